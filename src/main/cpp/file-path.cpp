/* file-path.cpp

Copyright 2026 Tideworks Technology

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.

*/
#include <cstdlib>
#include <climits>
#include <memory>
#include <vector>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include "str-util.h"
#include "file-path.h"

std::string path_concat(const char * const str1, const char * const str2) {
  std::string path_rslt{str1};
  const auto len = path_rslt.length();
  if (len > 0) {
    auto &last_ch = path_rslt[len - 1];
    if (last_ch != '/' && last_ch != '\\') {
      path_rslt += kPathSeparator;
    } else if (last_ch != kPathSeparator) {
      last_ch = kPathSeparator;
    }
  }
  const char *tail = str2;
  while (len > 0 && *tail == kPathSeparator) tail++;
  return path_rslt += tail;
}

std::string parent_path(const std::string &path) {
  std::string p{path};
  while (p.size() > 1 && p.back() == kPathSeparator) p.pop_back();
  const auto pos = p.find_last_of(kPathSeparator);
  if (pos == std::string::npos || p.size() == 1) {
    return std::string();
  }
  if (pos == 0) {
    return std::string(1, kPathSeparator);
  }
  auto rslt = p.substr(0, pos);
  while (rslt.size() > 1 && rslt.back() == kPathSeparator) rslt.pop_back();
  return rslt;
}

std::string lexically_normal(const std::string &path) {
  const bool is_absolute = !path.empty() && path[0] == kPathSeparator;
  std::vector<std::string> parts;
  for(auto &part : str_split(path, kPathSeparator)) {
    if (part == ".") continue;
    if (part == "..") {
      if (!parts.empty() && parts.back() != "..") {
        parts.pop_back();
      } else if (!is_absolute) {
        parts.push_back(std::move(part));
      }
      continue;
    }
    parts.push_back(std::move(part));
  }
  std::string rslt(is_absolute ? "/" : "");
  for(size_t i = 0; i < parts.size(); i++) {
    if (i > 0) rslt += kPathSeparator;
    rslt += parts[i];
  }
  if (rslt.empty()) rslt = ".";
  return rslt;
}

std::string absolute_path(const std::string &path, const std::string &cwd) {
  if (!path.empty() && path[0] == kPathSeparator) return path;
  if (cwd.empty()) return std::string();
  return path_concat(cwd, path.c_str());
}

static bool real_path(const std::string &path, std::string &out) {
  auto const free_buf = [](char *p) { std::free(p); };
  std::unique_ptr<char, decltype(free_buf)> resolved_sp(realpath(path.c_str(), nullptr), free_buf);
  if (!resolved_sp) return false;
  out = resolved_sp.get();
  return true;
}

bool canonical_path(const std::string &path, const std::string &cwd, std::string &out) {
  if (path.empty()) return false;
  const auto abs_path = absolute_path(path, cwd);
  if (abs_path.empty()) return false;

  std::string prefix( lexically_normal(abs_path) );
  std::string tail;
  std::string resolved;
  for(;;) {
    if (real_path(prefix, resolved)) break;
    if (prefix == "/") return false;
    const auto pos = prefix.find_last_of(kPathSeparator);
    const auto last = prefix.substr(pos + 1);
    tail = tail.empty() ? last : path_concat(last, tail.c_str());
    prefix = pos == 0 ? std::string("/") : prefix.substr(0, pos);
  }
  out = tail.empty() ? resolved : path_concat(resolved, tail.c_str());
  return true;
}

bool is_directory(const char * const path) {
  struct stat statbuf;
  return stat(path, &statbuf) == 0 && (statbuf.st_mode & S_IFMT) == S_IFDIR;
}

bool is_readable_file(const char * const path) {
  struct stat statbuf;
  return stat(path, &statbuf) == 0 && (statbuf.st_mode & S_IFMT) == S_IFREG && access(path, R_OK) == 0;
}

std::string current_working_dir() {
  char strbuf[PATH_MAX];
  if (getcwd(strbuf, sizeof(strbuf)) == nullptr) {
    return std::string();
  }
  return std::string(strbuf);
}
