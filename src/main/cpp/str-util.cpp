/* str-util.cpp

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
#include <cstdio>
#include <cstring>
#include <cctype>
#include <alloca.h>
#include <algorithm>
#include "str-util.h"

std::string vformat2str(const char *const fmt, va_list ap) {
  int strbuf_size = 256;
  char *strbuf = (char*) alloca(strbuf_size);
  va_list parm_copy;
  va_copy(parm_copy, ap);
  int n = vsnprintf(strbuf, (size_t) strbuf_size, fmt, ap);
  if (n >= strbuf_size) {
    strbuf = (char*) alloca(strbuf_size = ++n);
    n = vsnprintf(strbuf, (size_t) strbuf_size, fmt, parm_copy);
  }
  va_end(parm_copy);
  return n < 0 ? std::string() : std::string(strbuf);
}

std::string format2str(const char *const fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  auto rslt( vformat2str(fmt, ap) );
  va_end(ap);
  return rslt;
}

std::vector<std::string> str_split(const char *s, const char c) {
  std::vector<std::string> v;
  if (s == nullptr) return v;
  std::string buf; // string fragment buffer
  char n;
  while((n = *s++) != 0) {
    if (n != c) {
      buf += n; // accumulate character into string fragment buffer
    } else if (!buf.empty()) {
      v.push_back(std::move(buf));
      buf.clear();
    }
  }
  if (!buf.empty()) {
    v.push_back(std::move(buf));
  }
  return v;
}

bool starts_with(const std::string &s, const char *prefix) {
  const auto len = strlen(prefix);
  return s.size() >= len && s.compare(0, len, prefix) == 0;
}

bool ends_with(const std::string &s, const char *suffix) {
  const auto len = strlen(suffix);
  return s.size() >= len && s.compare(s.size() - len, len, suffix) == 0;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return s;
}
