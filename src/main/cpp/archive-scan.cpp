/* archive-scan.cpp

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
#include <sys/types.h>
#include <sys/stat.h>
#include <dirent.h>
#include <cstring>
#include <cerrno>
#include <memory>
#include <algorithm>
#include "log.h"
#include "str-util.h"
#include "file-path.h"
#include "archive-scan.h"

using logger::log;
using logger::LL;

namespace kickstart {

  const char * const ARCHIVE_SUFFIX = ".jar";

  static archive_scan_result inaccessible(const std::string &dir, const char * const reason) {
    archive_scan_result rslt;
    rslt.diagnostics.emplace_back( format2str("Could not access %s: %s", dir.c_str(), reason) );
    log(LL::WARN, "%s", rslt.diagnostics.back().c_str());
    return rslt;
  }

  archive_scan_result scan_archives(const std::string &dir, const scan_options &optns) {
    struct stat statbuf;
    if (dir.empty()) {
      return inaccessible(dir, "no directory specified");
    }
    if (stat(dir.c_str(), &statbuf) == -1) {
      return inaccessible(dir, strerror(errno));
    }
    if ((statbuf.st_mode & S_IFMT) != S_IFDIR) {
      return inaccessible(dir, "not a directory");
    }

    DIR * const d = opendir(dir.c_str());
    if (d == nullptr) {
      return inaccessible(dir, strerror(errno));
    }
    auto const close_dir = [](DIR *pd) {
      if (pd != nullptr) {
        closedir(pd);
      }
    };
    std::unique_ptr<DIR, decltype(close_dir)> dir_sp(d, close_dir);

    const char * const suffix = optns.suffix != nullptr ? optns.suffix : ARCHIVE_SUFFIX;
    archive_scan_result rslt;
    int readdir_errno = 0;
    for(;;) {
      errno = 0;
      struct dirent * const dent = readdir(d);
      if (dent == nullptr) {
        readdir_errno = errno;
        break;
      }
      if (strcmp(".", dent->d_name) == 0 || strcmp("..", dent->d_name) == 0) continue;
      const std::string name(dent->d_name);
      if (!ends_with(name, suffix)) continue;

      auto filepath( path_concat(dir, dent->d_name) );
      if (optns.require_readable_file && !is_readable_file(filepath)) {
        log(LL::DEBUG, "skipping \"%s\" (not a readable regular file)", filepath.c_str());
        continue;
      }
      rslt.entries.push_back(std::move(filepath));
    }
    if (readdir_errno != 0) {
      // listing broke off part way; what was read is discarded like an unreadable directory
      return inaccessible(dir, strerror(readdir_errno));
    }

    std::sort(rslt.entries.begin(), rslt.entries.end());
    log(LL::TRACE, "found %d archive(s) in \"%s\"", static_cast<int>(rslt.entries.size()), dir.c_str());
    return rslt;
  }

} // namespace kickstart
