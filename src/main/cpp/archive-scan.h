/* archive-scan.h

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
#ifndef __ARCHIVE_SCAN_H__
#define __ARCHIVE_SCAN_H__

#include <string>
#include <vector>

namespace kickstart {

  extern const char * const ARCHIVE_SUFFIX; // ".jar"

  struct scan_options {
    const char *suffix = ARCHIVE_SUFFIX;
    // when set, only readable regular files qualify (names alone otherwise)
    bool require_readable_file = false;
  };

  struct archive_scan_result {
    std::vector<std::string> entries;     // full paths, ascending
    std::vector<std::string> diagnostics; // one record per directory that could not be listed
    bool accessible() const { return diagnostics.empty(); }
  };

  /**
   * Lists the direct children of dir (no recursion) whose names end with the
   * archive suffix, sorted ascending by full path so load order is the same on
   * every run and platform. A dir that is not a directory, or that cannot be
   * listed, gives no entries and one diagnostic (logged at WARN); nothing is thrown.
   */
  archive_scan_result scan_archives(const std::string &dir, const scan_options &optns = scan_options());

} // namespace kickstart

#endif // __ARCHIVE_SCAN_H__
