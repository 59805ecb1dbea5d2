/* classpath.cpp

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
#include "log.h"
#include "str-util.h"
#include "file-path.h"
#include "archive-scan.h"
#include "path-normalize.h"
#include "classpath.h"

using logger::log;
using logger::LL;

namespace kickstart {

  const char * const STANDARD_LIB_DIRS[3] = { "lib", "lib/ext", "lib/junit" };

  static init_failure make_init_failure(const std::string &archive_path, const std::string &cwd,
                                        const malformed_locator_exception &ex)
  {
    const auto abs_path = absolute_path(archive_path, cwd);
    init_failure failure;
    failure.message = format2str("Error adding jar:%s\n\tcaused by %s: %s",
                                 abs_path.empty() ? archive_path.c_str() : abs_path.c_str(), ex.name(), ex.what());
    failure.trace = ex.trace();
    return failure;
  }

  classpath_assembly assemble_classpath(const install_dir &dir, const platform p, const std::string &cwd,
                                        search_path &sp)
  {
    classpath_assembly rslt;
    for(auto const lib_dir : STANDARD_LIB_DIRS) {
      if (!dir.known()) {
        rslt.diagnostics.emplace_back(
            format2str("Could not access %s: installation directory is unknown", lib_dir));
        log(LL::WARN, "%s", rslt.diagnostics.back().c_str());
        continue;
      }
      const auto lib_path = path_concat(dir.path(), lib_dir);
      auto scanned = scan_archives(lib_path);
      if (!scanned.accessible()) {
        for(auto &diagnostic : scanned.diagnostics) {
          rslt.diagnostics.push_back(std::move(diagnostic));
        }
        continue;
      }
      for(auto const &archive_path : scanned.entries) {
        try {
          auto normalized( normalize_share_path(archive_path, p) );
          rslt.locators.push_back(to_locator(normalized, p, cwd));
          sp.append(std::move(normalized));
        } catch (malformed_locator_exception &ex) {
          log(LL::ERR, "could not add \"%s\" to the classpath: %s", archive_path.c_str(), ex.what());
          rslt.failures.push_back(make_init_failure(archive_path, cwd, ex));
        }
      }
    }
    log(LL::DEBUG, "assembled %d locator(s) with %d failure(s)", static_cast<int>(rslt.locators.size()),
        static_cast<int>(rslt.failures.size()));
    sp.publish();
    return rslt;
  }

  std::vector<classpath_extender::archive_entry> classpath_extender::list_archives(const std::string &dir) {
    std::vector<archive_entry> rslt;
    if (!is_directory(dir)) return rslt;
    scan_options optns;
    optns.require_readable_file = true;
    for(auto &archive_path : scan_archives(dir, optns).entries) {
      try {
        auto loc( to_locator(archive_path, _platform, _cwd) );
        rslt.emplace_back(std::move(archive_path), std::move(loc));
      } catch (malformed_locator_exception &ex) {
        log(LL::WARN, "skipping \"%s\": %s", archive_path.c_str(), ex.what());
      }
    }
    return rslt;
  }

  void classpath_extender::add_url(const locator &loc) {
    std::lock_guard<std::mutex> lk(_guard);
    _loader.add(loc);
  }

  void classpath_extender::add_url(const std::string &path) {
    std::lock_guard<std::mutex> lk(_guard);
    const auto loc = to_locator(path, _platform, _cwd);
    const auto archives = list_archives(path);
    _loader.add(loc);
    for(auto const &archive : archives) {
      _loader.add(archive.second);
    }
  }

  void classpath_extender::add_path(const std::string &path) {
    std::lock_guard<std::mutex> lk(_guard);
    const bool is_dir = is_directory(path);
    const auto loc = to_locator(is_dir && !ends_with(path, "/") ? path + "/" : path, _platform, _cwd);
    const auto archives = is_dir ? list_archives(path) : std::vector<archive_entry>();
    try {
      _loader.add(loc);
      _search_path.append(path);
      for(auto const &archive : archives) {
        _loader.add(archive.second);
        _search_path.append(archive.first);
      }
    } catch (...) {
      // publish what the loader already accepted
      _search_path.publish();
      throw;
    }
    _search_path.publish();
  }

} // namespace kickstart
