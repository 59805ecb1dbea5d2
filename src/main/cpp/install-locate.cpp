/* install-locate.cpp

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
#include "install-locate.h"

using logger::log;
using logger::LL;

namespace kickstart {

  const char* install_source_to_str(const install_source source) {
    switch (source) {
      case install_source::UNKNOWN:            return "unknown";
      case install_source::GIVEN:              return "given path";
      case install_source::PACKAGED_ENTRY:     return "packaged search-path entry";
      case install_source::HOME_OVERRIDE:      return HOME_OVERRIDE_ENV_VAR;
      case install_source::WORKING_DIR_PARENT: return "parent of working directory";
    }
    return "";
  }

  static install_dir from_packaged_entry(const std::string &entry, const std::string &cwd) {
    std::string canonical;
    if (!canonical_path(entry, cwd, canonical)) {
      log(LL::DEBUG, "could not canonicalize search-path entry \"%s\"", entry.c_str());
      return install_dir();
    }
    const auto entry_dir = parent_path(canonical);
    if (entry_dir.empty()) {
      log(LL::DEBUG, "search-path entry \"%s\" has no parent directory", canonical.c_str());
      return install_dir();
    }
    return install_dir(parent_path(entry_dir), install_source::PACKAGED_ENTRY);
  }

  install_dir locate_install_dir(const launch_env &env) {
    const auto p = env.os_platform();
    const auto entries = str_split(env.search_path, path_list_separator(p));
    const auto count = entries.size();

    install_dir rslt;
    if (count == 1 || (count == 2 && p == platform::MACOS_FAMILY)) {
      log(LL::DEBUG, "packaged launch from \"%s\"", entries.front().c_str());
      rslt = from_packaged_entry(entries.front(), env.working_dir);
    } else if (!env.home_override.empty()) {
      log(LL::DEBUG, "development launch (%d search-path entries), using home override", static_cast<int>(count));
      rslt = install_dir(env.home_override, install_source::HOME_OVERRIDE);
    } else {
      log(LL::DEBUG, "development launch (%d search-path entries), using parent of working directory",
          static_cast<int>(count));
      rslt = install_dir(env.working_dir.empty() ? std::string() : parent_path(env.working_dir),
                         install_source::WORKING_DIR_PARENT);
    }

    if (!rslt.known()) {
      log(LL::WARN, "installation directory could not be determined");
    } else {
      log(LL::INFO, "installation directory \"%s\" taken from %s", rslt.path().c_str(),
          install_source_to_str(rslt.source()));
      if (rslt.source() == install_source::PACKAGED_ENTRY && !env.home_override.empty()) {
        log(LL::INFO, "%s=\"%s\" ignored for a packaged search path", HOME_OVERRIDE_ENV_VAR,
            env.home_override.c_str());
      }
    }
    return rslt;
  }

} // namespace kickstart
