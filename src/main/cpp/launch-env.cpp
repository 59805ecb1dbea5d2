/* launch-env.cpp

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
#include <unistd.h>
#include "log.h"
#include "file-path.h"
#include "launch-env.h"

using logger::log;
using logger::LL;

namespace kickstart {

  const char * const SEARCH_PATH_ENV_VAR = "CLASSPATH";
  const char * const HOME_OVERRIDE_ENV_VAR = "KICKSTART_HOME";

  static std::string get_env_var(const char * const name) {
    const char * const val = getenv(name);
    return val != nullptr ? std::string(val) : std::string();
  }

  std::string executable_path() {
    char strbuf[PATH_MAX];
    const auto n = readlink("/proc/self/exe", strbuf, sizeof(strbuf) - 1);
    if (n == -1) {
      return std::string();
    }
    strbuf[n] = '\0';
    return std::string(strbuf);
  }

  launch_env launch_env::from_process() {
    launch_env env;
    env.search_path = get_env_var(SEARCH_PATH_ENV_VAR);
    if (env.search_path.empty()) {
      // a packaged launch: the executable itself stands as the single search-path entry
      env.search_path = executable_path();
    }
    env.os_name = current_os_name();
    env.home_override = get_env_var(HOME_OVERRIDE_ENV_VAR);
    env.working_dir = current_working_dir();
    log(LL::DEBUG, "launch environment:\n\tsearch path: \"%s\"\n\tos name: \"%s\"\n\thome override: \"%s\"\n"
        "\tworking dir: \"%s\"", env.search_path.c_str(), env.os_name.c_str(), env.home_override.c_str(),
        env.working_dir.c_str());
    return env;
  }

} // namespace kickstart
