/* launch-env.h

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
#ifndef __LAUNCH_ENV_H__
#define __LAUNCH_ENV_H__

#include <string>
#include "platform.h"

namespace kickstart {

  extern const char * const SEARCH_PATH_ENV_VAR;   // "CLASSPATH"
  extern const char * const HOME_OVERRIDE_ENV_VAR; // "KICKSTART_HOME"

  /**
   * The ambient values the bootstrap reads once at process start. Captured into a
   * plain value so installation discovery and classpath assembly can be driven
   * from tests without touching the real process environment.
   */
  struct launch_env {
    std::string search_path;   // separator-joined search-path list
    std::string os_name;
    std::string home_override; // installation directory override (may be empty)
    std::string working_dir;

    platform os_platform() const { return platform_from_os_name(os_name.c_str()); }

    // $CLASSPATH (the launcher executable's own path when undefined), the current
    // OS name, $KICKSTART_HOME and the current working directory
    static launch_env from_process();
  };

  // full path of the running executable, or an empty string if /proc is unavailable
  std::string executable_path();

} // namespace kickstart

#endif // __LAUNCH_ENV_H__
