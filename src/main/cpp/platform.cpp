/* platform.cpp

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
#include <cstring>
#include <sys/utsname.h>
#include "str-util.h"
#include "platform.h"

namespace kickstart {

  static const char * const OS_NAME_ENV_VAR = "KICKSTART_OS_NAME";

  platform platform_from_os_name(const char * const os_name) {
    if (os_name == nullptr) return platform::OTHER;
    const std::string os_name_lc( to_lower(os_name) );
    if (starts_with(os_name_lc, "windows") || starts_with(os_name_lc, "cygwin") ||
        starts_with(os_name_lc, "mingw"))
    {
      return platform::WINDOWS_FAMILY;
    }
    // a JVM reports "Mac OS X", uname(2) reports "Darwin"
    if (starts_with(os_name_lc, "mac os x") || starts_with(os_name_lc, "darwin")) {
      return platform::MACOS_FAMILY;
    }
    return platform::OTHER;
  }

  std::string current_os_name() {
    const char * const os_name_override = getenv(OS_NAME_ENV_VAR);
    if (os_name_override != nullptr && *os_name_override != '\0') {
      return std::string(os_name_override);
    }
    struct utsname uts;
    memset(&uts, 0, sizeof(uts));
    if (uname(&uts) == -1) {
      return std::string();
    }
    return std::string(uts.sysname);
  }

  const char* platform_name(platform p) {
    switch (p) {
      case platform::WINDOWS_FAMILY: return "windows";
      case platform::MACOS_FAMILY:   return "mac os x";
      case platform::OTHER:          break;
    }
    return "other";
  }

} // namespace kickstart
