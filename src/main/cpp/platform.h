/* platform.h

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
#ifndef __PLATFORM_H__
#define __PLATFORM_H__

#include <string>

namespace kickstart {

  // Operating system families whose conventions change how paths are handled.
  enum class platform : char { OTHER = 0, WINDOWS_FAMILY, MACOS_FAMILY };

  // Maps an operating system name ("Linux", "Darwin", "Mac OS X", "Windows 10", ...)
  // to its family; matching is case-insensitive on the name prefix.
  platform platform_from_os_name(const char *os_name);

  // Operating system name of this process: $KICKSTART_OS_NAME when defined,
  // otherwise the uname(2) sysname (empty string if uname fails).
  std::string current_os_name();

  const char* platform_name(platform p);

  // network share (UNC) paths are only meaningful on the Windows family
  inline bool uses_share_paths(platform p) { return p == platform::WINDOWS_FAMILY; }

  // separator between entries of a search-path list value
  inline char path_list_separator(platform p) { return p == platform::WINDOWS_FAMILY ? ';' : ':'; }

} // namespace kickstart

#endif // __PLATFORM_H__
