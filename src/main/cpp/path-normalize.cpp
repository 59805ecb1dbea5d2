/* path-normalize.cpp

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
#include "str-util.h"
#include "path-normalize.h"

namespace kickstart {

  std::string normalize_share_path(const std::string &path, const bool uses_share_paths) {
    if (!uses_share_paths) return path;
    if (starts_with(path, R"(\\)") && !starts_with(path, R"(\\\)")) {
      return R"(\\)" + path;
    }
    if (starts_with(path, "//") && !starts_with(path, "///")) {
      return "//" + path;
    }
    return path;
  }

} // namespace kickstart
