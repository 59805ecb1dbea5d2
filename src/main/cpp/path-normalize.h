/* path-normalize.h

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
#ifndef __PATH_NORMALIZE_H__
#define __PATH_NORMALIZE_H__

#include <string>
#include "platform.h"

namespace kickstart {

  /**
   * Prepares a path for conversion to a locator. Locator conversion collapses
   * a leading run of separators shorter than four, so on a platform that uses
   * network share paths a path beginning with exactly two separators (of either
   * slash style) has two more prepended; "\\host\share" becomes "\\\\host\share".
   * Anything else, including "\\\host\share", is returned unchanged.
   */
  std::string normalize_share_path(const std::string &path, bool uses_share_paths);

  inline std::string normalize_share_path(const std::string &path, platform p) {
    return normalize_share_path(path, uses_share_paths(p));
  }

} // namespace kickstart

#endif // __PATH_NORMALIZE_H__
