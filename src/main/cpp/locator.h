/* locator.h

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
#ifndef __LOCATOR_H__
#define __LOCATOR_H__

#include <string>
#include "kickstart-exception.h"
#include "platform.h"

// declare malformed_locator_exception
DECL_EXCEPTION(malformed_locator)

namespace kickstart {

  /**
   * An absolute URI naming a directory (always ending in '/') or an archive that
   * the dynamic loader can resolve code from, e.g. "file:/opt/app/lib/core.jar".
   */
  class locator {
  private:
    std::string _uri;
  public:
    /**
     * @param uri absolute URI; must start with a scheme ("file:", "jar:", "http:", ...)
     * and contain no whitespace or control characters
     *
     * @throws malformed_locator_exception if uri is not of that form
     */
    explicit locator(std::string uri);
    locator(const locator &) = default;
    locator(locator &&) noexcept = default;
    locator& operator=(const locator &) = default;
    locator& operator=(locator &&) noexcept = default;
    ~locator() = default;
  public:
    const std::string& uri() const { return _uri; }
    const char* c_str() const { return _uri.c_str(); }
    bool is_directory() const { return !_uri.empty() && _uri.back() == '/'; }
    bool operator==(const locator &other) const { return _uri == other._uri; }
    bool operator!=(const locator &other) const { return _uri != other._uri; }
  };

  /**
   * Converts a file system path to a "file:" locator.
   *
   * Backslashes count as separators on the Windows family, where a path led by
   * four or more separators keeps a network share authority ("file:////host/share/")
   * and shorter leading runs collapse to one. Relative paths are taken against cwd.
   * A path naming an existing directory, or ending in a separator, yields a
   * locator ending in '/'. Characters outside the URI path set are percent-encoded.
   *
   * @throws malformed_locator_exception for an empty path, a path containing the
   * platform's path-list separator or a NUL character, a relative path with no cwd
   * to resolve it against, or a path longer than PATH_MAX
   */
  locator to_locator(const std::string &path, platform p, const std::string &cwd);

} // namespace kickstart

#endif // __LOCATOR_H__
