/* install-locate.h

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
#ifndef __INSTALL_LOCATE_H__
#define __INSTALL_LOCATE_H__

#include <string>
#include "launch-env.h"

namespace kickstart {

  // what the installation directory was derived from
  enum class install_source : char {
    UNKNOWN = 0,
    GIVEN,             // constructed from a known path
    PACKAGED_ENTRY,    // grandparent of the single search-path entry
    HOME_OVERRIDE,     // KICKSTART_HOME
    WORKING_DIR_PARENT
  };

  const char* install_source_to_str(install_source source);

  /**
   * The installation root directory, or the distinguished unknown value when it
   * could not be determined.
   */
  class install_dir {
  private:
    std::string _path;
    bool _known{false};
    install_source _source{install_source::UNKNOWN};
  public:
    install_dir() = default;
    explicit install_dir(std::string path, install_source source = install_source::GIVEN)
      : _path(std::move(path)), _known(!_path.empty()), _source(_known ? source : install_source::UNKNOWN) {}
  public:
    bool known() const { return _known; }
    install_source source() const { return _source; }
    // empty when unknown
    const std::string& path() const { return _path; }
    // path for messages and reports; "<unknown>" when unknown
    const char* display() const { return _known ? _path.c_str() : "<unknown>"; }
  };

  /**
   * Derives the installation directory from the launch environment.
   *
   * A search path of exactly one entry (or two on the Mac OS family, where the
   * runtime may add a second) is a packaged launch: the first entry is canonicalized
   * and the parent of its parent directory is the installation directory. Any other
   * search path is a development launch: the home override when non-empty, else the
   * parent of the working directory. Failures yield an unknown install_dir.
   *
   * The home override is only consulted for a development launch; it does not
   * replace the directory derived from a single search-path entry.
   */
  install_dir locate_install_dir(const launch_env &env);

} // namespace kickstart

#endif // __INSTALL_LOCATE_H__
