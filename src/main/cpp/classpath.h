/* classpath.h

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
#ifndef __CLASSPATH_H__
#define __CLASSPATH_H__

#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "locator.h"
#include "search-path.h"
#include "dynamic-loader.h"
#include "install-locate.h"

namespace kickstart {

  // library subdirectories of the installation directory, in load order
  extern const char * const STANDARD_LIB_DIRS[3]; // "lib", "lib/ext", "lib/junit"

  // a problem found while assembling the initial classpath; reported at hand-off
  struct init_failure {
    std::string message;
    std::string trace;
  };

  struct classpath_assembly {
    std::vector<locator> locators;
    std::vector<init_failure> failures;
    std::vector<std::string> diagnostics;
  };

  /**
   * One-time assembly of the initial classpath from the standard library
   * subdirectories of dir. Each archive path found is share-path normalized,
   * converted to a locator and appended to the result, and the normalized path is
   * appended to sp. An unreadable subdirectory only adds a diagnostic; a path that
   * cannot become a locator adds an init_failure and assembly carries on. When all
   * subdirectories are done the search path is published.
   */
  classpath_assembly assemble_classpath(const install_dir &dir, platform p, const std::string &cwd, search_path &sp);

  /**
   * Extends the classpath of a running application. Each call holds a lock across
   * its loader additions and search-path appends so the two stay in the same order.
   */
  class classpath_extender {
  private:
    std::mutex _guard;
    dynamic_loader &_loader;
    search_path &_search_path;
    const platform _platform;
    const std::string _cwd;
  public:
    classpath_extender(dynamic_loader &loader, search_path &sp, platform p, std::string cwd)
      : _loader(loader), _search_path(sp), _platform(p), _cwd(std::move(cwd)) {}
    classpath_extender(const classpath_extender &) = delete;
    classpath_extender& operator=(const classpath_extender &) = delete;
    ~classpath_extender() = default;
  public:
    // adds loc to the dynamic loader only
    void add_url(const locator &loc);
    /**
     * Adds path, and for a directory each of its readable archives, to the dynamic
     * loader only; the search path is left as is. Archives that cannot be converted
     * are logged and skipped.
     *
     * @throws malformed_locator_exception if path cannot be converted to a locator;
     *         nothing is added in that case
     */
    void add_url(const std::string &path);
    /**
     * Adds path to the dynamic loader and the search path. A directory is added with
     * a trailing separator, followed by each of its readable archives in sorted order.
     * Archives that cannot be converted are logged and skipped. The search path is
     * published afterwards.
     *
     * @throws malformed_locator_exception if path cannot be converted to a locator;
     *         nothing is added in that case
     */
    void add_path(const std::string &path);
  private:
    using archive_entry = std::pair<std::string, locator>;
    // readable archives of dir, converted to locators; unconvertible ones are dropped
    std::vector<archive_entry> list_archives(const std::string &dir);
  };

} // namespace kickstart

#endif // __CLASSPATH_H__
