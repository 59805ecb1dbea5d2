/* search-path.h

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
#ifndef __SEARCH_PATH_H__
#define __SEARCH_PATH_H__

#include <string>
#include <vector>
#include <mutex>
#include <functional>

namespace kickstart {

  /**
   * The textual search-path value: the ambient value read at start followed by
   * one separator-prefixed segment per path added since, in order, never
   * de-duplicated. Publishing hands the full value to every registered publisher
   * (the process environment, the hosted runtime's class path property).
   */
  class search_path {
  public:
    using publish_cb_t = std::function<void(const std::string &value)>;
  private:
    mutable std::mutex _guard;
    const std::string _initial;
    const char _separator;
    std::vector<std::string> _segments;
    std::vector<publish_cb_t> _publishers;
  public:
    search_path(std::string initial, char separator) : _initial(std::move(initial)), _separator(separator) {}
    search_path(const search_path &) = delete;
    search_path(search_path &&) = delete;
    search_path& operator=(const search_path &) = delete;
    search_path& operator=(search_path &&) = delete;
    ~search_path() = default;
  public:
    void append(std::string segment);
    std::string value() const;
    const std::string& initial() const { return _initial; }
    std::vector<std::string> segments() const;
    size_t size() const;
    char separator() const { return _separator; }
    void add_publisher(publish_cb_t cb);
    void publish() const;
  };

  // publisher that stores the value in the named environment variable of this process
  search_path::publish_cb_t environment_publisher(const char *env_var_name);

} // namespace kickstart

#endif // __SEARCH_PATH_H__
