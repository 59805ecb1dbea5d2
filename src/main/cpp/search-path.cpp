/* search-path.cpp

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
#include <cerrno>
#include "log.h"
#include "search-path.h"

using logger::log;
using logger::LL;

namespace kickstart {

  void search_path::append(std::string segment) {
    std::lock_guard<std::mutex> lk(_guard);
    _segments.push_back(std::move(segment));
  }

  std::string search_path::value() const {
    std::lock_guard<std::mutex> lk(_guard);
    std::string rslt{_initial};
    for(auto const &segment : _segments) {
      rslt += _separator;
      rslt += segment;
    }
    return rslt;
  }

  std::vector<std::string> search_path::segments() const {
    std::lock_guard<std::mutex> lk(_guard);
    return _segments;
  }

  size_t search_path::size() const {
    std::lock_guard<std::mutex> lk(_guard);
    return _segments.size();
  }

  void search_path::add_publisher(publish_cb_t cb) {
    std::lock_guard<std::mutex> lk(_guard);
    _publishers.push_back(std::move(cb));
  }

  void search_path::publish() const {
    const auto full_value = value();
    std::vector<publish_cb_t> publishers;
    {
      std::lock_guard<std::mutex> lk(_guard);
      publishers = _publishers;
    }
    log(LL::TRACE, "publishing search path:\n\t%s", full_value.c_str());
    for(auto const &publisher : publishers) {
      publisher(full_value);
    }
  }

  search_path::publish_cb_t environment_publisher(const char * const env_var_name) {
    const std::string var_name{env_var_name};
    return [var_name](const std::string &value) {
      if (setenv(var_name.c_str(), value.c_str(), 1) != 0) {
        log(LL::WARN, "could not set environment variable %s: %s", var_name.c_str(), strerror(errno));
      }
    };
  }

} // namespace kickstart
