/* dynamic-loader.cpp

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
#include "log.h"
#include "str-util.h"
#include "dynamic-loader.h"

using logger::log;
using logger::LL;

namespace kickstart {

  void dynamic_loader::add(const locator &loc) {
    std::lock_guard<std::mutex> lk(_guard);
    // registry only records what the backend accepted
    if (_backend != nullptr) {
      _backend->append(loc);
    }
    _locators.push_back(loc);
    log(LL::DEBUG, "added locator %s", loc.c_str());
  }

  std::vector<locator> dynamic_loader::locators() const {
    std::lock_guard<std::mutex> lk(_guard);
    return _locators;
  }

  size_t dynamic_loader::size() const {
    std::lock_guard<std::mutex> lk(_guard);
    return _locators.size();
  }

  void dynamic_loader::attach(loader_backend &backend) {
    std::lock_guard<std::mutex> lk(_guard);
    if (_backend != nullptr) {
      throw entry_point_exception("dynamic loader is already attached to a backend");
    }
    log(LL::DEBUG, "seeding loader backend with %d locator(s)", static_cast<int>(_locators.size()));
    backend.seed(_locators);
    _backend = &backend;
  }

  bool dynamic_loader::attached() const {
    std::lock_guard<std::mutex> lk(_guard);
    return _backend != nullptr;
  }

  loader_backend& dynamic_loader::attached_backend(const char * const operation) const {
    std::lock_guard<std::mutex> lk(_guard);
    if (_backend == nullptr) {
      throw entry_point_exception(format2str("%s requires the dynamic loader to be attached to a backend", operation));
    }
    return *_backend;
  }

  void dynamic_loader::make_context_loader() {
    attached_backend(__func__).make_context_loader();
  }

  std::unique_ptr<startable> dynamic_loader::resolve_entry(const std::string &class_name) {
    return attached_backend(__func__).resolve_entry(class_name);
  }

} // namespace kickstart
