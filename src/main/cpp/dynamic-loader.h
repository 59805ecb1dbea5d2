/* dynamic-loader.h

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
#ifndef __DYNAMIC_LOADER_H__
#define __DYNAMIC_LOADER_H__

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "kickstart-exception.h"
#include "locator.h"

// declare entry_point_exception (entry class could not be located or instantiated)
DECL_EXCEPTION(entry_point)
// declare application_exception (the started application raised an error)
DECL_EXCEPTION(application)

namespace kickstart {

  // An instantiated application entry point.
  class startable {
  public:
    virtual ~startable() = default;
    virtual void start(const std::vector<std::string> &args) = 0;
  };

  /**
   * The mechanism that actually resolves code from locators, together with the
   * system properties of the runtime it lives in. The dynamic_loader owns the
   * locator list; a backend only ever sees it seeded once and then appended to.
   */
  class loader_backend {
  public:
    virtual ~loader_backend() = default;
    virtual void seed(const std::vector<locator> &locators) = 0;
    virtual void append(const locator &loc) = 0;
    // make the seeded loader the resolution context of the calling thread
    virtual void make_context_loader() = 0;
    // locate the named class and instantiate it through its no-argument constructor
    virtual std::unique_ptr<startable> resolve_entry(const std::string &class_name) = 0;
    virtual bool has_property(const std::string &name) = 0;
    virtual void set_property(const std::string &name, const std::string &value) = 0;
  };

  /**
   * Ordered, append-only registry of locators. Safe for concurrent add() calls.
   * Once attached to a backend, the backend is seeded with the registry and every
   * later add() is forwarded to it in the same order.
   */
  class dynamic_loader {
  private:
    mutable std::mutex _guard;
    std::vector<locator> _locators;
    loader_backend *_backend{nullptr};
  public:
    explicit dynamic_loader(std::vector<locator> initial) : _locators(std::move(initial)) {}
    dynamic_loader(const dynamic_loader &) = delete;
    dynamic_loader(dynamic_loader &&) = delete;
    dynamic_loader& operator=(const dynamic_loader &) = delete;
    dynamic_loader& operator=(dynamic_loader &&) = delete;
    ~dynamic_loader() = default;
  public:
    void add(const locator &loc);
    std::vector<locator> locators() const;
    size_t size() const;
    void attach(loader_backend &backend);
    bool attached() const;
    // throws entry_point_exception when not attached
    void make_context_loader();
    std::unique_ptr<startable> resolve_entry(const std::string &class_name);
  private:
    loader_backend& attached_backend(const char *operation) const;
  };

} // namespace kickstart

#endif // __DYNAMIC_LOADER_H__
