/* bootstrap.cpp

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
#include "file-path.h"
#include "bootstrap.h"

using logger::log;
using logger::LL;

namespace kickstart {

  static const char * const CLASS_PATH_PROPERTY = "java.class.path";

  const char* state_to_str(const bootstrap_state state) {
    switch (state) {
      case bootstrap_state::INIT:            return "Init";
      case bootstrap_state::HAND_OFF:        return "HandOff";
      case bootstrap_state::ABORTED_CONFIG:  return "AbortedConfig";
      case bootstrap_state::ABORTED_RUNTIME: return "AbortedRuntime";
      case bootstrap_state::COMPLETED:       return "Completed";
    }
    return "";
  }

  bootstrap_context::bootstrap_context(launch_env env,
                                       const std::vector<kickstart::search_path::publish_cb_t> &publishers)
    : _env(std::move(env)), _platform(_env.os_platform()), _install_dir(locate_install_dir(_env)),
      _search_path(_env.search_path, path_list_separator(_platform))
  {
    log(LL::DEBUG, "%s installation directory: %s", platform_name(_platform), _install_dir.display());
    for(auto const &publisher : publishers) {
      _search_path.add_publisher(publisher);
    }
    auto assembly = assemble_classpath(_install_dir, _platform, _env.working_dir, _search_path);
    _failures = std::move(assembly.failures);
    _diagnostics = std::move(assembly.diagnostics);
    _loader.reset(new dynamic_loader(std::move(assembly.locators)));
    _extender.reset(new classpath_extender(*_loader, _search_path, _platform, _env.working_dir));
  }

  void bootstrap_context::record_failure(init_failure failure) {
    log(LL::ERR, "%s", failure.message.c_str());
    _failures.push_back(std::move(failure));
  }

  void bootstrap_context::set_state(const bootstrap_state state) {
    log(LL::DEBUG, "bootstrap state %s -> %s", state_to_str(_state), state_to_str(state));
    _state = state;
  }

  namespace bootstrap {

    std::unique_ptr<bootstrap_context> initialize(const launch_env &env,
                                                  const std::vector<search_path::publish_cb_t> &publishers)
    {
      return std::unique_ptr<bootstrap_context>(new bootstrap_context(env, publishers));
    }

    std::string failures_to_string(const std::vector<init_failure> &failures) {
      std::string rslt;
      for(auto const &failure : failures) {
        rslt += failure.message;
        if (!failure.trace.empty()) {
          rslt += '\n';
          rslt += failure.trace;
        }
        rslt += "\r\n";
      }
      return rslt;
    }

    static void set_logging_default(const bootstrap_context &ctx, loader_backend &backend,
                                    const launch_settings &settings)
    {
      if (settings.logging_property.empty() || backend.has_property(settings.logging_property)) return;
      if (!ctx.install_dir().known()) {
        log(LL::WARN, "%s not defaulted: installation directory is unknown", settings.logging_property.c_str());
        return;
      }
      const auto conf_path = path_concat(path_concat(ctx.install_dir().path(), "bin"),
                                         settings.logging_file.c_str());
      const auto value = "file:" + conf_path;
      log(LL::DEBUG, "defaulting %s=%s", settings.logging_property.c_str(), value.c_str());
      backend.set_property(settings.logging_property, value);
    }

    std::string launcher_class_path(const bootstrap_context &ctx) {
      return ctx.search_path().initial();
    }

    int hand_off(bootstrap_context &ctx, loader_backend &backend, const launch_settings &settings,
                 const std::vector<std::string> &args, std::ostream &err)
    {
      if (!ctx.failures().empty()) {
        ctx.set_state(bootstrap_state::ABORTED_CONFIG);
        err << "Configuration error during init, see exceptions:\n" << failures_to_string(ctx.failures());
        err.flush();
        return 1;
      }

      ctx.set_state(bootstrap_state::HAND_OFF);
      try {
        auto &loader = ctx.loader();
        loader.attach(backend);
        backend.set_property(CLASS_PATH_PROPERTY, ctx.search_path().value());
        ctx.search_path().add_publisher([&backend](const std::string &value) {
          backend.set_property(CLASS_PATH_PROPERTY, value);
        });
        loader.make_context_loader();
        set_logging_default(ctx, backend, settings);

        log(LL::DEBUG, "resolving entry point %s", settings.entry_class.c_str());
        auto entry = loader.resolve_entry(settings.entry_class);
        if (!entry) {
          throw entry_point_exception(format2str("entry point %s could not be instantiated",
                                                 settings.entry_class.c_str()));
        }
        entry->start(args);
      } catch(const std::exception &ex) {
        ctx.set_state(bootstrap_state::ABORTED_RUNTIME);
        err << describe_exception(ex) << '\n'
            << settings.app_name << " home directory was detected as: " << ctx.install_dir().display() << '\n';
        err.flush();
        return 1;
      }
      ctx.set_state(bootstrap_state::COMPLETED);
      return 0;
    }

  } // namespace bootstrap

} // namespace kickstart
