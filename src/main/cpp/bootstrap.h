/* bootstrap.h

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
#ifndef __BOOTSTRAP_H__
#define __BOOTSTRAP_H__

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "launch-env.h"
#include "install-locate.h"
#include "search-path.h"
#include "dynamic-loader.h"
#include "classpath.h"

namespace kickstart {

  struct launch_settings {
    std::string entry_class{"org.apache.jmeter.JMeter"};
    std::string app_name{"JMeter"};
    // logging-configuration property, defaulted to file:<install-dir>/bin/<logging_file> when unset
    std::string logging_property{"log4j.configuration"};
    std::string logging_file{"log4j.conf"};
  };

  enum class bootstrap_state : char {
    INIT = 0,
    HAND_OFF,
    ABORTED_CONFIG,
    ABORTED_RUNTIME,
    COMPLETED
  };

  const char* state_to_str(bootstrap_state state);

  /**
   * Everything established at process start: the launch environment, the
   * installation directory, the assembled search path and dynamic loader, and the
   * failures collected along the way. Lives until process exit.
   */
  class bootstrap_context {
  private:
    const launch_env _env;
    const platform _platform;
    const kickstart::install_dir _install_dir;
    kickstart::search_path _search_path;
    std::vector<init_failure> _failures;
    std::vector<std::string> _diagnostics;
    std::unique_ptr<dynamic_loader> _loader;
    std::unique_ptr<classpath_extender> _extender;
    bootstrap_state _state{bootstrap_state::INIT};
  public:
    bootstrap_context(launch_env env, const std::vector<kickstart::search_path::publish_cb_t> &publishers);
    bootstrap_context(const bootstrap_context &) = delete;
    bootstrap_context& operator=(const bootstrap_context &) = delete;
    ~bootstrap_context() = default;
  public:
    const launch_env& env() const { return _env; }
    platform os_platform() const { return _platform; }
    const kickstart::install_dir& install_dir() const { return _install_dir; }
    kickstart::search_path& search_path() { return _search_path; }
    const kickstart::search_path& search_path() const { return _search_path; }
    dynamic_loader& loader() { return *_loader; }
    classpath_extender& extender() { return *_extender; }
    const std::vector<init_failure>& failures() const { return _failures; }
    const std::vector<std::string>& diagnostics() const { return _diagnostics; }
    void record_failure(init_failure failure);
    bootstrap_state state() const { return _state; }
    void set_state(bootstrap_state state);
  };

  namespace bootstrap {

    /**
     * Locates the installation directory and assembles the initial classpath. The
     * publishers are registered before assembly, so they receive the assembled
     * search path. Never throws for classpath problems; those are collected as
     * failures on the returned context.
     */
    std::unique_ptr<bootstrap_context> initialize(const launch_env &env,
                                                  const std::vector<search_path::publish_cb_t> &publishers);

    // message and trace of each failure, each followed by "\r\n"
    std::string failures_to_string(const std::vector<init_failure> &failures);

    /**
     * Class path the virtual machine is created with: the ambient search path the
     * launcher started with. The installation archives are held by the dynamic
     * loader only, so the system class loader does not define application classes.
     */
    std::string launcher_class_path(const bootstrap_context &ctx);

    /**
     * Hands control to the application. With failures collected at initialization
     * it reports them to err and returns 1 without touching the backend. Otherwise
     * the loader is attached to backend, the class path property is set to the
     * assembled search path, the loader is made the context loader, the logging
     * configuration property gets its default when unset, and the entry class is
     * resolved, instantiated and started with args. Any exception raised along the
     * way is reported to err with the installation directory and 1 is returned.
     *
     * @return process exit code
     */
    int hand_off(bootstrap_context &ctx, loader_backend &backend, const launch_settings &settings,
                 const std::vector<std::string> &args, std::ostream &err);

  } // namespace bootstrap

} // namespace kickstart

#endif // __BOOTSTRAP_H__
