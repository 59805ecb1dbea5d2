/* cfgparse.h

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
#ifndef __CFGPARSE_H__
#define __CFGPARSE_H__

#include <functional>
#include <string>
#include "kickstart-exception.h"
#include "install-locate.h"
#include "bootstrap.h"

// declare process_cfg_exception
DECL_EXCEPTION(process_cfg)

// called per name=value pair; returns nonzero on success, zero to flag the line as an error
using cfg_parse_handler_t = std::function<int (const char *section, const char *name, const char *value)>;

/**
 * Parses the INI file cfgfilename in dirpath, passing each setting to handler.
 *
 * @return false if the file does not exist (or is not a regular file)
 * @throws process_cfg_exception if the file cannot be read or has malformed lines
 */
bool process_config(const char * const dirpath, const char * const cfgfilename, const cfg_parse_handler_t &handler);

namespace kickstart {

  extern const char * const CONFIG_FILE_NAME; // "kickstart.ini", looked for in <install-dir>/bin

  struct launcher_config {
    launch_settings settings;
    std::string jvm_cmd_line_args;
    std::string bridge_class{"kickstart/NativeClasspath"};
    std::string logging_level; // empty when not configured
    bool loaded{false};
  };

  // applies one [section] name=value setting; unknown settings are ignored
  int apply_setting(launcher_config &cfg, const char *section, const char *name, const char *value);

  /**
   * Reads <install-dir>/bin/kickstart.ini. A missing file, or an unknown
   * installation directory, leaves every setting at its default.
   *
   * @throws process_cfg_exception if the file exists but cannot be parsed
   */
  launcher_config load_launcher_config(const install_dir &dir);

} // namespace kickstart

#endif // __CFGPARSE_H__
