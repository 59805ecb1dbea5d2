/* cfgparse.cpp

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
#include <sys/types.h>
#include <sys/stat.h>
#include <strings.h>
#include <list>
#include <sstream>
#include <ini.h>
#include "log.h"
#include "str-util.h"
#include "file-path.h"
#include "cfgparse.h"

using logger::log;
using logger::LL;

static const char config_file_parse_err_fmt[] = "config file parsing error %d in \"%s\"\n";
static const char config_setting_err_fmt[]    = "invalid setting [%s] %s=%s\n";
static const char config_file_load_err_fmt[]  = "can't load \"%s\"\n";

namespace {
  // carries the C++ handler through the inih C callback
  struct parse_ctx {
    const cfg_parse_handler_t &handler;
    std::list<std::string> err_list;
  };
}

extern "C" {
  static int ini_handler_trampoline(void *user, const char *section, const char *name, const char *value) {
    auto const ctx = static_cast<parse_ctx*>(user);
    try {
      if (ctx->handler(section, name, value) != 0) return 1;
      ctx->err_list.emplace_back(format2str(config_setting_err_fmt, section, name, value));
    } catch(const std::exception &ex) {
      // exceptions must not unwind through the C parser
      ctx->err_list.emplace_back(format2str("[%s] %s: %s\n", section, name, ex.what()));
    }
    return 0;
  }
}

bool process_config(const char * const dirpath, const char * const cfgfilename, const cfg_parse_handler_t &handler) {
  const std::string cfgfullfilepath(path_concat(dirpath, cfgfilename));

  // check to see if specified config file exist
  struct stat statbuf;
  if (stat(cfgfullfilepath.c_str(), &statbuf) == -1 || (statbuf.st_mode & S_IFMT) != S_IFREG) {
    return false;
  }

  parse_ctx ctx{handler, {}};
  const int rc = ini_parse(cfgfullfilepath.c_str(), &ini_handler_trampoline, &ctx);
  if (rc != 0) {
    if (rc < 0) {
      ctx.err_list.emplace_front(format2str(config_file_load_err_fmt, cfgfullfilepath.c_str()));
    } else {
      // positive rc is the line number of the first error
      ctx.err_list.emplace_front(format2str(config_file_parse_err_fmt, rc, cfgfullfilepath.c_str()));
    }

    std::stringstream ss;
    for(auto const &errmsg : ctx.err_list) {
      ss << errmsg;
    }
    throw process_cfg_exception(ss.str());
  }

  return true;
}

namespace kickstart {

  const char * const CONFIG_FILE_NAME = "kickstart.ini";

  int apply_setting(launcher_config &cfg, const char * const section, const char * const name,
                    const char * const value)
  {
    if (strcasecmp(section, "JvmSettings") == 0) {
      if (strcasecmp(name, "CommandLineArgs") == 0) {
        cfg.jvm_cmd_line_args = value;
      }
    } else if (strcasecmp(section, "LauncherSettings") == 0) {
      if (strcasecmp(name, "EntryPoint") == 0) {
        if (*value == '\0') return 0;
        cfg.settings.entry_class = value;
      } else if (strcasecmp(name, "NativeBridgeClass") == 0) {
        cfg.bridge_class = value;
      } else if (strcasecmp(name, "ApplicationName") == 0) {
        cfg.settings.app_name = value;
      }
    } else if (strcasecmp(section, "LoggingSettings") == 0) {
      if (strcasecmp(name, "LoggingLevel") == 0) {
        cfg.logging_level = value;
      } else if (strcasecmp(name, "ConfigProperty") == 0) {
        cfg.settings.logging_property = value;
      } else if (strcasecmp(name, "ConfigFile") == 0) {
        if (*value == '\0') return 0;
        cfg.settings.logging_file = value;
      }
    } else {
      log(LL::DEBUG, "ignoring setting [%s] %s", section, name);
    }
    return 1;
  }

  launcher_config load_launcher_config(const install_dir &dir) {
    launcher_config cfg;
    if (!dir.known()) {
      log(LL::DEBUG, "no %s read: installation directory is unknown", CONFIG_FILE_NAME);
      return cfg;
    }
    const auto bin_dir = path_concat(dir.path(), "bin");
    cfg.loaded = process_config(bin_dir.c_str(), CONFIG_FILE_NAME,
                                [&cfg](const char *section, const char *name, const char *value) {
                                  return apply_setting(cfg, section, name, value);
                                });
    log(LL::DEBUG, "%s %s", CONFIG_FILE_NAME, cfg.loaded ? "loaded" : "not present, using defaults");
    return cfg;
  }

} // namespace kickstart
