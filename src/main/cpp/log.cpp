/* log.cpp

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
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cctype>
#include <syslog.h>
#include <string>
#include <vector>
#include <algorithm>
#include <mutex>
#include "so-export.h"
#include "log.h"

namespace logger {

  const char * const LOG_LEVEL_ENV_VAR = "KICKSTART_LOG_LEVEL";

  static const size_t DEFAULT_STRBUF_SIZE = 256;
  static const LOGGING_LEVEL DEFAULT_LOGGING_LEVEL = LL::INFO;

  // per-level output traits, indexed by the enum value
  struct level_traits {
    const char *name;
    bool to_stderr;
    bool to_syslog;
  };
  static const level_traits s_level_traits[] = {
    { "",      false, false },
    { "TRACE", false, false },
    { "DEBUG", false, false },
    { "INFO",  false, false },
    { "WARN",  true,  false },
    { "ERROR", true,  true  },
    { "FATAL", true,  true  },
  };

  static const level_traits& traits_of(const LOGGING_LEVEL level) {
    const auto idx = static_cast<size_t>(level);
    return s_level_traits[idx < sizeof(s_level_traits) / sizeof(s_level_traits[0]) ? idx : 0];
  }

  static volatile LOGGING_LEVEL s_logging_level = DEFAULT_LOGGING_LEVEL;
  static std::string s_progname{ "kickstart" };
  static bool s_syslogging_enabled = true;
  static bool s_syslog_opened = false;
  static std::mutex s_output_guard;

  static void open_syslog_once() {
    if (s_syslogging_enabled && !s_syslog_opened) {
      openlog(s_progname.c_str(), LOG_PID, LOG_USER);
      s_syslog_opened = true;
    }
  }

  // NOTE: this property must be set on the logger namespace subsystem prior to use of its functions
  SO_EXPORT void set_progname(const char *const progname) {
    std::lock_guard<std::mutex> lk(s_output_guard);
    s_progname = progname != nullptr ? progname : "kickstart";
    open_syslog_once();
  }

  SO_EXPORT void set_syslogging(bool is_syslogging_enabled) {
    std::lock_guard<std::mutex> lk(s_output_guard);
    s_syslogging_enabled = is_syslogging_enabled;
    if (!is_syslogging_enabled && s_syslog_opened) {
      closelog();
      s_syslog_opened = false;
    }
  }

  SO_EXPORT LOGGING_LEVEL get_level() { return s_logging_level; }

  SO_EXPORT LOGGING_LEVEL str_to_level(const char *const logging_level) {
    if (logging_level == nullptr) return DEFAULT_LOGGING_LEVEL;
    std::string name(logging_level);
    auto const not_space = [](unsigned char ch) { return !std::isspace(ch); };
    name.erase(std::find_if(name.rbegin(), name.rend(), not_space).base(), name.end());
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), not_space));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (name == "ERR") return LL::ERR;
    for(auto level : { LL::TRACE, LL::DEBUG, LL::INFO, LL::WARN, LL::ERR, LL::FATAL }) {
      if (name == traits_of(level).name) return level;
    }
    return DEFAULT_LOGGING_LEVEL; // didn't match anything so return default logging level
  }

  SO_EXPORT const char* level_to_str(LOGGING_LEVEL level) {
    const char * const name = traits_of(level).name;
    return *name != '\0' ? name : traits_of(DEFAULT_LOGGING_LEVEL).name;
  }

  SO_EXPORT void set_level(LOGGING_LEVEL level) {
    s_logging_level = level;
  }

  SO_EXPORT bool set_level_from_env() {
    const char * const env_level = getenv(LOG_LEVEL_ENV_VAR);
    if (env_level == nullptr || *env_level == '\0') return false;
    set_level(str_to_level(env_level));
    return true;
  }

  SO_EXPORT void set_to_unbuffered() {
    setvbuf(stdout, NULL, _IONBF, 0);
    setvbuf(stderr, NULL, _IONBF, 0);
  }

  // formats fmt/ap into a string, growing past DEFAULT_STRBUF_SIZE when needed
  static std::string format_message(const char * const fmt, va_list ap) {
    std::vector<char> buf(DEFAULT_STRBUF_SIZE);
    va_list ap_copy;
    va_copy(ap_copy, ap);
    int n = vsnprintf(buf.data(), buf.size(), fmt, ap);
    if (n >= 0 && static_cast<size_t>(n) >= buf.size()) {
      buf.resize(static_cast<size_t>(n) + 1);
      n = vsnprintf(buf.data(), buf.size(), fmt, ap_copy);
    }
    va_end(ap_copy);
    return n < 0 ? std::string() : std::string(buf.data(), static_cast<size_t>(n));
  }

  SO_EXPORT void vlog(LOGGING_LEVEL level, const char * const fmt, va_list ap) {
    if (!is_enabled(level)) return;

    const auto &traits = traits_of(level);
    const auto msg = format_message(fmt, ap);

    std::lock_guard<std::mutex> lk(s_output_guard);
    fprintf(traits.to_stderr ? stderr : stdout, "%s: %s: %s\n", s_progname.c_str(), traits.name, msg.c_str());
    if (traits.to_syslog && s_syslogging_enabled) {
      open_syslog_once();
      syslog(LOG_ERR, "%s: %s", traits.name, msg.c_str());
    }
  }

  SO_EXPORT void log(LOGGING_LEVEL level, const char * const fmt, ...) {
    if (!is_enabled(level)) return;

    va_list ap;
    va_start(ap, fmt);
    vlog(level, fmt, ap);
    va_end(ap);
  }

  SO_EXPORT void logm(LOGGING_LEVEL level, const char * const msg) {
    log(level, "%s", msg);
  }
}
