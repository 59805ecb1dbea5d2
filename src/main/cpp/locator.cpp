/* locator.cpp

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
#include <cctype>
#include <climits>
#include <cstring>
#include <algorithm>
#include "str-util.h"
#include "file-path.h"
#include "locator.h"

namespace kickstart {

  static const char * const FILE_SCHEME = "file:";
  static const char URI_PATH_CHARS[] = "-._~!$&'()*+,;=:@/";

  static bool is_scheme_char(const unsigned char ch) {
    return std::isalnum(ch) || ch == '+' || ch == '-' || ch == '.';
  }

  locator::locator(std::string uri) : _uri(std::move(uri)) {
    const auto colon_pos = _uri.find(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || !std::isalpha(static_cast<unsigned char>(_uri[0])) ||
        !std::all_of(_uri.begin(), _uri.begin() + colon_pos, is_scheme_char))
    {
      throw malformed_locator_exception(format2str("no scheme in locator \"%s\"", _uri.c_str()));
    }
    if (colon_pos + 1 == _uri.size()) {
      throw malformed_locator_exception(format2str("locator \"%s\" names nothing", _uri.c_str()));
    }
    auto const bad_char = std::find_if(_uri.begin(), _uri.end(), [](unsigned char ch) {
      return std::isspace(ch) || std::iscntrl(ch);
    });
    if (bad_char != _uri.end()) {
      throw malformed_locator_exception(format2str("illegal character at index %d in locator \"%s\"",
                                                   static_cast<int>(bad_char - _uri.begin()), _uri.c_str()));
    }
  }

  static std::string percent_encode(const std::string &path) {
    static const char hex_digits[] = "0123456789ABCDEF";
    std::string rslt;
    rslt.reserve(path.size());
    for(const unsigned char ch : path) {
      if (std::isalnum(ch) || (ch != '\0' && strchr(URI_PATH_CHARS, ch) != nullptr)) {
        rslt += static_cast<char>(ch);
      } else {
        rslt += '%';
        rslt += hex_digits[ch >> 4];
        rslt += hex_digits[ch & 0x0F];
      }
    }
    return rslt;
  }

  static std::string collapse_separators(const std::string &path) {
    std::string rslt;
    rslt.reserve(path.size());
    for(const char ch : path) {
      if (ch == '/' && !rslt.empty() && rslt.back() == '/') continue;
      rslt += ch;
    }
    return rslt;
  }

  locator to_locator(const std::string &path, const platform p, const std::string &cwd) {
    if (path.empty()) {
      throw malformed_locator_exception("empty path cannot be a locator");
    }
    if (path.find('\0') != std::string::npos) {
      throw malformed_locator_exception(format2str("path \"%s\" contains a NUL character", path.c_str()));
    }
    const char list_sep = path_list_separator(p);
    if (path.find(list_sep) != std::string::npos) {
      throw malformed_locator_exception(format2str("path \"%s\" contains the path-list separator '%c'",
                                                   path.c_str(), list_sep));
    }
    if (path.size() >= PATH_MAX) {
      throw malformed_locator_exception(format2str("path \"%.64s...\" exceeds %d characters", path.c_str(), PATH_MAX));
    }

    const bool is_windows = p == platform::WINDOWS_FAMILY;
    std::string s{path};
    if (is_windows) {
      std::replace(s.begin(), s.end(), '\\', '/');
    }
    const auto leading = s.find_first_not_of('/');
    const auto lead_count = leading == std::string::npos ? s.size() : leading;
    const bool has_drive = is_windows && s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';

    std::string uri_path;
    if (is_windows && lead_count >= 4) {
      uri_path = "////" + collapse_separators(s.substr(lead_count));
    } else if (has_drive) {
      uri_path = "/" + collapse_separators(s);
    } else if (lead_count > 0) {
      uri_path = collapse_separators(s);
    } else {
      const auto abs_path = absolute_path(s, cwd);
      if (abs_path.empty()) {
        throw malformed_locator_exception(format2str("relative path \"%s\" has no working directory to resolve against",
                                                     path.c_str()));
      }
      uri_path = collapse_separators(abs_path);
    }

    const char last_ch = path.back();
    const bool names_dir = last_ch == '/' || (is_windows && last_ch == '\\') || is_directory(path);
    if (names_dir && uri_path.back() != '/') {
      uri_path += '/';
    }

    return locator(FILE_SCHEME + percent_encode(uri_path));
  }

} // namespace kickstart
