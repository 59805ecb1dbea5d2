/* str-util.h

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
#ifndef __STR_UTIL_H__
#define __STR_UTIL_H__

#include <string>
#include <vector>
#include <cstdarg>

std::string vformat2str(const char *const fmt, va_list ap);

std::string format2str(const char *const fmt, ...) __attribute__((format(printf, 1, 2)));

// Splits an input C string into a returned vector of std::string parts where is split
// on a specified character. Empty parts (adjacent split characters, or a leading or
// trailing split character) are not returned.
std::vector<std::string> str_split(const char *s, const char c);

inline std::vector<std::string> str_split(const std::string &s, const char c) { return str_split(s.c_str(), c); }

bool starts_with(const std::string &s, const char *prefix);
bool ends_with(const std::string &s, const char *suffix);
std::string to_lower(std::string s);

#endif //__STR_UTIL_H__
