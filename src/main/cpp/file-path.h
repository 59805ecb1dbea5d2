/* file-path.h

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
#ifndef __FILE_PATH_H__
#define __FILE_PATH_H__

#include <string>

const char kPathSeparator = '/';

// joins two path parts with exactly one separator between them
std::string path_concat(const char * const str1, const char * const str2);

inline std::string path_concat(const std::string &str1, const char * const str2) {
  return path_concat(str1.c_str(), str2);
}

// Parent of a path, with trailing separators ignored: "/opt/app/bin" -> "/opt/app",
// "/opt" -> "/". Returns an empty string when there is no parent ("/", "name").
std::string parent_path(const std::string &path);

// Removes "." segments, resolves ".." segments and duplicate separators without
// consulting the file system.
std::string lexically_normal(const std::string &path);

// Absolute form of path, taken against cwd when relative (not normalized).
// Returns an empty string if path is relative and cwd is empty.
std::string absolute_path(const std::string &path, const std::string &cwd);

// Canonical absolute form of path: symbolic links are resolved for the longest
// prefix that exists, the remainder is normalized lexically (so a file that does
// not exist yet still has a canonical form). Returns false if no form could be
// determined; out is left untouched in that case.
bool canonical_path(const std::string &path, const std::string &cwd, std::string &out);

bool is_directory(const char * const path);
inline bool is_directory(const std::string &path) { return is_directory(path.c_str()); }

bool is_readable_file(const char * const path);
inline bool is_readable_file(const std::string &path) { return is_readable_file(path.c_str()); }

// current working directory, or an empty string if it cannot be determined
std::string current_working_dir();

#endif // __FILE_PATH_H__
