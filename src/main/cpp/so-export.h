/* so-export.h

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
#ifndef __SO_EXPORT_H__
#define __SO_EXPORT_H__

#ifndef __has_attribute
  #define __has_attribute(x) 0
#endif
#if (defined(__GNUC__) && ((__GNUC__ > 4) || (__GNUC__ == 4) && (__GNUC_MINOR__ > 2))) || __has_attribute(visibility)
  #define SO_EXPORT     __attribute__((visibility("default")))
#else
  #define SO_EXPORT
#endif

// C entry points exported by the kickstart executable (linked with -rdynamic) so that
// native code loaded into the process after hand-off can extend the running classpath.
// Each returns 0 on success, non-zero if the path could not be turned into a locator
// or the bootstrap context is not yet established.
extern "C" SO_EXPORT int kickstart_add_path(const char *path);
extern "C" SO_EXPORT int kickstart_add_url(const char *path);
extern "C" SO_EXPORT const char* kickstart_install_dir();

#endif /* __SO_EXPORT_H__ */
