/* kickstart-exception.cpp

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
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <cxxabi.h>
#include <execinfo.h>
#include "kickstart-exception.h"

static const int MAX_TRACE_FRAMES = 64;

char* kickstart_exception::type_name(const char * const mangled_name) {
  int status;
  return abi::__cxa_demangle(mangled_name, 0, 0, &status);
}

void kickstart_exception::free_nm(char *p) {
  std::free(p);
}

std::string get_unmangled_name(const char * const mangled_name) {
  auto const free_nm = [](char *p) { std::free(p); };
  int status;
  auto const pnm = abi::__cxa_demangle(mangled_name, 0, 0, &status);
  std::unique_ptr<char,decltype(free_nm)> nm_sp(const_cast<char*>(pnm), free_nm);
  return std::string(nm_sp ? nm_sp.get() : mangled_name);
}

// A backtrace_symbols() line looks like "module(mangled+0x1f) [0x4005d4]";
// the mangled part is replaced with its demangled form where possible.
static std::string demangle_frame(const char * const frame) {
  const char * const open_paren = strchr(frame, '(');
  const char * const plus_sign = open_paren != nullptr ? strchr(open_paren, '+') : nullptr;
  if (open_paren == nullptr || plus_sign == nullptr || plus_sign == open_paren + 1) {
    return std::string(frame);
  }
  const std::string mangled(open_paren + 1, plus_sign);
  int status = -1;
  auto const free_nm = [](char *p) { std::free(p); };
  std::unique_ptr<char,decltype(free_nm)> nm_sp(abi::__cxa_demangle(mangled.c_str(), 0, 0, &status), free_nm);
  if (status != 0 || !nm_sp) {
    return std::string(frame);
  }
  std::string rslt(frame, open_paren + 1);
  rslt += nm_sp.get();
  rslt += plus_sign;
  return rslt;
}

std::string kickstart_exception::capture_stack_trace(const int skip_frames) {
  void *frames[MAX_TRACE_FRAMES];
  const int n = backtrace(frames, MAX_TRACE_FRAMES);
  if (n <= 0) return std::string();

  auto const free_symbols = [](char **p) { std::free(p); };
  std::unique_ptr<char*, decltype(free_symbols)> symbols_sp(backtrace_symbols(frames, n), free_symbols);
  if (!symbols_sp) return std::string();

  std::stringstream ss;
  for(int i = skip_frames < 0 ? 0 : skip_frames; i < n; i++) {
    ss << "\tat " << demangle_frame(symbols_sp.get()[i]) << '\n';
  }
  return ss.str();
}

std::string kickstart_exception::describe() const {
  std::string rslt(name());
  rslt += ": ";
  rslt += _msg;
  rslt += '\n';
  rslt += _trace;
  return rslt;
}

std::string describe_exception(const std::exception &ex) {
  auto const kex = dynamic_cast<const kickstart_exception*>(&ex);
  if (kex != nullptr) {
    return kex->describe();
  }
  std::string rslt( get_unmangled_name(typeid(ex).name()) );
  rslt += ": ";
  rslt += ex.what();
  rslt += '\n';
  return rslt;
}
