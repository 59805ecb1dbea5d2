/* kickstart-exception.h

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
#ifndef __KICKSTART_EXCEPTION_H__
#define __KICKSTART_EXCEPTION_H__

#include <exception>
#include <memory>
#include <string>
#include <typeinfo>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wreorder"
class kickstart_exception : public std::exception {
protected:
  virtual void make_abstract() = 0;
protected:
  static void free_nm(char *p);
  std::unique_ptr<char, decltype(&free_nm)> _nm{ nullptr, &free_nm };
  std::string _msg;
  std::string _trace;
  char* type_name(const char * const mangled_name);
  explicit kickstart_exception(const char * const mangled_type_name, const char * const msg)
    : _msg{ msg }, _trace{ capture_stack_trace(2) } { _nm.reset(type_name(mangled_type_name)); }
  explicit kickstart_exception(const char * const mangled_type_name, std::string &msg)
    : _msg{ std::move(msg) }, _trace{ capture_stack_trace(2) } { _nm.reset(type_name(mangled_type_name)); }
  kickstart_exception() = default;
public:
  kickstart_exception(const char * const msg) = delete;
  kickstart_exception(std::string &&) = delete;
  kickstart_exception(const std::string &) = delete;
  kickstart_exception(std::string &) = delete;
  kickstart_exception(const kickstart_exception &) = delete;
  kickstart_exception& operator=(const kickstart_exception &) = delete;
  kickstart_exception(kickstart_exception &&) = delete;
  kickstart_exception& operator=(kickstart_exception &&) = delete;
  ~kickstart_exception() override = default;
public:
  virtual const char* name() const throw()  { return _nm ? _nm.get() : "kickstart_exception"; }
  const char* what() const throw() override { return _msg.c_str(); }
  // call stack at the point the exception was constructed, one frame per line
  const char* trace() const throw() { return _trace.c_str(); }
  // "name: what" followed by the captured call stack
  std::string describe() const;

  static std::string capture_stack_trace(int skip_frames = 1);
};
#pragma GCC diagnostic pop

#define DECL_EXCEPTION(x) \
class x##_exception : public kickstart_exception {\
protected:\
  void make_abstract() override {}\
public:\
  x##_exception() = delete;\
  explicit x##_exception(const char * const msg) : kickstart_exception{ typeid(x##_exception).name(), msg } {}\
  explicit x##_exception(std::string &&msg) : kickstart_exception{ typeid(x##_exception).name(), msg } {}\
  x##_exception(const std::string &) = delete;\
  x##_exception(std::string &) = delete;\
  x##_exception(const x##_exception &) = delete;\
  x##_exception& operator=(const x##_exception &) = delete;\
  x##_exception(x##_exception &&ex) noexcept : kickstart_exception() { this->operator=(std::move(ex)); }\
  x##_exception& operator=(x##_exception &&ex) noexcept {\
    this->_nm    = std::move(ex._nm);\
    this->_msg   = std::move(ex._msg);\
    this->_trace = std::move(ex._trace);\
    return *this;\
  }\
  ~x##_exception() override = default;\
};

std::string get_unmangled_name(const char * const mangled_name);

// Renders any std::exception for an error report; a kickstart_exception
// contributes its captured call stack as well.
std::string describe_exception(const std::exception &ex);

#endif // __KICKSTART_EXCEPTION_H__
