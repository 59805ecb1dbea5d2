/* jvm-backend.h

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
#ifndef __JVM_BACKEND_H__
#define __JVM_BACKEND_H__

#include <string>
#include <vector>
#include <dlfcn.h>
#include <jni.h>
#include "kickstart-exception.h"
#include "dynamic-loader.h"

// declare create_jvm_exception
DECL_EXCEPTION(create_jvm)
// declare jni_call_exception (a JNI call into the running JVM failed)
DECL_EXCEPTION(jni_call)

namespace kickstart {

  // Determine the Java JVM runtime library path via the JAVA_HOME directory
  // (returns just the jvm library file name if it is not found under java_home)
  std::string determine_jvmlib_path(const char *java_home);

  /**
   * Splits a JVM command line with popt quoting rules. A -Djava.class.path=
   * option is dropped (logged at WARN) as the class path is always the one
   * the backend is constructed with.
   *
   * @throws create_jvm_exception if the command line cannot be parsed
   */
  std::vector<std::string> split_jvm_options(const std::string &cmd_line_args);

  /**
   * Loader backend hosting a Java VM in-process. The JVM is created when the
   * backend is seeded; the seed locators become a java.net.URLClassLoader, a child
   * of the system class loader, that later locators are appended to with addURL.
   */
  class jvm_backend : public loader_backend {
    friend class jvm_startable;
  private:
    const std::string _jvmlib_path;
    const std::vector<std::string> _jvm_options;
    const std::string _class_path;
    std::string _bridge_class;
    std::vector<JNINativeMethod> _bridge_methods;
    void *_hlibjvm{nullptr};
    JavaVM *_jvm{nullptr};
    jobject _loader{nullptr};   // global ref
    jmethodID _add_url_mid{nullptr};
  public:
    // class_path becomes -Djava.class.path= of the created JVM
    jvm_backend(std::string jvmlib_path, std::vector<std::string> jvm_options, std::string class_path);
    jvm_backend(const jvm_backend &) = delete;
    jvm_backend& operator=(const jvm_backend &) = delete;
    // waits for the JVM's non-daemon threads, then destroys it
    ~jvm_backend() override;
  public:
    // natives to register on class_name (resolved through the seeded loader) once the JVM is up
    void set_bridge(std::string class_name, std::vector<JNINativeMethod> methods);
    void seed(const std::vector<locator> &locators) override;
    void append(const locator &loc) override;
    void make_context_loader() override;
    std::unique_ptr<startable> resolve_entry(const std::string &class_name) override;
    bool has_property(const std::string &name) override;
    void set_property(const std::string &name, const std::string &value) override;
  private:
    void create_jvm();
    JNIEnv* env();
    jobject new_url(JNIEnv *env, const locator &loc);
    jclass load_class(JNIEnv *env, const std::string &class_name);
    void register_bridge(JNIEnv *env);
  };

  std::string jstring_to_str(JNIEnv *env, jstring jstr);

  // Renders the pending Java exception (stack trace included) and clears it;
  // returns an empty string when no exception is pending.
  std::string take_pending_exception(JNIEnv *env);

} // namespace kickstart

#endif // __JVM_BACKEND_H__
