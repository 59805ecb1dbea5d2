/* jvm-backend.cpp

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
#include <algorithm>
#include <memory>
#include <popt.h>
#include "log.h"
#include "str-util.h"
#include "file-path.h"
#include "jvm-backend.h"

using logger::log;
using logger::LL;

using const_char_ptr_t = const char *;

static const_char_ptr_t const jvm_classpath_optn_str = "-Djava.class.path=";
static const_char_ptr_t const jvmlib_name = "libjvm.so";

#if defined(__x86_64__)
  #define JVM_ARCH "amd64"
#elif defined(__aarch64__)
  #define JVM_ARCH "aarch64"
#elif defined(__i386__)
  #define JVM_ARCH "i386"
#else
  #define JVM_ARCH ""
#endif

namespace {
  // deletes a JNI local reference when going out of scope
  struct local_ref_deleter {
    JNIEnv *env;
    void operator()(jobject p) const {
      if (p != nullptr) {
        env->DeleteLocalRef(p);
      }
    }
  };
  using local_ref_t = std::unique_ptr<_jobject, local_ref_deleter>;

  template<typename E, typename T>
  T checked(JNIEnv * const env, T rslt, const char * const what) {
    if (rslt == nullptr || env->ExceptionCheck() != JNI_FALSE) {
      const auto excptn_str = kickstart::take_pending_exception(env);
      throw E(format2str("%s failed%s%s", what, excptn_str.empty() ? "" : ":\n", excptn_str.c_str()));
    }
    return rslt;
  }
}

namespace kickstart {

  std::string determine_jvmlib_path(const char * const java_home) {
    log(LL::DEBUG, "Java environment variables:\n\tJAVA $JAVA_HOME=%s", java_home != nullptr ? java_home : "");
    if (java_home == nullptr || *java_home == '\0') {
      log(LL::WARN, "JAVA_HOME is not defined; relying on the dynamic linker to find \"%s\"", jvmlib_name);
      return jvmlib_name;
    }
    static const_char_ptr_t const subdirs[] = {
        "lib/server", "jre/lib/server", "lib/client", "jre/lib/" JVM_ARCH "/server"
    };
    for(auto const subdir : subdirs) {
      const auto candidate = path_concat(path_concat(java_home, subdir), jvmlib_name);
      if (is_readable_file(candidate)) {
        log(LL::DEBUG, "using Java JVM runtime located at:\n\t\"%s\"", candidate.c_str());
        return candidate;
      }
    }
    log(LL::ERR, "failed to find Java JVM runtime \"%s\" under \"%s\"", jvmlib_name, java_home);
    return jvmlib_name;
  }

  std::vector<std::string> split_jvm_options(const std::string &cmd_line_args) {
    std::vector<std::string> rslt;
    if (cmd_line_args.find_first_not_of(" \t\r\n") == std::string::npos) return rslt;

    int argc = 0;
    const_char_ptr_t *argv = nullptr;
    const auto rtn = poptParseArgvString(cmd_line_args.c_str(), &argc, &argv);
    if (rtn != 0) {
      static const_char_ptr_t const err_msg_fmt = "%s() failed parsing Java JVM command line:\n\t%s";
      throw create_jvm_exception(format2str(err_msg_fmt, __func__, poptStrerror(rtn)));
    }
    auto const cleanup = [](const_char_ptr_t *p) {
      if (p != nullptr) {
        std::free(p);
      }
    };
    std::unique_ptr<const_char_ptr_t, decltype(cleanup)> raii_argv_sp(argv, cleanup);

    for(int i = 0; i < argc; i++) {
      if (strncmp(argv[i], jvm_classpath_optn_str, strlen(jvm_classpath_optn_str)) == 0) {
        log(LL::WARN, "ignoring JVM option %s - the launcher class path is used instead", argv[i]);
        continue;
      }
      rslt.emplace_back(argv[i]);
    }
    return rslt;
  }

  std::string jstring_to_str(JNIEnv * const env, jstring jstr) {
    if (jstr == nullptr) return std::string();
    const char * const utf = env->GetStringUTFChars(jstr, nullptr);
    if (utf == nullptr) return std::string();
    std::string rslt(utf);
    env->ReleaseStringUTFChars(jstr, utf);
    return rslt;
  }

  std::string take_pending_exception(JNIEnv * const env) {
    if (env->ExceptionCheck() == JNI_FALSE) return std::string();
    local_ref_t throwable(env->ExceptionOccurred(), local_ref_deleter{env});
    env->ExceptionClear();

    // new StringWriter; throwable.printStackTrace(new PrintWriter(sw)); sw.toString()
    std::string rslt;
    local_ref_t sw_cls(env->FindClass("java/io/StringWriter"), local_ref_deleter{env});
    local_ref_t pw_cls(env->FindClass("java/io/PrintWriter"), local_ref_deleter{env});
    local_ref_t th_cls(env->FindClass("java/lang/Throwable"), local_ref_deleter{env});
    if (sw_cls && pw_cls && th_cls) {
      auto const sw_ctor = env->GetMethodID(static_cast<jclass>(sw_cls.get()), "<init>", "()V");
      auto const pw_ctor = env->GetMethodID(static_cast<jclass>(pw_cls.get()), "<init>", "(Ljava/io/Writer;)V");
      auto const print_trace = env->GetMethodID(static_cast<jclass>(th_cls.get()), "printStackTrace",
                                                "(Ljava/io/PrintWriter;)V");
      auto const to_string = env->GetMethodID(static_cast<jclass>(sw_cls.get()), "toString", "()Ljava/lang/String;");
      if (sw_ctor != nullptr && pw_ctor != nullptr && print_trace != nullptr && to_string != nullptr) {
        local_ref_t sw(env->NewObject(static_cast<jclass>(sw_cls.get()), sw_ctor), local_ref_deleter{env});
        local_ref_t pw(sw ? env->NewObject(static_cast<jclass>(pw_cls.get()), pw_ctor, sw.get()) : nullptr,
                       local_ref_deleter{env});
        if (pw) {
          env->CallVoidMethod(throwable.get(), print_trace, pw.get());
          local_ref_t jstr(env->CallObjectMethod(sw.get(), to_string), local_ref_deleter{env});
          rslt = jstring_to_str(env, static_cast<jstring>(jstr.get()));
        }
      }
    }
    if (env->ExceptionCheck() != JNI_FALSE) {
      env->ExceptionClear();
    }
    return rslt.empty() ? std::string("java.lang.Throwable (stack trace unavailable)") : rslt;
  }

  // An instance of the application entry class held by a JNI global reference.
  class jvm_startable : public startable {
  private:
    jvm_backend &_backend;
    jobject _obj; // global ref
    const jmethodID _start_mid;
    const std::string _class_name;
  public:
    jvm_startable(jvm_backend &backend, jobject obj, jmethodID start_mid, std::string class_name)
      : _backend(backend), _obj(obj), _start_mid(start_mid), _class_name(std::move(class_name)) {}
    jvm_startable(const jvm_startable &) = delete;
    jvm_startable& operator=(const jvm_startable &) = delete;
    ~jvm_startable() override {
      JNIEnv *envp = nullptr;
      if (_backend._jvm != nullptr && _backend._jvm->GetEnv((void**)&envp, JNI_VERSION_1_6) == JNI_OK) {
        envp->DeleteGlobalRef(_obj);
      }
    }
  public:
    void start(const std::vector<std::string> &args) override {
      auto const env = _backend.env();
      local_ref_t jstr_cls(checked<jni_call_exception>(env, env->FindClass("java/lang/String"), "FindClass(String)"),
                           local_ref_deleter{env});
      local_ref_t jargs(checked<jni_call_exception>(
          env, env->NewObjectArray(static_cast<jsize>(args.size()), static_cast<jclass>(jstr_cls.get()), nullptr),
          "NewObjectArray(String)"), local_ref_deleter{env});
      for(size_t i = 0; i < args.size(); i++) {
        local_ref_t jstr(checked<jni_call_exception>(env, env->NewStringUTF(args[i].c_str()), "NewStringUTF()"),
                         local_ref_deleter{env});
        env->SetObjectArrayElement(static_cast<jobjectArray>(jargs.get()), static_cast<jsize>(i), jstr.get());
      }

      log(LL::DEBUG, "invoking %s.start() with %d argument(s)", _class_name.c_str(), static_cast<int>(args.size()));
      env->CallVoidMethod(_obj, _start_mid, jargs.get());
      if (env->ExceptionCheck() != JNI_FALSE) {
        throw application_exception(take_pending_exception(env));
      }
    }
  };

  jvm_backend::jvm_backend(std::string jvmlib_path, std::vector<std::string> jvm_options, std::string class_path)
    : _jvmlib_path(std::move(jvmlib_path)), _jvm_options(std::move(jvm_options)), _class_path(std::move(class_path))
  {}

  jvm_backend::~jvm_backend() {
    if (_jvm == nullptr) return;
    JNIEnv *envp = nullptr;
    if (_loader != nullptr && _jvm->GetEnv((void**)&envp, JNI_VERSION_1_6) == JNI_OK) {
      envp->DeleteGlobalRef(_loader);
    }
    log(LL::DEBUG, "%s() waiting on Java JVM threads before destroying it", __func__);
    const auto rc = _jvm->DestroyJavaVM();
    if (rc != JNI_OK) {
      log(LL::WARN, "%s() DestroyJavaVM() returned %d", __func__, static_cast<int>(rc));
    }
  }

  void jvm_backend::set_bridge(std::string class_name, std::vector<JNINativeMethod> methods) {
    _bridge_class = std::move(class_name);
    _bridge_methods = std::move(methods);
  }

  void jvm_backend::create_jvm() {
    _hlibjvm = dlopen(_jvmlib_path.c_str(), RTLD_LAZY);
    if (_hlibjvm == nullptr) {
      static const_char_ptr_t const err_msg_fmt = "failed to load the Java JVM runtime \"%s\"\n\t%s";
      throw create_jvm_exception(format2str(err_msg_fmt, _jvmlib_path.c_str(), dlerror()));
    }

    const_char_ptr_t const create_jvm_func_name = "JNI_CreateJavaVM";
    typedef jint (JNICALL *JNI_CreateJavaVM_Proc_t)(JavaVM **/*pvm*/, void **/*penv*/, void */*args*/);
    auto const JNI_CreateJavaVM_proc = (JNI_CreateJavaVM_Proc_t) dlsym(_hlibjvm, create_jvm_func_name);
    if (JNI_CreateJavaVM_proc == nullptr) {
      static const_char_ptr_t const err_msg_fmt = "failed to obtain function %s() for creating JVM instance";
      throw create_jvm_exception(format2str(err_msg_fmt, create_jvm_func_name));
    }

    std::vector<std::string> option_strs;
    option_strs.reserve(_jvm_options.size() + 1);
    option_strs.push_back(std::string(jvm_classpath_optn_str) + _class_path);
    option_strs.insert(option_strs.end(), _jvm_options.begin(), _jvm_options.end());

    std::vector<JavaVMOption> options(option_strs.size());
    for(size_t i = 0; i < option_strs.size(); i++) {
      options[i].optionString = const_cast<char*>(option_strs[i].c_str());
      options[i].extraInfo = nullptr;
    }
    if (logger::is_trace_level()) {
      log(LL::TRACE, "%s() Java JVM args: %d", __func__, static_cast<int>(options.size()));
      for(auto const &option : options) {
        log(LL::TRACE, "\t%s", option.optionString);
      }
    }

    JavaVMInitArgs vm_args = {0};
    vm_args.version = JNI_VERSION_1_6;
    vm_args.options = options.data();
    vm_args.nOptions = static_cast<jint>(options.size());
    vm_args.ignoreUnrecognized = JNI_TRUE;

    JavaVM *jvmp = nullptr;
    JNIEnv *envp = nullptr;
    const auto res = JNI_CreateJavaVM_proc(&jvmp, (void**)&envp, &vm_args);
    if (res < 0) {
      throw create_jvm_exception(format2str("%s() failed creating JVM instance: error %d", create_jvm_func_name,
                                            static_cast<int>(res)));
    }
    _jvm = jvmp;
  }

  JNIEnv* jvm_backend::env() {
    if (_jvm == nullptr) {
      throw jni_call_exception("the Java JVM runtime has not been created");
    }
    JNIEnv *envp = nullptr;
    const auto rc = _jvm->GetEnv((void**)&envp, JNI_VERSION_1_6);
    if (rc == JNI_EDETACHED) {
      if (_jvm->AttachCurrentThreadAsDaemon((void**)&envp, nullptr) != JNI_OK) {
        throw jni_call_exception("failed attaching the current thread to the Java JVM");
      }
    } else if (rc != JNI_OK) {
      throw jni_call_exception(format2str("GetEnv() failed with error %d", static_cast<int>(rc)));
    }
    return envp;
  }

  jobject jvm_backend::new_url(JNIEnv * const env, const locator &loc) {
    local_ref_t url_cls(checked<jni_call_exception>(env, env->FindClass("java/net/URL"), "FindClass(URL)"),
                        local_ref_deleter{env});
    auto const ctor = checked<jni_call_exception>(
        env, env->GetMethodID(static_cast<jclass>(url_cls.get()), "<init>", "(Ljava/lang/String;)V"), "URL.<init>");
    local_ref_t juri(checked<jni_call_exception>(env, env->NewStringUTF(loc.c_str()), "NewStringUTF()"),
                     local_ref_deleter{env});
    auto const url = env->NewObject(static_cast<jclass>(url_cls.get()), ctor, juri.get());
    if (url == nullptr || env->ExceptionCheck() != JNI_FALSE) {
      throw malformed_locator_exception(format2str("%s is not a valid URL:\n%s", loc.c_str(),
                                                   take_pending_exception(env).c_str()));
    }
    return url;
  }

  void jvm_backend::seed(const std::vector<locator> &locators) {
    if (_loader != nullptr) {
      throw jni_call_exception("the Java class loader is already seeded");
    }
    if (_jvm == nullptr) {
      create_jvm();
    }
    auto const env = this->env();

    local_ref_t url_cls(checked<create_jvm_exception>(env, env->FindClass("java/net/URL"), "FindClass(URL)"),
                        local_ref_deleter{env});
    local_ref_t urls(checked<create_jvm_exception>(
        env, env->NewObjectArray(static_cast<jsize>(locators.size()), static_cast<jclass>(url_cls.get()), nullptr),
        "NewObjectArray(URL)"), local_ref_deleter{env});
    jsize i = 0;
    for(auto const &loc : locators) {
      local_ref_t url(new_url(env, loc), local_ref_deleter{env});
      env->SetObjectArrayElement(static_cast<jobjectArray>(urls.get()), i++, url.get());
    }

    local_ref_t cl_cls(checked<create_jvm_exception>(env, env->FindClass("java/lang/ClassLoader"),
                                                     "FindClass(ClassLoader)"), local_ref_deleter{env});
    auto const get_sys_cl = checked<create_jvm_exception>(
        env, env->GetStaticMethodID(static_cast<jclass>(cl_cls.get()), "getSystemClassLoader",
                                    "()Ljava/lang/ClassLoader;"), "ClassLoader.getSystemClassLoader");
    local_ref_t sys_cl(checked<create_jvm_exception>(
        env, env->CallStaticObjectMethod(static_cast<jclass>(cl_cls.get()), get_sys_cl),
        "ClassLoader.getSystemClassLoader()"), local_ref_deleter{env});

    local_ref_t ucl_cls(checked<create_jvm_exception>(env, env->FindClass("java/net/URLClassLoader"),
                                                      "FindClass(URLClassLoader)"), local_ref_deleter{env});
    auto const ucl_ctor = checked<create_jvm_exception>(
        env, env->GetMethodID(static_cast<jclass>(ucl_cls.get()), "<init>", "([Ljava/net/URL;Ljava/lang/ClassLoader;)V"),
        "URLClassLoader.<init>");
    // addURL() is protected; JNI is not bound by Java access checks
    _add_url_mid = checked<create_jvm_exception>(
        env, env->GetMethodID(static_cast<jclass>(ucl_cls.get()), "addURL", "(Ljava/net/URL;)V"),
        "URLClassLoader.addURL");
    local_ref_t ucl(checked<create_jvm_exception>(
        env, env->NewObject(static_cast<jclass>(ucl_cls.get()), ucl_ctor, urls.get(), sys_cl.get()),
        "new URLClassLoader()"), local_ref_deleter{env});
    _loader = env->NewGlobalRef(ucl.get());
    log(LL::DEBUG, "%s() URLClassLoader seeded with %d locator(s)", __func__, static_cast<int>(locators.size()));

    register_bridge(env);
  }

  void jvm_backend::append(const locator &loc) {
    if (_loader == nullptr) {
      throw jni_call_exception("the Java class loader has not been seeded");
    }
    auto const env = this->env();
    local_ref_t url(new_url(env, loc), local_ref_deleter{env});
    env->CallVoidMethod(_loader, _add_url_mid, url.get());
    if (env->ExceptionCheck() != JNI_FALSE) {
      throw malformed_locator_exception(format2str("URLClassLoader.addURL(%s) failed:\n%s", loc.c_str(),
                                                   take_pending_exception(env).c_str()));
    }
  }

  void jvm_backend::make_context_loader() {
    auto const env = this->env();
    local_ref_t thrd_cls(checked<jni_call_exception>(env, env->FindClass("java/lang/Thread"), "FindClass(Thread)"),
                         local_ref_deleter{env});
    auto const curr_thrd = checked<jni_call_exception>(
        env, env->GetStaticMethodID(static_cast<jclass>(thrd_cls.get()), "currentThread", "()Ljava/lang/Thread;"),
        "Thread.currentThread");
    auto const set_cntx_cl = checked<jni_call_exception>(
        env, env->GetMethodID(static_cast<jclass>(thrd_cls.get()), "setContextClassLoader",
                              "(Ljava/lang/ClassLoader;)V"), "Thread.setContextClassLoader");
    local_ref_t curr_thrd_obj(checked<jni_call_exception>(
        env, env->CallStaticObjectMethod(static_cast<jclass>(thrd_cls.get()), curr_thrd), "Thread.currentThread()"),
        local_ref_deleter{env});

    // now set the seeded class loader on the current thread object as the thread's context class loader
    env->CallVoidMethod(curr_thrd_obj.get(), set_cntx_cl, _loader);
    if (env->ExceptionCheck() != JNI_FALSE) {
      throw jni_call_exception(take_pending_exception(env));
    }
  }

  jclass jvm_backend::load_class(JNIEnv * const env, const std::string &class_name) {
    std::string binary_name(class_name);
    std::replace(binary_name.begin(), binary_name.end(), '/', '.');

    local_ref_t cl_cls(checked<jni_call_exception>(env, env->FindClass("java/lang/ClassLoader"),
                                                   "FindClass(ClassLoader)"), local_ref_deleter{env});
    auto const load_class_mid = checked<jni_call_exception>(
        env, env->GetMethodID(static_cast<jclass>(cl_cls.get()), "loadClass", "(Ljava/lang/String;)Ljava/lang/Class;"),
        "ClassLoader.loadClass");
    local_ref_t jname(checked<jni_call_exception>(env, env->NewStringUTF(binary_name.c_str()), "NewStringUTF()"),
                      local_ref_deleter{env});
    auto const cls = env->CallObjectMethod(_loader, load_class_mid, jname.get());
    if (cls == nullptr || env->ExceptionCheck() != JNI_FALSE) {
      throw entry_point_exception(format2str("could not load class %s:\n%s", binary_name.c_str(),
                                             take_pending_exception(env).c_str()));
    }
    return static_cast<jclass>(cls);
  }

  std::unique_ptr<startable> jvm_backend::resolve_entry(const std::string &class_name) {
    auto const env = this->env();
    local_ref_t cls(load_class(env, class_name), local_ref_deleter{env});
    auto const jcls = static_cast<jclass>(cls.get());
    auto const ctor = checked<entry_point_exception>(env, env->GetMethodID(jcls, "<init>", "()V"),
                                                     "no-argument constructor lookup");
    auto const start_mid = checked<entry_point_exception>(
        env, env->GetMethodID(jcls, "start", "([Ljava/lang/String;)V"), "start(String[]) lookup");
    local_ref_t obj(env->NewObject(jcls, ctor), local_ref_deleter{env});
    if (!obj || env->ExceptionCheck() != JNI_FALSE) {
      throw entry_point_exception(format2str("could not instantiate %s:\n%s", class_name.c_str(),
                                             take_pending_exception(env).c_str()));
    }
    return std::unique_ptr<startable>(new jvm_startable(*this, env->NewGlobalRef(obj.get()), start_mid, class_name));
  }

  bool jvm_backend::has_property(const std::string &name) {
    auto const env = this->env();
    local_ref_t sys_cls(checked<jni_call_exception>(env, env->FindClass("java/lang/System"), "FindClass(System)"),
                        local_ref_deleter{env});
    auto const get_prop = checked<jni_call_exception>(
        env, env->GetStaticMethodID(static_cast<jclass>(sys_cls.get()), "getProperty",
                                    "(Ljava/lang/String;)Ljava/lang/String;"), "System.getProperty");
    local_ref_t jname(checked<jni_call_exception>(env, env->NewStringUTF(name.c_str()), "NewStringUTF()"),
                      local_ref_deleter{env});
    local_ref_t value(env->CallStaticObjectMethod(static_cast<jclass>(sys_cls.get()), get_prop, jname.get()),
                      local_ref_deleter{env});
    if (env->ExceptionCheck() != JNI_FALSE) {
      throw jni_call_exception(take_pending_exception(env));
    }
    return value != nullptr;
  }

  void jvm_backend::set_property(const std::string &name, const std::string &value) {
    auto const env = this->env();
    local_ref_t sys_cls(checked<jni_call_exception>(env, env->FindClass("java/lang/System"), "FindClass(System)"),
                        local_ref_deleter{env});
    auto const set_prop = checked<jni_call_exception>(
        env, env->GetStaticMethodID(static_cast<jclass>(sys_cls.get()), "setProperty",
                                    "(Ljava/lang/String;Ljava/lang/String;)Ljava/lang/String;"), "System.setProperty");
    local_ref_t jname(checked<jni_call_exception>(env, env->NewStringUTF(name.c_str()), "NewStringUTF()"),
                      local_ref_deleter{env});
    local_ref_t jvalue(checked<jni_call_exception>(env, env->NewStringUTF(value.c_str()), "NewStringUTF()"),
                       local_ref_deleter{env});
    local_ref_t prev(env->CallStaticObjectMethod(static_cast<jclass>(sys_cls.get()), set_prop, jname.get(),
                                                 jvalue.get()), local_ref_deleter{env});
    if (env->ExceptionCheck() != JNI_FALSE) {
      throw jni_call_exception(take_pending_exception(env));
    }
  }

  void jvm_backend::register_bridge(JNIEnv * const env) {
    if (_bridge_class.empty() || _bridge_methods.empty()) return;
    jclass cls = nullptr;
    try {
      cls = load_class(env, _bridge_class);
    } catch(const entry_point_exception &ex) {
      log(LL::DEBUG, "native bridge class %s not present - natives not registered\n\t%s", _bridge_class.c_str(),
          ex.what());
      return;
    }
    local_ref_t cls_sp(cls, local_ref_deleter{env});
    const auto rc = env->RegisterNatives(cls, _bridge_methods.data(), static_cast<jint>(_bridge_methods.size()));
    if (rc != JNI_OK) {
      const auto excptn_str = take_pending_exception(env);
      log(LL::WARN, "RegisterNatives() on %s failed with error %d\n%s", _bridge_class.c_str(), static_cast<int>(rc),
          excptn_str.c_str());
      return;
    }
    log(LL::DEBUG, "registered %d native method(s) on %s", static_cast<int>(_bridge_methods.size()),
        _bridge_class.c_str());
  }

} // namespace kickstart
