/* kickstart.cpp

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
#include <libgen.h>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <iostream>
#include "so-export.h"
#include "log.h"
#include "str-util.h"
#include "launch-env.h"
#include "bootstrap.h"
#include "cfgparse.h"
#include "jvm-backend.h"

using logger::log;
using logger::LL;
using namespace kickstart;

// established once initialization is done; lives until process exit
static std::atomic<bootstrap_context*> s_ctx{ nullptr };

static bootstrap_context& established_context() {
  auto const ctx = s_ctx.load();
  if (ctx == nullptr) {
    throw entry_point_exception("the bootstrap context is not established");
  }
  return *ctx;
}

static void throw_java_exception(JNIEnv * const env, const char * const class_name, const char * const msg) {
  jclass const cls = env->FindClass(class_name);
  if (cls != nullptr) {
    env->ThrowNew(cls, msg);
    env->DeleteLocalRef(cls);
  }
}

using classpath_op_t = void (*)(classpath_extender &extender, const std::string &path);

static void invoke_classpath_op(JNIEnv * const env, jstring jpath, const classpath_op_t op) {
  const auto path = jstring_to_str(env, jpath);
  try {
    op(established_context().extender(), path);
  } catch(const malformed_locator_exception &ex) {
    throw_java_exception(env, "java/net/MalformedURLException", ex.what());
  } catch(const std::exception &ex) {
    throw_java_exception(env, "java/lang/IllegalStateException", ex.what());
  }
}

// static native void addURL(String path)
static void JNICALL native_add_url(JNIEnv *env, jclass, jstring jpath) {
  invoke_classpath_op(env, jpath, [](classpath_extender &extender, const std::string &path) {
    extender.add_url(path);
  });
}

// static native void addPath(String path)
static void JNICALL native_add_path(JNIEnv *env, jclass, jstring jpath) {
  invoke_classpath_op(env, jpath, [](classpath_extender &extender, const std::string &path) {
    extender.add_path(path);
  });
}

// static native String getInstallDir()
static jstring JNICALL native_get_install_dir(JNIEnv *env, jclass) {
  auto const ctx = s_ctx.load();
  if (ctx == nullptr || !ctx->install_dir().known()) return nullptr;
  return env->NewStringUTF(ctx->install_dir().path().c_str());
}

static std::vector<JNINativeMethod> bridge_methods() {
  return std::vector<JNINativeMethod>{
      { const_cast<char*>("addURL"), const_cast<char*>("(Ljava/lang/String;)V"),
        reinterpret_cast<void*>(native_add_url) },
      { const_cast<char*>("addPath"), const_cast<char*>("(Ljava/lang/String;)V"),
        reinterpret_cast<void*>(native_add_path) },
      { const_cast<char*>("getInstallDir"), const_cast<char*>("()Ljava/lang/String;"),
        reinterpret_cast<void*>(native_get_install_dir) },
  };
}

static int invoke_c_api(const char * const path, const classpath_op_t op, const char * const func_name) {
  if (path == nullptr) return EXIT_FAILURE;
  try {
    op(established_context().extender(), path);
    return EXIT_SUCCESS;
  } catch(const std::exception &ex) {
    log(LL::ERR, "%s(\"%s\") failed: %s", func_name, path, ex.what());
    return EXIT_FAILURE;
  }
}

extern "C" SO_EXPORT int kickstart_add_path(const char *path) {
  return invoke_c_api(path, [](classpath_extender &extender, const std::string &p) { extender.add_path(p); },
                      __func__);
}

extern "C" SO_EXPORT int kickstart_add_url(const char *path) {
  return invoke_c_api(path, [](classpath_extender &extender, const std::string &p) { extender.add_url(p); },
                      __func__);
}

extern "C" SO_EXPORT const char* kickstart_install_dir() {
  auto const ctx = s_ctx.load();
  return ctx != nullptr && ctx->install_dir().known() ? ctx->install_dir().path().c_str() : nullptr;
}

static void apply_logging_level(const launcher_config &cfg) {
  if (!cfg.logging_level.empty()) {
    logger::set_level(logger::str_to_level(cfg.logging_level.c_str()));
  }
  // environment takes precedence over the config file
  logger::set_level_from_env();
  log(LL::DEBUG, "logging level is %s", logger::level_to_str(logger::get_level()));
}

int main(int argc, char **argv) {
  const std::string progname = [](const char * const path) -> std::string {
    std::string dup_path(path != nullptr ? path : "kickstart");
    return std::string(basename(&dup_path[0]));
  }(argc > 0 ? argv[0] : nullptr);

  logger::set_progname(progname.c_str());
  logger::set_to_unbuffered();
  logger::set_level_from_env();

  const auto env = launch_env::from_process();
  log(LL::DEBUG, "%d command-line arg(s),\n\tsearch path: \"%s\"\n\tworking dir: \"%s\"",
      argc - 1, env.search_path.c_str(), env.working_dir.c_str());

  std::unique_ptr<bootstrap_context> ctx;
  try {
    ctx = bootstrap::initialize(env, { environment_publisher(SEARCH_PATH_ENV_VAR) });
  } catch(const std::exception &ex) {
    log(LL::FATAL, "bootstrap initialization failed:\n%s", describe_exception(ex).c_str());
    return EXIT_FAILURE;
  }

  launcher_config cfg;
  try {
    cfg = load_launcher_config(ctx->install_dir());
  } catch(const process_cfg_exception &ex) {
    ctx->record_failure(init_failure{ format2str("Error loading %s:\n\t%s", CONFIG_FILE_NAME, ex.what()),
                                      ex.trace() });
  }
  apply_logging_level(cfg);

  std::vector<std::string> jvm_options;
  try {
    jvm_options = split_jvm_options(cfg.jvm_cmd_line_args);
  } catch(const create_jvm_exception &ex) {
    ctx->record_failure(init_failure{ std::string(ex.what()), ex.trace() });
  }

  const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  s_ctx = ctx.get();
  int exit_code = EXIT_FAILURE;
  {
    // the JVM is only created when the backend gets seeded at hand-off
    jvm_backend backend(determine_jvmlib_path(getenv("JAVA_HOME")), std::move(jvm_options),
                        bootstrap::launcher_class_path(*ctx));
    backend.set_bridge(cfg.bridge_class, bridge_methods());
    exit_code = bootstrap::hand_off(*ctx, backend, cfg.settings, args, std::cerr);
  }
  s_ctx = nullptr;
  return exit_code;
}
