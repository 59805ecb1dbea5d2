/* cfgparse-test.cpp

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
#include <gtest/gtest.h>
#include <fstream>
#include "cfgparse.h"
#include "test-util.h"

using namespace kickstart;
using kickstart_test::temp_dir;

class CfgParse : public ::testing::Test {
protected:
  temp_dir tmp;

  void write_config(const std::string &text) {
    tmp.make_dir("bin");
    std::ofstream out(tmp.path() + "/bin/" + CONFIG_FILE_NAME);
    out << text;
  }
};

TEST_F(CfgParse, MissingFileKeepsDefaults) {
  const auto cfg = load_launcher_config(install_dir(tmp.path()));
  EXPECT_FALSE(cfg.loaded);
  EXPECT_EQ("org.apache.jmeter.JMeter", cfg.settings.entry_class);
  EXPECT_EQ("JMeter", cfg.settings.app_name);
  EXPECT_EQ("log4j.configuration", cfg.settings.logging_property);
  EXPECT_EQ("log4j.conf", cfg.settings.logging_file);
  EXPECT_EQ("kickstart/NativeClasspath", cfg.bridge_class);
  EXPECT_TRUE(cfg.jvm_cmd_line_args.empty());
}

TEST_F(CfgParse, UnknownInstallDirKeepsDefaults) {
  const auto cfg = load_launcher_config(install_dir());
  EXPECT_FALSE(cfg.loaded);
  EXPECT_EQ("org.apache.jmeter.JMeter", cfg.settings.entry_class);
}

TEST_F(CfgParse, ReadsEverySection) {
  write_config(
      "; launcher settings\n"
      "[JvmSettings]\n"
      "CommandLineArgs=-Xmx512m -Dfile.encoding=UTF-8\n"
      "\n"
      "[LauncherSettings]\n"
      "EntryPoint=com/example/loadgen/Main\n"
      "NativeBridgeClass=com/example/Bridge\n"
      "ApplicationName=Loadgen\n"
      "\n"
      "[LoggingSettings]\n"
      "LoggingLevel=DEBUG\n"
      "ConfigProperty=log4j.configurationFile\n"
      "ConfigFile=log4j2.xml\n"
      "\n"
      "[Unrelated]\n"
      "Anything=goes\n");

  const auto cfg = load_launcher_config(install_dir(tmp.path()));
  EXPECT_TRUE(cfg.loaded);
  EXPECT_EQ("-Xmx512m -Dfile.encoding=UTF-8", cfg.jvm_cmd_line_args);
  EXPECT_EQ("com/example/loadgen/Main", cfg.settings.entry_class);
  EXPECT_EQ("com/example/Bridge", cfg.bridge_class);
  EXPECT_EQ("Loadgen", cfg.settings.app_name);
  EXPECT_EQ("DEBUG", cfg.logging_level);
  EXPECT_EQ("log4j.configurationFile", cfg.settings.logging_property);
  EXPECT_EQ("log4j2.xml", cfg.settings.logging_file);
}

TEST_F(CfgParse, MalformedLineThrows) {
  write_config(
      "[LauncherSettings]\n"
      "ApplicationName=Loadgen\n"
      "this line has no equals sign\n");
  try {
    load_launcher_config(install_dir(tmp.path()));
    FAIL() << "expected process_cfg_exception";
  } catch(const process_cfg_exception &ex) {
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("config file parsing error 3"));
  }
}

TEST_F(CfgParse, EmptyEntryPointRejected) {
  write_config(
      "[LauncherSettings]\n"
      "EntryPoint=\n");
  try {
    load_launcher_config(install_dir(tmp.path()));
    FAIL() << "expected process_cfg_exception";
  } catch(const process_cfg_exception &ex) {
    const std::string msg(ex.what());
    EXPECT_NE(std::string::npos, msg.find("config file parsing error 2"));
    EXPECT_NE(std::string::npos, msg.find("invalid setting [LauncherSettings] EntryPoint="));
  }
}

TEST(CfgParseSetting, SectionAndNameMatchIgnoringCase) {
  launcher_config cfg;
  EXPECT_NE(0, apply_setting(cfg, "launchersettings", "entrypoint", "org.example.Main"));
  EXPECT_EQ("org.example.Main", cfg.settings.entry_class);
  EXPECT_EQ(0, apply_setting(cfg, "LoggingSettings", "ConfigFile", ""));
  EXPECT_EQ("log4j.conf", cfg.settings.logging_file);
}
