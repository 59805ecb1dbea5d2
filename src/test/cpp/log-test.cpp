/* log-test.cpp

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
#include "log.h"
#include "test-util.h"

using logger::LL;

TEST(Log, LevelNamesMatchIgnoringCaseAndSpace) {
  EXPECT_EQ(LL::TRACE, logger::str_to_level("trace"));
  EXPECT_EQ(LL::DEBUG, logger::str_to_level("  Debug\t"));
  EXPECT_EQ(LL::WARN, logger::str_to_level("WARN"));
  EXPECT_EQ(LL::ERR, logger::str_to_level("err"));
  EXPECT_EQ(LL::ERR, logger::str_to_level("error"));
  EXPECT_EQ(LL::FATAL, logger::str_to_level("fatal"));
}

TEST(Log, UnknownNamesFallBackToInfo) {
  EXPECT_EQ(LL::INFO, logger::str_to_level(nullptr));
  EXPECT_EQ(LL::INFO, logger::str_to_level(""));
  EXPECT_EQ(LL::INFO, logger::str_to_level("verbose"));
  // bytes outside ASCII are compared as is
  EXPECT_EQ(LL::INFO, logger::str_to_level("d\xC3\xA9" "bug"));
  EXPECT_EQ(LL::INFO, logger::str_to_level("\xFF\xFE"));
}

TEST(Log, LevelToStrRoundTrips) {
  for(auto level : { LL::TRACE, LL::DEBUG, LL::INFO, LL::WARN, LL::ERR, LL::FATAL }) {
    EXPECT_EQ(level, logger::str_to_level(logger::level_to_str(level)));
  }
}

TEST(Log, EnvironmentOverridesLevel) {
  const auto saved = logger::get_level();
  {
    kickstart_test::env_var_guard guard(logger::LOG_LEVEL_ENV_VAR, "debug");
    EXPECT_TRUE(logger::set_level_from_env());
    EXPECT_EQ(LL::DEBUG, logger::get_level());
  }
  {
    kickstart_test::env_var_guard guard(logger::LOG_LEVEL_ENV_VAR, nullptr);
    EXPECT_FALSE(logger::set_level_from_env());
    EXPECT_EQ(LL::DEBUG, logger::get_level());
  }
  logger::set_level(saved);
}
