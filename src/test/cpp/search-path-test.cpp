/* search-path-test.cpp

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
#include <cstdlib>
#include "search-path.h"
#include "test-util.h"

using namespace kickstart;

TEST(SearchPath, AppendsSeparatorPrefixedSegments) {
  search_path sp("/opt/app/bin/app.jar", ':');
  sp.append("/opt/app/lib/a.jar");
  sp.append("/opt/app/lib/a.jar");
  EXPECT_EQ("/opt/app/bin/app.jar:/opt/app/lib/a.jar:/opt/app/lib/a.jar", sp.value());
  EXPECT_EQ(2u, sp.size());
  EXPECT_EQ("/opt/app/bin/app.jar", sp.initial());
}

TEST(SearchPath, UsesGivenSeparator) {
  search_path sp(R"(C:\app\bin\app.jar)", ';');
  sp.append(R"(C:\app\lib\a.jar)");
  EXPECT_EQ(R"(C:\app\bin\app.jar;C:\app\lib\a.jar)", sp.value());
}

TEST(SearchPath, EmptyInitialValueStillGetsSeparator) {
  search_path sp("", ':');
  sp.append("/a.jar");
  EXPECT_EQ(":/a.jar", sp.value());
}

TEST(SearchPath, PublishHandsFullValueToEveryPublisher) {
  search_path sp("/init", ':');
  std::vector<std::string> first, second;
  sp.add_publisher([&first](const std::string &value) { first.push_back(value); });
  sp.add_publisher([&second](const std::string &value) { second.push_back(value); });
  sp.append("/a.jar");
  sp.publish();
  sp.append("/b.jar");
  sp.publish();
  const std::vector<std::string> expected{ "/init:/a.jar", "/init:/a.jar:/b.jar" };
  EXPECT_EQ(expected, first);
  EXPECT_EQ(expected, second);
}

TEST(SearchPath, EnvironmentPublisherSetsVariable) {
  kickstart_test::env_var_guard guard("KICKSTART_TEST_SEARCH_PATH", nullptr);
  search_path sp("/init", ':');
  sp.add_publisher(environment_publisher("KICKSTART_TEST_SEARCH_PATH"));
  sp.append("/a.jar");
  sp.publish();
  const char * const value = getenv("KICKSTART_TEST_SEARCH_PATH");
  ASSERT_NE(nullptr, value);
  EXPECT_STREQ("/init:/a.jar", value);
}
