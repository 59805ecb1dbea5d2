/* classpath-test.cpp

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
#include "classpath.h"
#include "test-util.h"

using namespace kickstart;
using kickstart_test::temp_dir;

namespace {
  // <root>/lib with two archives, <root>/lib/ext with one, <root>/lib/junit empty
  void make_standard_layout(const temp_dir &root) {
    root.make_dir("lib/ext");
    root.make_dir("lib/junit");
    root.touch("lib/b.jar");
    root.touch("lib/a.jar");
    root.touch("lib/notes.txt");
    root.touch("lib/ext/x.jar");
  }
}

TEST(Classpath, AssemblesStandardDirectoriesInOrder) {
  temp_dir root;
  make_standard_layout(root);
  search_path sp("/init/bin/app.jar", ':');
  int publish_count = 0;
  std::string published;
  sp.add_publisher([&](const std::string &value) { publish_count++; published = value; });

  const auto rslt = assemble_classpath(install_dir(root.path()), platform::OTHER, "/", sp);

  EXPECT_TRUE(rslt.failures.empty());
  EXPECT_TRUE(rslt.diagnostics.empty());
  ASSERT_EQ(3u, rslt.locators.size());
  EXPECT_EQ("file:" + root.path() + "/lib/a.jar", rslt.locators[0].uri());
  EXPECT_EQ("file:" + root.path() + "/lib/b.jar", rslt.locators[1].uri());
  EXPECT_EQ("file:" + root.path() + "/lib/ext/x.jar", rslt.locators[2].uri());

  const std::vector<std::string> segments{
      root.path() + "/lib/a.jar", root.path() + "/lib/b.jar", root.path() + "/lib/ext/x.jar" };
  EXPECT_EQ(segments, sp.segments());
  EXPECT_EQ(1, publish_count);
  EXPECT_EQ("/init/bin/app.jar:" + segments[0] + ":" + segments[1] + ":" + segments[2], published);
}

TEST(Classpath, MissingSubdirectoryOnlyAddsDiagnostic) {
  temp_dir root;
  root.make_dir("lib");
  root.touch("lib/a.jar");

  search_path sp("", ':');
  const auto rslt = assemble_classpath(install_dir(root.path()), platform::OTHER, "/", sp);

  EXPECT_TRUE(rslt.failures.empty());
  ASSERT_EQ(1u, rslt.locators.size());
  // lib/ext and lib/junit
  EXPECT_EQ(2u, rslt.diagnostics.size());
}

TEST(Classpath, MalformedEntryRecordedWhileOthersLoad) {
  temp_dir root;
  make_standard_layout(root);
  // the path-list separator cannot appear in a classpath entry
  root.touch("lib/bad:name.jar");

  search_path sp("", ':');
  const auto rslt = assemble_classpath(install_dir(root.path()), platform::OTHER, "/", sp);

  ASSERT_EQ(1u, rslt.failures.size());
  EXPECT_EQ(0u, rslt.failures[0].message.find("Error adding jar:" + root.path() + "/lib/bad:name.jar"));
  EXPECT_NE(std::string::npos, rslt.failures[0].message.find("malformed_locator_exception"));
  EXPECT_EQ(3u, rslt.locators.size());
  EXPECT_EQ(3u, sp.size());
}

TEST(Classpath, UnknownInstallDirScansNothing) {
  search_path sp("/init", ':');
  int publish_count = 0;
  sp.add_publisher([&publish_count](const std::string &) { publish_count++; });

  const auto rslt = assemble_classpath(install_dir(), platform::OTHER, "/", sp);

  EXPECT_TRUE(rslt.locators.empty());
  EXPECT_TRUE(rslt.failures.empty());
  EXPECT_EQ(3u, rslt.diagnostics.size());
  EXPECT_EQ("/init", sp.value());
  EXPECT_EQ(1, publish_count);
}

TEST(Classpath, SharePathsNormalizedOnWindowsFamily) {
  temp_dir root;
  make_standard_layout(root);
  search_path sp("", ';');
  // local paths have no share prefix, so they pass through unchanged
  const auto rslt = assemble_classpath(install_dir(root.path()), platform::WINDOWS_FAMILY, "/", sp);
  ASSERT_EQ(3u, rslt.locators.size());
  EXPECT_EQ(root.path() + "/lib/a.jar", sp.segments()[0]);
}

class ClasspathExtender : public ::testing::Test {
protected:
  temp_dir root;
  search_path sp{"/init", ':'};
  dynamic_loader loader{std::vector<locator>()};
  classpath_extender extender{loader, sp, platform::OTHER, "/"};
  int publish_count{0};

  void SetUp() override {
    sp.add_publisher([this](const std::string &) { publish_count++; });
  }
};

TEST_F(ClasspathExtender, AddPathOnDirectory) {
  const auto plugins = root.make_dir("plugins");
  root.touch("plugins/p2.jar");
  root.touch("plugins/p1.jar");
  root.touch("plugins/readme.md");
  root.make_dir("plugins/dir.jar");

  extender.add_path(plugins);

  const auto locators = loader.locators();
  ASSERT_EQ(3u, locators.size());
  EXPECT_EQ("file:" + plugins + "/", locators[0].uri());
  EXPECT_TRUE(locators[0].is_directory());
  EXPECT_EQ("file:" + plugins + "/p1.jar", locators[1].uri());
  EXPECT_EQ("file:" + plugins + "/p2.jar", locators[2].uri());

  const std::vector<std::string> segments{ plugins, plugins + "/p1.jar", plugins + "/p2.jar" };
  EXPECT_EQ(segments, sp.segments());
  EXPECT_EQ(1, publish_count);
}

TEST_F(ClasspathExtender, AddPathSkipsUnconvertibleArchive) {
  const auto plugins = root.make_dir("plugins");
  root.touch("plugins/a.jar");
  root.touch("plugins/b:c.jar");

  EXPECT_NO_THROW(extender.add_path(plugins));

  const auto locators = loader.locators();
  ASSERT_EQ(2u, locators.size());
  EXPECT_EQ("file:" + plugins + "/", locators[0].uri());
  EXPECT_EQ("file:" + plugins + "/a.jar", locators[1].uri());
  const std::vector<std::string> segments{ plugins, plugins + "/a.jar" };
  EXPECT_EQ(segments, sp.segments());
  EXPECT_EQ(1, publish_count);
}

TEST_F(ClasspathExtender, AddUrlPathSkipsUnconvertibleArchive) {
  const auto plugins = root.make_dir("plugins");
  root.touch("plugins/a.jar");
  root.touch("plugins/b:c.jar");

  EXPECT_NO_THROW(extender.add_url(plugins));

  ASSERT_EQ(2u, loader.size());
  EXPECT_EQ("file:" + plugins + "/a.jar", loader.locators()[1].uri());
  EXPECT_EQ(0u, sp.size());
}

TEST_F(ClasspathExtender, AddPathOnArchive) {
  const auto jar = root.touch("extra.jar");
  extender.add_path(jar);
  ASSERT_EQ(1u, loader.size());
  EXPECT_EQ("file:" + jar, loader.locators()[0].uri());
  EXPECT_EQ("/init:" + jar, sp.value());
  EXPECT_EQ(1, publish_count);
}

TEST_F(ClasspathExtender, AddPathRejectsMalformedPath) {
  EXPECT_THROW(extender.add_path("/opt/a:b.jar"), malformed_locator_exception);
  EXPECT_EQ(0u, loader.size());
  EXPECT_EQ(0u, sp.size());
  EXPECT_EQ(0, publish_count);
}

TEST_F(ClasspathExtender, AddUrlLeavesSearchPath) {
  extender.add_url(locator("file:/opt/extra.jar"));
  ASSERT_EQ(1u, loader.size());
  EXPECT_EQ("/init", sp.value());
  EXPECT_EQ(0, publish_count);
}

TEST_F(ClasspathExtender, AddUrlPathAddsDirectoryArchives) {
  const auto plugins = root.make_dir("plugins");
  root.touch("plugins/p1.jar");

  extender.add_url(plugins);

  const auto locators = loader.locators();
  ASSERT_EQ(2u, locators.size());
  EXPECT_EQ("file:" + plugins + "/", locators[0].uri());
  EXPECT_EQ("file:" + plugins + "/p1.jar", locators[1].uri());
  EXPECT_EQ(0u, sp.size());
  EXPECT_EQ(0, publish_count);
}
