/* locator-test.cpp

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
#include <climits>
#include "locator.h"
#include "path-normalize.h"
#include "test-util.h"

using namespace kickstart;

TEST(Locator, AbsoluteArchivePath) {
  const auto loc = to_locator("/opt/app/lib/core.jar", platform::OTHER, "/home");
  EXPECT_EQ("file:/opt/app/lib/core.jar", loc.uri());
  EXPECT_FALSE(loc.is_directory());
}

TEST(Locator, RelativePathTakenAgainstCwd) {
  EXPECT_EQ("file:/opt/app/lib/core.jar", to_locator("lib/core.jar", platform::OTHER, "/opt/app").uri());
}

TEST(Locator, DirectoryGetsTrailingSlash) {
  kickstart_test::temp_dir tmp;
  const auto dir = tmp.make_dir("classes");
  const auto loc = to_locator(dir, platform::OTHER, "/");
  EXPECT_EQ("file:" + dir + "/", loc.uri());
  EXPECT_TRUE(loc.is_directory());
  // a trailing separator is kept whether or not the directory exists
  EXPECT_EQ("file:/no/such/dir/", to_locator("/no/such/dir/", platform::OTHER, "/").uri());
}

TEST(Locator, PercentEncodesSpaces) {
  EXPECT_EQ("file:/opt/my%20app/lib/a%25b.jar", to_locator("/opt/my app/lib/a%b.jar", platform::OTHER, "/").uri());
}

TEST(Locator, WindowsDrivePath) {
  EXPECT_EQ("file:/C:/app/lib/a.jar", to_locator(R"(C:\app\lib\a.jar)", platform::WINDOWS_FAMILY, "/").uri());
}

TEST(Locator, ShareAuthorityKeptOnlyAfterDoubling) {
  const std::string share_path(R"(\\srv\share\lib\a.jar)");
  EXPECT_EQ("file:/srv/share/lib/a.jar", to_locator(share_path, platform::WINDOWS_FAMILY, "/").uri());
  const auto doubled = normalize_share_path(share_path, platform::WINDOWS_FAMILY);
  EXPECT_EQ("file:////srv/share/lib/a.jar", to_locator(doubled, platform::WINDOWS_FAMILY, "/").uri());
}

TEST(Locator, MalformedInputs) {
  EXPECT_THROW(to_locator("", platform::OTHER, "/"), malformed_locator_exception);
  EXPECT_THROW(to_locator("/opt/a:b.jar", platform::OTHER, "/"), malformed_locator_exception);
  EXPECT_THROW(to_locator(R"(C:\a;b.jar)", platform::WINDOWS_FAMILY, "/"), malformed_locator_exception);
  EXPECT_THROW(to_locator(std::string("/opt/a\0b.jar", 12), platform::OTHER, "/"), malformed_locator_exception);
  EXPECT_THROW(to_locator("lib/a.jar", platform::OTHER, ""), malformed_locator_exception);
  EXPECT_THROW(to_locator("/" + std::string(PATH_MAX, 'a'), platform::OTHER, "/"), malformed_locator_exception);
}

TEST(Locator, ConstructorValidatesUri) {
  EXPECT_NO_THROW(locator("file:/opt/a.jar"));
  EXPECT_NO_THROW(locator("jar:file:/opt/a.jar!/"));
  EXPECT_THROW(locator("/opt/a.jar"), malformed_locator_exception);
  EXPECT_THROW(locator("1file:/opt/a.jar"), malformed_locator_exception);
  EXPECT_THROW(locator("file:"), malformed_locator_exception);
  EXPECT_THROW(locator("file:/opt/a b.jar"), malformed_locator_exception);
}

TEST(Locator, ExceptionCarriesNameAndTrace) {
  try {
    to_locator("", platform::OTHER, "/");
    FAIL() << "expected malformed_locator_exception";
  } catch(const malformed_locator_exception &ex) {
    EXPECT_STREQ("malformed_locator_exception", ex.name());
    EXPECT_NE(std::string::npos, ex.describe().find("malformed_locator_exception: "));
  }
}
