/* dynamic-loader-test.cpp

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
#include <set>
#include <thread>
#include "str-util.h"
#include "dynamic-loader.h"
#include "test-util.h"

using namespace kickstart;
using kickstart_test::fake_backend;

namespace {
  std::vector<locator> initial_locators() {
    return std::vector<locator>{ locator("file:/opt/app/lib/a.jar"), locator("file:/opt/app/lib/b.jar") };
  }
}

TEST(DynamicLoader, AttachSeedsBackendWithRegistry) {
  dynamic_loader loader(initial_locators());
  loader.add(locator("file:/opt/app/lib/ext/c.jar"));
  EXPECT_FALSE(loader.attached());

  fake_backend backend;
  loader.attach(backend);
  EXPECT_TRUE(loader.attached());
  EXPECT_EQ(1, backend.seed_calls);
  ASSERT_EQ(3u, backend.seeded.size());
  EXPECT_EQ("file:/opt/app/lib/ext/c.jar", backend.seeded[2].uri());
  EXPECT_TRUE(backend.appended.empty());
}

TEST(DynamicLoader, LaterAddsForwardedInOrder) {
  dynamic_loader loader(initial_locators());
  fake_backend backend;
  loader.attach(backend);

  loader.add(locator("file:/plugins/"));
  loader.add(locator("file:/plugins/p1.jar"));

  ASSERT_EQ(2u, backend.appended.size());
  EXPECT_EQ("file:/plugins/", backend.appended[0].uri());
  EXPECT_EQ("file:/plugins/p1.jar", backend.appended[1].uri());
  EXPECT_EQ(4u, loader.size());
  EXPECT_EQ(2u, backend.seeded.size());
}

TEST(DynamicLoader, RejectedForwardLeavesRegistryUnchanged) {
  dynamic_loader loader(initial_locators());
  fake_backend backend;
  loader.attach(backend);
  backend.fail_append = true;

  EXPECT_THROW(loader.add(locator("file:/plugins/broken.jar")), entry_point_exception);
  EXPECT_EQ(2u, loader.size());
  EXPECT_TRUE(backend.appended.empty());

  backend.fail_append = false;
  loader.add(locator("file:/plugins/ok.jar"));
  const auto locators = loader.locators();
  ASSERT_EQ(3u, locators.size());
  EXPECT_EQ("file:/plugins/ok.jar", locators[2].uri());
  EXPECT_EQ(1u, backend.appended.size());
}

TEST(DynamicLoader, SecondAttachRejected) {
  dynamic_loader loader(initial_locators());
  fake_backend first, second;
  loader.attach(first);
  EXPECT_THROW(loader.attach(second), entry_point_exception);
  EXPECT_FALSE(second.touched());
}

TEST(DynamicLoader, UnattachedLoaderCannotResolve) {
  dynamic_loader loader(initial_locators());
  EXPECT_THROW(loader.resolve_entry("org.example.Main"), entry_point_exception);
  EXPECT_THROW(loader.make_context_loader(), entry_point_exception);
}

TEST(DynamicLoader, ResolveDelegatesToBackend) {
  dynamic_loader loader(initial_locators());
  fake_backend backend;
  loader.attach(backend);
  loader.make_context_loader();
  auto entry = loader.resolve_entry("org.example.Main");
  ASSERT_TRUE(entry != nullptr);
  entry->start({ "-n", "-t", "plan.jmx" });

  EXPECT_EQ(1, backend.context_loader_calls);
  ASSERT_EQ(1u, backend.resolved.size());
  EXPECT_EQ("org.example.Main", backend.resolved[0]);
  ASSERT_EQ(1u, backend.started_with.size());
  EXPECT_EQ(3u, backend.started_with[0].size());
}

TEST(DynamicLoader, ConcurrentAddsKeepEveryEntry) {
  static const int THREAD_COUNT = 8;
  static const int ADDS_PER_THREAD = 50;
  dynamic_loader loader(std::vector<locator>{});
  fake_backend backend;
  loader.attach(backend);

  std::vector<std::thread> threads;
  for(int t = 0; t < THREAD_COUNT; t++) {
    threads.emplace_back([&loader, t]() {
      for(int i = 0; i < ADDS_PER_THREAD; i++) {
        loader.add(locator(format2str("file:/t%d/%d.jar", t, i)));
      }
    });
  }
  for(auto &thrd : threads) {
    thrd.join();
  }

  const auto locators = loader.locators();
  ASSERT_EQ(static_cast<size_t>(THREAD_COUNT * ADDS_PER_THREAD), locators.size());
  std::set<std::string> unique_uris;
  for(auto const &loc : locators) {
    unique_uris.insert(loc.uri());
  }
  EXPECT_EQ(locators.size(), unique_uris.size());
  // forwarded under the same lock, so the backend saw the registry order
  EXPECT_EQ(locators, backend.appended);
}
