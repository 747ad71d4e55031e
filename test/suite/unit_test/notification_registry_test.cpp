/* Flow-PG: Stream
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "pgwire/stream/notification_registry.hpp"
#include "pgwire/stream/error.hpp"
#include "pgwire/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <thread>

namespace pgwire::stream::test
{

using pgwire::test::Test_logger;

TEST(Notification_registry, Subscribe_dispatch_unsubscribe)
{
  Test_logger logger;
  Notification_registry registry(&logger, "test");

  std::vector<std::string> got_a;
  std::vector<std::string> got_b;
  const auto token_a = registry.subscribe("jobs", [&](const std::string& payload) { got_a.push_back(payload); });
  const auto token_b = registry.subscribe("jobs", [&](const std::string& payload) { got_b.push_back(payload); });
  EXPECT_NE(token_a, token_b);
  EXPECT_EQ(registry.subscriber_count("jobs"), 2u);

  registry.dispatch("jobs", "1");
  registry.dispatch("other", "x"); // No subscribers: no-op.
  EXPECT_EQ(got_a, std::vector<std::string>{ "1" });
  EXPECT_EQ(got_b, std::vector<std::string>{ "1" });

  Error_code err_code;
  registry.unsubscribe("jobs", token_a, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(registry.subscriber_count("jobs"), 1u);

  registry.dispatch("jobs", "2");
  EXPECT_EQ(got_a, std::vector<std::string>{ "1" });
  EXPECT_EQ(got_b, (std::vector<std::string>{ "1", "2" }));
}

TEST(Notification_registry, Unknown_token)
{
  Test_logger logger;
  Notification_registry registry(&logger, "test");

  int calls = 0;
  const auto token = registry.subscribe("jobs", [&](const std::string&) { ++calls; });

  Error_code err_code;
  registry.unsubscribe("jobs", "no-such-token", &err_code);
  EXPECT_EQ(err_code, error::Code::S_NO_SUCH_SUBSCRIBER);
  err_code.clear();
  registry.unsubscribe("no-such-channel", token, &err_code);
  EXPECT_EQ(err_code, error::Code::S_NO_SUCH_SUBSCRIBER);

  // Others intact.
  registry.dispatch("jobs", "x");
  EXPECT_EQ(calls, 1);

  // Null err_code: throws.
  EXPECT_THROW(registry.unsubscribe("jobs", "no-such-token"), flow::error::Runtime_error);
  EXPECT_NO_THROW(registry.unsubscribe("jobs", token));
  EXPECT_THROW(registry.unsubscribe("jobs", token), flow::error::Runtime_error);
}

TEST(Notification_registry, Faulty_subscriber_does_not_affect_others)
{
  Test_logger logger;
  Notification_registry registry(&logger, "test");

  int calls = 0;
  registry.subscribe("jobs", [](const std::string&) { throw std::runtime_error("subscriber bug"); });
  registry.subscribe("jobs", [&](const std::string&) { ++calls; });
  registry.subscribe("jobs", [](const std::string&) { throw std::runtime_error("another"); });

  EXPECT_NO_THROW(registry.dispatch("jobs", "x"));
  EXPECT_EQ(calls, 1);
}

TEST(Notification_registry, Subscriber_may_unsubscribe_itself)
{
  Test_logger logger;
  Notification_registry registry(&logger, "test");

  int calls = 0;
  std::string token;
  token = registry.subscribe("jobs", [&](const std::string&)
  {
    ++calls;
    registry.unsubscribe("jobs", token);
  });

  registry.dispatch("jobs", "1");
  registry.dispatch("jobs", "2");
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(registry.subscriber_count("jobs"), 0u);
}

TEST(Notification_registry, Concurrent_first_subscribe)
{
  Test_logger logger;
  Notification_registry registry(&logger, "test");

  constexpr size_t N_THREADS = 8;
  constexpr size_t N_PER_THREAD = 100;
  std::vector<std::vector<std::string>> tokens(N_THREADS);
  std::vector<std::thread> threads;
  for (size_t idx = 0; idx != N_THREADS; ++idx)
  {
    threads.emplace_back([&, idx]()
    {
      for (size_t count = 0; count != N_PER_THREAD; ++count)
      {
        tokens[idx].push_back(registry.subscribe("fresh", [](const std::string&) {}));
      }
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  EXPECT_EQ(registry.subscriber_count("fresh"), N_THREADS * N_PER_THREAD);
  std::set<std::string> unique;
  for (const auto& per_thread : tokens)
  {
    unique.insert(per_thread.begin(), per_thread.end());
  }
  EXPECT_EQ(unique.size(), N_THREADS * N_PER_THREAD);
}

} // namespace pgwire::stream::test
