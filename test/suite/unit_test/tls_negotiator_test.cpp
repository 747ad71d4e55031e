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
#include "pgwire/stream/tls_negotiator.hpp"
#include "pgwire/stream/error.hpp"
#include "pgwire/test/test_logger.hpp"
#include <gtest/gtest.h>

namespace pgwire::stream::test
{

namespace
{
using pgwire::test::Test_logger;

util::Blob_const blob(const char* bytes, size_t size)
{
  return util::Blob_const(bytes, size);
}
} // namespace (anon)

TEST(Tls_negotiator, Request_sent_once)
{
  Test_logger logger;
  Tls_negotiator negotiator(&logger, "test");

  EXPECT_EQ(negotiator.request_for_sending(), std::string("\0\0\0\x08\x04\xd2\x16\x2f", 8));
  EXPECT_TRUE(negotiator.request_for_sending().empty());
  EXPECT_EQ(negotiator.outcome(), Tls_negotiator::Outcome::S_UNKNOWN);
}

TEST(Tls_negotiator, Accepted)
{
  Test_logger logger;
  Tls_negotiator negotiator(&logger, "test");
  negotiator.request_for_sending();

  Error_code err_code;
  EXPECT_FALSE(negotiator.compute_outcome(blob("", 0), &err_code)); // Nothing yet.
  EXPECT_EQ(negotiator.outcome(), Tls_negotiator::Outcome::S_UNKNOWN);

  EXPECT_TRUE(negotiator.compute_outcome(blob("S", 1), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(negotiator.outcome(), Tls_negotiator::Outcome::S_ACCEPTED);

  // Decided once; further bytes change nothing.
  EXPECT_FALSE(negotiator.compute_outcome(blob("N", 1), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(negotiator.outcome(), Tls_negotiator::Outcome::S_ACCEPTED);
}

TEST(Tls_negotiator, Refused)
{
  Test_logger logger;
  Tls_negotiator negotiator(&logger, "test");
  negotiator.request_for_sending();

  Error_code err_code;
  EXPECT_TRUE(negotiator.compute_outcome(blob("N", 1), &err_code));
  EXPECT_EQ(err_code, error::Code::S_SECURITY_NOT_SUPPORTED_BY_BACKEND);
  EXPECT_EQ(negotiator.outcome(), Tls_negotiator::Outcome::S_REFUSED);

  EXPECT_THROW(Tls_negotiator(&logger, "test2").compute_outcome(blob("E", 1)), flow::error::Runtime_error);
}

} // namespace pgwire::stream::test
