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
#include "pgwire/stream/error.hpp"
#include "pgwire/stream/config.hpp"
#include "pgwire/protocol/error.hpp"
#include <boost/lexical_cast.hpp>
#include <gtest/gtest.h>

namespace pgwire::test
{

TEST(Error_code, Stream_codes)
{
  using stream::error::Code;

  const Error_code err_code = Code::S_PIPELINING_NOT_ENABLED;
  EXPECT_STREQ(err_code.category().name(), "pgwire/stream");
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_EQ(boost::lexical_cast<std::string>(Code::S_CHANNEL_INACTIVE), "CHANNEL_INACTIVE");
  EXPECT_EQ(boost::lexical_cast<Code>("NO_SUCH_SUBSCRIBER"), Code::S_NO_SUCH_SUBSCRIBER);

  for (int code = stream::error::S_CODE_LOWEST_INT_VALUE; code != int(Code::S_END_SENTINEL); ++code)
  {
    const auto val = Code(code);
    EXPECT_FALSE(make_error_code(val).message().empty()) << val;
    EXPECT_EQ(boost::lexical_cast<Code>(boost::lexical_cast<std::string>(val)), val);
  }
}

TEST(Error_code, Protocol_codes)
{
  using protocol::error::Code;

  const Error_code err_code = Code::S_FRAME_TOO_LARGE;
  EXPECT_STREQ(err_code.category().name(), "pgwire/protocol");
  EXPECT_NE(err_code, Error_code(stream::error::Code::S_NOT_CONNECTED)); // Same int value, other category.
  EXPECT_EQ(boost::lexical_cast<std::string>(Code::S_MESSAGE_MALFORMED), "MESSAGE_MALFORMED");
}

TEST(Stream_config, Defaults_and_enums)
{
  using stream::Stream_config;
  using stream::Tls_mode;
  using stream::Trust_policy;

  const Stream_config config;
  EXPECT_EQ(config.m_host, "localhost");
  EXPECT_EQ(config.m_port, 5432);
  EXPECT_FALSE(config.m_pipelining);
  EXPECT_EQ(config.m_tls_mode, Tls_mode::S_DISABLED);
  EXPECT_EQ(config.m_trust_policy, Trust_policy::S_UNSPECIFIED);
  EXPECT_EQ(config.m_max_frame_sz, size_t(1) << 30);

  EXPECT_EQ(boost::lexical_cast<Tls_mode>("REQUIRED"), Tls_mode::S_REQUIRED);
  EXPECT_EQ(boost::lexical_cast<Trust_policy>("PINNED_CERTIFICATE"), Trust_policy::S_PINNED_CERTIFICATE);
  EXPECT_EQ(boost::lexical_cast<std::string>(Trust_policy::S_INSECURE_TRUST_ALL), "INSECURE_TRUST_ALL");
}

} // namespace pgwire::test
