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
#include "pgwire/protocol/message_codec.hpp"
#include "pgwire/protocol/error.hpp"
#include "pgwire/test/test_backend.hpp"
#include "pgwire/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>

namespace pgwire::protocol::test
{

namespace
{
using pgwire::test::Test_backend;
using pgwire::test::Test_logger;

void feed(Frame_decoder* decoder, util::String_view bytes)
{
  decoder->feed(util::Blob_const(bytes.data(), bytes.size()));
}
} // namespace (anon)

TEST(Frame_decoder, Partial_frames)
{
  Test_logger logger;
  Frame_decoder decoder(&logger, "test");
  const auto bytes = Test_backend::ready_for_query();

  In_message msg;
  Error_code err_code;
  for (size_t idx = 0; idx != bytes.size() - 1; ++idx)
  {
    feed(&decoder, util::String_view(&bytes[idx], 1));
    EXPECT_FALSE(decoder.next(&msg, &err_code));
    EXPECT_FALSE(err_code);
  }
  feed(&decoder, util::String_view(&bytes.back(), 1));
  ASSERT_TRUE(decoder.next(&msg, &err_code));
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(std::holds_alternative<Ready_for_query>(msg));
  EXPECT_EQ(std::get<Ready_for_query>(msg).m_tx_status, 'I');
  EXPECT_EQ(decoder.buffered_size(), 0u);
}

TEST(Frame_decoder, Multiple_frames_in_one_feed)
{
  Test_logger logger;
  Frame_decoder decoder(&logger, "test");
  const auto tail = Test_backend::ready_for_query();
  feed(&decoder, Test_backend::authentication(Authentication::Request::S_OK)
                   + Test_backend::command_complete("SELECT 1")
                   + tail.substr(0, 3));

  In_message msg;
  ASSERT_TRUE(decoder.next(&msg));
  ASSERT_TRUE(std::holds_alternative<Authentication>(msg));
  EXPECT_EQ(std::get<Authentication>(msg).m_request, Authentication::Request::S_OK);
  ASSERT_TRUE(decoder.next(&msg));
  ASSERT_TRUE(std::holds_alternative<Opaque_message>(msg));
  EXPECT_EQ(std::get<Opaque_message>(msg).m_type, 'C');
  EXPECT_EQ(std::get<Opaque_message>(msg).m_body, std::string("SELECT 1", 9)); // NUL included.
  EXPECT_FALSE(decoder.next(&msg));
  EXPECT_EQ(decoder.buffered_size(), 3u);

  feed(&decoder, tail.substr(3));
  ASSERT_TRUE(decoder.next(&msg));
  EXPECT_TRUE(std::holds_alternative<Ready_for_query>(msg));
}

TEST(Frame_decoder, Length_smaller_than_length_field)
{
  Test_logger logger;
  Frame_decoder decoder(&logger, "test");
  feed(&decoder, util::String_view("Z\0\0\0\3I", 6));

  In_message msg;
  Error_code err_code;
  EXPECT_FALSE(decoder.next(&msg, &err_code));
  EXPECT_EQ(err_code, error::Code::S_FRAME_LENGTH_INVALID);

  // Framing is lost for good.
  feed(&decoder, Test_backend::ready_for_query());
  err_code.clear();
  EXPECT_FALSE(decoder.next(&msg, &err_code));
  EXPECT_EQ(err_code, error::Code::S_FRAME_LENGTH_INVALID);
}

TEST(Frame_decoder, Frame_too_large)
{
  Test_logger logger;
  Frame_decoder decoder(&logger, "test", 16);
  // Header alone: declares a 100-byte frame; detected before the body arrives.
  feed(&decoder, util::String_view("D\0\0\0\x64", 5));

  In_message msg;
  Error_code err_code;
  EXPECT_FALSE(decoder.next(&msg, &err_code));
  EXPECT_EQ(err_code, error::Code::S_FRAME_TOO_LARGE);
}

TEST(Frame_decoder, Throws_without_err_code)
{
  Test_logger logger;
  Frame_decoder decoder(&logger, "test");
  feed(&decoder, util::String_view("Z\0\0\0\0", 5));

  In_message msg;
  EXPECT_THROW(decoder.next(&msg), flow::error::Runtime_error);
}

TEST(Decode_message, Each_kind)
{
  const auto decode = [](const util::Byte_buffer& frame) -> In_message
  {
    return decode_message(frame[0], util::Blob_const(frame.data() + 5, frame.size() - 5));
  };

  const auto err = decode(Test_backend::error_response("28P01", "password authentication failed"));
  ASSERT_TRUE(std::holds_alternative<Error_response>(err));
  EXPECT_EQ(std::get<Error_response>(err).severity(), "ERROR");
  EXPECT_EQ(std::get<Error_response>(err).sqlstate(), "28P01");
  EXPECT_EQ(std::get<Error_response>(err).message(), "password authentication failed");
  EXPECT_EQ(std::get<Error_response>(err).field('H'), "");

  const auto auth = decode(Test_backend::authentication(Authentication::Request::S_MD5_PASSWORD));
  ASSERT_TRUE(std::holds_alternative<Authentication>(auth));
  EXPECT_EQ(std::get<Authentication>(auth).m_request, Authentication::Request::S_MD5_PASSWORD);
  EXPECT_TRUE(std::get<Authentication>(auth).requires_response());

  const auto notification = decode(Test_backend::notification("jobs", "42"));
  ASSERT_TRUE(std::holds_alternative<Notification_response>(notification));
  EXPECT_EQ(std::get<Notification_response>(notification).m_backend_pid, 42);
  EXPECT_EQ(std::get<Notification_response>(notification).m_channel, "jobs");
  EXPECT_EQ(std::get<Notification_response>(notification).m_payload, "42");

  const auto param = decode(Test_backend::frame('S', util::String_view("TimeZone\0UTC\0", 13)));
  ASSERT_TRUE(std::holds_alternative<Parameter_status>(param));
  EXPECT_EQ(std::get<Parameter_status>(param).m_name, "TimeZone");
  EXPECT_EQ(std::get<Parameter_status>(param).m_value, "UTC");

  const auto key = decode(Test_backend::frame('K', util::String_view("\0\0\0\x07\0\0\x01\0", 8)));
  ASSERT_TRUE(std::holds_alternative<Backend_key_data>(key));
  EXPECT_EQ(std::get<Backend_key_data>(key).m_backend_pid, 7);
  EXPECT_EQ(std::get<Backend_key_data>(key).m_secret_key, 256);
}

TEST(Decode_message, Malformed)
{
  Error_code err_code;
  // Channel name not terminated.
  const util::String_view body("\0\0\0\x01jobs", 8);
  decode_message(Notification_response::S_TYPE, util::Blob_const(body.data(), body.size()), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_MALFORMED);

  err_code.clear();
  decode_message(Ready_for_query::S_TYPE, util::Blob_const(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_MALFORMED);

  // Request code cut short.
  err_code.clear();
  const util::String_view short_auth("\0\0", 2);
  decode_message(Authentication::S_TYPE, util::Blob_const(short_auth.data(), short_auth.size()), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_MALFORMED);

  // Secret key missing.
  err_code.clear();
  const util::String_view short_key("\0\0\0\x07", 4);
  decode_message(Backend_key_data::S_TYPE, util::Blob_const(short_key.data(), short_key.size()), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_MALFORMED);
}

TEST(Frame_decoder, Short_authentication_body_is_fatal)
{
  Test_logger logger;
  Frame_decoder decoder(&logger, "test");
  feed(&decoder, util::String_view("R\0\0\0\x06\0\0", 7));

  In_message msg;
  Error_code err_code;
  EXPECT_FALSE(decoder.next(&msg, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_MALFORMED);
}

TEST(Encode, Startup_message)
{
  Startup_message startup;
  startup.m_parameters.emplace_back("user", "bob");
  util::Byte_buffer out;
  encode(startup, &out);

  // Untyped: length (18), version 3.0, "user\0bob\0", terminating NUL.
  EXPECT_EQ(out, std::string("\0\0\0\x12\0\x03\0\0user\0bob\0\0", 18));
}

TEST(Encode, Tls_request)
{
  util::Byte_buffer out;
  encode(Tls_request(), &out);
  EXPECT_EQ(out, std::string("\0\0\0\x08\x04\xd2\x16\x2f", 8));
}

TEST(Encode, Typed_messages_append)
{
  util::Byte_buffer out;
  encode(Query{ "SELECT 1" }, &out);
  encode(Sync(), &out);
  encode(Terminate(), &out);
  EXPECT_EQ(out, std::string("Q\0\0\0\x0dSELECT 1\0" "S\0\0\0\x04" "X\0\0\0\x04", 24));
}

} // namespace pgwire::protocol::test
