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

// Include Protocol_stream::Impl class body to complete that type and enable pImpl forwarding.
#include "pgwire/stream/detail/protocol_stream_impl.hpp"
#include "pgwire/stream/protocol_stream.hpp"
#include <boost/move/make_unique.hpp>

namespace pgwire::stream
{

// Implementations (strict pImpl-idiom style).

Protocol_stream::Protocol_stream(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                 const Stream_config& config) :
  m_impl(boost::movelib::make_unique<Impl>(logger_ptr, nickname_str, config))
{
  // Yay.
}

Protocol_stream::~Protocol_stream() = default; // It's only explicitly defined to formally document it.

const std::string& Protocol_stream::nickname() const
{
  return m_impl->nickname();
}

const Stream_config& Protocol_stream::config() const
{
  return m_impl->config();
}

bool Protocol_stream::connect(const protocol::Startup_message& startup, On_reply_func&& on_done)
{
  return m_impl->connect(startup, std::move(on_done));
}

void Protocol_stream::send(protocol::Out_message msg, On_reply_func&& on_done, Error_code* err_code)
{
  std::vector<protocol::Out_message> msgs;
  msgs.emplace_back(std::move(msg));
  m_impl->send(std::move(msgs), std::move(on_done), err_code);
}

void Protocol_stream::send(std::vector<protocol::Out_message> msgs, On_reply_func&& on_done, Error_code* err_code)
{
  m_impl->send(std::move(msgs), std::move(on_done), err_code);
}

bool Protocol_stream::is_connected() const
{
  return m_impl->is_connected();
}

std::string Protocol_stream::subscribe(util::String_view channel, On_notification_func&& on_notification)
{
  return m_impl->subscribe(channel, std::move(on_notification));
}

void Protocol_stream::unsubscribe(util::String_view channel, util::String_view token, Error_code* err_code)
{
  m_impl->unsubscribe(channel, token, err_code);
}

void Protocol_stream::close()
{
  m_impl->close();
}

std::ostream& operator<<(std::ostream& os, const Protocol_stream& val)
{
  return os << *val.m_impl;
}

std::ostream& operator<<(std::ostream& os, const Reply& val)
{
  os << '[' << val.size() << " messages:";
  for (const auto& msg : val)
  {
    os << " [" << msg << ']';
  }
  return os << ']';
}

} // namespace pgwire::stream
