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
#include "pgwire/protocol/message.hpp"
#include <flow/util/util.hpp>

namespace pgwire::protocol
{

namespace
{

/// Max number of body/payload characters printed by the `<<` operators.
constexpr size_t S_PRINT_MAX_CHARS = 64;

/**
 * Prints `str` to `os`, abbreviated to S_PRINT_MAX_CHARS characters.
 *
 * @param os
 *        Stream.
 * @param str
 *        Text.
 */
void print_abbreviated(std::ostream& os, util::String_view str)
{
  if (str.size() <= S_PRINT_MAX_CHARS)
  {
    os << '[' << str << ']';
  }
  else
  {
    os << '[' << str.substr(0, S_PRINT_MAX_CHARS) << "...] (" << str.size() << " chars)";
  }
}

/// Helper for `std::visit`: overload set of lambdas.
template<typename... Visitors>
struct Overloaded : Visitors...
{
  using Visitors::operator()...;
};
template<typename... Visitors>
Overloaded(Visitors...) -> Overloaded<Visitors...>;

} // namespace (anon)

const std::string& Field_map_message::field(char field_type) const
{
  const auto it = m_fields.find(field_type);
  return (it == m_fields.end()) ? util::EMPTY_STRING : it->second;
}

const std::string& Field_map_message::severity() const
{
  return field('S');
}

const std::string& Field_map_message::sqlstate() const
{
  return field('C');
}

const std::string& Field_map_message::message() const
{
  return field('M');
}

bool Authentication::requires_response() const
{
  return (m_request != Request::S_OK) && (m_request != Request::S_SASL_FINAL);
}

bool is_reply_terminal(const In_message& msg)
{
  if (std::holds_alternative<Ready_for_query>(msg) || std::holds_alternative<Channel_error>(msg))
  {
    return true;
  }
  // else
  const auto auth = std::get_if<Authentication>(&msg);
  return auth && auth->requires_response();
}

bool is_push(const In_message& msg)
{
  return std::holds_alternative<Notification_response>(msg);
}

std::ostream& operator<<(std::ostream& os, Authentication::Request val)
{
  using Request = Authentication::Request;

  switch (val)
  {
  case Request::S_OK: return os << "OK";
  case Request::S_KERBEROS_V5: return os << "KERBEROS_V5";
  case Request::S_CLEARTEXT_PASSWORD: return os << "CLEARTEXT_PASSWORD";
  case Request::S_MD5_PASSWORD: return os << "MD5_PASSWORD";
  case Request::S_GSS: return os << "GSS";
  case Request::S_GSS_CONTINUE: return os << "GSS_CONTINUE";
  case Request::S_SSPI: return os << "SSPI";
  case Request::S_SASL: return os << "SASL";
  case Request::S_SASL_CONTINUE: return os << "SASL_CONTINUE";
  case Request::S_SASL_FINAL: return os << "SASL_FINAL";
  }
  // Unknown codes are kept as-is by the decoder.
  return os << "UNKNOWN(" << static_cast<int32_t>(val) << ')';
}

std::ostream& operator<<(std::ostream& os, const In_message& val)
{
  std::visit(Overloaded
               {
                 [&](const Ready_for_query& msg)
                 {
                   os << "Ready_for_query[tx_status=" << msg.m_tx_status << ']';
                 },
                 [&](const Error_response& msg)
                 {
                   os << "Error_response[" << msg.severity() << ' ' << msg.sqlstate() << ": ";
                   print_abbreviated(os, msg.message());
                   os << ']';
                 },
                 [&](const Notice_response& msg)
                 {
                   os << "Notice_response[" << msg.severity() << ' ' << msg.sqlstate() << ": ";
                   print_abbreviated(os, msg.message());
                   os << ']';
                 },
                 [&](const Authentication& msg)
                 {
                   os << "Authentication[" << msg.m_request << "; data_sz=" << msg.m_data.size() << ']';
                 },
                 [&](const Notification_response& msg)
                 {
                   os << "Notification_response[pid=" << msg.m_backend_pid << " channel=[" << msg.m_channel
                      << "] payload=";
                   print_abbreviated(os, msg.m_payload);
                   os << ']';
                 },
                 [&](const Parameter_status& msg)
                 {
                   os << "Parameter_status[" << msg.m_name << '=' << msg.m_value << ']';
                 },
                 [&](const Backend_key_data& msg)
                 {
                   os << "Backend_key_data[pid=" << msg.m_backend_pid << ']'; // Secret key deliberately not logged.
                 },
                 [&](const Opaque_message& msg)
                 {
                   os << "Opaque_message[type=" << msg.m_type << " body_sz=" << msg.m_body.size() << ']';
                 },
                 [&](const Channel_error& msg)
                 {
                   os << "Channel_error[" << msg.m_err_code << " [" << msg.m_err_code.message() << ']';
                   if (!msg.m_description.empty())
                   {
                     os << ": " << msg.m_description;
                   }
                   os << ']';
                 }
               },
             val);
  return os;
} // operator<<(In_message)

std::ostream& operator<<(std::ostream& os, const Out_message& val)
{
  std::visit(Overloaded
               {
                 [&](const Startup_message& msg)
                 {
                   os << "Startup_message[";
                   for (const auto& param : msg.m_parameters)
                   {
                     os << param.first << '=' << param.second << ' ';
                   }
                   os << ']';
                 },
                 [&](const Tls_request&) { os << "Tls_request[]"; },
                 [&](const Query& msg)
                 {
                   os << "Query[";
                   print_abbreviated(os, msg.m_sql);
                   os << ']';
                 },
                 [&](const Password_message&) { os << "Password_message[***]"; },
                 [&](const Sync&) { os << "Sync[]"; },
                 [&](const Terminate&) { os << "Terminate[]"; },
                 [&](const Raw_message& msg)
                 {
                   os << "Raw_message[type=" << msg.m_type << " body_sz=" << msg.m_body.size() << ']';
                 }
               },
             val);
  return os;
} // operator<<(Out_message)

} // namespace pgwire::protocol
