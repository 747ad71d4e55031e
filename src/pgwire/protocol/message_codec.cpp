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
#include <flow/error/error.hpp>
#include <boost/endian/conversion.hpp>
#include <algorithm>

namespace pgwire::protocol
{

namespace
{

/**
 * Sequential reader of a frame body.  Every `read_*()` returns `false`, touching nothing, if the remaining bytes
 * cannot satisfy it.
 */
class Body_reader
{
public:
  /**
   * Reads from the given body.
   * @param body
   *        The body; must outlive `*this`.
   */
  explicit Body_reader(util::Blob_const body) :
    m_cur(util::blob_data(body)),
    m_end(m_cur + body.size())
  {
    // Nothing else.
  }

  /// Reads one byte.  @param val Target.  @return See class doc header.
  bool read_byte(char* val)
  {
    if (m_cur == m_end)
    {
      return false;
    }
    *val = char(*m_cur++);
    return true;
  }

  /// Reads a big-endian signed 32-bit integer.  @param val Target.  @return See class doc header.
  bool read_int32(int32_t* val)
  {
    if ((m_end - m_cur) < 4)
    {
      return false;
    }
    *val = boost::endian::load_big_s32(m_cur);
    m_cur += 4;
    return true;
  }

  /// Reads a NUL-terminated string, consuming the NUL.  @param val Target.  @return See class doc header.
  bool read_cstring(std::string* val)
  {
    const auto nul = std::find(m_cur, m_end, uint8_t(0));
    if (nul == m_end)
    {
      return false;
    }
    val->assign(reinterpret_cast<const char*>(m_cur), nul - m_cur);
    m_cur = nul + 1;
    return true;
  }

  /// Reads everything left.  @param val Target.
  void read_rest(std::string* val)
  {
    val->assign(reinterpret_cast<const char*>(m_cur), m_end - m_cur);
    m_cur = m_end;
  }

  /// Returns `true` if everything has been read.  @return See above.
  bool at_end() const
  {
    return m_cur == m_end;
  }

private:
  /// Next byte to read.
  const uint8_t* m_cur;
  /// One past the last byte.
  const uint8_t* const m_end;
}; // class Body_reader

/**
 * Appends a big-endian signed 32-bit integer to `*out`.
 * @param val
 *        Value.
 * @param out
 *        Target.
 */
void append_int32(int32_t val, util::Byte_buffer* out)
{
  unsigned char bytes[4];
  boost::endian::store_big_s32(bytes, val);
  out->append(reinterpret_cast<const char*>(bytes), sizeof bytes);
}

/**
 * Appends `str` plus a NUL to `*out`.
 * @param str
 *        String.
 * @param out
 *        Target.
 */
void append_cstring(util::String_view str, util::Byte_buffer* out)
{
  out->append(str.data(), str.size());
  out->push_back('\0');
}

/**
 * Appends a typed frame, header and all, to `*out`; the body is written by `body_func(out)`.
 *
 * @tparam Body_func
 *         Function type `void (util::Byte_buffer*)`.
 * @param type
 *        Frame type byte; or NUL for the untyped frame format (no type byte at all).
 * @param body_func
 *        See above.
 * @param out
 *        Target.
 */
template<typename Body_func>
void append_frame(char type, const Body_func& body_func, util::Byte_buffer* out)
{
  if (type != '\0')
  {
    out->push_back(type);
  }
  const size_t len_pos = out->size();
  append_int32(0, out); // Placeholder, patched below once the body size is known.
  body_func(out);
  boost::endian::store_big_s32(reinterpret_cast<unsigned char*>(&(*out)[len_pos]),
                               int32_t(out->size() - len_pos));
}

/**
 * Decodes the body of an 'E' or 'N' frame.
 * @param reader
 *        Reader of the body.
 * @param msg
 *        Target.
 * @return `false` if malformed.
 */
bool read_fields(Body_reader* reader, Field_map_message* msg)
{
  char field_type;
  while (reader->read_byte(&field_type))
  {
    if (field_type == '\0')
    {
      return reader->at_end();
    }
    // else
    std::string value;
    if (!reader->read_cstring(&value))
    {
      return false;
    }
    msg->m_fields[field_type] = std::move(value);
  }
  return false; // Ran out without the terminating NUL.
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

// Frame_decoder implementations.

Frame_decoder::Frame_decoder(flow::log::Logger* logger_ptr, util::String_view nickname, size_t max_frame_sz) :
  flow::log::Log_context(logger_ptr, Log_component::S_PROTOCOL),
  m_nickname(nickname),
  m_max_frame_sz(max_frame_sz),
  m_pos(0)
{
  FLOW_LOG_TRACE("Frame_decoder [" << m_nickname << "]: Created; max frame size [" << m_max_frame_sz << "].");
}

void Frame_decoder::feed(util::Blob_const bytes)
{
  // Drop the consumed prefix first, so the buffer does not grow without bound over a long-lived connection.
  if (m_pos != 0)
  {
    m_buf.erase(0, m_pos);
    m_pos = 0;
  }
  m_buf.append(static_cast<const char*>(bytes.data()), bytes.size());
}

size_t Frame_decoder::buffered_size() const
{
  return m_buf.size() - m_pos;
}

bool Frame_decoder::next(In_message* msg, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Frame_decoder::next, msg, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_fatal_err_code)
  {
    *err_code = m_fatal_err_code;
    return false;
  }
  // else

  const size_t avail = buffered_size();
  if (avail < S_HEADER_SZ)
  {
    return false;
  }
  // else

  const auto hdr = reinterpret_cast<const unsigned char*>(m_buf.data() + m_pos);
  const char type = char(hdr[0]);
  const int32_t len = boost::endian::load_big_s32(hdr + 1);

  if (len < 4)
  {
    FLOW_LOG_WARNING("Frame_decoder [" << m_nickname << "]: Frame of type [" << type << "] declares length "
                     "[" << len << "], smaller than the length field itself.  Framing is lost.");
    *err_code = m_fatal_err_code = error::Code::S_FRAME_LENGTH_INVALID;
    return false;
  }
  // else
  const size_t frame_sz = size_t(len) + 1;
  if (frame_sz > m_max_frame_sz)
  {
    FLOW_LOG_WARNING("Frame_decoder [" << m_nickname << "]: Frame of type [" << type << "] has size "
                     "[" << frame_sz << "], exceeding the limit [" << m_max_frame_sz << "].");
    *err_code = m_fatal_err_code = error::Code::S_FRAME_TOO_LARGE;
    return false;
  }
  // else
  if (avail < frame_sz)
  {
    return false; // Partial frame; wait for more.
  }
  // else

  const util::Blob_const body(hdr + S_HEADER_SZ, frame_sz - S_HEADER_SZ);
  m_pos += frame_sz;

  auto decoded = decode_message(type, body, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Frame_decoder [" << m_nickname << "]: Frame of type [" << type << "] with body size "
                     "[" << body.size() << "] failed to decode: [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    m_fatal_err_code = *err_code;
    return false;
  }
  // else

  FLOW_LOG_TRACE("Frame_decoder [" << m_nickname << "]: Decoded [" << decoded << "]; "
                 "[" << buffered_size() << "] bytes remain buffered.");
  *msg = std::move(decoded);
  return true;
} // Frame_decoder::next()

// Free function implementations.

In_message decode_message(char type, util::Blob_const body, Error_code* err_code)
{
  FLOW_ERROR_EXEC_FUNC_AND_THROW_ON_ERROR(In_message, decode_message, type, body, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Body_reader reader(body);
  bool ok;
  In_message result;

  switch (type)
  {
  case Ready_for_query::S_TYPE:
  {
    Ready_for_query msg;
    ok = reader.read_byte(&msg.m_tx_status) && reader.at_end();
    result = msg;
    break;
  }
  case Error_response::S_TYPE:
  {
    Error_response msg;
    ok = read_fields(&reader, &msg);
    result = std::move(msg);
    break;
  }
  case Notice_response::S_TYPE:
  {
    Notice_response msg;
    ok = read_fields(&reader, &msg);
    result = std::move(msg);
    break;
  }
  case Authentication::S_TYPE:
  {
    Authentication msg;
    int32_t request = 0;
    ok = reader.read_int32(&request);
    msg.m_request = Authentication::Request(request);
    reader.read_rest(&msg.m_data);
    result = std::move(msg);
    break;
  }
  case Notification_response::S_TYPE:
  {
    Notification_response msg;
    ok = reader.read_int32(&msg.m_backend_pid)
         && reader.read_cstring(&msg.m_channel)
         && reader.read_cstring(&msg.m_payload);
    result = std::move(msg);
    break;
  }
  case Parameter_status::S_TYPE:
  {
    Parameter_status msg;
    ok = reader.read_cstring(&msg.m_name) && reader.read_cstring(&msg.m_value);
    result = std::move(msg);
    break;
  }
  case Backend_key_data::S_TYPE:
  {
    Backend_key_data msg;
    ok = reader.read_int32(&msg.m_backend_pid) && reader.read_int32(&msg.m_secret_key);
    result = msg;
    break;
  }
  default:
  {
    Opaque_message msg;
    msg.m_type = type;
    reader.read_rest(&msg.m_body);
    ok = true;
    result = std::move(msg);
  }
  } // switch (type)

  if (!ok)
  {
    *err_code = error::Code::S_MESSAGE_MALFORMED;
  }
  return result;
} // decode_message()

void encode(const Out_message& msg, util::Byte_buffer* out)
{
  std::visit(Overloaded
               {
                 [&](const Startup_message& startup)
                 {
                   append_frame('\0', [&](util::Byte_buffer* body)
                   {
                     append_int32(Startup_message::S_PROTOCOL_VERSION, body);
                     for (const auto& param : startup.m_parameters)
                     {
                       append_cstring(param.first, body);
                       append_cstring(param.second, body);
                     }
                     body->push_back('\0');
                   }, out);
                 },
                 [&](const Tls_request&)
                 {
                   append_frame('\0', [&](util::Byte_buffer* body)
                   {
                     append_int32(Tls_request::S_REQUEST_CODE, body);
                   }, out);
                 },
                 [&](const Query& query)
                 {
                   append_frame(Query::S_TYPE, [&](util::Byte_buffer* body)
                   {
                     append_cstring(query.m_sql, body);
                   }, out);
                 },
                 [&](const Password_message& password)
                 {
                   append_frame(Password_message::S_TYPE, [&](util::Byte_buffer* body)
                   {
                     append_cstring(password.m_password, body);
                   }, out);
                 },
                 [&](const Sync&)
                 {
                   append_frame(Sync::S_TYPE, [](util::Byte_buffer*) {}, out);
                 },
                 [&](const Terminate&)
                 {
                   append_frame(Terminate::S_TYPE, [](util::Byte_buffer*) {}, out);
                 },
                 [&](const Raw_message& raw)
                 {
                   append_frame(raw.m_type, [&](util::Byte_buffer* body)
                   {
                     body->append(raw.m_body);
                   }, out);
                 }
               },
             msg);
} // encode()

} // namespace pgwire::protocol
