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
#pragma once

#include "pgwire/protocol/message.hpp"
#include <flow/log/log.hpp>

namespace pgwire::protocol
{

// Types.

/**
 * Incremental splitter of the backend-to-frontend byte stream into frames, and decoder of each frame into an
 * In_message.  Bytes are fed as they arrive, in arbitrarily sized pieces; next() then yields complete messages
 * one at a time.  A frame is `[type:1][length:4][body:length-4]`, the length being big-endian and counting itself.
 *
 * Once next() has emitted an error, the decoder is hosed: every subsequent next() emits the same error.  Since the
 * byte stream has lost its framing at that point, the only reasonable reaction is to close the connection.
 *
 * ### Thread safety ###
 * Same as for `std::string`: no concurrent non-`const` access.  In practice it is only touched from the
 * read handler of a single connection.
 */
class Frame_decoder :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Size of the frame header: the type byte plus the 4-byte length.
  static constexpr size_t S_HEADER_SZ = 5;

  /// Default for the `max_frame_sz` ctor arg: 1GiB, the largest allocation the backend itself would make.
  static constexpr size_t S_DEFAULT_MAX_FRAME_SZ = size_t(1) << 30;

  // Constructors/destructor.

  /**
   * Constructs decoder with empty buffer.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        String to use subsequently in logging to identify `*this`.
   * @param max_frame_sz
   *        A frame whose total size (header included) exceeds this is an error::Code::S_FRAME_TOO_LARGE.
   */
  explicit Frame_decoder(flow::log::Logger* logger_ptr, util::String_view nickname,
                         size_t max_frame_sz = S_DEFAULT_MAX_FRAME_SZ);

  // Methods.

  /**
   * Appends the given bytes to the internal buffer; does not decode anything.
   *
   * @param bytes
   *        Bytes as received; may split frames anywhere.
   */
  void feed(util::Blob_const bytes);

  /**
   * If the buffer holds at least one complete frame, decodes the first one into `*msg`, removes it from the
   * buffer and returns `true`; otherwise returns `false`.
   *
   * @param msg
   *        Target; touched only if `true` returned.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_FRAME_LENGTH_INVALID, error::Code::S_FRAME_TOO_LARGE,
   *        error::Code::S_MESSAGE_MALFORMED.  `false` is returned if an error is emitted.
   * @return See above.
   */
  bool next(In_message* msg, Error_code* err_code = 0);

  /**
   * Number of bytes fed but not yet consumed by next().
   * @return See above.
   */
  size_t buffered_size() const;

private:
  // Data.

  /// The `nickname` from ctor.
  const std::string m_nickname;

  /// The `max_frame_sz` from ctor.
  const size_t m_max_frame_sz;

  /// Fed bytes; those before #m_pos have been consumed.
  std::string m_buf;

  /// Offset of the first unconsumed byte in #m_buf.
  size_t m_pos;

  /// Falsy until next() emits an error; then that error forever.
  Error_code m_fatal_err_code;
}; // class Frame_decoder

// Free functions.

/**
 * Appends the wire encoding of `msg` to `*out`.  Startup_message and Tls_request get the untyped frame format;
 * all others the typed one.
 *
 * @param msg
 *        Message to encode.
 * @param out
 *        Buffer to which to append.  Existing contents are left alone.
 */
void encode(const Out_message& msg, util::Byte_buffer* out);

/**
 * Decodes the body of a typed backend frame into an In_message.  Types not understood further become an
 * Opaque_message.
 *
 * @param type
 *        The frame type byte.
 * @param body
 *        The frame body (after the length field).
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_MESSAGE_MALFORMED (body too short, or a string field is missing its terminator).
 * @return The message; meaningless if an error is emitted.
 */
In_message decode_message(char type, util::Blob_const body, Error_code* err_code = 0);

} // namespace pgwire::protocol
