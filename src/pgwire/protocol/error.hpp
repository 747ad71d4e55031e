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

#include "pgwire/common.hpp"

/**
 * Namespace containing the pgwire::protocol module's extension of boost.system error conventions.  These are
 * the errors the framing/codec layer can emit when the incoming byte stream does not parse as the v3 wire
 * protocol.  They are never retried: a stream that hits one of these closes, and the resulting channel error
 * is broadcast to all pending callers.
 *
 * @see pgwire::stream::error which covers the errors of the stream layer proper.
 */
namespace pgwire::protocol::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by pgwire::protocol functions/methods.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol (minus the `S_`) to Category::code_symbol().  Add new values at the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Incoming frame declares a length exceeding the configured maximum frame size.
  S_FRAME_TOO_LARGE = S_CODE_LOWEST_INT_VALUE,

  /// Incoming frame declares a length smaller than the length field itself.
  S_FRAME_LENGTH_INVALID,

  /// Incoming frame body is too short or otherwise malformed for its message type.
  S_MESSAGE_MALFORMED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a protocol::error::Code from a standard input stream: either its `int` value or the
 * case-insensitive non-S_-prefix part of the identifier.  No match => Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a protocol::error::Code to a standard output stream; e.g., Code::S_FRAME_TOO_LARGE =>
 * `"FRAME_TOO_LARGE"`.  Compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace pgwire::protocol::error

namespace boost::system
{

// Types.

/// Authorizes boost.system to make `enum` pgwire::protocol::error::Code convertible to `Error_code`.
template<>
struct is_error_code_enum<::pgwire::protocol::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
