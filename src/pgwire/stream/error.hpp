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
 * Namespace containing the pgwire::stream module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * pgwire::stream might report are system errors and would not draw from this set of codes/messages but rather
 * from `boost::asio::error`, `boost::asio::ssl::error` or `boost::system::errc`; and framing errors come from
 * pgwire::protocol::error.  Such mixing is normal in boost.system.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace pgwire::stream::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments or Channel_error in-messages) by pgwire::stream
 * functions/methods *outside of* system-triggered errors such as `boost::asio::error::connection_reset`.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp’s Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to error.cpp's
 * Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.
 *
 * If you add a value to this `enum`, add it to the end, but ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Cannot send request: the connection to the backend is not open.
  S_NOT_CONNECTED = S_CODE_LOWEST_INT_VALUE,

  /// Cannot send request: a reply is already pending, and pipelining is not enabled for this stream.
  S_PIPELINING_NOT_ENABLED,

  /// Security (TLS) requested but not supported by backend server.
  S_SECURITY_NOT_SUPPORTED_BY_BACKEND,

  /// Channel state changed to inactive: the connection closed before the reply completed.
  S_CHANNEL_INACTIVE,

  /// Unsubscribe failed: no subscriber with the given token on the given notification channel.
  S_NO_SUCH_SUBSCRIBER,

  /// TLS is enabled, but no certificate trust policy was configured; refusing to connect.
  S_TLS_TRUST_POLICY_UNSPECIFIED,

  /// TLS peer certificate does not match the pinned certificate.
  S_TLS_PINNED_CERTIFICATE_MISMATCH,

  /// The configured pinned certificate could not be loaded.
  S_TLS_PINNED_CERTIFICATE_UNREADABLE,

  /// User called an API with 1 or more arguments violating the documented API contract.
  S_INVALID_ARGUMENT,

  /// Async completion handler is being called prematurely, because underlying object is shutting down, as user desires.
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.  Or, slightly more in English,
 * it glues the (completely general) #Error_code to the (`pgwire::stream`-specific) error code set
 * pgwire::stream::error::Code, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a stream::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If none is recognized, Code::S_END_SENTINEL is the result.
 * The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "NOT_CONNECTED" (or "not_connected" or "Not_connected" or...) for Code::S_NOT_CONNECTED.
 * This enables conversion from `string` via `boost::lexical_cast`, e.g., to specify an expected outcome
 * symbolically in tests.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a stream::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  When printing an #Error_code storing a Code, continue to do the standard thing
 * (the #Error_code itself plus its `.message()`); this is for symbolic [de]serialization specifically.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace pgwire::stream::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system makes `enum` `Code` convertible to `Error_code`.  The
 * non-specialized version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.
 */
template<>
struct is_error_code_enum<::pgwire::stream::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
