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

#include "pgwire/protocol/protocol_fwd.hpp"
#include "pgwire/util/util_fwd.hpp"
#include <map>
#include <vector>

namespace pgwire::protocol
{

// Types.

/// Backend message 'Z': the backend is ready for a new query cycle.  Ends every reply to a query or sync.
struct Ready_for_query
{
  // Constants.

  /// Frame type byte.
  static constexpr char S_TYPE = 'Z';

  // Data.

  /// Transaction status indicator: 'I' (idle), 'T' (in a transaction block) or 'E' (failed transaction block).
  char m_tx_status = '\0';
};

/**
 * Common body of the 2 backend messages ('E' and 'N') consisting of a sequence of (field type, string) pairs.
 * Known field types include 'S' (severity), 'C' (SQLSTATE code) and 'M' (primary message).
 */
struct Field_map_message
{
  // Types.

  /// Field type byte to field value.
  using Field_map = std::map<char, std::string>;

  // Methods.

  /**
   * Returns the field of the given type or an empty string if not present.
   *
   * @param field_type
   *        Field type byte.
   * @return See above.
   */
  const std::string& field(char field_type) const;

  /// Returns `field('S')`.  @return See above.
  const std::string& severity() const;
  /// Returns `field('C')`.  @return See above.
  const std::string& sqlstate() const;
  /// Returns `field('M')`.  @return See above.
  const std::string& message() const;

  // Data.

  /// The fields.
  Field_map m_fields;
};

/// Backend message 'E'.
struct Error_response : public Field_map_message
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'E';
};

/// Backend message 'N'.
struct Notice_response : public Field_map_message
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'N';
};

/**
 * Backend message 'R': an authentication request (or the "authentication OK" notice).  Apart from OK and SASL-final,
 * each request expects a response from the frontend before the backend will say anything more; therefore
 * requires_response() messages end a reply.
 */
struct Authentication
{
  // Types.

  /// The request codes.
  enum class Request : int32_t
  {
    /// Authentication succeeded.
    S_OK = 0,
    /// Kerberos V5 requested.
    S_KERBEROS_V5 = 2,
    /// Cleartext password requested.
    S_CLEARTEXT_PASSWORD = 3,
    /// MD5-hashed password requested; #m_data holds the 4-byte salt.
    S_MD5_PASSWORD = 5,
    /// GSSAPI requested.
    S_GSS = 7,
    /// GSSAPI or SSPI continuation; #m_data holds the data.
    S_GSS_CONTINUE = 8,
    /// SSPI requested.
    S_SSPI = 9,
    /// SASL requested; #m_data holds the NUL-terminated mechanism names.
    S_SASL = 10,
    /// SASL challenge; #m_data holds the challenge.
    S_SASL_CONTINUE = 11,
    /// SASL outcome; #m_data holds the additional data.  No response expected.
    S_SASL_FINAL = 12
  };

  // Constants.

  /// Frame type byte.
  static constexpr char S_TYPE = 'R';

  // Methods.

  /**
   * Returns `true` unless #m_request is `S_OK` or `S_SASL_FINAL`.
   * @return See above.
   */
  bool requires_response() const;

  // Data.

  /// The request code as sent; values outside Request are kept as-is.
  Request m_request = Request::S_OK;

  /// Request-specific trailing data (salt, SASL mechanism list, challenge...); possibly empty.
  std::string m_data;
};

/// Backend message 'A': a notification pushed on a channel the session LISTENs to.  Never part of a reply.
struct Notification_response
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'A';

  /// Process ID of the notifying backend.
  int32_t m_backend_pid = 0;
  /// Channel name.
  std::string m_channel;
  /// Payload; possibly empty.
  std::string m_payload;
};

/// Backend message 'S': run-time parameter status report.
struct Parameter_status
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'S';

  /// Parameter name.
  std::string m_name;
  /// Current value.
  std::string m_value;
};

/// Backend message 'K': cancellation key data.
struct Backend_key_data
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'K';

  /// Process ID of this backend.
  int32_t m_backend_pid = 0;
  /// Secret key of this backend.
  int32_t m_secret_key = 0;
};

/// Any backend message whose type this library does not decode further (row descriptions, data rows, etc.).
struct Opaque_message
{
  /// Frame type byte as received.
  char m_type;
  /// Body as received (excluding type and length).
  std::string m_body;
};

/**
 * Not a wire message: a synthetic in-message standing in for a failure of the connection itself (or of a
 * request's admission), delivered to a reply consumer as the last (usually only) message of its reply.
 */
struct Channel_error
{
  /// The error: a pgwire::stream::error::Code, a pgwire::protocol::error::Code, or a system/asio/ssl code.
  Error_code m_err_code;
  /// Human-readable elaboration; possibly empty.
  std::string m_description;
};

/**
 * Frontend startup message: untyped frame carrying protocol version 3.0 and (name, value) parameter pairs
 * such as `user` and `database`.
 */
struct Startup_message
{
  // Types.

  /// A (name, value) pair.
  using Parameter = std::pair<std::string, std::string>;

  // Constants.

  /// Protocol version 3.0 as encoded on the wire: major 3 in the high 16 bits, minor 0 in the low 16 bits.
  static constexpr int32_t S_PROTOCOL_VERSION = 196608;

  // Data.

  /// Parameters, sent in this order.
  std::vector<Parameter> m_parameters;
};

/// Frontend TLS request: untyped 8-byte frame whose body is the magic request code.
struct Tls_request
{
  /// The request code (1234 in the high 16 bits, 5679 in the low 16 bits).
  static constexpr int32_t S_REQUEST_CODE = 80877103;
};

/// Frontend message 'Q': simple query.
struct Query
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'Q';

  /// The query text (no NUL allowed; the terminator is added on the wire).
  std::string m_sql;
};

/// Frontend message 'p': password (cleartext or MD5-hashed as the request demands).
struct Password_message
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'p';

  /// The password string (the terminator is added on the wire).
  std::string m_password;
};

/// Frontend message 'S': sync.
struct Sync
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'S';
};

/// Frontend message 'X': terminate.
struct Terminate
{
  /// Frame type byte.
  static constexpr char S_TYPE = 'X';
};

/// Any typed frontend message, pre-encoded by the caller (SASL responses, extended-query messages, etc.).
struct Raw_message
{
  /// Frame type byte.
  char m_type;
  /// Body (the length field is computed on the wire).
  std::string m_body;
};

// Free functions.

/**
 * Returns `true` if and only if `msg` ends the reply it is part of: Ready_for_query, Channel_error, or an
 * Authentication that requires_response().
 *
 * @param msg
 *        The message.
 * @return See above.
 */
bool is_reply_terminal(const In_message& msg);

/**
 * Returns `true` if and only if `msg` is a server-pushed message that is never part of any reply
 * (Notification_response).
 *
 * @param msg
 *        The message.
 * @return See above.
 */
bool is_push(const In_message& msg);

/**
 * Prints string representation of the given `Authentication::Request` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Authentication::Request val);

} // namespace pgwire::protocol
