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

#include "pgwire/stream/stream_fwd.hpp"
#include "pgwire/protocol/message_codec.hpp"

namespace pgwire::stream
{

// Types.

/// Whether the connection is upgraded to TLS before the startup handshake.
enum class Tls_mode
{
  /// Plain TCP; no TLS request is sent.
  S_DISABLED = 0,
  /// TLS request is sent; a refusal by the backend fails the connect.
  S_REQUIRED,
  /// SENTINEL: Not a mode; I/O use only.
  S_END_SENTINEL
};

/**
 * How the backend's TLS certificate is validated.  There is no implicit default: with Tls_mode::S_REQUIRED,
 * leaving this at S_UNSPECIFIED makes Protocol_stream::connect() fail with
 * error::Code::S_TLS_TRUST_POLICY_UNSPECIFIED.
 */
enum class Trust_policy
{
  /// Not chosen.  Fine if TLS is disabled; an error otherwise.
  S_UNSPECIFIED = 0,
  /// Chain verified against the system's default trust store; host name verified.
  S_SYSTEM_TRUST_STORE,
  /// Chain verified against the CA certificate(s) in Stream_config::m_ca_file_path; host name verified.
  S_CA_FILE,
  /**
   * The leaf certificate's SHA-256 digest must equal that of the certificate in
   * Stream_config::m_pinned_cert_path.  Chain and host name are not otherwise verified.
   */
  S_PINNED_CERTIFICATE,
  /// Any certificate accepted.  Encrypts the connection but does not authenticate the backend.
  S_INSECURE_TRUST_ALL,
  /// SENTINEL: Not a policy; I/O use only.
  S_END_SENTINEL
};

/**
 * Everything a Protocol_stream needs to know about where and how to connect.  Plain aggregate; the defaults are
 * those of a local backend without TLS.
 */
struct Stream_config
{
  // Constants.

  /// Default TCP port of the backend.
  static constexpr uint16_t S_DEFAULT_PORT = 5432;

  // Data.

  /// Host name or address literal of the backend; also the TLS SNI and verification name.
  std::string m_host = "localhost";

  /// TCP port of the backend.
  uint16_t m_port = S_DEFAULT_PORT;

  /**
   * If `true`, any number of requests may be outstanding at once; otherwise a request sent while another one's
   * reply is pending is rejected with error::Code::S_PIPELINING_NOT_ENABLED.
   */
  bool m_pipelining = false;

  /// See Tls_mode.
  Tls_mode m_tls_mode = Tls_mode::S_DISABLED;

  /// See Trust_policy.
  Trust_policy m_trust_policy = Trust_policy::S_UNSPECIFIED;

  /// PEM file of trusted CA certificate(s); used with Trust_policy::S_CA_FILE only.
  std::string m_ca_file_path;

  /// PEM file of the pinned backend certificate; used with Trust_policy::S_PINNED_CERTIFICATE only.
  std::string m_pinned_cert_path;

  /// Incoming frames larger than this (header included) are a protocol error.
  size_t m_max_frame_sz = protocol::Frame_decoder::S_DEFAULT_MAX_FRAME_SZ;
}; // struct Stream_config

// Free functions.

/**
 * Serializes a Tls_mode, e.g., Tls_mode::S_REQUIRED => `"REQUIRED"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Tls_mode val);

/**
 * Deserializes a Tls_mode: its number, or the case-insensitive non-S_-prefix part of the identifier.
 * No match => Tls_mode::S_END_SENTINEL.  Enables parsing from config files or command lines, e.g. via
 * `boost::lexical_cast`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Tls_mode& val);

/**
 * Serializes a Trust_policy, e.g., Trust_policy::S_CA_FILE => `"CA_FILE"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Trust_policy val);

/**
 * Deserializes a Trust_policy similarly to the Tls_mode `>>`.  No match => Trust_policy::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Trust_policy& val);

/**
 * Prints all fields of the given config, on one line, for logging.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Stream_config& val);

} // namespace pgwire::stream
