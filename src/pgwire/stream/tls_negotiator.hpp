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
#include <flow/log/log.hpp>

namespace pgwire::stream
{

// Types.

/**
 * A simple state machine for the one-shot TLS request sub-protocol that precedes the startup handshake when
 * TLS is required.  The frontend sends the 8-byte TLS request exactly once; the backend answers with exactly one
 * byte: `'S'` (go ahead with the TLS handshake on this very socket) or anything else, typically `'N'`
 * (TLS not supported; the frontend must give up, as TLS was required).
 *
 * ### How to use ###
 * Call request_for_sending() when the TCP connection is up; it returns the encoded TLS request the first time
 * and an empty buffer subsequently.  Send it.  Read the response: exactly one byte is expected, but a read may
 * yield 0 bytes; pass whatever was read to compute_outcome() which no-ops on an empty buffer.  Once it has returned
 * `true`, check outcome() (or the emitted error).  The response is only ever consumed once.
 *
 * Only the first byte is consumed: the bytes after it, if the backend were to send any, belong to the TLS
 * handshake.  The caller should read into a 1-byte buffer for that reason.
 *
 * ### Thread safety ###
 * For simplicity the object is not thread-safe; it is used from thread W only.
 */
class Tls_negotiator :
  public flow::log::Log_context
{
public:
  // Types.

  /// Result of the negotiation.
  enum class Outcome
  {
    /// compute_outcome() has not yet consumed the response byte.
    S_UNKNOWN,
    /// Backend answered `'S'`.
    S_ACCEPTED,
    /// Backend answered something else.
    S_REFUSED
  };

  // Constants.

  /// The accepting response byte.
  static constexpr char S_ACCEPTED_RESPONSE = 'S';

  // Constructors/destructor.

  /**
   * Constructs a negotiator in initial state wherein: (1) outcome() returns Outcome::S_UNKNOWN; and (2)
   * request_for_sending() would return the TLS request.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        String to use subsequently in logging to identify `*this`.
   */
  explicit Tls_negotiator(flow::log::Logger* logger_ptr, util::String_view nickname);

  // Methods.

  /**
   * Returns Outcome::S_UNKNOWN before compute_outcome() has consumed the response; then the outcome.
   * @return See above.
   */
  Outcome outcome() const;

  /**
   * To be called at least once, this returns the encoded TLS request the first time and an empty buffer
   * subsequently.
   *
   * @return See above.
   */
  util::Byte_buffer request_for_sending();

  /**
   * Based on the presumably-just-received bytes of the backend's response, decides the outcome, so it will be
   * returned by outcome() subsequently.  Returns `true` if this call decided it; returns `false`, doing nothing
   * (outside of logging) if `response` is empty or the outcome was already decided.
   *
   * If it decides Outcome::S_REFUSED, a truthy `Error_code` is emitted using standard Flow error-emission
   * convention.
   *
   * @param response
   *        Bytes read from the backend after the TLS request; only the first one is examined.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SECURITY_NOT_SUPPORTED_BY_BACKEND (response byte not `'S'`).
   * @return See above.
   */
  bool compute_outcome(util::Blob_const response, Error_code* err_code = 0);

private:
  // Data.

  /// The `nickname` from ctor.
  std::string m_nickname;

  /// Init value `false` indicating request_for_sending() has not been called; subsequently `true`.
  bool m_request_sent;

  /// See outcome().
  Outcome m_outcome;
}; // class Tls_negotiator

// Free functions.

/**
 * Prints string representation of the given `Tls_negotiator::Outcome` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Tls_negotiator::Outcome val);

} // namespace pgwire::stream
