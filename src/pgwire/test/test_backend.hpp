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
#include "pgwire/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <chrono>
#include <optional>

namespace pgwire::test
{

/**
 * In-process stand-in for a PostgreSQL backend: a loopback TCP acceptor for exactly one client connection, driven
 * synchronously by the test thread.  Each blocking operation gives up after S_TIMEOUT, so that a misbehaving
 * client fails the test instead of hanging it.
 *
 * If constructed with Tls_answer::S_ACCEPT, a TLS request is answered `'S'` and followed by the server side of
 * a TLS handshake using a self-signed certificate (CN `localhost`) generated in the ctor; see cert_pem().
 * Otherwise it is answered `'N'`.
 */
class Test_backend :
  public flow::log::Log_context
{
public:
  // Types.

  /// How to answer a TLS request.
  enum class Tls_answer
  {
    /// Reply `'N'`.
    S_REFUSE,
    /// Reply `'S'`; then handshake.
    S_ACCEPT
  };

  // Constants.

  /// Limit on each blocking operation.
  static const std::chrono::seconds S_TIMEOUT;

  // Constructors/destructor.

  /**
   * Starts listening on an ephemeral loopback port.
   *
   * @param logger_ptr
   *        Logger.
   * @param tls_answer
   *        See class doc header.
   */
  explicit Test_backend(flow::log::Logger* logger_ptr, Tls_answer tls_answer = Tls_answer::S_REFUSE);

  // Methods.

  /**
   * Port we listen on.
   * @return See above.
   */
  uint16_t port() const;

  /**
   * PEM of the self-signed certificate presented in TLS handshakes.
   * @return See above.
   */
  const std::string& cert_pem() const;

  /**
   * Awaits the client connection.
   * @return `false` on timeout or error.
   */
  bool accept();

  /**
   * Reads the client's opening: an optional TLS request (answered, and handshaken, per ctor), then the
   * startup message.
   *
   * @return `true` if and only if a startup message was read.
   */
  bool read_opening();

  /**
   * Whether read_opening() saw a TLS request.
   * @return See above.
   */
  bool tls_requested() const;

  /**
   * Whether the server-side TLS handshake completed.
   * @return See above.
   */
  bool tls_established() const;

  /**
   * Parameters of the startup message read by read_opening().
   * @return See above.
   */
  const std::vector<protocol::Startup_message::Parameter>& startup_parameters() const;

  /**
   * Reads one typed frame from the client.
   *
   * @param type
   *        Target for the type byte.
   * @param body
   *        Target for the body.
   * @return `false` on timeout, EOF, or error.
   */
  bool read_frame(char* type, std::string* body);

  /**
   * Returns `true` if the client closes the connection (EOF or reset) before sending any more bytes.
   * @return See above.
   */
  bool await_client_close();

  /**
   * Writes bytes to the client.
   *
   * @param bytes
   *        Bytes.
   * @return `false` on timeout or error.
   */
  bool write(util::String_view bytes);

  /// Closes the client connection (abruptly; no TLS close_notify).
  void close_client();

  /// Resets the client connection: closes with zero linger, so the client sees a TCP RST, not an orderly FIN.
  void reset_client();

  // Backend frame builders.

  /**
   * Builds a typed frame.
   *
   * @param type
   *        Type byte.
   * @param body
   *        Body.
   * @return See above.
   */
  static util::Byte_buffer frame(char type, util::String_view body);

  /// `Z` with status `I`.  @return See above.
  static util::Byte_buffer ready_for_query();

  /// `R` with the given request code.  @param request Request code.  @return See above.
  static util::Byte_buffer authentication(protocol::Authentication::Request request);

  /// `C` with the given tag.  @param tag Command tag.  @return See above.
  static util::Byte_buffer command_complete(util::String_view tag);

  /**
   * `E` with severity `ERROR`, the given SQLSTATE and message.
   * @param sqlstate
   *        SQLSTATE.
   * @param message
   *        Message.
   * @return See above.
   */
  static util::Byte_buffer error_response(util::String_view sqlstate, util::String_view message);

  /**
   * `A` from backend PID 42.
   * @param channel
   *        Channel.
   * @param payload
   *        Payload.
   * @return See above.
   */
  static util::Byte_buffer notification(util::String_view channel, util::String_view payload);

private:
  // Methods.

  /**
   * Reads exactly `buf.size()` bytes.
   * @param buf
   *        Target.
   * @return Result; `boost::asio::error::timed_out` on timeout.
   */
  Error_code read_exactly(util::Blob_mutable buf);

  /**
   * Runs #m_io until `*done` or timeout; on timeout closes the connection.
   *
   * @param done
   *        Set by the completion handler of the op in question.
   * @return `*done`.
   */
  bool await(const bool* done);

  /// Runs `func(stream)`, on the TLS stream if established, else on the TCP socket.  @param func See above.
  template<typename Func>
  void with_stream(const Func& func);

  /// Generates #m_cert_pem and loads it, with its key, into #m_tls_ctx.
  void make_certificate();

  // Data.

  /// I/O engine; only run from the test thread.
  boost::asio::io_context m_io;

  /// Acceptor.
  boost::asio::ip::tcp::acceptor m_acceptor;

  /// Client connection, or TLS's lower layer.
  boost::asio::ip::tcp::socket m_socket;

  /// See ctor.
  const Tls_answer m_tls_answer;

  /// Server TLS context.
  boost::asio::ssl::context m_tls_ctx;

  /// See cert_pem().
  std::string m_cert_pem;

  /// TLS stream, once accepted.
  std::optional<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>> m_tls_stream;

  /// See tls_requested().
  bool m_tls_requested;

  /// See tls_established().
  bool m_tls_established;

  /// See startup_parameters().
  std::vector<protocol::Startup_message::Parameter> m_startup_params;
}; // class Test_backend

} // namespace pgwire::test
