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

#include "pgwire/stream/protocol_stream.hpp"
#include "pgwire/stream/reply_correlator.hpp"
#include "pgwire/stream/notification_registry.hpp"
#include "pgwire/stream/tls_negotiator.hpp"
#include "pgwire/stream/tls_context.hpp"
#include "pgwire/protocol/message_codec.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <array>
#include <atomic>
#include <deque>
#include <optional>

namespace pgwire::stream
{

// Types.

/**
 * Internal, non-movable pImpl implementation of Protocol_stream class.
 *
 * @see All discussion of the public API is in Protocol_stream doc header; that class forwards to this one.
 *
 * Impl design
 * -----------
 * ### Threads ###
 * Thread W is #m_worker.  All boost.asio I/O objects, the lifecycle state #m_state, the write queue and the
 * frame decoder are touched from thread W only, hence need no locking.  The public methods run in thread U
 * (any user thread, possibly thread W itself when called from a consumer); they touch only the thread-safe
 * #m_correlator and #m_registry, the atomic flags, and #m_send_mutex; and otherwise post() to thread W.
 *
 * ### Send path ###
 * send() encodes its messages, then, under #m_send_mutex: checks #m_connected, registers the consumer with
 * #m_correlator, and post()s the write onto thread W.  As both the registration order and the post() order are
 * decided under that one lock, and thread W executes tasks in post() order, and the write queue is FIFO, the
 * backend receives requests in registration order: which is what Reply_correlator relies on.
 *
 * ### Lifecycle ###
 * #m_state moves forward only: NULL -> CONNECTING -> [TLS_PENDING -> TLS_HANDSHAKING ->] HANDSHAKING ->
 * READY -> CLOSING -> CLOSED; or from any pre-READY state straight to CLOSED (connect failure).  Each async
 * handler first checks that #m_state is what it expects; otherwise (e.g., after close()) it is a no-op, except for
 * delivering a pre-READY failure to #m_connect_on_done which is consumed at most once.
 */
class Protocol_stream::Impl :
  public flow::log::Log_context
{
public:
  // Types.

  /// Lifecycle state; see class doc header.
  enum class State
  {
    /// connect() not yet called.
    S_NULL,
    /// Resolving the host and connecting TCP.
    S_CONNECTING,
    /// TLS request sent; awaiting the 1-byte response.
    S_TLS_PENDING,
    /// TLS handshake in progress.
    S_TLS_HANDSHAKING,
    /// Transport ready; startup message being queued.
    S_HANDSHAKING,
    /// Connected.
    S_READY,
    /// Shutting down the transport.
    S_CLOSING,
    /// Done; never leaves this state.
    S_CLOSED
  };

  // Constructors/destructor.

  /**
   * See Protocol_stream counterpart.
   *
   * @param logger_ptr
   *        See Protocol_stream counterpart.
   * @param nickname_str
   *        See Protocol_stream counterpart.
   * @param config
   *        See Protocol_stream counterpart.
   */
  explicit Impl(flow::log::Logger* logger_ptr, util::String_view nickname_str, const Stream_config& config);

  /// See Protocol_stream counterpart.
  ~Impl();

  // Methods.

  /**
   * See Protocol_stream counterpart.
   * @return See Protocol_stream counterpart.
   */
  const std::string& nickname() const;

  /**
   * See Protocol_stream counterpart.
   * @return See Protocol_stream counterpart.
   */
  const Stream_config& config() const;

  /**
   * See Protocol_stream counterpart.
   *
   * @param startup
   *        See Protocol_stream counterpart.
   * @param on_done
   *        See Protocol_stream counterpart.
   * @return See Protocol_stream counterpart.
   */
  bool connect(const protocol::Startup_message& startup, On_reply_func&& on_done);

  /**
   * See Protocol_stream counterpart (both overloads).
   *
   * @param msgs
   *        See Protocol_stream counterpart.
   * @param on_done
   *        See Protocol_stream counterpart.
   * @param err_code
   *        See Protocol_stream counterpart.
   */
  void send(std::vector<protocol::Out_message>&& msgs, On_reply_func&& on_done, Error_code* err_code);

  /**
   * See Protocol_stream counterpart.
   * @return See Protocol_stream counterpart.
   */
  bool is_connected() const;

  /**
   * See Protocol_stream counterpart.
   *
   * @param channel
   *        See Protocol_stream counterpart.
   * @param on_notification
   *        See Protocol_stream counterpart.
   * @return See Protocol_stream counterpart.
   */
  std::string subscribe(util::String_view channel, On_notification_func&& on_notification);

  /**
   * See Protocol_stream counterpart.
   *
   * @param channel
   *        See Protocol_stream counterpart.
   * @param token
   *        See Protocol_stream counterpart.
   * @param err_code
   *        See Protocol_stream counterpart.
   */
  void unsubscribe(util::String_view channel, util::String_view token, Error_code* err_code);

  /// See Protocol_stream counterpart.
  void close();

private:
  // Types.

  /// Short-hand for the TCP socket type.
  using Tcp_socket = boost::asio::ip::tcp::socket;

  /// Short-hand for the TLS transport: TLS over (a moved-in) #Tcp_socket.
  using Tls_stream = boost::asio::ssl::stream<Tcp_socket>;

  /// A queued write: the bytes of one send() (or of the startup message), and its reply's ID.
  struct Pending_write
  {
    /// ID from Reply_correlator::register_reply().
    Reply_correlator::reply_id_t m_reply_id;
    /// Encoded message(s).
    util::Byte_buffer m_bytes;
  };

  // Constants.

  /// Size of #m_read_buf.
  static constexpr size_t S_READ_BUF_SZ = 64 * 1024;

  // Methods.

  /**
   * Thread W: begins bring-up: prepares the TLS context if needed; resolves the host.
   * @param startup
   *        See connect().
   */
  void start_connect(const protocol::Startup_message& startup);

  /**
   * Thread W: after resolution, connects TCP.
   * @param results
   *        Resolver results.
   */
  void on_resolved(const boost::asio::ip::tcp::resolver::results_type& results);

  /// Thread W: after TCP connect: TLS request, or handshake.
  void on_tcp_connected();

  /// Thread W: reads (more of) the 1-byte TLS response.
  void read_tls_response();

  /**
   * Thread W: after the TLS response read.
   * @param n_read
   *        Bytes read into #m_tls_response_byte: 0 or 1.
   */
  void on_tls_response(size_t n_read);

  /// Thread W: the TLS handshake, on the socket moved into #m_tls_stream.
  void start_tls_handshake();

  /// Thread W: the startup message (the handshake proper), and on to READY.
  void start_handshake();

  /**
   * Thread W: pre-READY failure: closes everything; delivers the error to #m_connect_on_done, if not yet consumed.
   *
   * @param err_code
   *        The error.
   * @param description
   *        Elaboration.
   */
  void connect_failed(const Error_code& err_code, util::String_view description);

  /**
   * Delivers a one-message failure reply to #m_connect_on_done, if not yet consumed, and empties it.  An exception
   * from the consumer is logged, not propagated.
   *
   * @param err_code
   *        The error.
   * @param description
   *        Elaboration.
   */
  void fail_connect_consumer(const Error_code& err_code, util::String_view description);

  /**
   * Thread W: enqueues a write; starts it if no write is in progress.
   * @param write
   *        The write.
   */
  void enqueue_write(Pending_write&& write);

  /// Thread W: writes #m_write_q front.  Pre-condition: not empty, and no write in progress.
  void write_next();

  /// Thread W: reads more, in READY state.
  void read_next();

  /**
   * Thread W: feeds the read bytes to the decoder and routes each message; on decode error closes.
   * @param n_read
   *        Bytes read into #m_read_buf.
   */
  void on_read(size_t n_read);

  /**
   * Thread W: ends a READY (or HANDSHAKING) connection: closes the transport and broadcasts the error to all
   * pending consumers.  No-op if already CLOSING/CLOSED.
   *
   * @param err_code
   *        The error to broadcast.
   * @param description
   *        Elaboration.
   */
  void close_connection(const Error_code& err_code, util::String_view description);

  /// Thread W (or the transient dtor thread): closes the TCP socket, whether or not under TLS; no error reported.
  void close_transport();

  /**
   * Thread W: invokes `func` with the TLS stream if any, else the TCP socket.
   *
   * @tparam Func
   *         Generic function `void (auto& transport)`.
   * @param func
   *        See above.
   */
  template<typename Func>
  void with_transport(const Func& func);

  /**
   * Returns the name of the given state, for logging.
   * @param state
   *        State.
   * @return See above.
   */
  static util::String_view state_name(State state);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See config().
  const Stream_config m_config;

  /// Thread W.  Declared before the I/O objects which depend on its `Task_engine`, so as to be destroyed last.
  boost::movelib::unique_ptr<flow::async::Single_thread_task_loop> m_worker;

  /// See Reply_correlator.  Thread-safe.
  Reply_correlator m_correlator;

  /// See Notification_registry.  Thread-safe.
  Notification_registry m_registry;

  /// `true` once connect() has been called.
  std::atomic<bool> m_connect_requested;

  /// See is_connected().  Written in thread W under #m_send_mutex; read anywhere.
  std::atomic<bool> m_connected;

  /// Makes {check #m_connected, register consumer, post() write} atomic.  See class doc header.
  flow::util::Mutex_non_recursive m_send_mutex;

  /// Lifecycle state.  Thread W only (and the transient dtor thread, after thread W is gone).
  State m_state;

  /// connect() `startup`, until written.  Thread W.
  protocol::Startup_message m_startup;

  /// connect() `on_done`, until registered with #m_correlator or invoked with a failure.  Thread W.
  On_reply_func m_connect_on_done;

  /// Host name resolver.  Thread W.
  boost::asio::ip::tcp::resolver m_resolver;

  /// The TCP socket; moved into #m_tls_stream on TLS acceptance, hence not open after that.  Thread W.
  Tcp_socket m_socket;

  /// TLS context; null unless TLS is required.  Thread W.
  Tls_context_ptr m_tls_ctx;

  /// The TLS transport; empty unless the backend accepted TLS.  Thread W.
  std::optional<Tls_stream> m_tls_stream;

  /// See Tls_negotiator.  Thread W.
  Tls_negotiator m_tls_negotiator;

  /// The encoded TLS request, kept alive until written.  Thread W.
  util::Byte_buffer m_tls_request;

  /// Target of the 1-byte TLS response read.  Thread W.
  char m_tls_response_byte;

  /// Writes not yet completed; front one is in progress if #m_writing.  Thread W.
  std::deque<Pending_write> m_write_q;

  /// Whether an async write is in progress.  Thread W.
  bool m_writing;

  /// Target of reads.  Thread W.
  std::array<uint8_t, S_READ_BUF_SZ> m_read_buf;

  /// Incoming frame decoder.  Thread W.
  protocol::Frame_decoder m_decoder;
}; // class Protocol_stream::Impl

// Free functions.

/**
 * Prints string representation of the given `Protocol_stream::Impl` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Protocol_stream::Impl& val);

} // namespace pgwire::stream
