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

#include "pgwire/stream/config.hpp"
#include "pgwire/protocol/message.hpp"
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <experimental/propagate_const>

namespace pgwire::stream
{

// Types.

/**
 * A single connection to a PostgreSQL backend, speaking the v3 wire protocol, that matches replies to requests
 * and fans out notifications.
 *
 * ### Lifecycle ###
 * A Protocol_stream starts in NULL state; connect() starts the asynchronous bring-up exactly once: host name
 * resolution, TCP connect, then -- if Stream_config::m_tls_mode is Tls_mode::S_REQUIRED -- the TLS request and
 * (if the backend accepts) the TLS handshake, then the startup message.  The reply to the startup message
 * (typically through an authentication request or `ReadyForQuery`) goes to connect()'s consumer.  As soon as
 * the startup message is queued, the stream is connected (is_connected()), and send() may be used; in particular
 * to answer an authentication request.  Any failure before that (including the backend refusing TLS, in which
 * case the startup message is never written) goes to connect()'s consumer as a one-message reply consisting of a
 * protocol::Channel_error.
 *
 * The connection ends when the backend closes it, on any transport or framing error, or on close().  Then every
 * pending reply consumer gets its partial reply plus a protocol::Channel_error, in request order; and
 * is_connected() becomes `false` for good.  A Protocol_stream is not reusable: make a new one to reconnect.
 *
 * ### Replies ###
 * send() writes one message, or a batch of messages in one write, and registers the consumer of the reply.
 * The reply is every non-notification message the backend sends in response, up to and including the first
 * terminal one: `ReadyForQuery`, or an authentication request needing a response; or a Channel_error if the
 * connection fails first.  Each consumer is invoked exactly once.
 *
 * If Stream_config::m_pipelining is `false`, at most one request may be outstanding at a time: send() while
 * a reply is pending invokes the consumer right away, from the calling thread, with a Channel_error
 * error::Code::S_PIPELINING_NOT_ENABLED, writing nothing.  Otherwise requests are written immediately, and
 * their replies delivered in the same order.
 *
 * ### Notifications ###
 * `NotificationResponse` messages may arrive at any time, also in the middle of a reply; they are never part of one.
 * Instead their payload goes to every subscriber of their channel: see subscribe().  Subscribing does not send
 * `LISTEN` to the backend; that is up to the user, via send().
 *
 * ### Thread safety and threads ###
 * All public methods may be called concurrently from any thread, and from within consumers, except the destructor.
 * Internally each Protocol_stream runs one worker thread (thread W) performing all I/O and invoking all consumers
 * and subscribers, one at a time.  A consumer or subscriber must not block for long: that delays all I/O.
 * Destroying `*this` must not happen from thread W (from a consumer or subscriber); it stops thread W, and then
 * invokes any consumers still pending with error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER from an
 * unspecified thread, before returning.
 *
 * There is no timeout facility: a backend that stops answering leaves replies pending until close().
 *
 * @internal
 * ### Implementation ###
 * pImpl idiom: all the logic is in Protocol_stream::Impl; see its doc header.
 */
class Protocol_stream
{
public:
  // Constructors/destructor.

  /**
   * Constructs the stream in NULL state: not connected; connect() should follow.  Starts thread W.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null: logs nowhere.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param config
   *        Where and how to connect; copied.
   */
  explicit Protocol_stream(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                           const Stream_config& config);

  /// Copy construction is disallowed.
  Protocol_stream(const Protocol_stream&) = delete;

  /**
   * Stops thread W; closes the connection if any; invokes all pending consumers with
   * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER (not from the calling thread) and awaits their
   * completion.  See class doc header.
   */
  ~Protocol_stream();

  // Methods.

  /// Copy assignment is disallowed.
  Protocol_stream& operator=(const Protocol_stream&) = delete;

  /**
   * Returns nickname, a brief string suitable for logging.  This is always the same value as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Returns the config given to ctor.
   * @return See above.
   */
  const Stream_config& config() const;

  /**
   * Starts the asynchronous connection bring-up (see class doc header), if in NULL state; otherwise no-op.
   *
   * @param startup
   *        Startup message to send once the transport is ready; typically with `user` and `database` parameters.
   * @param on_done
   *        Consumer of the reply to the startup message (or of the failure to get it).
   * @return `false` if connect() was already called (no-op); `true` otherwise.
   */
  bool connect(const protocol::Startup_message& startup, On_reply_func&& on_done);

  /**
   * Sends the given message and registers the consumer of its reply.  See class doc header.
   *
   * @param msg
   *        Message.
   * @param on_done
   *        Reply consumer.  Not invoked if an error is emitted.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NOT_CONNECTED (not yet connected, or connection ended).  Capacity rejection
   *        (error::Code::S_PIPELINING_NOT_ENABLED) is not emitted here but given to `on_done`.
   */
  void send(protocol::Out_message msg, On_reply_func&& on_done, Error_code* err_code = 0);

  /**
   * Sends the given messages, in order and in one write, and registers the consumer of their (one) reply.
   * Typical batch: an extended-query sequence ending with `Sync`.  Otherwise identical to the other overload.
   *
   * @param msgs
   *        Messages.  Must not be empty.
   * @param on_done
   *        Reply consumer.  Not invoked if an error is emitted.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NOT_CONNECTED, error::Code::S_INVALID_ARGUMENT (`msgs` empty).
   */
  void send(std::vector<protocol::Out_message> msgs, On_reply_func&& on_done, Error_code* err_code = 0);

  /**
   * Returns `true` if and only if the connection is up: the startup message has been queued and the connection
   * has not ended.  Point-in-time answer: may be stale by the time it is used.
   *
   * @return See above.
   */
  bool is_connected() const;

  /**
   * Adds a subscriber to notifications on the given channel.  Works in any state.
   *
   * @param channel
   *        Channel name (as in `LISTEN <channel>`).
   * @param on_notification
   *        Subscriber: invoked from thread W with the payload of each notification on `channel`.
   * @return Token for unsubscribe(); a random UUID string.
   */
  std::string subscribe(util::String_view channel, On_notification_func&& on_notification);

  /**
   * Removes the given subscriber.  Once this returns, it will not be invoked, unless it was being invoked
   * concurrently.
   *
   * @param channel
   *        As given to subscribe().
   * @param token
   *        As returned by subscribe().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NO_SUCH_SUBSCRIBER.
   */
  void unsubscribe(util::String_view channel, util::String_view token, Error_code* err_code = 0);

  /**
   * Closes the connection, or aborts the bring-up, asynchronously; pending consumers then get a
   * error::Code::S_CHANNEL_INACTIVE Channel_error.  No-op if already closed or never connected.
   */
  void close();

private:
  // Types.

  // Forward declare the pImpl-idiom true implementation of this class.  See protocol_stream_impl.hpp.
  class Impl;

  /// Short-hand for `const`-respecting wrapper around Protocol_stream::Impl for the pImpl idiom.
  using Impl_ptr = std::experimental::propagate_const<boost::movelib::unique_ptr<Impl>>;

  // Friends.

  /// Friend of Protocol_stream.
  friend std::ostream& operator<<(std::ostream& os, const Protocol_stream& val);
  /// Friend of Protocol_stream.
  friend std::ostream& operator<<(std::ostream& os, const Impl& val);

  // Data.

  /// The true implementation of this class.  See also our class doc header.
  Impl_ptr m_impl;
}; // class Protocol_stream

} // namespace pgwire::stream
