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
#include "pgwire/protocol/message.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <deque>

namespace pgwire::stream
{

// Types.

/**
 * Strictly ordered queue of pending reply consumers, matching each incoming backend message to the oldest request
 * not yet fully answered.  The backend answers requests in the order it received them, and the frontend writes
 * requests in the order they were registered here (Protocol_stream ensures this), so the head of the queue is always
 * the request whose reply is arriving.
 *
 * Each entry accumulates the messages of its reply; once a terminal message (protocol::is_reply_terminal())
 * arrives, the entry is popped and its consumer invoked with the complete Reply.  Each consumer is invoked
 * exactly once:
 *   - with its complete reply; or
 *   - with a single-message reply consisting of a protocol::Channel_error via fail_one() (the entry's
 *     request could not be written); the entry is then *answered* but stays in the queue, as the backend
 *     may still answer a partially written request; or
 *   - with its partial reply plus a protocol::Channel_error via fail_all() (the connection went away),
 *     unless it was already answered; or
 *   - with a single protocol::Channel_error error::Code::S_PIPELINING_NOT_ENABLED via reject(), if
 *     register_reply() refused it (pipelining disabled and another reply pending); it is then never queued.
 *
 * A message arriving when nothing is pending is logged and dropped.
 *
 * ### Thread safety ###
 * All methods may be called concurrently.  Consumers are always invoked with no lock held, so they may call back
 * into `*this`; they are invoked from whichever thread called the method that completed them (in Protocol_stream,
 * thread W, except for reject() which is invoked in the thread calling `send()`).
 */
class Reply_correlator :
  public flow::log::Log_context
{
public:
  // Types.

  /// Identifies a registered reply consumer, for fail_one().
  using reply_id_t = uint64_t;

  // Constants.

  /// The #reply_id_t returned by register_reply() on rejection; no registered consumer has it.
  static constexpr reply_id_t S_NO_ID = 0;

  // Constructors/destructor.

  /**
   * Constructs an empty queue.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        String to use subsequently in logging to identify `*this`.
   * @param pipelining
   *        If `false`, at most one consumer is queued at a time.
   */
  explicit Reply_correlator(flow::log::Logger* logger_ptr, util::String_view nickname, bool pipelining);

  // Methods.

  /**
   * Appends the given consumer to the queue, moving it from `*on_done`, and returns its ID; or, if pipelining is
   * disabled and the queue is not empty, returns #S_NO_ID leaving `*on_done` untouched.  In the latter case
   * the caller shall pass it to reject(), once it holds no lock of its own.
   *
   * @param on_done
   *        Reply consumer.
   * @return See above.
   */
  reply_id_t register_reply(On_reply_func* on_done);

  /**
   * Invokes the given consumer, refused by register_reply(), with a one-message reply consisting of a Channel_error
   * error::Code::S_PIPELINING_NOT_ENABLED.
   *
   * @param on_done
   *        Reply consumer.
   */
  void reject(On_reply_func&& on_done);

  /**
   * Appends the given non-push message to the head entry's reply; if it is terminal, pops the head and invokes
   * its consumer (unless already answered).  If the queue is empty, logs and drops it.
   *
   * @param msg
   *        Incoming message.
   */
  void on_message(protocol::In_message&& msg);

  /**
   * Invokes the consumer of the given entry, if it is still queued and not yet answered, with a one-message reply
   * consisting of a Channel_error with the given error; marks the entry answered.  Otherwise no-op.
   *
   * @param id
   *        Value from register_reply().
   * @param err_code
   *        Error to report.
   * @param description
   *        Elaboration for Channel_error::m_description.
   */
  void fail_one(reply_id_t id, const Error_code& err_code, util::String_view description);

  /**
   * Empties the queue, invoking, in queue order, each consumer not yet answered with its partial reply plus a
   * Channel_error with the given error.
   *
   * @param err_code
   *        Error to report.
   * @param description
   *        Elaboration for Channel_error::m_description.
   */
  void fail_all(const Error_code& err_code, util::String_view description);

  /**
   * Number of queued entries, answered or not.
   * @return See above.
   */
  size_t pending_count() const;

  /**
   * The `pipelining` from ctor.
   * @return See above.
   */
  bool pipelining() const;

private:
  // Types.

  /// One registered consumer and its reply so far.
  struct Pending_reply
  {
    /// See register_reply().
    reply_id_t m_id;

    /// See register_reply() `on_done`.  Moved-from once invoked.
    On_reply_func m_on_done;

    /// Messages of the reply so far.
    Reply m_reply;

    /// `true` once #m_on_done has been invoked (by fail_one()), though the entry is still queued.
    bool m_answered;
  }; // struct Pending_reply

  // Methods.

  /**
   * Creates the synthetic terminal message.
   *
   * @param err_code
   *        Error.
   * @param description
   *        Description.
   * @return See above.
   */
  static protocol::In_message make_channel_error(const Error_code& err_code, util::String_view description);

  /**
   * Invokes `on_done(reply)`; an exception it throws is logged and does not propagate, so the other pending
   * consumers (and the caller's thread) are unaffected.
   *
   * @param id
   *        ID of the reply, for logging (#S_NO_ID if never registered).
   * @param on_done
   *        Consumer.
   * @param reply
   *        Reply to deliver.
   */
  void deliver(reply_id_t id, On_reply_func& on_done, Reply&& reply);

  // Data.

  /// The `nickname` from ctor.
  const std::string m_nickname;

  /// See pipelining().
  const bool m_pipelining;

  /// ID of the next register_reply(); increments from `S_NO_ID + 1`.  Protected by #m_mutex.
  reply_id_t m_next_id;

  /// The queue; front is the reply currently arriving.  Protected by #m_mutex.
  std::deque<Pending_reply> m_pending_q;

  /// Protects #m_pending_q and #m_next_id.
  mutable flow::util::Mutex_non_recursive m_mutex;
}; // class Reply_correlator

} // namespace pgwire::stream
