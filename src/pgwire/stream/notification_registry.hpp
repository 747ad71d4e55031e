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
#include <flow/util/util.hpp>
#include <boost/uuid/random_generator.hpp>
#include <unordered_map>
#include <map>

namespace pgwire::stream
{

// Types.

/**
 * Thread-safe map from notification channel name to its subscribers, each identified by a random UUID token
 * returned at subscription.  dispatch() fans a payload out to every current subscriber of a channel.
 *
 * A channel's entry is created on first subscription and never pruned, even once its last subscriber is gone.
 * The registry is only a local fan-out: it sends nothing to the backend (the user still issues `LISTEN`).
 *
 * ### Thread safety ###
 * All methods may be called concurrently, including from within a subscriber.  Subscribers are invoked with no lock
 * held, from the thread calling dispatch() (in Protocol_stream, thread W).  A subscriber removed concurrently with
 * a dispatch() may still receive that one payload.
 */
class Notification_registry :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs an empty registry.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        String to use subsequently in logging to identify `*this`.
   */
  explicit Notification_registry(flow::log::Logger* logger_ptr, util::String_view nickname);

  // Methods.

  /**
   * Adds a subscriber to the given channel, creating the channel's entry if needed.
   *
   * @param channel
   *        Channel name.
   * @param on_notification
   *        Subscriber.
   * @return Token identifying the subscription, unique over the lifetime of `*this`.
   */
  std::string subscribe(util::String_view channel, On_notification_func&& on_notification);

  /**
   * Removes the given subscriber.
   *
   * @param channel
   *        Channel name as given to subscribe().
   * @param token
   *        Token returned by subscribe().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NO_SUCH_SUBSCRIBER (no such channel, or no such token on it).
   */
  void unsubscribe(util::String_view channel, util::String_view token, Error_code* err_code = 0);

  /**
   * Invokes every current subscriber of the given channel with the given payload.  No subscribers: no-op.
   * A subscriber throwing a `std::exception` is logged; the others still get the payload.
   *
   * @param channel
   *        Channel name.
   * @param payload
   *        Payload.
   */
  void dispatch(util::String_view channel, const std::string& payload);

  /**
   * Number of subscribers of the given channel.
   *
   * @param channel
   *        Channel name.
   * @return See above.
   */
  size_t subscriber_count(util::String_view channel) const;

private:
  // Types.

  /// Token to subscriber.  Shared so that dispatch() can invoke subscribers outside the lock.
  using Subscriber_map = std::map<std::string, std::shared_ptr<On_notification_func>>;

  // Data.

  /// The `nickname` from ctor.
  const std::string m_nickname;

  /// Channel name to its subscribers.  Protected by #m_mutex.
  std::unordered_map<std::string, Subscriber_map> m_channels;

  /// Token generator.  Protected by #m_mutex.
  boost::uuids::random_generator m_token_generator;

  /// Protects #m_channels and #m_token_generator.
  mutable flow::util::Mutex_non_recursive m_mutex;
}; // class Notification_registry

} // namespace pgwire::stream
