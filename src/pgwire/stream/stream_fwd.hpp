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
#include <vector>

/**
 * Flow-PG module providing a single-connection protocol stream to a PostgreSQL backend.  A synopsis follows:
 *
 * The main feature is Protocol_stream: it connects (resolving the host, optionally upgrading to TLS first),
 * performs the startup handshake, and then lets the user send requests whose replies are matched back to them
 * strictly in order.  A *reply* is the sequence of backend messages ending with a terminal one (see
 * protocol::is_reply_terminal()).  Server-pushed notifications are not part of any reply; they are fanned out to
 * the subscribers of their channel instead.
 *
 * The building blocks, usable and testable on their own, are: Reply_correlator (the ordered queue of pending reply
 * consumers), Notification_registry (channel-to-subscribers map), Tls_negotiator (the one-byte TLS request
 * sub-protocol), and make_tls_context() (the trust policy made concrete).
 *
 * Failures never vanish: every pending reply consumer receives exactly one terminal delivery, a real reply or
 * a reply ending in a protocol::Channel_error.
 */
namespace pgwire::stream
{

// Types.

// Find doc headers near the bodies of these compound types.

class Protocol_stream;
class Reply_correlator;
class Notification_registry;
class Tls_negotiator;
struct Stream_config;

enum class Tls_mode;
enum class Trust_policy;

/// The messages making up one reply, in arrival order; the last one is terminal.
using Reply = std::vector<protocol::In_message>;

/**
 * Reply consumer: invoked exactly once per accepted request (or connect) with the complete reply; or with the
 * partial reply plus a terminal protocol::Channel_error if the request failed first.  An exception it throws is
 * logged and otherwise ignored; it does not affect delivery to other consumers.
 */
using On_reply_func = Function<void (Reply&& reply)>;

/// Notification subscriber: invoked once per notification on its channel, with the payload.
using On_notification_func = Function<void (const std::string& payload)>;

// Free functions.

/**
 * Prints string representation of the given `Protocol_stream` to the given `ostream`.
 *
 * @relatesalso Protocol_stream
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Protocol_stream& val);

/**
 * Prints string representation of the given `Reply` (its messages, comma-separated) to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Reply& val);

} // namespace pgwire::stream
