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

/* flow/common.hpp defines (and does not #undef) FLOW_LOG_CFG_COMPONENT_ENUM_*; so it must come before our own
 * log-component macro magic in pgwire/detail/common.hpp. */
#include <flow/util/util.hpp>

#include "pgwire/detail/common.hpp"

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any pgwire/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-PG project: a non-blocking client-side protocol stream speaking the
 * PostgreSQL v3 frontend/backend wire protocol over TCP, optionally upgraded to TLS.
 *
 * Modules overview
 * ----------------
 *   - *pgwire::protocol*: The framing layer.  It knows how a byte stream is split into length-prefixed
 *     messages, and how the (small) catalog of messages the stream cares about is encoded and decoded.  It knows
 *     nothing about connections, threads, or callbacks.
 *     - Dependents: pgwire::stream.
 *   - *pgwire::stream*: The protocol stream manager.  pgwire::stream::Protocol_stream is the point of the whole
 *     thing: connection bring-up (including TLS negotiation), the startup handshake, request/reply correlation
 *     (pipelined or not), and publish/subscribe of server-pushed notifications.  Its building blocks
 *     (Reply_correlator, Notification_registry, Tls_negotiator) are public as well, as they are usable and
 *     testable in isolation.
 *   - *pgwire::util*: Miscellaneous items.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-PG requires Flow and Boost (and OpenSSL via boost.asio), not only for internal implementation purposes but
 * also in its APIs.  `flow::log` is the assumed logging system; `flow::Error_code` and related conventions are
 * used for error reporting; boost.asio is the I/O engine.
 *
 * ### Error reporting ###
 * Inherited from Flow.  See the `namespace flow` doc header's "Error reporting" section.  In short: a method that
 * can fail synchronously takes `Error_code* err_code = 0` last; if null, a `flow::error::Runtime_error` is thrown
 * on error; else `*err_code` is set (falsy on success).  Asynchronous results arrive through completion handlers.
 *
 * ### Logging ###
 * We use the Flow log module, `flow::log`.  The user supplies a `flow::log::Logger*` to the various constructors
 * (null = log nowhere).  Log components are pgwire::Log_component.
 */
namespace pgwire
{

// Types.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef PGWIRE_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-PG internal
 * logging.  The actual members are generated via `flow::log` macro magic; find them in
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in pgwire::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_PGWIRE_LOG_COMPONENT_NAME_MAP;

#endif // PGWIRE_DOXYGEN_ONLY

} // namespace pgwire
