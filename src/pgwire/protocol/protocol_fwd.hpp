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

#include "pgwire/common.hpp"
#include <variant>

/**
 * Flow-PG module containing the framing and message catalog of the PostgreSQL v3 frontend/backend wire protocol:
 * the value types for backend (incoming) and frontend (outgoing) messages, the length-field frame decoder, and
 * the encoder.  It knows nothing of connections, threads or correlation; that is the business of pgwire::stream.
 *
 * Every frame, in either direction, except two, is `[type:1][length:4][body]`, where `length` is a big-endian
 * 32-bit signed integer that counts itself and the body but not the type byte.  The 2 exceptions, both
 * frontend-to-backend, are the startup message and the TLS request: `[length:4][body]` without a type byte.
 */
namespace pgwire::protocol
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Ready_for_query;
struct Field_map_message;
struct Error_response;
struct Notice_response;
struct Authentication;
struct Notification_response;
struct Parameter_status;
struct Backend_key_data;
struct Opaque_message;
struct Channel_error;

struct Startup_message;
struct Tls_request;
struct Query;
struct Password_message;
struct Sync;
struct Terminate;
struct Raw_message;

class Frame_decoder;

/**
 * A message received from the backend, or a synthetic Channel_error standing in for the transport failure
 * that ended the reply.  Exactly one alternative is held.
 */
using In_message = std::variant<Ready_for_query, Error_response, Notice_response, Authentication,
                                Notification_response, Parameter_status, Backend_key_data, Opaque_message,
                                Channel_error>;

/// A message the frontend sends to the backend.
using Out_message = std::variant<Startup_message, Tls_request, Query, Password_message, Sync, Terminate,
                                 Raw_message>;

// Free functions.

/**
 * Prints string representation of the given `In_message` to the given `ostream`.  Bodies of unknown types
 * and payloads are abbreviated.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const In_message& val);

/**
 * Prints string representation of the given `Out_message` to the given `ostream`.  Password contents are not printed.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Out_message& val);

} // namespace pgwire::protocol
