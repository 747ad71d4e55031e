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
#include <flow/log/log.hpp>
#include <boost/asio.hpp>

/**
 * Flow-PG module containing miscellaneous general-use facilities that ubiquitously used by ~all Flow-PG
 * modules and/or do not fit into any other Flow-PG module.
 */
namespace pgwire::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 *
 * ### How to use ###
 * We provide this alias as a stylistic short-hand, as it better suits various interfaces especially in
 * pgwire::protocol.  To work with these (create them, access them, etc.), do use the highly convenient
 * boost.asio buffer APIs which are well documented in boost.asio's docs.
 */
using Blob_const = boost::asio::const_buffer;

/**
 * Short-hand for an mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
 * @see pgwire::util::Blob_const; usability notes in that doc header apply similarly here.
 */
using Blob_mutable = boost::asio::mutable_buffer;

/**
 * Short-hand for a contiguous, growable sequence of bytes to which encoders append and from which
 * the stream writes.  `std::string` is used for its small-buffer optimization and cheap moves.
 */
using Byte_buffer = std::string;

// Constants.

/// A (default-cted) string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

// Free functions.

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

} // namespace pgwire::util
