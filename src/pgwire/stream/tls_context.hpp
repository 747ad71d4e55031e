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
#include <flow/log/log.hpp>
#include <boost/asio/ssl.hpp>

namespace pgwire::stream
{

// Types.

/// Short-hand for boost.asio's OpenSSL-backed TLS context; shared by the context factory and the stream using it.
using Tls_context_ptr = std::shared_ptr<boost::asio::ssl::context>;

// Free functions.

/**
 * Builds the client TLS context implementing `config.m_trust_policy` for a connection to `config.m_host`.
 * Protocol versions below TLS 1.2 are disabled.  Per Trust_policy:
 *   - S_SYSTEM_TRUST_STORE: default verify paths; peer and host name verified.
 *   - S_CA_FILE: `config.m_ca_file_path` loaded as the trust anchors; peer and host name verified.
 *   - S_PINNED_CERTIFICATE: `config.m_pinned_cert_path` loaded; the peer's leaf certificate is accepted if and only
 *     if its SHA-256 digest equals that of the pinned one; otherwise it is rejected with
 *     `X509_V_ERR_CERT_REJECTED` (see pinned_certificate_rejected()).
 *   - S_INSECURE_TRUST_ALL: no verification (a WARNING is logged).
 *   - S_UNSPECIFIED: error.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently (including from the verify callback).
 * @param config
 *        The stream config; TLS mode is not checked.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_TLS_TRUST_POLICY_UNSPECIFIED, error::Code::S_INVALID_ARGUMENT (CA file path empty),
 *        error::Code::S_TLS_PINNED_CERTIFICATE_UNREADABLE, and boost.asio ssl errors from loading the CA file or
 *        the default verify paths.
 * @return The context; null if and only if an error is emitted.
 */
Tls_context_ptr make_tls_context(flow::log::Logger* logger_ptr, const Stream_config& config,
                                 Error_code* err_code = 0);

/**
 * Returns `true` if the given finished-or-failed TLS connection's certificate verification failed because of
 * the pinned certificate check of a context from make_tls_context().
 *
 * @param native_ssl
 *        OpenSSL connection handle, as from `ssl::stream::native_handle()`.
 * @return See above.
 */
bool pinned_certificate_rejected(SSL* native_ssl);

} // namespace pgwire::stream
