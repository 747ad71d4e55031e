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
#include "pgwire/stream/tls_context.hpp"
#include "pgwire/stream/error.hpp"
#include <flow/error/error.hpp>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace pgwire::stream
{

namespace
{

/**
 * Returns the SHA-256 digest of the DER encoding of the given certificate; or empty string on failure.
 * @param cert
 *        Certificate.
 * @return See above.
 */
std::string certificate_digest(X509* cert)
{
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_sz = 0;
  if (!X509_digest(cert, EVP_sha256(), md, &md_sz))
  {
    return std::string();
  }
  // else
  return std::string(reinterpret_cast<const char*>(md), md_sz);
}

/**
 * Loads the first PEM certificate from the given file and returns its certificate_digest(); or empty string
 * if the file cannot be read or parsed.
 *
 * @param logger_ptr
 *        Logger.
 * @param path
 *        PEM file.
 * @return See above.
 */
std::string pinned_certificate_digest(flow::log::Logger* logger_ptr, const std::string& path)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_STREAM);

  const std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_file(path.c_str(), "r"), &BIO_free);
  if (!bio)
  {
    FLOW_LOG_WARNING("Could not open pinned certificate file [" << path << "].");
    return std::string();
  }
  // else
  const std::unique_ptr<X509, decltype(&X509_free)>
    cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
  if (!cert)
  {
    FLOW_LOG_WARNING("Pinned certificate file [" << path << "] does not contain a PEM certificate.");
    return std::string();
  }
  // else
  return certificate_digest(cert.get());
}

} // namespace (anon)

Tls_context_ptr make_tls_context(flow::log::Logger* logger_ptr, const Stream_config& config, Error_code* err_code)
{
  namespace ssl = boost::asio::ssl;
  namespace bind_ns = flow::util::bind_ns;
  using std::make_shared;
  using std::string;

  FLOW_ERROR_EXEC_FUNC_AND_THROW_ON_ERROR(Tls_context_ptr, make_tls_context, logger_ptr, bind_ns::cref(config), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_STREAM);

  auto ctx = make_shared<ssl::context>(ssl::context::tls_client);
  ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3
                   | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);

  switch (config.m_trust_policy)
  {
  case Trust_policy::S_SYSTEM_TRUST_STORE:
    ctx->set_default_verify_paths(*err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("TLS context for [" << config.m_host << "]: Could not load the system trust store: "
                       "[" << *err_code << "] [" << err_code->message() << "].");
      return Tls_context_ptr();
    }
    // else
    ctx->set_verify_mode(ssl::verify_peer);
    ctx->set_verify_callback(ssl::host_name_verification(config.m_host));
    break;

  case Trust_policy::S_CA_FILE:
    if (config.m_ca_file_path.empty())
    {
      FLOW_LOG_WARNING("TLS context for [" << config.m_host << "]: CA file trust policy chosen, but no CA file "
                       "given.");
      *err_code = error::Code::S_INVALID_ARGUMENT;
      return Tls_context_ptr();
    }
    // else
    ctx->load_verify_file(config.m_ca_file_path, *err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("TLS context for [" << config.m_host << "]: Could not load CA file "
                       "[" << config.m_ca_file_path << "]: [" << *err_code << "] [" << err_code->message() << "].");
      return Tls_context_ptr();
    }
    // else
    ctx->set_verify_mode(ssl::verify_peer);
    ctx->set_verify_callback(ssl::host_name_verification(config.m_host));
    break;

  case Trust_policy::S_PINNED_CERTIFICATE:
  {
    string pinned_digest = pinned_certificate_digest(logger_ptr, config.m_pinned_cert_path);
    if (pinned_digest.empty())
    {
      *err_code = error::Code::S_TLS_PINNED_CERTIFICATE_UNREADABLE;
      return Tls_context_ptr();
    }
    // else

    ctx->set_verify_mode(ssl::verify_peer);
    ctx->set_verify_callback([logger_ptr, host = config.m_host, pinned_digest = std::move(pinned_digest)]
                               (bool, ssl::verify_context& verify_ctx) -> bool
    {
      FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_STREAM);

      const auto store_ctx = verify_ctx.native_handle();
      if (X509_STORE_CTX_get_error_depth(store_ctx) != 0)
      {
        return true; // Only the leaf is pinned; the rest of the chain is irrelevant.
      }
      // else
      if (certificate_digest(X509_STORE_CTX_get_current_cert(store_ctx)) != pinned_digest)
      {
        FLOW_LOG_WARNING("TLS handshake with [" << host << "]: Peer certificate does not match the pinned "
                         "certificate.  Rejecting.");
        X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_CERT_REJECTED);
        return false;
      }
      // else
      FLOW_LOG_INFO("TLS handshake with [" << host << "]: Peer certificate matches the pinned certificate.");
      X509_STORE_CTX_set_error(store_ctx, X509_V_OK);
      return true;
    });
    break;
  }

  case Trust_policy::S_INSECURE_TRUST_ALL:
    FLOW_LOG_WARNING("TLS context for [" << config.m_host << "]: Trust-all policy chosen explicitly: the "
                     "connection will be encrypted, but the backend will not be authenticated.");
    ctx->set_verify_mode(ssl::verify_none);
    break;

  case Trust_policy::S_UNSPECIFIED:
    FLOW_LOG_WARNING("TLS context for [" << config.m_host << "]: TLS is required, but no trust policy was "
                     "chosen.  Refusing to guess.");
    *err_code = error::Code::S_TLS_TRUST_POLICY_UNSPECIFIED;
    return Tls_context_ptr();

  case Trust_policy::S_END_SENTINEL:
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return Tls_context_ptr();
  } // switch (config.m_trust_policy)

  FLOW_LOG_INFO("TLS context for [" << config.m_host << "]: Ready with trust policy "
                "[" << config.m_trust_policy << "].");
  err_code->clear();
  return ctx;
} // make_tls_context()

bool pinned_certificate_rejected(SSL* native_ssl)
{
  return SSL_get_verify_result(native_ssl) == X509_V_ERR_CERT_REJECTED;
}

} // namespace pgwire::stream
