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
#include "pgwire/stream/tls_negotiator.hpp"
#include "pgwire/stream/error.hpp"
#include "pgwire/protocol/message_codec.hpp"
#include <flow/error/error.hpp>

namespace pgwire::stream
{

Tls_negotiator::Tls_negotiator(flow::log::Logger* logger_ptr, util::String_view nickname) :
  flow::log::Log_context(logger_ptr, Log_component::S_STREAM),
  m_nickname(nickname),
  m_request_sent(false),
  m_outcome(Outcome::S_UNKNOWN)
{
  FLOW_LOG_TRACE("Tls_negotiator [" << m_nickname << "]: Created.");
}

Tls_negotiator::Outcome Tls_negotiator::outcome() const
{
  return m_outcome;
}

util::Byte_buffer Tls_negotiator::request_for_sending()
{
  util::Byte_buffer request;
  if (m_request_sent)
  {
    return request;
  }
  // else
  protocol::encode(protocol::Tls_request(), &request);
  FLOW_LOG_INFO("Tls_negotiator [" << m_nickname << "]: About to send TLS request "
                "([" << request.size() << "] bytes) for the first and only time.");
  m_request_sent = true;
  return request;
}

bool Tls_negotiator::compute_outcome(util::Blob_const response, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Tls_negotiator::compute_outcome, response, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_outcome != Outcome::S_UNKNOWN)
  {
    FLOW_LOG_TRACE("Tls_negotiator [" << m_nickname << "]: We were asked to compute the outcome based on "
                   "[" << response.size() << "] more response bytes; but we have already done so "
                   "in the past (result: [" << m_outcome << "]); no-op.");
    return false;
  }
  // else
  if (response.size() == 0)
  {
    FLOW_LOG_TRACE("Tls_negotiator [" << m_nickname << "]: Empty read; awaiting the response byte.");
    return false;
  }
  // else

  const char response_byte = char(util::blob_data(response)[0]);
  if (response_byte == S_ACCEPTED_RESPONSE)
  {
    FLOW_LOG_INFO("Tls_negotiator [" << m_nickname << "]: Backend accepted TLS request.  The TLS handshake "
                  "shall follow.");
    m_outcome = Outcome::S_ACCEPTED;
    err_code->clear();
  }
  else
  {
    FLOW_LOG_WARNING("Tls_negotiator [" << m_nickname << "]: Backend answered TLS request with "
                     "[" << int(response_byte) << "] instead of accepting it.  TLS is required; "
                     "presumably we will abruptly close this connection shortly.");
    m_outcome = Outcome::S_REFUSED;
    *err_code = error::Code::S_SECURITY_NOT_SUPPORTED_BY_BACKEND;
  }

  return true;
} // Tls_negotiator::compute_outcome()

std::ostream& operator<<(std::ostream& os, Tls_negotiator::Outcome val)
{
  using Outcome = Tls_negotiator::Outcome;

  switch (val)
  {
  case Outcome::S_UNKNOWN: return os << "UNKNOWN";
  case Outcome::S_ACCEPTED: return os << "ACCEPTED";
  case Outcome::S_REFUSED: return os << "REFUSED";
  }
  assert(false);
  return os;
}

} // namespace pgwire::stream
