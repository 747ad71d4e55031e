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
#include "pgwire/stream/config.hpp"
#include <flow/util/util.hpp>

namespace pgwire::stream
{

std::ostream& operator<<(std::ostream& os, Tls_mode val)
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (val)
  {
  case Tls_mode::S_DISABLED: return os << "DISABLED";
  case Tls_mode::S_REQUIRED: return os << "REQUIRED";
  case Tls_mode::S_END_SENTINEL: return os << "END_SENTINEL";
  }
  assert(false);
  return os;
}

std::istream& operator>>(std::istream& is, Tls_mode& val)
{
  // Range [DISABLED, END_SENTINEL); no match => END_SENTINEL; allow for number; case-insensitive.
  val = flow::util::istream_to_enum(&is, Tls_mode::S_END_SENTINEL, Tls_mode::S_END_SENTINEL, true, false,
                                    Tls_mode::S_DISABLED);
  return is;
}

std::ostream& operator<<(std::ostream& os, Trust_policy val)
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (val)
  {
  case Trust_policy::S_UNSPECIFIED: return os << "UNSPECIFIED";
  case Trust_policy::S_SYSTEM_TRUST_STORE: return os << "SYSTEM_TRUST_STORE";
  case Trust_policy::S_CA_FILE: return os << "CA_FILE";
  case Trust_policy::S_PINNED_CERTIFICATE: return os << "PINNED_CERTIFICATE";
  case Trust_policy::S_INSECURE_TRUST_ALL: return os << "INSECURE_TRUST_ALL";
  case Trust_policy::S_END_SENTINEL: return os << "END_SENTINEL";
  }
  assert(false);
  return os;
}

std::istream& operator>>(std::istream& is, Trust_policy& val)
{
  val = flow::util::istream_to_enum(&is, Trust_policy::S_END_SENTINEL, Trust_policy::S_END_SENTINEL, true, false,
                                    Trust_policy::S_UNSPECIFIED);
  return is;
}

std::ostream& operator<<(std::ostream& os, const Stream_config& val)
{
  os << "host[" << val.m_host << "] port[" << val.m_port << "] pipelining[" << val.m_pipelining << "] "
        "tls_mode[" << val.m_tls_mode << ']';
  if (val.m_tls_mode != Tls_mode::S_DISABLED)
  {
    os << " trust_policy[" << val.m_trust_policy << ']';
    if (val.m_trust_policy == Trust_policy::S_CA_FILE)
    {
      os << " ca_file[" << val.m_ca_file_path << ']';
    }
    else if (val.m_trust_policy == Trust_policy::S_PINNED_CERTIFICATE)
    {
      os << " pinned_cert[" << val.m_pinned_cert_path << ']';
    }
  }
  return os << " max_frame_sz[" << val.m_max_frame_sz << ']';
}

} // namespace pgwire::stream
