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
#include "pgwire/test/test_backend.hpp"
#include <boost/endian/conversion.hpp>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <memory>
#include <stdexcept>

namespace pgwire::test
{

namespace
{

/// Appends a big-endian 32-bit integer.  @param val Value.  @param out Target.
void append_int32(int32_t val, util::Byte_buffer* out)
{
  unsigned char bytes[4];
  boost::endian::store_big_s32(bytes, val);
  out->append(reinterpret_cast<const char*>(bytes), sizeof bytes);
}

/// Throws unless `ok`.  @param ok Result of an OpenSSL call.  @param what Its name.
void check_openssl(bool ok, const char* what)
{
  if (!ok)
  {
    throw std::runtime_error(std::string("OpenSSL call failed: ") + what);
  }
}

/// Contents of a memory BIO.  @param bio The BIO.  @return See above.
std::string bio_contents(BIO* bio)
{
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio, &data);
  return std::string(data, size_t(len));
}

} // namespace (anon)

// Static initializations.

const std::chrono::seconds Test_backend::S_TIMEOUT(10);

// Implementations.

Test_backend::Test_backend(flow::log::Logger* logger_ptr, Tls_answer tls_answer) :
  flow::log::Log_context(logger_ptr, Log_component::S_TEST),
  m_acceptor(m_io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
  m_socket(m_io),
  m_tls_answer(tls_answer),
  m_tls_ctx(boost::asio::ssl::context::tls_server),
  m_tls_requested(false),
  m_tls_established(false)
{
  make_certificate();
  FLOW_LOG_INFO("Test_backend: Listening on port [" << port() << "].");
}

uint16_t Test_backend::port() const
{
  return m_acceptor.local_endpoint().port();
}

const std::string& Test_backend::cert_pem() const
{
  return m_cert_pem;
}

bool Test_backend::tls_requested() const
{
  return m_tls_requested;
}

bool Test_backend::tls_established() const
{
  return m_tls_established;
}

const std::vector<protocol::Startup_message::Parameter>& Test_backend::startup_parameters() const
{
  return m_startup_params;
}

bool Test_backend::accept()
{
  bool done = false;
  Error_code result;
  m_acceptor.async_accept(m_socket, [&](const Error_code& err_code)
  {
    result = err_code;
    done = true;
  });
  return await(&done) && (!result);
}

bool Test_backend::read_opening()
{
  using protocol::Startup_message;
  using protocol::Tls_request;

  while (true)
  {
    unsigned char len_bytes[4];
    if (read_exactly(boost::asio::buffer(len_bytes)))
    {
      return false;
    }
    const int32_t len = boost::endian::load_big_s32(len_bytes);
    if (len < 8)
    {
      FLOW_LOG_WARNING("Test_backend: Opening message length [" << len << "] invalid.");
      return false;
    }
    std::string body(size_t(len) - 4, '\0');
    if (read_exactly(boost::asio::buffer(body)))
    {
      return false;
    }
    const int32_t code = boost::endian::load_big_s32(reinterpret_cast<const unsigned char*>(body.data()));

    if (code == Tls_request::S_REQUEST_CODE)
    {
      m_tls_requested = true;
      const bool accept_tls = m_tls_answer == Tls_answer::S_ACCEPT;
      if (!write(accept_tls ? "S" : "N"))
      {
        return false;
      }
      if (!accept_tls)
      {
        continue; // A client may go on in plaintext; ours should hang up instead.
      }
      // else

      m_tls_stream.emplace(std::move(m_socket), m_tls_ctx);
      bool done = false;
      Error_code result;
      m_tls_stream->async_handshake(boost::asio::ssl::stream_base::server, [&](const Error_code& err_code)
      {
        result = err_code;
        done = true;
      });
      if ((!await(&done)) || result)
      {
        FLOW_LOG_INFO("Test_backend: TLS handshake failed: [" << result << "] [" << result.message() << "].");
        return false;
      }
      // else
      m_tls_established = true;
      continue;
    }
    // else

    if (code != Startup_message::S_PROTOCOL_VERSION)
    {
      FLOW_LOG_WARNING("Test_backend: Unexpected opening code [" << code << "].");
      return false;
    }
    // else

    // Then: (name NUL value NUL)* NUL.
    size_t pos = 4;
    while ((pos < body.size()) && (body[pos] != '\0'))
    {
      const size_t name_end = body.find('\0', pos);
      const size_t value_end = (name_end == std::string::npos) ? name_end : body.find('\0', name_end + 1);
      if (value_end == std::string::npos)
      {
        return false;
      }
      m_startup_params.emplace_back(body.substr(pos, name_end - pos),
                                    body.substr(name_end + 1, value_end - name_end - 1));
      pos = value_end + 1;
    }
    return true;
  } // while (true)
} // Test_backend::read_opening()

bool Test_backend::read_frame(char* type, std::string* body)
{
  unsigned char hdr[5];
  if (read_exactly(boost::asio::buffer(hdr)))
  {
    return false;
  }
  *type = char(hdr[0]);
  const int32_t len = boost::endian::load_big_s32(hdr + 1);
  if (len < 4)
  {
    return false;
  }
  body->assign(size_t(len) - 4, '\0');
  return !read_exactly(boost::asio::buffer(*body));
}

bool Test_backend::await_client_close()
{
  char byte;
  const auto err_code = read_exactly(boost::asio::buffer(&byte, 1));
  return (err_code == boost::asio::error::eof)
         || (err_code == boost::asio::error::connection_reset)
         || (err_code == boost::asio::ssl::error::stream_truncated);
}

bool Test_backend::write(util::String_view bytes)
{
  bool done = false;
  Error_code result;
  with_stream([&](auto& stream)
  {
    boost::asio::async_write(stream, boost::asio::buffer(bytes.data(), bytes.size()),
                             [&](const Error_code& err_code, size_t)
    {
      result = err_code;
      done = true;
    });
  });
  return await(&done) && (!result);
}

void Test_backend::close_client()
{
  auto& socket = m_tls_stream ? m_tls_stream->next_layer() : m_socket;
  Error_code err_code;
  socket.close(err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Test_backend: Close failed: [" << err_code << "] [" << err_code.message() << "].");
  }
}

void Test_backend::reset_client()
{
  auto& socket = m_tls_stream ? m_tls_stream->next_layer() : m_socket;
  Error_code err_code;
  socket.set_option(boost::asio::socket_base::linger(true, 0), err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Test_backend: Setting zero linger failed: [" << err_code << "] [" << err_code.message() << "].");
  }
  close_client();
}

Error_code Test_backend::read_exactly(util::Blob_mutable buf)
{
  bool done = false;
  Error_code result;
  with_stream([&](auto& stream)
  {
    boost::asio::async_read(stream, buf, [&](const Error_code& err_code, size_t)
    {
      result = err_code;
      done = true;
    });
  });
  if (!await(&done))
  {
    return boost::asio::error::timed_out;
  }
  return result;
}

bool Test_backend::await(const bool* done)
{
  m_io.restart();
  const auto deadline = std::chrono::steady_clock::now() + S_TIMEOUT;
  while ((!*done) && (m_io.run_one_until(deadline) != 0))
  {
    // Keep going.
  }
  if (*done)
  {
    return true;
  }
  // else

  FLOW_LOG_WARNING("Test_backend: Timed out; closing.");
  Error_code err_code;
  m_acceptor.cancel(err_code);
  close_client();
  m_io.restart();
  m_io.run(); // The op's handler runs, aborted; nothing may refer to the caller's locals after we return.
  return false;
}

template<typename Func>
void Test_backend::with_stream(const Func& func)
{
  if (m_tls_stream)
  {
    func(*m_tls_stream);
  }
  else
  {
    func(m_socket);
  }
}

void Test_backend::make_certificate()
{
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(EVP_RSA_gen(2048), &EVP_PKEY_free);
  check_openssl(bool(pkey), "EVP_RSA_gen");
  std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
  check_openssl(bool(cert), "X509_new");

  check_openssl(X509_set_version(cert.get(), 2) == 1, "X509_set_version");
  check_openssl(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1) == 1, "ASN1_INTEGER_set");
  check_openssl(X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600), "X509_gmtime_adj");
  check_openssl(X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 3600), "X509_gmtime_adj");
  check_openssl(X509_set_pubkey(cert.get(), pkey.get()) == 1, "X509_set_pubkey");
  X509_NAME* const name = X509_get_subject_name(cert.get());
  check_openssl(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                           reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0) == 1,
                "X509_NAME_add_entry_by_txt");
  check_openssl(X509_set_issuer_name(cert.get(), name) == 1, "X509_set_issuer_name");
  check_openssl(X509_sign(cert.get(), pkey.get(), EVP_sha256()) != 0, "X509_sign");

  std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), &BIO_free);
  check_openssl(PEM_write_bio_X509(cert_bio.get(), cert.get()) == 1, "PEM_write_bio_X509");
  m_cert_pem = bio_contents(cert_bio.get());

  std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), &BIO_free);
  check_openssl(PEM_write_bio_PrivateKey(key_bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1,
                "PEM_write_bio_PrivateKey");
  const auto key_pem = bio_contents(key_bio.get());

  m_tls_ctx.use_certificate(boost::asio::buffer(m_cert_pem), boost::asio::ssl::context::pem);
  m_tls_ctx.use_private_key(boost::asio::buffer(key_pem), boost::asio::ssl::context::pem);
} // Test_backend::make_certificate()

// Frame builders.

util::Byte_buffer Test_backend::frame(char type, util::String_view body) // Static.
{
  util::Byte_buffer out;
  out.push_back(type);
  append_int32(int32_t(body.size() + 4), &out);
  out.append(body.data(), body.size());
  return out;
}

util::Byte_buffer Test_backend::ready_for_query() // Static.
{
  return frame('Z', "I");
}

util::Byte_buffer Test_backend::authentication(protocol::Authentication::Request request) // Static.
{
  util::Byte_buffer body;
  append_int32(int32_t(request), &body);
  return frame('R', body);
}

util::Byte_buffer Test_backend::command_complete(util::String_view tag) // Static.
{
  util::Byte_buffer body(tag.data(), tag.size());
  body.push_back('\0');
  return frame('C', body);
}

util::Byte_buffer Test_backend::error_response(util::String_view sqlstate, util::String_view message) // Static.
{
  util::Byte_buffer body;
  body.append("SERROR");
  body.push_back('\0');
  body.push_back('C');
  body.append(sqlstate.data(), sqlstate.size());
  body.push_back('\0');
  body.push_back('M');
  body.append(message.data(), message.size());
  body.push_back('\0');
  body.push_back('\0');
  return frame('E', body);
}

util::Byte_buffer Test_backend::notification(util::String_view channel, util::String_view payload) // Static.
{
  util::Byte_buffer body;
  append_int32(42, &body);
  body.append(channel.data(), channel.size());
  body.push_back('\0');
  body.append(payload.data(), payload.size());
  body.push_back('\0');
  return frame('A', body);
}

} // namespace pgwire::test
