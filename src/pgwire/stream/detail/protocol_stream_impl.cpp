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
#include "pgwire/stream/detail/protocol_stream_impl.hpp"
#include "pgwire/stream/error.hpp"
#include <flow/error/error.hpp>
#include <flow/async/util.hpp>
#include <boost/move/make_unique.hpp>
#include <openssl/ssl.h>

namespace pgwire::stream
{

// Implementations.

// General.

Protocol_stream::Impl::Impl(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                            const Stream_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_STREAM),
  m_nickname(nickname_str),
  m_config(config),
  m_worker(boost::movelib::make_unique<flow::async::Single_thread_task_loop>
             (get_logger(),
              // (Linux) OS thread name will truncate to 15 chars; the start of the nickname is the useful part.
              flow::util::ostream_op_string("PgS-", m_nickname))),
  m_correlator(get_logger(), m_nickname, m_config.m_pipelining),
  m_registry(get_logger(), m_nickname),
  m_connect_requested(false),
  m_connected(false),
  m_state(State::S_NULL),
  m_resolver(*(m_worker->task_engine())),
  m_socket(*(m_worker->task_engine())),
  m_tls_negotiator(get_logger(), m_nickname),
  m_tls_response_byte(0),
  m_writing(false),
  m_decoder(get_logger(), m_nickname, m_config.m_max_frame_sz)
{
  using flow::async::reset_this_thread_pinning;

  m_worker->start(reset_this_thread_pinning); // Don't inherit any strange core-affinity!  Worker must float free.

  FLOW_LOG_INFO("Protocol_stream [" << *this << "]: Created (NULL state); config: [" << m_config << "].");
}

Protocol_stream::Impl::~Impl()
{
  using flow::async::Single_thread_task_loop;
  using flow::async::reset_thread_pinning;
  using flow::util::ostream_op_string;

  // We are in thread U.  By contract in doc header, they must not call us from a consumer (thread W).

  FLOW_LOG_INFO("Protocol_stream [" << *this << "]: Shutting down.  All our internal async handlers will be "
                "canceled; and worker thread will be joined.");

  /* This stop()s the Task_engine (any handler running now is the last one to run), hence thread W exits; and joins
   * thread W.  It's non-blocking. */
  m_worker->stop();
  // Thread W is (synchronously!) no more.

  /* We promised to invoke pending consumers with OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER from some thread that is
   * not thread U; and W is finished.  So do it from a transient thread.  Before that, run any post()ed tasks
   * that had not yet run (e.g., a write post()ed by send()): as-if they had run just before the dtor was called.
   * Task_engine::restart() undoes the stop(), so that poll() can synchronously execute them. */

  FLOW_LOG_INFO("Protocol_stream [" << *this << "]: Continuing shutdown.  Next we will run pending handlers from "
                "some other thread.  In this user thread we will await those handlers' completion and then return.");

  Single_thread_task_loop one_thread(get_logger(), ostream_op_string("PgSDeinit-", m_nickname));
  one_thread.start([&]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity.  Float free.

    const auto task_engine = m_worker->task_engine();
    task_engine->restart();
    const auto count = task_engine->poll();
    if (count != 0)
    {
      FLOW_LOG_INFO("Protocol_stream [" << *this << "]: "
                    "In transient finisher thread: Ran [" << count << "] internal handlers after all.");
    }
    task_engine->stop();

    // Thread W's state is ours now.

    m_connected = false;
    m_state = State::S_CLOSED;
    m_resolver.cancel();
    close_transport();

    const Error_code err_code = error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER;
    fail_connect_consumer(err_code, "Stream destroyed");
    m_correlator.fail_all(err_code, "Stream destroyed");

    FLOW_LOG_INFO("Transient finisher exiting.");
  }); // one_thread.start()
  // Here thread exits/joins synchronously.
} // Protocol_stream::Impl::~Impl()

const std::string& Protocol_stream::Impl::nickname() const
{
  return m_nickname;
}

const Stream_config& Protocol_stream::Impl::config() const
{
  return m_config;
}

bool Protocol_stream::Impl::is_connected() const
{
  return m_connected;
}

std::string Protocol_stream::Impl::subscribe(util::String_view channel, On_notification_func&& on_notification)
{
  return m_registry.subscribe(channel, std::move(on_notification));
}

void Protocol_stream::Impl::unsubscribe(util::String_view channel, util::String_view token, Error_code* err_code)
{
  m_registry.unsubscribe(channel, token, err_code);
}

// Connect-ops.

bool Protocol_stream::Impl::connect(const protocol::Startup_message& startup, On_reply_func&& on_done)
{
  if (m_connect_requested.exchange(true))
  {
    FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: connect() called, but it was already called before.  "
                     "Ignoring.");
    return false;
  }
  // else

  FLOW_LOG_INFO("Protocol_stream [" << *this << "]: Connect requested to "
                "[" << m_config.m_host << ':' << m_config.m_port << "].");

  m_worker->post([this, startup, on_done = std::move(on_done)]() mutable
  {
    // We are in thread W.
    m_connect_on_done = std::move(on_done);
    start_connect(startup);
  });
  return true;
} // Protocol_stream::Impl::connect()

void Protocol_stream::Impl::start_connect(const protocol::Startup_message& startup)
{
  using boost::asio::ip::tcp;
  using std::to_string;

  if (m_state != State::S_NULL)
  {
    // close() got here first.
    connect_failed(error::Code::S_CHANNEL_INACTIVE, "Stream closed before connecting");
    return;
  }
  // else

  m_startup = startup;
  m_state = State::S_CONNECTING;

  if (m_config.m_tls_mode == Tls_mode::S_REQUIRED)
  {
    Error_code err_code;
    m_tls_ctx = make_tls_context(get_logger(), m_config, &err_code);
    if (err_code)
    {
      connect_failed(err_code, "TLS context setup failed");
      return;
    }
  }
  else if (m_config.m_tls_mode != Tls_mode::S_DISABLED)
  {
    connect_failed(error::Code::S_INVALID_ARGUMENT, "Invalid TLS mode");
    return;
  }
  // else

  FLOW_LOG_TRACE("Protocol_stream [" << *this << "]: Resolving [" << m_config.m_host << "].");
  m_resolver.async_resolve(m_config.m_host, to_string(m_config.m_port),
                           [this](const Error_code& err_code, const tcp::resolver::results_type& results)
  {
    // We are in thread W.

    if (m_state != State::S_CONNECTING)
    {
      return; // close() got here first and has informed the consumer.
    }
    // else
    if (err_code)
    {
      connect_failed(err_code, "Host name resolution failed");
      return;
    }
    // else
    on_resolved(results);
  });
} // Protocol_stream::Impl::start_connect()

void Protocol_stream::Impl::on_resolved(const boost::asio::ip::tcp::resolver::results_type& results)
{
  using boost::asio::ip::tcp;

  FLOW_LOG_TRACE("Protocol_stream [" << *this << "]: Resolved [" << m_config.m_host << "] to "
                 "[" << results.size() << "] endpoints; connecting.");

  boost::asio::async_connect(m_socket, results, [this](const Error_code& err_code, const tcp::endpoint& endpoint)
  {
    if (m_state != State::S_CONNECTING)
    {
      return;
    }
    // else
    if (err_code)
    {
      connect_failed(err_code, "TCP connect failed");
      return;
    }
    // else

    FLOW_LOG_INFO("Protocol_stream [" << *this << "]: TCP connected to [" << endpoint << "].");
    on_tcp_connected();
  });
}

void Protocol_stream::Impl::on_tcp_connected()
{
  using boost::asio::ip::tcp;

  Error_code err_code;
  m_socket.set_option(tcp::no_delay(true), err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: Could not disable Nagle's algorithm: "
                     "[" << err_code << "] [" << err_code.message() << "].  Continuing.");
  }

  if (!m_tls_ctx)
  {
    start_handshake();
    return;
  }
  // else

  m_state = State::S_TLS_PENDING;
  m_tls_request = m_tls_negotiator.request_for_sending();
  boost::asio::async_write(m_socket, boost::asio::buffer(m_tls_request),
                           [this](const Error_code& err_code, size_t)
  {
    if (m_state != State::S_TLS_PENDING)
    {
      return;
    }
    // else
    if (err_code)
    {
      connect_failed(err_code, "TLS request write failed");
      return;
    }
    // else
    read_tls_response();
  });
} // Protocol_stream::Impl::on_tcp_connected()

void Protocol_stream::Impl::read_tls_response()
{
  // Exactly 1 byte: anything after it belongs to the TLS handshake.
  m_socket.async_read_some(boost::asio::buffer(&m_tls_response_byte, 1),
                           [this](const Error_code& err_code, size_t n_read)
  {
    if (m_state != State::S_TLS_PENDING)
    {
      return;
    }
    // else
    if (err_code)
    {
      connect_failed(err_code, "TLS response read failed");
      return;
    }
    // else
    on_tls_response(n_read);
  });
}

void Protocol_stream::Impl::on_tls_response(size_t n_read)
{
  Error_code err_code;
  if (!m_tls_negotiator.compute_outcome(util::Blob_const(&m_tls_response_byte, n_read), &err_code))
  {
    read_tls_response(); // Nothing read yet.
    return;
  }
  // else
  if (err_code)
  {
    connect_failed(err_code, "SSL required but not supported by backend server");
    return;
  }
  // else
  start_tls_handshake();
}

void Protocol_stream::Impl::start_tls_handshake()
{
  using boost::asio::ip::make_address;
  using boost::asio::ssl::stream_base;

  m_state = State::S_TLS_HANDSHAKING;
  m_tls_stream.emplace(std::move(m_socket), *m_tls_ctx);

  // SNI is for host names only; an address literal is left out.
  Error_code addr_err_code;
  make_address(m_config.m_host, addr_err_code);
  if (addr_err_code && (!SSL_set_tlsext_host_name(m_tls_stream->native_handle(), m_config.m_host.c_str())))
  {
    FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: Could not set TLS SNI host name "
                     "[" << m_config.m_host << "].  Continuing without it.");
  }

  FLOW_LOG_TRACE("Protocol_stream [" << *this << "]: Starting TLS handshake.");
  m_tls_stream->async_handshake(stream_base::client, [this](const Error_code& err_code)
  {
    if (m_state != State::S_TLS_HANDSHAKING)
    {
      return;
    }
    // else
    if (err_code)
    {
      if ((m_config.m_trust_policy == Trust_policy::S_PINNED_CERTIFICATE)
          && pinned_certificate_rejected(m_tls_stream->native_handle()))
      {
        connect_failed(error::Code::S_TLS_PINNED_CERTIFICATE_MISMATCH, "TLS handshake failed");
      }
      else
      {
        connect_failed(err_code, "TLS handshake failed");
      }
      return;
    }
    // else

    FLOW_LOG_INFO("Protocol_stream [" << *this << "]: TLS handshake done.");
    start_handshake();
  });
} // Protocol_stream::Impl::start_tls_handshake()

void Protocol_stream::Impl::start_handshake()
{
  using flow::util::Lock_guard;

  m_state = State::S_HANDSHAKING;

  util::Byte_buffer bytes;
  protocol::encode(m_startup, &bytes);

  {
    Lock_guard<decltype(m_send_mutex)> lock(m_send_mutex);

    // Nothing can be pending yet: send() has been refusing until now.
    const auto id = m_correlator.register_reply(&m_connect_on_done);
    assert((id != Reply_correlator::S_NO_ID) && "Startup reply registration cannot be refused.");
    m_connect_on_done = nullptr;

    FLOW_LOG_INFO("Protocol_stream [" << *this << "]: Transport ready; writing startup message; "
                  "now connected.");
    m_state = State::S_READY;
    m_connected = true;
    enqueue_write(Pending_write{ id, std::move(bytes) });
  }

  read_next();
} // Protocol_stream::Impl::start_handshake()

void Protocol_stream::Impl::connect_failed(const Error_code& err_code, util::String_view description)
{
  FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: Connect failed in state [" << state_name(m_state) << "]: "
                   "[" << description << "]: [" << err_code << "] [" << err_code.message() << "].");

  m_state = State::S_CLOSED;
  m_resolver.cancel();
  close_transport();

  fail_connect_consumer(err_code, description);
}

void Protocol_stream::Impl::fail_connect_consumer(const Error_code& err_code, util::String_view description)
{
  if (!m_connect_on_done)
  {
    return; // Already informed (or close() before connect()).
  }
  // else
  auto on_done = std::move(m_connect_on_done);
  m_connect_on_done = nullptr;
  Reply reply;
  reply.push_back(protocol::Channel_error{ err_code, std::string(description) });
  try
  {
    on_done(std::move(reply));
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: Connect consumer threw [" << exc.what() << "]; "
                     "continuing.");
  }
}

// Send-ops.

void Protocol_stream::Impl::send(std::vector<protocol::Out_message>&& msgs, On_reply_func&& on_done,
                                 Error_code* err_code)
{
  using flow::util::Lock_guard;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send(std::move(msgs), std::move(on_done), actual_err_code); },
         err_code, "Protocol_stream::send()"))
  {
    return;
  }
  // else

  if (msgs.empty())
  {
    FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: send() given no messages.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  util::Byte_buffer bytes;
  for (const auto& msg : msgs)
  {
    protocol::encode(msg, &bytes);
  }

  {
    Lock_guard<decltype(m_send_mutex)> lock(m_send_mutex);

    if (!m_connected)
    {
      FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: send() of [" << msgs.size() << "] messages "
                       "(first: [" << msgs.front() << "]) while not connected.");
      *err_code = error::Code::S_NOT_CONNECTED;
      return;
    }
    // else
    err_code->clear();

    const auto id = m_correlator.register_reply(&on_done);
    if (id != Reply_correlator::S_NO_ID)
    {
      FLOW_LOG_TRACE("Protocol_stream [" << *this << "]: Reply [" << id << "] registered for "
                     "[" << msgs.size() << "] messages (first: [" << msgs.front() << "]) totaling "
                     "[" << bytes.size() << "] bytes; queuing write.");
      m_worker->post([this, write = Pending_write{ id, std::move(bytes) }]() mutable
      {
        enqueue_write(std::move(write));
      });
      return;
    }
    // else: Refused; deliver that outside the lock.
  }

  m_correlator.reject(std::move(on_done));
} // Protocol_stream::Impl::send()

void Protocol_stream::Impl::enqueue_write(Pending_write&& write)
{
  // We are in thread W.

  if (m_state != State::S_READY)
  {
    // The connection ended after send() registered the reply; fail_all() has informed its consumer.
    FLOW_LOG_TRACE("Protocol_stream [" << *this << "]: Dropping write for reply [" << write.m_reply_id << "]: "
                   "state is [" << state_name(m_state) << "].");
    return;
  }
  // else

  m_write_q.push_back(std::move(write));
  if (!m_writing)
  {
    write_next();
  }
}

void Protocol_stream::Impl::write_next()
{
  m_writing = true;
  const auto& write = m_write_q.front();

  with_transport([&](auto& transport)
  {
    boost::asio::async_write(transport, boost::asio::buffer(write.m_bytes),
                             [this](const Error_code& err_code, size_t n_written)
    {
      // We are in thread W.
      m_writing = false;

      if (m_state != State::S_READY)
      {
        m_write_q.clear(); // Their consumers have been informed by fail_all().
        return;
      }
      // else

      const auto id = m_write_q.front().m_reply_id;
      if (err_code)
      {
        /* The backend may or may not get (part of) the request; either way this consumer hears about the failure
         * now, and only now; then everyone else does. */
        m_correlator.fail_one(id, err_code, "Write failed");
        close_connection(err_code, "Write failed");
        return;
      }
      // else

      FLOW_LOG_TRACE("Protocol_stream [" << *this << "]: Wrote [" << n_written << "] bytes for reply [" << id << "].");
      m_write_q.pop_front();
      if (!m_write_q.empty())
      {
        write_next();
      }
    });
  });
} // Protocol_stream::Impl::write_next()

// Receive-ops.

void Protocol_stream::Impl::read_next()
{
  with_transport([this](auto& transport)
  {
    transport.async_read_some(boost::asio::buffer(m_read_buf), [this](const Error_code& err_code, size_t n_read)
    {
      // We are in thread W.

      if (m_state != State::S_READY)
      {
        return;
      }
      // else
      if (err_code)
      {
        if ((err_code == boost::asio::error::eof) || (err_code == boost::asio::ssl::error::stream_truncated))
        {
          close_connection(error::Code::S_CHANNEL_INACTIVE, "Channel state changed to inactive");
        }
        else
        {
          close_connection(err_code, "Read failed");
        }
        return;
      }
      // else
      on_read(n_read);
    });
  });
}

void Protocol_stream::Impl::on_read(size_t n_read)
{
  m_decoder.feed(util::Blob_const(m_read_buf.data(), n_read));

  protocol::In_message msg;
  Error_code err_code;
  while (m_decoder.next(&msg, &err_code))
  {
    if (protocol::is_push(msg))
    {
      const auto& notification = std::get<protocol::Notification_response>(msg);
      m_registry.dispatch(notification.m_channel, notification.m_payload);
    }
    else
    {
      m_correlator.on_message(std::move(msg));
    }
  }

  if (err_code)
  {
    close_connection(err_code, "Malformed input from backend");
    return;
  }
  // else
  read_next();
} // Protocol_stream::Impl::on_read()

// Close-ops.

void Protocol_stream::Impl::close()
{
  FLOW_LOG_INFO("Protocol_stream [" << *this << "]: Close requested.");
  m_worker->post([this]()
  {
    close_connection(error::Code::S_CHANNEL_INACTIVE, "Channel state changed to inactive");
  });
}

void Protocol_stream::Impl::close_connection(const Error_code& err_code, util::String_view description)
{
  using flow::util::Lock_guard;

  if ((m_state == State::S_CLOSING) || (m_state == State::S_CLOSED))
  {
    return;
  }
  // else
  if (m_state != State::S_READY)
  {
    connect_failed(err_code, description); // Not yet connected: a bring-up failure.
    return;
  }
  // else

  FLOW_LOG_INFO("Protocol_stream [" << *this << "]: Connection ending: [" << description << "]: "
                "[" << err_code << "] [" << err_code.message() << "].");

  m_state = State::S_CLOSING;
  {
    // From now on send() refuses; anything registered before this point is in m_correlator.
    Lock_guard<decltype(m_send_mutex)> lock(m_send_mutex);
    m_connected = false;
  }

  close_transport();
  if (m_writing)
  {
    // Keep the in-progress write's buffer alive until its (aborted) handler runs.
    m_write_q.erase(m_write_q.begin() + 1, m_write_q.end());
  }
  else
  {
    m_write_q.clear();
  }
  m_state = State::S_CLOSED;

  m_correlator.fail_all(err_code, description);
} // Protocol_stream::Impl::close_connection()

void Protocol_stream::Impl::close_transport()
{
  using boost::asio::ip::tcp;

  auto& socket = m_tls_stream ? m_tls_stream->next_layer() : m_socket;
  if (!socket.is_open())
  {
    return;
  }
  // else

  // TLS close_notify is skipped: the connection is going away regardless, and the backend does not need it.
  Error_code err_code;
  socket.shutdown(tcp::socket::shutdown_both, err_code);
  if (err_code)
  {
    FLOW_LOG_TRACE("Protocol_stream [" << *this << "]: Socket shutdown reported "
                   "[" << err_code << "] [" << err_code.message() << "]; closing anyway.");
  }
  socket.close(err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Protocol_stream [" << *this << "]: Socket close reported "
                     "[" << err_code << "] [" << err_code.message() << "].");
  }
}

template<typename Func>
void Protocol_stream::Impl::with_transport(const Func& func)
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

util::String_view Protocol_stream::Impl::state_name(State state) // Static.
{
  switch (state)
  {
  case State::S_NULL: return "NULL";
  case State::S_CONNECTING: return "CONNECTING";
  case State::S_TLS_PENDING: return "TLS_PENDING";
  case State::S_TLS_HANDSHAKING: return "TLS_HANDSHAKING";
  case State::S_HANDSHAKING: return "HANDSHAKING";
  case State::S_READY: return "READY";
  case State::S_CLOSING: return "CLOSING";
  case State::S_CLOSED: return "CLOSED";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, const Protocol_stream::Impl& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace pgwire::stream
