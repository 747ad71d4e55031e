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
#include "pgwire/stream/reply_correlator.hpp"
#include "pgwire/stream/error.hpp"
#include <algorithm>
#include <vector>

namespace pgwire::stream
{

Reply_correlator::Reply_correlator(flow::log::Logger* logger_ptr, util::String_view nickname, bool pipelining) :
  flow::log::Log_context(logger_ptr, Log_component::S_STREAM),
  m_nickname(nickname),
  m_pipelining(pipelining),
  m_next_id(S_NO_ID + 1)
{
  FLOW_LOG_TRACE("Reply_correlator [" << m_nickname << "]: Created; pipelining [" << m_pipelining << "].");
}

Reply_correlator::reply_id_t Reply_correlator::register_reply(On_reply_func* on_done)
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);

  if ((!m_pipelining) && (!m_pending_q.empty()))
  {
    FLOW_LOG_TRACE("Reply_correlator [" << m_nickname << "]: Refusing registration: a reply is pending, and "
                   "pipelining is not enabled.");
    return S_NO_ID;
  }
  // else

  const auto id = m_next_id++;
  m_pending_q.push_back(Pending_reply{ id, std::move(*on_done), Reply(), false });

  FLOW_LOG_TRACE("Reply_correlator [" << m_nickname << "]: Registered reply [" << id << "]; "
                 "queue size [" << m_pending_q.size() << "].");
  return id;
}

void Reply_correlator::reject(On_reply_func&& on_done)
{
  FLOW_LOG_WARNING("Reply_correlator [" << m_nickname << "]: Request rejected: a reply is pending, and "
                   "pipelining is not enabled.");
  Reply reply;
  reply.push_back(make_channel_error(error::Code::S_PIPELINING_NOT_ENABLED, "Pipelining not enabled"));
  deliver(S_NO_ID, on_done, std::move(reply));
}

void Reply_correlator::on_message(protocol::In_message&& msg)
{
  using flow::util::Lock_guard;

  const bool terminal = protocol::is_reply_terminal(msg);
  On_reply_func on_done;
  Reply reply;
  reply_id_t id;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);

    if (m_pending_q.empty())
    {
      FLOW_LOG_WARNING("Reply_correlator [" << m_nickname << "]: Received [" << msg << "], but no reply is "
                       "pending.  Dropping it.");
      return;
    }
    // else

    auto& head = m_pending_q.front();
    id = head.m_id;
    FLOW_LOG_TRACE("Reply_correlator [" << m_nickname << "]: Reply [" << id << "] gets [" << msg << "]; "
                   "terminal [" << terminal << "].");
    head.m_reply.push_back(std::move(msg));

    if (!terminal)
    {
      return;
    }
    // else

    const bool answered = head.m_answered;
    if (!answered)
    {
      on_done = std::move(head.m_on_done);
      reply = std::move(head.m_reply);
    }
    m_pending_q.pop_front();

    if (answered)
    {
      FLOW_LOG_INFO("Reply_correlator [" << m_nickname << "]: Reply [" << id << "] completed, but its "
                    "consumer was already informed of a failure.  Dropping it.");
      return;
    }
  } // Lock_guard<decltype(m_mutex)> lock(m_mutex): unlocks here.

  FLOW_LOG_TRACE("Reply_correlator [" << m_nickname << "]: Reply [" << id << "] complete with "
                 "[" << reply.size() << "] messages.  Delivering.");
  deliver(id, on_done, std::move(reply));
} // Reply_correlator::on_message()

void Reply_correlator::fail_one(reply_id_t id, const Error_code& err_code, util::String_view description)
{
  using flow::util::Lock_guard;

  On_reply_func on_done;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);

    const auto it = std::find_if(m_pending_q.begin(), m_pending_q.end(),
                                 [id](const Pending_reply& entry) { return entry.m_id == id; });
    if ((it == m_pending_q.end()) || it->m_answered)
    {
      FLOW_LOG_TRACE("Reply_correlator [" << m_nickname << "]: Asked to fail reply [" << id << "], but it is "
                     "already complete or answered.  No-op.");
      return;
    }
    // else
    on_done = std::move(it->m_on_done);
    it->m_answered = true;
  }

  FLOW_LOG_INFO("Reply_correlator [" << m_nickname << "]: Failing reply [" << id << "] alone with "
                "[" << err_code << "] [" << err_code.message() << "].");
  Reply reply;
  reply.push_back(make_channel_error(err_code, description));
  deliver(id, on_done, std::move(reply));
}

void Reply_correlator::fail_all(const Error_code& err_code, util::String_view description)
{
  using flow::util::Lock_guard;
  using std::vector;

  vector<Pending_reply> failed;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    for (auto& entry : m_pending_q)
    {
      if (!entry.m_answered)
      {
        failed.push_back(std::move(entry));
      }
    }
    m_pending_q.clear();
  }

  if (failed.empty())
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Reply_correlator [" << m_nickname << "]: Failing [" << failed.size() << "] pending "
                "replies with [" << err_code << "] [" << err_code.message() << "].");
  for (auto& entry : failed)
  {
    entry.m_reply.push_back(make_channel_error(err_code, description));
    deliver(entry.m_id, entry.m_on_done, std::move(entry.m_reply));
  }
} // Reply_correlator::fail_all()

void Reply_correlator::deliver(reply_id_t id, On_reply_func& on_done, Reply&& reply)
{
  try
  {
    on_done(std::move(reply));
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("Reply_correlator [" << m_nickname << "]: Consumer of reply [" << id << "] threw "
                     "[" << exc.what() << "]; continuing.");
  }
}

size_t Reply_correlator::pending_count() const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_pending_q.size();
}

bool Reply_correlator::pipelining() const
{
  return m_pipelining;
}

protocol::In_message Reply_correlator::make_channel_error(const Error_code& err_code,
                                                          util::String_view description) // Static.
{
  return protocol::Channel_error{ err_code, std::string(description) };
}

} // namespace pgwire::stream
