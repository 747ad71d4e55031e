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
#include "pgwire/stream/notification_registry.hpp"
#include "pgwire/stream/error.hpp"
#include <flow/error/error.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <vector>

namespace pgwire::stream
{

Notification_registry::Notification_registry(flow::log::Logger* logger_ptr, util::String_view nickname) :
  flow::log::Log_context(logger_ptr, Log_component::S_STREAM),
  m_nickname(nickname)
{
  FLOW_LOG_TRACE("Notification_registry [" << m_nickname << "]: Created.");
}

std::string Notification_registry::subscribe(util::String_view channel, On_notification_func&& on_notification)
{
  using flow::util::Lock_guard;
  using boost::uuids::to_string;
  using std::make_shared;
  using std::string;

  string token;
  size_t count;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);

    token = to_string(m_token_generator());
    auto& subscribers = m_channels[string(channel)]; // Get-or-create under the same lock.
    subscribers.emplace(token, make_shared<On_notification_func>(std::move(on_notification)));
    count = subscribers.size();
  }

  FLOW_LOG_INFO("Notification_registry [" << m_nickname << "]: Channel [" << channel << "]: Subscribed "
                "[" << token << "]; now [" << count << "] subscribers.");
  return token;
}

void Notification_registry::unsubscribe(util::String_view channel, util::String_view token, Error_code* err_code)
{
  using flow::util::Lock_guard;
  using std::string;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { unsubscribe(channel, token, actual_err_code); },
         err_code, "Notification_registry::unsubscribe()"))
  {
    return;
  }
  // else

  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);

    const auto channel_it = m_channels.find(string(channel));
    if ((channel_it != m_channels.end()) && (channel_it->second.erase(string(token)) != 0))
    {
      err_code->clear();
      FLOW_LOG_INFO("Notification_registry [" << m_nickname << "]: Channel [" << channel << "]: Unsubscribed "
                    "[" << token << "]; now [" << channel_it->second.size() << "] subscribers.");
      return;
    }
  }

  FLOW_LOG_WARNING("Notification_registry [" << m_nickname << "]: No consumers on channel [" << channel << "] "
                   "with token [" << token << "].");
  *err_code = error::Code::S_NO_SUCH_SUBSCRIBER;
} // Notification_registry::unsubscribe()

void Notification_registry::dispatch(util::String_view channel, const std::string& payload)
{
  using flow::util::Lock_guard;
  using std::shared_ptr;
  using std::string;
  using std::vector;

  // Snapshot the subscribers, so that they run with no lock held and may (un)subscribe freely.
  vector<shared_ptr<On_notification_func>> subscribers;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);

    const auto channel_it = m_channels.find(string(channel));
    if (channel_it != m_channels.end())
    {
      subscribers.reserve(channel_it->second.size());
      for (const auto& token_and_subscriber : channel_it->second)
      {
        subscribers.push_back(token_and_subscriber.second);
      }
    }
  }

  FLOW_LOG_TRACE("Notification_registry [" << m_nickname << "]: Channel [" << channel << "]: Dispatching "
                 "payload of size [" << payload.size() << "] to [" << subscribers.size() << "] subscribers.");

  for (const auto& subscriber : subscribers)
  {
    try
    {
      (*subscriber)(payload);
    }
    catch (const std::exception& exc)
    {
      FLOW_LOG_WARNING("Notification_registry [" << m_nickname << "]: Channel [" << channel << "]: A subscriber "
                       "threw [" << exc.what() << "]; continuing with the others.");
    }
  }
} // Notification_registry::dispatch()

size_t Notification_registry::subscriber_count(util::String_view channel) const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  const auto channel_it = m_channels.find(std::string(channel));
  return (channel_it == m_channels.end()) ? 0 : channel_it->second.size();
}

} // namespace pgwire::stream
