/* Flow-Xfer: Core
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
#include "xfer/transfer/cancellation_context.hpp"
#include <ostream>

namespace xfer::transfer
{

// Cancellation_context::Hook implementations.

Cancellation_context::Hook::Hook() :
  m_ctx(nullptr),
  m_id(0)
{
  // That's it.
}

Cancellation_context::Hook::Hook(Cancellation_context* ctx, uint64_t id) :
  m_ctx(ctx),
  m_id(id)
{
  // That's it.
}

Cancellation_context::Hook::Hook(Hook&& src) :
  Hook()
{
  operator=(std::move(src));
}

Cancellation_context::Hook::~Hook()
{
  dispose();
}

Cancellation_context::Hook& Cancellation_context::Hook::operator=(Hook&& src)
{
  if (&src != this)
  {
    dispose();
    m_ctx = src.m_ctx;
    m_id = src.m_id;
    src.m_ctx = nullptr;
    src.m_id = 0;
  }
  return *this;
}

void Cancellation_context::Hook::dispose()
{
  if (m_ctx)
  {
    m_ctx->remove_hook(m_id);
    m_ctx = nullptr;
    m_id = 0;
  }
}

bool Cancellation_context::Hook::active() const
{
  return m_ctx != nullptr;
}

// Cancellation_context implementations.

Cancellation_context::Cancellation_context(flow::log::Logger* logger_ptr, util::String_view nickname_str) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_nickname(nickname_str),
  m_next_hook_id(1),
  m_running_hook_id(0)
{
  FLOW_LOG_TRACE("Cancellation_context [" << *this << "]: Created.");
}

Cancellation_context::~Cancellation_context()
{
  FLOW_LOG_TRACE("Cancellation_context [" << *this << "]: Destroying; "
                 "[" << m_hooks.size() << "] hooks still registered (will not be invoked).");
}

bool Cancellation_context::cancel(const Error_code& cause)
{
  using flow::util::Lock_guard;

  const Error_code actual_cause = cause ? cause : Error_code(error::Code::S_REQUEST_CANCELED);

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  if (m_cause)
  {
    FLOW_LOG_TRACE("Cancellation_context [" << *this << "]: cancel(cause [" << actual_cause << "]) ignored; "
                   "already canceled with cause [" << m_cause << "].");
    return false;
  }
  // else
  m_cause = actual_cause;
  m_canceling_thread_id = boost::this_thread::get_id();

  FLOW_LOG_INFO("Cancellation_context [" << *this << "]: Canceled with cause [" << actual_cause << "] "
                "[" << actual_cause.message() << "]; invoking [" << m_hooks.size() << "] hooks.");

  /* Take hooks out one at a time, so that one disposed while an earlier one runs is skipped.  No new ones can
   * appear (on_cancel() now invokes immediately instead). */
  while (!m_hooks.empty())
  {
    const auto it = m_hooks.begin();
    m_running_hook_id = it->first;
    const auto func = std::move(it->second);
    m_hooks.erase(it);

    // Hooks may call back into *this; so no lock.
    lock.unlock();
    func(actual_cause);
    lock.lock();

    m_running_hook_id = 0;
    m_hook_done.notify_all();
  }
  return true;
} // Cancellation_context::cancel()

Cancellation_context::Hook Cancellation_context::on_cancel(On_cancel_func&& on_cancel_func)
{
  using flow::util::Lock_guard;

  Error_code cause;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    if (!m_cause)
    {
      const auto id = m_next_hook_id++;
      m_hooks.emplace(id, std::move(on_cancel_func));
      return Hook(this, id);
    }
    // else
    cause = m_cause;
  }

  FLOW_LOG_TRACE("Cancellation_context [" << *this << "]: Hook registered after cancellation; "
                 "invoking it immediately with cause [" << cause << "].");
  on_cancel_func(cause);
  return Hook();
} // Cancellation_context::on_cancel()

void Cancellation_context::remove_hook(uint64_t id)
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_hooks.erase(id); // Might be gone already, if cancel() took it.

  if (boost::this_thread::get_id() == m_canceling_thread_id)
  {
    return; // Waiting for ourselves would never end.
  }
  // else
  while (m_running_hook_id == id)
  {
    m_hook_done.wait(lock);
  }
}

bool Cancellation_context::canceled() const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return bool(m_cause);
}

Error_code Cancellation_context::cause() const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_cause;
}

size_t Cancellation_context::hook_count() const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_hooks.size();
}

const std::string& Cancellation_context::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Cancellation_context& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace xfer::transfer
