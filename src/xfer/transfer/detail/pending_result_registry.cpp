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
#include "xfer/transfer/detail/pending_result_registry.hpp"
#include "xfer/transfer/error.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/make_shared.hpp>
#include <boost/functional/hash/hash.hpp>
#include <ostream>

namespace xfer::transfer::detail
{

// Implementations.

Pending_result_registry::Pending_result_registry(flow::log::Logger* logger_ptr, size_t n_shards) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_n_shards(n_shards),
  m_shards(boost::movelib::make_unique<Shard[]>(m_n_shards)),
  m_active_count(0)
{
  assert((m_n_shards != 0) && "Processor_config::validate() should have caught this.");
  FLOW_LOG_TRACE("Registry [" << *this << "]: Created.");
}

Pending_result_registry::~Pending_result_registry()
{
  const auto n = size();
  if (n != 0)
  {
    FLOW_LOG_WARNING("Registry [" << *this << "]: Destroying with [" << n << "] entries remaining.  "
                     "Nobody should be waiting on them, so this is unexpected; but they are simply dropped.");
  }
}

Pending_result_registry::Shard& Pending_result_registry::shard_of(request_id_t id)
{
  using boost::hash;
  return m_shards[hash<request_id_t>()(id) % m_n_shards];
}

Pending_result::Ptr Pending_result_registry::register_request(const Request_descriptor& request,
                                                              Error_code* err_code)
{
  using flow::util::Lock_guard;
  using boost::make_shared;

  Pending_result::Ptr result;
  if (flow::error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> Pending_result::Ptr
                                             { return register_request(request, actual_err_code); },
                                           &result, err_code, "Pending_result_registry::register_request()"))
  {
    return result;
  }
  // else if (err_code): Proceed.

  auto& shard = shard_of(request.id());
  {
    Lock_guard<decltype(shard.m_mutex)> lock(shard.m_mutex);

    auto& slot = shard.m_results[request.id()];
    if (slot)
    {
      FLOW_LOG_WARNING("Registry [" << *this << "]: Cannot register request [" << request << "]: "
                       "it is already in flight.");
      *err_code = error::Code::S_DUPLICATE_REQUEST;
      return Pending_result::Ptr();
    }
    // else

    slot = make_shared<Pending_result>(request);
    result = slot;
    ++m_active_count;
  } // Lock_guard lock(shard.m_mutex)

  FLOW_LOG_TRACE("Registry [" << *this << "]: Registered [" << request << "].");
  err_code->clear();
  return result;
} // Pending_result_registry::register_request()

size_t Pending_result_registry::resolve_and_remove(std::vector<Completion_record>* batch)
{
  using flow::util::Lock_guard;

  size_t n_resolved = 0;
  for (auto& record : *batch)
  {
    const auto id = record.request().id();
    auto& shard = shard_of(id);

    Lock_guard<decltype(shard.m_mutex)> lock(shard.m_mutex);

    const auto it = shard.m_results.find(id);
    if (it == shard.m_results.end())
    {
      FLOW_LOG_WARNING("Registry [" << *this << "]: Engine reported completion [" << record << "] "
                       "for which no request is in flight.  Ignoring.");
      continue;
    }
    // else

    FLOW_LOG_TRACE("Registry [" << *this << "]: Resolving with completion [" << record << "].");

    /* Resolve and erase in the same critical section: whoever erases is the only one that resolves.  Note that
     * resolution merely sets the promise; the waiter wakes up and does its work outside our lock. */
    it->second->resolve(std::move(record));
    shard.m_results.erase(it);
    --m_active_count;
    ++n_resolved;
  } // for (record : *batch)

  return n_resolved;
} // Pending_result_registry::resolve_and_remove()

bool Pending_result_registry::fail_and_remove(const Request_descriptor& request, const Error_code& cause)
{
  using flow::util::Lock_guard;

  assert(cause);

  auto& shard = shard_of(request.id());
  Lock_guard<decltype(shard.m_mutex)> lock(shard.m_mutex);

  const auto it = shard.m_results.find(request.id());
  if (it == shard.m_results.end())
  {
    FLOW_LOG_TRACE("Registry [" << *this << "]: Wanted to fail [" << request << "] with [" << cause << "]; "
                   "but it was already resolved.  Fine.");
    return false;
  }
  // else

  FLOW_LOG_TRACE("Registry [" << *this << "]: Failing [" << request << "] with [" << cause << "] "
                 "[" << cause.message() << "].");
  it->second->fail(cause);
  shard.m_results.erase(it);
  --m_active_count;
  return true;
} // Pending_result_registry::fail_and_remove()

size_t Pending_result_registry::active_count() const
{
  return m_active_count.load();
}

size_t Pending_result_registry::size() const
{
  using flow::util::Lock_guard;

  size_t n = 0;
  for (size_t idx = 0; idx != m_n_shards; ++idx)
  {
    const auto& shard = m_shards[idx];
    Lock_guard<decltype(shard.m_mutex)> lock(shard.m_mutex);
    n += shard.m_results.size();
  }
  return n;
}

size_t Pending_result_registry::n_shards() const
{
  return m_n_shards;
}

std::ostream& operator<<(std::ostream& os, const Pending_result_registry& val)
{
  return os << "shards[" << val.n_shards() << "] active[" << val.active_count() << "]@"
            << static_cast<const void*>(&val);
}

} // namespace xfer::transfer::detail
