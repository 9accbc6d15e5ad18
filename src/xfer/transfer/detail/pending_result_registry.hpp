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
#pragma once

#include "xfer/transfer/detail/pending_result.hpp"
#include <flow/log/log.hpp>
#include <boost/unordered_map.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <vector>

namespace xfer::transfer::detail
{

// Types.

/**
 * Concurrent table of in-flight requests, mapping each request's identity to its Pending_result, plus the
 * *active count*: an atomic counter equal at all times (when no operation is mid-flight) to the number of entries.
 *
 * Transfer_processor registers a request before scheduling it, and whoever processes the request's outcome --
 * any caller's poll, or a caller that could not schedule or poll -- resolves the slot and removes the entry.
 * Resolution and removal happen together under the entry's shard lock, and only the thread that removes an entry
 * resolves it.  Consequently each slot is resolved exactly once, however many threads race to process the same
 * outcome; and the active count is never decremented for an entry that did not exist.
 *
 * ### Internal structure ###
 * The entries are spread over a fixed number of *shards* by identity hash, each shard being an independently locked
 * `boost::unordered_map`.  Concurrent callers touching different requests thus rarely contend.  The active count is
 * maintained with atomic increments/decrements performed inside the shard lock alongside the insert/erase; so
 * active_count() never disagrees with a snapshot of the entries by more than the number of in-progress operations.
 *
 * ### Thread safety ###
 * All methods may be invoked concurrently.
 */
class Pending_result_registry :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs an empty registry.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param n_shards
   *        Number of independently locked shards; must be positive.
   */
  explicit Pending_result_registry(flow::log::Logger* logger_ptr, size_t n_shards);

  /// Destroys the registry.  Any remaining entries are dropped unresolved (nobody could be waiting on them).
  ~Pending_result_registry();

  // Methods.

  /**
   * Inserts an entry for the given request and increments the active count.
   *
   * @param request
   *        The request.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_DUPLICATE_REQUEST (an entry with the same identity exists; nothing changed).
   * @return The new slot; null on error.
   */
  Pending_result::Ptr register_request(const Request_descriptor& request, Error_code* err_code = 0);

  /**
   * For each record, in order, resolves the matching entry and removes it, decrementing the active count.
   * A record with no matching entry (the engine reported an unknown or already-completed request) is logged and
   * skipped.
   *
   * @param batch
   *        Records as returned by the engine's poll.  Responses are moved out of them.
   * @return Number of entries resolved and removed.
   */
  size_t resolve_and_remove(std::vector<Completion_record>* batch);

  /**
   * Resolves the entry for the given request to failure with the given cause and removes it, decrementing
   * the active count; or does nothing if there is no such entry.
   *
   * @param request
   *        The request.
   * @param cause
   *        Truthy cause.
   * @return `true` if this call resolved the entry; `false` if there was none (someone else resolved it).
   */
  bool fail_and_remove(const Request_descriptor& request, const Error_code& cause);

  /**
   * The active count.
   * @return See above.
   */
  size_t active_count() const;

  /**
   * Number of entries, counted shard by shard under each shard's lock.
   * @return See above.
   */
  size_t size() const;

  /**
   * Number of shards given to ctor.
   * @return See above.
   */
  size_t n_shards() const;

private:
  // Types.

  /// One independently locked portion of the table.
  struct Shard
  {
    /// Protects #m_results.
    mutable util::Mutex_non_recursive m_mutex;

    /// Entries in this shard, keyed by request identity.
    boost::unordered_map<request_id_t, Pending_result::Ptr> m_results;
  };

  // Methods.

  /**
   * The shard in which an entry with the given identity lives.
   *
   * @param id
   *        Identity.
   * @return See above.
   */
  Shard& shard_of(request_id_t id);

  // Data.

  /// See n_shards().
  const size_t m_n_shards;

  /// The shards; array of size #m_n_shards.
  boost::movelib::unique_ptr<Shard[]> m_shards;

  /// See active_count().
  std::atomic<size_t> m_active_count;
}; // class Pending_result_registry

} // namespace xfer::transfer::detail
