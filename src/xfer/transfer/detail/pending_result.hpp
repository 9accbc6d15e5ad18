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

#include "xfer/transfer/detail/transfer_fwd.hpp"
#include "xfer/transfer/completion_record.hpp"
#include <boost/thread/future.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <variant>

namespace xfer::transfer::detail
{

// Types.

/**
 * Single-assignment result slot for one in-flight request: the caller blocked in
 * Transfer_processor::execute_request() waits on it, and whichever thread processes the request's
 * Completion_record resolves it.
 *
 * It is a thin wrapper around a `boost::promise`/`boost::unique_future` pair.  A second resolution (via resolve() or
 * fail(), in any combination) throws `boost::promise_already_satisfied`: Pending_result_registry makes that
 * impossible by resolving only while removing the slot from the registry under a lock; so the exception, should it
 * ever fly, indicates a bug.
 *
 * ### Thread safety ###
 * resolve(), fail() and ready() may be called concurrently from any threads.  get() is to be called once, by the
 * waiting caller.
 */
class Pending_result :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to this class.
  using Ptr = boost::shared_ptr<Pending_result>;

  // Constructors/destructor.

  /**
   * Constructs an unresolved slot.
   *
   * @param request
   *        The request whose outcome will go here.
   */
  explicit Pending_result(const Request_descriptor& request);

  // Methods.

  /**
   * Resolves the slot from the given record: success or failure as the record says.
   *
   * @param record
   *        Record for request(); the response is moved out of it if successful.
   */
  void resolve(Completion_record&& record);

  /**
   * Resolves the slot to failure with the given cause.
   *
   * @param cause
   *        Truthy cause.
   */
  void fail(const Error_code& cause);

  /**
   * Whether the slot has been resolved.
   * @return See above.
   */
  bool ready() const;

  /**
   * Blocks until resolved; then returns the response or emits the failure cause.  To be called at most once.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  On failure, the cause given to fail() or
   *        carried by the failure record given to resolve().
   * @return The response on success; default-constructed otherwise.
   */
  Response_data get(Error_code* err_code = 0);

  /**
   * The request whose outcome goes here.
   * @return See above.
   */
  const Request_descriptor& request() const;

private:
  // Types.

  /// What the slot ultimately holds.
  using Outcome = std::variant<Response_data, Error_code>;

  // Data.

  /// See request().
  const Request_descriptor m_request;

  /// The write side.
  boost::promise<Outcome> m_promise;

  /// The read side.
  boost::unique_future<Outcome> m_result;
}; // class Pending_result

} // namespace xfer::transfer::detail
