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

#include "xfer/transfer/request_descriptor.hpp"
#include <variant>

namespace xfer::transfer
{

// Types.

/**
 * Result of a successful transfer, as produced by the native transfer engine.  Flow-Xfer does not interpret it;
 * it is moved from the engine, through the worker thread, to the caller of Transfer_processor::execute_request().
 */
struct Response_data
{
  // Data.

  /// Protocol status code (e.g., 200).
  unsigned int m_status_code = 0;

  /// Response headers in the order received.
  Headers m_headers;

  /// Response body.
  std::string m_body;
}; // struct Response_data

/**
 * The terminal outcome of one scheduled request, as reported by the native engine's poll: the request's descriptor
 * (a copy of the scheduled one, hence with the same identity) plus either a Response_data (success()) or an
 * #Error_code cause (failure).  A given request is reported at most once.
 *
 * Construct via the static factories success() and failure().
 */
class Completion_record
{
public:
  // Constructors/destructor.

  /**
   * Makes a success record.
   *
   * @param request
   *        The completed request.
   * @param response
   *        Its result.
   * @return See above.
   */
  static Completion_record success(const Request_descriptor& request, Response_data&& response);

  /**
   * Makes a failure record.
   *
   * @param request
   *        The completed request.
   * @param cause
   *        Why it failed.  Must be truthy.
   * @return See above.
   */
  static Completion_record failure(const Request_descriptor& request, const Error_code& cause);

  // Methods.

  /**
   * The request this record completes.
   * @return See above.
   */
  const Request_descriptor& request() const;

  /**
   * `true` if success record; `false` if failure record.
   * @return See above.
   */
  bool succeeded() const;

  /**
   * The response of a success record.  Behavior undefined if `!succeeded()`.
   * @return See above.
   */
  const Response_data& response() const;

  /**
   * Moves out the response of a success record.  Behavior undefined if `!succeeded()`.
   * @return See above.
   */
  Response_data&& release_response();

  /**
   * The cause of a failure record; falsy for a success record.
   * @return See above.
   */
  Error_code cause() const;

private:
  // Types.

  /// Response or failure cause.
  using Outcome = std::variant<Response_data, Error_code>;

  // Constructors.

  /**
   * Used by the factories.
   *
   * @param request
   *        See m_request.
   * @param outcome
   *        See m_outcome.
   */
  explicit Completion_record(const Request_descriptor& request, Outcome&& outcome);

  // Data.

  /// See request().
  Request_descriptor m_request;

  /// See response() and cause().
  Outcome m_outcome;
}; // class Completion_record

} // namespace xfer::transfer
