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
#include "xfer/transfer/detail/pending_result.hpp"
#include <flow/error/error.hpp>
#include <ostream>

namespace xfer::transfer::detail
{

// Implementations.

Pending_result::Pending_result(const Request_descriptor& request) :
  m_request(request),
  m_result(m_promise.get_future())
{
  // That's it.
}

void Pending_result::resolve(Completion_record&& record)
{
  assert((record.request() == m_request) && "Resolving slot with another request's record.");

  if (record.succeeded())
  {
    m_promise.set_value(Outcome(std::in_place_type<Response_data>, std::move(record.release_response())));
  }
  else
  {
    m_promise.set_value(Outcome(std::in_place_type<Error_code>, record.cause()));
  }
}

void Pending_result::fail(const Error_code& cause)
{
  assert(cause);
  m_promise.set_value(Outcome(std::in_place_type<Error_code>, cause));
}

bool Pending_result::ready() const
{
  return m_result.is_ready();
}

Response_data Pending_result::get(Error_code* err_code)
{
  Response_data response;
  if (flow::error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> Response_data
                                             { return get(actual_err_code); },
                                           &response, err_code, "Pending_result::get()"))
  {
    return response;
  }
  // else if (err_code): Proceed.

  auto outcome = m_result.get(); // Blocks until resolved.
  if (std::holds_alternative<Error_code>(outcome))
  {
    *err_code = std::get<Error_code>(outcome);
    return Response_data();
  }
  // else
  err_code->clear();
  return std::move(std::get<Response_data>(outcome));
} // Pending_result::get()

const Request_descriptor& Pending_result::request() const
{
  return m_request;
}

std::ostream& operator<<(std::ostream& os, const Pending_result& val)
{
  return os << "slot[" << val.request() << "] " << (val.ready() ? "resolved" : "pending");
}

} // namespace xfer::transfer::detail
