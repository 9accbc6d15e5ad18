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
#include "xfer/transfer/completion_record.hpp"
#include <ostream>

namespace xfer::transfer
{

// Implementations.

Completion_record::Completion_record(const Request_descriptor& request, Outcome&& outcome) :
  m_request(request),
  m_outcome(std::move(outcome))
{
  // Yeah.
}

Completion_record Completion_record::success(const Request_descriptor& request, Response_data&& response) // Static.
{
  return Completion_record(request, Outcome(std::in_place_type<Response_data>, std::move(response)));
}

Completion_record Completion_record::failure(const Request_descriptor& request, const Error_code& cause) // Static.
{
  assert(cause && "A failure record must carry a truthy cause.");
  return Completion_record(request, Outcome(std::in_place_type<Error_code>, cause));
}

const Request_descriptor& Completion_record::request() const
{
  return m_request;
}

bool Completion_record::succeeded() const
{
  return std::holds_alternative<Response_data>(m_outcome);
}

const Response_data& Completion_record::response() const
{
  assert(succeeded());
  return std::get<Response_data>(m_outcome);
}

Response_data&& Completion_record::release_response()
{
  assert(succeeded());
  return std::move(std::get<Response_data>(m_outcome));
}

Error_code Completion_record::cause() const
{
  return succeeded() ? Error_code() : std::get<Error_code>(m_outcome);
}

std::ostream& operator<<(std::ostream& os, const Response_data& val)
{
  return os << "status[" << val.m_status_code << "] hdrs[" << val.m_headers.size() << "] "
               "body[" << val.m_body.size() << "b]";
}

std::ostream& operator<<(std::ostream& os, const Completion_record& val)
{
  os << '[' << val.request() << "] => ";
  if (val.succeeded())
  {
    return os << "success [" << val.response() << ']';
  }
  // else
  const auto cause = val.cause();
  return os << "failure [" << cause << "] [" << cause.message() << ']';
}

} // namespace xfer::transfer
