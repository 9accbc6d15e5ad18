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
#include "xfer/transfer/request_descriptor.hpp"
#include <boost/functional/hash/hash.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <ostream>

namespace xfer::transfer
{

// Static initializations.

std::atomic<request_id_t> Request_descriptor::s_next_id(1);

// Implementations.

Request_descriptor::Request_descriptor(util::String_view method, util::String_view target,
                                       Headers headers, std::string body,
                                       util::Fine_duration connect_timeout,
                                       util::Fine_duration request_timeout) :
  m_id(s_next_id.fetch_add(1, std::memory_order_relaxed)),
  m_method(method),
  m_target(target),
  m_headers(std::move(headers)),
  m_body(std::move(body)),
  m_connect_timeout(connect_timeout),
  m_request_timeout(request_timeout)
{
  // That's it.
}

request_id_t Request_descriptor::id() const
{
  return m_id;
}

const std::string& Request_descriptor::method() const
{
  return m_method;
}

const std::string& Request_descriptor::target() const
{
  return m_target;
}

const Headers& Request_descriptor::headers() const
{
  return m_headers;
}

const std::string& Request_descriptor::body() const
{
  return m_body;
}

util::Fine_duration Request_descriptor::connect_timeout() const
{
  return m_connect_timeout;
}

util::Fine_duration Request_descriptor::request_timeout() const
{
  return m_request_timeout;
}

bool operator==(const Request_descriptor& val1, const Request_descriptor& val2)
{
  return val1.id() == val2.id();
}

bool operator!=(const Request_descriptor& val1, const Request_descriptor& val2)
{
  return !(val1 == val2);
}

bool operator<(const Request_descriptor& val1, const Request_descriptor& val2)
{
  return val1.id() < val2.id();
}

size_t hash_value(const Request_descriptor& val)
{
  using boost::hash;
  return hash<request_id_t>()(val.id());
}

std::ostream& operator<<(std::ostream& os, const Request_descriptor& val)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  os << "req#" << val.id() << " [" << val.method() << ' ' << val.target() << "] "
        "hdrs[" << val.headers().size() << "] body[" << val.body().size() << "b]";
  if (val.connect_timeout() != util::Fine_duration::zero())
  {
    os << " conn_to[" << round<milliseconds>(val.connect_timeout()) << ']';
  }
  if (val.request_timeout() != util::Fine_duration::zero())
  {
    os << " req_to[" << round<milliseconds>(val.request_timeout()) << ']';
  }
  return os;
}

} // namespace xfer::transfer

size_t std::hash<::xfer::transfer::Request_descriptor>::operator()
         (const ::xfer::transfer::Request_descriptor& val) const
{
  return ::xfer::transfer::hash_value(val);
}
