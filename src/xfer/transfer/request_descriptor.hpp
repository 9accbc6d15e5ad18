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

#include "xfer/transfer/transfer_fwd.hpp"
#include <atomic>

namespace xfer::transfer
{

// Types.

/**
 * Immutable description of one logical transfer, as submitted to Transfer_processor::execute_request() and handed
 * (by copy) to the native transfer engine.  It carries what the engine needs to perform the transfer -- method,
 * target, headers, body, timeouts -- and an *identity*.
 *
 * ### Identity ###
 * Each constructor invocation (other than copy/move) assigns a new process-unique identity, id().  Copies share the
 * identity of their source.  Equality (`==`), ordering and `hash_value()` are in terms of identity only; hence
 * two descriptors built separately from the same arguments are different requests, while the copy the engine
 * echoes back inside a Completion_record is the same request as the one the caller submitted.  This is what lets
 * a completion be matched with its waiting caller.
 *
 * The object holds no references to outside storage, so it is safe to copy into another thread and use there.
 *
 * ### Thread safety ###
 * All accessors are `const`, and there are no mutators; so concurrent access to one object is safe.
 */
class Request_descriptor
{
public:
  // Constructors/destructor.

  /**
   * Constructs a descriptor with a new identity.
   *
   * @param method
   *        Request method, such as `"GET"`.  Interpreted by the engine.
   * @param target
   *        Request target, such as a URL.  Interpreted by the engine.
   * @param headers
   *        Request headers.
   * @param body
   *        Request body (possibly empty).
   * @param connect_timeout
   *        Timeout for establishing the connection; zero means the engine's default.
   * @param request_timeout
   *        Timeout for the entire transfer; zero means the engine's default.
   */
  explicit Request_descriptor(util::String_view method, util::String_view target,
                              Headers headers = Headers(), std::string body = std::string(),
                              util::Fine_duration connect_timeout = util::Fine_duration::zero(),
                              util::Fine_duration request_timeout = util::Fine_duration::zero());

  // Methods.

  /**
   * Identity; see class doc header.
   * @return See above.
   */
  request_id_t id() const;

  /**
   * Request method.
   * @return See above.
   */
  const std::string& method() const;

  /**
   * Request target.
   * @return See above.
   */
  const std::string& target() const;

  /**
   * Request headers, in the order given to ctor.
   * @return See above.
   */
  const Headers& headers() const;

  /**
   * Request body.
   * @return See above.
   */
  const std::string& body() const;

  /**
   * Connection-establishment timeout; zero means the engine's default.
   * @return See above.
   */
  util::Fine_duration connect_timeout() const;

  /**
   * Overall transfer timeout; zero means the engine's default.
   * @return See above.
   */
  util::Fine_duration request_timeout() const;

private:
  // Data.

  /// Source of id() values for newly constructed descriptors.  Starts at 1 so that 0 never identifies a request.
  static std::atomic<request_id_t> s_next_id;

  /// See id().
  request_id_t m_id;

  /// See method().
  std::string m_method;

  /// See target().
  std::string m_target;

  /// See headers().
  Headers m_headers;

  /// See body().
  std::string m_body;

  /// See connect_timeout().
  util::Fine_duration m_connect_timeout;

  /// See request_timeout().
  util::Fine_duration m_request_timeout;
}; // class Request_descriptor

} // namespace xfer::transfer

namespace std
{

/// Hash functor for Request_descriptor, so that it can key `std::unordered_*` containers too.
template<>
struct hash<::xfer::transfer::Request_descriptor>
{
  /**
   * Forwards to `hash_value()`.
   * @param val
   *        Object to hash.
   * @return See above.
   */
  size_t operator()(const ::xfer::transfer::Request_descriptor& val) const;
};

} // namespace std
