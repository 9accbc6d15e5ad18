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

namespace xfer::transfer
{

// Types.

/**
 * Tunables of a Transfer_processor, given to its constructor.  A default-constructed object holds the defaults,
 * which are reasonable for production; tests typically shorten #m_poll_interval.
 */
struct Processor_config
{
  // Constants.

  /// Default for #m_poll_interval.
  static const util::Fine_duration S_DEFAULT_POLL_INTERVAL;

  /// Default for #m_worker_nickname.
  static const std::string S_DEFAULT_WORKER_NICKNAME;

  /// Default for #m_n_registry_shards.
  static constexpr size_t S_DEFAULT_N_REGISTRY_SHARDS = 16;

  // Constructors/destructor.

  /// Constructs with every field at its default.
  Processor_config();

  // Methods.

  /**
   * Checks the fields for validity.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (some field has an invalid value; it is logged if `logger_ptr`).
   * @param logger_ptr
   *        Logger to use for logging the problem, if any.
   * @return `true` if valid; `false` otherwise.
   */
  bool validate(flow::log::Logger* logger_ptr, Error_code* err_code = 0) const;

  // Data.

  /**
   * How long each poll dispatched by a waiting caller may block inside the engine waiting for completions.
   * Longer means fewer idle polls; shorter means a poll that returns nothing frees the worker sooner for other
   * dispatches (such as a cancel).  Must be positive.
   */
  util::Fine_duration m_poll_interval;

  /// Human-readable name used for the worker thread and in logging.  Must not be empty.
  std::string m_worker_nickname;

  /// Number of lock stripes in the in-flight request table; more means less contention.  Must be positive.
  size_t m_n_registry_shards;
}; // struct Processor_config

} // namespace xfer::transfer
