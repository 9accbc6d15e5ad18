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
#include "xfer/transfer/processor_config.hpp"
#include "xfer/transfer/error.hpp"
#include <flow/error/error.hpp>
#include <ostream>

namespace xfer::transfer
{

// Static initializations.

const util::Fine_duration Processor_config::S_DEFAULT_POLL_INTERVAL = boost::chrono::milliseconds(100);
const std::string Processor_config::S_DEFAULT_WORKER_NICKNAME = "xfer";

// Implementations.

Processor_config::Processor_config() :
  m_poll_interval(S_DEFAULT_POLL_INTERVAL),
  m_worker_nickname(S_DEFAULT_WORKER_NICKNAME),
  m_n_registry_shards(S_DEFAULT_N_REGISTRY_SHARDS)
{
  // That's it.
}

bool Processor_config::validate(flow::log::Logger* logger_ptr, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Processor_config::validate, logger_ptr, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSFER);

  if (m_poll_interval <= util::Fine_duration::zero())
  {
    FLOW_LOG_WARNING("Processor_config [" << *this << "]: Poll interval must be positive.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  if (m_worker_nickname.empty())
  {
    FLOW_LOG_WARNING("Processor_config [" << *this << "]: Worker nickname must not be empty.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  if (m_n_registry_shards == 0)
  {
    FLOW_LOG_WARNING("Processor_config [" << *this << "]: Registry shard count must be positive.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  err_code->clear();
  return true;
} // Processor_config::validate()

std::ostream& operator<<(std::ostream& os, const Processor_config& val)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  return os << "poll_interval[" << round<milliseconds>(val.m_poll_interval) << "] "
               "worker_nickname[" << val.m_worker_nickname << "] "
               "n_registry_shards[" << val.m_n_registry_shards << ']';
}

} // namespace xfer::transfer
