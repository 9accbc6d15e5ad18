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

#include "xfer/common.hpp"
#include <flow/log/log.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/locks.hpp>

/**
 * Flow-Xfer module containing miscellaneous general-use facilities used by the other Flow-Xfer modules.
 * Mostly these are short-hands for Flow types, so that Flow-Xfer code and user code alike can say
 * `util::Fine_duration`.
 */
namespace xfer::util
{

// Types.

/// Short-hand for standard thread-safe-mutex type.
using Mutex_non_recursive = flow::util::Mutex_non_recursive;

/**
 * Short-hand for a reader/writer mutex: many holders of the shared lock or one holder of the exclusive lock.
 * Used where a frequently-taken operation must exclude a rare state-changing one (e.g., dispatch versus shutdown).
 */
using Mutex_shared_non_recursive = boost::shared_mutex;

/// Short-hand for the shared (reader) lock on #Mutex_shared_non_recursive.
using Lock_guard_shared_non_recursive_sh = boost::shared_lock<Mutex_shared_non_recursive>;

/// Short-hand for the exclusive (writer) lock on #Mutex_shared_non_recursive.
using Lock_guard_shared_non_recursive_ex = boost::unique_lock<Mutex_shared_non_recursive>;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

} // namespace xfer::util
