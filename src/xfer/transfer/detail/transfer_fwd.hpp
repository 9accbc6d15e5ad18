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

namespace xfer::transfer::detail
{

// Types.

// Find doc headers near the bodies of these compound types.

class Pending_result;
class Pending_result_registry;

// Free functions.

/**
 * Prints string representation of the given Pending_result to the given `ostream`.
 *
 * @relatesalso Pending_result
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pending_result& val);

/**
 * Prints string representation of the given Pending_result_registry to the given `ostream`.
 *
 * @relatesalso Pending_result_registry
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pending_result_registry& val);

} // namespace xfer::transfer::detail
