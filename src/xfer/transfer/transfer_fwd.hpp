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

#include "xfer/util/util_fwd.hpp"
#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <iosfwd>

/**
 * Flow-Xfer module providing network transfers, performed by a single-threaded native transfer engine, on behalf of
 * any number of concurrent callers.  A synopsis follows.
 *
 * The user-facing entry point is class template Transfer_processor, parameterized on a type satisfying the
 * `Transfer_engine` concept (see transfer_engine.hpp).  The engine is not thread-safe, so Transfer_processor
 * confines it to one thread owned by a Transfer_worker; every engine call (schedule, poll, cancel, close) is
 * marshaled onto that thread.  A caller describes a transfer with a Request_descriptor and invokes
 * Transfer_processor::execute_request(), which blocks until exactly one outcome is available: Response_data on
 * success, an #Error_code otherwise.  Optionally the caller passes a Cancellation_context, which it (or anyone)
 * may later trigger to abort the transfer.
 *
 * Outcomes come out of the engine as Completion_record batches.  There is no dedicated thread waiting for them:
 * each blocked caller itself dispatches polls and distributes every record it obtains to the matching waiting
 * caller (see detail::Pending_result_registry); so a batch polled by one caller may complete many others.
 */
namespace xfer::transfer
{

// Types.

// Find doc headers near the bodies of these compound types.

class Request_descriptor;
struct Response_data;
class Completion_record;
class Cancellation_context;
struct Processor_config;
template<typename Transfer_engine>
class Transfer_worker;
template<typename Transfer_engine>
class Transfer_processor;

/// Process-unique identity of a Request_descriptor; shared by copies of the same descriptor.
using request_id_t = uint64_t;

/// Sequence of (name, value) header pairs; order is preserved, and names may repeat.
using Headers = std::vector<std::pair<std::string, std::string>>;

// Free functions.

/**
 * Prints string representation of the given Request_descriptor to the given `ostream`.
 *
 * @relatesalso Request_descriptor
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Request_descriptor& val);

/**
 * Returns `true` if and only if the two descriptors have the same identity, i.e., one is a copy of the other.
 * Two separately constructed descriptors with identical contents are *not* equal.
 *
 * @relatesalso Request_descriptor
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Request_descriptor& val1, const Request_descriptor& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Request_descriptor
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Request_descriptor& val1, const Request_descriptor& val2);

/**
 * Orders by identity (which increases in order of construction).
 *
 * @relatesalso Request_descriptor
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator<(const Request_descriptor& val1, const Request_descriptor& val2);

/**
 * Hash consistent with `==`, for boost.unordered and friends.
 *
 * @relatesalso Request_descriptor
 *
 * @param val
 *        Object to hash.
 * @return See above.
 */
size_t hash_value(const Request_descriptor& val);

/**
 * Prints string representation of the given Response_data to the given `ostream`.  The body is not printed,
 * only its size.
 *
 * @relatesalso Response_data
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Response_data& val);

/**
 * Prints string representation of the given Completion_record to the given `ostream`.
 *
 * @relatesalso Completion_record
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Completion_record& val);

/**
 * Prints string representation of the given Cancellation_context to the given `ostream`.
 *
 * @relatesalso Cancellation_context
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Cancellation_context& val);

/**
 * Prints string representation of the given Processor_config (every field) to the given `ostream`.
 *
 * @relatesalso Processor_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Processor_config& val);

/**
 * Prints string representation of the given Transfer_worker to the given `ostream`.
 *
 * @relatesalso Transfer_worker
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Transfer_engine>
std::ostream& operator<<(std::ostream& os, const Transfer_worker<Transfer_engine>& val);

/**
 * Prints string representation of the given Transfer_processor to the given `ostream`.
 *
 * @relatesalso Transfer_processor
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Transfer_engine>
std::ostream& operator<<(std::ostream& os, const Transfer_processor<Transfer_engine>& val);

} // namespace xfer::transfer
