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

/* flow/common.hpp (pulled in by flow/util/util.hpp) #undef-s and #define-s FLOW_LOG_CFG_COMPONENT_ENUM_* for its
 * own purposes; so it must come before xfer/detail/common.hpp which does the same for ours. */
#include <flow/util/util.hpp>

#include "xfer/detail/common.hpp"

/* We build in C++17 mode; the APIs and header-inlined stuff (the class templates in particular) require the same
 * of any `#include`ing translation unit.  Enforce it. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any xfer/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-Xfer project: a library/API in modern C++17 that lets any number of threads
 * perform network transfers through a single-threaded, non-thread-safe native transfer engine.
 *
 * @note Nomenclature: The project is called Flow-Xfer.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in `xfer`: Key symbols, namely #Error_code, #Function, and the `flow::log` component
 *     `enum class` xfer::Log_component with its name map.
 *   - Sub-namespaces:
 *     - xfer::transfer is the main module: xfer::transfer::Transfer_processor is the entry point; it is built on
 *       xfer::transfer::Transfer_worker, the thread that owns the native engine (see the `Transfer_engine`
 *       concept).  Caller-side cancellation is xfer::transfer::Cancellation_context.
 *     - xfer::util contains miscellaneous aliases and facilities used throughout.
 *     - xfer::test (not part of the library proper) holds test-only facilities such as a scriptable engine.
 *
 * Flow-Xfer is built on Flow (`flow::log`, `flow::async`, `flow::error`) and Boost; familiarity with those
 * conventions (`Error_code* err_code` out-args, `Log_context`, `Single_thread_task_loop`) is assumed.
 */
namespace xfer
{

// Types.  They're outside of `namespace ::xfer::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef XFER_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-Xfer internal
 * logging.  The user specifies it, rarely, when configuring their program's logging such as via
 * `flow::log::Config::init_component_to_union_idx_mapping()` and `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are generated by `flow::log` macro magic and are listed in the source file
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /**
   * CAUTION -- see xfer::Log_component doc header for directions to find actual members of this
   * `enum class`.  This entry is a placeholder for Doxygen purposes only.
   */
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in xfer::Log_component to its
 * string representation as used in log output and verbosity config.
 *
 * @see xfer::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_XFER_LOG_COMPONENT_NAME_MAP;

#endif // XFER_DOXYGEN_ONLY

} // namespace xfer
