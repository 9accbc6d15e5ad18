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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <boost/unordered_map.hpp>
#include <string>

namespace xfer
{

// Types.

#ifndef XFER_DOXYGEN_ONLY // Doxygen sees the placeholder in xfer/common.hpp instead.

/* Generate `enum class Log_component` and the extern declaration of S_XFER_LOG_COMPONENT_NAME_MAP via flow::log
 * macro magic; the members come from log_component_enum_declare.macros.hpp.  The counterpart in detail/common.cpp
 * defines the map. */
#define FLOW_LOG_CFG_COMPONENT_ENUM_CLASS Log_component
#define FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_XFER_LOG_COMPONENT_NAME_MAP
#include <flow/log/macros/config_enum_start_hdr.macros.hpp>
#include "xfer/detail/macros/log_component_enum_declare.macros.hpp"
#include <flow/log/macros/config_enum_end_hdr.macros.hpp>

#endif // XFER_DOXYGEN_ONLY

} // namespace xfer
