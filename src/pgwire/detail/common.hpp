/* Flow-PG: Stream
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

namespace pgwire
{

// Types.

#ifndef PGWIRE_DOXYGEN_ONLY // See pgwire::Log_component doc header in common.hpp instead.

#  undef FLOW_LOG_CFG_COMPONENT_ENUM_CLASS
#  undef FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP_OBJ
#  define FLOW_LOG_CFG_COMPONENT_ENUM_CLASS Log_component
#  define FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP_OBJ S_PGWIRE_LOG_COMPONENT_NAME_MAP
#  include <flow/log/macros/config_enum_start_hdr.macros.hpp>
#  include "pgwire/detail/macros/log_component_enum_declare.macros.hpp"
#  include <flow/log/macros/config_enum_end_hdr.macros.hpp>
#  undef FLOW_LOG_CFG_COMPONENT_ENUM_CLASS
#  undef FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP_OBJ

#endif // PGWIRE_DOXYGEN_ONLY

} // namespace pgwire
