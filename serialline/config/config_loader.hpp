/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>

#include "serialline/base/visibility.hpp"
#include "serialline/config/engine_config.hpp"

namespace serialline {
namespace config {

/**
 * @brief Load an EngineConfig from a YAML file
 *
 * Recognized keys:
 *   device, baud_rate, char_size, parity (none|even|odd), stop_bits,
 *   flow (none|software|hardware), read_chunk, timeout_ms, send_eol,
 *   receive_delimiter, max_line_length, reconnect, retry_interval_ms,
 *   max_reconnect_attempts, fail_pending_on_disconnect, verbose
 *
 * Unknown keys are ignored. Missing keys keep their defaults.
 *
 * @throws diagnostics::ConfigurationError if the file cannot be read or a
 *         value has the wrong type or is out of range
 */
SERIALLINE_API EngineConfig load_engine_config(const std::string& path);

/**
 * @brief Same as load_engine_config but parses YAML text directly
 */
SERIALLINE_API EngineConfig parse_engine_config(const std::string& yaml_text);

}  // namespace config
}  // namespace serialline
