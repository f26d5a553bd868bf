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

#include <cstdint>
#include <string>

#include "serialline/base/error_codes.hpp"
#include "serialline/builder/engine_builder.hpp"
#include "serialline/config/config_loader.hpp"
#include "serialline/config/engine_config.hpp"
#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/exceptions.hpp"
#include "serialline/diagnostics/logger.hpp"
#include "serialline/engine/serial_line_engine.hpp"

namespace serialline {

// === Public API ===

using engine::ConnectionState;
using engine::EngineEvent;
using engine::EventKind;
using engine::Pattern;
using engine::Response;
using engine::SendOptions;
using engine::SerialLineEngine;
using engine::SubscriptionId;
using engine::WatcherId;

/**
 * @brief Create an engine builder for a serial device
 * @param device The serial device path (e.g., "/dev/ttyUSB0")
 * @param baud_rate The baud rate for serial communication
 */
inline builder::EngineBuilder line(const std::string& device, uint32_t baud_rate) {
  return builder::EngineBuilder(device, baud_rate);
}

}  // namespace serialline
