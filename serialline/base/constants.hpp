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

#include <cstddef>
#include <cstdint>

namespace serialline {
namespace base {
namespace constants {

// Command response constants
constexpr unsigned DEFAULT_RESPONSE_TIMEOUT_MS = 1000;  // 1 second
constexpr unsigned MIN_RESPONSE_TIMEOUT_MS = 1;         // 1ms minimum
constexpr unsigned MAX_RESPONSE_TIMEOUT_MS = 600000;    // 10 minutes maximum

// Line terminators
constexpr const char* DEFAULT_SEND_EOL = "\r\n";
constexpr const char* DEFAULT_RECEIVE_DELIMITER = "\n";
constexpr size_t DEFAULT_MAX_LINE_LENGTH = 65536;  // 64KB
constexpr size_t MIN_MAX_LINE_LENGTH = 16;

// Reconnect constants
constexpr unsigned DEFAULT_RETRY_INTERVAL_MS = 1000;  // 1 second
constexpr unsigned MIN_RETRY_INTERVAL_MS = 10;        // 10ms minimum
constexpr unsigned MAX_RETRY_INTERVAL_MS = 300000;    // 5 minutes maximum
constexpr int DEFAULT_MAX_RETRIES = -1;               // Unlimited retries
constexpr int MAX_RETRIES_LIMIT = 100000;

// Serial port constants
constexpr uint32_t DEFAULT_BAUD_RATE = 9600;
constexpr uint32_t MIN_BAUD_RATE = 50;
constexpr uint32_t MAX_BAUD_RATE = 4000000;
constexpr size_t DEFAULT_READ_BUFFER_SIZE = 4096;
constexpr size_t MAX_DEVICE_PATH_LENGTH = 256;

// Error history
constexpr size_t MAX_COMPONENT_ERRORS = 100;

}  // namespace constants
}  // namespace base
}  // namespace serialline
