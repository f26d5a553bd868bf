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

#include <boost/system/error_code.hpp>
#include <chrono>
#include <string>
#include <utility>

#include "serialline/base/visibility.hpp"

namespace serialline {
namespace diagnostics {

enum class ErrorLevel { INFO = 0, WARNING = 1, ERROR = 2, CRITICAL = 3 };

enum class ErrorCategory {
  CONNECTION = 0,     // Port open/close/disconnect/reconnect
  COMMUNICATION = 1,  // Writes, responses, timeouts
  CONFIGURATION = 2,  // Invalid settings or arguments
  SYSTEM = 3,         // Callback failures
  UNKNOWN = 4
};

SERIALLINE_API std::string to_string(ErrorLevel level);
SERIALLINE_API std::string to_string(ErrorCategory category);

/**
 * @brief One failure observed by an engine or one of its parts
 *
 * source is the device path of the engine that saw the failure, or empty
 * for failures not tied to a device (configuration files).
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string source;
  std::string component;  // engine, command_queue, serial, reconnect, ...
  std::string operation;  // open, write, response, attempt, ...
  std::string message;
  boost::system::error_code error;
  bool retryable = false;
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

  ErrorInfo(ErrorLevel l, ErrorCategory c, std::string src, std::string comp, std::string op, std::string msg,
            const boost::system::error_code& ec = boost::system::error_code{}, bool retry = false)
      : level(l),
        category(c),
        source(std::move(src)),
        component(std::move(comp)),
        operation(std::move(op)),
        message(std::move(msg)),
        error(ec),
        retryable(retry) {}

  // "[ERROR] /dev/ttyUSB0 command_queue/response: ... (code 125) [retryable]"
  std::string summary() const;
};

}  // namespace diagnostics
}  // namespace serialline
