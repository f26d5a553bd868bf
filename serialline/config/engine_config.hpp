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

#include "serialline/base/constants.hpp"
#include "serialline/config/serial_config.hpp"

namespace serialline {
namespace config {

/**
 * @brief Settings for one SerialLineEngine
 *
 * A bare device name is enough to get a usable configuration; everything
 * else falls back to the defaults below.
 */
struct EngineConfig {
  SerialConfig serial;

  unsigned default_timeout_ms = base::constants::DEFAULT_RESPONSE_TIMEOUT_MS;
  std::string send_eol = base::constants::DEFAULT_SEND_EOL;
  std::string receive_delimiter = base::constants::DEFAULT_RECEIVE_DELIMITER;
  size_t max_line_length = base::constants::DEFAULT_MAX_LINE_LENGTH;

  bool reconnect_on_disconnect = true;
  unsigned retry_interval_ms = base::constants::DEFAULT_RETRY_INTERVAL_MS;
  int max_reconnect_attempts = base::constants::DEFAULT_MAX_RETRIES;  // -1 = unlimited

  // Fail queued commands with NotOpenError when the port drops
  bool fail_pending_on_disconnect = false;

  // Log tx/rx traffic at INFO instead of DEBUG
  bool verbose = false;

  EngineConfig() = default;
  explicit EngineConfig(const std::string& device) : serial(device) {}

  bool is_valid() const {
    return serial.is_valid() && default_timeout_ms >= base::constants::MIN_RESPONSE_TIMEOUT_MS &&
           default_timeout_ms <= base::constants::MAX_RESPONSE_TIMEOUT_MS && !receive_delimiter.empty() &&
           max_line_length >= base::constants::MIN_MAX_LINE_LENGTH &&
           retry_interval_ms >= base::constants::MIN_RETRY_INTERVAL_MS &&
           retry_interval_ms <= base::constants::MAX_RETRY_INTERVAL_MS &&
           (max_reconnect_attempts == -1 ||
            (max_reconnect_attempts >= 0 && max_reconnect_attempts <= base::constants::MAX_RETRIES_LIMIT));
  }

  void validate_and_clamp() {
    serial.validate_and_clamp();

    if (default_timeout_ms < base::constants::MIN_RESPONSE_TIMEOUT_MS) {
      default_timeout_ms = base::constants::MIN_RESPONSE_TIMEOUT_MS;
    } else if (default_timeout_ms > base::constants::MAX_RESPONSE_TIMEOUT_MS) {
      default_timeout_ms = base::constants::MAX_RESPONSE_TIMEOUT_MS;
    }

    if (receive_delimiter.empty()) receive_delimiter = base::constants::DEFAULT_RECEIVE_DELIMITER;

    if (max_line_length < base::constants::MIN_MAX_LINE_LENGTH) {
      max_line_length = base::constants::MIN_MAX_LINE_LENGTH;
    }

    if (retry_interval_ms < base::constants::MIN_RETRY_INTERVAL_MS) {
      retry_interval_ms = base::constants::MIN_RETRY_INTERVAL_MS;
    } else if (retry_interval_ms > base::constants::MAX_RETRY_INTERVAL_MS) {
      retry_interval_ms = base::constants::MAX_RETRY_INTERVAL_MS;
    }

    if (max_reconnect_attempts < -1) {
      max_reconnect_attempts = -1;
    } else if (max_reconnect_attempts > base::constants::MAX_RETRIES_LIMIT) {
      max_reconnect_attempts = base::constants::MAX_RETRIES_LIMIT;
    }
  }
};

}  // namespace config
}  // namespace serialline
