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

#include "serialline/base/constants.hpp"

namespace serialline {
namespace config {

struct SerialConfig {
#ifdef _WIN32
  std::string device = "COM1";
#else
  std::string device = "/dev/ttyUSB0";
#endif
  uint32_t baud_rate = base::constants::DEFAULT_BAUD_RATE;
  unsigned char_size = 8;  // 5,6,7,8
  enum class Parity { None, Even, Odd } parity = Parity::None;
  unsigned stop_bits = 1;  // 1 or 2
  enum class Flow { None, Software, Hardware } flow = Flow::None;

  size_t read_chunk = base::constants::DEFAULT_READ_BUFFER_SIZE;

  SerialConfig() = default;
  explicit SerialConfig(const std::string& dev) : device(dev) {}

  bool is_valid() const {
    return !device.empty() && device.size() <= base::constants::MAX_DEVICE_PATH_LENGTH &&
           baud_rate >= base::constants::MIN_BAUD_RATE && baud_rate <= base::constants::MAX_BAUD_RATE &&
           char_size >= 5 && char_size <= 8 && (stop_bits == 1 || stop_bits == 2) && read_chunk > 0;
  }

  // Apply validation and clamp values to valid ranges
  void validate_and_clamp() {
    if (baud_rate < base::constants::MIN_BAUD_RATE) {
      baud_rate = base::constants::MIN_BAUD_RATE;
    } else if (baud_rate > base::constants::MAX_BAUD_RATE) {
      baud_rate = base::constants::MAX_BAUD_RATE;
    }

    if (char_size < 5)
      char_size = 5;
    else if (char_size > 8)
      char_size = 8;

    if (stop_bits != 1 && stop_bits != 2) stop_bits = 1;

    if (read_chunk == 0) read_chunk = base::constants::DEFAULT_READ_BUFFER_SIZE;
  }
};

}  // namespace config
}  // namespace serialline
