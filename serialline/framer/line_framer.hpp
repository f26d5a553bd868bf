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

#include <functional>
#include <string>
#include <string_view>

#include "serialline/base/constants.hpp"
#include "serialline/base/visibility.hpp"

namespace serialline {
namespace framer {

/**
 * @brief Splits a byte stream into delimiter-terminated text lines.
 *
 * The delimiter is not part of the emitted line. Anything before it,
 * including a trailing '\r' of a CRLF sender, is kept.
 */
class SERIALLINE_API LineFramer {
 public:
  using MessageCallback = std::function<void(std::string_view)>;

  /**
   * @param delimiter The delimiter string (default: "\n")
   * @param max_length Maximum line length; longer lines are dropped
   */
  explicit LineFramer(std::string_view delimiter = base::constants::DEFAULT_RECEIVE_DELIMITER,
                      size_t max_length = base::constants::DEFAULT_MAX_LINE_LENGTH);

  void push_bytes(std::string_view data);
  void set_on_message(MessageCallback cb);

  /**
   * @brief Drop any buffered partial line
   *
   * Called when the port is (re)opened or closed.
   */
  void reset();

  size_t buffered() const { return buffer_.size(); }

 private:
  std::string delimiter_;
  size_t max_length_;

  std::string buffer_;
  // Oversized partial line is being discarded up to the next delimiter
  bool discarding_ = false;
  MessageCallback on_message_;
};

}  // namespace framer
}  // namespace serialline
