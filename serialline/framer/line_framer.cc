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

#include "serialline/framer/line_framer.hpp"

namespace serialline {
namespace framer {

LineFramer::LineFramer(std::string_view delimiter, size_t max_length)
    : delimiter_(delimiter), max_length_(max_length) {
  if (delimiter_.empty()) {
    delimiter_ = base::constants::DEFAULT_RECEIVE_DELIMITER;
  }
}

void LineFramer::push_bytes(std::string_view data) {
  if (data.empty()) return;

  // Back up by delimiter length - 1 to catch split delimiters
  size_t search_from = buffer_.size() >= delimiter_.size() ? buffer_.size() - (delimiter_.size() - 1) : 0;
  buffer_.append(data.data(), data.size());

  size_t processed = 0;
  while (true) {
    size_t pos = buffer_.find(delimiter_, search_from);
    if (pos == std::string::npos) break;

    size_t len = pos - processed;
    if (discarding_) {
      // Tail of an oversized line
      discarding_ = false;
    } else if (len <= max_length_ && on_message_) {
      on_message_(std::string_view(buffer_.data() + processed, len));
    }

    processed = pos + delimiter_.size();
    search_from = processed;
  }

  if (processed > 0) {
    buffer_.erase(0, processed);
  }

  if (buffer_.size() > max_length_) {
    buffer_.clear();
    discarding_ = true;
  }
}

void LineFramer::set_on_message(MessageCallback cb) { on_message_ = std::move(cb); }

void LineFramer::reset() {
  buffer_.clear();
  discarding_ = false;
}

}  // namespace framer
}  // namespace serialline
