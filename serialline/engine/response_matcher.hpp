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
#include "serialline/engine/command.hpp"

namespace serialline {
namespace engine {

struct MatchResult {
  bool accumulate = false;
  bool complete = false;
};

/**
 * @brief Decides what an inbound line means for the head command.
 *
 * Stateless; the only side effect of evaluate() is appending to
 * Command::accumulated when the scan pattern matches. The scan check runs
 * before the completion check so a completing line that also matches the
 * scan pattern is part of the collected data.
 */
class SERIALLINE_API ResponseMatcher {
 public:
  static MatchResult evaluate(Command& command, const std::string& line);

  /**
   * @brief Value a completed command resolves with
   *
   * The accumulated lines when a scan pattern is set, otherwise the line
   * that completed the command.
   */
  static Response completion_data(Command& command, const std::string& completing_line);
};

}  // namespace engine
}  // namespace serialline
