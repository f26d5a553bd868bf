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

#include "serialline/engine/response_matcher.hpp"

namespace serialline {
namespace engine {

MatchResult ResponseMatcher::evaluate(Command& command, const std::string& line) {
  MatchResult result;

  if (command.scan && command.scan->search(line)) {
    command.accumulated.push_back(line);
    result.accumulate = true;
  }

  if (command.response && command.response->search(line)) {
    result.complete = true;
  }

  return result;
}

Response ResponseMatcher::completion_data(Command& command, const std::string& completing_line) {
  if (command.scan) {
    return Response{std::move(command.accumulated)};
  }
  return Response{completing_line};
}

}  // namespace engine
}  // namespace serialline
