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

#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "serialline/engine/pattern.hpp"

namespace serialline {
namespace engine {

/**
 * @brief Result of a send()
 *
 * - std::monostate: the command completed without data (no response pattern)
 * - std::string: the line that matched the response pattern
 * - std::vector<std::string>: the lines collected by the scan pattern
 */
using Response = std::variant<std::monostate, std::string, std::vector<std::string>>;

/**
 * @brief Per-call overrides for send()
 */
struct SendOptions {
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<Pattern> scan;
  std::optional<std::string> eol;
};

enum class CommandState { Pending, Completed, Failed };

/**
 * @brief One queued request, owned by the CommandQueue until it resolves.
 */
struct Command {
  std::string text;
  std::optional<Pattern> response;
  std::optional<Pattern> scan;
  std::chrono::milliseconds timeout{0};
  std::string eol;

  std::vector<std::string> accumulated;
  CommandState state = CommandState::Pending;
  // Set once the write has been handed to the transport
  bool written = false;
  uint64_t sequence = 0;

  std::promise<Response> promise;

  std::string wire_text() const { return text + eol; }
  bool is_pending() const { return state == CommandState::Pending; }
};

}  // namespace engine
}  // namespace serialline
