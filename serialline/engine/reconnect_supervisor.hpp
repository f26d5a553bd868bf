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

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "serialline/base/visibility.hpp"

namespace serialline {
namespace engine {

namespace net = boost::asio;

enum class ConnectionState { Disconnected, Reconnecting, Connected };

SERIALLINE_API std::string to_string(ConnectionState state);

/**
 * @brief Whether another reopen attempt is allowed
 *
 * @param max_attempts -1 for unlimited, 0 to never retry
 * @param attempts_made attempts already made in this reconnect cycle
 */
inline bool should_retry(int max_attempts, uint32_t attempts_made) {
  if (max_attempts < 0) return true;
  return attempts_made < static_cast<uint32_t>(max_attempts);
}

/**
 * @brief Reopens the transport at a fixed interval after a disconnect.
 *
 * Disconnected -> Reconnecting on a transport disconnect (handlers are
 * re-installed first), Reconnecting -> Connected when an attempt succeeds,
 * Reconnecting -> Reconnecting when it fails. stop() returns to
 * Disconnected and schedules nothing. Member functions run on the strand
 * given to create(); state() may be read from any thread.
 */
class SERIALLINE_API ReconnectSupervisor : public std::enable_shared_from_this<ReconnectSupervisor> {
 public:
  using Strand = net::strand<net::io_context::executor_type>;
  using OpenCompletion = std::function<void(const boost::system::error_code&)>;
  using OpenFunction = std::function<void(OpenCompletion done)>;
  using Hook = std::function<void()>;
  using GiveUpHook = std::function<void(const boost::system::error_code& last_error, uint32_t attempts)>;

  struct Options {
    bool enabled = true;
    std::chrono::milliseconds interval{1000};
    int max_attempts = -1;
    std::string source;  // device path for reported failures
  };

  static std::shared_ptr<ReconnectSupervisor> create(Strand strand, Options options, OpenFunction open);

  // Called before every reconnect cycle so the transport handlers are fresh
  void on_reinstall(Hook hook);
  void on_reconnected(Hook hook);
  void on_give_up(GiveUpHook hook);

  /**
   * @brief The transport was opened by the user
   */
  void mark_connected();

  /**
   * @brief The transport reported a disconnect
   */
  void on_disconnect();

  /**
   * @brief User close or destroy; cancels any pending retry
   */
  void stop();

  ConnectionState state() const { return state_.load(); }
  uint32_t attempts() const { return attempts_; }

 private:
  ReconnectSupervisor(Strand strand, Options options, OpenFunction open);

  void schedule_attempt();
  void attempt(uint64_t generation);
  void on_attempt_result(uint64_t generation, const boost::system::error_code& ec);

 private:
  Strand strand_;
  Options options_;
  OpenFunction open_;
  net::steady_timer timer_;

  Hook on_reinstall_;
  Hook on_reconnected_;
  GiveUpHook on_give_up_;

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  uint32_t attempts_ = 0;
  // Bumped on every transition out of Reconnecting; stale timer or open
  // completions compare against it
  uint64_t generation_ = 0;
};

}  // namespace engine
}  // namespace serialline
