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

#include "serialline/engine/reconnect_supervisor.hpp"

#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/logger.hpp"

namespace serialline {
namespace engine {

std::string to_string(ConnectionState state) {
  switch (state) {
    case ConnectionState::Disconnected:
      return "Disconnected";
    case ConnectionState::Reconnecting:
      return "Reconnecting";
    case ConnectionState::Connected:
      return "Connected";
  }
  return "Unknown";
}

std::shared_ptr<ReconnectSupervisor> ReconnectSupervisor::create(Strand strand, Options options, OpenFunction open) {
  return std::shared_ptr<ReconnectSupervisor>(new ReconnectSupervisor(std::move(strand), options, std::move(open)));
}

ReconnectSupervisor::ReconnectSupervisor(Strand strand, Options options, OpenFunction open)
    : strand_(std::move(strand)), options_(options), open_(std::move(open)), timer_(strand_) {}

void ReconnectSupervisor::on_reinstall(Hook hook) { on_reinstall_ = std::move(hook); }
void ReconnectSupervisor::on_reconnected(Hook hook) { on_reconnected_ = std::move(hook); }
void ReconnectSupervisor::on_give_up(GiveUpHook hook) { on_give_up_ = std::move(hook); }

void ReconnectSupervisor::mark_connected() {
  ++generation_;
  timer_.cancel();
  state_.store(ConnectionState::Connected);
}

void ReconnectSupervisor::on_disconnect() {
  if (state_.load() != ConnectionState::Connected) {
    return;
  }

  ++generation_;
  state_.store(ConnectionState::Disconnected);
  if (!options_.enabled || options_.max_attempts == 0) {
    SERIALLINE_LOG_INFO("reconnect", "disconnect", "Port disconnected; reconnect disabled");
    return;
  }

  state_.store(ConnectionState::Reconnecting);
  attempts_ = 0;
  if (on_reinstall_) on_reinstall_();
  SERIALLINE_LOG_INFO("reconnect", "disconnect",
                      "Port disconnected; retrying every " + std::to_string(options_.interval.count()) + " ms");
  schedule_attempt();
}

void ReconnectSupervisor::stop() {
  ++generation_;
  timer_.cancel();
  state_.store(ConnectionState::Disconnected);
}

void ReconnectSupervisor::schedule_attempt() {
  const uint64_t generation = generation_;
  std::weak_ptr<ReconnectSupervisor> weak = weak_from_this();
  timer_.expires_after(options_.interval);
  timer_.async_wait(net::bind_executor(strand_, [weak, generation](const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted) return;
    if (auto self = weak.lock()) {
      self->attempt(generation);
    }
  }));
}

void ReconnectSupervisor::attempt(uint64_t generation) {
  if (generation != generation_ || state_.load() != ConnectionState::Reconnecting) {
    return;
  }

  ++attempts_;
  // A transport may drop its handlers only after reporting the disconnect
  if (on_reinstall_) on_reinstall_();
  SERIALLINE_LOG_DEBUG("reconnect", "attempt", "Reopen attempt " + std::to_string(attempts_));

  std::weak_ptr<ReconnectSupervisor> weak = weak_from_this();
  auto strand = strand_;
  open_([weak, strand, generation](const boost::system::error_code& ec) {
    net::post(strand, [weak, generation, ec] {
      if (auto self = weak.lock()) {
        self->on_attempt_result(generation, ec);
      }
    });
  });
}

void ReconnectSupervisor::on_attempt_result(uint64_t generation, const boost::system::error_code& ec) {
  if (generation != generation_ || state_.load() != ConnectionState::Reconnecting) {
    return;
  }

  if (!ec || ec == net::error::already_open) {
    SERIALLINE_LOG_INFO("reconnect", "attempt", "Port reopened after " + std::to_string(attempts_) + " attempt(s)");
    mark_connected();
    if (on_reconnected_) on_reconnected_();
    return;
  }

  diagnostics::error_reporting::report_connection_error("reconnect", "attempt", ec, true, options_.source);

  if (!should_retry(options_.max_attempts, attempts_)) {
    SERIALLINE_LOG_ERROR("reconnect", "attempt",
                         "Giving up after " + std::to_string(attempts_) + " attempt(s): " + ec.message());
    ++generation_;
    state_.store(ConnectionState::Disconnected);
    if (on_give_up_) on_give_up_(ec, attempts_);
    return;
  }

  schedule_attempt();
}

}  // namespace engine
}  // namespace serialline
