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

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "serialline/base/visibility.hpp"
#include "serialline/config/engine_config.hpp"
#include "serialline/engine/serial_line_engine.hpp"

namespace serialline {
namespace builder {

/**
 * @brief Fluent construction of a SerialLineEngine
 *
 * @code
 *   auto engine = serialline::line("/dev/ttyUSB0", 115200)
 *                     .timeout(std::chrono::milliseconds(500))
 *                     .retry_interval(2000)
 *                     .on_data([](const std::string& l) { ... })
 *                     .build();
 * @endcode
 */
class SERIALLINE_API EngineBuilder {
 public:
  /**
   * @throws diagnostics::ConfigurationError for an empty device or a baud
   *         rate out of range
   */
  EngineBuilder(const std::string& device, uint32_t baud_rate);
  explicit EngineBuilder(const config::EngineConfig& cfg);

  EngineBuilder(const EngineBuilder&) = delete;
  EngineBuilder& operator=(const EngineBuilder&) = delete;
  EngineBuilder(EngineBuilder&&) = default;
  EngineBuilder& operator=(EngineBuilder&&) = default;

  /**
   * @throws diagnostics::ConfigurationError if the collected settings are
   *         invalid
   */
  std::shared_ptr<engine::SerialLineEngine> build();

  EngineBuilder& timeout(std::chrono::milliseconds default_timeout);
  EngineBuilder& send_eol(const std::string& eol);
  EngineBuilder& receive_delimiter(const std::string& delimiter);
  EngineBuilder& max_line_length(size_t length);
  EngineBuilder& parity(config::SerialConfig::Parity parity);
  EngineBuilder& flow_control(config::SerialConfig::Flow flow);
  EngineBuilder& reconnect(bool enable = true);
  EngineBuilder& retry_interval(unsigned interval_ms);
  EngineBuilder& max_reconnect_attempts(int attempts);
  EngineBuilder& fail_pending_on_disconnect(bool enable = true);
  EngineBuilder& verbose(bool enable = true);

  // Run on a caller-owned io_context instead of the shared one
  EngineBuilder& io_context(boost::asio::io_context& ioc);
  // Use a custom line transport instead of the serial port
  EngineBuilder& transport(engine::SerialLineEngine::Transport transport);

  EngineBuilder& on_data(std::function<void(const std::string&)> handler);
  EngineBuilder& on_open(std::function<void()> handler);
  EngineBuilder& on_close(std::function<void()> handler);
  EngineBuilder& on_disconnect(std::function<void()> handler);
  EngineBuilder& on_error(std::function<void(const boost::system::error_code&)> handler);

  const config::EngineConfig& config() const { return cfg_; }

 private:
  config::EngineConfig cfg_;
  boost::asio::io_context* ioc_ = nullptr;
  engine::SerialLineEngine::Transport transport_;

  std::function<void(const std::string&)> on_data_;
  std::function<void()> on_open_;
  std::function<void()> on_close_;
  std::function<void()> on_disconnect_;
  std::function<void(const boost::system::error_code&)> on_error_;
};

}  // namespace builder
}  // namespace serialline
