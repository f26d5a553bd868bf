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

#include "serialline/builder/engine_builder.hpp"

#include "serialline/base/constants.hpp"
#include "serialline/diagnostics/exceptions.hpp"

namespace serialline {
namespace builder {

using diagnostics::ConfigurationError;

EngineBuilder::EngineBuilder(const std::string& device, uint32_t baud_rate) : cfg_(device) {
  if (device.empty() || device.size() > base::constants::MAX_DEVICE_PATH_LENGTH) {
    throw ConfigurationError("Invalid device path '" + device + "'", "builder", "device");
  }
  if (baud_rate < base::constants::MIN_BAUD_RATE || baud_rate > base::constants::MAX_BAUD_RATE) {
    throw ConfigurationError("Baud rate out of range: " + std::to_string(baud_rate), "builder", "baud_rate");
  }
  cfg_.serial.baud_rate = baud_rate;
}

EngineBuilder::EngineBuilder(const config::EngineConfig& cfg) : cfg_(cfg) {}

std::shared_ptr<engine::SerialLineEngine> EngineBuilder::build() {
  if (!cfg_.is_valid()) {
    throw ConfigurationError("Invalid engine configuration for '" + cfg_.serial.device + "'", "build");
  }

  std::shared_ptr<engine::SerialLineEngine> result;
  if (transport_ && ioc_) {
    result = engine::SerialLineEngine::create(cfg_, transport_, *ioc_);
  } else if (transport_) {
    result = engine::SerialLineEngine::create(cfg_, transport_);
  } else if (ioc_) {
    result = engine::SerialLineEngine::create(cfg_, *ioc_);
  } else {
    result = engine::SerialLineEngine::create(cfg_);
  }

  using engine::EngineEvent;
  using engine::EventKind;
  if (on_data_) {
    auto handler = on_data_;
    result->on(EventKind::Data, [handler](const EngineEvent& e) { handler(e.data); });
  }
  if (on_open_) {
    auto handler = on_open_;
    result->on(EventKind::Open, [handler](const EngineEvent&) { handler(); });
  }
  if (on_close_) {
    auto handler = on_close_;
    result->on(EventKind::Close, [handler](const EngineEvent&) { handler(); });
  }
  if (on_disconnect_) {
    auto handler = on_disconnect_;
    result->on(EventKind::Disconnected, [handler](const EngineEvent&) { handler(); });
  }
  if (on_error_) {
    auto handler = on_error_;
    result->on(EventKind::Error, [handler](const EngineEvent& e) { handler(e.error); });
  }
  return result;
}

EngineBuilder& EngineBuilder::timeout(std::chrono::milliseconds default_timeout) {
  if (default_timeout.count() <= 0) {
    throw ConfigurationError("Timeout must be positive", "builder", "timeout");
  }
  cfg_.default_timeout_ms = static_cast<unsigned>(default_timeout.count());
  return *this;
}

EngineBuilder& EngineBuilder::send_eol(const std::string& eol) {
  cfg_.send_eol = eol;
  return *this;
}

EngineBuilder& EngineBuilder::receive_delimiter(const std::string& delimiter) {
  cfg_.receive_delimiter = delimiter;
  return *this;
}

EngineBuilder& EngineBuilder::max_line_length(size_t length) {
  cfg_.max_line_length = length;
  return *this;
}

EngineBuilder& EngineBuilder::parity(config::SerialConfig::Parity parity) {
  cfg_.serial.parity = parity;
  return *this;
}

EngineBuilder& EngineBuilder::flow_control(config::SerialConfig::Flow flow) {
  cfg_.serial.flow = flow;
  return *this;
}

EngineBuilder& EngineBuilder::reconnect(bool enable) {
  cfg_.reconnect_on_disconnect = enable;
  return *this;
}

EngineBuilder& EngineBuilder::retry_interval(unsigned interval_ms) {
  cfg_.retry_interval_ms = interval_ms;
  return *this;
}

EngineBuilder& EngineBuilder::max_reconnect_attempts(int attempts) {
  cfg_.max_reconnect_attempts = attempts;
  return *this;
}

EngineBuilder& EngineBuilder::fail_pending_on_disconnect(bool enable) {
  cfg_.fail_pending_on_disconnect = enable;
  return *this;
}

EngineBuilder& EngineBuilder::verbose(bool enable) {
  cfg_.verbose = enable;
  return *this;
}

EngineBuilder& EngineBuilder::io_context(boost::asio::io_context& ioc) {
  ioc_ = &ioc;
  return *this;
}

EngineBuilder& EngineBuilder::transport(engine::SerialLineEngine::Transport transport) {
  transport_ = std::move(transport);
  return *this;
}

EngineBuilder& EngineBuilder::on_data(std::function<void(const std::string&)> handler) {
  on_data_ = std::move(handler);
  return *this;
}

EngineBuilder& EngineBuilder::on_open(std::function<void()> handler) {
  on_open_ = std::move(handler);
  return *this;
}

EngineBuilder& EngineBuilder::on_close(std::function<void()> handler) {
  on_close_ = std::move(handler);
  return *this;
}

EngineBuilder& EngineBuilder::on_disconnect(std::function<void()> handler) {
  on_disconnect_ = std::move(handler);
  return *this;
}

EngineBuilder& EngineBuilder::on_error(std::function<void(const boost::system::error_code&)> handler) {
  on_error_ = std::move(handler);
  return *this;
}

}  // namespace builder
}  // namespace serialline
