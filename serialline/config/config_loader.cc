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

#include "serialline/config/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/exceptions.hpp"
#include "serialline/diagnostics/logger.hpp"

namespace serialline {
namespace config {

namespace {

template <typename T>
T get_or(const YAML::Node& n, const char* key, const T& defv) {
  if (n[key]) return n[key].as<T>();
  return defv;
}

SerialConfig::Parity parse_parity(const std::string& value) {
  if (value == "none") return SerialConfig::Parity::None;
  if (value == "even") return SerialConfig::Parity::Even;
  if (value == "odd") return SerialConfig::Parity::Odd;
  throw diagnostics::ConfigurationError("Unknown parity '" + value + "'", "load", "parity");
}

SerialConfig::Flow parse_flow(const std::string& value) {
  if (value == "none") return SerialConfig::Flow::None;
  if (value == "software") return SerialConfig::Flow::Software;
  if (value == "hardware") return SerialConfig::Flow::Hardware;
  throw diagnostics::ConfigurationError("Unknown flow control '" + value + "'", "load", "flow");
}

EngineConfig from_node(const YAML::Node& root) {
  if (!root.IsMap()) {
    throw diagnostics::ConfigurationError("Configuration root must be a mapping", "load");
  }

  EngineConfig c;
  try {
    c.serial.device = get_or<std::string>(root, "device", c.serial.device);
    c.serial.baud_rate = get_or<uint32_t>(root, "baud_rate", c.serial.baud_rate);
    c.serial.char_size = get_or<unsigned>(root, "char_size", c.serial.char_size);
    c.serial.stop_bits = get_or<unsigned>(root, "stop_bits", c.serial.stop_bits);
    c.serial.read_chunk = get_or<size_t>(root, "read_chunk", c.serial.read_chunk);
    if (root["parity"]) c.serial.parity = parse_parity(root["parity"].as<std::string>());
    if (root["flow"]) c.serial.flow = parse_flow(root["flow"].as<std::string>());

    c.default_timeout_ms = get_or<unsigned>(root, "timeout_ms", c.default_timeout_ms);
    c.send_eol = get_or<std::string>(root, "send_eol", c.send_eol);
    c.receive_delimiter = get_or<std::string>(root, "receive_delimiter", c.receive_delimiter);
    c.max_line_length = get_or<size_t>(root, "max_line_length", c.max_line_length);

    c.reconnect_on_disconnect = get_or<bool>(root, "reconnect", c.reconnect_on_disconnect);
    c.retry_interval_ms = get_or<unsigned>(root, "retry_interval_ms", c.retry_interval_ms);
    c.max_reconnect_attempts = get_or<int>(root, "max_reconnect_attempts", c.max_reconnect_attempts);
    c.fail_pending_on_disconnect = get_or<bool>(root, "fail_pending_on_disconnect", c.fail_pending_on_disconnect);
    c.verbose = get_or<bool>(root, "verbose", c.verbose);
  } catch (const YAML::Exception& e) {
    throw diagnostics::ConfigurationError(std::string("Invalid configuration value: ") + e.what(), "load");
  }

  if (!c.is_valid()) {
    throw diagnostics::ConfigurationError("Configuration values out of range", "load");
  }
  return c;
}

}  // namespace

EngineConfig load_engine_config(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("config", "load", e.what());
    throw diagnostics::ConfigurationError("Failed to load '" + path + "': " + e.what(), "load");
  }

  SERIALLINE_LOG_DEBUG("config", "load", "Loaded configuration from " + path);
  return from_node(root);
}

EngineConfig parse_engine_config(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("config", "parse", e.what());
    throw diagnostics::ConfigurationError(std::string("Failed to parse configuration: ") + e.what(), "parse");
  }
  return from_node(root);
}

}  // namespace config
}  // namespace serialline
