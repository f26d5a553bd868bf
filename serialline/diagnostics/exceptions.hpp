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

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>

#include "serialline/base/error_codes.hpp"

namespace serialline {
namespace diagnostics {

/**
 * @brief Base exception class for all serialline exceptions
 *
 * Carries the component and operation where the failure happened together
 * with a structured ErrorCode, so futures can be inspected uniformly.
 */
class SerialLineException : public std::runtime_error {
 public:
  explicit SerialLineException(const std::string& message, ErrorCode code = ErrorCode::Unknown,
                               const std::string& component = "", const std::string& operation = "")
      : std::runtime_error(message), code_(code), component_(component), operation_(operation) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  ErrorCode code_;
  std::string component_;
  std::string operation_;
};

/**
 * @brief The transport is already open
 */
class AlreadyOpenError : public SerialLineException {
 public:
  explicit AlreadyOpenError(const std::string& operation = "open")
      : SerialLineException("Port is already open", ErrorCode::AlreadyOpen, "transport", operation) {}
};

/**
 * @brief The transport is not open
 */
class NotOpenError : public SerialLineException {
 public:
  explicit NotOpenError(const std::string& operation = "", const std::string& message = "Port is not open")
      : SerialLineException(message, ErrorCode::NotOpen, "transport", operation) {}
};

/**
 * @brief Writing a queued command failed
 *
 * Only the command whose write failed is rejected; the queue moves on.
 */
class WriteError : public SerialLineException {
 public:
  WriteError(const std::string& command, const boost::system::error_code& ec)
      : SerialLineException("Failed to write command '" + command + "': " + ec.message(), ErrorCode::WriteFailed,
                            "command_queue", "write"),
        command_(command),
        error_(ec) {}

  const std::string& get_command() const noexcept { return command_; }
  const boost::system::error_code& get_error() const noexcept { return error_; }

 private:
  std::string command_;
  boost::system::error_code error_;
};

/**
 * @brief No matching response arrived in time
 */
class TimeoutError : public SerialLineException {
 public:
  TimeoutError(const std::string& command, long long timeout_ms)
      : SerialLineException("Response timed out after " + std::to_string(timeout_ms) + " ms for '" + command + "'",
                            ErrorCode::TimedOut, "command_queue", "response"),
        command_(command),
        timeout_ms_(timeout_ms) {}

  const std::string& get_command() const noexcept { return command_; }
  long long get_timeout_ms() const noexcept { return timeout_ms_; }

 private:
  std::string command_;
  long long timeout_ms_;
};

/**
 * @brief Invalid argument, pattern or configuration value
 */
class ConfigurationError : public SerialLineException {
 public:
  explicit ConfigurationError(const std::string& message, const std::string& operation = "",
                              const std::string& parameter = "")
      : SerialLineException(message, ErrorCode::InvalidConfiguration, "configuration", operation),
        parameter_(parameter) {}

  const std::string& get_parameter() const noexcept { return parameter_; }

  std::string get_full_message() const {
    std::string full_msg = SerialLineException::get_full_message();
    if (!parameter_.empty()) {
      full_msg += " (parameter: " + parameter_ + ")";
    }
    return full_msg;
  }

 private:
  std::string parameter_;
};

/**
 * @brief The engine was destroyed before the operation resolved
 */
class EngineDestroyedError : public SerialLineException {
 public:
  explicit EngineDestroyedError(const std::string& operation = "")
      : SerialLineException("Engine has been destroyed", ErrorCode::Destroyed, "engine", operation) {}
};

/**
 * @brief Any other transport failure
 */
class TransportError : public SerialLineException {
 public:
  TransportError(const boost::system::error_code& ec, ErrorCode code = ErrorCode::IoError,
                 const std::string& operation = "")
      : SerialLineException(ec.message(), code, "transport", operation), error_(ec) {}

  const boost::system::error_code& get_error() const noexcept { return error_; }

 private:
  boost::system::error_code error_;
};

}  // namespace diagnostics
}  // namespace serialline
