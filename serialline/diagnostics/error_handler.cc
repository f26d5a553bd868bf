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

#include "serialline/diagnostics/error_handler.hpp"

#include <algorithm>
#include <sstream>

#include "serialline/base/constants.hpp"
#include "serialline/diagnostics/logger.hpp"

namespace serialline {
namespace diagnostics {

std::string to_string(ErrorLevel level) {
  switch (level) {
    case ErrorLevel::INFO:
      return "INFO";
    case ErrorLevel::WARNING:
      return "WARNING";
    case ErrorLevel::ERROR:
      return "ERROR";
    case ErrorLevel::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::CONNECTION:
      return "CONNECTION";
    case ErrorCategory::COMMUNICATION:
      return "COMMUNICATION";
    case ErrorCategory::CONFIGURATION:
      return "CONFIGURATION";
    case ErrorCategory::SYSTEM:
      return "SYSTEM";
    case ErrorCategory::UNKNOWN:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::string ErrorInfo::summary() const {
  std::ostringstream oss;
  oss << "[" << to_string(level) << "] ";
  if (!source.empty()) oss << source << " ";
  oss << component << "/" << operation << ": " << message;
  if (error) oss << " (code " << error.value() << ")";
  if (retryable) oss << " [retryable]";
  return oss.str();
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance;
  return instance;
}

void ErrorHandler::report(const ErrorInfo& error) {
  if (!enabled_.load()) {
    return;
  }

  std::vector<ErrorCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    remember(by_component_[error.component], error);
    if (!error.source.empty()) remember(by_source_[error.source], error);
    for (const auto& entry : callbacks_) callbacks.push_back(entry.second);
  }

  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      // Reporting from here would recurse
      SERIALLINE_LOG_ERROR("error_handler", "callback", "Error in error callback: " + std::string(e.what()));
    } catch (...) {
      SERIALLINE_LOG_ERROR("error_handler", "callback", "Unknown error in error callback");
    }
  }
}

ErrorHandler::CallbackId ErrorHandler::add_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  CallbackId id = next_callback_id_++;
  callbacks_.emplace_back(id, std::move(callback));
  return id;
}

void ErrorHandler::remove_callback(CallbackId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const std::pair<CallbackId, ErrorCallback>& e) { return e.first == id; }),
                   callbacks_.end());
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

bool ErrorHandler::has_errors(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_component_.find(component);
  return it != by_component_.end() && !it->second.empty();
}

std::vector<ErrorInfo> ErrorHandler::errors_for(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_component_.find(component);
  return it == by_component_.end() ? std::vector<ErrorInfo>{} : it->second;
}

std::vector<ErrorInfo> ErrorHandler::errors_for_source(const std::string& source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_source_.find(source);
  return it == by_source_.end() ? std::vector<ErrorInfo>{} : it->second;
}

std::optional<ErrorInfo> ErrorHandler::last_error_for_source(const std::string& source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_source_.find(source);
  if (it == by_source_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

void ErrorHandler::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  by_component_.clear();
  by_source_.clear();
}

void ErrorHandler::remember(std::vector<ErrorInfo>& history, const ErrorInfo& error) {
  history.push_back(error);
  if (history.size() > base::constants::MAX_COMPONENT_ERRORS) {
    history.erase(history.begin());
  }
}

namespace error_reporting {

void report_connection_error(const std::string& component, const std::string& operation,
                             const boost::system::error_code& ec, bool retryable, const std::string& source) {
  ErrorHandler::instance().report(
      ErrorInfo(ErrorLevel::ERROR, ErrorCategory::CONNECTION, source, component, operation, ec.message(), ec,
                retryable));
}

void report_communication_error(const std::string& component, const std::string& operation, const std::string& message,
                                bool retryable, const std::string& source, const boost::system::error_code& ec) {
  ErrorHandler::instance().report(
      ErrorInfo(ErrorLevel::ERROR, ErrorCategory::COMMUNICATION, source, component, operation, message, ec, retryable));
}

void report_configuration_error(const std::string& component, const std::string& operation,
                                const std::string& message, const std::string& source) {
  ErrorHandler::instance().report(
      ErrorInfo(ErrorLevel::ERROR, ErrorCategory::CONFIGURATION, source, component, operation, message));
}

void report_system_error(const std::string& component, const std::string& operation, const std::string& message,
                         const std::string& source) {
  ErrorHandler::instance().report(
      ErrorInfo(ErrorLevel::ERROR, ErrorCategory::SYSTEM, source, component, operation, message));
}

void report_warning(const std::string& component, const std::string& operation, const std::string& message,
                    const std::string& source) {
  ErrorHandler::instance().report(
      ErrorInfo(ErrorLevel::WARNING, ErrorCategory::UNKNOWN, source, component, operation, message));
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace serialline
