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
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "serialline/base/visibility.hpp"
#include "serialline/diagnostics/error_types.hpp"

namespace serialline {
namespace diagnostics {

/**
 * @brief Process-wide sink for failures.
 *
 * Keeps a bounded history per component and per source (device) and fans
 * every report out to the registered callbacks. Engines read their own
 * history back through errors_for_source().
 */
class SERIALLINE_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;
  using CallbackId = uint64_t;

  static ErrorHandler& instance();

  void report(const ErrorInfo& error);

  CallbackId add_callback(ErrorCallback callback);
  void remove_callback(CallbackId id);
  void clear_callbacks();

  void set_enabled(bool enabled) { enabled_.store(enabled); }
  bool is_enabled() const { return enabled_.load(); }

  bool has_errors(const std::string& component) const;
  std::vector<ErrorInfo> errors_for(const std::string& component) const;
  std::vector<ErrorInfo> errors_for_source(const std::string& source) const;
  std::optional<ErrorInfo> last_error_for_source(const std::string& source) const;

  // Drop all history; callbacks stay registered
  void clear();

 private:
  ErrorHandler() = default;
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  static void remember(std::vector<ErrorInfo>& history, const ErrorInfo& error);

  mutable std::mutex mutex_;
  std::vector<std::pair<CallbackId, ErrorCallback>> callbacks_;
  CallbackId next_callback_id_ = 1;
  std::atomic<bool> enabled_{true};

  std::unordered_map<std::string, std::vector<ErrorInfo>> by_component_;
  std::unordered_map<std::string, std::vector<ErrorInfo>> by_source_;
};

/**
 * @brief Shorthands used at the call sites
 *
 * source is the device path of the reporting engine; leave it empty when
 * there is none.
 */
namespace error_reporting {

SERIALLINE_API void report_connection_error(const std::string& component, const std::string& operation,
                                            const boost::system::error_code& ec, bool retryable = true,
                                            const std::string& source = std::string());

SERIALLINE_API void report_communication_error(const std::string& component, const std::string& operation,
                                               const std::string& message, bool retryable = false,
                                               const std::string& source = std::string(),
                                               const boost::system::error_code& ec = boost::system::error_code{});

SERIALLINE_API void report_configuration_error(const std::string& component, const std::string& operation,
                                               const std::string& message,
                                               const std::string& source = std::string());

SERIALLINE_API void report_system_error(const std::string& component, const std::string& operation,
                                        const std::string& message, const std::string& source = std::string());

SERIALLINE_API void report_warning(const std::string& component, const std::string& operation,
                                   const std::string& message, const std::string& source = std::string());

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace serialline
