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

#include <string>

namespace serialline {

/**
 * @brief Structured error codes for serialline
 */
enum class ErrorCode {
  Success = 0,
  Unknown,
  InvalidConfiguration,
  InternalError,
  IoError,

  // Transport state
  AlreadyOpen,
  NotOpen,
  AccessDenied,
  Disconnected,

  // Command lifecycle
  WriteFailed,
  TimedOut,
  Destroyed
};

/**
 * @brief Convert ErrorCode to human-readable string
 */
inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:
      return "Success";
    case ErrorCode::Unknown:
      return "Unknown Error";
    case ErrorCode::InvalidConfiguration:
      return "Invalid Configuration";
    case ErrorCode::InternalError:
      return "Internal Error";
    case ErrorCode::IoError:
      return "I/O Error";
    case ErrorCode::AlreadyOpen:
      return "Port Already Open";
    case ErrorCode::NotOpen:
      return "Port Not Open";
    case ErrorCode::AccessDenied:
      return "Access Denied";
    case ErrorCode::Disconnected:
      return "Disconnected";
    case ErrorCode::WriteFailed:
      return "Write Failed";
    case ErrorCode::TimedOut:
      return "Response Timed Out";
    case ErrorCode::Destroyed:
      return "Engine Destroyed";
  }
  return "Unknown Error Code";
}

}  // namespace serialline
