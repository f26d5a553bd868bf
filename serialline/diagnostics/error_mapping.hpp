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

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <exception>
#include <string>

#include "serialline/base/error_codes.hpp"
#include "serialline/diagnostics/exceptions.hpp"

namespace serialline {
namespace diagnostics {

/**
 * @brief Maps boost::system::error_code to serialline ErrorCode
 */
inline ErrorCode to_error_code(const boost::system::error_code& ec) {
  if (!ec) {
    return ErrorCode::Success;
  }

  if (ec == boost::asio::error::already_open) {
    return ErrorCode::AlreadyOpen;
  }
  if (ec == boost::asio::error::bad_descriptor || ec == boost::asio::error::not_connected) {
    return ErrorCode::NotOpen;
  }
  if (ec == boost::asio::error::access_denied) {
    return ErrorCode::AccessDenied;
  }
  if (ec == boost::asio::error::eof || ec == boost::asio::error::broken_pipe) {
    return ErrorCode::Disconnected;
  }

  return ErrorCode::IoError;
}

/**
 * @brief Builds the exception a transport failure is delivered as
 */
inline std::exception_ptr make_transport_exception(const boost::system::error_code& ec,
                                                   const std::string& operation) {
  switch (to_error_code(ec)) {
    case ErrorCode::AlreadyOpen:
      return std::make_exception_ptr(AlreadyOpenError(operation));
    case ErrorCode::NotOpen:
      return std::make_exception_ptr(NotOpenError(operation));
    default:
      return std::make_exception_ptr(TransportError(ec, to_error_code(ec), operation));
  }
}

}  // namespace diagnostics
}  // namespace serialline
