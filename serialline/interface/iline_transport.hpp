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
#include <functional>
#include <string>

namespace serialline {
namespace interface {

/**
 * @brief Line-oriented transport consumed by SerialLineEngine.
 *
 * Implementations deliver complete inbound lines (terminator stripped) and
 * report open, close, disconnect and error notifications. Completion
 * handlers and notifications may be invoked from any thread; the engine
 * re-posts them onto its own strand.
 *
 * Error conventions for completion handlers:
 *  - boost::asio::error::already_open when opening an open transport
 *  - boost::asio::error::bad_descriptor or not_connected when writing to or
 *    closing a transport that is not open
 *
 * A transport may drop every registered handler after it reports a
 * disconnect. Users are expected to install them again before reopening.
 */
class LineTransportInterface {
 public:
  using CompletionHandler = std::function<void(const boost::system::error_code&)>;
  using LineHandler = std::function<void(const std::string&)>;
  using EventHandler = std::function<void()>;
  using ErrorHandler = std::function<void(const boost::system::error_code&)>;

  virtual ~LineTransportInterface() = default;

  virtual void async_open(CompletionHandler handler) = 0;
  virtual void async_write(std::string bytes, CompletionHandler handler) = 0;
  virtual void async_close(CompletionHandler handler) = 0;
  virtual bool is_open() const = 0;

  virtual void on_line(LineHandler handler) = 0;
  virtual void on_open(EventHandler handler) = 0;
  virtual void on_close(EventHandler handler) = 0;
  virtual void on_disconnect(EventHandler handler) = 0;
  virtual void on_error(ErrorHandler handler) = 0;

  virtual void clear_handlers() = 0;
};

}  // namespace interface
}  // namespace serialline
