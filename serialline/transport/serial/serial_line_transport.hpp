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
#include <boost/asio.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "serialline/base/visibility.hpp"
#include "serialline/config/engine_config.hpp"
#include "serialline/framer/line_framer.hpp"
#include "serialline/interface/iline_transport.hpp"
#include "serialline/interface/iserial_port.hpp"

namespace serialline {
namespace transport {

using config::EngineConfig;
using config::SerialConfig;
using interface::LineTransportInterface;
using interface::SerialPortInterface;
namespace net = boost::asio;

/**
 * @brief LineTransportInterface over a serial port.
 *
 * All port state lives on a private strand. Writes are queued and issued one
 * at a time; each write completes its own handler. Inbound bytes go through a
 * LineFramer and come out as lines.
 */
class SERIALLINE_API SerialLineTransport : public LineTransportInterface,
                                           public std::enable_shared_from_this<SerialLineTransport> {
 public:
  static std::shared_ptr<SerialLineTransport> create(const EngineConfig& cfg, net::io_context& ioc);
  // For testing with dependency injection
  static std::shared_ptr<SerialLineTransport> create(const EngineConfig& cfg,
                                                     std::unique_ptr<SerialPortInterface> port,
                                                     net::io_context& ioc);
  ~SerialLineTransport() override;

  void async_open(CompletionHandler handler) override;
  void async_write(std::string bytes, CompletionHandler handler) override;
  void async_close(CompletionHandler handler) override;
  bool is_open() const override;

  void on_line(LineHandler handler) override;
  void on_open(EventHandler handler) override;
  void on_close(EventHandler handler) override;
  void on_disconnect(EventHandler handler) override;
  void on_error(ErrorHandler handler) override;
  void clear_handlers() override;

  const SerialConfig& serial_config() const { return cfg_; }

 private:
  SerialLineTransport(const EngineConfig& cfg, std::unique_ptr<SerialPortInterface> port, net::io_context& ioc);

  struct PendingWrite {
    std::string bytes;
    CompletionHandler handler;
  };

  boost::system::error_code open_and_configure();
  void start_read();
  void do_write();
  void handle_read_error(const boost::system::error_code& ec);
  void close_port();
  void fail_queued_writes(const boost::system::error_code& ec);

  void emit_line(const std::string& line);
  void emit_event(const EventHandler& which);
  void emit_error(const boost::system::error_code& ec);

 private:
  net::io_context& ioc_;
  net::strand<net::io_context::executor_type> strand_;
  std::unique_ptr<SerialPortInterface> port_;
  SerialConfig cfg_;

  framer::LineFramer framer_;
  std::vector<char> rx_;
  std::deque<std::shared_ptr<PendingWrite>> tx_;
  std::shared_ptr<PendingWrite> inflight_;
  bool writing_ = false;

  // Bumped on every close so completions of a previous session are ignored
  uint64_t session_ = 0;
  std::atomic<bool> opened_{false};

  mutable std::mutex handler_mutex_;
  LineHandler on_line_;
  EventHandler on_open_;
  EventHandler on_close_;
  EventHandler on_disconnect_;
  ErrorHandler on_error_;
};

}  // namespace transport
}  // namespace serialline
