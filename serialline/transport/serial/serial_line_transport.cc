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

#include "serialline/transport/serial/serial_line_transport.hpp"

#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/logger.hpp"
#include "serialline/transport/serial/boost_serial_port.hpp"

namespace serialline {
namespace transport {

namespace net = boost::asio;

std::shared_ptr<SerialLineTransport> SerialLineTransport::create(const EngineConfig& cfg, net::io_context& ioc) {
  return std::shared_ptr<SerialLineTransport>(
      new SerialLineTransport(cfg, std::make_unique<BoostSerialPort>(ioc), ioc));
}

std::shared_ptr<SerialLineTransport> SerialLineTransport::create(const EngineConfig& cfg,
                                                                 std::unique_ptr<SerialPortInterface> port,
                                                                 net::io_context& ioc) {
  return std::shared_ptr<SerialLineTransport>(new SerialLineTransport(cfg, std::move(port), ioc));
}

SerialLineTransport::SerialLineTransport(const EngineConfig& cfg, std::unique_ptr<SerialPortInterface> port,
                                         net::io_context& ioc)
    : ioc_(ioc),
      strand_(ioc_.get_executor()),
      port_(std::move(port)),
      cfg_(cfg.serial),
      framer_(cfg.receive_delimiter, cfg.max_line_length) {
  cfg_.validate_and_clamp();
  rx_.resize(cfg_.read_chunk);
  framer_.set_on_message([this](std::string_view line) { emit_line(std::string(line)); });
}

SerialLineTransport::~SerialLineTransport() {
  if (port_ && port_->is_open()) {
    boost::system::error_code ec;
    port_->close(ec);
  }
}

void SerialLineTransport::async_open(CompletionHandler handler) {
  net::post(strand_, [self = shared_from_this(), handler = std::move(handler)] {
    if (self->port_->is_open()) {
      if (handler) handler(net::error::already_open);
      return;
    }

    auto ec = self->open_and_configure();
    if (ec) {
      if (handler) handler(ec);
      return;
    }

    self->framer_.reset();
    self->opened_.store(true);
    self->start_read();
    self->emit_event(self->on_open_);
    if (handler) handler(boost::system::error_code{});

    // Writes queued while the port was opening
    if (!self->writing_) self->do_write();
  });
}

void SerialLineTransport::async_write(std::string bytes, CompletionHandler handler) {
  auto op = std::make_shared<PendingWrite>();
  op->bytes = std::move(bytes);
  op->handler = std::move(handler);
  net::post(strand_, [self = shared_from_this(), op] {
    if (!self->opened_.load()) {
      if (op->handler) op->handler(net::error::bad_descriptor);
      return;
    }
    self->tx_.push_back(op);
    if (!self->writing_) self->do_write();
  });
}

void SerialLineTransport::async_close(CompletionHandler handler) {
  net::post(strand_, [self = shared_from_this(), handler = std::move(handler)] {
    if (!self->opened_.load()) {
      if (handler) handler(net::error::bad_descriptor);
      return;
    }
    self->close_port();
    SERIALLINE_LOG_INFO("serial", "close", "Device closed: " + self->cfg_.device);
    self->emit_event(self->on_close_);
    if (handler) handler(boost::system::error_code{});
  });
}

bool SerialLineTransport::is_open() const { return opened_.load(); }

void SerialLineTransport::on_line(LineHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  on_line_ = std::move(handler);
}

void SerialLineTransport::on_open(EventHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  on_open_ = std::move(handler);
}

void SerialLineTransport::on_close(EventHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  on_close_ = std::move(handler);
}

void SerialLineTransport::on_disconnect(EventHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  on_disconnect_ = std::move(handler);
}

void SerialLineTransport::on_error(ErrorHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  on_error_ = std::move(handler);
}

void SerialLineTransport::clear_handlers() {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  on_line_ = nullptr;
  on_open_ = nullptr;
  on_close_ = nullptr;
  on_disconnect_ = nullptr;
  on_error_ = nullptr;
}

boost::system::error_code SerialLineTransport::open_and_configure() {
  boost::system::error_code ec;
  port_->open(cfg_.device, ec);
  if (ec) {
    SERIALLINE_LOG_ERROR("serial", "open", "Failed to open device: " + cfg_.device + " - " + ec.message());
    return ec;
  }

  auto fail = [this](const char* what, const boost::system::error_code& err) {
    SERIALLINE_LOG_ERROR("serial", "configure", std::string("Failed to set ") + what + " - " + err.message());
    boost::system::error_code ignored;
    port_->close(ignored);
    return err;
  };

  port_->set_option(net::serial_port_base::baud_rate(cfg_.baud_rate), ec);
  if (ec) return fail("baud rate", ec);

  port_->set_option(net::serial_port_base::character_size(cfg_.char_size), ec);
  if (ec) return fail("character size", ec);

  using sb = net::serial_port_base::stop_bits;
  port_->set_option(sb(cfg_.stop_bits == 2 ? sb::two : sb::one), ec);
  if (ec) return fail("stop bits", ec);

  using pa = net::serial_port_base::parity;
  pa::type p = pa::none;
  if (cfg_.parity == SerialConfig::Parity::Even)
    p = pa::even;
  else if (cfg_.parity == SerialConfig::Parity::Odd)
    p = pa::odd;
  port_->set_option(pa(p), ec);
  if (ec) return fail("parity", ec);

  using fc = net::serial_port_base::flow_control;
  fc::type f = fc::none;
  if (cfg_.flow == SerialConfig::Flow::Software)
    f = fc::software;
  else if (cfg_.flow == SerialConfig::Flow::Hardware)
    f = fc::hardware;
  port_->set_option(fc(f), ec);
  if (ec) return fail("flow control", ec);

  SERIALLINE_LOG_INFO("serial", "open", "Device opened: " + cfg_.device + " @ " + std::to_string(cfg_.baud_rate));
  return ec;
}

void SerialLineTransport::start_read() {
  auto self = shared_from_this();
  const uint64_t session = session_;
  // The port calls back on an arbitrary thread; hop onto the strand
  port_->async_read_some(net::buffer(rx_.data(), rx_.size()),
                         [self, session](const boost::system::error_code& ec, std::size_t n) {
                           net::post(self->strand_, [self, session, ec, n] {
                             if (session != self->session_ || !self->opened_.load()) return;
                             if (ec) {
                               self->handle_read_error(ec);
                               return;
                             }
                             self->framer_.push_bytes(std::string_view(self->rx_.data(), n));
                             // A line handler may have closed the port
                             if (session == self->session_ && self->opened_.load()) self->start_read();
                           });
                         });
}

void SerialLineTransport::handle_read_error(const boost::system::error_code& ec) {
  if (ec == net::error::eof) {
    // No data at the moment; keep reading
    start_read();
    return;
  }
  if (ec == net::error::operation_aborted) {
    return;
  }

  SERIALLINE_LOG_WARNING("serial", "read", "Device lost: " + cfg_.device + " - " + ec.message());
  diagnostics::error_reporting::report_connection_error("serial", "read", ec, true, cfg_.device);
  close_port();
  emit_error(ec);
  emit_event(on_disconnect_);
}

void SerialLineTransport::do_write() {
  if (tx_.empty() || !opened_.load()) {
    writing_ = false;
    return;
  }
  writing_ = true;

  auto op = tx_.front();
  tx_.pop_front();
  inflight_ = op;

  auto self = shared_from_this();
  const uint64_t session = session_;
  port_->async_write(net::buffer(op->bytes), [self, op, session](const boost::system::error_code& ec, std::size_t) {
    net::post(self->strand_, [self, op, session, ec] {
      if (ec && ec != net::error::operation_aborted) {
        SERIALLINE_LOG_ERROR("serial", "write", "Write failed: " + ec.message());
        diagnostics::error_reporting::report_communication_error("serial", "write", ec.message(), false, self->cfg_.device, ec);
      }
      // close_port() may already have failed this write
      if (op->handler) {
        auto handler = std::move(op->handler);
        op->handler = nullptr;
        handler(ec);
      }
      if (session != self->session_) return;
      if (self->inflight_ == op) self->inflight_.reset();
      self->writing_ = false;
      self->do_write();
    });
  });
}

void SerialLineTransport::close_port() {
  ++session_;
  opened_.store(false);
  writing_ = false;
  boost::system::error_code ec;
  port_->close(ec);
  if (ec) {
    SERIALLINE_LOG_WARNING("serial", "close", "Error while closing port: " + ec.message());
  }
  framer_.reset();

  if (inflight_) {
    auto handler = std::move(inflight_->handler);
    inflight_->handler = nullptr;
    inflight_.reset();
    if (handler) handler(net::error::operation_aborted);
  }
  fail_queued_writes(net::error::operation_aborted);
}

void SerialLineTransport::fail_queued_writes(const boost::system::error_code& ec) {
  auto pending = std::move(tx_);
  tx_.clear();
  for (auto& op : pending) {
    if (op->handler) op->handler(ec);
  }
}

void SerialLineTransport::emit_line(const std::string& line) {
  LineHandler cb;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    cb = on_line_;
  }
  if (cb) cb(line);
}

void SerialLineTransport::emit_event(const EventHandler& which) {
  EventHandler cb;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    cb = which;
  }
  if (cb) cb();
}

void SerialLineTransport::emit_error(const boost::system::error_code& ec) {
  ErrorHandler cb;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    cb = on_error_;
  }
  if (cb) cb(ec);
}

}  // namespace transport
}  // namespace serialline
