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

#include "serialline/engine/serial_line_engine.hpp"

#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/error_mapping.hpp"
#include "serialline/diagnostics/exceptions.hpp"
#include "serialline/diagnostics/logger.hpp"
#include "serialline/runtime/io_context_manager.hpp"
#include "serialline/transport/serial/serial_line_transport.hpp"

namespace serialline {
namespace engine {

using namespace diagnostics;

namespace {

// Make sure the shared context is running before engines capture it
net::io_context& acquire_shared_context() {
  auto& manager = runtime::IoContextManager::instance();
  manager.start();
  return manager.get_context();
}

std::string printable(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\r') {
      out += "\\r";
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out += c;
    }
  }
  return out;
}

template <typename T>
std::future<T> failed_future(std::exception_ptr error) {
  std::promise<T> promise;
  promise.set_exception(error);
  return promise.get_future();
}

}  // namespace

std::shared_ptr<SerialLineEngine> SerialLineEngine::create(const EngineConfig& cfg) {
  auto& ioc = acquire_shared_context();
  return create(cfg, transport::SerialLineTransport::create(cfg, ioc), ioc);
}

std::shared_ptr<SerialLineEngine> SerialLineEngine::create(const EngineConfig& cfg, net::io_context& ioc) {
  return create(cfg, transport::SerialLineTransport::create(cfg, ioc), ioc);
}

std::shared_ptr<SerialLineEngine> SerialLineEngine::create(const EngineConfig& cfg, Transport transport) {
  return create(cfg, std::move(transport), acquire_shared_context());
}

std::shared_ptr<SerialLineEngine> SerialLineEngine::create(const EngineConfig& cfg, Transport transport,
                                                           net::io_context& ioc) {
  if (!transport) {
    throw ConfigurationError("Engine requires a transport", "create", "transport");
  }
  auto engine = std::shared_ptr<SerialLineEngine>(new SerialLineEngine(cfg, std::move(transport), ioc));
  engine->init();
  return engine;
}

SerialLineEngine::SerialLineEngine(const EngineConfig& cfg, Transport transport, net::io_context& ioc)
    : cfg_(cfg), ioc_(ioc), strand_(net::make_strand(ioc_)), transport_(std::move(transport)) {
  if (!cfg_.is_valid()) {
    SERIALLINE_LOG_WARNING("engine", "create", "Configuration out of range; clamping to valid values");
    error_reporting::report_warning("engine", "create", "Configuration out of range", cfg.serial.device);
    cfg_.validate_and_clamp();
  }
}

SerialLineEngine::~SerialLineEngine() {
  if (destroyed_.exchange(true)) {
    return;
  }
  // Queue and supervisor handlers may still be running on the strand; their
  // state is only released there
  net::post(strand_, [queue = std::move(queue_), supervisor = std::move(supervisor_),
                      transport = std::move(transport_)]() mutable {
    release(queue, supervisor, transport);
  });
}

void SerialLineEngine::init() {
  std::weak_ptr<SerialLineEngine> weak = weak_from_this();
  watchers_.set_source(cfg_.serial.device);
  events_.set_source(cfg_.serial.device);

  queue_ = CommandQueue::create(strand_, [weak](std::string bytes, CommandQueue::WriteCompletion done) {
    auto self = weak.lock();
    if (!self || !self->transport_) {
      done(net::error::operation_aborted);
      return;
    }
    self->transport_->async_write(std::move(bytes), std::move(done));
  });
  queue_->set_source(cfg_.serial.device);
  queue_->on_write([weak](const std::string& bytes) {
    if (auto self = weak.lock()) {
      self->log_traffic("tx", bytes);
      self->emit(EventKind::Write, bytes);
    }
  });

  ReconnectSupervisor::Options options;
  options.enabled = cfg_.reconnect_on_disconnect;
  options.interval = std::chrono::milliseconds(cfg_.retry_interval_ms);
  options.max_attempts = cfg_.max_reconnect_attempts;
  options.source = cfg_.serial.device;
  supervisor_ = ReconnectSupervisor::create(strand_, options, [weak](ReconnectSupervisor::OpenCompletion done) {
    auto self = weak.lock();
    if (!self || !self->transport_) {
      done(net::error::operation_aborted);
      return;
    }
    self->transport_->async_open(std::move(done));
  });
  supervisor_->on_reinstall([weak] {
    if (auto self = weak.lock()) self->install_transport_handlers();
  });
  supervisor_->on_reconnected([weak] {
    if (auto self = weak.lock()) self->open_.store(true);
  });
  supervisor_->on_give_up([weak](const boost::system::error_code& ec, uint32_t attempts) {
    if (auto self = weak.lock()) {
      error_reporting::report_connection_error("engine", "reconnect", ec, false, self->cfg_.serial.device);
      SERIALLINE_LOG_ERROR("engine", "reconnect",
                           "Reconnect abandoned after " + std::to_string(attempts) + " attempt(s)");
      self->emit(EventKind::Error, std::string(), ec);
    }
  });

  install_transport_handlers();
}

std::future<void> SerialLineEngine::open() {
  if (destroyed_.load()) {
    return failed_future<void>(std::make_exception_ptr(EngineDestroyedError("open")));
  }

  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();
  net::post(strand_, [self = shared_from_this(), promise] {
    if (self->destroyed_.load() || !self->transport_) {
      promise->set_exception(std::make_exception_ptr(EngineDestroyedError("open")));
      return;
    }
    self->install_transport_handlers();
    std::weak_ptr<SerialLineEngine> weak = self;
    auto strand = self->strand_;
    self->transport_->async_open([weak, strand, promise](const boost::system::error_code& ec) {
      net::post(strand, [weak, promise, ec] {
        auto s = weak.lock();
        if (!s || s->destroyed_.load()) {
          promise->set_exception(std::make_exception_ptr(EngineDestroyedError("open")));
          return;
        }
        if (ec) {
          SERIALLINE_LOG_ERROR("engine", "open", "Open failed: " + ec.message());
          error_reporting::report_connection_error("engine", "open", ec, false, s->cfg_.serial.device);
          promise->set_exception(make_transport_exception(ec, "open"));
          return;
        }
        s->open_.store(true);
        s->supervisor_->mark_connected();
        promise->set_value();
      });
    });
  });
  return future;
}

std::future<void> SerialLineEngine::close() {
  if (destroyed_.load()) {
    return failed_future<void>(std::make_exception_ptr(EngineDestroyedError("close")));
  }

  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();
  net::post(strand_, [self = shared_from_this(), promise] {
    if (self->destroyed_.load() || !self->transport_) {
      promise->set_exception(std::make_exception_ptr(EngineDestroyedError("close")));
      return;
    }
    // A user close is not a disconnect: no reconnect may follow
    self->supervisor_->stop();
    std::weak_ptr<SerialLineEngine> weak = self;
    auto strand = self->strand_;
    self->transport_->async_close([weak, strand, promise](const boost::system::error_code& ec) {
      net::post(strand, [weak, promise, ec] {
        auto s = weak.lock();
        if (!s || s->destroyed_.load()) {
          promise->set_exception(std::make_exception_ptr(EngineDestroyedError("close")));
          return;
        }
        if (ec) {
          promise->set_exception(make_transport_exception(ec, "close"));
          return;
        }
        s->open_.store(false);
        promise->set_value();
      });
    });
  });
  return future;
}

bool SerialLineEngine::is_open() const { return !destroyed_.load() && open_.load(); }

std::future<Response> SerialLineEngine::send(const std::string& command, SendOptions options) {
  return send(command, std::nullopt, std::move(options));
}

std::future<Response> SerialLineEngine::send(const std::string& command, std::optional<Pattern> response,
                                             SendOptions options) {
  if (destroyed_.load()) {
    return failed_future<Response>(std::make_exception_ptr(EngineDestroyedError("send")));
  }

  auto timeout = options.timeout.value_or(std::chrono::milliseconds(cfg_.default_timeout_ms));
  if (timeout.count() <= 0) {
    error_reporting::report_configuration_error("engine", "send", "Timeout must be positive", cfg_.serial.device);
    return failed_future<Response>(std::make_exception_ptr(
        ConfigurationError("Timeout must be positive, got " + std::to_string(timeout.count()) + " ms", "send",
                           "timeout")));
  }

  auto cmd = std::make_unique<Command>();
  cmd->text = command;
  cmd->response = std::move(response);
  cmd->scan = std::move(options.scan);
  cmd->timeout = timeout;
  cmd->eol = options.eol.value_or(cfg_.send_eol);
  auto future = cmd->promise.get_future();

  net::post(strand_, [self = shared_from_this(), cmd = std::move(cmd)]() mutable {
    if (self->destroyed_.load()) {
      cmd->promise.set_exception(std::make_exception_ptr(EngineDestroyedError("send")));
      return;
    }
    self->queue_->enqueue(std::move(cmd));
  });
  return future;
}

std::future<void> SerialLineEngine::write(const std::string& raw) {
  if (destroyed_.load()) {
    return failed_future<void>(std::make_exception_ptr(EngineDestroyedError("write")));
  }

  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();
  net::post(strand_, [self = shared_from_this(), promise, raw] {
    if (self->destroyed_.load() || !self->transport_) {
      promise->set_exception(std::make_exception_ptr(EngineDestroyedError("write")));
      return;
    }
    self->log_traffic("tx", raw);
    self->emit(EventKind::Write, raw);
    auto strand = self->strand_;
    self->transport_->async_write(raw, [strand, promise](const boost::system::error_code& ec) {
      net::post(strand, [promise, ec] {
        if (ec) {
          promise->set_exception(make_transport_exception(ec, "write"));
        } else {
          promise->set_value();
        }
      });
    });
  });
  return future;
}

WatcherId SerialLineEngine::watch(Pattern pattern, WatcherRegistry::Callback callback) {
  if (destroyed_.load()) {
    throw EngineDestroyedError("watch");
  }
  if (!callback) {
    throw ConfigurationError("watch callback must be callable", "watch", "callback");
  }

  WatcherId id = watchers_.reserve_id();
  net::post(strand_, [self = shared_from_this(), id, pattern = std::move(pattern),
                      callback = std::move(callback)]() mutable {
    if (self->destroyed_.load()) return;
    self->watchers_.insert(id, std::move(pattern), std::move(callback));
  });
  return id;
}

void SerialLineEngine::unwatch(WatcherId id) {
  if (destroyed_.load()) return;
  net::post(strand_, [self = shared_from_this(), id] { self->watchers_.remove(id); });
}

SubscriptionId SerialLineEngine::on(EventKind kind, EventHub::Handler handler) {
  if (destroyed_.load()) {
    throw EngineDestroyedError("on");
  }

  SubscriptionId id = events_.reserve_id();
  net::post(strand_, [self = shared_from_this(), id, kind, handler = std::move(handler)]() mutable {
    if (self->destroyed_.load()) return;
    self->events_.insert(id, kind, std::move(handler));
  });
  return id;
}

void SerialLineEngine::off(SubscriptionId id) {
  if (destroyed_.load()) return;
  net::post(strand_, [self = shared_from_this(), id] { self->events_.unsubscribe(id); });
}

void SerialLineEngine::destroy() {
  if (destroyed_.exchange(true)) {
    return;
  }
  SERIALLINE_LOG_DEBUG("engine", "destroy", "Destroying engine");
  net::post(strand_, [self = shared_from_this()] { self->teardown(); });
}

ConnectionState SerialLineEngine::connection_state() const { return supervisor_->state(); }

size_t SerialLineEngine::pending_commands() const { return queue_->size(); }

std::vector<ErrorInfo> SerialLineEngine::errors() const {
  return ErrorHandler::instance().errors_for_source(cfg_.serial.device);
}

std::optional<ErrorInfo> SerialLineEngine::last_error() const {
  return ErrorHandler::instance().last_error_for_source(cfg_.serial.device);
}

void SerialLineEngine::install_transport_handlers() {
  if (!transport_) return;

  std::weak_ptr<SerialLineEngine> weak = weak_from_this();
  auto strand = strand_;

  transport_->on_line([weak, strand](const std::string& line) {
    net::post(strand, [weak, line] {
      if (auto self = weak.lock()) self->handle_line(line);
    });
  });
  transport_->on_open([weak, strand] {
    net::post(strand, [weak] {
      if (auto self = weak.lock()) self->handle_transport_open();
    });
  });
  transport_->on_close([weak, strand] {
    net::post(strand, [weak] {
      if (auto self = weak.lock()) self->handle_transport_close();
    });
  });
  transport_->on_disconnect([weak, strand] {
    net::post(strand, [weak] {
      if (auto self = weak.lock()) self->handle_disconnect();
    });
  });
  transport_->on_error([weak, strand](const boost::system::error_code& ec) {
    net::post(strand, [weak, ec] {
      if (auto self = weak.lock()) self->handle_transport_error(ec);
    });
  });
}

void SerialLineEngine::handle_line(const std::string& line) {
  if (destroyed_.load()) return;
  log_traffic("rx", line);

  // Watchers see every line, including the ones that resolve a command
  watchers_.scan(line);
  if (!queue_->on_line(line)) {
    emit(EventKind::Data, line);
  }
}

void SerialLineEngine::handle_transport_open() {
  if (destroyed_.load()) return;
  open_.store(true);
  SERIALLINE_LOG_INFO("engine", "open", "Port open: " + cfg_.serial.device);
  emit(EventKind::Open);
}

void SerialLineEngine::handle_transport_close() {
  if (destroyed_.load()) return;
  open_.store(false);
  emit(EventKind::Close);
}

void SerialLineEngine::handle_disconnect() {
  if (destroyed_.load()) return;
  open_.store(false);
  SERIALLINE_LOG_WARNING("engine", "disconnect", "Port disconnected: " + cfg_.serial.device);
  emit(EventKind::Disconnected);

  if (cfg_.fail_pending_on_disconnect && !queue_->empty()) {
    queue_->fail_all(std::make_exception_ptr(NotOpenError("send", "Port disconnected")));
  }
  supervisor_->on_disconnect();
}

void SerialLineEngine::handle_transport_error(const boost::system::error_code& ec) {
  if (destroyed_.load()) return;
  emit(EventKind::Error, std::string(), ec);
}

void SerialLineEngine::teardown() {
  events_.clear();
  watchers_.clear();
  release(queue_, supervisor_, transport_);
  open_.store(false);
}

void SerialLineEngine::release(const std::shared_ptr<CommandQueue>& queue,
                               const std::shared_ptr<ReconnectSupervisor>& supervisor, Transport& transport) {
  if (queue) queue->fail_all(std::make_exception_ptr(EngineDestroyedError("send")));
  if (supervisor) supervisor->stop();

  if (transport) {
    transport->clear_handlers();
    if (transport->is_open()) {
      // Keep the transport alive until the close completes
      auto keep = transport;
      transport->async_close([keep](const boost::system::error_code& ec) {
        if (ec) {
          SERIALLINE_LOG_DEBUG("engine", "destroy", "Close during destroy failed: " + ec.message());
        }
      });
    }
    transport.reset();
  }
}

void SerialLineEngine::emit(EventKind kind, const std::string& data, const boost::system::error_code& ec) {
  events_.emit(EngineEvent{kind, data, ec});
}

void SerialLineEngine::log_traffic(const char* direction, const std::string& text) const {
  if (cfg_.verbose) {
    SERIALLINE_LOG_INFO("engine", direction, printable(text));
  } else {
    SERIALLINE_LOG_DEBUG("engine", direction, printable(text));
  }
}

}  // namespace engine
}  // namespace serialline
