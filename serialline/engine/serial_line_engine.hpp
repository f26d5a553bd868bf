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
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "serialline/base/visibility.hpp"
#include "serialline/config/engine_config.hpp"
#include "serialline/diagnostics/error_types.hpp"
#include "serialline/engine/command.hpp"
#include "serialline/engine/command_queue.hpp"
#include "serialline/engine/event_hub.hpp"
#include "serialline/engine/pattern.hpp"
#include "serialline/engine/reconnect_supervisor.hpp"
#include "serialline/engine/watcher_registry.hpp"
#include "serialline/interface/iline_transport.hpp"

namespace serialline {
namespace engine {

using config::EngineConfig;
namespace net = boost::asio;

/**
 * @brief Request/response correlation over a line transport.
 *
 * Commands are written one at a time; each resolves with the first line
 * matching its response pattern (or the lines collected by its scan
 * pattern), or fails with TimeoutError. Watchers see every inbound line.
 * After an unexpected disconnect the port is reopened at a fixed interval.
 *
 * All state is owned by one strand. Public member functions may be called
 * from any thread; the futures they return must not be waited on from inside
 * an engine callback, which runs on that same strand.
 *
 * Usage:
 * @code
 *   auto engine = SerialLineEngine::create(EngineConfig("/dev/ttyUSB0"));
 *   engine->open().get();
 *   auto reply = engine->send("AT", "^OK").get();
 * @endcode
 */
class SERIALLINE_API SerialLineEngine : public std::enable_shared_from_this<SerialLineEngine> {
 public:
  using Transport = std::shared_ptr<interface::LineTransportInterface>;

  // Serial port transport on the shared io_context
  static std::shared_ptr<SerialLineEngine> create(const EngineConfig& cfg);
  static std::shared_ptr<SerialLineEngine> create(const EngineConfig& cfg, net::io_context& ioc);
  static std::shared_ptr<SerialLineEngine> create(const EngineConfig& cfg, Transport transport);
  static std::shared_ptr<SerialLineEngine> create(const EngineConfig& cfg, Transport transport,
                                                  net::io_context& ioc);
  ~SerialLineEngine();

  SerialLineEngine(const SerialLineEngine&) = delete;
  SerialLineEngine& operator=(const SerialLineEngine&) = delete;

  /**
   * @brief Open the transport
   *
   * Fails with AlreadyOpenError if already open, or with the transport's
   * error otherwise.
   */
  std::future<void> open();

  /**
   * @brief Close the transport; no reconnect follows
   *
   * Fails with NotOpenError if the transport is not open.
   */
  std::future<void> close();

  bool is_open() const;

  /**
   * @brief Queue a command
   *
   * @param command Text without line terminator
   * @param response Pattern that completes the command; without one the
   *        command completes with no data once written
   * @param options Timeout, scan pattern and terminator overrides
   * @return Future resolved with the completing line, the scanned lines, or
   *         nothing. Fails with TimeoutError, WriteError,
   *         ConfigurationError (non-positive timeout) or
   *         EngineDestroyedError.
   */
  std::future<Response> send(const std::string& command, std::optional<Pattern> response = std::nullopt,
                             SendOptions options = SendOptions{});
  std::future<Response> send(const std::string& command, SendOptions options);

  /**
   * @brief Write raw bytes, bypassing the command queue
   */
  std::future<void> write(const std::string& raw);

  /**
   * @throws diagnostics::ConfigurationError if callback is empty
   * @throws diagnostics::EngineDestroyedError after destroy()
   */
  WatcherId watch(Pattern pattern, WatcherRegistry::Callback callback);
  void unwatch(WatcherId id);

  /**
   * @throws diagnostics::EngineDestroyedError after destroy()
   */
  SubscriptionId on(EventKind kind, EventHub::Handler handler);
  void off(SubscriptionId id);

  /**
   * @brief Detach listeners, fail pending commands, stop reconnecting and
   * release the transport. Idempotent.
   */
  void destroy();
  bool is_destroyed() const { return destroyed_.load(); }

  ConnectionState connection_state() const;
  size_t pending_commands() const;

  /**
   * @brief Failures reported for this engine's device, oldest first
   *
   * Covers timeouts, write and open failures, reconnect attempts and
   * callback exceptions. Engines on the same device share one history.
   */
  std::vector<diagnostics::ErrorInfo> errors() const;
  std::optional<diagnostics::ErrorInfo> last_error() const;
  const EngineConfig& config() const { return cfg_; }

 private:
  SerialLineEngine(const EngineConfig& cfg, Transport transport, net::io_context& ioc);
  void init();

  void install_transport_handlers();
  void handle_line(const std::string& line);
  void handle_transport_open();
  void handle_transport_close();
  void handle_disconnect();
  void handle_transport_error(const boost::system::error_code& ec);
  void teardown();
  // Runs on the strand only
  static void release(const std::shared_ptr<CommandQueue>& queue,
                      const std::shared_ptr<ReconnectSupervisor>& supervisor, Transport& transport);

  void emit(EventKind kind, const std::string& data = std::string(),
            const boost::system::error_code& ec = boost::system::error_code{});
  void log_traffic(const char* direction, const std::string& text) const;

 private:
  EngineConfig cfg_;
  net::io_context& ioc_;
  CommandQueue::Strand strand_;
  Transport transport_;

  std::shared_ptr<CommandQueue> queue_;
  std::shared_ptr<ReconnectSupervisor> supervisor_;
  WatcherRegistry watchers_;
  EventHub events_;

  std::atomic<bool> open_{false};
  std::atomic<bool> destroyed_{false};
};

}  // namespace engine
}  // namespace serialline
