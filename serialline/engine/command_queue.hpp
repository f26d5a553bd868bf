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
#include <exception>
#include <functional>
#include <memory>
#include <string>

#include "serialline/base/visibility.hpp"
#include "serialline/engine/command.hpp"

namespace serialline {
namespace engine {

namespace net = boost::asio;

/**
 * @brief Strictly serial FIFO of commands.
 *
 * Only the head command is ever written. It becomes eligible for inbound
 * lines as soon as its write is issued and owns the single response timer
 * once the write is acknowledged. Every member function must be called on
 * the strand passed to create(); write acknowledgements and timer
 * expirations are routed back onto it.
 */
class SERIALLINE_API CommandQueue : public std::enable_shared_from_this<CommandQueue> {
 public:
  using Strand = net::strand<net::io_context::executor_type>;
  using WriteCompletion = std::function<void(const boost::system::error_code&)>;
  using WriteFunction = std::function<void(std::string bytes, WriteCompletion done)>;
  using WriteListener = std::function<void(const std::string& bytes)>;

  static std::shared_ptr<CommandQueue> create(Strand strand, WriteFunction write);

  /**
   * @brief Diagnostic hook called with the exact bytes of every dispatch
   */
  void on_write(WriteListener listener);

  // Device path attached to reported write failures and timeouts
  void set_source(const std::string& source) { source_ = source; }

  void enqueue(std::unique_ptr<Command> command);

  /**
   * @brief Offer an inbound line to the head command
   * @return false if the queue is empty and the line was not consumed
   */
  bool on_line(const std::string& line);

  /**
   * @brief Reject every queued command with the given exception
   */
  void fail_all(std::exception_ptr error);

  // size() may be read from any thread
  size_t size() const { return count_.load(); }
  bool empty() const { return queue_.empty(); }
  bool timer_armed() const { return timer_armed_; }

 private:
  CommandQueue(Strand strand, WriteFunction write);

  void dispatch();
  void on_write_complete(uint64_t sequence, const boost::system::error_code& ec);
  void on_timeout(uint64_t sequence);
  void complete_head(Response data);
  void fail_head(std::exception_ptr error);
  void cancel_timer();
  bool is_head(uint64_t sequence) const;

 private:
  Strand strand_;
  WriteFunction write_;
  WriteListener on_write_;
  std::string source_;
  net::steady_timer timer_;
  bool timer_armed_ = false;

  std::deque<std::unique_ptr<Command>> queue_;
  std::atomic<size_t> count_{0};
  uint64_t next_sequence_ = 1;
};

}  // namespace engine
}  // namespace serialline
