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
#include <memory>
#include <mutex>
#include <thread>

#include "serialline/base/visibility.hpp"

namespace serialline {
namespace runtime {

/**
 * @brief Process-wide io_context run on one background thread.
 *
 * Engines created without an explicit io_context share this one. The
 * context object outlives stop(), so engines holding a reference to it stay
 * valid across a stop()/start() cycle.
 */
class SERIALLINE_API IoContextManager {
 public:
  using IoContext = boost::asio::io_context;
  using WorkGuard = boost::asio::executor_work_guard<IoContext::executor_type>;

  static IoContextManager& instance();

  IoContext& get_context();

  void start();
  void stop();

  bool is_running() const;

  ~IoContextManager();

 private:
  IoContextManager() = default;
  IoContextManager(const IoContextManager&) = delete;
  IoContextManager& operator=(const IoContextManager&) = delete;

  std::unique_ptr<IoContext> ioc_;
  std::unique_ptr<WorkGuard> work_guard_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
};

}  // namespace runtime
}  // namespace serialline
