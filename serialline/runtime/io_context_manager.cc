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

#include "serialline/runtime/io_context_manager.hpp"

#include <iostream>
#include <system_error>

#include "serialline/diagnostics/logger.hpp"

namespace serialline {
namespace runtime {

IoContextManager& IoContextManager::instance() {
  static IoContextManager instance;
  return instance;
}

boost::asio::io_context& IoContextManager::get_context() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ioc_) {
    ioc_ = std::make_unique<IoContext>();
  }
  return *ioc_;
}

void IoContextManager::start() {
  std::thread previous_thread;
  IoContext* context = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }

    if (io_thread_.joinable()) {
      previous_thread = std::move(io_thread_);
    }

    if (!ioc_) {
      ioc_ = std::make_unique<IoContext>();
    }

    if (ioc_->stopped()) {
      ioc_->restart();
    }
    work_guard_ = std::make_unique<WorkGuard>(ioc_->get_executor());
    context = ioc_.get();
    running_.store(true);
  }

  if (previous_thread.joinable()) {
    previous_thread.join();
  }

  io_thread_ = std::thread([context]() {
    try {
      context->run();
    } catch (const std::exception& e) {
      SERIALLINE_LOG_ERROR("io_context_manager", "run", "Thread error: " + std::string(e.what()));
    } catch (...) {
      SERIALLINE_LOG_ERROR("io_context_manager", "run", "Thread error: unknown exception");
    }
  });
  SERIALLINE_LOG_DEBUG("io_context_manager", "start", "Shared io_context started");
}

void IoContextManager::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && !io_thread_.joinable()) {
      return;
    }

    if (work_guard_) {
      work_guard_.reset();
    }

    if (ioc_) {
      ioc_->stop();
    }

    if (io_thread_.joinable()) {
      worker = std::move(io_thread_);
    }

    running_ = false;
  }

  if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
    worker.join();
  } else if (worker.joinable()) {
    // stop() called from a handler on the io thread
    worker.detach();
  }
}

bool IoContextManager::is_running() const { return running_.load(); }

IoContextManager::~IoContextManager() {
  try {
    stop();
  } catch (const std::system_error& e) {
    // Logger may already be gone at static destruction time
    std::cerr << "IoContextManager shutdown failed: " << e.what() << std::endl;
  }
}

}  // namespace runtime
}  // namespace serialline
