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

#include "serialline/engine/command_queue.hpp"

#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/exceptions.hpp"
#include "serialline/diagnostics/logger.hpp"
#include "serialline/engine/response_matcher.hpp"

namespace serialline {
namespace engine {

using namespace diagnostics;

std::shared_ptr<CommandQueue> CommandQueue::create(Strand strand, WriteFunction write) {
  return std::shared_ptr<CommandQueue>(new CommandQueue(std::move(strand), std::move(write)));
}

CommandQueue::CommandQueue(Strand strand, WriteFunction write)
    : strand_(std::move(strand)), write_(std::move(write)), timer_(strand_) {}

void CommandQueue::on_write(WriteListener listener) { on_write_ = std::move(listener); }

void CommandQueue::enqueue(std::unique_ptr<Command> command) {
  command->sequence = next_sequence_++;
  queue_.push_back(std::move(command));
  count_.store(queue_.size());
  if (queue_.size() == 1) {
    dispatch();
  }
}

bool CommandQueue::on_line(const std::string& line) {
  if (queue_.empty()) {
    return false;
  }

  auto& head = *queue_.front();
  if (!head.written) {
    return true;
  }

  auto result = ResponseMatcher::evaluate(head, line);
  if (result.complete) {
    cancel_timer();
    complete_head(ResponseMatcher::completion_data(head, line));
    dispatch();
  }
  return true;
}

void CommandQueue::fail_all(std::exception_ptr error) {
  cancel_timer();
  auto pending = std::move(queue_);
  queue_.clear();
  count_.store(0);
  for (auto& command : pending) {
    if (command->is_pending()) {
      command->state = CommandState::Failed;
      command->promise.set_exception(error);
    }
  }
}

void CommandQueue::dispatch() {
  if (queue_.empty()) {
    return;
  }

  auto& head = *queue_.front();
  head.written = true;
  std::string bytes = head.wire_text();
  if (on_write_) on_write_(bytes);

  const uint64_t sequence = head.sequence;
  std::weak_ptr<CommandQueue> weak = weak_from_this();
  auto strand = strand_;
  write_(std::move(bytes), [weak, strand, sequence](const boost::system::error_code& ec) {
    net::post(strand, [weak, sequence, ec] {
      if (auto self = weak.lock()) {
        self->on_write_complete(sequence, ec);
      }
    });
  });
}

void CommandQueue::on_write_complete(uint64_t sequence, const boost::system::error_code& ec) {
  // Head already resolved through data, failed or was flushed
  if (!is_head(sequence)) {
    return;
  }

  auto& head = *queue_.front();
  if (ec) {
    SERIALLINE_LOG_ERROR("command_queue", "write", "Write failed for '" + head.text + "': " + ec.message());
    error_reporting::report_communication_error("command_queue", "write", ec.message(), false, source_, ec);
    fail_head(std::make_exception_ptr(WriteError(head.text, ec)));
    dispatch();
    return;
  }

  if (!head.response) {
    complete_head(Response{});
    dispatch();
    return;
  }

  timer_armed_ = true;
  timer_.expires_after(head.timeout);
  std::weak_ptr<CommandQueue> weak = weak_from_this();
  timer_.async_wait(net::bind_executor(strand_, [weak, sequence](const boost::system::error_code& tec) {
    if (tec == net::error::operation_aborted) {
      return;
    }
    if (auto self = weak.lock()) {
      self->on_timeout(sequence);
    }
  }));
}

void CommandQueue::on_timeout(uint64_t sequence) {
  if (!is_head(sequence) || !timer_armed_) {
    return;
  }
  timer_armed_ = false;

  auto& head = *queue_.front();
  TimeoutError error(head.text, static_cast<long long>(head.timeout.count()));
  SERIALLINE_LOG_WARNING("command_queue", "response", error.what());
  error_reporting::report_communication_error("command_queue", "response", error.what(), true, source_);
  fail_head(std::make_exception_ptr(error));
  dispatch();
}

void CommandQueue::complete_head(Response data) {
  auto head = std::move(queue_.front());
  queue_.pop_front();
  count_.store(queue_.size());
  head->state = CommandState::Completed;
  head->promise.set_value(std::move(data));
}

void CommandQueue::fail_head(std::exception_ptr error) {
  auto head = std::move(queue_.front());
  queue_.pop_front();
  count_.store(queue_.size());
  head->state = CommandState::Failed;
  head->promise.set_exception(error);
}

void CommandQueue::cancel_timer() {
  if (timer_armed_) {
    timer_.cancel();
    timer_armed_ = false;
  }
}

bool CommandQueue::is_head(uint64_t sequence) const {
  return !queue_.empty() && queue_.front()->sequence == sequence && queue_.front()->is_pending();
}

}  // namespace engine
}  // namespace serialline
