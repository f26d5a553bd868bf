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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>
#include <future>
#include <string>
#include <vector>

#include "serialline/diagnostics/exceptions.hpp"
#include "serialline/engine/command_queue.hpp"
#include "utils/test_utils.hpp"

using namespace serialline;
using namespace serialline::engine;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace {

template <typename T>
bool is_ready(std::future<T>& f) {
  return f.wait_for(0ms) == std::future_status::ready;
}

}  // namespace

// The queue is driven by hand on a single thread: writes are captured and
// acknowledged explicitly, and the io_context is polled in between.
class CommandQueueTest : public test::BaseTest {
 protected:
  void SetUp() override {
    BaseTest::SetUp();
    queue_ = CommandQueue::create(strand_, [this](std::string bytes, CommandQueue::WriteCompletion done) {
      writes_.push_back(std::move(bytes));
      completions_.push_back(std::move(done));
    });
  }

  std::future<Response> enqueue(const std::string& text, std::optional<Pattern> response,
                                std::chrono::milliseconds timeout = 1000ms, std::optional<Pattern> scan = std::nullopt,
                                const std::string& eol = "\r\n") {
    auto cmd = std::make_unique<Command>();
    cmd->text = text;
    cmd->response = std::move(response);
    cmd->scan = std::move(scan);
    cmd->timeout = timeout;
    cmd->eol = eol;
    auto future = cmd->promise.get_future();
    queue_->enqueue(std::move(cmd));
    return future;
  }

  void ack(size_t index, const boost::system::error_code& ec = {}) {
    ASSERT_LT(index, completions_.size());
    completions_[index](ec);
    pump();
  }

  void pump() {
    ioc_.restart();
    ioc_.poll();
  }

  boost::asio::io_context ioc_;
  CommandQueue::Strand strand_{boost::asio::make_strand(ioc_)};
  std::shared_ptr<CommandQueue> queue_;
  std::vector<std::string> writes_;
  std::vector<CommandQueue::WriteCompletion> completions_;
};

TEST_F(CommandQueueTest, OnlyHeadIsWrittenUntilItResolves) {
  auto a = enqueue("A", Pattern("^A-OK"));
  auto b = enqueue("B", std::nullopt);
  EXPECT_EQ(queue_->size(), 2u);
  EXPECT_THAT(writes_, ElementsAre("A\r\n"));

  ack(0);
  EXPECT_TRUE(queue_->timer_armed());
  EXPECT_THAT(writes_, ElementsAre("A\r\n"));

  EXPECT_TRUE(queue_->on_line("A-OK"));
  ASSERT_TRUE(is_ready(a));
  EXPECT_EQ(std::get<std::string>(a.get()), "A-OK");
  EXPECT_FALSE(queue_->timer_armed());
  EXPECT_THAT(writes_, ElementsAre("A\r\n", "B\r\n"));

  ack(1);
  ASSERT_TRUE(is_ready(b));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(b.get()));
  EXPECT_TRUE(queue_->empty());
}

TEST_F(CommandQueueTest, NoResponseCommandCompletesOnWriteAck) {
  auto f = enqueue("Hello?", std::nullopt);
  pump();
  EXPECT_FALSE(is_ready(f));
  ack(0);
  ASSERT_TRUE(is_ready(f));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(f.get()));
}

TEST_F(CommandQueueTest, ResponseBeforeWriteAckResolvesAndLateAckIsIgnored) {
  auto a = enqueue("A", Pattern("A"));
  auto b = enqueue("B", Pattern("never"));

  // Loopback echo arrives before the write completes
  EXPECT_TRUE(queue_->on_line("A"));
  ASSERT_TRUE(is_ready(a));
  EXPECT_EQ(std::get<std::string>(a.get()), "A");

  // Stale ack for A must not touch B
  ack(0);
  EXPECT_FALSE(is_ready(b));
  EXPECT_FALSE(queue_->timer_armed());
  EXPECT_EQ(queue_->size(), 1u);
}

TEST_F(CommandQueueTest, WriteErrorFailsHeadAndAdvances) {
  auto a = enqueue("A", Pattern("OK"));
  auto b = enqueue("B", Pattern("OK"));

  ack(0, boost::asio::error::broken_pipe);
  ASSERT_TRUE(is_ready(a));
  try {
    a.get();
    FAIL() << "expected WriteError";
  } catch (const diagnostics::WriteError& e) {
    EXPECT_EQ(e.get_command(), "A");
    EXPECT_EQ(e.get_error(), boost::asio::error::broken_pipe);
    EXPECT_EQ(e.code(), ErrorCode::WriteFailed);
  }
  EXPECT_THAT(writes_, ElementsAre("A\r\n", "B\r\n"));
  EXPECT_FALSE(is_ready(b));
  EXPECT_TRUE(diagnostics::ErrorHandler::instance().has_errors("command_queue"));
}

TEST_F(CommandQueueTest, TimeoutFailsHeadAndAdvances) {
  auto a = enqueue("ATD", Pattern("CONNECT"), 20ms);
  auto b = enqueue("ATH", std::nullopt);
  ack(0);
  EXPECT_TRUE(queue_->timer_armed());

  ASSERT_TRUE(test::TestUtils::runUntil(ioc_, [&] { return is_ready(a); }));
  try {
    a.get();
    FAIL() << "expected TimeoutError";
  } catch (const diagnostics::TimeoutError& e) {
    EXPECT_EQ(e.get_command(), "ATD");
    EXPECT_EQ(e.get_timeout_ms(), 20);
  }
  EXPECT_THAT(writes_, ElementsAre("ATD\r\n", "ATH\r\n"));
  ack(1);
  EXPECT_TRUE(is_ready(b));
}

TEST_F(CommandQueueTest, TimerStartsOnlyAfterWriteCompletes) {
  auto a = enqueue("SLOW", Pattern("OK"), 10ms);
  // Without the ack no deadline is running
  ioc_.restart();
  ioc_.run_for(40ms);
  EXPECT_FALSE(is_ready(a));
  EXPECT_FALSE(queue_->timer_armed());
  ack(0);
  EXPECT_TRUE(queue_->timer_armed());
}

TEST_F(CommandQueueTest, ScanCollectsLinesUntilResponse) {
  auto f = enqueue("AT+CMGL", Pattern("^OK"), 1000ms, Pattern("^\\+CMGL"));
  ack(0);
  queue_->on_line("AT+CMGL\r");
  queue_->on_line("+CMGL: 1,\"REC READ\"");
  queue_->on_line("hello");
  queue_->on_line("+CMGL: 2,\"REC UNREAD\"");
  EXPECT_FALSE(is_ready(f));
  queue_->on_line("OK");
  ASSERT_TRUE(is_ready(f));
  EXPECT_THAT(std::get<std::vector<std::string>>(f.get()),
              ElementsAre("+CMGL: 1,\"REC READ\"", "+CMGL: 2,\"REC UNREAD\""));
}

TEST_F(CommandQueueTest, OnLineWithEmptyQueueIsNotConsumed) { EXPECT_FALSE(queue_->on_line("RING")); }

TEST_F(CommandQueueTest, FailAllRejectsEveryQueuedCommand) {
  auto a = enqueue("A", Pattern("OK"));
  auto b = enqueue("B", Pattern("OK"));
  auto c = enqueue("C", std::nullopt);
  ack(0);

  queue_->fail_all(std::make_exception_ptr(diagnostics::EngineDestroyedError("send")));
  EXPECT_EQ(queue_->size(), 0u);
  EXPECT_FALSE(queue_->timer_armed());
  EXPECT_THROW(a.get(), diagnostics::EngineDestroyedError);
  EXPECT_THROW(b.get(), diagnostics::EngineDestroyedError);
  EXPECT_THROW(c.get(), diagnostics::EngineDestroyedError);

  // The queue keeps working afterwards
  auto d = enqueue("D", std::nullopt);
  EXPECT_EQ(writes_.back(), "D\r\n");
  ack(completions_.size() - 1);
  EXPECT_TRUE(is_ready(d));
}

TEST_F(CommandQueueTest, WriteListenerSeesExactWireBytes) {
  std::vector<std::string> seen;
  queue_->on_write([&](const std::string& bytes) { seen.push_back(bytes); });
  enqueue("ATZ", std::nullopt, 1000ms, std::nullopt, "\r");
  EXPECT_THAT(seen, ElementsAre("ATZ\r"));
  EXPECT_THAT(writes_, ElementsAre("ATZ\r"));
}
