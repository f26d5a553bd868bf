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

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>

#include "serialline/engine/reconnect_supervisor.hpp"
#include "utils/test_utils.hpp"

using namespace serialline;
using namespace serialline::engine;
using namespace std::chrono_literals;

class ReconnectSupervisorTest : public test::BaseTest {
 protected:
  std::shared_ptr<ReconnectSupervisor> make(bool enabled, int max_attempts, int failures_before_success) {
    failures_left_ = failures_before_success;
    ReconnectSupervisor::Options options;
    options.enabled = enabled;
    options.interval = 10ms;
    options.max_attempts = max_attempts;

    auto sup = ReconnectSupervisor::create(strand_, options, [this](ReconnectSupervisor::OpenCompletion done) {
      ++opens_;
      if (failures_left_ != 0) {
        if (failures_left_ > 0) --failures_left_;
        done(open_error_);
        return;
      }
      done(success_code_);
    });
    sup->on_reinstall([this] { ++reinstalls_; });
    sup->on_reconnected([this] { ++reconnected_; });
    sup->on_give_up([this](const boost::system::error_code& ec, uint32_t attempts) {
      ++give_ups_;
      last_error_ = ec;
      give_up_attempts_ = attempts;
    });
    return sup;
  }

  void run_for(std::chrono::milliseconds d) {
    ioc_.restart();
    ioc_.run_for(d);
  }

  boost::asio::io_context ioc_;
  ReconnectSupervisor::Strand strand_{boost::asio::make_strand(ioc_)};

  int failures_left_ = 0;
  boost::system::error_code open_error_ = boost::asio::error::no_such_device;
  boost::system::error_code success_code_;
  int opens_ = 0;
  int reinstalls_ = 0;
  int reconnected_ = 0;
  int give_ups_ = 0;
  boost::system::error_code last_error_;
  uint32_t give_up_attempts_ = 0;
};

TEST_F(ReconnectSupervisorTest, StartsDisconnected) {
  auto sup = make(true, -1, 0);
  EXPECT_EQ(sup->state(), ConnectionState::Disconnected);
  sup->mark_connected();
  EXPECT_EQ(sup->state(), ConnectionState::Connected);
}

TEST_F(ReconnectSupervisorTest, DisconnectWithoutConnectionIsIgnored) {
  auto sup = make(true, -1, 0);
  sup->on_disconnect();
  run_for(40ms);
  EXPECT_EQ(sup->state(), ConnectionState::Disconnected);
  EXPECT_EQ(opens_, 0);
}

TEST_F(ReconnectSupervisorTest, DisabledSupervisorStaysDisconnected) {
  auto sup = make(false, -1, 0);
  sup->mark_connected();
  sup->on_disconnect();
  run_for(40ms);
  EXPECT_EQ(sup->state(), ConnectionState::Disconnected);
  EXPECT_EQ(opens_, 0);
}

TEST_F(ReconnectSupervisorTest, ZeroAttemptsMeansNoReconnect) {
  auto sup = make(true, 0, 0);
  sup->mark_connected();
  sup->on_disconnect();
  run_for(40ms);
  EXPECT_EQ(sup->state(), ConnectionState::Disconnected);
  EXPECT_EQ(opens_, 0);
}

TEST_F(ReconnectSupervisorTest, RetriesUntilOpenSucceeds) {
  auto sup = make(true, -1, 2);
  sup->mark_connected();
  sup->on_disconnect();
  EXPECT_EQ(sup->state(), ConnectionState::Reconnecting);

  ASSERT_TRUE(test::TestUtils::runUntil(ioc_, [&] { return sup->state() == ConnectionState::Connected; }));
  EXPECT_EQ(opens_, 3);
  EXPECT_EQ(sup->attempts(), 3u);
  EXPECT_EQ(reconnected_, 1);
  // Once on disconnect, then before each attempt
  EXPECT_EQ(reinstalls_, 4);
  EXPECT_EQ(give_ups_, 0);
  EXPECT_TRUE(diagnostics::ErrorHandler::instance().has_errors("reconnect"));
}

TEST_F(ReconnectSupervisorTest, AlreadyOpenCountsAsSuccess) {
  auto sup = make(true, -1, 0);
  success_code_ = boost::asio::error::already_open;
  sup->mark_connected();
  sup->on_disconnect();
  ASSERT_TRUE(test::TestUtils::runUntil(ioc_, [&] { return sup->state() == ConnectionState::Connected; }));
  EXPECT_EQ(reconnected_, 1);
}

TEST_F(ReconnectSupervisorTest, GivesUpAfterMaxAttempts) {
  auto sup = make(true, 2, -1);
  sup->mark_connected();
  sup->on_disconnect();

  ASSERT_TRUE(test::TestUtils::runUntil(ioc_, [&] { return give_ups_ == 1; }));
  EXPECT_EQ(sup->state(), ConnectionState::Disconnected);
  EXPECT_EQ(opens_, 2);
  EXPECT_EQ(give_up_attempts_, 2u);
  EXPECT_EQ(last_error_, boost::asio::error::no_such_device);

  run_for(40ms);
  EXPECT_EQ(opens_, 2);
}

TEST_F(ReconnectSupervisorTest, StopCancelsPendingRetry) {
  auto sup = make(true, -1, 0);
  sup->mark_connected();
  sup->on_disconnect();
  sup->stop();
  run_for(50ms);
  EXPECT_EQ(opens_, 0);
  EXPECT_EQ(sup->state(), ConnectionState::Disconnected);
}

TEST_F(ReconnectSupervisorTest, ManualOpenDuringRetryWins) {
  auto sup = make(true, -1, -1);
  sup->mark_connected();
  sup->on_disconnect();
  run_for(25ms);
  int before = opens_;
  EXPECT_GE(before, 1);

  sup->mark_connected();
  run_for(40ms);
  EXPECT_EQ(opens_, before);
  EXPECT_EQ(sup->state(), ConnectionState::Connected);
}

TEST(ReconnectPolicyTest, ShouldRetryHonoursLimit) {
  EXPECT_TRUE(should_retry(-1, 1000));
  EXPECT_FALSE(should_retry(0, 0));
  EXPECT_TRUE(should_retry(3, 2));
  EXPECT_FALSE(should_retry(3, 3));
}

TEST(ConnectionStateTest, Names) {
  EXPECT_EQ(to_string(ConnectionState::Disconnected), "Disconnected");
  EXPECT_EQ(to_string(ConnectionState::Reconnecting), "Reconnecting");
  EXPECT_EQ(to_string(ConnectionState::Connected), "Connected");
}
