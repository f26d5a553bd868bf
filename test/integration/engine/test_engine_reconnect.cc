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

#include <atomic>
#include <chrono>
#include <string>

#include "integration/engine/engine_test_fixture.hpp"

using namespace serialline;
using namespace serialline::test;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

class EngineReconnectTest : public EngineTest {
 protected:
  bool reconnected(int expected_open_calls) {
    return TestUtils::waitForCondition([&] {
      return fake_->open_calls() == expected_open_calls &&
             engine_->connection_state() == ConnectionState::Connected;
    });
  }
};

TEST_F(EngineReconnectTest, ReopensAfterDisconnect) {
  start(false);
  Recorder events;
  engine_->on(EventKind::Open, events.counter());
  engine_->on(EventKind::Disconnected, events.counter());
  auto opened = engine_->open();
  await(opened);

  fake_->fail_opens(2);
  fake_->simulate_disconnect();

  ASSERT_TRUE(reconnected(4));
  EXPECT_TRUE(engine_->is_open());
  EXPECT_TRUE(fake_->has_line_handler());
  ASSERT_TRUE(TestUtils::waitForCondition([&] { return events.size() == 3; }));
  EXPECT_THAT(events.values(), ElementsAre("open", "disconnected", "open"));

  // Lines flow again through the reinstalled handlers
  Recorder data;
  engine_->on(EventKind::Data, data.data_handler());
  fake_->mock_rx("RING");
  EXPECT_TRUE(TestUtils::waitForCondition([&] { return data.size() == 1; }));
}

TEST_F(EngineReconnectTest, DisconnectIsReportedAsError) {
  start(false);
  std::atomic<int> eof_errors{0};
  engine_->on(EventKind::Error, [&eof_errors](const EngineEvent& e) {
    if (e.error == boost::asio::error::eof) ++eof_errors;
  });
  auto opened = engine_->open();
  await(opened);

  fake_->simulate_disconnect();
  EXPECT_TRUE(TestUtils::waitForCondition([&] { return eof_errors.load() == 1; }));
  EXPECT_TRUE(reconnected(2));
}

TEST_F(EngineReconnectTest, PendingCommandSurvivesReconnect) {
  start();
  fake_->set_loopback(false);
  SendOptions options;
  options.timeout = 2000ms;
  auto f = engine_->send("AT+COPS?", Pattern("^\\+COPS"), options);
  ASSERT_TRUE(TestUtils::waitForCondition([&] { return fake_->write_count() == 1; }));

  fake_->simulate_disconnect();
  ASSERT_TRUE(reconnected(2));
  EXPECT_NE(f.wait_for(0ms), std::future_status::ready);

  fake_->mock_rx("+COPS: 0,0,\"Operator\"");
  EXPECT_EQ(std::get<std::string>(await(f)), "+COPS: 0,0,\"Operator\"\r");
}

TEST_F(EngineReconnectTest, FailPendingOnDisconnect) {
  cfg_.fail_pending_on_disconnect = true;
  start();
  fake_->set_loopback(false);
  auto f = engine_->send("AT+COPS?", Pattern("^\\+COPS"));
  ASSERT_TRUE(TestUtils::waitForCondition([&] { return fake_->write_count() == 1; }));

  fake_->simulate_disconnect();
  EXPECT_THROW(await(f), diagnostics::NotOpenError);
  EXPECT_TRUE(reconnected(2));
  EXPECT_EQ(engine_->pending_commands(), 0u);
}

TEST_F(EngineReconnectTest, GivesUpAfterMaxAttempts) {
  cfg_.max_reconnect_attempts = 2;
  start(false);
  std::atomic<int> give_ups{0};
  engine_->on(EventKind::Error, [&give_ups](const EngineEvent& e) {
    if (e.error == boost::asio::error::no_such_device) ++give_ups;
  });
  auto opened = engine_->open();
  await(opened);

  fake_->fail_opens(-1);
  fake_->simulate_disconnect();

  ASSERT_TRUE(TestUtils::waitForCondition([&] { return give_ups.load() == 1; }));
  EXPECT_EQ(fake_->open_calls(), 3);
  EXPECT_EQ(engine_->connection_state(), ConnectionState::Disconnected);
  EXPECT_FALSE(engine_->is_open());
  EXPECT_TRUE(diagnostics::ErrorHandler::instance().has_errors("reconnect"));

  // No further attempts once abandoned
  TestUtils::waitFor(100);
  EXPECT_EQ(fake_->open_calls(), 3);
}

TEST_F(EngineReconnectTest, ReconnectDisabled) {
  cfg_.reconnect_on_disconnect = false;
  start(false);
  Recorder events;
  engine_->on(EventKind::Disconnected, events.counter());
  auto opened = engine_->open();
  await(opened);

  fake_->simulate_disconnect();
  ASSERT_TRUE(TestUtils::waitForCondition([&] { return events.size() == 1; }));
  TestUtils::waitFor(100);
  EXPECT_EQ(fake_->open_calls(), 1);
  EXPECT_EQ(engine_->connection_state(), ConnectionState::Disconnected);
  EXPECT_FALSE(engine_->is_open());
}

TEST_F(EngineReconnectTest, UserCloseDoesNotReconnect) {
  start();
  auto closed = engine_->close();
  await(closed);

  TestUtils::waitFor(100);
  EXPECT_EQ(fake_->open_calls(), 1);
  EXPECT_EQ(engine_->connection_state(), ConnectionState::Disconnected);
  EXPECT_FALSE(fake_->is_open());
}

TEST_F(EngineReconnectTest, ManualOpenWhileReconnectingWins) {
  cfg_.retry_interval_ms = 300;
  start();

  fake_->simulate_disconnect();
  ASSERT_TRUE(TestUtils::waitForCondition(
      [&] { return engine_->connection_state() == ConnectionState::Reconnecting; }));

  auto opened = engine_->open();
  EXPECT_NO_THROW(await(opened));
  EXPECT_EQ(engine_->connection_state(), ConnectionState::Connected);

  // The pending retry is cancelled
  TestUtils::waitFor(400);
  EXPECT_EQ(fake_->open_calls(), 2);
  EXPECT_TRUE(engine_->is_open());
}
