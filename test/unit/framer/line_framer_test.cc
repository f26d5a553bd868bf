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

#include <memory>
#include <string>
#include <vector>

#include "serialline/framer/line_framer.hpp"

using namespace serialline::framer;

class LineFramerTest : public ::testing::Test {
 protected:
  void SetUp() override { make_framer("\n", 1024); }

  void make_framer(const std::string& delimiter, size_t max_length) {
    framer_ = std::make_unique<LineFramer>(delimiter, max_length);
    framer_->set_on_message([this](std::string_view msg) { messages_.emplace_back(msg); });
  }

  std::unique_ptr<LineFramer> framer_;
  std::vector<std::string> messages_;
};

TEST_F(LineFramerTest, SingleMessage) {
  framer_->push_bytes("Hello\n");
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0], "Hello");
}

TEST_F(LineFramerTest, SplitMessage) {
  framer_->push_bytes("He");
  ASSERT_EQ(messages_.size(), 0u);
  EXPECT_EQ(framer_->buffered(), 2u);
  framer_->push_bytes("llo\n");
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0], "Hello");
  EXPECT_EQ(framer_->buffered(), 0u);
}

TEST_F(LineFramerTest, MergedMessages) {
  framer_->push_bytes("Msg1\nMsg2\npart");
  ASSERT_EQ(messages_.size(), 2u);
  EXPECT_EQ(messages_[0], "Msg1");
  EXPECT_EQ(messages_[1], "Msg2");
  EXPECT_EQ(framer_->buffered(), 4u);
}

// Modems answer with CRLF; splitting on LF leaves the CR on the line
TEST_F(LineFramerTest, CarriageReturnIsKept) {
  framer_->push_bytes("Come on, now,\r\n");
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0], "Come on, now,\r");
}

TEST_F(LineFramerTest, EmptyLinesAreDelivered) {
  framer_->push_bytes("\r\n\nOK\n");
  ASSERT_EQ(messages_.size(), 3u);
  EXPECT_EQ(messages_[0], "\r");
  EXPECT_EQ(messages_[1], "");
  EXPECT_EQ(messages_[2], "OK");
}

TEST_F(LineFramerTest, MultiByteDelimiterSplitAcrossChunks) {
  make_framer("\r\n", 1024);
  framer_->push_bytes("OK\r");
  EXPECT_TRUE(messages_.empty());
  framer_->push_bytes("\nRING\r\n");
  ASSERT_EQ(messages_.size(), 2u);
  EXPECT_EQ(messages_[0], "OK");
  EXPECT_EQ(messages_[1], "RING");
}

TEST_F(LineFramerTest, OversizedLineIsDroppedUpToNextDelimiter) {
  make_framer("\n", 16);
  framer_->push_bytes("0123456789ABCDEFGH");  // no delimiter, exceeds max
  EXPECT_EQ(framer_->buffered(), 0u);
  framer_->push_bytes("tail of the long line\nHi\n");
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0], "Hi");
}

TEST_F(LineFramerTest, CompleteOversizedLineIsDropped) {
  make_framer("\n", 16);
  framer_->push_bytes("this line is far too long\nshort\n");
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0], "short");
}

TEST_F(LineFramerTest, ResetDiscardsPartialLine) {
  framer_->push_bytes("stale");
  framer_->reset();
  framer_->push_bytes("fresh\n");
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_EQ(messages_[0], "fresh");
}

TEST_F(LineFramerTest, EmptyDelimiterFallsBackToNewline) {
  make_framer("", 1024);
  framer_->push_bytes("a\nb\n");
  ASSERT_EQ(messages_.size(), 2u);
  EXPECT_EQ(messages_[1], "b");
}
