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

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "serialline/diagnostics/logger.hpp"
#include "utils/test_utils.hpp"

using namespace serialline;
using namespace serialline::diagnostics;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& logger = Logger::instance();
    logger.set_enabled(true);
    logger.set_level(LogLevel::DEBUG);
    logger.set_outputs(0);
    logger.set_format("{level}|{component}|{operation}|{message}");
    logger.set_callback([this](LogLevel level, const std::string& line) {
      levels_.push_back(level);
      lines_.push_back(line);
    });
  }

  void TearDown() override {
    auto& logger = Logger::instance();
    logger.set_callback(nullptr);
    logger.set_file_output("");
    logger.set_format("{timestamp} [{level}] [{component}] [{operation}] {message}");
    logger.set_outputs(static_cast<int>(LogOutput::CONSOLE));
    logger.set_level(LogLevel::INFO);
  }

  std::vector<LogLevel> levels_;
  std::vector<std::string> lines_;
};

TEST_F(LoggerTest, FormatsPlaceholders) {
  SERIALLINE_LOG_INFO("engine", "tx", "AT\\r\\n");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0], "INFO|engine|tx|AT\\r\\n");
  EXPECT_EQ(levels_[0], LogLevel::INFO);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
  Logger::instance().set_level(LogLevel::WARNING);
  SERIALLINE_LOG_DEBUG("engine", "rx", "dropped");
  SERIALLINE_LOG_INFO("engine", "rx", "dropped");
  SERIALLINE_LOG_WARNING("engine", "disconnect", "kept");
  SERIALLINE_LOG_ERROR("command_queue", "write", "kept");
  ASSERT_EQ(lines_.size(), 2u);
  EXPECT_EQ(lines_[0], "WARNING|engine|disconnect|kept");
  EXPECT_EQ(lines_[1], "ERROR|command_queue|write|kept");
}

TEST_F(LoggerTest, DisabledLoggerIsSilent) {
  Logger::instance().set_enabled(false);
  SERIALLINE_LOG_CRITICAL("engine", "destroy", "nothing");
  Logger::instance().set_enabled(true);
  EXPECT_TRUE(lines_.empty());
}

TEST_F(LoggerTest, UnknownPlaceholderIsLeftAsIs) {
  Logger::instance().set_format("{level} {thread} {message}");
  SERIALLINE_LOG_INFO("a", "b", "msg");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0], "INFO {thread} msg");
}

TEST_F(LoggerTest, WritesToFile) {
  auto path = test::TestUtils::makeTempFilePath("serialline_logger_test.log");
  test::TestUtils::removeFileIfExists(path);

  Logger::instance().set_file_output(path.string());
  SERIALLINE_LOG_INFO("serial", "open", "Device opened: /dev/ttyUSB0 @ 115200");
  Logger::instance().flush();
  Logger::instance().set_file_output("");

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_NE(content.str().find("INFO|serial|open|Device opened: /dev/ttyUSB0 @ 115200"), std::string::npos);
  test::TestUtils::removeFileIfExists(path);
}

TEST_F(LoggerTest, ThrowingCallbackIsContained) {
  Logger::instance().set_callback([](LogLevel, const std::string&) { throw std::runtime_error("sink failure"); });
  EXPECT_NO_THROW(SERIALLINE_LOG_ERROR("engine", "open", "failed"));
}
