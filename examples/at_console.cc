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

#include <chrono>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "serialline/serialline.hpp"

using namespace serialline;

namespace {

void print_response(const Response& response) {
  if (std::holds_alternative<std::string>(response)) {
    std::cout << "< " << std::get<std::string>(response) << "\n";
  } else if (std::holds_alternative<std::vector<std::string>>(response)) {
    for (const auto& line : std::get<std::vector<std::string>>(response)) {
      std::cout << "< " << line << "\n";
    }
  } else {
    std::cout << "(sent)\n";
  }
}

}  // namespace

// Usage: at_console <device> [baud]
//        at_console --config <engine.yaml>
// Reads commands from stdin, one per line, and prints the modem reply.
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <device> [baud] | --config <file.yaml>\n";
    return 1;
  }

  diagnostics::Logger::instance().set_level(diagnostics::LogLevel::INFO);
  diagnostics::ErrorHandler::instance().add_callback([](const diagnostics::ErrorInfo& info) {
    std::cerr << info.summary() << "\n";
  });

  std::shared_ptr<SerialLineEngine> engine;
  try {
    if (std::string(argv[1]) == "--config" && argc >= 3) {
      engine = builder::EngineBuilder(config::load_engine_config(argv[2])).build();
    } else {
      uint32_t baud = argc >= 3 ? static_cast<uint32_t>(std::stoul(argv[2])) : 115200;
      engine = line(argv[1], baud)
                   .timeout(std::chrono::milliseconds(2000))
                   .on_data([](const std::string& l) { std::cout << "~ " << l << "\n"; })
                   .on_disconnect([] { std::cout << "[serial] disconnected, retrying\n"; })
                   .on_open([] { std::cout << "[serial] open\n"; })
                   .build();
    }
  } catch (const diagnostics::SerialLineException& e) {
    std::cerr << e.get_full_message() << "\n";
    return 1;
  }

  engine->watch(Pattern::parse("/ERROR|NO CARRIER/g"),
                [](const std::string& match, const Pattern&) { std::cout << "! " << match << "\n"; });

  try {
    engine->open().get();
  } catch (const diagnostics::SerialLineException& e) {
    std::cerr << "open failed: " << e.get_full_message() << "\n";
    return 1;
  }

  std::string command;
  while (std::getline(std::cin, command)) {
    if (command.empty()) continue;
    try {
      print_response(engine->send(command, Pattern::parse("/^(OK|ERROR)/")).get());
    } catch (const diagnostics::TimeoutError& e) {
      std::cout << "timeout: " << e.get_command() << "\n";
    } catch (const diagnostics::SerialLineException& e) {
      std::cout << "failed: " << e.get_full_message() << "\n";
    }
  }

  engine->destroy();
  return 0;
}
