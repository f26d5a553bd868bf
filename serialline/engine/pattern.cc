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

#include "serialline/engine/pattern.hpp"

#include "serialline/diagnostics/exceptions.hpp"

namespace serialline {
namespace engine {

Pattern::Pattern(std::string source, Mode mode, bool icase, bool literal)
    : source_(std::move(source)), mode_(mode), icase_(icase), literal_(literal) {
  if (literal_) {
    if (source_.empty()) {
      throw diagnostics::ConfigurationError("Literal pattern must not be empty", "pattern", "literal");
    }
    return;
  }

  auto flags = std::regex::ECMAScript;
  if (icase_) flags |= std::regex::icase;
  try {
    re_ = std::make_shared<const std::regex>(source_, flags);
  } catch (const std::regex_error& e) {
    throw diagnostics::ConfigurationError("Invalid pattern '" + source_ + "': " + e.what(), "pattern", "regex");
  }
}

Pattern::Pattern(const char* expression) : Pattern(std::string(expression ? expression : ""), Mode::Single, false, false) {}

Pattern::Pattern(const std::string& expression) : Pattern(expression, Mode::Single, false, false) {}

Pattern Pattern::regex(const std::string& expression, Mode mode, bool icase) {
  return Pattern(expression, mode, icase, false);
}

Pattern Pattern::literal(const std::string& text, Mode mode) { return Pattern(text, mode, false, true); }

Pattern Pattern::parse(const std::string& text) {
  if (text.size() >= 2 && text.front() == '/') {
    auto close = text.rfind('/');
    if (close > 0) {
      std::string flags = text.substr(close + 1);
      if (flags.find_first_not_of("gi") == std::string::npos) {
        bool global = flags.find('g') != std::string::npos;
        bool icase = flags.find('i') != std::string::npos;
        return Pattern(text.substr(1, close - 1), global ? Mode::Global : Mode::Single, icase, false);
      }
    }
  }
  return Pattern(text, Mode::Single, false, false);
}

bool Pattern::search(const std::string& line) const {
  if (literal_) {
    return line.find(source_) != std::string::npos;
  }
  return std::regex_search(line, *re_);
}

std::vector<std::string> Pattern::matches(const std::string& line) const {
  std::vector<std::string> out;

  if (literal_) {
    size_t pos = line.find(source_);
    while (pos != std::string::npos) {
      out.push_back(source_);
      if (mode_ == Mode::Single) break;
      pos = line.find(source_, pos + source_.size());
    }
    return out;
  }

  if (mode_ == Mode::Single) {
    std::smatch m;
    if (std::regex_search(line, m, *re_)) {
      out.push_back(m.str(0));
    }
    return out;
  }

  // sregex_iterator steps past empty matches itself
  for (std::sregex_iterator it(line.begin(), line.end(), *re_), end; it != end; ++it) {
    out.push_back(it->str(0));
  }
  return out;
}

}  // namespace engine
}  // namespace serialline
