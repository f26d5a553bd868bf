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

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "serialline/base/visibility.hpp"

namespace serialline {
namespace engine {

/**
 * @brief Text-matching predicate used for responses, scans and watchers.
 *
 * A pattern is either a regular expression (ECMAScript grammar) or a
 * literal substring. In Single mode it yields at most the first match of a
 * line; in Global mode it yields every non-overlapping match, left to right.
 * Matching is always containment: a pattern never has to span the whole
 * line unless it anchors itself with ^ and $.
 *
 * Plain strings convert implicitly to a single-mode regex, so
 * `engine->send("AT", "^OK")` reads naturally.
 */
class SERIALLINE_API Pattern {
 public:
  enum class Mode { Single, Global };

  /**
   * @throws diagnostics::ConfigurationError if the expression does not compile
   */
  static Pattern regex(const std::string& expression, Mode mode = Mode::Single, bool icase = false);
  static Pattern literal(const std::string& text, Mode mode = Mode::Single);

  /**
   * @brief Parse "/expr/flags" notation
   *
   * Flags may contain 'g' (global) and 'i' (case-insensitive). Text that is
   * not in this notation is compiled as a plain single-mode regex.
   */
  static Pattern parse(const std::string& text);

  Pattern(const char* expression);         // NOLINT(google-explicit-constructor)
  Pattern(const std::string& expression);  // NOLINT(google-explicit-constructor)

  /**
   * @brief True if the line contains at least one match
   */
  bool search(const std::string& line) const;

  /**
   * @brief Matched substrings, one for Single mode, all for Global mode
   */
  std::vector<std::string> matches(const std::string& line) const;

  const std::string& source() const { return source_; }
  Mode mode() const { return mode_; }
  bool is_global() const { return mode_ == Mode::Global; }
  bool is_literal() const { return literal_; }
  bool ignore_case() const { return icase_; }

 private:
  Pattern(std::string source, Mode mode, bool icase, bool literal);

  std::string source_;
  Mode mode_;
  bool icase_;
  bool literal_;
  // Shared so copies of a Pattern do not recompile the expression
  std::shared_ptr<const std::regex> re_;
};

}  // namespace engine
}  // namespace serialline
