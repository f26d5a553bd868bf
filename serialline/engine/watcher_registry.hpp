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

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "serialline/base/visibility.hpp"
#include "serialline/engine/pattern.hpp"

namespace serialline {
namespace engine {

using WatcherId = uint64_t;

/**
 * @brief Standing pattern subscriptions scanned against every inbound line.
 *
 * Not thread-safe; the owning engine only touches it on its strand.
 */
class SERIALLINE_API WatcherRegistry {
 public:
  using Callback = std::function<void(const std::string& match, const Pattern& pattern)>;

  /**
   * @throws diagnostics::ConfigurationError if the callback is empty
   */
  WatcherId add(Pattern pattern, Callback callback);

  /**
   * @brief Take an id for a later insert()
   *
   * Safe from any thread, so the engine can hand out ids before it gets
   * onto its strand.
   */
  WatcherId reserve_id() { return next_id_.fetch_add(1); }
  void insert(WatcherId id, Pattern pattern, Callback callback);

  bool remove(WatcherId id);
  void clear();

  /**
   * @brief Run every watcher against one line
   *
   * Watchers run in registration order. A watcher removed by an earlier
   * callback during the same scan is skipped. Exceptions thrown by a
   * callback are logged and reported; remaining watchers still run.
   *
   * @return number of callbacks invoked
   */
  size_t scan(const std::string& line);

  size_t size() const { return watchers_.size(); }
  bool contains(WatcherId id) const;

  // Device path attached to reported callback failures
  void set_source(const std::string& source) { source_ = source; }

 private:
  struct Watcher {
    WatcherId id;
    Pattern pattern;
    Callback callback;
  };

  std::vector<Watcher> watchers_;
  std::atomic<WatcherId> next_id_{1};
  std::string source_;
};

}  // namespace engine
}  // namespace serialline
