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

#include "serialline/engine/watcher_registry.hpp"

#include <algorithm>

#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/exceptions.hpp"
#include "serialline/diagnostics/logger.hpp"

namespace serialline {
namespace engine {

WatcherId WatcherRegistry::add(Pattern pattern, Callback callback) {
  WatcherId id = reserve_id();
  insert(id, std::move(pattern), std::move(callback));
  return id;
}

void WatcherRegistry::insert(WatcherId id, Pattern pattern, Callback callback) {
  if (!callback) {
    throw diagnostics::ConfigurationError("watch callback must be callable", "watch", "callback");
  }
  watchers_.push_back(Watcher{id, std::move(pattern), std::move(callback)});
}

bool WatcherRegistry::remove(WatcherId id) {
  auto it = std::find_if(watchers_.begin(), watchers_.end(), [id](const Watcher& w) { return w.id == id; });
  if (it == watchers_.end()) {
    return false;
  }
  watchers_.erase(it);
  return true;
}

void WatcherRegistry::clear() { watchers_.clear(); }

bool WatcherRegistry::contains(WatcherId id) const {
  return std::any_of(watchers_.begin(), watchers_.end(), [id](const Watcher& w) { return w.id == id; });
}

size_t WatcherRegistry::scan(const std::string& line) {
  // Callbacks may add or remove watchers; work from a snapshot of the ids
  std::vector<WatcherId> ids;
  ids.reserve(watchers_.size());
  for (const auto& w : watchers_) ids.push_back(w.id);

  size_t invoked = 0;
  for (WatcherId id : ids) {
    auto it = std::find_if(watchers_.begin(), watchers_.end(), [id](const Watcher& w) { return w.id == id; });
    if (it == watchers_.end()) continue;

    // Copies keep the watcher usable even if its callback unwatches it
    Pattern pattern = it->pattern;
    Callback callback = it->callback;

    for (const auto& match : pattern.matches(line)) {
      ++invoked;
      try {
        callback(match, pattern);
      } catch (const std::exception& e) {
        SERIALLINE_LOG_ERROR("watcher", "callback",
                             "Watcher " + std::to_string(id) + " (" + pattern.source() + ") threw: " + e.what());
        diagnostics::error_reporting::report_system_error("watcher", "callback", e.what(), source_);
      } catch (...) {
        SERIALLINE_LOG_ERROR("watcher", "callback",
                             "Watcher " + std::to_string(id) + " (" + pattern.source() + ") threw an unknown error");
        diagnostics::error_reporting::report_system_error("watcher", "callback", "Unknown error in watcher callback",
                                                          source_);
      }
      if (!contains(id)) break;
    }
  }
  return invoked;
}

}  // namespace engine
}  // namespace serialline
