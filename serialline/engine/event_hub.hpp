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
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "serialline/base/visibility.hpp"

namespace serialline {
namespace engine {

enum class EventKind { Open, Close, Error, Disconnected, Data, Write };

SERIALLINE_API std::string to_string(EventKind kind);

/**
 * @brief Payload passed to event subscribers
 *
 * data carries the line for Data and the bytes for Write; error is set for
 * Error.
 */
struct EngineEvent {
  EventKind kind;
  std::string data;
  boost::system::error_code error;
};

using SubscriptionId = uint64_t;

/**
 * @brief Per-kind subscriber lists for engine lifecycle events.
 *
 * Handlers run in subscription order. A handler that throws is logged and
 * reported; the remaining handlers still run.
 */
class SERIALLINE_API EventHub {
 public:
  using Handler = std::function<void(const EngineEvent&)>;

  SubscriptionId subscribe(EventKind kind, Handler handler);

  // Thread-safe; pairs with insert() the same way as WatcherRegistry
  SubscriptionId reserve_id() { return next_id_.fetch_add(1); }
  void insert(SubscriptionId id, EventKind kind, Handler handler);

  bool unsubscribe(SubscriptionId id);
  void emit(const EngineEvent& event);
  void clear();

  size_t subscriber_count(EventKind kind) const;
  void set_source(const std::string& source) { source_ = source; }

 private:
  struct Subscription {
    SubscriptionId id;
    EventKind kind;
    Handler handler;
  };

  std::vector<Subscription> subscriptions_;
  std::atomic<SubscriptionId> next_id_{1};
  std::string source_;
};

}  // namespace engine
}  // namespace serialline
