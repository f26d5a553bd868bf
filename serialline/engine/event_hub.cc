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

#include "serialline/engine/event_hub.hpp"

#include <algorithm>

#include "serialline/diagnostics/error_handler.hpp"
#include "serialline/diagnostics/logger.hpp"

namespace serialline {
namespace engine {

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::Open:
      return "open";
    case EventKind::Close:
      return "close";
    case EventKind::Error:
      return "error";
    case EventKind::Disconnected:
      return "disconnected";
    case EventKind::Data:
      return "data";
    case EventKind::Write:
      return "write";
  }
  return "unknown";
}

SubscriptionId EventHub::subscribe(EventKind kind, Handler handler) {
  SubscriptionId id = reserve_id();
  insert(id, kind, std::move(handler));
  return id;
}

void EventHub::insert(SubscriptionId id, EventKind kind, Handler handler) {
  subscriptions_.push_back(Subscription{id, kind, std::move(handler)});
}

bool EventHub::unsubscribe(SubscriptionId id) {
  auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                         [id](const Subscription& s) { return s.id == id; });
  if (it == subscriptions_.end()) {
    return false;
  }
  subscriptions_.erase(it);
  return true;
}

void EventHub::emit(const EngineEvent& event) {
  // Handlers may subscribe or unsubscribe while we iterate
  std::vector<Handler> handlers;
  for (const auto& s : subscriptions_) {
    if (s.kind == event.kind && s.handler) handlers.push_back(s.handler);
  }

  for (const auto& handler : handlers) {
    try {
      handler(event);
    } catch (const std::exception& e) {
      SERIALLINE_LOG_ERROR("event_hub", to_string(event.kind), std::string("Event handler threw: ") + e.what());
      diagnostics::error_reporting::report_system_error("event_hub", to_string(event.kind), e.what(), source_);
    } catch (...) {
      SERIALLINE_LOG_ERROR("event_hub", to_string(event.kind), "Event handler threw an unknown error");
      diagnostics::error_reporting::report_system_error("event_hub", to_string(event.kind),
                                                        "Unknown error in event handler", source_);
    }
  }
}

void EventHub::clear() { subscriptions_.clear(); }

size_t EventHub::subscriber_count(EventKind kind) const {
  return static_cast<size_t>(std::count_if(subscriptions_.begin(), subscriptions_.end(),
                                           [kind](const Subscription& s) { return s.kind == kind; }));
}

}  // namespace engine
}  // namespace serialline
