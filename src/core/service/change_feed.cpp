#include "core/service/change_feed.hpp"

#include <utility>

namespace stride {

std::string_view aggregate_name(AggregateKind kind) {
  switch (kind) {
    case AggregateKind::DailyLog:
      return "daily_log";
    case AggregateKind::Streak:
      return "streak";
    case AggregateKind::Shields:
      return "shields";
    case AggregateKind::Goal:
      return "goal";
  }
  return "unknown";
}

std::uint64_t ChangeFeed::subscribe(Listener listener) {
  std::lock_guard lock(mutex_);
  const std::uint64_t id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

bool ChangeFeed::unsubscribe(std::uint64_t id) {
  std::lock_guard lock(mutex_);
  return listeners_.erase(id) > 0;
}

void ChangeFeed::publish(const std::vector<ChangeEvent>& events) const {
  if (events.empty()) {
    return;
  }

  std::vector<Listener> listeners;
  {
    std::lock_guard lock(mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) {
      (void)id;
      listeners.push_back(listener);
    }
  }

  for (const auto& event : events) {
    for (const auto& listener : listeners) {
      if (listener) {
        listener(event);
      }
    }
  }
}

std::size_t ChangeFeed::listener_count() const {
  std::lock_guard lock(mutex_);
  return listeners_.size();
}

}  // namespace stride
