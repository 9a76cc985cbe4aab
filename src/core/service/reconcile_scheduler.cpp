#include "core/service/reconcile_scheduler.hpp"

#include <algorithm>

#include "core/util/calendar.hpp"

namespace stride {

std::string_view trigger_name(ReconcileTrigger trigger) {
  switch (trigger) {
    case ReconcileTrigger::BackgroundRefresh:
      return "background_refresh";
    case ReconcileTrigger::Foreground:
      return "foreground";
    case ReconcileTrigger::Manual:
      return "manual";
  }
  return "unknown";
}

ReconcileScheduler::ReconcileScheduler(ReconcilePolicy policy) : policy_(policy) {}

bool ReconcileScheduler::should_run(std::int64_t now_unix, ReconcileTrigger trigger) const {
  if (trigger == ReconcileTrigger::Manual) {
    return true;
  }

  std::lock_guard lock(mutex_);
  if (!last_completed_unix_) {
    return true;
  }
  const std::int64_t interval = trigger == ReconcileTrigger::Foreground
                                    ? policy_.foreground_min_interval_seconds
                                    : policy_.min_interval_seconds;
  // A clock that moved backwards does not hold the pass back.
  const std::int64_t elapsed = now_unix - *last_completed_unix_;
  return elapsed < 0 || elapsed >= interval;
}

void ReconcileScheduler::mark_completed(std::int64_t now_unix) {
  std::lock_guard lock(mutex_);
  last_completed_unix_ = now_unix;
}

std::optional<std::int64_t> ReconcileScheduler::last_completed_unix() const {
  std::lock_guard lock(mutex_);
  return last_completed_unix_;
}

DayWindow ReconcileScheduler::default_window(CivilDay today, const TierAllowance& allowance) const {
  const int length = std::clamp(allowance.history_window_days, 1, std::max(policy_.max_window_days, 1));
  return DayWindow{calendar::add_days(today, -(length - 1)), today};
}

std::optional<DayWindow> ReconcileScheduler::clamp_window(DayWindow requested, CivilDay today) const {
  if (requested.last < requested.first) {
    return std::nullopt;
  }
  DayWindow window = requested;
  if (window.last > today) {
    window.last = today;
  }
  if (window.last < window.first) {
    return std::nullopt;
  }
  const int max_length = std::max(policy_.max_window_days, 1);
  if (calendar::days_between(window.first, window.last) + 1 > max_length) {
    window.first = calendar::add_days(window.last, -(max_length - 1));
  }
  return window;
}

}  // namespace stride
