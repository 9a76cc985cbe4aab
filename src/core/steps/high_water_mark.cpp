#include "core/steps/high_water_mark.hpp"

#include <algorithm>

namespace stride {

void HighWaterMark::seed(CivilDay day, std::int64_t steps, DayState state) {
  std::lock_guard lock(mutex_);
  Mark& mark = marks_[day];
  mark.steps = std::max(mark.steps, std::max<std::int64_t>(steps, 0));
  if (state == DayState::Finalized) {
    mark.state = DayState::Finalized;
  }
}

std::int64_t HighWaterMark::accept(CivilDay day, std::int64_t candidate) {
  std::lock_guard lock(mutex_);
  Mark& mark = marks_[day];
  if (mark.state == DayState::Finalized) {
    return mark.steps;
  }
  mark.steps = std::max(mark.steps, candidate);
  return mark.steps;
}

std::int64_t HighWaterMark::accept_correction(CivilDay day, std::int64_t candidate) {
  std::lock_guard lock(mutex_);
  Mark& mark = marks_[day];
  mark.steps = std::max(mark.steps, candidate);
  return mark.steps;
}

void HighWaterMark::roll_over(CivilDay today) {
  std::lock_guard lock(mutex_);
  for (auto it = marks_.begin(); it != marks_.end() && it->first < today; ++it) {
    it->second.state = DayState::Finalized;
  }
}

void HighWaterMark::forget_before(CivilDay cutoff) {
  std::lock_guard lock(mutex_);
  marks_.erase(marks_.begin(), marks_.lower_bound(cutoff));
}

std::optional<HighWaterMark::Mark> HighWaterMark::mark(CivilDay day) const {
  std::lock_guard lock(mutex_);
  const auto it = marks_.find(day);
  if (it == marks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool HighWaterMark::is_finalized(CivilDay day) const {
  std::lock_guard lock(mutex_);
  const auto it = marks_.find(day);
  return it != marks_.end() && it->second.state == DayState::Finalized;
}

}  // namespace stride
