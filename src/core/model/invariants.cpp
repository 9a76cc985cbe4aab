#include "core/model/invariants.hpp"

#include <string>

#include "core/util/calendar.hpp"

namespace stride {
namespace {

Result corrupted(std::string message) {
  return Result::failure(ErrorKind::CorruptedAggregate, std::move(message));
}

bool is_valid_session_id(const std::string& id) {
  if (id.empty()) {
    return false;
  }
  for (char c : id) {
    if (c == ',' || c == '\n' || c == '\r' || c == '\t') {
      return false;
    }
  }
  return true;
}

}  // namespace

Result validate_daily_log(const DailyLog& log) {
  const std::string day = calendar::format_day(log.date);
  if (log.steps < 0) {
    return corrupted("DailyLog " + day + " has negative steps.");
  }
  if (log.goal_target <= 0) {
    return corrupted("DailyLog " + day + " has a non-positive goal target.");
  }
  for (const auto& id : log.session_ids) {
    if (!is_valid_session_id(id)) {
      return corrupted("DailyLog " + day + " has a malformed session reference.");
    }
  }
  return Result::success();
}

Result validate_streak_state(const StreakState& state) {
  if (state.current_streak < 0 || state.longest_streak < 0) {
    return corrupted("StreakState has a negative counter.");
  }
  if (state.current_streak > state.longest_streak) {
    return corrupted("StreakState current streak exceeds longest streak.");
  }
  if (state.current_streak == 0 && state.streak_start_date.has_value()) {
    return corrupted("StreakState has a start date without a running streak.");
  }
  if (state.current_streak > 0 && !state.streak_start_date.has_value()) {
    return corrupted("StreakState running streak has no start date.");
  }
  if (state.streak_start_date && state.last_goal_met_date &&
      *state.streak_start_date > *state.last_goal_met_date) {
    return corrupted("StreakState start date is after the last counted day.");
  }
  if (state.last_fired_milestone < 0 || state.consecutive_goal_days < 0) {
    return corrupted("StreakState has a negative milestone or jackpot counter.");
  }
  if (state.last_reached_milestone && *state.last_reached_milestone <= 0) {
    return corrupted("StreakState pending milestone is not positive.");
  }
  return Result::success();
}

Result validate_shield_inventory(const ShieldInventory& inventory) {
  if (inventory.recurring_available < 0 || inventory.purchased_available < 0) {
    return corrupted("ShieldInventory has a negative token bucket.");
  }
  if (inventory.used_this_period < 0 || inventory.total_used_lifetime < 0 ||
      inventory.purchased_lifetime < 0) {
    return corrupted("ShieldInventory has a negative usage counter.");
  }
  if (inventory.used_this_period > inventory.total_used_lifetime) {
    return corrupted("ShieldInventory period usage exceeds lifetime usage.");
  }
  if (inventory.purchased_available > inventory.purchased_lifetime) {
    return corrupted("ShieldInventory holds more purchased tokens than were ever bought.");
  }
  if (inventory.last_refill_period && !inventory.last_refill_period->valid()) {
    return corrupted("ShieldInventory refill period is invalid.");
  }
  return Result::success();
}

Result validate_goal_history(const std::vector<GoalChange>& history) {
  for (std::size_t i = 0; i < history.size(); ++i) {
    if (history[i].goal <= 0) {
      return corrupted("Goal history has a non-positive goal.");
    }
    if (i > 0 && history[i - 1].effective_from >= history[i].effective_from) {
      return corrupted("Goal history is not strictly ordered by date.");
    }
  }
  return Result::success();
}

}  // namespace stride
