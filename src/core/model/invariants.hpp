#pragma once

#include <vector>

#include "core/model/types.hpp"

namespace stride {

// Each check returns CorruptedAggregate with the violated rule in the message.
Result validate_daily_log(const DailyLog& log);
Result validate_streak_state(const StreakState& state);
Result validate_shield_inventory(const ShieldInventory& inventory);
Result validate_goal_history(const std::vector<GoalChange>& history);

}  // namespace stride
