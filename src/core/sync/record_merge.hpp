#pragma once

#include "core/model/types.hpp"

namespace stride::sync {

// Deterministic merge of a local record with a copy delivered by the sync layer.
// Ties resolve towards the local copy; merging a copy with itself is a no-op.
DailyLog merge_daily_log(const DailyLog& local, const DailyLog& remote);
StreakState merge_streak_state(const StreakState& local, const StreakState& remote);
ShieldInventory merge_shield_inventory(const ShieldInventory& local, const ShieldInventory& remote);

}  // namespace stride::sync
