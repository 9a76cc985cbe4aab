#include "core/sync/record_merge.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace stride::sync {
namespace {

std::int64_t purchased_after_credit(const ShieldInventory& self, const ShieldInventory& other) {
  const std::int64_t unseen = std::max<std::int64_t>(0, other.purchased_lifetime - self.purchased_lifetime);
  return self.purchased_available + unseen;
}

}  // namespace

DailyLog merge_daily_log(const DailyLog& local, const DailyLog& remote) {
  DailyLog merged = local;
  merged.steps = std::max(local.steps, remote.steps);
  merged.goal_met = local.goal_met || remote.goal_met;
  merged.shield_used = local.shield_used || remote.shield_used;
  merged.repair_declined = local.repair_declined || remote.repair_declined;

  const bool local_final = local.state == DayState::Finalized;
  const bool remote_final = remote.state == DayState::Finalized;
  merged.state = (local_final || remote_final) ? DayState::Finalized : DayState::Open;
  if (remote_final && !local_final) {
    merged.goal_target = remote.goal_target;
  }

  std::set<std::string> sessions(local.session_ids.begin(), local.session_ids.end());
  sessions.insert(remote.session_ids.begin(), remote.session_ids.end());
  merged.session_ids.assign(sessions.begin(), sessions.end());
  return merged;
}

StreakState merge_streak_state(const StreakState& local, const StreakState& remote) {
  StreakState merged = local;
  if (remote.last_goal_met_date > local.last_goal_met_date) {
    merged.current_streak = remote.current_streak;
    merged.streak_start_date = remote.streak_start_date;
    merged.last_goal_met_date = remote.last_goal_met_date;
  }
  merged.longest_streak =
      std::max({local.longest_streak, remote.longest_streak, merged.current_streak});
  merged.last_fired_milestone = std::max(local.last_fired_milestone, remote.last_fired_milestone);
  merged.consecutive_goal_days = std::max(local.consecutive_goal_days, remote.consecutive_goal_days);
  return merged;
}

ShieldInventory merge_shield_inventory(const ShieldInventory& local, const ShieldInventory& remote) {
  ShieldInventory merged = local;
  if (remote.last_refill_period > local.last_refill_period) {
    merged.recurring_available = remote.recurring_available;
    merged.used_this_period = remote.used_this_period;
    merged.last_refill_period = remote.last_refill_period;
  } else if (remote.last_refill_period == local.last_refill_period) {
    merged.recurring_available = std::min(local.recurring_available, remote.recurring_available);
    merged.used_this_period = std::max(local.used_this_period, remote.used_this_period);
  }

  merged.purchased_available =
      std::min(purchased_after_credit(local, remote), purchased_after_credit(remote, local));
  merged.purchased_lifetime = std::max(local.purchased_lifetime, remote.purchased_lifetime);
  merged.total_used_lifetime = std::max(local.total_used_lifetime, remote.total_used_lifetime);
  merged.used_this_period = std::min(merged.used_this_period, merged.total_used_lifetime);
  return merged;
}

}  // namespace stride::sync
