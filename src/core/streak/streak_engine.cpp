#include "core/streak/streak_engine.hpp"

#include <algorithm>
#include <array>
#include <map>

#include "core/util/calendar.hpp"

namespace stride::streak {
namespace {

constexpr std::array<int, 8> kFixedMilestones = {7, 14, 21, 30, 60, 90, 180, 365};
constexpr int kHundredsFrom = 400;

using RowIndex = std::map<CivilDay, const DailyLog*>;

RowIndex index_rows(const std::vector<DailyLog>& snapshot) {
  RowIndex rows;
  for (const auto& log : snapshot) {
    rows[log.date] = &log;
  }
  return rows;
}

bool counts(const RowIndex& rows, CivilDay day) {
  const auto it = rows.find(day);
  return it != rows.end() && it->second->counts_for_streak();
}

int longest_run_through(const RowIndex& rows, CivilDay last_day) {
  int longest = 0;
  int run = 0;
  std::optional<CivilDay> previous;
  for (const auto& [day, log] : rows) {
    if (day > last_day) {
      break;
    }
    if (!log->counts_for_streak()) {
      run = 0;
      previous.reset();
      continue;
    }
    run = (previous && calendar::add_days(*previous, 1) == day) ? run + 1 : 1;
    previous = day;
    longest = std::max(longest, run);
  }
  return longest;
}

}  // namespace

std::string_view day_class_name(DayClass day_class) {
  switch (day_class) {
    case DayClass::Met:
      return "met";
    case DayClass::Shielded:
      return "shielded";
    case DayClass::Missed:
      return "missed";
    case DayClass::NoData:
      return "no_data";
    case DayClass::Open:
      return "open";
  }
  return "unknown";
}

DayClass classify_day(const std::optional<DailyLog>& log, CivilDay day, CivilDay today) {
  if (log && log->goal_met) {
    return DayClass::Met;
  }
  if (log && log->shield_used) {
    return DayClass::Shielded;
  }
  if (day >= today) {
    return DayClass::Open;
  }
  return log ? DayClass::Missed : DayClass::NoData;
}

bool is_milestone(int days) {
  if (days >= kHundredsFrom) {
    return days % 100 == 0;
  }
  return std::ranges::find(kFixedMilestones, days) != kFixedMilestones.end();
}

int highest_milestone_at_or_below(int days) {
  if (days >= kHundredsFrom) {
    return (days / 100) * 100;
  }
  int highest = 0;
  for (int milestone : kFixedMilestones) {
    if (milestone <= days) {
      highest = milestone;
    }
  }
  return highest;
}

int next_milestone(int current) {
  for (int milestone : kFixedMilestones) {
    if (milestone > current) {
      return milestone;
    }
  }
  return std::max(kHundredsFrom, (current / 100 + 1) * 100);
}

StreakState recompute(const std::vector<DailyLog>& snapshot, const StreakState& previous,
                      CivilDay as_of, CivilDay today) {
  if (as_of > today) {
    as_of = today;
  }
  const RowIndex rows = index_rows(snapshot);

  CivilDay cursor = as_of;
  if (as_of == today && !counts(rows, today)) {
    cursor = calendar::add_days(today, -1);
  }

  int count = 0;
  int goal_run = 0;
  bool goal_run_open = true;
  std::optional<CivilDay> latest;
  std::optional<CivilDay> earliest;
  while (counts(rows, cursor)) {
    const DailyLog& log = *rows.at(cursor);
    if (!latest) {
      latest = cursor;
    }
    earliest = cursor;
    ++count;
    if (goal_run_open && log.goal_met) {
      ++goal_run;
    } else {
      goal_run_open = false;
    }
    cursor = calendar::add_days(cursor, -1);
  }

  StreakState next = previous;
  next.current_streak = count;
  next.streak_start_date = earliest;
  next.last_goal_met_date = latest;
  next.consecutive_goal_days = goal_run;
  next.longest_streak =
      std::max({previous.longest_streak, count, longest_run_through(rows, as_of)});

  const int reached = highest_milestone_at_or_below(count);
  if (reached < next.last_fired_milestone) {
    next.last_fired_milestone = reached;
  }
  if (reached > next.last_fired_milestone) {
    next.last_fired_milestone = reached;
    next.last_reached_milestone = reached;
  }
  return next;
}

int run_length_ending(const std::vector<DailyLog>& snapshot, CivilDay day) {
  const RowIndex rows = index_rows(snapshot);
  int length = 0;
  while (counts(rows, day)) {
    ++length;
    day = calendar::add_days(day, -1);
  }
  return length;
}

std::optional<int> legacy_badge_for(int run_length) {
  if (run_length < kLegacyBadgeMinimum) {
    return std::nullopt;
  }
  return highest_milestone_at_or_below(run_length);
}

std::optional<int> break_streak(StreakState& state) {
  const std::optional<int> badge = legacy_badge_for(state.current_streak);
  state.current_streak = 0;
  state.streak_start_date.reset();
  state.last_goal_met_date.reset();
  state.consecutive_goal_days = 0;
  return badge;
}

std::optional<int> consume_milestone(StreakState& state) {
  const std::optional<int> pending = state.last_reached_milestone;
  state.last_reached_milestone.reset();
  return pending;
}

bool is_alive(const StreakState& state, CivilDay today) {
  if (state.current_streak <= 0 || !state.last_goal_met_date) {
    return false;
  }
  const int age = calendar::days_between(*state.last_goal_met_date, today);
  return age == 0 || age == 1;
}

bool is_at_risk(const StreakState& state, const std::optional<DailyLog>& today_log, int local_hour) {
  if (state.current_streak <= 0 || local_hour < kAtRiskHour) {
    return false;
  }
  return !(today_log && today_log->counts_for_streak());
}

bool weekly_jackpot_earned(const StreakState& state) {
  return state.consecutive_goal_days > 0 && state.consecutive_goal_days % kJackpotCycleDays == 0;
}

StreakInsights insights(const StreakState& state, const std::optional<DailyLog>& today_log,
                        CivilDay today, int local_hour) {
  StreakInsights out;
  out.alive = is_alive(state, today);
  out.at_risk = out.alive && is_at_risk(state, today_log, local_hour);
  const int next = next_milestone(state.current_streak);
  out.next_milestone = next;
  out.days_until_next_milestone = next - state.current_streak;
  out.weekly_jackpot_earned = weekly_jackpot_earned(state);
  out.weekly_jackpot_progress = state.consecutive_goal_days % kJackpotCycleDays;
  return out;
}

}  // namespace stride::streak
