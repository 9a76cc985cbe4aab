#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace stride::streak {

inline constexpr int kAtRiskHour = 18;
inline constexpr int kLegacyBadgeMinimum = 30;
inline constexpr int kJackpotCycleDays = 7;

enum class DayClass {
  Met,
  Shielded,
  Missed,
  NoData,
  Open,
};

std::string_view day_class_name(DayClass day_class);

// No row reads as NoData; it still breaks the streak like Missed does.
DayClass classify_day(const std::optional<DailyLog>& log, CivilDay day, CivilDay today);

bool is_milestone(int days);
// 0 when `days` is below the first milestone.
int highest_milestone_at_or_below(int days);
int next_milestone(int current);

// Recomputes the streak from a consistent snapshot of rows. `today` is never counted as a
// break while it is still open.
StreakState recompute(const std::vector<DailyLog>& snapshot, const StreakState& previous,
                      CivilDay as_of, CivilDay today);

// Counted days ending at `day` inclusive.
int run_length_ending(const std::vector<DailyLog>& snapshot, CivilDay day);
std::optional<int> legacy_badge_for(int run_length);

// Returns the legacy badge length when a run of at least 30 days is broken. The fired
// milestone is kept; the next recompute lowers it only if the surviving run is shorter.
std::optional<int> break_streak(StreakState& state);
std::optional<int> consume_milestone(StreakState& state);

bool is_alive(const StreakState& state, CivilDay today);
bool is_at_risk(const StreakState& state, const std::optional<DailyLog>& today_log, int local_hour);
bool weekly_jackpot_earned(const StreakState& state);
StreakInsights insights(const StreakState& state, const std::optional<DailyLog>& today_log,
                        CivilDay today, int local_hour);

}  // namespace stride::streak
