#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stride {

enum class ErrorKind {
  None,
  ObservationFetchFailure,
  InsufficientShields,
  RepairIneligible,
  CorruptedAggregate,
  PersistenceFailure,
  InvalidArgument,
  Cancelled,
  Throttled,
};

struct Result {
  bool ok = false;
  ErrorKind code = ErrorKind::None;
  std::string message;

  static Result success(std::string msg = {}) {
    return {true, ErrorKind::None, std::move(msg)};
  }

  static Result failure(ErrorKind code, std::string msg) {
    return {false, code, std::move(msg)};
  }

  [[nodiscard]] bool is(ErrorKind kind) const { return code == kind; }
};

// Local calendar day, counted in days since 1970-01-01.
struct CivilDay {
  std::int32_t serial = 0;

  auto operator<=>(const CivilDay&) const = default;
};

struct GrantPeriod {
  int year = 0;
  int month = 0;

  [[nodiscard]] bool valid() const { return year > 0 && month >= 1 && month <= 12; }
  auto operator<=>(const GrantPeriod&) const = default;
};

enum class DayState {
  Open,
  Finalized,
};

struct StepObservation {
  std::string provider;
  std::int64_t start_unix = 0;
  std::int64_t end_unix = 0;
  std::int64_t steps = 0;
  std::string session_id;
};

struct DailyLog {
  CivilDay date;
  std::int64_t steps = 0;
  std::int64_t goal_target = 0;
  bool goal_met = false;
  bool shield_used = false;
  bool repair_declined = false;
  DayState state = DayState::Open;
  std::vector<std::string> session_ids;

  [[nodiscard]] bool counts_for_streak() const { return goal_met || shield_used; }
  bool operator==(const DailyLog&) const = default;
};

struct StreakState {
  int current_streak = 0;
  int longest_streak = 0;
  std::optional<CivilDay> streak_start_date;
  std::optional<CivilDay> last_goal_met_date;
  std::optional<int> last_reached_milestone;
  int last_fired_milestone = 0;
  int consecutive_goal_days = 0;

  bool operator==(const StreakState&) const = default;
};

struct ShieldInventory {
  std::int64_t recurring_available = 0;
  std::int64_t purchased_available = 0;
  std::optional<GrantPeriod> last_refill_period;
  std::int64_t used_this_period = 0;
  std::int64_t total_used_lifetime = 0;
  std::int64_t purchased_lifetime = 0;

  [[nodiscard]] std::int64_t total_available() const {
    return recurring_available + purchased_available;
  }
  bool operator==(const ShieldInventory&) const = default;
};

struct GoalChange {
  CivilDay effective_from;
  std::int64_t goal = 0;

  bool operator==(const GoalChange&) const = default;
};

enum class Tier {
  Free,
  Pro,
};

struct TierAllowance {
  Tier tier = Tier::Free;
  std::int64_t bank_max = 2;
  std::int64_t recurring_amount = 2;
  int history_window_days = 30;
};

enum class ConsumptionOrder {
  PurchasedFirst,
  RecurringFirst,
};

struct ShieldPolicy {
  ConsumptionOrder consumption_order = ConsumptionOrder::PurchasedFirst;
  int repair_lookback_days = 7;
  bool auto_deploy_missed_days = true;
};

struct ReconcilePolicy {
  std::int64_t min_interval_seconds = 4 * 60 * 60;
  std::int64_t foreground_min_interval_seconds = 15 * 60;
  int max_window_days = 365;
};

enum class ReconcileTrigger {
  BackgroundRefresh,
  Foreground,
  Manual,
};

struct TodaySummary {
  CivilDay day;
  std::int64_t steps = 0;
  std::int64_t goal = 0;
  bool goal_met = false;
  bool shield_used = false;
};

struct MissedDayResult {
  int shields_deployed = 0;
  bool streak_broken = false;
  std::optional<int> legacy_badge;
};

struct ReconcileReport {
  std::vector<CivilDay> changed_days;
  std::vector<CivilDay> failed_days;
  std::size_t days_visited = 0;
  bool cancelled = false;
  bool deferred = false;
};

struct StreakInsights {
  bool alive = false;
  bool at_risk = false;
  std::optional<int> next_milestone;
  std::optional<int> days_until_next_milestone;
  bool weekly_jackpot_earned = false;
  int weekly_jackpot_progress = 0;
};

enum class AggregateKind {
  DailyLog,
  Streak,
  Shields,
  Goal,
};

struct ChangeEvent {
  AggregateKind aggregate = AggregateKind::DailyLog;
  std::optional<CivilDay> day;
};

struct RemoteSnapshot {
  std::vector<DailyLog> daily_logs;
  std::optional<StreakState> streak;
  std::optional<ShieldInventory> shields;
};

struct StoreHealthReport {
  bool healthy = false;
  std::string details;
  std::string data_dir;
  std::string days_dir;
  std::string anomalies_file;
  std::size_t daily_log_count = 0;
  std::size_t goal_change_count = 0;
  std::size_t anomaly_count = 0;
  std::size_t quarantined_record_count = 0;
  std::size_t committed_batch_count = 0;
  bool recovered_from_journal = false;
};

}  // namespace stride
