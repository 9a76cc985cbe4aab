#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "core/config/engine_config.hpp"
#include "core/model/types.hpp"
#include "core/service/change_feed.hpp"
#include "core/service/reconcile_scheduler.hpp"
#include "core/source/step_source.hpp"
#include "core/source/tier_provider.hpp"
#include "core/steps/high_water_mark.hpp"
#include "core/steps/interval_merge.hpp"
#include "core/storage/store.hpp"
#include "core/streak/streak_engine.hpp"
#include "core/util/calendar.hpp"

namespace stride {

// Single owner of the DailyLog rows, goal history, StreakState and ShieldInventory.
// Mutations lock the aggregates they touch; observation fetches happen outside every lock
// and change events are published after the locks are released.
class TrackerService {
public:
  TrackerService(EngineConfig config, IPersistence& store, IStepSource& source, const IClock& clock,
                 ITierProvider& tiers);

  Result start();

  Result record_observations(CivilDay day, const std::vector<StepObservation>& observations);
  Result refresh_today();
  Result set_daily_goal(std::int64_t goal);

  Result request_repair(CivilDay day);
  Result decline_repair(CivilDay day);
  Result decline_repair(CivilDay day, std::optional<int>& legacy_badge);
  Result deploy_for_missed_days(MissedDayResult& out);
  Result purchase_shields(std::int64_t count);
  Result consume_milestone(std::optional<int>& out);

  Result reconcile(DayWindow window, const CancellationToken* cancel, ReconcileReport& out);
  Result run_scheduled_reconcile(ReconcileTrigger trigger, const CancellationToken* cancel,
                                 ReconcileReport& out);
  Result on_foreground(MissedDayResult& missed, ReconcileReport& report);
  Result on_background_refresh(ReconcileReport& report);

  Result apply_remote_records(const RemoteSnapshot& snapshot);

  std::uint64_t subscribe(ChangeFeed::Listener listener);
  bool unsubscribe(std::uint64_t id);

  [[nodiscard]] TodaySummary get_today() const;
  [[nodiscard]] StreakState get_streak() const;
  [[nodiscard]] ShieldInventory get_shields() const;
  [[nodiscard]] std::optional<DailyLog> load_daily_log(CivilDay day) const;
  [[nodiscard]] std::vector<DailyLog> load_daily_logs(CivilDay first, CivilDay last) const;
  [[nodiscard]] streak::DayClass classify_day(CivilDay day) const;
  [[nodiscard]] StreakInsights streak_insights() const;
  [[nodiscard]] std::int64_t goal_for(CivilDay day) const;
  [[nodiscard]] std::vector<GoalChange> goal_history() const;
  [[nodiscard]] bool can_buy_more_shields() const;
  [[nodiscard]] CivilDay next_refill_day() const;
  [[nodiscard]] StoreHealthReport health_report() const;
  [[nodiscard]] CivilDay today() const;
  [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
  EngineConfig config_;
  IPersistence& store_;
  IStepSource& source_;
  const IClock& clock_;
  ITierProvider& tiers_;

  IntervalMerger merger_;
  HighWaterMark marks_;
  ReconcileScheduler scheduler_;
  ChangeFeed feed_;

  // Lock order: ledger, streak, shield. Multi-aggregate paths use std::scoped_lock.
  mutable std::mutex ledger_mutex_;
  mutable std::mutex streak_mutex_;
  mutable std::mutex shield_mutex_;
  std::optional<CivilDay> rolled_over_through_;
  // Shields spent while rolling the day over, reported by the next deploy_for_missed_days.
  MissedDayResult rolled_over_deployment_;
  std::atomic<bool> started_{false};

  Result ensure_started() const;
  Result roll_forward();
  // Needs all three locks: the first call on a new day also deploys shields for missed days
  // before any recompute can zero the streak.
  Result roll_over_locked(CivilDay today, std::vector<ChangeEvent>& events);
  Result refill_locked(CivilDay today, std::vector<ChangeEvent>& events);
  Result recompute_streak_locked(CivilDay today, std::vector<ChangeEvent>& events);
  Result compute_streak_locked(CivilDay today, const std::vector<DailyLog>& snapshot,
                               StreakState& out) const;
  Result deploy_for_missed_days_locked(CivilDay today, MissedDayResult& out,
                                       std::vector<ChangeEvent>& events);
  Result apply_reconciled_day_locked(CivilDay day, CivilDay today, const MergeReport& merged,
                                     const std::vector<StepObservation>& observations,
                                     bool& changed);
  std::int64_t goal_for_locked(CivilDay day) const;
  DailyLog new_row_locked(CivilDay day, CivilDay today) const;
  void note_dropped_observations(CivilDay day, const MergeReport& merged);
};

}  // namespace stride
