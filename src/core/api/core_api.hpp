#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "core/config/engine_config.hpp"
#include "core/model/types.hpp"
#include "core/service/tracker_service.hpp"
#include "core/source/step_source.hpp"
#include "core/source/tier_provider.hpp"
#include "core/storage/store.hpp"
#include "core/util/calendar.hpp"

namespace stride {

class CoreApi {
public:
  // Opens the file store under config.data_dir with the system clock, a FileStepSource over
  // config.observations_file and a static tier provider.
  Result init(const EngineConfig& config);
  Result init(const EngineConfig& config, std::unique_ptr<IStepSource> source,
              std::unique_ptr<IClock> clock, std::unique_ptr<ITierProvider> tiers);

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
  Result on_foreground(MissedDayResult& missed, ReconcileReport& report);
  Result on_background_refresh(ReconcileReport& report);
  Result apply_remote_records(const RemoteSnapshot& snapshot);

  std::uint64_t subscribe(ChangeFeed::Listener listener);
  bool unsubscribe(std::uint64_t id);

  TodaySummary get_today() const;
  StreakState get_streak() const;
  ShieldInventory get_shields() const;
  std::optional<DailyLog> load_daily_log(CivilDay day) const;
  std::vector<DailyLog> load_daily_logs(CivilDay first, CivilDay last) const;
  streak::DayClass classify_day(CivilDay day) const;
  StreakInsights streak_insights() const;
  std::vector<GoalChange> goal_history() const;
  bool can_buy_more_shields() const;
  CivilDay next_refill_day() const;
  StoreHealthReport health_report() const;
  CivilDay today() const;

private:
  FileStore store_;
  std::unique_ptr<IStepSource> source_;
  std::unique_ptr<IClock> clock_;
  std::unique_ptr<ITierProvider> tiers_;
  std::unique_ptr<TrackerService> service_;

  Result not_initialized() const;
};

}  // namespace stride
