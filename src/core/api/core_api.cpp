#include "core/api/core_api.hpp"

#include <filesystem>
#include <utility>

namespace stride {

Result CoreApi::init(const EngineConfig& config) {
  std::string observations = config.observations_file;
  if (observations.empty()) {
    observations = (std::filesystem::path{config.data_dir} / "observations.tsv").string();
  }
  auto clock = std::make_unique<SystemClock>();
  auto source = std::make_unique<FileStepSource>(observations, *clock);
  return init(config, std::move(source), std::move(clock), std::make_unique<StaticTierProvider>(config.tier));
}

Result CoreApi::init(const EngineConfig& config, std::unique_ptr<IStepSource> source,
                     std::unique_ptr<IClock> clock, std::unique_ptr<ITierProvider> tiers) {
  if (service_) {
    return Result::failure(ErrorKind::InvalidArgument, "Init failed: engine already initialized.");
  }
  if (config.data_dir.empty()) {
    return Result::failure(ErrorKind::InvalidArgument, "Init failed: data_dir is required.");
  }
  if (!source || !clock || !tiers) {
    return Result::failure(ErrorKind::InvalidArgument, "Init failed: missing collaborator.");
  }
  if (config.default_daily_goal <= 0) {
    return Result::failure(ErrorKind::InvalidArgument, "Init failed: default_daily_goal must be positive.");
  }

  if (const Result opened = store_.open(config.data_dir); !opened.ok) {
    return opened;
  }

  source_ = std::move(source);
  clock_ = std::move(clock);
  tiers_ = std::move(tiers);
  auto service = std::make_unique<TrackerService>(config, store_, *source_, *clock_, *tiers_);
  const Result started = service->start();
  if (!started.ok) {
    return started;
  }
  service_ = std::move(service);
  return started;
}

Result CoreApi::not_initialized() const {
  return Result::failure(ErrorKind::InvalidArgument, "Engine is not initialized.");
}

Result CoreApi::record_observations(CivilDay day, const std::vector<StepObservation>& observations) {
  return service_ ? service_->record_observations(day, observations) : not_initialized();
}

Result CoreApi::refresh_today() {
  return service_ ? service_->refresh_today() : not_initialized();
}

Result CoreApi::set_daily_goal(std::int64_t goal) {
  return service_ ? service_->set_daily_goal(goal) : not_initialized();
}

Result CoreApi::request_repair(CivilDay day) {
  return service_ ? service_->request_repair(day) : not_initialized();
}

Result CoreApi::decline_repair(CivilDay day) {
  return service_ ? service_->decline_repair(day) : not_initialized();
}

Result CoreApi::decline_repair(CivilDay day, std::optional<int>& legacy_badge) {
  return service_ ? service_->decline_repair(day, legacy_badge) : not_initialized();
}

Result CoreApi::deploy_for_missed_days(MissedDayResult& out) {
  return service_ ? service_->deploy_for_missed_days(out) : not_initialized();
}

Result CoreApi::purchase_shields(std::int64_t count) {
  return service_ ? service_->purchase_shields(count) : not_initialized();
}

Result CoreApi::consume_milestone(std::optional<int>& out) {
  return service_ ? service_->consume_milestone(out) : not_initialized();
}

Result CoreApi::reconcile(DayWindow window, const CancellationToken* cancel, ReconcileReport& out) {
  return service_ ? service_->reconcile(window, cancel, out) : not_initialized();
}

Result CoreApi::on_foreground(MissedDayResult& missed, ReconcileReport& report) {
  return service_ ? service_->on_foreground(missed, report) : not_initialized();
}

Result CoreApi::on_background_refresh(ReconcileReport& report) {
  return service_ ? service_->on_background_refresh(report) : not_initialized();
}

Result CoreApi::apply_remote_records(const RemoteSnapshot& snapshot) {
  return service_ ? service_->apply_remote_records(snapshot) : not_initialized();
}

std::uint64_t CoreApi::subscribe(ChangeFeed::Listener listener) {
  return service_ ? service_->subscribe(std::move(listener)) : 0;
}

bool CoreApi::unsubscribe(std::uint64_t id) {
  return service_ && service_->unsubscribe(id);
}

TodaySummary CoreApi::get_today() const {
  return service_ ? service_->get_today() : TodaySummary{};
}

StreakState CoreApi::get_streak() const {
  return service_ ? service_->get_streak() : StreakState{};
}

ShieldInventory CoreApi::get_shields() const {
  return service_ ? service_->get_shields() : ShieldInventory{};
}

std::optional<DailyLog> CoreApi::load_daily_log(CivilDay day) const {
  return service_ ? service_->load_daily_log(day) : std::nullopt;
}

std::vector<DailyLog> CoreApi::load_daily_logs(CivilDay first, CivilDay last) const {
  return service_ ? service_->load_daily_logs(first, last) : std::vector<DailyLog>{};
}

streak::DayClass CoreApi::classify_day(CivilDay day) const {
  return service_ ? service_->classify_day(day) : streak::DayClass::NoData;
}

StreakInsights CoreApi::streak_insights() const {
  return service_ ? service_->streak_insights() : StreakInsights{};
}

std::vector<GoalChange> CoreApi::goal_history() const {
  return service_ ? service_->goal_history() : std::vector<GoalChange>{};
}

bool CoreApi::can_buy_more_shields() const {
  return service_ && service_->can_buy_more_shields();
}

CivilDay CoreApi::next_refill_day() const {
  return service_ ? service_->next_refill_day() : CivilDay{};
}

StoreHealthReport CoreApi::health_report() const {
  return store_.health_report();
}

CivilDay CoreApi::today() const {
  return service_ ? service_->today() : CivilDay{};
}

}  // namespace stride
