#include <algorithm>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <ranges>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/engine_config.hpp"
#include "core/service/reconcile_scheduler.hpp"
#include "core/shield/shield_engine.hpp"
#include "core/source/step_source.hpp"
#include "core/steps/high_water_mark.hpp"
#include "core/steps/interval_merge.hpp"
#include "core/storage/store.hpp"
#include "core/streak/streak_engine.hpp"
#include "core/sync/record_merge.hpp"
#include "core/util/calendar.hpp"
#include "core/util/hash.hpp"

namespace {

constexpr std::int64_t kHour = 60 * 60;

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "stride-core-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

stride::CivilDay day_of(int year, unsigned month, unsigned dom) {
  return stride::calendar::from_ymd(year, month, dom);
}

stride::CivilDay days_before(stride::CivilDay day, int count) {
  return stride::calendar::add_days(day, -count);
}

const stride::CivilDay kToday = day_of(2026, 3, 20);

std::int64_t unix_at(stride::CivilDay day, int hour) {
  return static_cast<std::int64_t>(day.serial) * stride::calendar::kSecondsPerDay + hour * kHour;
}

stride::StepObservation observation(std::string provider, stride::CivilDay day, int from_hour, int to_hour,
                                    std::int64_t steps, std::string session = {}) {
  stride::StepObservation out;
  out.provider = std::move(provider);
  out.start_unix = unix_at(day, from_hour);
  out.end_unix = unix_at(day, to_hour);
  out.steps = steps;
  out.session_id = std::move(session);
  return out;
}

stride::DailyLog day_row(stride::CivilDay day, std::int64_t steps, std::int64_t goal = 10000,
                         stride::DayState state = stride::DayState::Finalized) {
  stride::DailyLog log;
  log.date = day;
  log.steps = steps;
  log.goal_target = goal;
  log.goal_met = steps >= goal;
  log.state = state;
  return log;
}

class FakeClock final : public stride::IClock {
public:
  explicit FakeClock(stride::CivilDay day, int hour = 12) { set(day, hour); }

  void set(stride::CivilDay day, int hour = 12) { now_ = unix_at(day, hour); }
  void advance(std::int64_t seconds) { now_ += seconds; }
  // `before` until `switch_at`, `after` from then on.
  void set_offsets(std::int32_t before, std::int32_t after, std::int64_t switch_at) {
    offset_before_ = before;
    offset_after_ = after;
    offset_switch_ = switch_at;
  }

  [[nodiscard]] std::int64_t now_unix() const override { return now_; }
  [[nodiscard]] std::int32_t utc_offset_seconds(std::int64_t unix_ts) const override {
    return unix_ts < offset_switch_ ? offset_before_ : offset_after_;
  }

private:
  std::int64_t now_ = 0;
  std::int32_t offset_before_ = 0;
  std::int32_t offset_after_ = 0;
  std::int64_t offset_switch_ = 0;
};

class FakeStepSource final : public stride::IStepSource {
public:
  std::map<stride::CivilDay, std::vector<stride::StepObservation>> by_day;
  bool unavailable = false;
  stride::CancellationToken* cancel = nullptr;
  std::size_t cancel_at_fetch = 0;
  std::size_t fetch_count = 0;

  stride::Result fetch_observations(stride::CivilDay day, std::vector<stride::StepObservation>& out) override {
    ++fetch_count;
    if (cancel != nullptr && fetch_count >= cancel_at_fetch) {
      cancel->request();
    }
    if (unavailable) {
      return stride::Result::failure(stride::ErrorKind::ObservationFetchFailure, "fake source offline");
    }
    const auto it = by_day.find(day);
    out = it == by_day.end() ? std::vector<stride::StepObservation>{} : it->second;
    return stride::Result::success();
  }

  stride::Result fetch_observations(stride::CivilDay first, stride::CivilDay last,
                                    stride::ObservationsByDay& out) override {
    out.clear();
    for (stride::CivilDay day = first; day <= last; day = stride::calendar::add_days(day, 1)) {
      if (const stride::Result fetched = fetch_observations(day, out[day]); !fetched.ok) {
        return fetched;
      }
    }
    return stride::Result::success();
  }
};

struct Engine {
  stride::CoreApi api;
  FakeClock* clock = nullptr;
  FakeStepSource* source = nullptr;
  stride::StaticTierProvider* tiers = nullptr;
};

stride::Result start_engine(Engine& engine, const std::filesystem::path& dir, stride::CivilDay today,
                            stride::EngineConfig config = {}) {
  config.data_dir = dir.string();
  auto clock = std::make_unique<FakeClock>(today);
  auto source = std::make_unique<FakeStepSource>();
  auto tiers = std::make_unique<stride::StaticTierProvider>(config.tier);
  engine.clock = clock.get();
  engine.source = source.get();
  engine.tiers = tiers.get();
  return engine.api.init(config, std::move(source), std::move(clock), std::move(tiers));
}

void seed_rows(const std::filesystem::path& dir, const std::vector<stride::DailyLog>& rows) {
  stride::FileStore store;
  const stride::Result open = store.open(dir.string());
  assert(open.ok);
  stride::StoreBatch batch;
  batch.daily_logs = rows;
  const stride::Result commit = store.commit(batch);
  assert(commit.ok);
}

std::string read_text(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void write_text(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

void test_calendar_and_periods() {
  stride::CivilDay parsed;
  assert(stride::calendar::parse_day("2026-03-20", parsed));
  assert(parsed == kToday);
  assert(stride::calendar::format_day(parsed) == "2026-03-20");
  assert(!stride::calendar::parse_day("2026-02-30", parsed));
  assert(!stride::calendar::parse_day("20260320", parsed));

  assert(stride::calendar::days_between(day_of(2026, 2, 27), day_of(2026, 3, 2)) == 3);
  assert(stride::calendar::first_day_of_next_month(day_of(2026, 12, 15)) == day_of(2027, 1, 1));
  assert(stride::calendar::period_of(kToday) == (stride::GrantPeriod{2026, 3}));

  // 23:30 UTC is already the next local day two hours east of UTC.
  const std::int64_t late = unix_at(kToday, 23) + 30 * 60;
  assert(stride::calendar::local_day_of(late, 0) == kToday);
  assert(stride::calendar::local_day_of(late, 2 * 3600) == stride::calendar::add_days(kToday, 1));
  assert(stride::calendar::local_hour_of(late, 2 * 3600) == 1);
  assert(stride::calendar::local_day_of(-1, 0) == (stride::CivilDay{-1}));
}

void test_merge_idempotent_and_order_free() {
  const stride::IntervalMerger merger{stride::ProviderPrecedence{}};
  const stride::CivilDay day = kToday;
  std::vector<stride::StepObservation> observations = {
      observation("health_store", day, 8, 9, 3600),
      observation("phone_motion", day, 8, 10, 5000),
      observation("watch_motion", day, 9, 11, 2400),
      observation("cloud_sync", day, 14, 15, 900),
      observation("phone_motion", day, 20, 21, 1500),
  };

  const stride::MergeReport first = merger.merge_day(observations, day, 0);
  const stride::MergeReport second = merger.merge_day(observations, day, 0);
  assert(first.steps == second.steps);
  assert(first.accepted == 5);

  std::vector<stride::StepObservation> shuffled = observations;
  std::ranges::reverse(shuffled);
  assert(merger.merge_day(shuffled, day, 0).steps == first.steps);
  std::ranges::rotate(shuffled, shuffled.begin() + 2);
  assert(merger.merge_day(shuffled, day, 0).steps == first.steps);

  // Re-delivered samples collapse instead of counting twice.
  std::vector<stride::StepObservation> duplicated = observations;
  duplicated.push_back(observations.front());
  duplicated.push_back(observations.back());
  const stride::MergeReport deduped = merger.merge_day(duplicated, day, 0);
  assert(deduped.steps == first.steps);
  assert(deduped.duplicates_collapsed == 2);
}

void test_merge_precedence_and_clipping() {
  const stride::IntervalMerger merger{stride::ProviderPrecedence{}};
  const stride::CivilDay day = kToday;

  // Same hour from two providers: the trusted one wins, the rest of the phone window is kept.
  stride::MergeReport report = merger.merge_day(
      {observation("health_store", day, 8, 9, 3600), observation("phone_motion", day, 8, 10, 1800 * 4)}, day, 0);
  assert(report.steps == 3600 + 3600);

  // Partial overlap splits at the boundaries.
  report = merger.merge_day(
      {observation("health_store", day, 0, 1, 3600), observation("watch_motion", day, 0, 2, 14400)}, day, 0);
  assert(report.steps == 3600 + 7200);

  // An interval that started yesterday only contributes its share after midnight.
  stride::StepObservation overnight = observation("health_store", day, 0, 1, 7200);
  overnight.start_unix -= kHour;
  report = merger.merge_day({overnight}, day, 0);
  assert(report.steps == 3600);

  stride::StepObservation inverted = observation("health_store", day, 5, 6, 100);
  std::swap(inverted.start_unix, inverted.end_unix);
  stride::StepObservation negative = observation("health_store", day, 6, 7, -10);
  const stride::StepObservation tomorrow = observation("health_store", stride::calendar::add_days(day, 1), 1, 2, 500);
  report = merger.merge_day({inverted, negative, tomorrow, observation("", day, 1, 2, 50)}, day, 0);
  assert(report.steps == 0);
  assert(report.dropped_malformed == 3);
  assert(report.dropped_outside_day == 1);

  // Unlisted providers rank after listed ones and among themselves by name.
  report = merger.merge_day(
      {observation("zeta_band", day, 3, 4, 900), observation("alpha_band", day, 3, 4, 300)}, day, 0);
  assert(report.steps == 300);
  report = merger.merge_day(
      {observation("zeta_band", day, 3, 4, 900), observation("cloud_sync", day, 3, 4, 200)}, day, 0);
  assert(report.steps == 200);

  const stride::IntervalMerger phone_first{stride::ProviderPrecedence{{"Phone_Motion", "health_store"}}};
  report = phone_first.merge_day(
      {observation("health_store", day, 8, 9, 3600), observation("phone_motion", day, 8, 9, 1800)}, day, 0);
  assert(report.steps == 1800);
}

void test_merge_same_provider_overlaps() {
  const stride::IntervalMerger merger{stride::ProviderPrecedence{}};
  const stride::CivilDay day = kToday;

  // A refresh re-reports the first hour inside a longer interval.
  stride::MergeReport report = merger.merge_day(
      {observation("health_store", day, 0, 1, 2000), observation("health_store", day, 0, 2, 3000)}, day, 0);
  assert(report.steps == 3000);
  assert(report.overlaps_resolved == 1);

  // Whole-day aggregate next to one of its hourly samples.
  report = merger.merge_day(
      {observation("health_store", day, 0, 24, 5000), observation("health_store", day, 9, 10, 3000)}, day, 0);
  assert(report.steps == 5000);
  assert(report.overlaps_resolved == 1);

  // Hourly samples that add up to more than the coarse aggregate replace it.
  report = merger.merge_day({observation("watch_motion", day, 0, 24, 1000), observation("watch_motion", day, 8, 9, 900),
                             observation("watch_motion", day, 9, 10, 800)},
                            day, 0);
  assert(report.steps == 1700);
  assert(report.overlaps_resolved == 1);

  std::vector<stride::StepObservation> hourly = {
      observation("phone_motion", day, 8, 9, 600),
      observation("phone_motion", day, 9, 10, 700),
      observation("phone_motion", day, 10, 11, 800),
  };
  report = merger.merge_day(hourly, day, 0);
  assert(report.steps == 2100);
  assert(report.overlaps_resolved == 0);
  std::ranges::reverse(hourly);
  assert(merger.merge_day(hourly, day, 0).steps == 2100);

  // Lower-precedence coverage outside the resolved interval still counts.
  report = merger.merge_day({observation("health_store", day, 8, 9, 1000), observation("health_store", day, 8, 10, 1500),
                             observation("phone_motion", day, 10, 12, 400)},
                            day, 0);
  assert(report.steps == 1900);
}

void test_day_window_across_offset_changes() {
  const stride::CivilDay switch_day = days_before(kToday, 1);
  const stride::IntervalMerger merger{stride::ProviderPrecedence{}};

  // Clocks go forward at 02:00 local (01:00 UTC), from +1h to +2h.
  FakeClock spring{kToday};
  spring.set_offsets(kHour, 2 * kHour, unix_at(switch_day, 1));
  const stride::calendar::LocalDayBounds short_day = stride::calendar::local_day_bounds(spring, switch_day);
  assert(short_day.start == unix_at(switch_day, 0) - kHour);
  assert(short_day.end - short_day.start == 23 * kHour);
  const stride::calendar::LocalDayBounds next_day = stride::calendar::local_day_bounds(spring, kToday);
  assert(next_day.start == short_day.end);
  assert(next_day.end - next_day.start == 24 * kHour);

  stride::StepObservation after_midnight;
  after_midnight.provider = "health_store";
  after_midnight.start_unix = next_day.start;
  after_midnight.end_unix = next_day.start + kHour;
  after_midnight.steps = 1200;
  assert(merger.merge({after_midnight}, short_day.start, short_day.end).steps == 0);
  assert(merger.merge({after_midnight}, next_day.start, next_day.end).steps == 1200);

  // Clocks go back at 03:00 local (01:00 UTC), from +2h to +1h.
  FakeClock autumn{kToday};
  autumn.set_offsets(2 * kHour, kHour, unix_at(switch_day, 1));
  const stride::calendar::LocalDayBounds long_day = stride::calendar::local_day_bounds(autumn, switch_day);
  assert(long_day.end - long_day.start == 25 * kHour);
  stride::StepObservation last_hour;
  last_hour.provider = "health_store";
  last_hour.start_unix = long_day.end - kHour;
  last_hour.end_unix = long_day.end;
  last_hour.steps = 900;
  assert(merger.merge({last_hour}, long_day.start, long_day.end).steps == 900);

  // Reconciliation files the early-morning walk under the new day only.
  const auto dir = temp_dir("offset-change");
  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);
  engine.clock->set_offsets(kHour, 2 * kHour, unix_at(switch_day, 1));
  engine.source->by_day[switch_day] = {after_midnight};
  engine.source->by_day[kToday] = {after_midnight};
  stride::ReconcileReport report;
  assert(engine.api.reconcile({switch_day, kToday}, nullptr, report).ok);
  assert(!engine.api.load_daily_log(switch_day).has_value());
  assert(engine.api.get_today().steps == 1200);
}

void test_high_water_mark_ratchet() {
  stride::HighWaterMark marks;
  const stride::CivilDay day = kToday;
  const std::vector<std::int64_t> candidates = {5000, 3000, 9000, 7000, 9000, 8500};
  std::int64_t previous = 0;
  for (const std::int64_t candidate : candidates) {
    const std::int64_t accepted = marks.accept(day, candidate);
    assert(accepted >= previous);
    previous = accepted;
  }
  assert(previous == *std::ranges::max_element(candidates));

  const stride::CivilDay past = days_before(kToday, 2);
  marks.seed(past, 4000, stride::DayState::Finalized);
  assert(marks.accept(past, 6000) == 4000);
  assert(marks.accept_correction(past, 6000) == 6000);
  assert(marks.accept_correction(past, 2000) == 6000);

  marks.roll_over(stride::calendar::add_days(kToday, 1));
  assert(marks.is_finalized(day));
  assert(marks.accept(day, 20000) == 9000);

  marks.forget_before(kToday);
  assert(!marks.mark(past).has_value());
  assert(marks.mark(day).has_value());
}

void test_shield_grants_and_consumption() {
  const stride::TierAllowance free = stride::shield::allowance_for(stride::Tier::Free);
  const stride::TierAllowance pro = stride::shield::allowance_for(stride::Tier::Pro);
  assert(free.bank_max == 2 && free.recurring_amount == 2 && free.history_window_days == 30);
  assert(pro.bank_max == 8 && pro.recurring_amount == 4 && pro.history_window_days == 365);

  stride::ShieldInventory inventory;
  assert(stride::shield::grant_recurring(inventory, {2026, 3}, pro));
  assert(inventory.recurring_available == 8);
  assert(!stride::shield::grant_recurring(inventory, {2026, 3}, pro));
  for (int i = 0; i < 5; ++i) {
    assert(stride::shield::consume(inventory, stride::ConsumptionOrder::PurchasedFirst).ok);
  }
  assert(inventory.recurring_available == 3);
  assert(inventory.used_this_period == 5);
  assert(stride::shield::grant_recurring(inventory, {2026, 4}, pro));
  assert(inventory.recurring_available == 7);
  assert(inventory.used_this_period == 0);
  assert(inventory.total_used_lifetime == 5);
  assert(stride::shield::grant_recurring(inventory, {2026, 5}, pro));
  assert(inventory.recurring_available == 8);

  stride::ShieldInventory mixed;
  mixed.recurring_available = 2;
  assert(stride::shield::purchase(mixed, 1).ok);
  assert(stride::shield::consume(mixed, stride::ConsumptionOrder::PurchasedFirst).ok);
  assert(mixed.purchased_available == 0);
  assert(mixed.recurring_available == 2);

  stride::ShieldInventory recurring_first;
  recurring_first.recurring_available = 2;
  recurring_first.purchased_available = 1;
  assert(stride::shield::consume(recurring_first, stride::ConsumptionOrder::RecurringFirst).ok);
  assert(recurring_first.recurring_available == 1);
  assert(recurring_first.purchased_available == 1);

  stride::ShieldInventory empty;
  const stride::Result none = stride::shield::consume(empty, stride::ConsumptionOrder::PurchasedFirst);
  assert(!none.ok);
  assert(none.is(stride::ErrorKind::InsufficientShields));
  assert(empty.recurring_available == 0);
  assert(empty.purchased_available == 0);
  assert(empty.total_used_lifetime == 0);

  assert(stride::shield::purchase(empty, 0).is(stride::ErrorKind::InvalidArgument));
  assert(stride::shield::can_buy_more(empty, free));
  assert(!stride::shield::can_buy_more(mixed, free));
  assert(stride::shield::next_refill_day(kToday) == day_of(2026, 4, 1));
}

void test_repair_eligibility() {
  const int lookback = 7;
  assert(stride::shield::check_repair_eligibility(days_before(kToday, 1), kToday, std::nullopt, lookback).ok);
  assert(stride::shield::check_repair_eligibility(days_before(kToday, 7), kToday, std::nullopt, lookback).ok);
  assert(stride::shield::check_repair_eligibility(kToday, kToday, std::nullopt, lookback)
             .is(stride::ErrorKind::RepairIneligible));
  assert(stride::shield::check_repair_eligibility(days_before(kToday, 8), kToday, std::nullopt, lookback)
             .is(stride::ErrorKind::RepairIneligible));

  stride::DailyLog met = day_row(days_before(kToday, 2), 12000);
  assert(stride::shield::check_repair_eligibility(met.date, kToday, met, lookback)
             .is(stride::ErrorKind::RepairIneligible));
  stride::DailyLog shielded = day_row(days_before(kToday, 2), 100);
  shielded.shield_used = true;
  assert(!stride::shield::check_repair_eligibility(shielded.date, kToday, shielded, lookback).ok);
  stride::DailyLog declined = day_row(days_before(kToday, 2), 100);
  declined.repair_declined = true;
  assert(!stride::shield::check_repair_eligibility(declined.date, kToday, declined, lookback).ok);
}

void test_streak_engine_rules() {
  std::vector<stride::DailyLog> rows;
  for (int back = 6; back >= 1; --back) {
    rows.push_back(day_row(days_before(kToday, back), 11000));
  }
  rows.push_back(day_row(kToday, 2500, 10000, stride::DayState::Open));

  stride::StreakState state = stride::streak::recompute(rows, {}, kToday, kToday);
  assert(state.current_streak == 6);
  assert(state.longest_streak == 6);
  assert(state.streak_start_date == days_before(kToday, 6));
  assert(state.last_goal_met_date == days_before(kToday, 1));
  assert(!state.last_reached_milestone.has_value());

  rows.back() = day_row(kToday, 10000, 10000, stride::DayState::Open);
  state = stride::streak::recompute(rows, state, kToday, kToday);
  assert(state.current_streak == 7);
  assert(state.last_reached_milestone == 7);
  assert(stride::streak::weekly_jackpot_earned(state));
  assert(stride::streak::consume_milestone(state) == 7);
  assert(!stride::streak::consume_milestone(state).has_value());
  state = stride::streak::recompute(rows, state, kToday, kToday);
  assert(!state.last_reached_milestone.has_value());

  assert(stride::streak::next_milestone(0) == 7);
  assert(stride::streak::next_milestone(7) == 14);
  assert(stride::streak::next_milestone(365) == 400);
  assert(stride::streak::next_milestone(450) == 500);
  assert(stride::streak::is_milestone(500));
  assert(!stride::streak::is_milestone(450));
  assert(!stride::streak::legacy_badge_for(29).has_value());
  assert(stride::streak::legacy_badge_for(45) == 30);
  assert(stride::streak::legacy_badge_for(95) == 90);

  stride::StreakState alive;
  alive.current_streak = 3;
  alive.longest_streak = 3;
  alive.last_goal_met_date = days_before(kToday, 1);
  alive.streak_start_date = days_before(kToday, 3);
  assert(stride::streak::is_alive(alive, kToday));
  assert(stride::streak::is_at_risk(alive, std::nullopt, 19));
  assert(!stride::streak::is_at_risk(alive, std::nullopt, 10));
  assert(!stride::streak::is_alive(alive, stride::calendar::add_days(kToday, 1)));

  assert(stride::streak::classify_day(std::nullopt, days_before(kToday, 1), kToday) ==
         stride::streak::DayClass::NoData);
  assert(stride::streak::classify_day(day_row(days_before(kToday, 1), 10), days_before(kToday, 1), kToday) ==
         stride::streak::DayClass::Missed);
  assert(stride::streak::classify_day(std::nullopt, kToday, kToday) == stride::streak::DayClass::Open);
}

void test_record_merge_rules() {
  stride::DailyLog local = day_row(days_before(kToday, 1), 4000, 10000, stride::DayState::Open);
  local.session_ids = {"a"};
  stride::DailyLog remote = day_row(days_before(kToday, 1), 6000, 5000);
  remote.session_ids = {"b", "a"};
  const stride::DailyLog merged = stride::sync::merge_daily_log(local, remote);
  assert(merged.steps == 6000);
  assert(merged.goal_met);
  assert(merged.goal_target == 5000);
  assert(merged.state == stride::DayState::Finalized);
  assert((merged.session_ids == std::vector<std::string>{"a", "b"}));

  stride::ShieldInventory mine;
  mine.recurring_available = 1;
  mine.purchased_available = 2;
  mine.last_refill_period = stride::GrantPeriod{2026, 3};
  mine.used_this_period = 1;
  mine.total_used_lifetime = 3;
  mine.purchased_lifetime = 4;
  stride::ShieldInventory theirs;
  theirs.recurring_available = 2;
  theirs.purchased_available = 1;
  theirs.last_refill_period = stride::GrantPeriod{2026, 3};
  theirs.total_used_lifetime = 2;
  theirs.purchased_lifetime = 5;
  stride::ShieldInventory combined = stride::sync::merge_shield_inventory(mine, theirs);
  assert(combined.recurring_available == 1);
  assert(combined.purchased_available == 1);
  assert(combined.purchased_lifetime == 5);
  assert(combined.total_used_lifetime == 3);
  assert(combined.used_this_period == 1);

  theirs.last_refill_period = stride::GrantPeriod{2026, 4};
  theirs.used_this_period = 0;
  combined = stride::sync::merge_shield_inventory(mine, theirs);
  assert(combined.recurring_available == 2);
  assert(combined.used_this_period == 0);
  assert(combined.last_refill_period == (stride::GrantPeriod{2026, 4}));

  stride::StreakState older;
  older.current_streak = 5;
  older.longest_streak = 9;
  older.streak_start_date = days_before(kToday, 9);
  older.last_goal_met_date = days_before(kToday, 5);
  stride::StreakState newer;
  newer.current_streak = 7;
  newer.longest_streak = 7;
  newer.streak_start_date = days_before(kToday, 7);
  newer.last_goal_met_date = days_before(kToday, 1);
  const stride::StreakState streak = stride::sync::merge_streak_state(older, newer);
  assert(streak.current_streak == 7);
  assert(streak.longest_streak == 9);
  assert(streak.last_goal_met_date == days_before(kToday, 1));
}

void test_store_round_trip_and_journal_replay() {
  const auto dir = temp_dir("store");
  {
    stride::FileStore store;
    assert(store.open(dir.string()).ok);

    stride::StoreBatch batch;
    stride::DailyLog row = day_row(days_before(kToday, 1), 5200, 5000);
    row.session_ids = {"walk-1", "walk-2"};
    batch.daily_logs.push_back(row);
    batch.goal_history = std::vector<stride::GoalChange>{{days_before(kToday, 30), 5000}};
    assert(store.commit(batch).ok);
    assert(!std::filesystem::exists(dir / "journal.pending"));
    assert(std::filesystem::exists(dir / "days" / "2026-03-19.rec"));
  }

  {
    stride::FileStore reopened;
    assert(reopened.open(dir.string()).ok);
    std::optional<stride::DailyLog> row;
    assert(reopened.load_daily_log(days_before(kToday, 1), row).ok);
    assert(row.has_value());
    assert(row->steps == 5200);
    assert(row->goal_target == 5000);
    assert(row->goal_met);
    assert((row->session_ids == std::vector<std::string>{"walk-1", "walk-2"}));
    std::vector<stride::GoalChange> goals;
    assert(reopened.load_goal_history(goals).ok);
    assert(goals.size() == 1 && goals.front().goal == 5000);
  }

  // A journal left behind by an interrupted batch is rolled forward.
  stride::StreakState streak;
  streak.current_streak = 1;
  streak.longest_streak = 1;
  streak.streak_start_date = kToday;
  streak.last_goal_met_date = kToday;
  const std::string day_record = stride::encode_daily_log(day_row(kToday, 12000, 10000, stride::DayState::Open));
  const std::string streak_record = stride::encode_streak_state(streak);
  std::string body = "# stride-journal-v1\n";
  body += "record=days/2026-03-20.rec\t" + std::to_string(day_record.size()) + "\n" + day_record;
  body += "record=streak.rec\t" + std::to_string(streak_record.size()) + "\n" + streak_record;
  write_text(dir / "journal.pending", body + "checksum=" + stride::util::blake2b_hex(body) + "\n");

  stride::FileStore recovered;
  assert(recovered.open(dir.string()).ok);
  assert(!std::filesystem::exists(dir / "journal.pending"));
  std::optional<stride::DailyLog> today_row;
  assert(recovered.load_daily_log(kToday, today_row).ok);
  assert(today_row.has_value() && today_row->steps == 12000);
  stride::StreakState loaded;
  assert(recovered.load_streak(loaded).ok);
  assert(loaded == streak);
  const stride::StoreHealthReport health = recovered.health_report();
  assert(health.healthy);
  assert(health.recovered_from_journal);
  assert(health.daily_log_count == 2);
}

void test_store_quarantines_corruption() {
  const auto dir = temp_dir("corruption");
  {
    stride::FileStore store;
    assert(store.open(dir.string()).ok);
    stride::StoreBatch batch;
    batch.daily_logs.push_back(day_row(days_before(kToday, 1), 5200, 5000));
    batch.daily_logs.push_back(day_row(days_before(kToday, 2), 7000, 5000));
    assert(store.commit(batch).ok);

    // An invalid aggregate is refused and the previous state stays.
    stride::StoreBatch invalid;
    stride::StreakState broken;
    broken.current_streak = 5;
    broken.longest_streak = 3;
    broken.streak_start_date = days_before(kToday, 5);
    broken.last_goal_met_date = days_before(kToday, 1);
    invalid.streak = broken;
    const stride::Result rejected = store.commit(invalid);
    assert(rejected.is(stride::ErrorKind::CorruptedAggregate));
    stride::StreakState current;
    assert(store.load_streak(current).ok);
    assert(current.current_streak == 0);
    assert(store.health_report().anomaly_count == 1);
  }

  const auto record = dir / "days" / "2026-03-19.rec";
  std::string content = read_text(record);
  const auto pos = content.find("steps=5200");
  assert(pos != std::string::npos);
  content.replace(pos, 10, "steps=9200");
  write_text(record, content);
  write_text(dir / "streak.rec", "not a record\n");
  write_text(dir / "journal.pending", "torn journal");

  stride::FileStore store;
  assert(store.open(dir.string()).ok);
  std::optional<stride::DailyLog> tampered;
  assert(store.load_daily_log(days_before(kToday, 1), tampered).ok);
  assert(!tampered.has_value());
  std::optional<stride::DailyLog> intact;
  assert(store.load_daily_log(days_before(kToday, 2), intact).ok);
  assert(intact.has_value() && intact->steps == 7000);
  stride::StreakState streak;
  assert(store.load_streak(streak).ok);
  assert(streak.current_streak == 0);

  const stride::StoreHealthReport health = store.health_report();
  assert(health.healthy);
  assert(health.quarantined_record_count == 3);
  assert(!health.recovered_from_journal);
  assert(!std::filesystem::exists(dir / "journal.pending"));
  const auto quarantined = std::distance(std::filesystem::directory_iterator{dir / "quarantine"},
                                         std::filesystem::directory_iterator{});
  assert(quarantined == 3);
  assert(std::filesystem::exists(dir / "anomalies.log"));
}

void test_store_rolls_forward_interrupted_batch() {
  const auto dir = temp_dir("interrupted-batch");
  stride::FileStore store;
  assert(store.open(dir.string()).ok);

  stride::ShieldInventory before;
  before.recurring_available = 2;
  before.last_refill_period = stride::GrantPeriod{2026, 3};
  stride::StoreBatch seed;
  seed.shields = before;
  assert(store.commit(seed).ok);

  stride::DailyLog repaired = day_row(days_before(kToday, 2), 300);
  repaired.shield_used = true;
  stride::ShieldInventory after = before;
  after.recurring_available = 1;
  after.used_this_period = 1;
  after.total_used_lifetime = 1;
  stride::StreakState streak;
  streak.current_streak = 3;
  streak.longest_streak = 3;
  streak.streak_start_date = days_before(kToday, 4);
  streak.last_goal_met_date = days_before(kToday, 2);
  stride::StoreBatch repair;
  repair.daily_logs.push_back(repaired);
  repair.streak = streak;
  repair.shields = after;

  // A directory on the temp name makes the streak write fail after the day row was replaced.
  std::filesystem::create_directories(dir / "streak.rec.tmp");
  assert(store.commit(repair).is(stride::ErrorKind::PersistenceFailure));
  assert(std::filesystem::exists(dir / "journal.pending"));
  std::filesystem::remove(dir / "streak.rec.tmp");

  // The next commit finishes the interrupted batch before writing its own records.
  stride::StoreBatch next;
  next.daily_logs.push_back(day_row(days_before(kToday, 1), 12000));
  assert(store.commit(next).ok);
  assert(!std::filesystem::exists(dir / "journal.pending"));
  stride::ShieldInventory shields;
  assert(store.load_shields(shields).ok);
  assert(shields == after);
  stride::StreakState loaded_streak;
  assert(store.load_streak(loaded_streak).ok);
  assert(loaded_streak == streak);

  stride::FileStore reopened;
  assert(reopened.open(dir.string()).ok);
  assert(reopened.load_shields(shields).ok);
  assert(shields == after);
  std::optional<stride::DailyLog> row;
  assert(reopened.load_daily_log(days_before(kToday, 2), row).ok);
  assert(row.has_value() && row->shield_used);
  assert(reopened.load_daily_log(days_before(kToday, 1), row).ok);
  assert(row.has_value() && row->steps == 12000);
}

void test_store_rejects_out_of_range_counters() {
  const auto dir = temp_dir("out-of-range");
  stride::StreakState streak;
  streak.current_streak = 1;
  streak.longest_streak = 1;
  streak.streak_start_date = kToday;
  streak.last_goal_met_date = kToday;
  std::string record = stride::encode_streak_state(streak);
  std::string payload = record.substr(0, record.find("checksum="));
  const auto pos = payload.find("current_streak=1");
  assert(pos != std::string::npos);
  // 2^32 + 1 would wrap to 1 if narrowed.
  payload.replace(pos, 16, "current_streak=4294967297");
  write_text(dir / "streak.rec", payload + "checksum=" + stride::util::blake2b_hex(payload) + "\n");

  stride::FileStore store;
  assert(store.open(dir.string()).ok);
  stride::StreakState loaded;
  assert(store.load_streak(loaded).ok);
  assert(loaded.current_streak == 0);
  assert(store.health_report().quarantined_record_count == 1);
}

void test_engine_config_file() {
  const auto dir = temp_dir("config");
  stride::EngineConfig config;
  assert(stride::load_engine_config((dir / "missing.conf").string(), config).ok);
  assert(config.default_daily_goal == 10000);
  assert(config.shield_policy.consumption_order == stride::ConsumptionOrder::PurchasedFirst);

  write_text(dir / "stride.conf",
             "# stride settings\n"
             "default_daily_goal = 8000\n"
             "consumption_order = recurring_first\n"
             "repair_lookback_days=5\n"
             "auto_deploy_missed_days=false\n"
             "provider_precedence=Watch_Motion,health_store\n"
             "tier=pro\n"
             "unknown_key=ignored\n");
  assert(stride::load_engine_config((dir / "stride.conf").string(), config).ok);
  assert(config.default_daily_goal == 8000);
  assert(config.shield_policy.consumption_order == stride::ConsumptionOrder::RecurringFirst);
  assert(config.shield_policy.repair_lookback_days == 5);
  assert(!config.shield_policy.auto_deploy_missed_days);
  assert((config.provider_precedence == std::vector<std::string>{"watch_motion", "health_store"}));
  assert(config.tier == stride::Tier::Pro);

  write_text(dir / "bad.conf", "default_daily_goal=-4\nrepair_lookback_days=3\n");
  const stride::Result bad = stride::load_engine_config((dir / "bad.conf").string(), config);
  assert(bad.is(stride::ErrorKind::InvalidArgument));
  assert(config.default_daily_goal == 8000);
  assert(config.shield_policy.repair_lookback_days == 5);
}

void test_file_step_source() {
  const auto dir = temp_dir("source");
  const FakeClock clock{kToday};
  stride::FileStepSource source{(dir / "observations.tsv").string(), clock};

  std::vector<stride::StepObservation> out;
  assert(source.fetch_observations(kToday, out).is(stride::ErrorKind::ObservationFetchFailure));

  std::string lines = "# provider\tstart\tend\tsteps\n";
  lines += stride::format_observation_line(observation("health_store", kToday, 8, 9, 3000, "morning")) + "\n";
  lines += stride::format_observation_line(observation("Phone_Motion", kToday, 12, 13, 800)) + "\n";
  lines += stride::format_observation_line(observation("health_store", days_before(kToday, 1), 8, 9, 500)) + "\n";
  lines += "garbage line\n";
  write_text(dir / "observations.tsv", lines);

  assert(source.fetch_observations(kToday, out).ok);
  assert(out.size() == 2);
  assert(out.front().session_id == "morning");
  assert(out.back().provider == "phone_motion");
  assert(source.skipped_line_count() == 1);

  stride::ObservationsByDay by_day;
  assert(source.fetch_observations(days_before(kToday, 1), kToday, by_day).ok);
  assert(by_day.size() == 2);
  assert(by_day[days_before(kToday, 1)].size() == 1);
}

void test_scheduler_windows() {
  stride::ReconcileScheduler scheduler{stride::ReconcilePolicy{}};
  const std::int64_t now = unix_at(kToday, 12);
  assert(scheduler.should_run(now, stride::ReconcileTrigger::BackgroundRefresh));
  scheduler.mark_completed(now);
  assert(!scheduler.should_run(now + kHour, stride::ReconcileTrigger::BackgroundRefresh));
  assert(scheduler.should_run(now + kHour, stride::ReconcileTrigger::Foreground));
  assert(!scheduler.should_run(now + 60, stride::ReconcileTrigger::Foreground));
  assert(scheduler.should_run(now + 60, stride::ReconcileTrigger::Manual));
  assert(scheduler.should_run(now + 4 * kHour, stride::ReconcileTrigger::BackgroundRefresh));
  assert(scheduler.should_run(now - kHour, stride::ReconcileTrigger::BackgroundRefresh));

  const stride::DayWindow window =
      scheduler.default_window(kToday, stride::shield::allowance_for(stride::Tier::Free));
  assert(window.last == kToday);
  assert(stride::calendar::days_between(window.first, window.last) == 29);

  const auto clamped = scheduler.clamp_window({days_before(kToday, 400), stride::calendar::add_days(kToday, 3)}, kToday);
  assert(clamped.has_value());
  assert(clamped->last == kToday);
  assert(stride::calendar::days_between(clamped->first, clamped->last) == 364);
  assert(!scheduler.clamp_window({stride::calendar::add_days(kToday, 1), stride::calendar::add_days(kToday, 2)}, kToday)
              .has_value());
}

void test_streak_continuity_with_open_day() {
  const auto dir = temp_dir("continuity");
  std::vector<stride::DailyLog> rows;
  for (int back = 6; back >= 1; --back) {
    rows.push_back(day_row(days_before(kToday, back), 11000));
  }
  rows.push_back(day_row(kToday, 2000, 10000, stride::DayState::Open));
  seed_rows(dir, rows);

  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);
  stride::StreakState streak = engine.api.get_streak();
  assert(streak.current_streak == 6);
  assert(streak.longest_streak == 6);
  assert(engine.api.classify_day(kToday) == stride::streak::DayClass::Open);
  assert(engine.api.classify_day(days_before(kToday, 1)) == stride::streak::DayClass::Met);

  const stride::Result recorded =
      engine.api.record_observations(kToday, {observation("health_store", kToday, 6, 11, 11000, "run-1")});
  assert(recorded.ok);
  const stride::TodaySummary today = engine.api.get_today();
  assert(today.steps == 11000);
  assert(today.goal_met);
  streak = engine.api.get_streak();
  assert(streak.current_streak == 7);
  assert(streak.longest_streak == 7);

  const stride::StreakInsights insights = engine.api.streak_insights();
  assert(insights.alive);
  assert(insights.weekly_jackpot_earned);
  assert(insights.next_milestone == 14);

  std::optional<int> milestone;
  assert(engine.api.consume_milestone(milestone).ok);
  assert(milestone == 7);
  assert(engine.api.consume_milestone(milestone).ok);
  assert(!milestone.has_value());
}

void test_streak_break_and_shield_repair() {
  const auto dir = temp_dir("break-repair");
  seed_rows(dir, {
                     day_row(days_before(kToday, 6), 12000),
                     day_row(days_before(kToday, 5), 12000),
                     day_row(days_before(kToday, 4), 12000),
                     day_row(days_before(kToday, 3), 100),
                     day_row(days_before(kToday, 2), 12000),
                     day_row(days_before(kToday, 1), 12000),
                     day_row(kToday, 500, 10000, stride::DayState::Open),
                 });

  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);
  stride::StreakState streak = engine.api.get_streak();
  assert(streak.current_streak == 2);
  assert(streak.longest_streak == 3);
  assert(engine.api.classify_day(days_before(kToday, 3)) == stride::streak::DayClass::Missed);
  assert(engine.api.get_shields().recurring_available == 2);

  const stride::Result repaired = engine.api.request_repair(days_before(kToday, 3));
  assert(repaired.ok);
  const auto row = engine.api.load_daily_log(days_before(kToday, 3));
  assert(row.has_value());
  assert(row->shield_used);
  assert(row->steps == 100);
  assert(!row->goal_met);
  streak = engine.api.get_streak();
  assert(streak.current_streak == 6);
  assert(streak.longest_streak == 6);
  const stride::ShieldInventory shields = engine.api.get_shields();
  assert(shields.recurring_available == 1);
  assert(shields.used_this_period == 1);

  assert(engine.api.request_repair(days_before(kToday, 3)).is(stride::ErrorKind::RepairIneligible));
  assert(engine.api.request_repair(kToday).is(stride::ErrorKind::RepairIneligible));
  assert(engine.api.request_repair(days_before(kToday, 5)).is(stride::ErrorKind::RepairIneligible));
  assert(engine.api.request_repair(days_before(kToday, 10)).is(stride::ErrorKind::RepairIneligible));
  assert(engine.api.get_shields().recurring_available == 1);
}

void test_seven_day_repair_scenario() {
  const auto dir = temp_dir("seven-days");
  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);

  const stride::CivilDay day1 = days_before(kToday, 6);
  for (int offset = 0; offset < 7; ++offset) {
    const stride::CivilDay day = stride::calendar::add_days(day1, offset);
    const std::int64_t steps = offset == 3 ? 3000 : 10000 + offset * 100;
    engine.source->by_day[day] = {observation("health_store", day, 7, 19, steps)};
  }
  assert(engine.api.purchase_shields(1).ok);

  stride::ReconcileReport report;
  assert(engine.api.reconcile({day1, kToday}, nullptr, report).ok);
  assert(report.days_visited == 7);
  assert(report.changed_days.size() == 7);

  const stride::CivilDay day4 = stride::calendar::add_days(day1, 3);
  stride::StreakState streak = engine.api.get_streak();
  assert(streak.current_streak == 3);
  assert(streak.longest_streak == 3);

  assert(engine.api.request_repair(day4).ok);
  streak = engine.api.get_streak();
  assert(streak.current_streak == 7);
  assert(streak.longest_streak == 7);
  const stride::ShieldInventory shields = engine.api.get_shields();
  assert(shields.purchased_available == 0);
  assert(shields.recurring_available == 2);
  const auto repaired = engine.api.load_daily_log(day4);
  assert(repaired.has_value());
  assert(repaired->shield_used);
  assert(repaired->steps == 3000);
}

void test_historical_goal_freeze() {
  const auto dir = temp_dir("goal-freeze");
  seed_rows(dir, {day_row(days_before(kToday, 1), 5200, 5000)});

  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);
  assert(engine.api.record_observations(kToday, {observation("health_store", kToday, 8, 10, 6000)}).ok);

  assert(engine.api.set_daily_goal(0).is(stride::ErrorKind::InvalidArgument));
  assert(engine.api.set_daily_goal(10000).ok);
  auto past = engine.api.load_daily_log(days_before(kToday, 1));
  assert(past.has_value());
  assert(past->goal_target == 5000);
  assert(past->goal_met);
  stride::TodaySummary today = engine.api.get_today();
  assert(today.goal == 10000);
  assert(!today.goal_met);

  // A second change on the same day replaces the first.
  assert(engine.api.set_daily_goal(5000).ok);
  const auto history = engine.api.goal_history();
  assert(history.size() == 1);
  assert(history.front().effective_from == kToday);
  assert(history.front().goal == 5000);
  today = engine.api.get_today();
  assert(today.goal_met);

  past = engine.api.load_daily_log(days_before(kToday, 1));
  assert(past->goal_target == 5000);

  // A day before the first recorded change is created with the default that was in force then.
  const stride::CivilDay earlier = days_before(kToday, 3);
  engine.source->by_day[earlier] = {observation("health_store", earlier, 8, 12, 9000)};
  stride::ReconcileReport report;
  assert(engine.api.reconcile({earlier, earlier}, nullptr, report).ok);
  const auto created = engine.api.load_daily_log(earlier);
  assert(created.has_value());
  assert(created->goal_target == stride::EngineConfig{}.default_daily_goal);
  assert(!created->goal_met);
}

void test_live_updates_and_reconciliation_never_regress() {
  const auto dir = temp_dir("no-regress");
  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);

  assert(engine.api.record_observations(kToday, {observation("phone_motion", kToday, 8, 9, 4000)}).ok);
  assert(engine.api.record_observations(kToday, {observation("phone_motion", kToday, 8, 9, 3000)}).ok);
  assert(engine.api.get_today().steps == 4000);
  assert(engine.api.record_observations(days_before(kToday, 1), {}).is(stride::ErrorKind::InvalidArgument));
  assert(engine.api.record_observations(stride::calendar::add_days(kToday, 1), {})
             .is(stride::ErrorKind::InvalidArgument));

  const stride::CivilDay past = days_before(kToday, 2);
  engine.source->by_day[past] = {observation("health_store", past, 8, 12, 8000)};
  stride::ReconcileReport report;
  assert(engine.api.reconcile({days_before(kToday, 3), kToday}, nullptr, report).ok);
  assert(std::ranges::find(report.changed_days, past) != report.changed_days.end());
  assert(!engine.api.load_daily_log(days_before(kToday, 3)).has_value());
  auto row = engine.api.load_daily_log(past);
  assert(row.has_value() && row->steps == 8000);
  assert(row->state == stride::DayState::Finalized);

  engine.source->by_day[past] = {observation("health_store", past, 8, 10, 5000)};
  assert(engine.api.reconcile({days_before(kToday, 3), kToday}, nullptr, report).ok);
  assert(report.changed_days.empty());
  row = engine.api.load_daily_log(past);
  assert(row->steps == 8000);

  engine.source->by_day[past] = {observation("health_store", past, 8, 12, 10500)};
  assert(engine.api.reconcile({days_before(kToday, 3), kToday}, nullptr, report).ok);
  row = engine.api.load_daily_log(past);
  assert(row->steps == 10500);
  assert(row->goal_met);
}

void test_reconcile_deferral_and_cancellation() {
  const auto dir = temp_dir("cancel");
  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);

  engine.source->unavailable = true;
  stride::ReconcileReport report;
  const stride::Result deferred = engine.api.reconcile({days_before(kToday, 4), kToday}, nullptr, report);
  assert(deferred.is(stride::ErrorKind::ObservationFetchFailure));
  assert(report.deferred);
  assert(report.days_visited == 5);
  assert(report.failed_days.size() == 5);

  engine.source->unavailable = false;
  stride::CancellationToken token;
  engine.source->cancel = &token;
  engine.source->cancel_at_fetch = engine.source->fetch_count + 2;
  const stride::Result cancelled = engine.api.reconcile({days_before(kToday, 9), kToday}, &token, report);
  assert(cancelled.is(stride::ErrorKind::Cancelled));
  assert(report.cancelled);
  assert(report.days_visited == 2);
}

void test_scheduled_reconcile_throttle() {
  const auto dir = temp_dir("throttle");
  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);

  stride::ReconcileReport report;
  assert(engine.api.on_background_refresh(report).ok);
  assert(report.days_visited == 30);
  assert(engine.api.on_background_refresh(report).is(stride::ErrorKind::Throttled));
  assert(report.days_visited == 0);

  engine.clock->advance(4 * kHour);
  assert(engine.api.on_background_refresh(report).ok);

  // A throttled foreground pass still refreshes today.
  engine.source->by_day[kToday] = {observation("watch_motion", kToday, 13, 15, 2500)};
  stride::MissedDayResult missed;
  assert(engine.api.on_foreground(missed, report).ok);
  assert(report.days_visited == 0);
  assert(engine.api.get_today().steps == 2500);
}

void test_auto_deploy_covers_missed_days() {
  const auto dir = temp_dir("auto-deploy");
  seed_rows(dir, {day_row(days_before(kToday, 4), 12000), day_row(days_before(kToday, 3), 12000)});

  Engine engine;
  assert(start_engine(engine, dir, days_before(kToday, 2)).ok);
  assert(engine.api.get_streak().current_streak == 2);

  engine.clock->set(kToday);
  stride::MissedDayResult missed;
  stride::ReconcileReport report;
  assert(engine.api.on_foreground(missed, report).ok);
  assert(missed.shields_deployed == 2);
  assert(!missed.streak_broken);
  assert(engine.api.get_streak().current_streak == 4);
  assert(engine.api.get_shields().total_available() == 0);
  assert(engine.api.classify_day(days_before(kToday, 1)) == stride::streak::DayClass::Shielded);
  assert(engine.api.classify_day(days_before(kToday, 2)) == stride::streak::DayClass::Shielded);

  // A gap wider than the bank breaks the streak without spending anything.
  const auto wide = temp_dir("auto-deploy-wide");
  seed_rows(wide, {day_row(days_before(kToday, 5), 12000), day_row(days_before(kToday, 4), 12000)});
  Engine second;
  assert(start_engine(second, wide, days_before(kToday, 3)).ok);
  assert(second.api.get_streak().current_streak == 2);
  second.clock->set(kToday);
  assert(second.api.deploy_for_missed_days(missed).ok);
  assert(missed.streak_broken);
  assert(missed.shields_deployed == 0);
  assert(!missed.legacy_badge.has_value());
  const stride::StreakState streak = second.api.get_streak();
  assert(streak.current_streak == 0);
  assert(streak.longest_streak == 2);
  assert(second.api.get_shields().recurring_available == 2);
}

void test_auto_deploy_precedes_first_recompute_of_the_day() {
  const auto dir = temp_dir("deploy-after-refresh");
  seed_rows(dir, {day_row(days_before(kToday, 4), 12000), day_row(days_before(kToday, 3), 12000)});
  Engine engine;
  assert(start_engine(engine, dir, days_before(kToday, 2)).ok);
  assert(engine.api.get_streak().current_streak == 2);

  // A background refresh just after midnight runs before the app is opened.
  engine.clock->set(kToday, 1);
  stride::ReconcileReport report;
  assert(engine.api.on_background_refresh(report).ok);
  assert(engine.api.get_streak().current_streak == 4);
  assert(engine.api.get_shields().total_available() == 0);

  stride::MissedDayResult missed;
  assert(engine.api.on_foreground(missed, report).ok);
  assert(missed.shields_deployed == 2);
  assert(!missed.streak_broken);
  assert(engine.api.get_streak().current_streak == 4);
  assert(engine.api.on_foreground(missed, report).ok);
  assert(missed.shields_deployed == 0);

  // Same with a live write as the first call of the day.
  const auto live = temp_dir("deploy-after-live-write");
  seed_rows(live, {day_row(days_before(kToday, 4), 12000), day_row(days_before(kToday, 3), 12000)});
  Engine second;
  assert(start_engine(second, live, days_before(kToday, 2)).ok);
  second.clock->set(kToday, 7);
  assert(second.api.record_observations(kToday, {observation("phone_motion", kToday, 6, 7, 800)}).ok);
  assert(second.api.get_streak().current_streak == 4);
  assert(second.api.deploy_for_missed_days(missed).ok);
  assert(missed.shields_deployed == 2);
  assert(second.api.classify_day(days_before(kToday, 2)) == stride::streak::DayClass::Shielded);
}

void test_milestones_fire_once_across_decline_and_repair() {
  stride::EngineConfig config;
  config.shield_policy.repair_lookback_days = 14;

  const auto dir = temp_dir("milestone-decline");
  std::vector<stride::DailyLog> rows = {day_row(days_before(kToday, 10), 0)};
  for (int back = 9; back >= 1; --back) {
    rows.push_back(day_row(days_before(kToday, back), 11000));
  }
  seed_rows(dir, rows);

  Engine engine;
  assert(start_engine(engine, dir, kToday, config).ok);
  assert(engine.api.get_streak().current_streak == 9);
  std::optional<int> milestone;
  assert(engine.api.consume_milestone(milestone).ok);
  assert(milestone == 7);

  assert(engine.api.decline_repair(days_before(kToday, 10)).ok);
  assert(engine.api.get_streak().current_streak == 9);
  assert(engine.api.consume_milestone(milestone).ok);
  assert(!milestone.has_value());

  // Repair joins an older run; only a milestone above the fired one may follow.
  const auto repair_dir = temp_dir("milestone-repair");
  std::vector<stride::DailyLog> joined = {day_row(days_before(kToday, 13), 11000),
                                          day_row(days_before(kToday, 12), 11000),
                                          day_row(days_before(kToday, 11), 11000)};
  joined.insert(joined.end(), rows.begin(), rows.end());
  seed_rows(repair_dir, joined);

  Engine repaired;
  assert(start_engine(repaired, repair_dir, kToday, config).ok);
  assert(repaired.api.consume_milestone(milestone).ok);
  assert(milestone == 7);
  assert(repaired.api.request_repair(days_before(kToday, 10)).ok);
  assert(repaired.api.get_streak().current_streak == 13);
  assert(repaired.api.consume_milestone(milestone).ok);
  assert(!milestone.has_value());
}

void test_decline_repair_awards_legacy_badge() {
  const auto dir = temp_dir("decline");
  std::vector<stride::DailyLog> rows;
  for (int back = 33; back >= 2; --back) {
    rows.push_back(day_row(days_before(kToday, back), 10000));
  }
  rows.push_back(day_row(days_before(kToday, 1), 0));
  seed_rows(dir, rows);

  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);
  assert(engine.api.get_streak().longest_streak == 32);

  std::optional<int> badge;
  assert(engine.api.decline_repair(days_before(kToday, 1), badge).ok);
  assert(badge == 30);
  const auto declined = engine.api.load_daily_log(days_before(kToday, 1));
  assert(declined.has_value() && declined->repair_declined);
  assert(engine.api.request_repair(days_before(kToday, 1)).is(stride::ErrorKind::RepairIneligible));
  const stride::StreakState streak = engine.api.get_streak();
  assert(streak.current_streak == 0);
  assert(streak.longest_streak == 32);
  assert(engine.api.get_shields().recurring_available == 2);
}

void test_apply_remote_records() {
  const auto dir = temp_dir("remote");
  seed_rows(dir, {day_row(days_before(kToday, 2), 4000)});
  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);

  stride::RemoteSnapshot snapshot;
  stride::DailyLog synced = day_row(days_before(kToday, 2), 11000);
  synced.session_ids = {"remote-1"};
  snapshot.daily_logs.push_back(synced);
  snapshot.daily_logs.push_back(day_row(days_before(kToday, 1), 10200));
  stride::DailyLog negative = day_row(days_before(kToday, 3), 0);
  negative.steps = -5;
  snapshot.daily_logs.push_back(negative);
  snapshot.daily_logs.push_back(day_row(stride::calendar::add_days(kToday, 2), 100));
  stride::ShieldInventory remote_shields;
  remote_shields.recurring_available = 2;
  remote_shields.purchased_available = 3;
  remote_shields.purchased_lifetime = 3;
  remote_shields.last_refill_period = stride::GrantPeriod{2026, 3};
  snapshot.shields = remote_shields;

  const std::size_t anomalies_before = engine.api.health_report().anomaly_count;
  assert(engine.api.apply_remote_records(snapshot).ok);
  const auto merged = engine.api.load_daily_log(days_before(kToday, 2));
  assert(merged.has_value());
  assert(merged->steps == 11000);
  assert(merged->goal_met);
  assert(engine.api.load_daily_log(days_before(kToday, 1)).has_value());
  assert(!engine.api.load_daily_log(days_before(kToday, 3)).has_value());
  assert(!engine.api.load_daily_log(stride::calendar::add_days(kToday, 2)).has_value());
  assert(engine.api.get_shields().purchased_available == 3);
  assert(engine.api.get_streak().current_streak == 2);
  assert(engine.api.health_report().anomaly_count == anomalies_before + 2);

  // Applying the same snapshot again changes nothing.
  assert(engine.api.apply_remote_records(snapshot).ok);
  assert(engine.api.get_shields().purchased_available == 3);
  assert(engine.api.load_daily_log(days_before(kToday, 2))->steps == 11000);
}

void test_change_feed_and_concurrent_updates() {
  const auto dir = temp_dir("feed");
  Engine engine;
  assert(start_engine(engine, dir, kToday).ok);

  std::vector<stride::ChangeEvent> events;
  const std::uint64_t id = engine.api.subscribe([&](const stride::ChangeEvent& event) { events.push_back(event); });
  assert(engine.api.record_observations(kToday, {observation("health_store", kToday, 9, 10, 500)}).ok);
  assert(std::ranges::any_of(events, [](const stride::ChangeEvent& event) {
    return event.aggregate == stride::AggregateKind::DailyLog && event.day == kToday;
  }));
  assert(engine.api.unsubscribe(id));
  assert(!engine.api.unsubscribe(id));
  const std::size_t seen = events.size();
  assert(engine.api.purchase_shields(1).ok);
  assert(events.size() == seen);

  std::vector<std::thread> workers;
  for (int worker = 0; worker < 4; ++worker) {
    workers.emplace_back([&engine, worker] {
      for (int i = 0; i < 25; ++i) {
        const stride::Result recorded = engine.api.record_observations(
            kToday, {observation("health_store", kToday, 9, 10, worker * 1000 + i)});
        assert(recorded.ok);
      }
    });
  }
  workers.emplace_back([&engine] {
    for (int i = 0; i < 10; ++i) {
      const stride::Result purchased = engine.api.purchase_shields(1);
      assert(purchased.ok);
    }
  });
  for (auto& worker : workers) {
    worker.join();
  }
  assert(engine.api.get_today().steps == 3024);
  assert(engine.api.get_shields().purchased_available == 11);
  assert(engine.api.health_report().healthy);
}

}  // namespace

int main() {
  test_calendar_and_periods();
  test_merge_idempotent_and_order_free();
  test_merge_precedence_and_clipping();
  test_merge_same_provider_overlaps();
  test_day_window_across_offset_changes();
  test_high_water_mark_ratchet();
  test_shield_grants_and_consumption();
  test_repair_eligibility();
  test_streak_engine_rules();
  test_record_merge_rules();
  test_store_round_trip_and_journal_replay();
  test_store_quarantines_corruption();
  test_store_rolls_forward_interrupted_batch();
  test_store_rejects_out_of_range_counters();
  test_engine_config_file();
  test_file_step_source();
  test_scheduler_windows();
  test_streak_continuity_with_open_day();
  test_streak_break_and_shield_repair();
  test_seven_day_repair_scenario();
  test_historical_goal_freeze();
  test_live_updates_and_reconciliation_never_regress();
  test_reconcile_deferral_and_cancellation();
  test_scheduled_reconcile_throttle();
  test_auto_deploy_covers_missed_days();
  test_auto_deploy_precedes_first_recompute_of_the_day();
  test_milestones_fire_once_across_decline_and_repair();
  test_decline_repair_awards_legacy_badge();
  test_apply_remote_records();
  test_change_feed_and_concurrent_updates();

  std::cout << "stride_core_tests passed\n";
  return 0;
}
