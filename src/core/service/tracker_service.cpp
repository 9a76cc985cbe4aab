#include "core/service/tracker_service.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include "core/model/invariants.hpp"
#include "core/shield/shield_engine.hpp"
#include "core/sync/record_merge.hpp"

namespace stride {
namespace {

void add_sessions(DailyLog& log, const std::vector<StepObservation>& observations) {
  for (const auto& observation : observations) {
    const std::string& id = observation.session_id;
    if (id.empty() || id.find_first_of(",\n\r\t") != std::string::npos) {
      continue;
    }
    if (std::ranges::find(log.session_ids, id) == log.session_ids.end()) {
      log.session_ids.push_back(id);
    }
  }
  std::ranges::sort(log.session_ids);
}

void replace_row(std::vector<DailyLog>& snapshot, const DailyLog& row) {
  const auto it = std::ranges::find_if(snapshot, [&](const DailyLog& log) { return log.date == row.date; });
  if (it == snapshot.end()) {
    snapshot.push_back(row);
  } else {
    *it = row;
  }
}

std::string day_text(CivilDay day) {
  return calendar::format_day(day);
}

void absorb(MissedDayResult& into, const MissedDayResult& from) {
  into.shields_deployed += from.shields_deployed;
  into.streak_broken = into.streak_broken || from.streak_broken;
  if (from.legacy_badge) {
    into.legacy_badge = from.legacy_badge;
  }
}

}  // namespace

TrackerService::TrackerService(EngineConfig config, IPersistence& store, IStepSource& source,
                               const IClock& clock, ITierProvider& tiers)
    : config_(std::move(config)),
      store_(store),
      source_(source),
      clock_(clock),
      tiers_(tiers),
      merger_(ProviderPrecedence{config_.provider_precedence}),
      scheduler_(config_.reconcile_policy) {}

CivilDay TrackerService::today() const {
  return calendar::today(clock_);
}

Result TrackerService::ensure_started() const {
  if (!started_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Tracker service has not been started.");
  }
  return Result::success();
}

Result TrackerService::start() {
  std::vector<DailyLog> logs;
  if (const Result loaded = store_.load_all_daily_logs(logs); !loaded.ok) {
    return loaded;
  }
  for (const auto& log : logs) {
    marks_.seed(log.date, log.steps, log.state);
  }

  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }
      if (const Result refilled = refill_locked(current, events); !refilled.ok) {
        return refilled;
      }
      return recompute_streak_locked(current, events);
    }();
  }
  feed_.publish(events);
  if (!outcome.ok) {
    return outcome;
  }

  started_ = true;
  return Result::success("Tracker started for " + day_text(current) + " with " +
                         std::to_string(logs.size()) + " day record(s).");
}

Result TrackerService::roll_forward() {
  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }
      if (const Result refilled = refill_locked(current, events); !refilled.ok) {
        return refilled;
      }
      return recompute_streak_locked(current, events);
    }();
  }
  feed_.publish(events);
  return outcome;
}

Result TrackerService::roll_over_locked(CivilDay today, std::vector<ChangeEvent>& events) {
  if (rolled_over_through_ && *rolled_over_through_ == today) {
    return Result::success();
  }

  std::vector<DailyLog> logs;
  const CivilDay earliest{std::numeric_limits<std::int32_t>::min() / 2};
  if (const Result loaded = store_.load_daily_logs(earliest, calendar::add_days(today, -1), logs); !loaded.ok) {
    return loaded;
  }

  StoreBatch batch;
  for (auto& log : logs) {
    if (log.state != DayState::Open) {
      continue;
    }
    log.state = DayState::Finalized;
    log.goal_met = log.goal_met || log.steps >= log.goal_target;
    batch.daily_logs.push_back(log);
  }
  if (!batch.empty()) {
    if (const Result committed = store_.commit(batch); !committed.ok) {
      return committed;
    }
    for (const auto& log : batch.daily_logs) {
      events.push_back(ChangeEvent{AggregateKind::DailyLog, log.date});
    }
  }

  marks_.roll_over(today);
  marks_.forget_before(calendar::add_days(today, -std::max(config_.reconcile_policy.max_window_days, 1)));

  if (config_.shield_policy.auto_deploy_missed_days) {
    if (const Result refilled = refill_locked(today, events); !refilled.ok) {
      return refilled;
    }
    MissedDayResult missed;
    if (const Result deployed = deploy_for_missed_days_locked(today, missed, events); !deployed.ok) {
      return deployed;
    }
    absorb(rolled_over_deployment_, missed);
  }
  rolled_over_through_ = today;
  return Result::success();
}

Result TrackerService::refill_locked(CivilDay today, std::vector<ChangeEvent>& events) {
  ShieldInventory inventory;
  if (const Result loaded = store_.load_shields(inventory); !loaded.ok) {
    return loaded;
  }
  if (!shield::refill_check(inventory, today, tiers_.allowance())) {
    return Result::success();
  }

  StoreBatch batch;
  batch.shields = inventory;
  if (const Result committed = store_.commit(batch); !committed.ok) {
    return committed;
  }
  events.push_back(ChangeEvent{AggregateKind::Shields, std::nullopt});
  return Result::success();
}

Result TrackerService::compute_streak_locked(CivilDay today, const std::vector<DailyLog>& snapshot,
                                             StreakState& out) const {
  StreakState previous;
  if (const Result loaded = store_.load_streak(previous); !loaded.ok) {
    return loaded;
  }
  out = streak::recompute(snapshot, previous, today, today);
  return Result::success();
}

Result TrackerService::recompute_streak_locked(CivilDay today, std::vector<ChangeEvent>& events) {
  std::vector<DailyLog> snapshot;
  if (const Result loaded = store_.load_all_daily_logs(snapshot); !loaded.ok) {
    return loaded;
  }
  StreakState previous;
  if (const Result loaded = store_.load_streak(previous); !loaded.ok) {
    return loaded;
  }

  const StreakState next = streak::recompute(snapshot, previous, today, today);
  if (next == previous) {
    return Result::success();
  }

  StoreBatch batch;
  batch.streak = next;
  if (const Result committed = store_.commit(batch); !committed.ok) {
    return committed;
  }
  events.push_back(ChangeEvent{AggregateKind::Streak, std::nullopt});
  return Result::success();
}

std::int64_t TrackerService::goal_for_locked(CivilDay day) const {
  std::vector<GoalChange> history;
  if (const Result loaded = store_.load_goal_history(history); !loaded.ok || history.empty()) {
    return config_.default_daily_goal;
  }

  std::int64_t goal = config_.default_daily_goal;
  for (const auto& change : history) {
    if (change.effective_from > day) {
      break;
    }
    goal = change.goal;
  }
  return goal;
}

DailyLog TrackerService::new_row_locked(CivilDay day, CivilDay today) const {
  DailyLog row;
  row.date = day;
  row.goal_target = goal_for_locked(day);
  row.state = day < today ? DayState::Finalized : DayState::Open;
  return row;
}

void TrackerService::note_dropped_observations(CivilDay day, const MergeReport& merged) {
  if (merged.dropped_malformed == 0) {
    return;
  }
  store_.record_anomaly("observations:" + day_text(day),
                        "Dropped " + std::to_string(merged.dropped_malformed) +
                            " malformed observation(s).");
}

Result TrackerService::record_observations(CivilDay day,
                                           const std::vector<StepObservation>& observations) {
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }
  const CivilDay current = today();
  if (day > current) {
    return Result::failure(ErrorKind::InvalidArgument, "Observations for a future day were rejected.");
  }

  const calendar::LocalDayBounds bounds = calendar::local_day_bounds(clock_, day);
  const MergeReport merged = merger_.merge(observations, bounds.start, bounds.end);
  note_dropped_observations(day, merged);

  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }
      if (day < current) {
        return Result::failure(ErrorKind::InvalidArgument,
                               "Day " + day_text(day) +
                                   " is finalized; late data arrives through reconciliation.");
      }

      std::optional<DailyLog> existing;
      if (const Result loaded = store_.load_daily_log(day, existing); !loaded.ok) {
        return loaded;
      }
      DailyLog row = existing.value_or(new_row_locked(day, current));
      marks_.seed(day, row.steps, row.state);
      row.steps = std::max(row.steps, marks_.accept(day, merged.steps));
      row.goal_met = row.goal_met || row.steps >= row.goal_target;
      add_sessions(row, observations);
      if (existing && *existing == row) {
        return Result::success("No change for " + day_text(day) + ".");
      }

      StoreBatch batch;
      batch.daily_logs.push_back(row);
      if (const Result committed = store_.commit(batch); !committed.ok) {
        return committed;
      }
      events.push_back(ChangeEvent{AggregateKind::DailyLog, day});
      if (const Result recomputed = recompute_streak_locked(current, events); !recomputed.ok) {
        return recomputed;
      }
      return Result::success("Recorded " + std::to_string(row.steps) + " steps for " +
                             day_text(day) + ".");
    }();
  }
  feed_.publish(events);
  return outcome;
}

Result TrackerService::refresh_today() {
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }
  const CivilDay current = today();
  std::vector<StepObservation> observations;
  if (const Result fetched = source_.fetch_observations(current, observations); !fetched.ok) {
    return fetched;
  }
  return record_observations(current, observations);
}

Result TrackerService::set_daily_goal(std::int64_t goal) {
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }
  if (goal <= 0) {
    return Result::failure(ErrorKind::InvalidArgument, "Daily goal must be positive.");
  }

  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }

      std::vector<GoalChange> history;
      if (const Result loaded = store_.load_goal_history(history); !loaded.ok) {
        return loaded;
      }
      if (!history.empty() && history.back().effective_from > current) {
        return Result::failure(ErrorKind::InvalidArgument,
                               "Goal history already has a change after today.");
      }
      if (!history.empty() && history.back().effective_from == current) {
        history.back().goal = goal;
      } else if (!history.empty() && history.back().goal == goal) {
        return Result::success("Daily goal unchanged.");
      } else {
        history.push_back(GoalChange{current, goal});
      }

      StoreBatch batch;
      batch.goal_history = history;
      std::optional<DailyLog> today_row;
      if (const Result loaded = store_.load_daily_log(current, today_row); !loaded.ok) {
        return loaded;
      }
      if (today_row && today_row->state == DayState::Open) {
        today_row->goal_target = goal;
        today_row->goal_met = today_row->steps >= goal;
        batch.daily_logs.push_back(*today_row);
      }
      if (const Result committed = store_.commit(batch); !committed.ok) {
        return committed;
      }

      events.push_back(ChangeEvent{AggregateKind::Goal, current});
      if (!batch.daily_logs.empty()) {
        events.push_back(ChangeEvent{AggregateKind::DailyLog, current});
      }
      if (const Result recomputed = recompute_streak_locked(current, events); !recomputed.ok) {
        return recomputed;
      }
      return Result::success("Daily goal set to " + std::to_string(goal) + " from " +
                             day_text(current) + ".");
    }();
  }
  feed_.publish(events);
  return outcome;
}

Result TrackerService::request_repair(CivilDay day) {
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }
      if (const Result refilled = refill_locked(current, events); !refilled.ok) {
        return refilled;
      }

      std::optional<DailyLog> existing;
      if (const Result loaded = store_.load_daily_log(day, existing); !loaded.ok) {
        return loaded;
      }
      if (const Result eligible = shield::check_repair_eligibility(
              day, current, existing, config_.shield_policy.repair_lookback_days);
          !eligible.ok) {
        return eligible;
      }

      ShieldInventory inventory;
      if (const Result loaded = store_.load_shields(inventory); !loaded.ok) {
        return loaded;
      }
      if (const Result consumed = shield::consume(inventory, config_.shield_policy.consumption_order);
          !consumed.ok) {
        return consumed;
      }

      DailyLog row = existing.value_or(new_row_locked(day, current));
      row.shield_used = true;

      std::vector<DailyLog> snapshot;
      if (const Result loaded = store_.load_all_daily_logs(snapshot); !loaded.ok) {
        return loaded;
      }
      replace_row(snapshot, row);
      StreakState streak_state;
      if (const Result computed = compute_streak_locked(current, snapshot, streak_state); !computed.ok) {
        return computed;
      }

      StoreBatch batch;
      batch.daily_logs.push_back(row);
      batch.shields = inventory;
      batch.streak = streak_state;
      if (const Result committed = store_.commit(batch); !committed.ok) {
        return committed;
      }

      events.push_back(ChangeEvent{AggregateKind::DailyLog, day});
      events.push_back(ChangeEvent{AggregateKind::Shields, std::nullopt});
      events.push_back(ChangeEvent{AggregateKind::Streak, std::nullopt});
      return Result::success("Repaired " + day_text(day) + "; " +
                             std::to_string(inventory.total_available()) + " shield(s) left.");
    }();
  }
  feed_.publish(events);
  return outcome;
}

Result TrackerService::decline_repair(CivilDay day) {
  std::optional<int> legacy_badge;
  return decline_repair(day, legacy_badge);
}

Result TrackerService::decline_repair(CivilDay day, std::optional<int>& legacy_badge) {
  legacy_badge.reset();
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }

      std::optional<DailyLog> existing;
      if (const Result loaded = store_.load_daily_log(day, existing); !loaded.ok) {
        return loaded;
      }
      if (const Result eligible = shield::check_repair_eligibility(
              day, current, existing, config_.shield_policy.repair_lookback_days);
          !eligible.ok) {
        return eligible;
      }

      DailyLog row = existing.value_or(new_row_locked(day, current));
      row.repair_declined = true;

      std::vector<DailyLog> snapshot;
      if (const Result loaded = store_.load_all_daily_logs(snapshot); !loaded.ok) {
        return loaded;
      }
      replace_row(snapshot, row);

      StreakState state;
      if (const Result loaded = store_.load_streak(state); !loaded.ok) {
        return loaded;
      }
      const int broken_run = std::max(state.current_streak,
                                      streak::run_length_ending(snapshot, calendar::add_days(day, -1)));
      legacy_badge = streak::legacy_badge_for(broken_run);
      streak::break_streak(state);
      state = streak::recompute(snapshot, state, current, current);

      StoreBatch batch;
      batch.daily_logs.push_back(row);
      batch.streak = state;
      if (const Result committed = store_.commit(batch); !committed.ok) {
        legacy_badge.reset();
        return committed;
      }

      events.push_back(ChangeEvent{AggregateKind::DailyLog, day});
      events.push_back(ChangeEvent{AggregateKind::Streak, std::nullopt});
      std::string message = "Repair of " + day_text(day) + " declined; streak broken.";
      if (legacy_badge) {
        message += " Legacy badge earned: " + std::to_string(*legacy_badge) + " days.";
      }
      return Result::success(std::move(message));
    }();
  }
  feed_.publish(events);
  return outcome;
}

Result TrackerService::deploy_for_missed_days(MissedDayResult& out) {
  out = MissedDayResult{};
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }
      if (const Result refilled = refill_locked(current, events); !refilled.ok) {
        return refilled;
      }
      out = std::exchange(rolled_over_deployment_, MissedDayResult{});
      MissedDayResult missed;
      if (const Result deployed = deploy_for_missed_days_locked(current, missed, events); !deployed.ok) {
        return deployed;
      }
      absorb(out, missed);
      return recompute_streak_locked(current, events);
    }();
  }
  feed_.publish(events);
  if (!outcome.ok) {
    return outcome;
  }
  return Result::success("Deployed " + std::to_string(out.shields_deployed) + " shield(s)" +
                         (out.streak_broken ? "; streak broken." : "."));
}

Result TrackerService::deploy_for_missed_days_locked(CivilDay today, MissedDayResult& out,
                                                     std::vector<ChangeEvent>& events) {
  out = MissedDayResult{};
  StreakState state;
  if (const Result loaded = store_.load_streak(state); !loaded.ok) {
    return loaded;
  }
  if (state.current_streak <= 0 || !state.last_goal_met_date) {
    return Result::success("No streak to protect.");
  }
  const CivilDay yesterday = calendar::add_days(today, -1);
  if (*state.last_goal_met_date >= yesterday) {
    return Result::success("No missed days.");
  }

  ShieldInventory inventory;
  if (const Result loaded = store_.load_shields(inventory); !loaded.ok) {
    return loaded;
  }

  // The gap is covered whole or not at all; a partial cover would still break the streak.
  std::vector<DailyLog> uncovered;
  for (CivilDay day = calendar::add_days(*state.last_goal_met_date, 1); day <= yesterday;
       day = calendar::add_days(day, 1)) {
    std::optional<DailyLog> row;
    if (const Result loaded = store_.load_daily_log(day, row); !loaded.ok) {
      return loaded;
    }
    if (row && row->counts_for_streak()) {
      continue;
    }
    if (row && row->repair_declined) {
      out.streak_broken = true;
      break;
    }
    uncovered.push_back(row.value_or(new_row_locked(day, today)));
  }
  if (static_cast<std::int64_t>(uncovered.size()) > inventory.total_available()) {
    out.streak_broken = true;
  }

  StoreBatch batch;
  if (!out.streak_broken) {
    for (auto& row : uncovered) {
      if (const Result consumed = shield::consume(inventory, config_.shield_policy.consumption_order);
          !consumed.ok) {
        return consumed;
      }
      row.shield_used = true;
      batch.daily_logs.push_back(row);
      ++out.shields_deployed;
    }
  }

  std::vector<DailyLog> snapshot;
  if (const Result loaded = store_.load_all_daily_logs(snapshot); !loaded.ok) {
    return loaded;
  }
  for (const auto& row : batch.daily_logs) {
    replace_row(snapshot, row);
  }
  if (out.streak_broken) {
    out.legacy_badge = streak::break_streak(state);
  }
  state = streak::recompute(snapshot, state, today, today);

  if (out.shields_deployed > 0) {
    batch.shields = inventory;
  }
  batch.streak = state;
  if (const Result committed = store_.commit(batch); !committed.ok) {
    out = MissedDayResult{};
    return committed;
  }

  for (const auto& row : batch.daily_logs) {
    events.push_back(ChangeEvent{AggregateKind::DailyLog, row.date});
  }
  if (batch.shields) {
    events.push_back(ChangeEvent{AggregateKind::Shields, std::nullopt});
  }
  events.push_back(ChangeEvent{AggregateKind::Streak, std::nullopt});
  return Result::success();
}

Result TrackerService::purchase_shields(std::int64_t count) {
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::lock_guard lock(shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result refilled = refill_locked(current, events); !refilled.ok) {
        return refilled;
      }
      ShieldInventory inventory;
      if (const Result loaded = store_.load_shields(inventory); !loaded.ok) {
        return loaded;
      }
      const Result purchased = shield::purchase(inventory, count);
      if (!purchased.ok) {
        return purchased;
      }

      StoreBatch batch;
      batch.shields = inventory;
      if (const Result committed = store_.commit(batch); !committed.ok) {
        return committed;
      }
      events.push_back(ChangeEvent{AggregateKind::Shields, std::nullopt});
      return purchased;
    }();
  }
  feed_.publish(events);
  return outcome;
}

Result TrackerService::consume_milestone(std::optional<int>& out) {
  out.reset();
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::lock_guard lock(streak_mutex_);
    outcome = [&]() -> Result {
      StreakState state;
      if (const Result loaded = store_.load_streak(state); !loaded.ok) {
        return loaded;
      }
      const std::optional<int> pending = streak::consume_milestone(state);
      if (!pending) {
        return Result::success("No milestone pending.");
      }

      StoreBatch batch;
      batch.streak = state;
      if (const Result committed = store_.commit(batch); !committed.ok) {
        return committed;
      }
      out = pending;
      events.push_back(ChangeEvent{AggregateKind::Streak, std::nullopt});
      return Result::success("Milestone " + std::to_string(*pending) + " consumed.");
    }();
  }
  feed_.publish(events);
  return outcome;
}

Result TrackerService::apply_reconciled_day_locked(CivilDay day, CivilDay today,
                                                   const MergeReport& merged,
                                                   const std::vector<StepObservation>& observations,
                                                   bool& changed) {
  changed = false;
  std::optional<DailyLog> existing;
  if (const Result loaded = store_.load_daily_log(day, existing); !loaded.ok) {
    return loaded;
  }
  if (existing) {
    marks_.seed(day, existing->steps, existing->state);
  } else if (merged.accepted == 0) {
    return Result::success();
  }

  const bool open_day = day >= today;
  const std::int64_t ratcheted =
      open_day ? marks_.accept(day, merged.steps) : marks_.accept_correction(day, merged.steps);

  DailyLog row = existing.value_or(new_row_locked(day, today));
  if (existing && ratcheted <= row.steps && row.state == DayState::Finalized) {
    return Result::success();
  }
  row.steps = std::max(row.steps, ratcheted);
  row.goal_met = row.goal_met || row.steps >= row.goal_target;
  add_sessions(row, observations);
  if (existing && *existing == row) {
    return Result::success();
  }

  StoreBatch batch;
  batch.daily_logs.push_back(row);
  if (const Result committed = store_.commit(batch); !committed.ok) {
    return committed;
  }
  changed = true;
  return Result::success();
}

Result TrackerService::reconcile(DayWindow window, const CancellationToken* cancel,
                                 ReconcileReport& out) {
  out = ReconcileReport{};
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  const CivilDay current = today();
  const std::optional<DayWindow> clamped = scheduler_.clamp_window(window, current);
  if (!clamped) {
    return Result::failure(ErrorKind::InvalidArgument, "Reconciliation window is empty.");
  }

  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = roll_over_locked(current, events);
  }

  std::size_t fetch_failures = 0;
  for (CivilDay day = clamped->first; outcome.ok && day <= clamped->last;
       day = calendar::add_days(day, 1)) {
    if (cancel != nullptr && cancel->requested()) {
      out.cancelled = true;
      break;
    }
    ++out.days_visited;

    std::vector<StepObservation> observations;
    if (const Result fetched = source_.fetch_observations(day, observations); !fetched.ok) {
      ++fetch_failures;
      out.failed_days.push_back(day);
      continue;
    }
    const calendar::LocalDayBounds bounds = calendar::local_day_bounds(clock_, day);
    const MergeReport merged = merger_.merge(observations, bounds.start, bounds.end);
    note_dropped_observations(day, merged);

    bool changed = false;
    {
      std::lock_guard lock(ledger_mutex_);
      outcome = apply_reconciled_day_locked(day, current, merged, observations, changed);
    }
    if (!outcome.ok) {
      out.failed_days.push_back(day);
      break;
    }
    if (changed) {
      out.changed_days.push_back(day);
      events.push_back(ChangeEvent{AggregateKind::DailyLog, day});
    }
  }
  out.deferred = out.days_visited > 0 && fetch_failures == out.days_visited;

  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_);
    const Result recomputed = recompute_streak_locked(current, events);
    if (outcome.ok) {
      outcome = recomputed;
    }
  }
  feed_.publish(events);

  if (!outcome.ok) {
    return outcome;
  }
  if (out.deferred) {
    return Result::failure(ErrorKind::ObservationFetchFailure,
                           "Observation source unavailable; reconciliation deferred.");
  }
  if (out.cancelled) {
    return Result::failure(ErrorKind::Cancelled, "Reconciliation cancelled after " +
                                                     std::to_string(out.days_visited) + " day(s).");
  }
  scheduler_.mark_completed(clock_.now_unix());
  return Result::success("Reconciled " + std::to_string(out.days_visited) + " day(s): " +
                         std::to_string(out.changed_days.size()) + " changed, " +
                         std::to_string(out.failed_days.size()) + " failed.");
}

Result TrackerService::run_scheduled_reconcile(ReconcileTrigger trigger,
                                               const CancellationToken* cancel,
                                               ReconcileReport& out) {
  out = ReconcileReport{};
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }
  if (!scheduler_.should_run(clock_.now_unix(), trigger)) {
    return Result::failure(ErrorKind::Throttled, "Reconciliation throttled for " +
                                                     std::string{trigger_name(trigger)} +
                                                     " trigger.");
  }
  return reconcile(scheduler_.default_window(today(), tiers_.allowance()), cancel, out);
}

Result TrackerService::on_foreground(MissedDayResult& missed, ReconcileReport& report) {
  missed = MissedDayResult{};
  report = ReconcileReport{};
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  if (config_.shield_policy.auto_deploy_missed_days) {
    if (const Result deployed = deploy_for_missed_days(missed); !deployed.ok) {
      return deployed;
    }
  } else if (const Result rolled = roll_forward(); !rolled.ok) {
    return rolled;
  }

  std::string message = "Foreground: " + std::to_string(missed.shields_deployed) + " shield(s) deployed";
  const Result refreshed = refresh_today();
  if (!refreshed.ok && !refreshed.is(ErrorKind::ObservationFetchFailure)) {
    return refreshed;
  }
  message += refreshed.ok ? "; today refreshed" : "; today stale (" + refreshed.message + ")";

  const Result reconciled = run_scheduled_reconcile(ReconcileTrigger::Foreground, nullptr, report);
  if (!reconciled.ok && !reconciled.is(ErrorKind::Throttled) &&
      !reconciled.is(ErrorKind::ObservationFetchFailure)) {
    return reconciled;
  }
  message += "; " + reconciled.message;
  return Result::success(std::move(message));
}

Result TrackerService::on_background_refresh(ReconcileReport& report) {
  report = ReconcileReport{};
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }
  if (const Result rolled = roll_forward(); !rolled.ok) {
    return rolled;
  }
  return run_scheduled_reconcile(ReconcileTrigger::BackgroundRefresh, nullptr, report);
}

Result TrackerService::apply_remote_records(const RemoteSnapshot& snapshot) {
  if (const Result ready = ensure_started(); !ready.ok) {
    return ready;
  }

  const CivilDay current = today();
  std::vector<ChangeEvent> events;
  Result outcome = Result::success();
  {
    std::scoped_lock lock(ledger_mutex_, streak_mutex_, shield_mutex_);
    outcome = [&]() -> Result {
      if (const Result rolled = roll_over_locked(current, events); !rolled.ok) {
        return rolled;
      }

      StoreBatch batch;
      std::size_t rejected = 0;
      for (const auto& remote : snapshot.daily_logs) {
        if (const Result valid = validate_daily_log(remote); !valid.ok) {
          store_.record_anomaly("remote:" + day_text(remote.date), valid.message);
          ++rejected;
          continue;
        }
        if (remote.date > current) {
          store_.record_anomaly("remote:" + day_text(remote.date), "Remote row is dated in the future.");
          ++rejected;
          continue;
        }

        std::optional<DailyLog> existing;
        if (const Result loaded = store_.load_daily_log(remote.date, existing); !loaded.ok) {
          return loaded;
        }
        DailyLog merged = existing ? sync::merge_daily_log(*existing, remote) : remote;
        if (merged.date < current && merged.state == DayState::Open) {
          merged.state = DayState::Finalized;
          merged.goal_met = merged.goal_met || merged.steps >= merged.goal_target;
        }
        if (!existing || *existing != merged) {
          batch.daily_logs.push_back(merged);
        }
      }

      ShieldInventory local_shields;
      if (const Result loaded = store_.load_shields(local_shields); !loaded.ok) {
        return loaded;
      }
      if (snapshot.shields) {
        if (const Result valid = validate_shield_inventory(*snapshot.shields); !valid.ok) {
          store_.record_anomaly("remote:shields", valid.message);
          ++rejected;
        } else {
          const ShieldInventory merged = sync::merge_shield_inventory(local_shields, *snapshot.shields);
          if (merged != local_shields) {
            batch.shields = merged;
          }
        }
      }

      StreakState local_streak;
      if (const Result loaded = store_.load_streak(local_streak); !loaded.ok) {
        return loaded;
      }
      StreakState merged_streak = local_streak;
      if (snapshot.streak) {
        if (const Result valid = validate_streak_state(*snapshot.streak); !valid.ok) {
          store_.record_anomaly("remote:streak", valid.message);
          ++rejected;
        } else {
          merged_streak = sync::merge_streak_state(local_streak, *snapshot.streak);
        }
      }

      std::vector<DailyLog> logs;
      if (const Result loaded = store_.load_all_daily_logs(logs); !loaded.ok) {
        return loaded;
      }
      for (const auto& row : batch.daily_logs) {
        replace_row(logs, row);
      }
      const StreakState recomputed = streak::recompute(logs, merged_streak, current, current);
      if (recomputed != local_streak) {
        batch.streak = recomputed;
      }

      if (!batch.empty()) {
        if (const Result committed = store_.commit(batch); !committed.ok) {
          return committed;
        }
      }
      for (const auto& row : batch.daily_logs) {
        marks_.seed(row.date, row.steps, row.state);
        events.push_back(ChangeEvent{AggregateKind::DailyLog, row.date});
      }
      if (batch.shields) {
        events.push_back(ChangeEvent{AggregateKind::Shields, std::nullopt});
      }
      if (batch.streak) {
        events.push_back(ChangeEvent{AggregateKind::Streak, std::nullopt});
      }
      return Result::success("Merged " + std::to_string(batch.daily_logs.size()) +
                             " remote day record(s), rejected " + std::to_string(rejected) + ".");
    }();
  }
  feed_.publish(events);
  return outcome;
}

std::uint64_t TrackerService::subscribe(ChangeFeed::Listener listener) {
  return feed_.subscribe(std::move(listener));
}

bool TrackerService::unsubscribe(std::uint64_t id) {
  return feed_.unsubscribe(id);
}

TodaySummary TrackerService::get_today() const {
  TodaySummary summary;
  summary.day = today();
  const std::optional<DailyLog> row = load_daily_log(summary.day);
  if (row) {
    summary.steps = row->steps;
    summary.goal = row->goal_target;
    summary.goal_met = row->goal_met;
    summary.shield_used = row->shield_used;
  } else {
    summary.goal = goal_for(summary.day);
  }
  return summary;
}

StreakState TrackerService::get_streak() const {
  StreakState state;
  if (const Result loaded = store_.load_streak(state); !loaded.ok) {
    return StreakState{};
  }
  return state;
}

ShieldInventory TrackerService::get_shields() const {
  ShieldInventory inventory;
  if (const Result loaded = store_.load_shields(inventory); !loaded.ok) {
    return ShieldInventory{};
  }
  return inventory;
}

std::optional<DailyLog> TrackerService::load_daily_log(CivilDay day) const {
  std::optional<DailyLog> row;
  if (const Result loaded = store_.load_daily_log(day, row); !loaded.ok) {
    return std::nullopt;
  }
  return row;
}

std::vector<DailyLog> TrackerService::load_daily_logs(CivilDay first, CivilDay last) const {
  std::vector<DailyLog> rows;
  if (const Result loaded = store_.load_daily_logs(first, last, rows); !loaded.ok) {
    return {};
  }
  return rows;
}

streak::DayClass TrackerService::classify_day(CivilDay day) const {
  return streak::classify_day(load_daily_log(day), day, today());
}

StreakInsights TrackerService::streak_insights() const {
  const CivilDay current = today();
  return streak::insights(get_streak(), load_daily_log(current), current,
                          calendar::local_hour_now(clock_));
}

std::int64_t TrackerService::goal_for(CivilDay day) const {
  std::lock_guard lock(ledger_mutex_);
  return goal_for_locked(day);
}

std::vector<GoalChange> TrackerService::goal_history() const {
  std::vector<GoalChange> history;
  if (const Result loaded = store_.load_goal_history(history); !loaded.ok) {
    return {};
  }
  return history;
}

bool TrackerService::can_buy_more_shields() const {
  return shield::can_buy_more(get_shields(), tiers_.allowance());
}

CivilDay TrackerService::next_refill_day() const {
  return shield::next_refill_day(today());
}

StoreHealthReport TrackerService::health_report() const {
  return store_.health_report();
}

}  // namespace stride
