#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/engine_config.hpp"
#include "core/model/app_meta.hpp"
#include "core/shield/shield_engine.hpp"
#include "core/source/step_source.hpp"
#include "core/streak/streak_engine.hpp"
#include "core/util/calendar.hpp"
#include "core/util/canonical.hpp"

namespace {

constexpr std::string_view kConfigFileName = "stride.conf";

void print_usage() {
  std::cout << stride::kAppDisplayName << " " << stride::kAppVersion << " (" << stride::kBuildRelease
            << ")\n\n";
  std::cout << "usage: stride_cli <data_dir> <command> [args]\n\n";
  std::cout << "  status                                   today, streak and shields\n";
  std::cout << "  ingest <provider> <start> <end> <steps> [session]\n";
  std::cout << "                                           append an observation and refresh today\n";
  std::cout << "  repair <YYYY-MM-DD>                      spend a shield on a missed day\n";
  std::cout << "  decline <YYYY-MM-DD>                     decline the repair and break the streak\n";
  std::cout << "  reconcile [days]                         reconcile the last N days (default: tier window)\n";
  std::cout << "  foreground                               run the foreground pass\n";
  std::cout << "  purchase <count>                         add purchased shields\n";
  std::cout << "  goal <steps>                             set the daily goal from today\n";
  std::cout << "  history [days]                           list recent day records\n";
  std::cout << "  health                                   store health report\n";
}

int report(const stride::Result& result) {
  if (!result.ok) {
    std::cerr << "error: " << result.message << '\n';
    return 1;
  }
  if (!result.message.empty()) {
    std::cout << result.message << '\n';
  }
  return 0;
}

void print_status(const stride::CoreApi& api) {
  const stride::TodaySummary today = api.get_today();
  const stride::StreakState streak = api.get_streak();
  const stride::ShieldInventory shields = api.get_shields();
  const stride::StreakInsights insights = api.streak_insights();

  std::cout << "Today " << stride::calendar::format_day(today.day) << ": " << today.steps << " / "
            << today.goal << " steps" << (today.goal_met ? " (goal met)" : "")
            << (today.shield_used ? " (shielded)" : "") << '\n';
  std::cout << "Streak: " << streak.current_streak << " day(s), longest " << streak.longest_streak;
  if (insights.at_risk) {
    std::cout << " [at risk]";
  }
  std::cout << '\n';
  if (insights.next_milestone) {
    std::cout << "Next milestone: " << *insights.next_milestone << " (" << *insights.days_until_next_milestone
              << " day(s) to go)\n";
  }
  std::cout << "Weekly jackpot: " << insights.weekly_jackpot_progress << "/" << stride::streak::kJackpotCycleDays
            << (insights.weekly_jackpot_earned ? " earned" : "") << '\n';
  std::cout << "Shields: " << shields.total_available() << " (recurring " << shields.recurring_available
            << ", purchased " << shields.purchased_available << "), used this period "
            << shields.used_this_period << '\n';
  std::cout << "Next refill: " << stride::calendar::format_day(api.next_refill_day()) << '\n';
}

void print_history(const stride::CoreApi& api, int days) {
  const stride::CivilDay last = api.today();
  const stride::CivilDay first = stride::calendar::add_days(last, -(days - 1));
  for (stride::CivilDay day = first; day <= last; day = stride::calendar::add_days(day, 1)) {
    const auto log = api.load_daily_log(day);
    std::cout << stride::calendar::format_day(day) << "  "
              << stride::streak::day_class_name(api.classify_day(day));
    if (log) {
      std::cout << "  " << log->steps << "/" << log->goal_target;
      if (log->repair_declined) {
        std::cout << "  declined";
      }
    }
    std::cout << '\n';
  }
}

stride::Result append_observation(const std::string& path, const stride::StepObservation& observation) {
  std::ofstream out(path, std::ios::app);
  if (!out) {
    return stride::Result::failure(stride::ErrorKind::PersistenceFailure,
                                   "Unable to open observation file: " + path);
  }
  out << stride::format_observation_line(observation) << '\n';
  if (!out) {
    return stride::Result::failure(stride::ErrorKind::PersistenceFailure,
                                   "Unable to append to observation file: " + path);
  }
  return stride::Result::success();
}

bool parse_positive(std::string_view text, std::int64_t& out) {
  return stride::util::parse_int64(text, out) && out > 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    print_usage();
    return argc < 2 ? 0 : 1;
  }

  const std::vector<std::string> args(argv + 1, argv + argc);
  stride::EngineConfig config;
  config.data_dir = args[0];
  const std::string& command = args[1];

  std::error_code ec;
  std::filesystem::create_directories(config.data_dir, ec);
  if (ec) {
    std::cerr << "error: unable to create data dir: " << ec.message() << '\n';
    return 1;
  }

  const std::string config_path = (std::filesystem::path{config.data_dir} / kConfigFileName).string();
  if (const stride::Result loaded = stride::load_engine_config(config_path, config); !loaded.ok) {
    std::cerr << "error: " << loaded.message << '\n';
    return 1;
  }
  config.data_dir = args[0];
  if (config.observations_file.empty()) {
    config.observations_file = (std::filesystem::path{config.data_dir} / "observations.tsv").string();
  }

  stride::CoreApi api;
  if (const stride::Result init = api.init(config); !init.ok) {
    std::cerr << "stride init failed: " << init.message << '\n';
    return 1;
  }

  if (command == "status") {
    print_status(api);
    return 0;
  }

  if (command == "ingest") {
    if (args.size() < 6) {
      print_usage();
      return 1;
    }
    stride::StepObservation observation;
    observation.provider = args[2];
    if (!stride::util::parse_int64(args[3], observation.start_unix) ||
        !stride::util::parse_int64(args[4], observation.end_unix) ||
        !stride::util::parse_int64(args[5], observation.steps)) {
      std::cerr << "error: start, end and steps must be integers\n";
      return 1;
    }
    if (args.size() > 6) {
      observation.session_id = args[6];
    }
    if (const int code = report(append_observation(config.observations_file, observation)); code != 0) {
      return code;
    }
    return report(api.refresh_today());
  }

  if (command == "repair" || command == "decline") {
    stride::CivilDay day;
    if (args.size() < 3 || !stride::calendar::parse_day(args[2], day)) {
      std::cerr << "error: expected a day as YYYY-MM-DD\n";
      return 1;
    }
    return report(command == "repair" ? api.request_repair(day) : api.decline_repair(day));
  }

  if (command == "reconcile") {
    std::int64_t days = 0;
    if (args.size() > 2 && !parse_positive(args[2], days)) {
      std::cerr << "error: days must be a positive integer\n";
      return 1;
    }
    const stride::CivilDay today = api.today();
    const int window_days = days > 0 ? static_cast<int>(days)
                                     : stride::shield::allowance_for(config.tier).history_window_days;
    stride::ReconcileReport summary;
    const stride::Result result = api.reconcile(
        stride::DayWindow{stride::calendar::add_days(today, -(window_days - 1)), today}, nullptr, summary);
    for (const auto day : summary.failed_days) {
      std::cout << "  fetch failed: " << stride::calendar::format_day(day) << '\n';
    }
    return report(result);
  }

  if (command == "foreground") {
    stride::MissedDayResult missed;
    stride::ReconcileReport summary;
    const stride::Result result = api.on_foreground(missed, summary);
    if (missed.legacy_badge) {
      std::cout << "Legacy badge earned: " << *missed.legacy_badge << " days\n";
    }
    return report(result);
  }

  if (command == "purchase" || command == "goal") {
    std::int64_t value = 0;
    if (args.size() < 3 || !parse_positive(args[2], value)) {
      std::cerr << "error: expected a positive integer\n";
      return 1;
    }
    return report(command == "purchase" ? api.purchase_shields(value) : api.set_daily_goal(value));
  }

  if (command == "history") {
    std::int64_t days = 14;
    if (args.size() > 2 && !parse_positive(args[2], days)) {
      std::cerr << "error: days must be a positive integer\n";
      return 1;
    }
    print_history(api, static_cast<int>(days));
    return 0;
  }

  if (command == "health") {
    const stride::StoreHealthReport health = api.health_report();
    std::cout << (health.healthy ? "healthy" : "unhealthy") << ": " << health.details << '\n';
    std::cout << "days: " << health.daily_log_count << ", goal changes: " << health.goal_change_count
              << ", anomalies: " << health.anomaly_count << ", quarantined: " << health.quarantined_record_count
              << ", batches: " << health.committed_batch_count << '\n';
    return 0;
  }

  print_usage();
  return 1;
}
