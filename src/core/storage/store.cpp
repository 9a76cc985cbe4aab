#include "core/storage/store.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <mutex>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/model/invariants.hpp"
#include "core/util/calendar.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace stride {
namespace {

constexpr std::string_view kDaysDir = "days";
constexpr std::string_view kQuarantineDir = "quarantine";
constexpr std::string_view kStreakFile = "streak.rec";
constexpr std::string_view kShieldsFile = "shields.rec";
constexpr std::string_view kGoalsFile = "goals.rec";
constexpr std::string_view kJournalFile = "journal.pending";
constexpr std::string_view kAnomaliesFile = "anomalies.log";
constexpr std::string_view kRecordExtension = ".rec";
constexpr std::string_view kJournalHeader = "# stride-journal-v1\n";
constexpr std::string_view kChecksumKey = "checksum=";

using Fields = std::unordered_map<std::string, std::string>;

Result corrupted(std::string message) {
  return Result::failure(ErrorKind::CorruptedAggregate, std::move(message));
}

std::string flag(bool value) {
  return value ? "1" : "0";
}

std::string optional_day(const std::optional<CivilDay>& day) {
  return day.has_value() ? calendar::format_day(*day) : std::string{};
}

std::string seal(std::string payload) {
  const std::string checksum = util::blake2b_hex(payload);
  payload.append(kChecksumKey);
  payload.append(checksum);
  payload.push_back('\n');
  return payload;
}

// Splits "<payload>checksum=<hex>\n" and verifies the digest over the payload.
Result unseal(std::string_view content, std::string_view kind, Fields& fields) {
  const std::size_t marker = content.rfind(kChecksumKey);
  if (marker == std::string_view::npos || (marker != 0 && content[marker - 1] != '\n')) {
    return corrupted(std::string{kind} + " record has no checksum line.");
  }

  const std::string_view payload = content.substr(0, marker);
  const std::string expected = util::trim_copy(content.substr(marker + kChecksumKey.size()));
  if (!util::checksum_matches(payload, expected)) {
    return corrupted(std::string{kind} + " record checksum mismatch.");
  }

  fields = util::parse_canonical_map(payload);
  const auto format = fields.find("format");
  if (format == fields.end() || format->second != kRecordFormat) {
    return corrupted(std::string{kind} + " record has an unknown format.");
  }
  const auto record_kind = fields.find("kind");
  if (record_kind == fields.end() || record_kind->second != kind) {
    return corrupted(std::string{kind} + " record has the wrong kind.");
  }
  return Result::success();
}

bool read_int(const Fields& fields, const char* key, std::int64_t& out) {
  const auto it = fields.find(key);
  return it != fields.end() && util::parse_int64(it->second, out);
}

bool read_int(const Fields& fields, const char* key, int& out) {
  std::int64_t value = 0;
  if (!read_int(fields, key, value)) {
    return false;
  }
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

bool read_flag(const Fields& fields, const char* key, bool& out) {
  const auto it = fields.find(key);
  return it != fields.end() && util::parse_bool(it->second, out);
}

bool read_optional_day(const Fields& fields, const char* key, std::optional<CivilDay>& out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return false;
  }
  if (it->second.empty()) {
    out.reset();
    return true;
  }
  CivilDay day;
  if (!calendar::parse_day(it->second, day)) {
    return false;
  }
  out = day;
  return true;
}

std::string read_file(const std::filesystem::path& path, bool& ok) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    ok = false;
    return {};
  }
  std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  ok = !in.bad();
  return content;
}

std::string day_relative_path(CivilDay day) {
  return std::string{kDaysDir} + "/" + calendar::format_day(day) + std::string{kRecordExtension};
}

bool is_known_relative_path(std::string_view relative) {
  if (relative == kStreakFile || relative == kShieldsFile || relative == kGoalsFile) {
    return true;
  }
  const std::string prefix = std::string{kDaysDir} + "/";
  if (!relative.starts_with(prefix) || !relative.ends_with(kRecordExtension)) {
    return false;
  }
  const std::string_view stem =
      relative.substr(prefix.size(), relative.size() - prefix.size() - kRecordExtension.size());
  CivilDay day;
  return calendar::parse_day(stem, day);
}

std::string encode_journal(const std::vector<std::pair<std::string, std::string>>& writes) {
  std::string body{kJournalHeader};
  for (const auto& [relative, content] : writes) {
    body.append("record=");
    body.append(relative);
    body.push_back('\t');
    body.append(std::to_string(content.size()));
    body.push_back('\n');
    body.append(content);
  }
  return seal(std::move(body));
}

Result decode_journal(std::string_view content,
                      std::vector<std::pair<std::string, std::string>>& writes) {
  const std::size_t marker = content.rfind(kChecksumKey);
  if (marker == std::string_view::npos || marker == 0 || content[marker - 1] != '\n') {
    return corrupted("Journal has no checksum line.");
  }
  const std::string_view body = content.substr(0, marker);
  if (!util::checksum_matches(body, util::trim_copy(content.substr(marker + kChecksumKey.size())))) {
    return corrupted("Journal checksum mismatch.");
  }
  if (!body.starts_with(kJournalHeader)) {
    return corrupted("Journal header missing.");
  }

  std::size_t pos = kJournalHeader.size();
  while (pos < body.size()) {
    const std::size_t line_end = body.find('\n', pos);
    if (line_end == std::string_view::npos) {
      return corrupted("Journal entry header is truncated.");
    }
    const std::string_view header = body.substr(pos, line_end - pos);
    const std::size_t tab = header.find('\t');
    if (!header.starts_with("record=") || tab == std::string_view::npos) {
      return corrupted("Journal entry header is malformed.");
    }

    const std::string relative{header.substr(7, tab - 7)};
    std::int64_t size = 0;
    if (!util::parse_int64(header.substr(tab + 1), size) || size < 0 ||
        line_end + 1 + static_cast<std::size_t>(size) > body.size()) {
      return corrupted("Journal entry size is invalid.");
    }
    if (!is_known_relative_path(relative)) {
      return corrupted("Journal entry names an unknown record: " + relative);
    }

    writes.emplace_back(relative, std::string{body.substr(line_end + 1, static_cast<std::size_t>(size))});
    pos = line_end + 1 + static_cast<std::size_t>(size);
  }
  return Result::success();
}

}  // namespace

std::string encode_daily_log(const DailyLog& log) {
  return seal(util::canonical_join({
      {"format", std::string{kRecordFormat}},
      {"kind", "daily_log"},
      {"date", calendar::format_day(log.date)},
      {"steps", std::to_string(log.steps)},
      {"goal_target", std::to_string(log.goal_target)},
      {"goal_met", flag(log.goal_met)},
      {"shield_used", flag(log.shield_used)},
      {"repair_declined", flag(log.repair_declined)},
      {"state", log.state == DayState::Finalized ? "finalized" : "open"},
      {"sessions", util::join_csv(log.session_ids)},
  }));
}

std::string encode_streak_state(const StreakState& state) {
  return seal(util::canonical_join({
      {"format", std::string{kRecordFormat}},
      {"kind", "streak"},
      {"current_streak", std::to_string(state.current_streak)},
      {"longest_streak", std::to_string(state.longest_streak)},
      {"streak_start_date", optional_day(state.streak_start_date)},
      {"last_goal_met_date", optional_day(state.last_goal_met_date)},
      {"pending_milestone",
       state.last_reached_milestone ? std::to_string(*state.last_reached_milestone) : std::string{}},
      {"last_fired_milestone", std::to_string(state.last_fired_milestone)},
      {"consecutive_goal_days", std::to_string(state.consecutive_goal_days)},
  }));
}

std::string encode_shield_inventory(const ShieldInventory& inventory) {
  return seal(util::canonical_join({
      {"format", std::string{kRecordFormat}},
      {"kind", "shields"},
      {"recurring_available", std::to_string(inventory.recurring_available)},
      {"purchased_available", std::to_string(inventory.purchased_available)},
      {"last_refill_period", inventory.last_refill_period
                                 ? calendar::format_period(*inventory.last_refill_period)
                                 : std::string{}},
      {"used_this_period", std::to_string(inventory.used_this_period)},
      {"total_used_lifetime", std::to_string(inventory.total_used_lifetime)},
      {"purchased_lifetime", std::to_string(inventory.purchased_lifetime)},
  }));
}

std::string encode_goal_history(const std::vector<GoalChange>& history) {
  std::vector<std::string> entries;
  entries.reserve(history.size());
  for (const auto& change : history) {
    entries.push_back(calendar::format_day(change.effective_from) + ":" + std::to_string(change.goal));
  }
  return seal(util::canonical_join({
      {"format", std::string{kRecordFormat}},
      {"kind", "goals"},
      {"changes", util::join_csv(entries)},
  }));
}

Result decode_daily_log(std::string_view content, DailyLog& out) {
  Fields fields;
  if (const Result sealed = unseal(content, "daily_log", fields); !sealed.ok) {
    return sealed;
  }

  DailyLog log;
  const auto date = fields.find("date");
  const auto state = fields.find("state");
  const auto sessions = fields.find("sessions");
  if (date == fields.end() || !calendar::parse_day(date->second, log.date) ||
      !read_int(fields, "steps", log.steps) || !read_int(fields, "goal_target", log.goal_target) ||
      !read_flag(fields, "goal_met", log.goal_met) ||
      !read_flag(fields, "shield_used", log.shield_used) ||
      !read_flag(fields, "repair_declined", log.repair_declined) || state == fields.end() ||
      (state->second != "open" && state->second != "finalized") || sessions == fields.end()) {
    return corrupted("DailyLog record has a missing or malformed field.");
  }
  log.state = state->second == "finalized" ? DayState::Finalized : DayState::Open;
  log.session_ids = util::split_csv(sessions->second);

  if (const Result valid = validate_daily_log(log); !valid.ok) {
    return valid;
  }
  out = std::move(log);
  return Result::success();
}

Result decode_streak_state(std::string_view content, StreakState& out) {
  Fields fields;
  if (const Result sealed = unseal(content, "streak", fields); !sealed.ok) {
    return sealed;
  }

  StreakState state;
  const auto pending = fields.find("pending_milestone");
  if (!read_int(fields, "current_streak", state.current_streak) ||
      !read_int(fields, "longest_streak", state.longest_streak) ||
      !read_optional_day(fields, "streak_start_date", state.streak_start_date) ||
      !read_optional_day(fields, "last_goal_met_date", state.last_goal_met_date) ||
      !read_int(fields, "last_fired_milestone", state.last_fired_milestone) ||
      !read_int(fields, "consecutive_goal_days", state.consecutive_goal_days) ||
      pending == fields.end()) {
    return corrupted("StreakState record has a missing or malformed field.");
  }
  if (!pending->second.empty()) {
    std::int64_t milestone = 0;
    if (!util::parse_int64(pending->second, milestone)) {
      return corrupted("StreakState pending milestone is malformed.");
    }
    state.last_reached_milestone = static_cast<int>(milestone);
  }

  if (const Result valid = validate_streak_state(state); !valid.ok) {
    return valid;
  }
  out = std::move(state);
  return Result::success();
}

Result decode_shield_inventory(std::string_view content, ShieldInventory& out) {
  Fields fields;
  if (const Result sealed = unseal(content, "shields", fields); !sealed.ok) {
    return sealed;
  }

  ShieldInventory inventory;
  const auto period = fields.find("last_refill_period");
  if (!read_int(fields, "recurring_available", inventory.recurring_available) ||
      !read_int(fields, "purchased_available", inventory.purchased_available) ||
      !read_int(fields, "used_this_period", inventory.used_this_period) ||
      !read_int(fields, "total_used_lifetime", inventory.total_used_lifetime) ||
      !read_int(fields, "purchased_lifetime", inventory.purchased_lifetime) ||
      period == fields.end()) {
    return corrupted("ShieldInventory record has a missing or malformed field.");
  }
  if (!period->second.empty()) {
    GrantPeriod parsed;
    if (!calendar::parse_period(period->second, parsed)) {
      return corrupted("ShieldInventory refill period is malformed.");
    }
    inventory.last_refill_period = parsed;
  }

  if (const Result valid = validate_shield_inventory(inventory); !valid.ok) {
    return valid;
  }
  out = inventory;
  return Result::success();
}

Result decode_goal_history(std::string_view content, std::vector<GoalChange>& out) {
  Fields fields;
  if (const Result sealed = unseal(content, "goals", fields); !sealed.ok) {
    return sealed;
  }

  const auto changes = fields.find("changes");
  if (changes == fields.end()) {
    return corrupted("Goal history record has no changes field.");
  }

  std::vector<GoalChange> history;
  for (const auto& entry : util::split_csv(changes->second)) {
    const std::size_t colon = entry.find(':');
    GoalChange change;
    if (colon == std::string::npos ||
        !calendar::parse_day(std::string_view{entry}.substr(0, colon), change.effective_from) ||
        !util::parse_int64(std::string_view{entry}.substr(colon + 1), change.goal)) {
      return corrupted("Goal history entry is malformed: " + entry);
    }
    history.push_back(change);
  }

  if (const Result valid = validate_goal_history(history); !valid.ok) {
    return valid;
  }
  out = std::move(history);
  return Result::success();
}

Result FileStore::open(std::string_view data_dir) {
  std::unique_lock lock(mutex_);
  data_dir_ = std::string{data_dir};
  opened_ = false;

  const std::filesystem::path root{data_dir_};
  std::error_code ec;
  std::filesystem::create_directories(root / std::string{kDaysDir}, ec);
  if (ec) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Failed to create store directory: " + ec.message());
  }
  std::filesystem::create_directories(root / std::string{kQuarantineDir}, ec);
  if (ec) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Failed to create quarantine directory: " + ec.message());
  }

  days_dir_ = (root / std::string{kDaysDir}).string();
  quarantine_dir_ = (root / std::string{kQuarantineDir}).string();
  journal_path_ = (root / std::string{kJournalFile}).string();
  anomalies_path_ = (root / std::string{kAnomaliesFile}).string();
  daily_logs_.clear();
  streak_.reset();
  shields_.reset();
  goal_history_.clear();
  anomaly_count_ = 0;
  quarantined_record_count_ = 0;
  committed_batch_count_ = 0;
  recovered_from_journal_ = false;

  if (!util::hashing_ready()) {
    return Result::failure(ErrorKind::PersistenceFailure, "Checksum backend failed to initialize.");
  }

  if (const Result replayed = replay_journal(); !replayed.ok) {
    return replayed;
  }
  if (const Result days = load_days_dir(); !days.ok) {
    return days;
  }
  if (const Result singletons = load_singletons(); !singletons.ok) {
    return singletons;
  }

  opened_ = true;
  return Result::success("Store opened with " + std::to_string(daily_logs_.size()) + " day record(s).");
}

Result FileStore::replay_journal() {
  std::error_code ec;
  if (!std::filesystem::exists(journal_path_, ec)) {
    return Result::success();
  }

  bool read_ok = false;
  const std::string content = read_file(journal_path_, read_ok);
  std::vector<std::pair<std::string, std::string>> writes;
  const Result decoded = read_ok ? decode_journal(content, writes)
                                 : corrupted("Journal could not be read.");
  if (!decoded.ok) {
    // A torn journal means the batch never started replacing records.
    quarantine_file(journal_path_, decoded.message);
    return Result::success();
  }

  for (const auto& [relative, record] : writes) {
    if (const Result written = write_record(PendingWrite{relative, record}); !written.ok) {
      return written;
    }
  }

  std::filesystem::remove(journal_path_, ec);
  if (ec) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Failed to clear replayed journal: " + ec.message());
  }
  recovered_from_journal_ = true;
  record_anomaly_locked("journal", "Replayed " + std::to_string(writes.size()) +
                                       " record(s) from an interrupted batch.");
  return Result::success();
}

// A journal left by a failed commit is completed before anything else is written, then the
// cached aggregates are reloaded from disk.
Result FileStore::roll_forward_pending_journal() {
  std::error_code ec;
  if (!std::filesystem::exists(journal_path_, ec)) {
    return Result::success();
  }
  if (const Result replayed = replay_journal(); !replayed.ok) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Interrupted batch could not be rolled forward: " + replayed.message);
  }

  daily_logs_.clear();
  streak_.reset();
  shields_.reset();
  goal_history_.clear();
  if (const Result days = load_days_dir(); !days.ok) {
    return days;
  }
  return load_singletons();
}

Result FileStore::load_days_dir() {
  std::error_code ec;
  std::filesystem::directory_iterator it{days_dir_, ec};
  if (ec) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Failed to list day records: " + ec.message());
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : it) {
    if (entry.is_regular_file(ec)) {
      files.push_back(entry.path());
    }
    ec.clear();
  }

  for (const auto& path : files) {
    if (path.extension() == ".tmp") {
      std::filesystem::remove(path, ec);
      ec.clear();
      continue;
    }
    if (path.extension().string() != kRecordExtension) {
      continue;
    }

    CivilDay expected_day;
    if (!calendar::parse_day(path.stem().string(), expected_day)) {
      quarantine_file(path.string(), "Day record file name is not a date.");
      continue;
    }

    bool read_ok = false;
    const std::string content = read_file(path, read_ok);
    DailyLog log;
    Result decoded = read_ok ? decode_daily_log(content, log) : corrupted("Day record unreadable.");
    if (decoded.ok && log.date != expected_day) {
      decoded = corrupted("Day record date does not match its file name.");
    }
    if (!decoded.ok) {
      quarantine_file(path.string(), decoded.message);
      continue;
    }
    daily_logs_.emplace(log.date, std::move(log));
  }
  return Result::success();
}

Result FileStore::load_singletons() {
  const std::filesystem::path root{data_dir_};
  std::error_code ec;

  const std::filesystem::path streak_path = root / std::string{kStreakFile};
  if (std::filesystem::exists(streak_path, ec)) {
    bool read_ok = false;
    const std::string content = read_file(streak_path, read_ok);
    StreakState state;
    const Result decoded = read_ok ? decode_streak_state(content, state)
                                   : corrupted("Streak record unreadable.");
    if (decoded.ok) {
      streak_ = state;
    } else {
      quarantine_file(streak_path.string(), decoded.message);
    }
  }

  const std::filesystem::path shields_path = root / std::string{kShieldsFile};
  if (std::filesystem::exists(shields_path, ec)) {
    bool read_ok = false;
    const std::string content = read_file(shields_path, read_ok);
    ShieldInventory inventory;
    const Result decoded = read_ok ? decode_shield_inventory(content, inventory)
                                   : corrupted("Shield record unreadable.");
    if (decoded.ok) {
      shields_ = inventory;
    } else {
      quarantine_file(shields_path.string(), decoded.message);
    }
  }

  const std::filesystem::path goals_path = root / std::string{kGoalsFile};
  if (std::filesystem::exists(goals_path, ec)) {
    bool read_ok = false;
    const std::string content = read_file(goals_path, read_ok);
    std::vector<GoalChange> history;
    const Result decoded = read_ok ? decode_goal_history(content, history)
                                   : corrupted("Goal record unreadable.");
    if (decoded.ok) {
      goal_history_ = std::move(history);
    } else {
      quarantine_file(goals_path.string(), decoded.message);
    }
  }

  return Result::success();
}

Result FileStore::load_daily_log(CivilDay day, std::optional<DailyLog>& out) const {
  std::shared_lock lock(mutex_);
  if (!opened_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Store is not open.");
  }
  const auto it = daily_logs_.find(day);
  if (it == daily_logs_.end()) {
    out.reset();
  } else {
    out = it->second;
  }
  return Result::success();
}

Result FileStore::load_daily_logs(CivilDay first, CivilDay last, std::vector<DailyLog>& out) const {
  if (last < first) {
    return Result::failure(ErrorKind::InvalidArgument, "Day range ends before it starts.");
  }
  std::shared_lock lock(mutex_);
  if (!opened_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Store is not open.");
  }
  out.clear();
  for (auto it = daily_logs_.lower_bound(first); it != daily_logs_.end() && it->first <= last; ++it) {
    out.push_back(it->second);
  }
  return Result::success();
}

Result FileStore::load_all_daily_logs(std::vector<DailyLog>& out) const {
  std::shared_lock lock(mutex_);
  if (!opened_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Store is not open.");
  }
  out.clear();
  out.reserve(daily_logs_.size());
  for (const auto& [day, log] : daily_logs_) {
    (void)day;
    out.push_back(log);
  }
  return Result::success();
}

Result FileStore::load_streak(StreakState& out) const {
  std::shared_lock lock(mutex_);
  if (!opened_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Store is not open.");
  }
  out = streak_.value_or(StreakState{});
  return Result::success();
}

Result FileStore::load_shields(ShieldInventory& out) const {
  std::shared_lock lock(mutex_);
  if (!opened_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Store is not open.");
  }
  out = shields_.value_or(ShieldInventory{});
  return Result::success();
}

Result FileStore::load_goal_history(std::vector<GoalChange>& out) const {
  std::shared_lock lock(mutex_);
  if (!opened_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Store is not open.");
  }
  out = goal_history_;
  return Result::success();
}

Result FileStore::commit(const StoreBatch& batch) {
  if (batch.empty()) {
    return Result::success("Nothing to commit.");
  }

  std::vector<std::pair<std::string, std::string>> writes;
  Result invalid = Result::success();
  for (const auto& log : batch.daily_logs) {
    if (invalid = validate_daily_log(log); !invalid.ok) {
      break;
    }
    writes.emplace_back(day_relative_path(log.date), encode_daily_log(log));
  }
  if (invalid.ok && batch.streak) {
    if (invalid = validate_streak_state(*batch.streak); invalid.ok) {
      writes.emplace_back(std::string{kStreakFile}, encode_streak_state(*batch.streak));
    }
  }
  if (invalid.ok && batch.shields) {
    if (invalid = validate_shield_inventory(*batch.shields); invalid.ok) {
      writes.emplace_back(std::string{kShieldsFile}, encode_shield_inventory(*batch.shields));
    }
  }
  if (invalid.ok && batch.goal_history) {
    if (invalid = validate_goal_history(*batch.goal_history); invalid.ok) {
      writes.emplace_back(std::string{kGoalsFile}, encode_goal_history(*batch.goal_history));
    }
  }

  std::unique_lock lock(mutex_);
  if (!opened_) {
    return Result::failure(ErrorKind::PersistenceFailure, "Store is not open.");
  }
  if (!invalid.ok) {
    record_anomaly_locked("commit", invalid.message);
    return invalid;
  }
  if (const Result pending = roll_forward_pending_journal(); !pending.ok) {
    record_anomaly_locked("commit", pending.message);
    return pending;
  }

  if (writes.size() > 1) {
    const std::filesystem::path journal{journal_path_};
    const PendingWrite journal_write{journal.filename().string(), encode_journal(writes)};
    if (const Result journaled = write_record(journal_write); !journaled.ok) {
      return journaled;
    }
  }

  for (const auto& [relative, content] : writes) {
    if (const Result written = write_record(PendingWrite{relative, content}); !written.ok) {
      // The journal stays behind and is rolled forward by the next commit or open.
      record_anomaly_locked("commit", written.message);
      return written;
    }
  }

  if (writes.size() > 1) {
    std::error_code ec;
    std::filesystem::remove(journal_path_, ec);
    if (ec) {
      record_anomaly_locked("commit", "Failed to clear journal: " + ec.message());
    }
  }

  for (const auto& log : batch.daily_logs) {
    daily_logs_.insert_or_assign(log.date, log);
  }
  if (batch.streak) {
    streak_ = *batch.streak;
  }
  if (batch.shields) {
    shields_ = *batch.shields;
  }
  if (batch.goal_history) {
    goal_history_ = *batch.goal_history;
  }
  ++committed_batch_count_;
  return Result::success("Committed " + std::to_string(writes.size()) + " record(s).");
}

Result FileStore::write_record(const PendingWrite& write) const {
  const std::filesystem::path target = std::filesystem::path{data_dir_} / write.relative_path;
  const std::filesystem::path temp = target.string() + ".tmp";

  {
    std::ofstream out(temp, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
      return Result::failure(ErrorKind::PersistenceFailure,
                             "Failed to open record for writing: " + write.relative_path);
    }
    out << write.content;
    out.flush();
    if (!out.good()) {
      return Result::failure(ErrorKind::PersistenceFailure,
                             "Failed flushing record: " + write.relative_path);
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Failed to replace record " + write.relative_path + ": " + ec.message());
  }
  return Result::success();
}

void FileStore::quarantine_file(const std::string& path, std::string_view reason) {
  const std::filesystem::path source{path};
  const std::string base = source.filename().string() + "-quarantine-" +
                           std::to_string(util::unix_timestamp_now());

  std::error_code ec;
  std::filesystem::path target = std::filesystem::path{quarantine_dir_} / base;
  for (int suffix = 1; std::filesystem::exists(target, ec); ++suffix) {
    target = std::filesystem::path{quarantine_dir_} / (base + "-" + std::to_string(suffix));
  }

  std::filesystem::rename(source, target, ec);
  if (ec) {
    ec.clear();
    std::filesystem::remove(source, ec);
  }
  ++quarantined_record_count_;
  record_anomaly_locked(source.filename().string(), reason);
}

void FileStore::record_anomaly(std::string_view subject, std::string_view reason) {
  std::unique_lock lock(mutex_);
  record_anomaly_locked(subject, reason);
}

void FileStore::record_anomaly_locked(std::string_view subject, std::string_view reason) {
  ++anomaly_count_;
  if (anomalies_path_.empty()) {
    return;
  }

  std::ofstream out(anomalies_path_, std::ios::out | std::ios::app);
  if (!out) {
    return;
  }
  out << util::unix_timestamp_now() << "\t" << subject << "\t" << reason << "\n";
}

StoreHealthReport FileStore::health_report() const {
  std::shared_lock lock(mutex_);
  StoreHealthReport report;
  report.healthy = opened_;
  report.details = opened_ ? "Store health check passed." : "Store is not open.";
  report.data_dir = data_dir_;
  report.days_dir = days_dir_;
  report.anomalies_file = anomalies_path_;
  report.daily_log_count = daily_logs_.size();
  report.goal_change_count = goal_history_.size();
  report.anomaly_count = anomaly_count_;
  report.quarantined_record_count = quarantined_record_count_;
  report.committed_batch_count = committed_batch_count_;
  report.recovered_from_journal = recovered_from_journal_;

  std::error_code ec;
  if (opened_ && std::filesystem::exists(journal_path_, ec)) {
    report.healthy = false;
    report.details = "Store health warning: a batch journal is pending replay.";
  } else if (opened_ && quarantined_record_count_ > 0) {
    report.details = "Store recovered after quarantining " +
                     std::to_string(quarantined_record_count_) + " record(s).";
  }
  return report;
}

}  // namespace stride
