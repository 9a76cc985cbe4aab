#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace stride {

// Records written together by one commit. Either all of them become durable or none do.
struct StoreBatch {
  std::vector<DailyLog> daily_logs;
  std::optional<StreakState> streak;
  std::optional<ShieldInventory> shields;
  std::optional<std::vector<GoalChange>> goal_history;

  [[nodiscard]] bool empty() const {
    return daily_logs.empty() && !streak.has_value() && !shields.has_value() &&
           !goal_history.has_value();
  }
};

class IPersistence {
public:
  virtual ~IPersistence() = default;

  virtual Result load_daily_log(CivilDay day, std::optional<DailyLog>& out) const = 0;
  virtual Result load_daily_logs(CivilDay first, CivilDay last, std::vector<DailyLog>& out) const = 0;
  virtual Result load_all_daily_logs(std::vector<DailyLog>& out) const = 0;
  virtual Result load_streak(StreakState& out) const = 0;
  virtual Result load_shields(ShieldInventory& out) const = 0;
  virtual Result load_goal_history(std::vector<GoalChange>& out) const = 0;

  virtual Result commit(const StoreBatch& batch) = 0;

  virtual void record_anomaly(std::string_view subject, std::string_view reason) = 0;
  [[nodiscard]] virtual StoreHealthReport health_report() const = 0;
};

// Directory-backed store. One checksummed record file per aggregate; multi-record
// writes go through journal.pending so a crash mid-commit is rolled forward on open.
class FileStore final : public IPersistence {
public:
  Result open(std::string_view data_dir);

  Result load_daily_log(CivilDay day, std::optional<DailyLog>& out) const override;
  Result load_daily_logs(CivilDay first, CivilDay last, std::vector<DailyLog>& out) const override;
  Result load_all_daily_logs(std::vector<DailyLog>& out) const override;
  Result load_streak(StreakState& out) const override;
  Result load_shields(ShieldInventory& out) const override;
  Result load_goal_history(std::vector<GoalChange>& out) const override;

  Result commit(const StoreBatch& batch) override;

  void record_anomaly(std::string_view subject, std::string_view reason) override;
  [[nodiscard]] StoreHealthReport health_report() const override;

  [[nodiscard]] const std::string& data_dir() const { return data_dir_; }

private:
  struct PendingWrite {
    std::string relative_path;
    std::string content;
  };

  mutable std::shared_mutex mutex_;
  std::string data_dir_;
  std::string days_dir_;
  std::string quarantine_dir_;
  std::string journal_path_;
  std::string anomalies_path_;

  std::map<CivilDay, DailyLog> daily_logs_;
  std::optional<StreakState> streak_;
  std::optional<ShieldInventory> shields_;
  std::vector<GoalChange> goal_history_;

  std::size_t anomaly_count_ = 0;
  std::size_t quarantined_record_count_ = 0;
  std::size_t committed_batch_count_ = 0;
  bool recovered_from_journal_ = false;
  bool opened_ = false;

  Result replay_journal();
  Result roll_forward_pending_journal();
  Result load_days_dir();
  Result load_singletons();
  Result write_record(const PendingWrite& write) const;
  void quarantine_file(const std::string& path, std::string_view reason);
  void record_anomaly_locked(std::string_view subject, std::string_view reason);
};

// Record file encoding, exposed for the journal and for tests that corrupt records on purpose.
std::string encode_daily_log(const DailyLog& log);
std::string encode_streak_state(const StreakState& state);
std::string encode_shield_inventory(const ShieldInventory& inventory);
std::string encode_goal_history(const std::vector<GoalChange>& history);

Result decode_daily_log(std::string_view content, DailyLog& out);
Result decode_streak_state(std::string_view content, StreakState& out);
Result decode_shield_inventory(std::string_view content, ShieldInventory& out);
Result decode_goal_history(std::string_view content, std::vector<GoalChange>& out);

}  // namespace stride
