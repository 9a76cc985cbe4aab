#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

#include "core/model/types.hpp"

namespace stride {

class CancellationToken {
public:
  void request() { requested_.store(true, std::memory_order_release); }
  void reset() { requested_.store(false, std::memory_order_release); }
  [[nodiscard]] bool requested() const { return requested_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> requested_{false};
};

struct DayWindow {
  CivilDay first;
  CivilDay last;
};

std::string_view trigger_name(ReconcileTrigger trigger);

// Throttle clock and window policy for reconciliation passes.
class ReconcileScheduler {
public:
  explicit ReconcileScheduler(ReconcilePolicy policy = {});

  [[nodiscard]] bool should_run(std::int64_t now_unix, ReconcileTrigger trigger) const;
  void mark_completed(std::int64_t now_unix);
  [[nodiscard]] std::optional<std::int64_t> last_completed_unix() const;

  [[nodiscard]] DayWindow default_window(CivilDay today, const TierAllowance& allowance) const;
  // Clips a requested window to today and to the configured maximum length.
  [[nodiscard]] std::optional<DayWindow> clamp_window(DayWindow requested, CivilDay today) const;

  [[nodiscard]] const ReconcilePolicy& policy() const { return policy_; }

private:
  ReconcilePolicy policy_;
  mutable std::mutex mutex_;
  std::optional<std::int64_t> last_completed_unix_;
};

}  // namespace stride
