#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

#include "core/model/types.hpp"

namespace stride {

// Per-day step ceiling. Live readings may only raise an open day; finalized days move
// only through the correction path used by reconciliation, and never downwards.
class HighWaterMark {
public:
  struct Mark {
    std::int64_t steps = 0;
    DayState state = DayState::Open;
  };

  void seed(CivilDay day, std::int64_t steps, DayState state);
  std::int64_t accept(CivilDay day, std::int64_t candidate);
  std::int64_t accept_correction(CivilDay day, std::int64_t candidate);
  // Finalizes every tracked day before `today`.
  void roll_over(CivilDay today);
  void forget_before(CivilDay cutoff);

  [[nodiscard]] std::optional<Mark> mark(CivilDay day) const;
  [[nodiscard]] bool is_finalized(CivilDay day) const;

private:
  mutable std::mutex mutex_;
  std::map<CivilDay, Mark> marks_;
};

}  // namespace stride
