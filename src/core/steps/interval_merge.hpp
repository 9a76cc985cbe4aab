#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace stride {

// Ordered provider names, earlier entries are trusted more. Providers missing from the
// list rank after every listed one and are ordered among themselves by name.
class ProviderPrecedence {
public:
  ProviderPrecedence();
  explicit ProviderPrecedence(std::vector<std::string> ordered);

  [[nodiscard]] std::size_t rank(std::string_view provider) const;
  // Strict weak ordering: true when lhs should win a contested time range over rhs.
  [[nodiscard]] bool outranks(std::string_view lhs, std::string_view rhs) const;
  [[nodiscard]] const std::vector<std::string>& ordered() const { return ordered_; }

private:
  std::vector<std::string> ordered_;
};

struct MergeReport {
  std::int64_t steps = 0;
  std::size_t accepted = 0;
  std::size_t dropped_malformed = 0;
  std::size_t dropped_outside_day = 0;
  std::size_t duplicates_collapsed = 0;
  std::size_t overlaps_resolved = 0;
};

class IntervalMerger {
public:
  explicit IntervalMerger(ProviderPrecedence precedence);

  // Deduplicated total for the local day [window_start, window_end).
  [[nodiscard]] MergeReport merge(const std::vector<StepObservation>& observations,
                                  std::int64_t window_start, std::int64_t window_end) const;
  // 24-hour day under one fixed offset; callers with a clock use calendar::local_day_bounds.
  [[nodiscard]] MergeReport merge_day(const std::vector<StepObservation>& observations, CivilDay day,
                                      std::int32_t utc_offset_seconds) const;

  [[nodiscard]] const ProviderPrecedence& precedence() const { return precedence_; }

private:
  ProviderPrecedence precedence_;
};

}  // namespace stride
