#include "core/steps/interval_merge.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <tuple>
#include <utility>

#include "core/util/calendar.hpp"
#include "core/util/canonical.hpp"

namespace stride {
namespace {

struct Candidate {
  std::string provider;
  std::int64_t start = 0;
  std::int64_t end = 0;
  std::int64_t steps = 0;
  long double density = 0.0L;
};

bool same_interval(const Candidate& lhs, const Candidate& rhs) {
  return lhs.provider == rhs.provider && lhs.start == rhs.start && lhs.end == rhs.end;
}

long double clipped_steps(const Candidate& candidate, std::int64_t window_start, std::int64_t window_end) {
  const std::int64_t start = std::max(candidate.start, window_start);
  const std::int64_t end = std::min(candidate.end, window_end);
  return candidate.density * static_cast<long double>(end - start);
}

// One provider's reports, reduced to the mutually disjoint subset with the largest in-window
// count. Nested or overlapping re-reports of the same walking never add up.
std::vector<Candidate> keep_disjoint(std::vector<Candidate> group, std::int64_t window_start,
                                     std::int64_t window_end) {
  std::ranges::sort(group, [](const Candidate& lhs, const Candidate& rhs) {
    return std::tie(lhs.end, lhs.start, rhs.steps) < std::tie(rhs.end, rhs.start, lhs.steps);
  });

  const std::size_t count = group.size();
  std::vector<long double> best(count + 1U, 0.0L);
  std::vector<std::size_t> compatible(count, 0U);
  for (std::size_t i = 0; i < count; ++i) {
    const auto first_overlap =
        std::upper_bound(group.begin(), group.begin() + static_cast<std::ptrdiff_t>(i), group[i].start,
                         [](std::int64_t start, const Candidate& other) { return start < other.end; });
    compatible[i] = static_cast<std::size_t>(std::distance(group.begin(), first_overlap));
    const long double with = clipped_steps(group[i], window_start, window_end) + best[compatible[i]];
    best[i + 1U] = std::max(with, best[i]);
  }

  std::vector<Candidate> kept;
  std::size_t i = count;
  while (i > 0U) {
    const std::size_t index = i - 1U;
    const long double with = clipped_steps(group[index], window_start, window_end) + best[compatible[index]];
    if (with >= best[index]) {
      kept.push_back(std::move(group[index]));
      i = compatible[index];
    } else {
      i = index;
    }
  }
  return kept;
}

}  // namespace

ProviderPrecedence::ProviderPrecedence()
    : ordered_({"health_store", "watch_motion", "phone_motion", "cloud_sync"}) {}

ProviderPrecedence::ProviderPrecedence(std::vector<std::string> ordered) : ordered_(std::move(ordered)) {
  for (auto& provider : ordered_) {
    provider = util::lowercase_copy(util::trim_copy(provider));
  }
}

std::size_t ProviderPrecedence::rank(std::string_view provider) const {
  const std::string normalized = util::lowercase_copy(provider);
  const auto it = std::ranges::find(ordered_, normalized);
  return static_cast<std::size_t>(std::distance(ordered_.begin(), it));
}

bool ProviderPrecedence::outranks(std::string_view lhs, std::string_view rhs) const {
  const std::size_t lhs_rank = rank(lhs);
  const std::size_t rhs_rank = rank(rhs);
  if (lhs_rank != rhs_rank) {
    return lhs_rank < rhs_rank;
  }
  if (lhs_rank < ordered_.size()) {
    return false;
  }
  return util::lowercase_copy(lhs) < util::lowercase_copy(rhs);
}

IntervalMerger::IntervalMerger(ProviderPrecedence precedence) : precedence_(std::move(precedence)) {}

MergeReport IntervalMerger::merge_day(const std::vector<StepObservation>& observations, CivilDay day,
                                      std::int32_t utc_offset_seconds) const {
  const std::int64_t start = calendar::local_midnight_unix(day, utc_offset_seconds);
  return merge(observations, start, start + calendar::kSecondsPerDay);
}

MergeReport IntervalMerger::merge(const std::vector<StepObservation>& observations,
                                  std::int64_t window_start, std::int64_t window_end) const {
  MergeReport report;
  if (window_end <= window_start) {
    return report;
  }

  std::vector<Candidate> candidates;
  candidates.reserve(observations.size());
  for (const auto& observation : observations) {
    if (observation.end_unix <= observation.start_unix || observation.steps < 0 ||
        observation.provider.empty()) {
      ++report.dropped_malformed;
      continue;
    }
    if (observation.end_unix <= window_start || observation.start_unix >= window_end) {
      ++report.dropped_outside_day;
      continue;
    }

    Candidate candidate;
    candidate.provider = util::lowercase_copy(observation.provider);
    candidate.start = observation.start_unix;
    candidate.end = observation.end_unix;
    candidate.steps = observation.steps;
    candidate.density = static_cast<long double>(observation.steps) /
                        static_cast<long double>(observation.end_unix - observation.start_unix);
    candidates.push_back(std::move(candidate));
  }

  // Canonical order first so the result never depends on arrival order.
  std::ranges::sort(candidates, [](const Candidate& lhs, const Candidate& rhs) {
    return std::tie(lhs.provider, lhs.start, lhs.end, rhs.steps) <
           std::tie(rhs.provider, rhs.start, rhs.end, lhs.steps);
  });

  // Re-issued intervals keep the largest count, which sorts first within each group.
  std::vector<Candidate> unique;
  unique.reserve(candidates.size());
  for (auto& candidate : candidates) {
    if (!unique.empty() && same_interval(unique.back(), candidate)) {
      ++report.duplicates_collapsed;
      continue;
    }
    unique.push_back(std::move(candidate));
  }
  report.accepted = unique.size();
  if (unique.empty()) {
    return report;
  }

  std::vector<Candidate> resolved;
  resolved.reserve(unique.size());
  for (auto group_begin = unique.begin(); group_begin != unique.end();) {
    const auto group_end = std::find_if(group_begin, unique.end(), [&](const Candidate& candidate) {
      return candidate.provider != group_begin->provider;
    });
    std::vector<Candidate> kept = keep_disjoint(
        std::vector<Candidate>(std::make_move_iterator(group_begin), std::make_move_iterator(group_end)),
        window_start, window_end);
    report.overlaps_resolved += static_cast<std::size_t>(std::distance(group_begin, group_end)) - kept.size();
    std::ranges::move(kept, std::back_inserter(resolved));
    group_begin = group_end;
  }
  unique = std::move(resolved);

  std::vector<std::int64_t> cuts;
  cuts.reserve(unique.size() * 2U);
  for (const auto& candidate : unique) {
    cuts.push_back(std::max(candidate.start, window_start));
    cuts.push_back(std::min(candidate.end, window_end));
  }
  std::ranges::sort(cuts);
  const auto duplicate_cuts = std::ranges::unique(cuts);
  cuts.erase(duplicate_cuts.begin(), duplicate_cuts.end());

  const auto better = [this](const Candidate& lhs, const Candidate& rhs) {
    if (precedence_.outranks(lhs.provider, rhs.provider)) {
      return true;
    }
    if (precedence_.outranks(rhs.provider, lhs.provider)) {
      return false;
    }
    if (lhs.density != rhs.density) {
      return lhs.density > rhs.density;
    }
    const std::int64_t lhs_length = lhs.end - lhs.start;
    const std::int64_t rhs_length = rhs.end - rhs.start;
    if (lhs_length != rhs_length) {
      return lhs_length > rhs_length;
    }
    if (lhs.start != rhs.start) {
      return lhs.start < rhs.start;
    }
    return lhs.steps > rhs.steps;
  };

  long double total = 0.0L;
  for (std::size_t i = 0; i + 1 < cuts.size(); ++i) {
    const std::int64_t segment_start = cuts[i];
    const std::int64_t segment_end = cuts[i + 1];

    const Candidate* winner = nullptr;
    for (const auto& candidate : unique) {
      if (candidate.start > segment_start || candidate.end < segment_end) {
        continue;
      }
      if (winner == nullptr || better(candidate, *winner)) {
        winner = &candidate;
      }
    }
    if (winner != nullptr) {
      total += winner->density * static_cast<long double>(segment_end - segment_start);
    }
  }

  report.steps = static_cast<std::int64_t>(std::llround(total));
  return report;
}

}  // namespace stride
