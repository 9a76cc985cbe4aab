#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/util/calendar.hpp"

namespace stride {

using ObservationsByDay = std::map<CivilDay, std::vector<StepObservation>>;

// Source of truth for reconciliation. Fetching may block; answers may differ between calls.
class IStepSource {
public:
  virtual ~IStepSource() = default;

  virtual Result fetch_observations(CivilDay day, std::vector<StepObservation>& out) = 0;
  virtual Result fetch_observations(CivilDay first, CivilDay last, ObservationsByDay& out) = 0;
};

// Reads a tab-separated file: provider, start_unix, end_unix, steps[, session_id].
// The file is re-read on every fetch.
class FileStepSource final : public IStepSource {
public:
  FileStepSource(std::string path, const IClock& clock);

  Result fetch_observations(CivilDay day, std::vector<StepObservation>& out) override;
  Result fetch_observations(CivilDay first, CivilDay last, ObservationsByDay& out) override;

  [[nodiscard]] std::size_t skipped_line_count() const { return skipped_lines_; }

private:
  std::string path_;
  const IClock& clock_;
  std::size_t skipped_lines_ = 0;

  Result read_all(std::vector<StepObservation>& out);
};

bool parse_observation_line(std::string_view line, StepObservation& out);
std::string format_observation_line(const StepObservation& observation);

}  // namespace stride
