#include "core/source/step_source.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#include "core/util/canonical.hpp"

namespace stride {
namespace {

std::vector<std::string_view> split_tabs(std::string_view line) {
  std::vector<std::string_view> parts;
  std::size_t begin = 0;
  while (true) {
    const std::size_t tab = line.find('\t', begin);
    if (tab == std::string_view::npos) {
      parts.push_back(line.substr(begin));
      break;
    }
    parts.push_back(line.substr(begin, tab - begin));
    begin = tab + 1;
  }
  return parts;
}

bool overlaps(const StepObservation& observation, std::int64_t start, std::int64_t end) {
  return observation.end_unix > start && observation.start_unix < end;
}

}  // namespace

bool parse_observation_line(std::string_view line, StepObservation& out) {
  const auto parts = split_tabs(line);
  if (parts.size() < 4 || parts.size() > 5) {
    return false;
  }

  StepObservation observation;
  observation.provider = util::lowercase_copy(util::trim_copy(parts[0]));
  if (observation.provider.empty() ||
      !util::parse_int64(util::trim_copy(parts[1]), observation.start_unix) ||
      !util::parse_int64(util::trim_copy(parts[2]), observation.end_unix) ||
      !util::parse_int64(util::trim_copy(parts[3]), observation.steps)) {
    return false;
  }
  if (parts.size() == 5) {
    observation.session_id = util::trim_copy(parts[4]);
  }
  out = std::move(observation);
  return true;
}

std::string format_observation_line(const StepObservation& observation) {
  std::string line = observation.provider + "\t" + std::to_string(observation.start_unix) + "\t" +
                     std::to_string(observation.end_unix) + "\t" + std::to_string(observation.steps);
  if (!observation.session_id.empty()) {
    line += "\t" + observation.session_id;
  }
  return line;
}

FileStepSource::FileStepSource(std::string path, const IClock& clock)
    : path_(std::move(path)), clock_(clock) {}

Result FileStepSource::read_all(std::vector<StepObservation>& out) {
  std::ifstream in{std::filesystem::path{path_}};
  if (!in) {
    return Result::failure(ErrorKind::ObservationFetchFailure,
                           "Observation source unavailable: " + path_);
  }

  out.clear();
  skipped_lines_ = 0;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    StepObservation observation;
    if (parse_observation_line(line, observation)) {
      out.push_back(std::move(observation));
    } else {
      ++skipped_lines_;
    }
  }
  if (in.bad()) {
    return Result::failure(ErrorKind::ObservationFetchFailure,
                           "Observation source read error: " + path_);
  }
  return Result::success();
}

Result FileStepSource::fetch_observations(CivilDay day, std::vector<StepObservation>& out) {
  std::vector<StepObservation> all;
  if (const Result read = read_all(all); !read.ok) {
    return read;
  }

  const calendar::LocalDayBounds bounds = calendar::local_day_bounds(clock_, day);
  out.clear();
  for (auto& observation : all) {
    if (overlaps(observation, bounds.start, bounds.end)) {
      out.push_back(std::move(observation));
    }
  }
  return Result::success();
}

Result FileStepSource::fetch_observations(CivilDay first, CivilDay last, ObservationsByDay& out) {
  if (last < first) {
    return Result::failure(ErrorKind::InvalidArgument, "Day range ends before it starts.");
  }

  std::vector<StepObservation> all;
  if (const Result read = read_all(all); !read.ok) {
    return read;
  }

  out.clear();
  for (CivilDay day = first; day <= last; day = calendar::add_days(day, 1)) {
    const calendar::LocalDayBounds bounds = calendar::local_day_bounds(clock_, day);
    auto& bucket = out[day];
    for (const auto& observation : all) {
      if (overlaps(observation, bounds.start, bounds.end)) {
        bucket.push_back(observation);
      }
    }
  }
  return Result::success();
}

}  // namespace stride
