#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace stride {

class IClock {
public:
  virtual ~IClock() = default;

  [[nodiscard]] virtual std::int64_t now_unix() const = 0;
  [[nodiscard]] virtual std::int32_t utc_offset_seconds(std::int64_t unix_ts) const = 0;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] std::int64_t now_unix() const override;
  [[nodiscard]] std::int32_t utc_offset_seconds(std::int64_t unix_ts) const override;
};

}  // namespace stride

namespace stride::calendar {

inline constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;

CivilDay from_ymd(int year, unsigned month, unsigned day);
void to_ymd(CivilDay day, int& year, unsigned& month, unsigned& dom);

std::string format_day(CivilDay day);
bool parse_day(std::string_view text, CivilDay& out);

inline CivilDay add_days(CivilDay day, int delta) {
  return CivilDay{day.serial + delta};
}

inline int days_between(CivilDay from, CivilDay to) {
  return to.serial - from.serial;
}

CivilDay local_day_of(std::int64_t unix_ts, std::int32_t utc_offset_seconds);
std::int64_t local_midnight_unix(CivilDay day, std::int32_t utc_offset_seconds);
int local_hour_of(std::int64_t unix_ts, std::int32_t utc_offset_seconds);

CivilDay today(const IClock& clock);
// Local midnight under the offset in force at that instant, not at the current time.
std::int64_t local_midnight_unix(const IClock& clock, CivilDay day);

struct LocalDayBounds {
  std::int64_t start = 0;
  std::int64_t end = 0;
};

// [local midnight, next local midnight) of `day`; 23 or 25 hours long when the offset changes.
LocalDayBounds local_day_bounds(const IClock& clock, CivilDay day);
int local_hour_now(const IClock& clock);

GrantPeriod period_of(CivilDay day);
std::string format_period(GrantPeriod period);
bool parse_period(std::string_view text, GrantPeriod& out);
CivilDay first_day_of_next_month(CivilDay day);

}  // namespace stride::calendar
