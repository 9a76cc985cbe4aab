#include "core/util/calendar.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

#include "core/util/canonical.hpp"

namespace stride {

std::int64_t SystemClock::now_unix() const {
  return util::unix_timestamp_now();
}

std::int32_t SystemClock::utc_offset_seconds(std::int64_t unix_ts) const {
  const std::time_t raw = static_cast<std::time_t>(unix_ts);
  std::tm local{};
  if (localtime_r(&raw, &local) == nullptr) {
    return 0;
  }
  return static_cast<std::int32_t>(local.tm_gmtoff);
}

}  // namespace stride

namespace stride::calendar {
namespace {

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
  std::int64_t quotient = value / divisor;
  if ((value % divisor) != 0 && ((value < 0) != (divisor < 0))) {
    --quotient;
  }
  return quotient;
}

}  // namespace

CivilDay from_ymd(int year, unsigned month, unsigned day) {
  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                        std::chrono::day{day}};
  const std::chrono::sys_days days{ymd};
  return CivilDay{static_cast<std::int32_t>(days.time_since_epoch().count())};
}

void to_ymd(CivilDay day, int& year, unsigned& month, unsigned& dom) {
  const std::chrono::sys_days days{std::chrono::days{day.serial}};
  const std::chrono::year_month_day ymd{days};
  year = static_cast<int>(ymd.year());
  month = static_cast<unsigned>(ymd.month());
  dom = static_cast<unsigned>(ymd.day());
}

std::string format_day(CivilDay day) {
  int year = 0;
  unsigned month = 0;
  unsigned dom = 0;
  to_ymd(day, year, month, dom);
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, dom);
  return buffer;
}

bool parse_day(std::string_view text, CivilDay& out) {
  const std::string trimmed = util::trim_copy(text);
  if (trimmed.size() != 10 || trimmed[4] != '-' || trimmed[7] != '-') {
    return false;
  }

  std::int64_t year = 0;
  std::int64_t month = 0;
  std::int64_t dom = 0;
  const std::string_view view{trimmed};
  if (!util::parse_int64(view.substr(0, 4), year) || !util::parse_int64(view.substr(5, 2), month) ||
      !util::parse_int64(view.substr(8, 2), dom)) {
    return false;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(year)},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(dom)}};
  if (!ymd.ok()) {
    return false;
  }

  out = from_ymd(static_cast<int>(year), static_cast<unsigned>(month), static_cast<unsigned>(dom));
  return true;
}

CivilDay local_day_of(std::int64_t unix_ts, std::int32_t utc_offset_seconds) {
  return CivilDay{static_cast<std::int32_t>(floor_div(unix_ts + utc_offset_seconds, kSecondsPerDay))};
}

std::int64_t local_midnight_unix(CivilDay day, std::int32_t utc_offset_seconds) {
  return static_cast<std::int64_t>(day.serial) * kSecondsPerDay - utc_offset_seconds;
}

int local_hour_of(std::int64_t unix_ts, std::int32_t utc_offset_seconds) {
  const std::int64_t local = unix_ts + utc_offset_seconds;
  const std::int64_t second_of_day = local - floor_div(local, kSecondsPerDay) * kSecondsPerDay;
  return static_cast<int>(second_of_day / 3600);
}

CivilDay today(const IClock& clock) {
  const std::int64_t now = clock.now_unix();
  return local_day_of(now, clock.utc_offset_seconds(now));
}

std::int64_t local_midnight_unix(const IClock& clock, CivilDay day) {
  const std::int64_t utc_midnight = static_cast<std::int64_t>(day.serial) * kSecondsPerDay;
  const std::int64_t estimate = utc_midnight - clock.utc_offset_seconds(utc_midnight);
  return utc_midnight - clock.utc_offset_seconds(estimate);
}

LocalDayBounds local_day_bounds(const IClock& clock, CivilDay day) {
  return LocalDayBounds{local_midnight_unix(clock, day), local_midnight_unix(clock, add_days(day, 1))};
}

int local_hour_now(const IClock& clock) {
  const std::int64_t now = clock.now_unix();
  return local_hour_of(now, clock.utc_offset_seconds(now));
}

GrantPeriod period_of(CivilDay day) {
  int year = 0;
  unsigned month = 0;
  unsigned dom = 0;
  to_ymd(day, year, month, dom);
  return GrantPeriod{year, static_cast<int>(month)};
}

std::string format_period(GrantPeriod period) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d", period.year, period.month);
  return buffer;
}

bool parse_period(std::string_view text, GrantPeriod& out) {
  const std::string trimmed = util::trim_copy(text);
  if (trimmed.size() != 7 || trimmed[4] != '-') {
    return false;
  }
  std::int64_t year = 0;
  std::int64_t month = 0;
  const std::string_view view{trimmed};
  if (!util::parse_int64(view.substr(0, 4), year) || !util::parse_int64(view.substr(5, 2), month)) {
    return false;
  }
  const GrantPeriod parsed{static_cast<int>(year), static_cast<int>(month)};
  if (!parsed.valid()) {
    return false;
  }
  out = parsed;
  return true;
}

CivilDay first_day_of_next_month(CivilDay day) {
  const GrantPeriod period = period_of(day);
  if (period.month == 12) {
    return from_ymd(period.year + 1, 1, 1);
  }
  return from_ymd(period.year, static_cast<unsigned>(period.month + 1), 1);
}

}  // namespace stride::calendar
