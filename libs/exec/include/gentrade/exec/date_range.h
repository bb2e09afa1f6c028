#pragma once

#include <kj/common.h>
#include <kj/string.h>

namespace gentrade::exec {

struct CalendarDate {
  int year;
  int month;
  int day;

  [[nodiscard]] int as_number() const {
    return year * 10000 + month * 100 + day;
  }
};

/**
 * @brief A backtest time range in the engine's `YYYYMMDD-YYYYMMDD` notation
 */
struct DateRange {
  CalendarDate start;
  CalendarDate end;

  [[nodiscard]] kj::String to_string() const;
};

// Both dates must exist in the calendar and start must not be after end
[[nodiscard]] kj::Maybe<DateRange> parse_date_range(kj::StringPtr text);

/**
 * @brief Parse or fail
 * @throws kj::Exception (FAILED) naming the rejected text
 */
DateRange require_date_range(kj::StringPtr text);

} // namespace gentrade::exec
