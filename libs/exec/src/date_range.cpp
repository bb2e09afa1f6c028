#include "gentrade/exec/date_range.h"

#include <kj/debug.h>

namespace gentrade::exec {

namespace {

bool is_leap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return month == 2 && is_leap(year) ? 29 : kDays[month - 1];
}

kj::Maybe<CalendarDate> parse_date(kj::ArrayPtr<const char> digits) {
  if (digits.size() != 8) {
    return kj::none;
  }
  int value[8];
  for (size_t i = 0; i < 8; ++i) {
    if (digits[i] < '0' || digits[i] > '9') {
      return kj::none;
    }
    value[i] = digits[i] - '0';
  }
  CalendarDate date{value[0] * 1000 + value[1] * 100 + value[2] * 10 + value[3],
                    value[4] * 10 + value[5], value[6] * 10 + value[7]};
  if (date.year < 1970 || date.month < 1 || date.month > 12 || date.day < 1 ||
      date.day > days_in_month(date.year, date.month)) {
    return kj::none;
  }
  return date;
}

} // namespace

kj::String DateRange::to_string() const {
  return kj::str(start.as_number(), "-", end.as_number());
}

kj::Maybe<DateRange> parse_date_range(kj::StringPtr text) {
  if (text.size() != 17 || text[8] != '-') {
    return kj::none;
  }
  KJ_IF_SOME(start, parse_date(text.asArray().first(8))) {
    KJ_IF_SOME(end, parse_date(text.asArray().slice(9, 17))) {
      if (start.as_number() > end.as_number()) {
        return kj::none;
      }
      return DateRange{start, end};
    }
  }
  return kj::none;
}

DateRange require_date_range(kj::StringPtr text) {
  KJ_IF_SOME(range, parse_date_range(text)) {
    return range;
  }
  KJ_FAIL_REQUIRE("invalid date range, expected YYYYMMDD-YYYYMMDD with start <= end", text);
}

} // namespace gentrade::exec
