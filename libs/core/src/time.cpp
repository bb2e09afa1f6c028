#include "gentrade/core/time.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <kj/common.h>
#include <kj/string.h>

namespace gentrade::core {

std::int64_t now_unix_ns() {
  const auto now = std::chrono::system_clock::now();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ns.count());
}

std::int64_t now_unix_seconds() {
  return now_unix_ns() / 1'000'000'000;
}

kj::String now_utc_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto now_time_t = std::chrono::system_clock::to_time_t(now);

  std::tm tm{};
  gmtime_r(&now_time_t, &tm);

  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());
  const auto subsec_ns = static_cast<long>(ns.count() % 1'000'000'000);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09ldZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, subsec_ns);
  return kj::str(buf);
}

kj::String format_unix_seconds(std::int64_t ts) {
  const auto t = static_cast<std::time_t>(ts);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return kj::str(buf);
}

} // namespace gentrade::core
