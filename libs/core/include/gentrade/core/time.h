#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace gentrade::core {

[[nodiscard]] std::int64_t now_unix_ns();
[[nodiscard]] std::int64_t now_unix_seconds();
[[nodiscard]] kj::String now_utc_iso8601();

// ISO-8601 UTC with second precision, e.g. "2024-01-31T12:00:00Z"
[[nodiscard]] kj::String format_unix_seconds(std::int64_t ts);

} // namespace gentrade::core
