#pragma once

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace gentrade::exec {

/**
 * @brief One line of engine output
 *
 * The engine logs either JSON lines (`{"name": ..., "levelname": ..., "message": ...}`)
 * or text (`<timestamp> - <component> - <LEVEL> - <message>`). Lines in neither
 * shape are kept with an empty component and level.
 */
struct LogLine {
  kj::String component;
  kj::String level;
  kj::String message;

  [[nodiscard]] bool is_error() const;
};

[[nodiscard]] LogLine parse_log_line(kj::StringPtr line);

// Non-empty lines of `output`, parsed
[[nodiscard]] kj::Array<LogLine> parse_log(kj::StringPtr output);

/**
 * @brief The path from the last `dumping json to "<path>"` line
 *
 * The engine prints this when it writes the backtest result; the path is
 * inside the container.
 */
[[nodiscard]] kj::Maybe<kj::String> find_result_path(kj::StringPtr output);

[[nodiscard]] kj::Maybe<kj::String> last_error_line(kj::StringPtr output);

[[nodiscard]] size_t count_error_lines(kj::StringPtr output);

/**
 * @brief Short text for a failed run: the last error line, else the last line
 */
[[nodiscard]] kj::String summarize_failure(kj::StringPtr output);

} // namespace gentrade::exec
