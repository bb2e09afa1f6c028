#pragma once

#include <cstdint>
#include <kj/string.h>

namespace gentrade::broker {

/**
 * @brief Wire payload of one backtest job
 *
 * Encoded as `{"job_id": 1, "strategy_id": 2, "principal_id": "...", "date_range": "..."}`.
 */
struct JobMessage final {
  std::int64_t job_id{0};
  std::int64_t strategy_id{0};
  kj::String principal_id;
  kj::String date_range;
};

[[nodiscard]] kj::String encode_job_message(const JobMessage& message);

/**
 * @brief Decode a payload produced by encode_job_message()
 * @throws kj::Exception (FAILED) when the payload is not a valid job message
 */
[[nodiscard]] JobMessage decode_job_message(kj::StringPtr payload);

} // namespace gentrade::broker
