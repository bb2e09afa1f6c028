#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace gentrade::db {

/**
 * @brief Backtest job lifecycle
 *
 * created -> downloading_data -> running -> finished | failed. Failed is
 * reachable from every non-terminal state; nothing leaves a terminal state.
 */
enum class JobStatus : std::uint8_t {
  Created = 0,
  DownloadingData = 1,
  Running = 2,
  Finished = 3,
  Failed = 4,
};

// Persisted spelling: created | downloading_data | running | finished | failed
[[nodiscard]] kj::StringPtr to_string(JobStatus status);
[[nodiscard]] kj::Maybe<JobStatus> parse_job_status(kj::StringPtr str);

[[nodiscard]] bool is_terminal(JobStatus status);

// Position along the forward order; both terminals share the last rank
[[nodiscard]] int rank(JobStatus status);

[[nodiscard]] bool can_transition(JobStatus from, JobStatus to);

// Throws InvalidTransitionException when can_transition() is false
void require_transition(JobStatus from, JobStatus to);

// As require_transition(), and additionally rejects terminal targets, which
// carry an artifact or an error and are written through dedicated calls
void require_advance(JobStatus from, JobStatus to);

struct JobRecord final {
  std::int64_t id{0};
  std::int64_t strategy_id{0};
  kj::String date_range;
  JobStatus status{JobStatus::Created};
  kj::Maybe<kj::String> artifact_path;
  kj::Maybe<kj::String> error;
  std::int64_t created_at{0}; // unix seconds
  std::int64_t updated_at{0};
  // set once the job's message has been handed to the broker
  kj::Maybe<std::int64_t> queued_at;

  [[nodiscard]] JobRecord clone() const;
};

struct StrategyRecord final {
  std::int64_t id{0};
  std::int64_t user_id{0};
  kj::String name;
  kj::String file; // strategy source file name inside the user's sandbox
  kj::Maybe<kj::String> timeframe;
  kj::Array<kj::String> pairs;

  [[nodiscard]] StrategyRecord clone() const;
};

struct UserRecord final {
  std::int64_t id{0};
  kj::String principal; // external auth subject
  kj::Maybe<kj::String> name;

  [[nodiscard]] UserRecord clone() const;
};

/**
 * @brief Market parameters carried in a strategy's draft document
 */
struct StrategyDraft final {
  kj::Maybe<kj::String> timeframe;
  kj::Array<kj::String> pairs;
};

/**
 * @brief Decode `{"timeframe": "5m", "pairs": [...]}` from a draft document
 *
 * `pair_whitelist` is accepted as an alias for `pairs`. Empty, null or
 * malformed drafts decode to an empty StrategyDraft.
 */
[[nodiscard]] StrategyDraft parse_strategy_draft(kj::StringPtr json);

} // namespace gentrade::db
