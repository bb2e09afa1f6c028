/**
 * @file backtest_service.h
 * @brief Submission side of the backtest workflow
 */

#pragma once

#include "gentrade/broker/connection_pool.h"
#include "gentrade/db/records.h"
#include "gentrade/db/transaction.h"

#include <cstdint>
#include <kj/async-io.h>
#include <kj/string.h>

namespace gentrade::jobs {

/**
 * @brief What a polling client sees of a job
 */
struct JobView final {
  std::int64_t id{0};
  std::int64_t strategy_id{0};
  kj::String date_range;
  db::JobStatus status{db::JobStatus::Created};
  kj::Maybe<kj::String> artifact_path; // only when finished
  kj::Maybe<kj::String> error;         // only when failed
  std::int64_t created_at{0};
  std::int64_t updated_at{0};

  static JobView from(const db::JobRecord& record);

  // {"id", "strategy_id", "date_range", "status", "artifact_path", "error", "created_at", "updated_at"}
  [[nodiscard]] kj::String to_json(bool pretty = false) const;
};

/**
 * @brief Creates backtest jobs and hands them to the broker
 *
 * The job row is committed before the message is published, and marked as
 * queued once the broker has accepted it. When publishing fails the row stays
 * unmarked in `created` and can be found by resubmit_orphans().
 */
class BacktestService final {
public:
  BacktestService(db::TransactionManager& transactions, broker::BrokerConnectionPool& pool);

  /**
   * @brief Check ownership, persist the job and submit it
   * @return the new job id
   * @throws kj::Exception (FAILED) for a malformed date range, before anything is written
   * @throws core::AuthenticationRequiredException, core::NotFoundException,
   *         core::ForbiddenException, core::BrokerUnavailableException
   */
  std::int64_t create(kj::AsyncIoContext& io, kj::StringPtr principal, std::int64_t strategy_id,
                      kj::StringPtr date_range);

  JobView get(kj::AsyncIoContext& io, kj::StringPtr principal, std::int64_t job_id);

  /**
   * @brief Publish the message of a job that is `created` and was never queued
   * @return false when the job is gone, already queued or already picked up
   */
  bool resubmit(kj::AsyncIoContext& io, std::int64_t job_id);

  /**
   * @brief Resubmit every unqueued `created` job older than `min_age_seconds`
   *
   * Stops at the first broker failure, which propagates. Returns the number
   * of jobs published.
   */
  size_t resubmit_orphans(kj::AsyncIoContext& io, std::int64_t min_age_seconds);

private:
  broker::DeliveryResult submit(std::int64_t job_id, kj::String payload);
  void record_queued(kj::AsyncIoContext& io, std::int64_t job_id);

  db::TransactionManager& transactions_;
  broker::BrokerConnectionPool& pool_;
};

} // namespace gentrade::jobs
