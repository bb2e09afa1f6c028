/**
 * @file backtest_task.h
 * @brief Worker side of the backtest workflow
 */

#pragma once

#include "gentrade/broker/job_message.h"
#include "gentrade/db/transaction.h"
#include "gentrade/exec/execution_adapter.h"
#include "gentrade/exec/market_data.h"
#include "gentrade/jobs/execution_context.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::jobs {

enum class TaskOutcome : std::uint8_t {
  Finished = 0,
  Failed = 1,
  Skipped = 2, // nothing to do: job or strategy gone, or already handled
};

[[nodiscard]] kj::StringPtr to_string(TaskOutcome outcome);

struct TaskResult final {
  TaskOutcome outcome{TaskOutcome::Skipped};
  kj::Maybe<kj::String> error; // the summary recorded on a failed job

  TaskResult() = default;
  TaskResult(TaskOutcome outcome) : outcome(outcome) {}
  TaskResult(TaskOutcome outcome, kj::String error) : outcome(outcome), error(kj::mv(error)) {}
};

// Slack on top of a step's timeout before a job left in that step counts as
// abandoned by its worker
constexpr kj::Duration kStaleStepMargin = 300 * kj::SECONDS;

struct TaskOptions final {
  // Used when a strategy's draft names no pairs
  kj::Array<kj::String> default_pairs;
  // Longest a job may legitimately stay in downloading_data and running
  kj::Duration download_timeout = 1800 * kj::SECONDS;
  kj::Duration execution_timeout = 3600 * kj::SECONDS;
  kj::Duration stale_margin = kStaleStepMargin;
};

/**
 * @brief Drives one job through download, execution and its terminal status
 *
 * created -> downloading_data -> running -> finished, or failed from any of
 * them. Every status change is committed in its own scope before the next
 * step starts. Redelivered jobs are never executed twice: a terminal job is
 * skipped, and so is a job another worker is still moving through a step.
 * A job that has sat in a step longer than the step's timeout plus
 * `stale_margin` was left by a crashed worker and is failed as interrupted.
 *
 * Stateless between runs; one instance may serve several dispatch loops.
 */
class BacktestTask final {
public:
  BacktestTask(db::TransactionManager& transactions, exec::DataPreparer& data,
               exec::ExecutionRunner& runner, TaskOptions options = {});

  /**
   * @brief Run the pipeline for one message to a terminal status
   *
   * Failures of the pipeline are recorded on the job and reported as
   * TaskOutcome::Failed together with the recorded error. Only a failure to
   * record them escapes.
   */
  TaskResult run(ExecutionContext& context, const broker::JobMessage& message);

private:
  struct Loaded;

  kj::Maybe<Loaded> load(kj::AsyncIoContext& io, std::int64_t job_id);
  bool advance(kj::AsyncIoContext& io, std::int64_t job_id, db::JobStatus from, db::JobStatus to);
  TaskOutcome execute(kj::AsyncIoContext& io, Loaded& loaded, db::JobStatus& current);
  [[nodiscard]] bool abandoned(const db::JobRecord& job) const;
  TaskOutcome record_failure(kj::AsyncIoContext& io, std::int64_t job_id, db::JobStatus from,
                             kj::StringPtr error);

  db::TransactionManager& transactions_;
  exec::DataPreparer& data_;
  exec::ExecutionRunner& runner_;
  TaskOptions options_;
};

} // namespace gentrade::jobs
