#include "gentrade/jobs/backtest_task.h"

#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"
#include "gentrade/core/metrics.h"
#include "gentrade/core/time.h"

#include <exception>
#include <kj/exception.h>

namespace gentrade::jobs {

namespace {

double seconds_since(std::int64_t started_ns) {
  return static_cast<double>(core::now_unix_ns() - started_ns) / 1e9;
}

} // namespace

struct BacktestTask::Loaded {
  db::JobRecord job;
  db::StrategyRecord strategy;
  kj::String owner; // principal of the strategy's user
};

kj::StringPtr to_string(TaskOutcome outcome) {
  switch (outcome) {
  case TaskOutcome::Finished:
    return "finished"_kj;
  case TaskOutcome::Failed:
    return "failed"_kj;
  case TaskOutcome::Skipped:
    return "skipped"_kj;
  }
  return "unknown"_kj;
}

BacktestTask::BacktestTask(db::TransactionManager& transactions, exec::DataPreparer& data,
                           exec::ExecutionRunner& runner, TaskOptions options)
    : transactions_(transactions), data_(data), runner_(runner), options_(kj::mv(options)) {}

TaskResult BacktestTask::run(ExecutionContext& context, const broker::JobMessage& message) {
  auto& io = context.io();
  auto& log = core::global_logger();
  const auto job_id = message.job_id;
  const auto started = core::now_unix_ns();
  log.info(kj::str("backtest ", job_id, " picked up by ", context.id()));

  // Last status this task committed or observed; failures are recorded from it
  auto status = db::JobStatus::Created;
  auto outcome = TaskOutcome::Skipped;
  kj::Maybe<kj::String> failure;
  try {
    KJ_IF_SOME(loaded, load(io, job_id)) {
      status = loaded.job.status;
      if (db::is_terminal(status)) {
        log.info(kj::str("backtest ", job_id, " is already ", db::to_string(status),
                         ", ignoring the redelivery"));
        return TaskOutcome::Skipped;
      }
      if (status != db::JobStatus::Created) {
        if (!abandoned(loaded.job)) {
          log.warn(kj::str("backtest ", job_id, " is ", db::to_string(status),
                           " in another worker, ignoring the duplicate delivery"));
          return TaskOutcome::Skipped;
        }
        failure = kj::str("interrupted: the worker stopped while the job was ",
                          db::to_string(status));
      } else {
        outcome = execute(io, loaded, status);
      }
    } else {
      log.warn(kj::str("backtest ", job_id, " or its strategy no longer exists, skipping"));
      return TaskOutcome::Skipped;
    }
  } catch (const core::GentradeException&) {
    failure = core::describe_current_exception();
  } catch (const kj::Exception& e) {
    failure = core::describe(e);
  } catch (const std::exception& e) {
    failure = kj::str("unexpected error: ", e.what());
  }

  KJ_IF_SOME(error, failure) {
    log.error(kj::str("backtest ", job_id, " failed while ", db::to_string(status), " after ",
                      seconds_since(started), "s: ", error));
    outcome = record_failure(io, job_id, status, error);
  } else if (outcome == TaskOutcome::Finished) {
    log.info(kj::str("backtest ", job_id, " finished in ", seconds_since(started), "s"));
  }

  switch (outcome) {
  case TaskOutcome::Finished:
    core::counter_inc(core::metric_names::kJobsFinished);
    break;
  case TaskOutcome::Failed:
    core::counter_inc(core::metric_names::kJobsFailed);
    break;
  case TaskOutcome::Skipped:
    break;
  }
  core::histogram_observe(core::metric_names::kJobDuration, seconds_since(started));
  KJ_IF_SOME(error, failure) {
    if (outcome == TaskOutcome::Failed) {
      return TaskResult(outcome, kj::mv(error));
    }
  }
  return outcome;
}

bool BacktestTask::abandoned(const db::JobRecord& job) const {
  auto budget = options_.stale_margin;
  switch (job.status) {
  case db::JobStatus::DownloadingData:
    budget += options_.download_timeout;
    break;
  case db::JobStatus::Running:
    budget += options_.execution_timeout;
    break;
  default:
    return false;
  }
  return core::now_unix_seconds() - job.updated_at >= budget / kj::SECONDS;
}

kj::Maybe<BacktestTask::Loaded> BacktestTask::load(kj::AsyncIoContext& io, std::int64_t job_id) {
  return transactions_.with_scope(io, [&](db::UnitOfWork& uow) -> kj::Maybe<Loaded> {
    KJ_IF_SOME(job, uow.jobs().find(job_id)) {
      KJ_IF_SOME(strategy, uow.strategies().find(job.strategy_id)) {
        KJ_IF_SOME(owner, uow.users().find(strategy.user_id)) {
          return Loaded{kj::mv(job), kj::mv(strategy), kj::mv(owner.principal)};
        }
      }
    }
    return kj::none;
  });
}

bool BacktestTask::advance(kj::AsyncIoContext& io, std::int64_t job_id, db::JobStatus from,
                           db::JobStatus to) {
  bool moved = transactions_.with_scope(
      io, [&](db::UnitOfWork& uow) { return uow.jobs().transition(job_id, from, to); });
  if (moved) {
    core::global_logger().info(
        kj::str("backtest ", job_id, ": ", db::to_string(from), " -> ", db::to_string(to)));
  } else {
    core::global_logger().warn(kj::str("backtest ", job_id, " left ", db::to_string(from),
                                       " or was deleted before reaching ", db::to_string(to),
                                       ", abandoning it"));
  }
  return moved;
}

TaskOutcome BacktestTask::execute(kj::AsyncIoContext& io, Loaded& loaded,
                                  db::JobStatus& current) {
  const auto job_id = loaded.job.id;
  const auto& strategy = loaded.strategy;

  if (!advance(io, job_id, current, db::JobStatus::DownloadingData)) {
    return TaskOutcome::Skipped;
  }
  current = db::JobStatus::DownloadingData;

  kj::Maybe<kj::StringPtr> timeframe;
  KJ_IF_SOME(tf, strategy.timeframe) {
    timeframe = tf.asPtr();
  }
  kj::ArrayPtr<const kj::String> pairs = strategy.pairs;
  if (pairs.size() == 0) {
    pairs = options_.default_pairs;
  }
  data_.ensure(io, exec::DataRequest{loaded.owner, pairs, timeframe, loaded.job.date_range});

  if (!advance(io, job_id, current, db::JobStatus::Running)) {
    return TaskOutcome::Skipped;
  }
  current = db::JobStatus::Running;

  auto artifact =
      runner_.execute(io, exec::StrategyReference{kj::str(loaded.owner), kj::str(strategy.file)},
                      loaded.job.date_range);

  bool recorded = transactions_.with_scope(
      io, [&](db::UnitOfWork& uow) { return uow.jobs().finish(job_id, artifact); });
  if (!recorded) {
    core::global_logger().warn(kj::str("backtest ", job_id, " changed while running; result ",
                                       artifact, " was not recorded"));
    return TaskOutcome::Skipped;
  }
  current = db::JobStatus::Finished;
  core::global_logger().info(kj::str("backtest ", job_id, " result stored at ", artifact));
  return TaskOutcome::Finished;
}

TaskOutcome BacktestTask::record_failure(kj::AsyncIoContext& io, std::int64_t job_id,
                                         db::JobStatus from, kj::StringPtr error) {
  KJ_ON_SCOPE_FAILURE(core::global_logger().critical(
      kj::str("backtest ", job_id, " could not be marked failed and stays ", db::to_string(from))));
  bool marked = transactions_.with_scope(
      io, [&](db::UnitOfWork& uow) { return uow.jobs().fail(job_id, from, error); });
  if (!marked) {
    core::global_logger().warn(
        kj::str("backtest ", job_id, " was no longer ", db::to_string(from), " when failing it"));
    return TaskOutcome::Skipped;
  }
  return TaskOutcome::Failed;
}

} // namespace gentrade::jobs
