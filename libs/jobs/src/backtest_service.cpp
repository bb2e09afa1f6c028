#include "gentrade/jobs/backtest_service.h"

#include "gentrade/broker/job_message.h"
#include "gentrade/core/error.h"
#include "gentrade/core/json.h"
#include "gentrade/core/logger.h"
#include "gentrade/core/metrics.h"
#include "gentrade/core/time.h"
#include "gentrade/exec/date_range.h"
#include "gentrade/jobs/ownership_guard.h"

#include <kj/vector.h>

namespace gentrade::jobs {

JobView JobView::from(const db::JobRecord& record) {
  JobView view;
  view.id = record.id;
  view.strategy_id = record.strategy_id;
  view.date_range = kj::str(record.date_range);
  view.status = record.status;
  KJ_IF_SOME(path, record.artifact_path) {
    view.artifact_path = kj::str(path);
  }
  KJ_IF_SOME(error, record.error) {
    view.error = kj::str(error);
  }
  view.created_at = record.created_at;
  view.updated_at = record.updated_at;
  return view;
}

kj::String JobView::to_json(bool pretty) const {
  auto builder = core::JsonBuilder::object();
  builder.put("id"_kj, id)
      .put("strategy_id"_kj, strategy_id)
      .put("date_range"_kj, date_range.asPtr())
      .put("status"_kj, db::to_string(status));
  KJ_IF_SOME(path, artifact_path) {
    builder.put("artifact_path"_kj, path.asPtr());
  } else {
    builder.put("artifact_path"_kj, nullptr);
  }
  KJ_IF_SOME(message, error) {
    builder.put("error"_kj, message.asPtr());
  } else {
    builder.put("error"_kj, nullptr);
  }
  builder.put("created_at"_kj, core::format_unix_seconds(created_at).asPtr())
      .put("updated_at"_kj, core::format_unix_seconds(updated_at).asPtr());
  return builder.build(pretty);
}

BacktestService::BacktestService(db::TransactionManager& transactions,
                                 broker::BrokerConnectionPool& pool)
    : transactions_(transactions), pool_(pool) {}

std::int64_t BacktestService::create(kj::AsyncIoContext& io, kj::StringPtr principal,
                                     std::int64_t strategy_id, kj::StringPtr date_range) {
  exec::require_date_range(date_range);

  auto message = transactions_.with_scope(io, [&](db::UnitOfWork& uow) {
    OwnershipGuard guard(uow);
    auto access = guard.require_strategy(principal, strategy_id);
    auto job = uow.jobs().insert(access.strategy.id, date_range);
    return broker::JobMessage{job.id, access.strategy.id, kj::str(principal), kj::str(date_range)};
  });

  core::global_logger().info(kj::str("created backtest ", message.job_id, " of strategy ",
                                     strategy_id, " over ", date_range));
  try {
    submit(message.job_id, broker::encode_job_message(message));
  } catch (const core::BrokerUnavailableException& e) {
    core::global_logger().error(kj::str("backtest ", message.job_id,
                                        " is stored but was not queued: ", e.message()));
    throw;
  }
  record_queued(io, message.job_id);
  return message.job_id;
}

JobView BacktestService::get(kj::AsyncIoContext& io, kj::StringPtr principal,
                             std::int64_t job_id) {
  return transactions_.with_scope(io, [&](db::UnitOfWork& uow) {
    OwnershipGuard guard(uow);
    return JobView::from(guard.require_job(principal, job_id));
  });
}

bool BacktestService::resubmit(kj::AsyncIoContext& io, std::int64_t job_id) {
  auto message = transactions_.with_scope(io, [&](db::UnitOfWork& uow) -> kj::Maybe<broker::JobMessage> {
    KJ_IF_SOME(job, uow.jobs().find(job_id)) {
      if (job.status != db::JobStatus::Created || job.queued_at != kj::none) {
        return kj::none;
      }
      KJ_IF_SOME(strategy, uow.strategies().find(job.strategy_id)) {
        KJ_IF_SOME(owner, uow.users().find(strategy.user_id)) {
          return broker::JobMessage{job.id, job.strategy_id, kj::mv(owner.principal),
                                    kj::mv(job.date_range)};
        }
      }
    }
    return kj::none;
  });

  KJ_IF_SOME(m, message) {
    submit(m.job_id, broker::encode_job_message(m));
    core::global_logger().info(kj::str("resubmitted backtest ", m.job_id));
    record_queued(io, m.job_id);
    return true;
  }
  core::global_logger().warn(kj::str("backtest ", job_id, " is not waiting to be queued"));
  return false;
}

size_t BacktestService::resubmit_orphans(kj::AsyncIoContext& io, std::int64_t min_age_seconds) {
  auto cutoff = core::now_unix_seconds() - min_age_seconds;
  auto candidates = transactions_.with_scope(io, [&](db::UnitOfWork& uow) {
    kj::Vector<std::int64_t> ids;
    for (auto& job : uow.jobs().list_by_status(db::JobStatus::Created)) {
      if (job.queued_at == kj::none && job.created_at <= cutoff) {
        ids.add(job.id);
      }
    }
    return ids.releaseAsArray();
  });

  size_t published = 0;
  for (auto id : candidates) {
    if (resubmit(io, id)) {
      ++published;
    }
  }
  return published;
}

broker::DeliveryResult BacktestService::submit(std::int64_t job_id, kj::String payload) {
  auto result = pool_.submit(job_id, payload);
  core::counter_inc(core::metric_names::kJobsSubmitted);
  if (result.attempts > 1) {
    core::global_logger().warn(kj::str("backtest ", job_id, " queued after ", result.attempts,
                                       " attempts"));
  }
  return result;
}

void BacktestService::record_queued(kj::AsyncIoContext& io, std::int64_t job_id) {
  kj::Maybe<kj::String> failure;
  try {
    transactions_.with_scope(io, [&](db::UnitOfWork& uow) { uow.jobs().mark_queued(job_id); });
  } catch (const core::GentradeException&) {
    failure = core::describe_current_exception();
  } catch (const kj::Exception& e) {
    failure = core::describe(e);
  }
  KJ_IF_SOME(error, failure) {
    // the message is already out; a later sweep may publish it a second time
    core::global_logger().error(
        kj::str("backtest ", job_id, " was queued but could not be marked: ", error));
  }
}

} // namespace gentrade::jobs
