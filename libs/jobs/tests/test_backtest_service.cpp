#include "gentrade/broker/connection_pool.h"
#include "gentrade/broker/job_message.h"
#include "gentrade/broker/memory_queue.h"
#include "gentrade/core/error.h"
#include "gentrade/core/json.h"
#include "gentrade/db/memory_database.h"
#include "gentrade/jobs/backtest_service.h"
#include "kj/test.h"

#include <cstring>

using namespace gentrade;
using namespace gentrade::jobs;

namespace {

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return std::strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

broker::PoolOptions pool_options() {
  broker::PoolOptions options;
  options.queue = kj::str("backtests");
  options.borrow_timeout = 200 * kj::MILLISECONDS;
  return options;
}

struct Fixture {
  db::MemoryDatabase database;
  db::TransactionManager tx{database};
  broker::MemoryQueue queue;
  broker::BrokerConnectionPool pool{queue, pool_options()};
  BacktestService service{tx, pool};
  kj::AsyncIoContext io = kj::setupAsyncIo();
  std::int64_t alice;
  std::int64_t strategy;
  std::int64_t foreign_strategy;

  Fixture() {
    alice = database.add_user("auth0|alice"_kj);
    auto bob = database.add_user("auth0|bob"_kj);
    strategy = database.add_strategy(alice, "Alpha"_kj, "Alpha.py"_kj);
    foreign_strategy = database.add_strategy(bob, "Beta"_kj, "Beta.py"_kj);
  }

  core::ErrorCode create_error(kj::StringPtr principal, std::int64_t strategy_id) {
    try {
      (void)service.create(io, principal, strategy_id, "20240101-20240131"_kj);
    } catch (const core::GentradeException& e) {
      return e.code();
    }
    return core::ErrorCode::Success;
  }

  db::JobRecord committed(std::int64_t id) {
    KJ_IF_SOME(job, database.job(id)) {
      return kj::mv(job);
    }
    KJ_FAIL_ASSERT("job not committed", id);
  }
};

KJ_TEST("BacktestService: create persists the job and queues its message") {
  Fixture f;
  auto id = f.service.create(f.io, "auth0|alice"_kj, f.strategy, "20240101-20240131"_kj);

  auto job = f.committed(id);
  KJ_EXPECT(job.status == db::JobStatus::Created);
  KJ_EXPECT(job.strategy_id == f.strategy);
  KJ_EXPECT(job.date_range == "20240101-20240131"_kj);

  auto payloads = f.queue.payloads("backtests"_kj);
  KJ_ASSERT(payloads.size() == 1);
  auto message = broker::decode_job_message(payloads[0]);
  KJ_EXPECT(message.job_id == id);
  KJ_EXPECT(message.strategy_id == f.strategy);
  KJ_EXPECT(message.principal_id == "auth0|alice"_kj);
  KJ_EXPECT(message.date_range == "20240101-20240131"_kj);
  KJ_EXPECT(f.database.open_sessions() == 0);
}

KJ_TEST("BacktestService: rejected submissions create no job and no message") {
  Fixture f;
  KJ_EXPECT(f.create_error("auth0|alice"_kj, f.foreign_strategy) == core::ErrorCode::Forbidden);
  KJ_EXPECT(f.create_error("auth0|alice"_kj, 4242) == core::ErrorCode::NotFound);
  KJ_EXPECT(f.create_error("auth0|nobody"_kj, f.strategy) ==
            core::ErrorCode::AuthenticationRequired);
  KJ_EXPECT_THROW_MESSAGE(
      "invalid date range",
      (void)f.service.create(f.io, "auth0|alice"_kj, f.strategy, "20240131-20240101"_kj));

  KJ_EXPECT(f.database.job_count() == 0);
  KJ_EXPECT(f.queue.published() == 0);
  KJ_EXPECT(f.tx.rolled_back() == 3);
}

KJ_TEST("BacktestService: broker outage after commit leaves an orphaned created job") {
  Fixture f;
  f.queue.refuse_connections(true);

  KJ_EXPECT(f.create_error("auth0|alice"_kj, f.strategy) == core::ErrorCode::BrokerUnavailable);
  KJ_ASSERT(f.database.job_count() == 1);
  auto orphans = f.tx.with_scope(f.io, [](db::UnitOfWork& uow) {
    return uow.jobs().list_by_status(db::JobStatus::Created);
  });
  KJ_ASSERT(orphans.size() == 1);
  KJ_EXPECT(f.queue.published() == 0);

  // the reconciliation sweep queues it once the broker is back
  f.queue.refuse_connections(false);
  KJ_EXPECT(f.service.resubmit_orphans(f.io, 0) == 1);
  auto payloads = f.queue.payloads("backtests"_kj);
  KJ_ASSERT(payloads.size() == 1);
  KJ_EXPECT(broker::decode_job_message(payloads[0]).job_id == orphans[0].id);
  KJ_EXPECT(broker::decode_job_message(payloads[0]).principal_id == "auth0|alice"_kj);
}

KJ_TEST("BacktestService: orphans younger than the minimum age are left alone") {
  Fixture f;
  f.queue.refuse_connections(true);
  KJ_EXPECT(f.create_error("auth0|alice"_kj, f.strategy) == core::ErrorCode::BrokerUnavailable);
  f.queue.refuse_connections(false);
  KJ_EXPECT(f.service.resubmit_orphans(f.io, 3600) == 0);
  KJ_EXPECT(f.queue.published() == 0);
}

KJ_TEST("BacktestService: resubmit only touches jobs still waiting") {
  Fixture f;
  auto id = f.service.create(f.io, "auth0|alice"_kj, f.strategy, "20240101-20240131"_kj);
  f.tx.with_scope(f.io, [&](db::UnitOfWork& uow) {
    KJ_ASSERT(uow.jobs().transition(id, db::JobStatus::Created, db::JobStatus::DownloadingData));
  });
  KJ_EXPECT(!f.service.resubmit(f.io, id));
  KJ_EXPECT(!f.service.resubmit(f.io, id + 100));
  KJ_EXPECT(f.queue.published() == 1);
}

KJ_TEST("BacktestService: a job whose message is still queued is not published again") {
  Fixture f;
  auto id = f.service.create(f.io, "auth0|alice"_kj, f.strategy, "20240101-20240131"_kj);
  KJ_EXPECT(f.queue.pending("backtests"_kj) == 1);
  KJ_EXPECT(f.committed(id).status == db::JobStatus::Created);
  KJ_EXPECT(f.committed(id).queued_at != kj::none);

  // no worker has picked it up yet; republishing would deliver it twice
  KJ_EXPECT(!f.service.resubmit(f.io, id));
  KJ_EXPECT(f.service.resubmit_orphans(f.io, 0) == 0);
  KJ_EXPECT(f.queue.pending("backtests"_kj) == 1);
  KJ_EXPECT(f.queue.published() == 1);
}

KJ_TEST("BacktestService: an orphan is published once by repeated sweeps") {
  Fixture f;
  f.queue.refuse_connections(true);
  KJ_EXPECT(f.create_error("auth0|alice"_kj, f.strategy) == core::ErrorCode::BrokerUnavailable);
  KJ_EXPECT(f.committed(1).queued_at == kj::none);
  f.queue.refuse_connections(false);

  KJ_EXPECT(f.service.resubmit(f.io, 1));
  KJ_EXPECT(f.committed(1).queued_at != kj::none);
  KJ_EXPECT(f.service.resubmit_orphans(f.io, 0) == 0);
  KJ_EXPECT(!f.service.resubmit(f.io, 1));
  KJ_EXPECT(f.queue.pending("backtests"_kj) == 1);
}

KJ_TEST("BacktestService: get returns the owner's view") {
  Fixture f;
  auto id = f.service.create(f.io, "auth0|alice"_kj, f.strategy, "20240101-20240131"_kj);

  auto view = f.service.get(f.io, "auth0|alice"_kj, id);
  KJ_EXPECT(view.id == id);
  KJ_EXPECT(view.status == db::JobStatus::Created);
  KJ_EXPECT(view.artifact_path == kj::none);

  auto doc = core::JsonDocument::parse(view.to_json());
  auto root = doc.root();
  KJ_EXPECT(root["id"].get_int() == id);
  KJ_EXPECT(root["status"].get_string() == "created"_kj);
  KJ_EXPECT(root["artifact_path"].is_null());
  KJ_EXPECT(root["error"].is_null());
  KJ_EXPECT(contains(root["created_at"].get_string(), "T"_kj));

  bool forbidden = false;
  try {
    (void)f.service.get(f.io, "auth0|bob"_kj, id);
  } catch (const core::ForbiddenException&) {
    forbidden = true;
  }
  KJ_EXPECT(forbidden);
}

KJ_TEST("JobView: finished jobs carry the artifact") {
  db::JobRecord record;
  record.id = 7;
  record.strategy_id = 3;
  record.date_range = kj::str("20240101-20240131");
  record.status = db::JobStatus::Finished;
  record.artifact_path = kj::str("/srv/user_a/user_data/backtest_results/b.zip");
  record.created_at = 1704067200;
  record.updated_at = 1704067260;

  auto doc = core::JsonDocument::parse(JobView::from(record).to_json());
  auto root = doc.root();
  KJ_EXPECT(root["status"].get_string() == "finished"_kj);
  KJ_EXPECT(root["artifact_path"].get_string() == "/srv/user_a/user_data/backtest_results/b.zip"_kj);
  KJ_EXPECT(root["created_at"].get_string() == "2024-01-01T00:00:00Z"_kj);
}

} // namespace
