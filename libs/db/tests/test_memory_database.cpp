#include "gentrade/core/error.h"
#include "gentrade/db/memory_database.h"
#include "gentrade/db/transaction.h"
#include "kj/test.h"

#include <kj/async-io.h>

using namespace gentrade::db;

namespace {

kj::StringPtr text_of(const kj::Maybe<kj::String>& value) {
  KJ_IF_SOME(text, value) {
    return text;
  }
  return ""_kj;
}

struct Fixture {
  MemoryDatabase db;
  TransactionManager tx{db};
  std::int64_t user_id;
  std::int64_t strategy_id;

  Fixture() {
    user_id = db.add_user("auth0|alice"_kj, "alice"_kj);
    strategy_id = db.add_strategy(user_id, "SampleStrategy"_kj, "sample_strategy.py"_kj,
                                  R"({"timeframe": "1h", "pairs": ["BTC/USDT:USDT"]})"_kj);
  }

  JobRecord committed(std::int64_t id) {
    KJ_IF_SOME(job, db.job(id)) {
      return kj::mv(job);
    }
    KJ_FAIL_ASSERT("job not committed", id);
  }

  std::int64_t insert_job(kj::AsyncIoContext& io) {
    return tx.with_scope(io, [&](UnitOfWork& uow) {
      return uow.jobs().insert(strategy_id, "20240101-20240131"_kj).id;
    });
  }
};

KJ_TEST("TransactionManager: commit publishes staged writes") {
  auto io = kj::setupAsyncIo();
  Fixture f;

  auto id = f.insert_job(io);
  auto job = f.committed(id);
  KJ_EXPECT(job.status == JobStatus::Created);
  KJ_EXPECT(job.strategy_id == f.strategy_id);
  KJ_EXPECT(job.artifact_path == kj::none);
  KJ_EXPECT(job.created_at > 0);
  KJ_EXPECT(f.tx.committed() == 1);
  KJ_EXPECT(f.db.open_sessions() == 0);
}

KJ_TEST("TransactionManager: exception rolls back and propagates unchanged") {
  auto io = kj::setupAsyncIo();
  Fixture f;

  bool thrown = false;
  try {
    f.tx.with_scope(io, [&](UnitOfWork& uow) {
      uow.jobs().insert(f.strategy_id, "20240101-20240131"_kj);
      throw gentrade::core::ForbiddenException("not yours");
    });
  } catch (const gentrade::core::ForbiddenException& e) {
    thrown = true;
    KJ_EXPECT(e.message() == "not yours"_kj);
  }
  KJ_EXPECT(thrown);
  KJ_EXPECT(f.db.job_count() == 0);
  KJ_EXPECT(f.tx.rolled_back() == 1);
  KJ_EXPECT(f.db.open_sessions() == 0);
}

KJ_TEST("TransactionManager: writes are visible inside their own scope only") {
  auto io = kj::setupAsyncIo();
  Fixture f;

  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    auto job = uow.jobs().insert(f.strategy_id, "20240101-20240131"_kj);
    KJ_EXPECT(uow.jobs().find(job.id) != kj::none);
    KJ_EXPECT(f.db.job(job.id) == kj::none);

    // a nested scope gets its own session and does not see uncommitted rows
    f.tx.with_scope(io, [&](UnitOfWork& inner) {
      KJ_EXPECT(&inner != &uow);
      KJ_EXPECT(inner.jobs().find(job.id) == kj::none);
      KJ_EXPECT(f.db.open_sessions() == 2);
    });
  });
  KJ_EXPECT(f.db.job_count() == 1);
  KJ_EXPECT(f.db.sessions_opened() == 2);
  KJ_EXPECT(f.db.open_sessions() == 0);
}

KJ_TEST("JobRepository: status updates are compare-and-set") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  auto id = f.insert_job(io);

  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.jobs().transition(id, JobStatus::Created, JobStatus::DownloadingData));
    // stale expectation: the row has already moved on
    KJ_EXPECT(!uow.jobs().transition(id, JobStatus::Created, JobStatus::DownloadingData));
    KJ_EXPECT(!uow.jobs().transition(id + 100, JobStatus::Created, JobStatus::DownloadingData));
    KJ_EXPECT(uow.jobs().transition(id, JobStatus::DownloadingData, JobStatus::Running));
    KJ_EXPECT(!uow.jobs().finish(id + 100, "/tmp/a.json"_kj));
    KJ_EXPECT(uow.jobs().finish(id, "/tmp/a.json"_kj));
    KJ_EXPECT(!uow.jobs().fail(id, JobStatus::Running, "late"_kj));
  });

  auto job = f.committed(id);
  KJ_EXPECT(job.status == JobStatus::Finished);
  KJ_EXPECT(text_of(job.artifact_path) == "/tmp/a.json"_kj);
  KJ_EXPECT(job.error == kj::none);
}

KJ_TEST("JobRepository: illegal transitions are rejected before any write") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  auto id = f.insert_job(io);

  bool thrown = false;
  try {
    f.tx.with_scope(io, [&](UnitOfWork& uow) {
      uow.jobs().transition(id, JobStatus::Created, JobStatus::Running);
    });
  } catch (const gentrade::core::InvalidTransitionException&) {
    thrown = true;
  }
  KJ_EXPECT(thrown);
  KJ_EXPECT(f.committed(id).status == JobStatus::Created);
}

KJ_TEST("JobRepository: fail records the error summary") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  auto id = f.insert_job(io);

  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.jobs().transition(id, JobStatus::Created, JobStatus::DownloadingData));
  });
  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.jobs().fail(id, JobStatus::DownloadingData, "no data for BTC/USDT"_kj));
  });

  auto job = f.committed(id);
  KJ_EXPECT(job.status == JobStatus::Failed);
  KJ_EXPECT(text_of(job.error) == "no data for BTC/USDT"_kj);
  KJ_EXPECT(job.artifact_path == kj::none);

  auto history = f.db.status_history(id);
  KJ_ASSERT(history.size() == 3);
  KJ_EXPECT(history[0] == JobStatus::Created);
  KJ_EXPECT(history[1] == JobStatus::DownloadingData);
  KJ_EXPECT(history[2] == JobStatus::Failed);
}

KJ_TEST("JobRepository: the queued mark applies to created jobs only") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  auto waiting = f.insert_job(io);
  auto started = f.insert_job(io);
  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.jobs().transition(started, JobStatus::Created, JobStatus::DownloadingData));
  });
  auto updated_at = f.committed(waiting).updated_at;

  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.jobs().mark_queued(waiting));
    KJ_EXPECT(!uow.jobs().mark_queued(started));
    KJ_EXPECT(!uow.jobs().mark_queued(waiting + 100));
  });

  auto job = f.committed(waiting);
  KJ_EXPECT(job.queued_at != kj::none);
  KJ_EXPECT(job.updated_at == updated_at);
  KJ_EXPECT(job.status == JobStatus::Created);
  KJ_EXPECT(f.committed(started).queued_at == kj::none);
  KJ_EXPECT(f.committed(started).status == JobStatus::DownloadingData);
}

KJ_TEST("JobRepository: a queued mark does not undo a concurrent pickup") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  auto id = f.insert_job(io);

  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.jobs().mark_queued(id));
    // a worker commits the pickup while the mark is still staged
    f.tx.with_scope(io, [&](UnitOfWork& worker) {
      KJ_EXPECT(worker.jobs().transition(id, JobStatus::Created, JobStatus::DownloadingData));
    });
  });

  auto job = f.committed(id);
  KJ_EXPECT(job.status == JobStatus::DownloadingData);
  KJ_EXPECT(job.queued_at == kj::none);
}

KJ_TEST("JobRepository: listing by strategy and status") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  auto first = f.insert_job(io);
  f.insert_job(io);
  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    uow.jobs().fail(first, JobStatus::Created, "broker down"_kj);
  });

  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.jobs().list_for_strategy(f.strategy_id).size() == 2);
    KJ_EXPECT(uow.jobs().list_for_strategy(f.strategy_id + 1).size() == 0);
    KJ_EXPECT(uow.jobs().list_by_status(JobStatus::Created).size() == 1);
    KJ_EXPECT(uow.jobs().list_by_status(JobStatus::Failed).size() == 1);
  });
}

KJ_TEST("MemoryDatabase: injected commit failure discards the scope") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  f.db.fail_next_commits(1);

  bool thrown = false;
  try {
    f.insert_job(io);
  } catch (const gentrade::core::DatabaseException& e) {
    thrown = true;
    KJ_EXPECT(e.is_retryable());
  }
  KJ_EXPECT(thrown);
  KJ_EXPECT(f.db.job_count() == 0);
  KJ_EXPECT(f.db.open_sessions() == 0);

  f.insert_job(io);
  KJ_EXPECT(f.db.job_count() == 1);
}

KJ_TEST("MemoryDatabase: strategies and users are resolved") {
  auto io = kj::setupAsyncIo();
  Fixture f;

  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_IF_SOME(user, uow.users().find_by_principal("auth0|alice"_kj)) {
      KJ_EXPECT(user.id == f.user_id);
    } else {
      KJ_FAIL_EXPECT("principal not resolved");
    }
    KJ_EXPECT(uow.users().find_by_principal("auth0|mallory"_kj) == kj::none);

    KJ_IF_SOME(strategy, uow.strategies().find(f.strategy_id)) {
      KJ_EXPECT(strategy.user_id == f.user_id);
      KJ_EXPECT(text_of(strategy.timeframe) == "1h"_kj);
      KJ_EXPECT(strategy.pairs.size() == 1);
    } else {
      KJ_FAIL_EXPECT("strategy not found");
    }
  });

  f.db.remove_strategy(f.strategy_id);
  f.tx.with_scope(io, [&](UnitOfWork& uow) {
    KJ_EXPECT(uow.strategies().find(f.strategy_id) == kj::none);
  });
}

KJ_TEST("MemoryDatabase: closed database refuses sessions") {
  auto io = kj::setupAsyncIo();
  Fixture f;
  f.db.close();
  bool thrown = false;
  try {
    (void)f.db.open_session(io);
  } catch (const gentrade::core::DatabaseException& e) {
    thrown = true;
    KJ_EXPECT(e.message() == "database is closed"_kj);
  }
  KJ_EXPECT(thrown);
}

} // namespace
