#include "gentrade/db/pg_database.h"

#include "gentrade/core/error.h"
#include "gentrade/db/pg_connection.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace gentrade::db {

namespace {

constexpr kj::StringPtr kSchema[] = {
    R"(CREATE TABLE IF NOT EXISTS users (
         id BIGSERIAL PRIMARY KEY,
         principal TEXT NOT NULL UNIQUE,
         name TEXT
       ))"_kj,
    R"(CREATE TABLE IF NOT EXISTS strategies (
         id BIGSERIAL PRIMARY KEY,
         user_id BIGINT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
         name TEXT NOT NULL,
         file TEXT NOT NULL,
         draft JSONB NOT NULL DEFAULT '{}'::jsonb,
         created_at TIMESTAMPTZ NOT NULL DEFAULT now()
       ))"_kj,
    R"(CREATE TABLE IF NOT EXISTS backtests (
         id BIGSERIAL PRIMARY KEY,
         strategy_id BIGINT NOT NULL REFERENCES strategies(id) ON DELETE CASCADE,
         date_range TEXT NOT NULL,
         status TEXT NOT NULL DEFAULT 'created'
           CHECK (status IN ('created', 'downloading_data', 'running', 'finished', 'failed')),
         artifact_path TEXT,
         error TEXT,
         created_at TIMESTAMPTZ NOT NULL DEFAULT now(),
         updated_at TIMESTAMPTZ NOT NULL DEFAULT now(),
         queued_at TIMESTAMPTZ,
         CONSTRAINT artifact_iff_finished CHECK ((status = 'finished') = (artifact_path IS NOT NULL))
       ))"_kj,
    "ALTER TABLE backtests ADD COLUMN IF NOT EXISTS queued_at TIMESTAMPTZ"_kj,
    "CREATE INDEX IF NOT EXISTS backtests_strategy_idx ON backtests (strategy_id)"_kj,
    "CREATE INDEX IF NOT EXISTS backtests_status_idx ON backtests (status)"_kj,
    R"(CREATE TABLE IF NOT EXISTS job_queue (
         id BIGSERIAL PRIMARY KEY,
         queue TEXT NOT NULL,
         payload TEXT NOT NULL,
         deliveries INTEGER NOT NULL DEFAULT 0,
         enqueued_at TIMESTAMPTZ NOT NULL DEFAULT now(),
         visible_at TIMESTAMPTZ NOT NULL DEFAULT now()
       ))"_kj,
    "CREATE INDEX IF NOT EXISTS job_queue_visible_idx ON job_queue (queue, visible_at, id)"_kj,
};

constexpr kj::StringPtr kJobColumns =
    "id, strategy_id, date_range, status, artifact_path, error, "
    "extract(epoch FROM created_at)::bigint, extract(epoch FROM updated_at)::bigint, "
    "extract(epoch FROM queued_at)::bigint"_kj;

JobRecord job_from_row(const PgResult& result, int row) {
  JobRecord job;
  job.id = result.int64(row, 0);
  job.strategy_id = result.int64(row, 1);
  job.date_range = kj::str(result.text(row, 2));
  KJ_IF_SOME(status, parse_job_status(result.text(row, 3))) {
    job.status = status;
  } else {
    throw core::DatabaseException(kj::str("unknown job status '", result.text(row, 3), "'"));
  }
  KJ_IF_SOME(path, result.maybe_text(row, 4)) {
    job.artifact_path = kj::str(path);
  }
  KJ_IF_SOME(error, result.maybe_text(row, 5)) {
    job.error = kj::str(error);
  }
  job.created_at = result.int64(row, 6);
  job.updated_at = result.int64(row, 7);
  if (!result.is_null(row, 8)) {
    job.queued_at = result.int64(row, 8);
  }
  return job;
}

kj::Array<JobRecord> jobs_from_result(const PgResult& result) {
  kj::Vector<JobRecord> jobs(result.rows());
  for (int row = 0; row < result.rows(); ++row) {
    jobs.add(job_from_row(result, row));
  }
  return jobs.releaseAsArray();
}

} // namespace

class PgDatabase::PgSession final : public Session {
public:
  PgSession(PgDatabase& db, kj::AsyncIoContext& io, kj::Own<PgConnection> conn)
      : db_(db), io_(io), conn_(kj::mv(conn)), jobs_(*this), strategies_(*this), users_(*this) {
    db_.open_sessions_.fetch_add(1);
  }
  ~PgSession() noexcept override {
    db_.open_sessions_.fetch_sub(1);
  }

  JobRepository& jobs() override {
    return jobs_;
  }
  StrategyRepository& strategies() override {
    return strategies_;
  }
  UserRepository& users() override {
    return users_;
  }

  void begin() override {
    run("BEGIN"_kj);
  }
  void commit() override {
    run("COMMIT"_kj);
  }
  void rollback() override {
    run("ROLLBACK"_kj);
  }

  PgResult run(kj::StringPtr sql, kj::ArrayPtr<const PgParam> params = nullptr) {
    try {
      return conn_->exec(io_, sql, params).wait(io_.waitScope);
    } catch (kj::Exception& e) {
      throw core::DatabaseException(e.getDescription(), e.getType());
    }
  }

private:
  class Jobs final : public JobRepository {
  public:
    explicit Jobs(PgSession& session) : session_(session) {}

    JobRecord insert(std::int64_t strategy_id, kj::StringPtr date_range) override {
      auto id = kj::str(strategy_id);
      auto result = session_.run(
          kj::str("INSERT INTO backtests (strategy_id, date_range, status) "
                  "VALUES ($1::bigint, $2, 'created') RETURNING ",
                  kJobColumns),
          {PgParam(id.asPtr()), PgParam(date_range)});
      return job_from_row(result, 0);
    }

    kj::Maybe<JobRecord> find(std::int64_t id) override {
      auto key = kj::str(id);
      auto result = session_.run(
          kj::str("SELECT ", kJobColumns, " FROM backtests WHERE id = $1::bigint"),
          {PgParam(key.asPtr())});
      if (result.rows() == 0) {
        return kj::none;
      }
      return job_from_row(result, 0);
    }

    bool transition(std::int64_t id, JobStatus from, JobStatus to) override {
      require_advance(from, to);
      auto key = kj::str(id);
      auto result = session_.run("UPDATE backtests SET status = $3, updated_at = now() "
                                 "WHERE id = $1::bigint AND status = $2"_kj,
                                 {PgParam(key.asPtr()), PgParam(to_string(from)),
                                  PgParam(to_string(to))});
      return result.affected() == 1;
    }

    bool finish(std::int64_t id, kj::StringPtr artifact_path) override {
      KJ_REQUIRE(artifact_path.size() > 0, "finished job needs an artifact path");
      auto key = kj::str(id);
      auto result = session_.run(
          "UPDATE backtests SET status = 'finished', artifact_path = $2, updated_at = now() "
          "WHERE id = $1::bigint AND status = 'running'"_kj,
          {PgParam(key.asPtr()), PgParam(artifact_path)});
      return result.affected() == 1;
    }

    bool fail(std::int64_t id, JobStatus from, kj::StringPtr error) override {
      require_transition(from, JobStatus::Failed);
      auto key = kj::str(id);
      auto result = session_.run(
          "UPDATE backtests SET status = 'failed', error = $3, updated_at = now() "
          "WHERE id = $1::bigint AND status = $2"_kj,
          {PgParam(key.asPtr()), PgParam(to_string(from)), PgParam(error)});
      return result.affected() == 1;
    }

    bool mark_queued(std::int64_t id) override {
      auto key = kj::str(id);
      auto result = session_.run("UPDATE backtests SET queued_at = now() "
                                 "WHERE id = $1::bigint AND status = 'created'"_kj,
                                 {PgParam(key.asPtr())});
      return result.affected() == 1;
    }

    kj::Array<JobRecord> list_for_strategy(std::int64_t strategy_id) override {
      auto key = kj::str(strategy_id);
      return jobs_from_result(session_.run(
          kj::str("SELECT ", kJobColumns,
                  " FROM backtests WHERE strategy_id = $1::bigint ORDER BY id"),
          {PgParam(key.asPtr())}));
    }

    kj::Array<JobRecord> list_by_status(JobStatus status) override {
      return jobs_from_result(
          session_.run(kj::str("SELECT ", kJobColumns, " FROM backtests WHERE status = $1 ORDER BY id"),
                       {PgParam(to_string(status))}));
    }

  private:
    PgSession& session_;
  };

  class Strategies final : public StrategyRepository {
  public:
    explicit Strategies(PgSession& session) : session_(session) {}

    kj::Maybe<StrategyRecord> find(std::int64_t id) override {
      auto key = kj::str(id);
      auto result = session_.run(
          "SELECT id, user_id, name, file, draft::text FROM strategies WHERE id = $1::bigint"_kj,
          {PgParam(key.asPtr())});
      if (result.rows() == 0) {
        return kj::none;
      }
      StrategyRecord strategy;
      strategy.id = result.int64(0, 0);
      strategy.user_id = result.int64(0, 1);
      strategy.name = kj::str(result.text(0, 2));
      strategy.file = kj::str(result.text(0, 3));
      auto draft = parse_strategy_draft(result.maybe_text(0, 4).orDefault(""_kj));
      strategy.timeframe = kj::mv(draft.timeframe);
      strategy.pairs = kj::mv(draft.pairs);
      return kj::mv(strategy);
    }

  private:
    PgSession& session_;
  };

  class Users final : public UserRepository {
  public:
    explicit Users(PgSession& session) : session_(session) {}

    kj::Maybe<UserRecord> find_by_principal(kj::StringPtr principal) override {
      return one(session_.run("SELECT id, principal, name FROM users WHERE principal = $1"_kj,
                              {PgParam(principal)}));
    }

    kj::Maybe<UserRecord> find(std::int64_t id) override {
      auto key = kj::str(id);
      return one(session_.run("SELECT id, principal, name FROM users WHERE id = $1::bigint"_kj,
                              {PgParam(key.asPtr())}));
    }

  private:
    PgSession& session_;

    static kj::Maybe<UserRecord> one(const PgResult& result) {
      if (result.rows() == 0) {
        return kj::none;
      }
      UserRecord user;
      user.id = result.int64(0, 0);
      user.principal = kj::str(result.text(0, 1));
      KJ_IF_SOME(name, result.maybe_text(0, 2)) {
        user.name = kj::str(name);
      }
      return kj::mv(user);
    }
  };

  PgDatabase& db_;
  kj::AsyncIoContext& io_;
  kj::Own<PgConnection> conn_;
  Jobs jobs_;
  Strategies strategies_;
  Users users_;
};

PgDatabase::PgDatabase(PgOptions options) : options_(kj::mv(options)) {}

kj::Own<Session> PgDatabase::open_session(kj::AsyncIoContext& io) {
  if (closed_.load()) {
    throw core::DatabaseException("database is closed", kj::Exception::Type::DISCONNECTED);
  }
  kj::Own<PgConnection> conn;
  try {
    conn = PgConnection::connect(io, options_.conninfo, options_.connect_timeout).wait(io.waitScope);
  } catch (kj::Exception& e) {
    // connect timeouts surface as OVERLOADED; both mean no connection
    throw core::DatabaseException(kj::str("cannot open database session: ", e.getDescription()),
                                  kj::Exception::Type::DISCONNECTED);
  }
  return kj::heap<PgSession>(*this, io, kj::mv(conn));
}

void PgDatabase::close() {
  closed_.store(true);
}

void PgDatabase::migrate(kj::AsyncIoContext& io) {
  auto session = open_session(io);
  auto& pg = static_cast<PgSession&>(*session);
  pg.begin();
  try {
    for (auto statement : kSchema) {
      pg.run(statement);
    }
    pg.commit();
  } catch (...) {
    pg.rollback();
    throw;
  }
}

} // namespace gentrade::db
