#pragma once

#include "gentrade/db/records.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>

namespace gentrade::db {

/**
 * @brief Backtest job persistence
 *
 * Every status change is a compare-and-set against the status the caller
 * last observed. A false return means the row was missing or had already
 * moved on; the row is left untouched in that case.
 */
class JobRepository {
public:
  virtual ~JobRepository() = default;

  // New job in status `created`
  virtual JobRecord insert(std::int64_t strategy_id, kj::StringPtr date_range) = 0;
  virtual kj::Maybe<JobRecord> find(std::int64_t id) = 0;

  /**
   * @brief Advance along the success path to a non-terminal status
   * @throws core::InvalidTransitionException for an illegal pair or a terminal target
   */
  virtual bool transition(std::int64_t id, JobStatus from, JobStatus to) = 0;

  // running -> finished, recording the artifact
  virtual bool finish(std::int64_t id, kj::StringPtr artifact_path) = 0;

  // any non-terminal -> failed, recording the error summary
  virtual bool fail(std::int64_t id, JobStatus from, kj::StringPtr error) = 0;

  // Record that the job's message was published; applies only while the job
  // is still `created` and leaves updated_at alone
  virtual bool mark_queued(std::int64_t id) = 0;

  virtual kj::Array<JobRecord> list_for_strategy(std::int64_t strategy_id) = 0;
  virtual kj::Array<JobRecord> list_by_status(JobStatus status) = 0;
};

class StrategyRepository {
public:
  virtual ~StrategyRepository() = default;
  virtual kj::Maybe<StrategyRecord> find(std::int64_t id) = 0;
};

class UserRepository {
public:
  virtual ~UserRepository() = default;
  virtual kj::Maybe<UserRecord> find_by_principal(kj::StringPtr principal) = 0;
  virtual kj::Maybe<UserRecord> find(std::int64_t id) = 0;
};

/**
 * @brief Repository handle passed into a transactional scope
 */
class UnitOfWork {
public:
  virtual ~UnitOfWork() = default;
  virtual JobRepository& jobs() = 0;
  virtual StrategyRepository& strategies() = 0;
  virtual UserRepository& users() = 0;
};

/**
 * @brief One exclusive database connection
 *
 * Not thread-safe. A session belongs to the execution context that opened it
 * and is released when its owner drops it.
 */
class Session : public UnitOfWork {
public:
  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;
};

/**
 * @brief Process-wide connection factory
 *
 * Initialised once at startup and closed at shutdown; components receive it
 * by reference.
 */
class Database {
public:
  virtual ~Database() = default;

  /**
   * @brief Open a new connection bound to `io`
   * @throws core::DatabaseException when no connection can be established
   */
  virtual kj::Own<Session> open_session(kj::AsyncIoContext& io) = 0;

  virtual void close() = 0;
};

} // namespace gentrade::db
