#pragma once

#include "gentrade/db/repository.h"

#include <atomic>
#include <cstdint>
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/vector.h>

namespace gentrade::db {

/**
 * @brief In-process Database for tests and local runs
 *
 * Thread-safe. Sessions stage their writes and publish them on commit;
 * rollback discards them. Ids come from shared sequences and, like database
 * sequences, are not reused after a rollback.
 */
class MemoryDatabase final : public Database {
public:
  MemoryDatabase() = default;
  ~MemoryDatabase() noexcept override = default;

  kj::Own<Session> open_session(kj::AsyncIoContext& io) override;
  void close() override;

  // Seeding, committed immediately
  std::int64_t add_user(kj::StringPtr principal, kj::Maybe<kj::StringPtr> name = kj::none);
  std::int64_t add_strategy(std::int64_t user_id, kj::StringPtr name, kj::StringPtr file,
                            kj::StringPtr draft_json = ""_kj);
  void remove_strategy(std::int64_t id);
  void remove_job(std::int64_t id);
  // Shift a committed job's timestamps `seconds` into the past
  void backdate_job(std::int64_t id, std::int64_t seconds);

  // Committed view, bypassing sessions
  [[nodiscard]] kj::Maybe<JobRecord> job(std::int64_t id) const;
  [[nodiscard]] size_t job_count() const;

  // Every status a job has been committed with, in commit order
  [[nodiscard]] kj::Array<JobStatus> status_history(std::int64_t id) const;

  // The next `count` commits fail with a DISCONNECTED DatabaseException
  void fail_next_commits(int count);

  // Connection accounting
  [[nodiscard]] int open_sessions() const noexcept {
    return open_sessions_.load();
  }
  [[nodiscard]] std::int64_t sessions_opened() const noexcept {
    return sessions_opened_.load();
  }

private:
  class MemorySession;
  friend class MemorySession;

  struct State {
    kj::TreeMap<std::int64_t, UserRecord> users;
    kj::TreeMap<std::int64_t, StrategyRecord> strategies;
    kj::TreeMap<std::int64_t, JobRecord> jobs;
    kj::TreeMap<std::int64_t, kj::Vector<JobStatus>> history;
    std::int64_t next_user_id{1};
    std::int64_t next_strategy_id{1};
    std::int64_t next_job_id{1};
    int failing_commits{0};
    bool closed{false};
  };

  kj::MutexGuarded<State> state_;
  std::atomic<int> open_sessions_{0};
  std::atomic<std::int64_t> sessions_opened_{0};
};

} // namespace gentrade::db
