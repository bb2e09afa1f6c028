#include "gentrade/db/memory_database.h"

#include "gentrade/core/error.h"
#include "gentrade/core/time.h"

#include <kj/debug.h>

namespace gentrade::db {

namespace {

template <typename T> void put(kj::TreeMap<std::int64_t, T>& map, std::int64_t key, T value) {
  map.upsert(key, kj::mv(value),
             [](T& existing, T&& replacement) { existing = kj::mv(replacement); });
}

} // namespace

class MemoryDatabase::MemorySession final : public Session {
public:
  explicit MemorySession(MemoryDatabase& db)
      : db_(db), jobs_(*this), strategies_(db), users_(db) {
    db_.open_sessions_.fetch_add(1);
    db_.sessions_opened_.fetch_add(1);
  }
  ~MemorySession() noexcept override {
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
    KJ_REQUIRE(!in_transaction_, "transaction already open");
    in_transaction_ = true;
    staged_.clear();
    queued_marks_.clear();
  }

  void commit() override {
    KJ_REQUIRE(in_transaction_, "commit without an open transaction");
    in_transaction_ = false;
    auto lock = state(db_).lockExclusive();
    if (lock->closed) {
      staged_.clear();
      queued_marks_.clear();
      throw core::DatabaseException("database is closed", kj::Exception::Type::DISCONNECTED);
    }
    if (lock->failing_commits > 0) {
      --lock->failing_commits;
      staged_.clear();
      queued_marks_.clear();
      throw core::DatabaseException("connection lost during commit",
                                    kj::Exception::Type::DISCONNECTED);
    }
    using HistoryEntry = kj::TreeMap<std::int64_t, kj::Vector<JobStatus>>::Entry;
    for (auto& entry : staged_) {
      auto& history = lock->history.findOrCreate(
          entry.key, [&]() { return HistoryEntry{entry.key, kj::Vector<JobStatus>()}; });
      if (history.size() == 0 || history.back() != entry.value.status) {
        history.add(entry.value.status);
      }
      put(lock->jobs, entry.key, kj::mv(entry.value));
    }
    staged_.clear();
    // applied against the committed row, as a conditional UPDATE would be
    auto now = core::now_unix_seconds();
    for (auto id : queued_marks_) {
      KJ_IF_SOME(job, lock->jobs.find(id)) {
        if (job.status == JobStatus::Created) {
          job.queued_at = now;
        }
      }
    }
    queued_marks_.clear();
  }

  void rollback() override {
    in_transaction_ = false;
    staged_.clear();
    queued_marks_.clear();
  }

private:
  class Jobs final : public JobRepository {
  public:
    explicit Jobs(MemorySession& session) : session_(session) {}

    JobRecord insert(std::int64_t strategy_id, kj::StringPtr date_range) override {
      JobRecord record;
      {
        auto lock = state(session_.db_).lockExclusive();
        if (lock->strategies.find(strategy_id) == kj::none) {
          throw core::DatabaseException(
              kj::str("foreign key violation: strategy ", strategy_id, " does not exist"));
        }
        record.id = lock->next_job_id++;
      }
      record.strategy_id = strategy_id;
      record.date_range = kj::str(date_range);
      record.status = JobStatus::Created;
      record.created_at = core::now_unix_seconds();
      record.updated_at = record.created_at;
      auto copy = record.clone();
      session_.stage(kj::mv(record));
      return copy;
    }

    kj::Maybe<JobRecord> find(std::int64_t id) override {
      KJ_IF_SOME(staged, session_.staged_.find(id)) {
        return staged.clone();
      }
      return session_.db_.job(id);
    }

    bool transition(std::int64_t id, JobStatus from, JobStatus to) override {
      require_advance(from, to);
      return compare_and_set(id, from, [&](JobRecord& job) { job.status = to; });
    }

    bool finish(std::int64_t id, kj::StringPtr artifact_path) override {
      KJ_REQUIRE(artifact_path.size() > 0, "finished job needs an artifact path");
      return compare_and_set(id, JobStatus::Running, [&](JobRecord& job) {
        job.status = JobStatus::Finished;
        job.artifact_path = kj::str(artifact_path);
      });
    }

    bool fail(std::int64_t id, JobStatus from, kj::StringPtr error) override {
      require_transition(from, JobStatus::Failed);
      return compare_and_set(id, from, [&](JobRecord& job) {
        job.status = JobStatus::Failed;
        job.error = kj::str(error);
      });
    }

    bool mark_queued(std::int64_t id) override {
      KJ_REQUIRE(session_.in_transaction_, "write outside a transaction");
      KJ_IF_SOME(job, find(id)) {
        if (job.status != JobStatus::Created) {
          return false;
        }
        session_.queued_marks_.add(id);
        return true;
      }
      return false;
    }

    kj::Array<JobRecord> list_for_strategy(std::int64_t strategy_id) override {
      return collect([&](const JobRecord& job) { return job.strategy_id == strategy_id; });
    }

    kj::Array<JobRecord> list_by_status(JobStatus status) override {
      return collect([&](const JobRecord& job) { return job.status == status; });
    }

  private:
    MemorySession& session_;

    template <typename Mutate>
    bool compare_and_set(std::int64_t id, JobStatus expected, Mutate&& mutate) {
      KJ_IF_SOME(job, find(id)) {
        if (job.status != expected) {
          return false;
        }
        mutate(job);
        job.updated_at = core::now_unix_seconds();
        session_.stage(kj::mv(job));
        return true;
      }
      return false;
    }

    template <typename Predicate> kj::Array<JobRecord> collect(Predicate&& predicate) {
      kj::Vector<JobRecord> result;
      {
        auto lock = state(session_.db_).lockShared();
        for (auto& entry : lock->jobs) {
          if (session_.staged_.find(entry.key) == kj::none && predicate(entry.value)) {
            result.add(entry.value.clone());
          }
        }
      }
      for (auto& entry : session_.staged_) {
        if (predicate(entry.value)) {
          result.add(entry.value.clone());
        }
      }
      return result.releaseAsArray();
    }
  };

  class Strategies final : public StrategyRepository {
  public:
    explicit Strategies(MemoryDatabase& db) : db_(db) {}

    kj::Maybe<StrategyRecord> find(std::int64_t id) override {
      auto lock = state(db_).lockShared();
      KJ_IF_SOME(strategy, lock->strategies.find(id)) {
        return strategy.clone();
      }
      return kj::none;
    }

  private:
    MemoryDatabase& db_;
  };

  class Users final : public UserRepository {
  public:
    explicit Users(MemoryDatabase& db) : db_(db) {}

    kj::Maybe<UserRecord> find_by_principal(kj::StringPtr principal) override {
      auto lock = state(db_).lockShared();
      for (auto& entry : lock->users) {
        if (entry.value.principal == principal) {
          return entry.value.clone();
        }
      }
      return kj::none;
    }

    kj::Maybe<UserRecord> find(std::int64_t id) override {
      auto lock = state(db_).lockShared();
      KJ_IF_SOME(user, lock->users.find(id)) {
        return user.clone();
      }
      return kj::none;
    }

  private:
    MemoryDatabase& db_;
  };

  static kj::MutexGuarded<MemoryDatabase::State>& state(MemoryDatabase& db) {
    return db.state_;
  }

  void stage(JobRecord record) {
    KJ_REQUIRE(in_transaction_, "write outside a transaction");
    auto id = record.id;
    put(staged_, id, kj::mv(record));
  }

  MemoryDatabase& db_;
  Jobs jobs_;
  Strategies strategies_;
  Users users_;
  kj::TreeMap<std::int64_t, JobRecord> staged_;
  kj::Vector<std::int64_t> queued_marks_;
  bool in_transaction_{false};
};

kj::Own<Session> MemoryDatabase::open_session(kj::AsyncIoContext&) {
  if (state_.lockShared()->closed) {
    throw core::DatabaseException("database is closed", kj::Exception::Type::DISCONNECTED);
  }
  return kj::heap<MemorySession>(*this);
}

void MemoryDatabase::close() {
  state_.lockExclusive()->closed = true;
}

std::int64_t MemoryDatabase::add_user(kj::StringPtr principal, kj::Maybe<kj::StringPtr> name) {
  auto lock = state_.lockExclusive();
  UserRecord user;
  user.id = lock->next_user_id++;
  user.principal = kj::str(principal);
  KJ_IF_SOME(n, name) {
    user.name = kj::str(n);
  }
  auto id = user.id;
  put(lock->users, id, kj::mv(user));
  return id;
}

std::int64_t MemoryDatabase::add_strategy(std::int64_t user_id, kj::StringPtr name,
                                          kj::StringPtr file, kj::StringPtr draft_json) {
  auto draft = parse_strategy_draft(draft_json);
  auto lock = state_.lockExclusive();
  KJ_REQUIRE(lock->users.find(user_id) != kj::none, "unknown user", user_id);
  StrategyRecord strategy;
  strategy.id = lock->next_strategy_id++;
  strategy.user_id = user_id;
  strategy.name = kj::str(name);
  strategy.file = kj::str(file);
  strategy.timeframe = kj::mv(draft.timeframe);
  strategy.pairs = kj::mv(draft.pairs);
  auto id = strategy.id;
  put(lock->strategies, id, kj::mv(strategy));
  return id;
}

void MemoryDatabase::remove_strategy(std::int64_t id) {
  auto lock = state_.lockExclusive();
  lock->strategies.erase(id);
}

void MemoryDatabase::remove_job(std::int64_t id) {
  auto lock = state_.lockExclusive();
  lock->jobs.erase(id);
}

void MemoryDatabase::backdate_job(std::int64_t id, std::int64_t seconds) {
  auto lock = state_.lockExclusive();
  KJ_IF_SOME(job, lock->jobs.find(id)) {
    job.created_at -= seconds;
    job.updated_at -= seconds;
  } else {
    KJ_FAIL_REQUIRE("unknown job", id);
  }
}

kj::Maybe<JobRecord> MemoryDatabase::job(std::int64_t id) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(record, lock->jobs.find(id)) {
    return record.clone();
  }
  return kj::none;
}

size_t MemoryDatabase::job_count() const {
  return state_.lockShared()->jobs.size();
}

kj::Array<JobStatus> MemoryDatabase::status_history(std::int64_t id) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(history, lock->history.find(id)) {
    return kj::heapArray<JobStatus>(history.asPtr());
  }
  return nullptr;
}

void MemoryDatabase::fail_next_commits(int count) {
  state_.lockExclusive()->failing_commits = count;
}

} // namespace gentrade::db
