#pragma once

#include "gentrade/db/repository.h"

#include <atomic>
#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::db {

struct PgOptions final {
  kj::String conninfo; // libpq connection string or URI
  kj::Duration connect_timeout = 5 * kj::SECONDS;
};

/**
 * @brief PostgreSQL-backed Database
 *
 * Every session owns one PGconn, opened asynchronously on the session's own
 * event loop. Statements run asynchronously and the repositories wait for
 * them on the context's WaitScope, so a session may only be used from the top
 * level of its context, never from inside a promise callback.
 */
class PgDatabase final : public Database {
public:
  explicit PgDatabase(PgOptions options);
  ~PgDatabase() noexcept override = default;

  kj::Own<Session> open_session(kj::AsyncIoContext& io) override;
  void close() override;

  // Idempotent schema setup
  void migrate(kj::AsyncIoContext& io);

  [[nodiscard]] int open_sessions() const noexcept {
    return open_sessions_.load();
  }

private:
  class PgSession;

  PgOptions options_;
  std::atomic<bool> closed_{false};
  std::atomic<int> open_sessions_{0};
};

} // namespace gentrade::db
