#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/time.h>

// Forward declarations for libpq types to avoid including libpq-fe.h
struct pg_conn;
struct pg_result;

namespace gentrade::db {

// Query parameter; kj::none binds SQL NULL
using PgParam = kj::Maybe<kj::StringPtr>;

/**
 * @brief Owned libpq result set
 *
 * All values are text. Row and column indices are checked.
 */
class PgResult final {
public:
  PgResult() = default;
  explicit PgResult(pg_result* result);
  ~PgResult() noexcept;

  PgResult(PgResult&& other) noexcept;
  PgResult& operator=(PgResult&& other) noexcept;
  KJ_DISALLOW_COPY(PgResult);

  [[nodiscard]] int rows() const;
  [[nodiscard]] int columns() const;

  // Number of rows touched by INSERT/UPDATE/DELETE
  [[nodiscard]] std::int64_t affected() const;

  [[nodiscard]] bool is_null(int row, int column) const;
  [[nodiscard]] kj::StringPtr text(int row, int column) const;
  [[nodiscard]] kj::Maybe<kj::StringPtr> maybe_text(int row, int column) const;
  [[nodiscard]] std::int64_t int64(int row, int column) const;

private:
  pg_result* result_{nullptr};
};

/**
 * @brief One PostgreSQL connection
 *
 * The asynchronous calls drive libpq in non-blocking mode from the KJ event
 * port of the given context: the socket is watched with a fresh FdObserver
 * on every wait, backed by a short timer so an edge missed while libpq
 * switches sockets cannot stall a query. The blocking calls are for threads
 * that run no event loop.
 *
 * Failures raise kj::Exception: DISCONNECTED when the connection is gone,
 * FAILED when the server rejected the statement.
 */
class PgConnection final {
public:
  // Takes ownership of a handle from PQconnectStart/PQconnectdb
  explicit PgConnection(pg_conn* conn) : conn_(conn) {}
  ~PgConnection() noexcept;
  KJ_DISALLOW_COPY_AND_MOVE(PgConnection);

  static kj::Promise<kj::Own<PgConnection>> connect(kj::AsyncIoContext& io, kj::StringPtr conninfo,
                                                    kj::Duration timeout);
  static kj::Own<PgConnection> connect_blocking(kj::StringPtr conninfo, kj::Duration timeout);

  /**
   * @brief Run one statement
   *
   * The statement and parameters are handed to libpq before this returns, so
   * they only have to outlive the call itself.
   */
  kj::Promise<PgResult> exec(kj::AsyncIoContext& io, kj::StringPtr sql,
                             kj::ArrayPtr<const PgParam> params = nullptr);

  PgResult exec_blocking(kj::StringPtr sql, kj::ArrayPtr<const PgParam> params = nullptr);

  [[nodiscard]] bool is_open() const;
  [[nodiscard]] int socket() const;

  // Read pending NOTIFY payloads for `channel` without blocking
  [[nodiscard]] bool consume_notifications(kj::StringPtr channel);

  [[nodiscard]] pg_conn* raw() const {
    return conn_;
  }

private:
  kj::Promise<void> finish_connect(kj::AsyncIoContext& io);
  kj::Promise<void> wait_socket(kj::AsyncIoContext& io, bool writable);
  kj::Promise<PgResult> collect(kj::AsyncIoContext& io);

  [[noreturn]] void fail(kj::StringPtr what) const;

  pg_conn* conn_;
};

} // namespace gentrade::db
