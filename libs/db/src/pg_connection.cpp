#include "gentrade/db/pg_connection.h"

#include "gentrade/core/error.h"

#include <kj/async-unix.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <libpq-fe.h>

namespace gentrade::db {

namespace {

// Upper bound on a single socket wait before libpq is polled again
constexpr auto kSocketPollInterval = 50 * kj::MILLISECONDS;

kj::String trim_message(const char* message) {
  if (message == nullptr) {
    return kj::str("unknown libpq error");
  }
  kj::StringPtr text(message);
  size_t end = text.size();
  while (end > 0 && (text[end - 1] == '\n' || text[end - 1] == ' ')) {
    --end;
  }
  return kj::heapString(text.begin(), end);
}

kj::Array<const char*> param_values(kj::ArrayPtr<const PgParam> params) {
  return KJ_MAP(param, params) -> const char* {
    KJ_IF_SOME(value, param) {
      return value.cStr();
    }
    return nullptr;
  };
}

} // namespace

// PgResult

PgResult::PgResult(pg_result* result) : result_(result) {}

PgResult::~PgResult() noexcept {
  if (result_ != nullptr) {
    PQclear(result_);
  }
}

PgResult::PgResult(PgResult&& other) noexcept : result_(other.result_) {
  other.result_ = nullptr;
}

PgResult& PgResult::operator=(PgResult&& other) noexcept {
  if (this != &other) {
    if (result_ != nullptr) {
      PQclear(result_);
    }
    result_ = other.result_;
    other.result_ = nullptr;
  }
  return *this;
}

int PgResult::rows() const {
  return result_ == nullptr ? 0 : PQntuples(result_);
}

int PgResult::columns() const {
  return result_ == nullptr ? 0 : PQnfields(result_);
}

std::int64_t PgResult::affected() const {
  if (result_ == nullptr) {
    return 0;
  }
  kj::StringPtr tuples(PQcmdTuples(result_));
  return tuples.size() == 0 ? 0 : tuples.parseAs<std::int64_t>();
}

bool PgResult::is_null(int row, int column) const {
  KJ_REQUIRE(row >= 0 && row < rows() && column >= 0 && column < columns(),
             "result index out of range", row, column);
  return PQgetisnull(result_, row, column) != 0;
}

kj::StringPtr PgResult::text(int row, int column) const {
  KJ_REQUIRE(!is_null(row, column), "unexpected NULL value", row, column);
  return kj::StringPtr(PQgetvalue(result_, row, column),
                       static_cast<size_t>(PQgetlength(result_, row, column)));
}

kj::Maybe<kj::StringPtr> PgResult::maybe_text(int row, int column) const {
  if (is_null(row, column)) {
    return kj::none;
  }
  return text(row, column);
}

std::int64_t PgResult::int64(int row, int column) const {
  return text(row, column).parseAs<std::int64_t>();
}

// PgConnection

PgConnection::~PgConnection() noexcept {
  if (conn_ != nullptr) {
    PQfinish(conn_);
  }
}

kj::Promise<kj::Own<PgConnection>> PgConnection::connect(kj::AsyncIoContext& io,
                                                         kj::StringPtr conninfo,
                                                         kj::Duration timeout) {
  PGconn* raw = PQconnectStart(conninfo.cStr());
  if (raw == nullptr) {
    core::DatabaseException("libpq could not allocate a connection",
                            kj::Exception::Type::DISCONNECTED)
        .throwException();
  }
  auto conn = kj::heap<PgConnection>(raw);
  if (PQstatus(raw) == CONNECTION_BAD) {
    conn->fail("connection failed");
  }
  if (PQsetnonblocking(raw, 1) != 0) {
    conn->fail("cannot switch connection to non-blocking mode");
  }

  co_await io.provider->getTimer().timeoutAfter(timeout, conn->finish_connect(io));
  co_return kj::mv(conn);
}

kj::Own<PgConnection> PgConnection::connect_blocking(kj::StringPtr conninfo,
                                                    kj::Duration timeout) {
  // dbname is expanded as a full connection string; the later timeout overrides it
  auto seconds = kj::str(kj::max(timeout / kj::SECONDS, 1));
  const char* const keywords[] = {"dbname", "connect_timeout", nullptr};
  const char* const values[] = {conninfo.cStr(), seconds.cStr(), nullptr};
  PGconn* raw = PQconnectdbParams(keywords, values, 1);
  if (raw == nullptr) {
    core::DatabaseException("libpq could not allocate a connection",
                            kj::Exception::Type::DISCONNECTED)
        .throwException();
  }
  auto conn = kj::heap<PgConnection>(raw);
  if (PQstatus(raw) != CONNECTION_OK) {
    conn->fail("connection failed");
  }
  return conn;
}

kj::Promise<void> PgConnection::finish_connect(kj::AsyncIoContext& io) {
  // libpq expects the first wait to be for writability
  PostgresPollingStatusType state = PGRES_POLLING_WRITING;
  for (;;) {
    switch (state) {
    case PGRES_POLLING_OK:
      co_return;
    case PGRES_POLLING_FAILED:
      fail("connection failed");
    case PGRES_POLLING_READING:
      co_await wait_socket(io, false);
      break;
    default:
      co_await wait_socket(io, true);
      break;
    }
    state = PQconnectPoll(conn_);
  }
}

kj::Promise<void> PgConnection::wait_socket(kj::AsyncIoContext& io, bool writable) {
  // The socket may change while connecting, so it is looked up for every wait
  int fd = PQsocket(conn_);
  if (fd < 0) {
    fail("connection has no socket");
  }
  using Observer = kj::UnixEventPort::FdObserver;
  Observer observer(io.unixEventPort, fd, writable ? Observer::OBSERVE_WRITE : Observer::OBSERVE_READ);
  auto ready = writable ? observer.whenBecomesWritable() : observer.whenBecomesReadable();
  co_await ready.exclusiveJoin(io.provider->getTimer().afterDelay(kSocketPollInterval));
}

kj::Promise<PgResult> PgConnection::exec(kj::AsyncIoContext& io, kj::StringPtr sql,
                                         kj::ArrayPtr<const PgParam> params) {
  auto values = param_values(params);
  if (PQsendQueryParams(conn_, sql.cStr(), static_cast<int>(values.size()), nullptr,
                        values.begin(), nullptr, nullptr, 0) == 0) {
    fail("cannot send query");
  }
  return collect(io);
}

kj::Promise<PgResult> PgConnection::collect(kj::AsyncIoContext& io) {
  for (;;) {
    int flushed = PQflush(conn_);
    if (flushed == 0) {
      break;
    }
    if (flushed < 0) {
      fail("cannot flush query");
    }
    co_await wait_socket(io, true);
    if (PQconsumeInput(conn_) == 0) {
      fail("cannot read from server");
    }
  }

  kj::Maybe<PgResult> last;
  for (;;) {
    while (PQisBusy(conn_) == 0) {
      PGresult* raw = PQgetResult(conn_);
      if (raw == nullptr) {
        KJ_IF_SOME(result, last) {
          co_return kj::mv(result);
        }
        fail("query produced no result");
      }
      auto status = PQresultStatus(raw);
      if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        auto message = trim_message(PQresultErrorMessage(raw));
        PQclear(raw);
        // drain the remaining results so the connection stays usable
        while (PGresult* rest = PQgetResult(conn_)) {
          PQclear(rest);
        }
        fail(message);
      }
      last = PgResult(raw);
    }
    co_await wait_socket(io, false);
    if (PQconsumeInput(conn_) == 0) {
      fail("cannot read from server");
    }
  }
}

PgResult PgConnection::exec_blocking(kj::StringPtr sql, kj::ArrayPtr<const PgParam> params) {
  auto values = param_values(params);
  PGresult* raw = PQexecParams(conn_, sql.cStr(), static_cast<int>(values.size()), nullptr,
                               values.begin(), nullptr, nullptr, 0);
  if (raw == nullptr) {
    fail("query failed");
  }
  PgResult result(raw);
  auto status = PQresultStatus(raw);
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
    fail(trim_message(PQresultErrorMessage(raw)));
  }
  return result;
}

bool PgConnection::is_open() const {
  return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

int PgConnection::socket() const {
  return PQsocket(conn_);
}

bool PgConnection::consume_notifications(kj::StringPtr channel) {
  if (PQconsumeInput(conn_) == 0) {
    fail("cannot read from server");
  }
  bool matched = false;
  while (PGnotify* notify = PQnotifies(conn_)) {
    if (channel == notify->relname) {
      matched = true;
    }
    PQfreemem(notify);
  }
  return matched;
}

void PgConnection::fail(kj::StringPtr what) const {
  auto type = PQstatus(conn_) == CONNECTION_BAD ? kj::Exception::Type::DISCONNECTED
                                                : kj::Exception::Type::FAILED;
  auto detail = trim_message(PQerrorMessage(conn_));
  if (detail.size() > 0 && what != detail) {
    core::DatabaseException(kj::str(what, ": ", detail), type).throwException();
  }
  core::DatabaseException(what, type).throwException();
}

} // namespace gentrade::db
