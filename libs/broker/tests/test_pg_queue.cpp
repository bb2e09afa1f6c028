#include "gentrade/broker/connection_pool.h"
#include "gentrade/broker/pg_queue.h"
#include "gentrade/core/error.h"
#include "kj/test.h"

using namespace gentrade::broker;

namespace {

PgQueueOptions unreachable() {
  PgQueueOptions options;
  options.conninfo = kj::str("postgresql://gentrade@127.0.0.1:1/gentrade");
  options.connect_timeout = 2 * kj::SECONDS;
  return options;
}

KJ_TEST("PgQueue: notification channel is derived from the queue name") {
  KJ_EXPECT(PgQueueConnector::channel_for("backtests"_kj) == "gentrade_backtests"_kj);
  KJ_EXPECT_THROW_MESSAGE("queue names", (void)PgQueueConnector::channel_for("Back-Tests"_kj));
}

KJ_TEST("PgQueue: refused connection is reported as DISCONNECTED") {
  PgQueueConnector connector(unreachable());
  KJ_EXPECT_THROW(DISCONNECTED, (void)connector.connect());
}

KJ_TEST("PgQueue: pool over an unreachable server raises BrokerUnavailable") {
  PgQueueConnector connector(unreachable());
  PoolOptions options;
  options.queue = kj::str("backtests");
  BrokerConnectionPool pool(connector, kj::mv(options));

  bool thrown = false;
  try {
    pool.submit(1, R"({"job_id": 1})"_kj);
  } catch (const gentrade::core::BrokerUnavailableException& e) {
    thrown = true;
    KJ_EXPECT(e.attempts() == 2);
  }
  KJ_EXPECT(thrown);
}

KJ_TEST("PgQueue: consumer receive against an unreachable server throws") {
  PgQueueConnector connector(unreachable());
  auto consumer = connector.open_consumer("backtests"_kj);
  KJ_EXPECT_THROW(DISCONNECTED, (void)consumer->receive(10 * kj::MILLISECONDS));
}

} // namespace
