#include "gentrade/broker/pg_queue.h"

#include "gentrade/core/logger.h"
#include "gentrade/db/pg_connection.h"

#include <cerrno>
#include <kj/debug.h>
#include <poll.h>

namespace gentrade::broker {

using db::PgConnection;
using db::PgParam;

namespace {

bool valid_queue_name(kj::StringPtr queue) {
  if (queue.size() == 0) {
    return false;
  }
  for (char c : queue) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

class PgQueueConnection final : public BrokerConnection {
public:
  explicit PgQueueConnection(kj::Own<PgConnection> conn) : conn_(kj::mv(conn)) {}

  DeliveryReceipt publish(kj::StringPtr queue, kj::StringPtr payload) override {
    auto channel = PgQueueConnector::channel_for(queue);
    // NOTIFY is delivered when the INSERT commits, never before
    auto result = conn_->exec_blocking(
        "WITH inserted AS ("
        "  INSERT INTO job_queue (queue, payload) VALUES ($1, $2) RETURNING id)"
        " SELECT id, pg_notify($3, id::text) FROM inserted"_kj,
        {PgParam(queue), PgParam(payload), PgParam(channel.asPtr())});
    KJ_REQUIRE(result.rows() == 1, "queue insert returned no id");
    return DeliveryReceipt{kj::str(result.text(0, 0))};
  }

  bool is_open() const override {
    return conn_->is_open();
  }

private:
  kj::Own<PgConnection> conn_;
};

class PgQueueConsumer final : public BrokerConsumer {
public:
  PgQueueConsumer(const PgQueueOptions& options, kj::StringPtr queue)
      : options_(options), queue_(kj::str(queue)), channel_(PgQueueConnector::channel_for(queue)),
        visibility_(kj::str(options.visibility_timeout / kj::MILLISECONDS)) {}

  kj::Maybe<Delivery> receive(kj::Duration timeout) override {
    auto& clock = kj::systemPreciseMonotonicClock();
    auto deadline = clock.now() + timeout;
    auto& conn = ensure_connected();
    for (;;) {
      KJ_IF_SOME(delivery, claim(conn)) {
        return kj::mv(delivery);
      }
      auto now = clock.now();
      if (now >= deadline) {
        return kj::none;
      }
      auto wait = kj::min(deadline - now, options_.poll_interval);
      wait_for_notify(conn, wait);
    }
  }

  void ack(const Delivery& delivery) override {
    auto& conn = ensure_connected();
    auto result = conn.exec_blocking("DELETE FROM job_queue WHERE id = $1::bigint"_kj,
                                     {PgParam(delivery.tag.asPtr())});
    if (result.affected() == 0) {
      core::global_logger().warn(
          kj::str("ack for message ", delivery.tag, " on '", queue_, "' found no row"));
    }
  }

private:
  // Reconnects lazily after the server went away; LISTEN does not survive that
  PgConnection& ensure_connected() {
    KJ_IF_SOME(conn, conn_) {
      if (conn->is_open()) {
        return *conn;
      }
      core::global_logger().warn(kj::str("queue consumer for '", queue_, "' reconnecting"));
    }
    auto fresh = PgConnection::connect_blocking(options_.conninfo, options_.connect_timeout);
    fresh->exec_blocking(kj::str("LISTEN ", channel_));
    auto& ref = *fresh;
    conn_ = kj::mv(fresh);
    return ref;
  }

  kj::Maybe<Delivery> claim(PgConnection& conn) {
    auto result = conn.exec_blocking(
        "UPDATE job_queue SET deliveries = deliveries + 1,"
        "   visible_at = now() + ($2::bigint * interval '1 millisecond')"
        " WHERE id = (SELECT id FROM job_queue WHERE queue = $1 AND visible_at <= now()"
        "             ORDER BY id FOR UPDATE SKIP LOCKED LIMIT 1)"
        " RETURNING id, payload, deliveries"_kj,
        {PgParam(queue_.asPtr()), PgParam(visibility_.asPtr())});
    if (result.rows() == 0) {
      return kj::none;
    }
    Delivery delivery;
    delivery.tag = kj::str(result.text(0, 0));
    delivery.payload = kj::str(result.text(0, 1));
    delivery.redelivered = result.int64(0, 2) > 1;
    return kj::mv(delivery);
  }

  void wait_for_notify(PgConnection& conn, kj::Duration wait) {
    struct pollfd pfd{};
    pfd.fd = conn.socket();
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(wait / kj::MILLISECONDS));
    if (rc < 0 && errno != EINTR) {
      KJ_FAIL_SYSCALL("poll", errno);
    }
    if (rc > 0) {
      // wakes early on NOTIFY; the claim query decides what is available
      (void)conn.consume_notifications(channel_);
    }
  }

  const PgQueueOptions& options_;
  kj::String queue_;
  kj::String channel_;
  kj::String visibility_;
  kj::Maybe<kj::Own<PgConnection>> conn_;
};

} // namespace

PgQueueConnector::PgQueueConnector(PgQueueOptions options) : options_(kj::mv(options)) {}

kj::Own<BrokerConnection> PgQueueConnector::connect() {
  return kj::heap<PgQueueConnection>(
      PgConnection::connect_blocking(options_.conninfo, options_.connect_timeout));
}

kj::Own<BrokerConsumer> PgQueueConnector::open_consumer(kj::StringPtr queue) {
  KJ_REQUIRE(valid_queue_name(queue), "queue names are limited to [a-z0-9_]", queue);
  return kj::heap<PgQueueConsumer>(options_, queue);
}

kj::String PgQueueConnector::channel_for(kj::StringPtr queue) {
  KJ_REQUIRE(valid_queue_name(queue), "queue names are limited to [a-z0-9_]", queue);
  return kj::str("gentrade_", queue);
}

} // namespace gentrade::broker
