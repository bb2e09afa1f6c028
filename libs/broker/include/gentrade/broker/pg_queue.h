#pragma once

#include "gentrade/broker/transport.h"

#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::broker {

struct PgQueueOptions final {
  kj::String conninfo;
  kj::Duration connect_timeout = 5 * kj::SECONDS;
  // A claimed message becomes visible again when its consumer has not acked
  // it within this window, which must outlast the slowest job
  kj::Duration visibility_timeout = 2 * 60 * 60 * kj::SECONDS;
  kj::Duration poll_interval = 1 * kj::SECONDS;
};

/**
 * @brief Durable job queue in the `job_queue` table
 *
 * Publishing is an autocommitted INSERT whose returned id confirms the
 * message, followed by a NOTIFY on `gentrade_<queue>`. Consumers claim the
 * oldest visible row with FOR UPDATE SKIP LOCKED and delete it on ack. A row
 * delivered more than once is flagged as a redelivery.
 *
 * All calls block; they are made from threads without an event loop.
 */
class PgQueueConnector final : public BrokerConnector {
public:
  explicit PgQueueConnector(PgQueueOptions options);

  kj::Own<BrokerConnection> connect() override;
  kj::Own<BrokerConsumer> open_consumer(kj::StringPtr queue) override;

  // Channel used to wake consumers of `queue`
  [[nodiscard]] static kj::String channel_for(kj::StringPtr queue);

private:
  PgQueueOptions options_;
};

} // namespace gentrade::broker
