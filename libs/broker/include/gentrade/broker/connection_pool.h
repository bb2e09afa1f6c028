#pragma once

#include "gentrade/broker/transport.h"

#include <cstdint>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace gentrade::broker {

struct PoolOptions final {
  kj::String queue;
  size_t max_idle{2};
  size_t max_connections{8};
  kj::Duration borrow_timeout = 5 * kj::SECONDS;
};

struct DeliveryResult final {
  std::int64_t job_id{0};
  kj::String message_id;
  int attempts{0};
};

struct PoolStats final {
  size_t idle{0};
  size_t in_use{0};
  std::uint64_t created{0};
  std::uint64_t discarded{0};
  std::uint64_t reconnects{0};
};

/**
 * @brief Bounded pool of publishing connections
 *
 * Borrowed connections are health-checked and dead ones discarded. A publish
 * that fails with DISCONNECTED drops its connection and is retried once on a
 * fresh one; after that the caller gets BrokerUnavailableException. Any other
 * failure returns the connection to the pool and propagates unchanged.
 *
 * Thread-safe.
 */
class BrokerConnectionPool final {
public:
  BrokerConnectionPool(BrokerConnector& connector, PoolOptions options);
  ~BrokerConnectionPool() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(BrokerConnectionPool);

  /**
   * @brief Publish `payload` for `job_id` and wait for the broker's confirmation
   * @throws core::BrokerUnavailableException when no connection could deliver it
   */
  DeliveryResult submit(std::int64_t job_id, kj::StringPtr payload);

  void close();

  [[nodiscard]] PoolStats stats() const;
  [[nodiscard]] kj::StringPtr queue() const {
    return options_.queue;
  }

private:
  struct State {
    kj::Vector<kj::Own<BrokerConnection>> idle;
    size_t in_use{0};
    bool closed{false};
    std::uint64_t created{0};
    std::uint64_t discarded{0};
    std::uint64_t reconnects{0};
  };

  // `fresh` skips idle connections and always opens a new one
  kj::Own<BrokerConnection> borrow(bool fresh);
  void give_back(kj::Own<BrokerConnection> connection);
  void discard(kj::Own<BrokerConnection> connection);

  BrokerConnector& connector_;
  PoolOptions options_;
  kj::MutexGuarded<State> state_;
};

} // namespace gentrade::broker
