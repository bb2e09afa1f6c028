#pragma once

#include "gentrade/broker/transport.h"
#include "gentrade/db/repository.h"
#include "gentrade/jobs/worker_config.h"

#include <atomic>
#include <cstdint>
#include <kj/mutex.h>

namespace gentrade::worker {

/**
 * @brief The backtest worker process
 *
 * Wires the database, the broker consumers, the container runtime and the
 * worker pool together, then runs until SIGINT/SIGTERM or request_stop().
 * With `in_memory` the stores are process-local, for local runs without
 * PostgreSQL.
 */
class WorkerApp final {
public:
  WorkerApp(jobs::WorkerConfig config, bool in_memory);

  int run();

  // Safe to call from any thread
  void request_stop();

  [[nodiscard]] std::uint64_t processed() const noexcept {
    return processed_.load(std::memory_order_relaxed);
  }

private:
  void install_signal_handlers();
  int serve(db::Database& database, broker::BrokerConnector& broker);

  jobs::WorkerConfig config_;
  bool in_memory_;
  kj::MutexGuarded<bool> stop_{false};
  std::atomic<std::uint64_t> processed_{0};
};

} // namespace gentrade::worker
