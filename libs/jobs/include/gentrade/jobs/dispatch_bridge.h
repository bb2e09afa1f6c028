/**
 * @file dispatch_bridge.h
 * @brief Synchronous dispatch loops hosting asynchronous job bodies
 */

#pragma once

#include "gentrade/broker/job_message.h"
#include "gentrade/broker/transport.h"
#include "gentrade/jobs/backtest_task.h"
#include "gentrade/jobs/execution_context.h"

#include <atomic>
#include <cstdint>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/thread.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace gentrade::jobs {

/**
 * @brief Operational record of failed jobs, exceptions and poison messages
 *
 * Shared by all loops of a worker; thread-safe.
 */
class FailureChannel final {
public:
  void report(kj::StringPtr loop, std::int64_t job_id, kj::StringPtr what);

  [[nodiscard]] std::uint64_t count() const;
  [[nodiscard]] kj::Maybe<kj::String> last() const;

private:
  struct State {
    std::uint64_t count{0};
    kj::Maybe<kj::String> last;
  };
  kj::MutexGuarded<State> state_;
};

using JobHandler = kj::Function<TaskResult(ExecutionContext&, const broker::JobMessage&)>;

/**
 * @brief One worker slot: receives a message, runs it, acks it
 *
 * Jobs run strictly one after another. Each job gets a brand-new
 * ExecutionContext that is destroyed before the message is acked, so nothing
 * opened by one job survives into the next. Messages are acked whatever the
 * outcome; failures go to the FailureChannel.
 */
class DispatchLoop final {
public:
  DispatchLoop(kj::String name, broker::BrokerConsumer& consumer, JobHandler handler,
               FailureChannel& failures);

  KJ_DISALLOW_COPY_AND_MOVE(DispatchLoop);

  /**
   * @brief Wait up to `timeout` for one message and process it
   * @return true when a message was processed
   */
  bool run_once(kj::Duration timeout);

  // Loop until `stop` becomes true; checked between messages
  void run(const kj::MutexGuarded<bool>& stop, kj::Duration receive_timeout);

  [[nodiscard]] kj::StringPtr name() const {
    return name_;
  }
  [[nodiscard]] std::uint64_t processed() const noexcept {
    return processed_.load(std::memory_order_relaxed);
  }

private:
  void dispatch(const broker::Delivery& delivery);
  TaskResult run_in_context(const broker::JobMessage& message);

  kj::String name_;
  broker::BrokerConsumer& consumer_;
  JobHandler handler_;
  FailureChannel& failures_;
  std::uint64_t contexts_{0};
  std::atomic<std::uint64_t> processed_{0};
};

struct WorkerPoolOptions final {
  size_t concurrency{2};
  kj::Duration receive_timeout = 1 * kj::SECONDS;
  kj::String name = kj::str("worker");
};

/**
 * @brief Fixed set of dispatch loops, one thread each
 *
 * Consumers and handlers are created on the calling thread by the factories,
 * one per slot, and then owned by that slot's thread. stop() and the
 * destructor let each loop finish its current job and join the threads. A
 * pool runs once; start() after stop() is rejected.
 */
class WorkerPool final {
public:
  using ConsumerFactory = kj::Function<kj::Own<broker::BrokerConsumer>(size_t slot)>;
  using HandlerFactory = kj::Function<JobHandler(size_t slot)>;

  WorkerPool(WorkerPoolOptions options, ConsumerFactory consumers, HandlerFactory handlers);
  ~WorkerPool() noexcept(false);

  KJ_DISALLOW_COPY_AND_MOVE(WorkerPool);

  void start();
  void stop();

  // Block until stop() is called from another thread or a signal handler
  void wait_for_stop() const;

  kj::MutexGuarded<bool>& stop_flag() {
    return stop_;
  }
  FailureChannel& failures() {
    return failures_;
  }
  [[nodiscard]] std::uint64_t processed() const;
  [[nodiscard]] bool running() const noexcept {
    return running_;
  }

private:
  struct Slot {
    kj::Own<broker::BrokerConsumer> consumer;
    kj::Own<DispatchLoop> loop;
    kj::Maybe<kj::Own<kj::Thread>> thread;
  };

  WorkerPoolOptions options_;
  ConsumerFactory consumer_factory_;
  HandlerFactory handler_factory_;
  FailureChannel failures_;
  kj::MutexGuarded<bool> stop_{false};
  kj::Vector<kj::Own<Slot>> slots_;
  bool running_{false};
};

} // namespace gentrade::jobs
