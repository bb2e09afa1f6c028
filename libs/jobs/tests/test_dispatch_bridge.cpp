#include "gentrade/broker/memory_queue.h"
#include "gentrade/core/error.h"
#include "gentrade/core/metrics.h"
#include "gentrade/jobs/dispatch_bridge.h"
#include "kj/test.h"

#include <cstring>
#include <stdexcept>

using namespace gentrade;
using namespace gentrade::jobs;

namespace {

constexpr auto kQueue = "backtests"_kj;

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return std::strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

kj::String last_failure(const FailureChannel& failures) {
  KJ_IF_SOME(line, failures.last()) {
    return kj::mv(line);
  }
  return kj::str();
}

void publish(broker::MemoryQueue& queue, std::int64_t job_id) {
  queue.inject(kQueue, broker::encode_job_message(broker::JobMessage{
                           job_id, 7, kj::str("auth0|alice"), kj::str("20240101-20240131")}));
}

KJ_TEST("DispatchLoop: returns false when nothing arrives") {
  broker::MemoryQueue queue;
  auto consumer = queue.open_consumer(kQueue);
  FailureChannel failures;
  int calls = 0;
  DispatchLoop loop(kj::str("test"), *consumer,
                    [&](ExecutionContext&, const broker::JobMessage&) {
                      ++calls;
                      return TaskOutcome::Finished;
                    },
                    failures);

  KJ_EXPECT(!loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(calls == 0);
  KJ_EXPECT(loop.processed() == 0);
}

KJ_TEST("DispatchLoop: every message is acked whatever the outcome") {
  broker::MemoryQueue queue;
  auto consumer = queue.open_consumer(kQueue);
  FailureChannel failures;
  kj::Vector<std::int64_t> seen;
  DispatchLoop loop(kj::str("test"), *consumer,
                    [&](ExecutionContext&, const broker::JobMessage& message) -> TaskResult {
                      seen.add(message.job_id);
                      if (message.job_id == 2) {
                        throw core::DatabaseException("connection reset"_kj);
                      }
                      if (message.job_id == 3) {
                        return TaskResult(TaskOutcome::Failed, kj::str("no data for BTC/USDT"));
                      }
                      return TaskOutcome::Finished;
                    },
                    failures);

  auto in_flight = core::gauge_get(core::metric_names::kJobsInFlight);
  publish(queue, 1);
  publish(queue, 2);
  publish(queue, 3);

  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(failures.count() == 0);

  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(failures.count() == 1);
  auto thrown = last_failure(failures);
  KJ_EXPECT(contains(thrown, "backtest 2"_kj), thrown);
  KJ_EXPECT(contains(thrown, "connection reset"_kj), thrown);

  // a failed job is reported with the error recorded on it
  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(failures.count() == 2);
  auto failed = last_failure(failures);
  KJ_EXPECT(contains(failed, "backtest 3"_kj), failed);
  KJ_EXPECT(contains(failed, "job failed: no data for BTC/USDT"_kj), failed);

  KJ_EXPECT(!loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(seen.size() == 3);
  KJ_EXPECT(queue.acked() == 3);
  KJ_EXPECT(queue.unacked() == 0);
  KJ_EXPECT(queue.pending(kQueue) == 0);
  KJ_EXPECT(loop.processed() == 3);
  KJ_EXPECT(core::gauge_get(core::metric_names::kJobsInFlight) == in_flight);
}

KJ_TEST("DispatchLoop: skipped jobs are not reported") {
  broker::MemoryQueue queue;
  auto consumer = queue.open_consumer(kQueue);
  FailureChannel failures;
  DispatchLoop loop(kj::str("test"), *consumer,
                    [](ExecutionContext&, const broker::JobMessage&) { return TaskOutcome::Skipped; },
                    failures);

  publish(queue, 1);
  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(failures.count() == 0);
  KJ_EXPECT(queue.acked() == 1);
}

KJ_TEST("DispatchLoop: undecodable messages are reported and acked") {
  broker::MemoryQueue queue;
  auto consumer = queue.open_consumer(kQueue);
  FailureChannel failures;
  int calls = 0;
  DispatchLoop loop(kj::str("test"), *consumer,
                    [&](ExecutionContext&, const broker::JobMessage&) {
                      ++calls;
                      return TaskOutcome::Finished;
                    },
                    failures);

  queue.inject(kQueue, "{not json"_kj);
  queue.inject(kQueue, R"({"strategy_id": 1})"_kj);
  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));

  KJ_EXPECT(calls == 0);
  KJ_EXPECT(queue.acked() == 2);
  KJ_EXPECT(failures.count() == 2);
  KJ_EXPECT(contains(last_failure(failures), "undecodable"_kj));
}

KJ_TEST("DispatchLoop: each job gets its own execution context") {
  broker::MemoryQueue queue;
  auto consumer = queue.open_consumer(kQueue);
  FailureChannel failures;
  kj::Vector<kj::String> ids;
  DispatchLoop loop(kj::str("slot"), *consumer,
                    [&](ExecutionContext& context, const broker::JobMessage&) {
                      ids.add(kj::str(context.id()));
                      // the context's event loop is usable by the job body
                      auto& io = context.io();
                      io.provider->getTimer().afterDelay(1 * kj::MILLISECONDS).wait(io.waitScope);
                      return TaskOutcome::Finished;
                    },
                    failures);

  publish(queue, 1);
  publish(queue, 2);
  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));
  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));

  KJ_ASSERT(ids.size() == 2);
  KJ_EXPECT(ids[0] == "slot#1"_kj);
  KJ_EXPECT(ids[1] == "slot#2"_kj);
  KJ_EXPECT(failures.count() == 0);
}

KJ_TEST("DispatchLoop: a message left unacked by a dead consumer is redelivered") {
  broker::MemoryQueue queue;
  publish(queue, 5);
  {
    auto crashed = queue.open_consumer(kQueue);
    KJ_EXPECT(crashed->receive(10 * kj::MILLISECONDS) != kj::none);
  }
  KJ_EXPECT(queue.unacked() == 1);
  KJ_EXPECT(queue.requeue_unacked() == 1);

  auto consumer = queue.open_consumer(kQueue);
  FailureChannel failures;
  kj::Vector<std::int64_t> seen;
  DispatchLoop loop(kj::str("test"), *consumer,
                    [&](ExecutionContext&, const broker::JobMessage& message) {
                      seen.add(message.job_id);
                      return TaskOutcome::Skipped;
                    },
                    failures);

  KJ_EXPECT(loop.run_once(10 * kj::MILLISECONDS));
  KJ_ASSERT(seen.size() == 1);
  KJ_EXPECT(seen[0] == 5);
  KJ_EXPECT(queue.unacked() == 0);
  KJ_EXPECT(queue.acked() == 1);
}

KJ_TEST("DispatchLoop: run() stops between messages") {
  broker::MemoryQueue queue;
  auto consumer = queue.open_consumer(kQueue);
  FailureChannel failures;
  kj::MutexGuarded<bool> stop(false);
  DispatchLoop loop(kj::str("test"), *consumer,
                    [&](ExecutionContext&, const broker::JobMessage&) {
                      *stop.lockExclusive() = true;
                      return TaskOutcome::Finished;
                    },
                    failures);

  publish(queue, 1);
  publish(queue, 2);
  loop.run(stop, 10 * kj::MILLISECONDS);

  KJ_EXPECT(loop.processed() == 1);
  KJ_EXPECT(queue.pending(kQueue) == 1);
}

class FailingConsumer final : public broker::BrokerConsumer {
public:
  explicit FailingConsumer(kj::MutexGuarded<bool>& stop) : stop_(stop) {}

  kj::Maybe<broker::Delivery> receive(kj::Duration) override {
    *stop_.lockExclusive() = true;
    KJ_FAIL_REQUIRE("channel closed by broker");
  }
  void ack(const broker::Delivery&) override {}

private:
  kj::MutexGuarded<bool>& stop_;
};

KJ_TEST("DispatchLoop: broker errors are reported without killing the loop") {
  kj::MutexGuarded<bool> stop(false);
  FailingConsumer consumer(stop);
  FailureChannel failures;
  DispatchLoop loop(kj::str("test"), consumer,
                    [](ExecutionContext&, const broker::JobMessage&) { return TaskOutcome::Finished; },
                    failures);

  loop.run(stop, 10 * kj::MILLISECONDS);
  KJ_EXPECT(failures.count() == 1);
  KJ_EXPECT(contains(last_failure(failures), "broker error"_kj));
  KJ_EXPECT(contains(last_failure(failures), "channel closed by broker"_kj));
}

KJ_TEST("WorkerPool: concurrent loops drain the queue and join on stop") {
  broker::MemoryQueue queue;
  kj::MutexGuarded<kj::Vector<std::int64_t>> seen;
  constexpr size_t kJobs = 6;
  for (size_t i = 1; i <= kJobs; ++i) {
    publish(queue, static_cast<std::int64_t>(i));
  }

  WorkerPoolOptions options;
  options.concurrency = 3;
  options.receive_timeout = 10 * kj::MILLISECONDS;
  WorkerPool pool(
      kj::mv(options), [&](size_t) { return queue.open_consumer(kQueue); },
      [&](size_t) -> JobHandler {
        return [&](ExecutionContext&, const broker::JobMessage& message) {
          seen.lockExclusive()->add(message.job_id);
          return TaskOutcome::Finished;
        };
      });

  pool.start();
  KJ_EXPECT(pool.running());
  auto handled = seen.when([](const kj::Vector<std::int64_t>& jobs) { return jobs.size() >= kJobs; },
                           [](kj::Vector<std::int64_t>& jobs) { return jobs.size(); },
                           5 * kj::SECONDS);
  KJ_EXPECT(handled == kJobs);

  pool.stop();
  KJ_EXPECT(!pool.running());
  KJ_EXPECT(pool.processed() == kJobs);
  KJ_EXPECT(queue.acked() == kJobs);
  KJ_EXPECT(pool.failures().count() == 0);

  bool each_once = true;
  auto jobs = seen.lockExclusive();
  for (std::int64_t id = 1; id <= static_cast<std::int64_t>(kJobs); ++id) {
    size_t hits = 0;
    for (auto job : *jobs) {
      hits += job == id ? 1 : 0;
    }
    each_once = each_once && hits == 1;
  }
  KJ_EXPECT(each_once);
}

KJ_TEST("WorkerPool: stop wakes wait_for_stop") {
  broker::MemoryQueue queue;
  WorkerPoolOptions options;
  options.concurrency = 1;
  options.receive_timeout = 10 * kj::MILLISECONDS;
  WorkerPool pool(
      kj::mv(options), [&](size_t) { return queue.open_consumer(kQueue); },
      [](size_t) -> JobHandler {
        return [](ExecutionContext&, const broker::JobMessage&) { return TaskOutcome::Finished; };
      });
  pool.start();

  kj::Thread stopper([&]() { *pool.stop_flag().lockExclusive() = true; });
  pool.wait_for_stop();
  pool.stop();
  KJ_EXPECT(!pool.running());
}

KJ_TEST("WorkerPool: a stopped pool refuses to start again") {
  broker::MemoryQueue queue;
  publish(queue, 1);
  WorkerPoolOptions options;
  options.concurrency = 2;
  options.receive_timeout = 10 * kj::MILLISECONDS;
  size_t consumers = 0;
  kj::MutexGuarded<size_t> handled(0);
  WorkerPool pool(
      kj::mv(options),
      [&](size_t) {
        ++consumers;
        return queue.open_consumer(kQueue);
      },
      [&](size_t) -> JobHandler {
        return [&](ExecutionContext&, const broker::JobMessage&) {
          ++*handled.lockExclusive();
          return TaskOutcome::Finished;
        };
      });

  pool.start();
  handled.when([](const size_t& count) { return count >= 1; }, [](size_t&) {}, 5 * kj::SECONDS);
  pool.stop();
  KJ_EXPECT(pool.processed() == 1);

  KJ_EXPECT_THROW_MESSAGE("cannot be restarted", pool.start());
  KJ_EXPECT(!pool.running());
  KJ_EXPECT(consumers == 2);
  KJ_EXPECT(pool.processed() == 1);
}

} // namespace
