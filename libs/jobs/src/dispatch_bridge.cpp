#include "gentrade/jobs/dispatch_bridge.h"

#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"
#include "gentrade/core/metrics.h"

#include <exception>
#include <kj/debug.h>

namespace gentrade::jobs {

namespace {

// Pause after a broker error before receiving again
constexpr auto kBrokerBackoff = 1 * kj::SECONDS;

} // namespace

void FailureChannel::report(kj::StringPtr loop, std::int64_t job_id, kj::StringPtr what) {
  auto line = job_id > 0 ? kj::str(loop, ": backtest ", job_id, ": ", what)
                         : kj::str(loop, ": ", what);
  core::global_logger().error(line);
  auto lock = state_.lockExclusive();
  ++lock->count;
  lock->last = kj::mv(line);
}

std::uint64_t FailureChannel::count() const {
  return state_.lockShared()->count;
}

kj::Maybe<kj::String> FailureChannel::last() const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(line, lock->last) {
    return kj::str(line);
  }
  return kj::none;
}

DispatchLoop::DispatchLoop(kj::String name, broker::BrokerConsumer& consumer, JobHandler handler,
                           FailureChannel& failures)
    : name_(kj::mv(name)), consumer_(consumer), handler_(kj::mv(handler)), failures_(failures) {}

bool DispatchLoop::run_once(kj::Duration timeout) {
  KJ_IF_SOME(delivery, consumer_.receive(timeout)) {
    dispatch(delivery);
    return true;
  }
  return false;
}

void DispatchLoop::run(const kj::MutexGuarded<bool>& stop, kj::Duration receive_timeout) {
  core::global_logger().info(kj::str("dispatch loop ", name_, " started"));
  while (!*stop.lockShared()) {
    kj::Maybe<kj::String> failure;
    try {
      run_once(receive_timeout);
    } catch (const core::GentradeException&) {
      failure = core::describe_current_exception();
    } catch (const kj::Exception& e) {
      failure = core::describe(e);
    } catch (const std::exception& e) {
      failure = kj::str(e.what());
    }
    KJ_IF_SOME(error, failure) {
      failures_.report(name_, 0, kj::str("broker error: ", error));
      stop.when([](const bool& stopped) { return stopped; }, [](const bool&) {}, kBrokerBackoff);
    }
  }
  core::global_logger().info(kj::str("dispatch loop ", name_, " stopped after ", processed(),
                                     " message(s)"));
}

void DispatchLoop::dispatch(const broker::Delivery& delivery) {
  KJ_DEFER(processed_.fetch_add(1, std::memory_order_relaxed));

  broker::JobMessage message;
  KJ_IF_SOME(exception, kj::runCatchingExceptions(
                            [&]() { message = broker::decode_job_message(delivery.payload); })) {
    failures_.report(name_, 0, kj::str("dropping undecodable message ", delivery.tag, ": ",
                                       core::describe(exception)));
    consumer_.ack(delivery);
    return;
  }

  core::CorrelationScope correlation(kj::str("job-", message.job_id));
  if (delivery.redelivered) {
    core::counter_inc(core::metric_names::kJobsRedelivered);
    core::global_logger().info(kj::str("backtest ", message.job_id, " was delivered again"));
  }

  kj::Maybe<kj::String> failure;
  try {
    auto result = run_in_context(message);
    core::global_logger().debug(kj::str("backtest ", message.job_id, " done in ", name_, ": ",
                                        to_string(result.outcome)));
    if (result.outcome == TaskOutcome::Failed) {
      KJ_IF_SOME(error, result.error) {
        failure = kj::str("job failed: ", error);
      } else {
        failure = kj::str("job failed");
      }
    }
  } catch (const core::GentradeException&) {
    failure = core::describe_current_exception();
  } catch (const kj::Exception& e) {
    failure = core::describe(e);
  } catch (const std::exception& e) {
    failure = kj::str(e.what());
  }
  KJ_IF_SOME(error, failure) {
    failures_.report(name_, message.job_id, error);
  }
  consumer_.ack(delivery);
}

TaskResult DispatchLoop::run_in_context(const broker::JobMessage& message) {
  core::gauge_inc(core::metric_names::kJobsInFlight);
  KJ_DEFER(core::gauge_dec(core::metric_names::kJobsInFlight));

  // Destroyed on return, before the message is acked
  ExecutionContext context(kj::str(name_, "#", ++contexts_));
  return handler_(context, message);
}

WorkerPool::WorkerPool(WorkerPoolOptions options, ConsumerFactory consumers,
                       HandlerFactory handlers)
    : options_(kj::mv(options)), consumer_factory_(kj::mv(consumers)),
      handler_factory_(kj::mv(handlers)) {}

WorkerPool::~WorkerPool() noexcept(false) {
  stop();
}

void WorkerPool::start() {
  KJ_REQUIRE(!running_, "worker pool already started");
  KJ_REQUIRE(slots_.empty(), "a stopped worker pool cannot be restarted");
  KJ_REQUIRE(options_.concurrency > 0, "worker pool needs at least one slot");
  *stop_.lockExclusive() = false;

  for (size_t i = 0; i < options_.concurrency; ++i) {
    auto slot = kj::heap<Slot>();
    slot->consumer = consumer_factory_(i);
    slot->loop = kj::heap<DispatchLoop>(kj::str(options_.name, "-", i), *slot->consumer,
                                        handler_factory_(i), failures_);
    slots_.add(kj::mv(slot));
  }
  for (auto& slot : slots_) {
    auto& loop = *slot->loop;
    slot->thread = kj::heap<kj::Thread>([this, &loop]() {
      KJ_IF_SOME(exception, kj::runCatchingExceptions(
                                [&]() { loop.run(stop_, options_.receive_timeout); })) {
        failures_.report(loop.name(), 0,
                         kj::str("dispatch loop died: ", core::describe(exception)));
      }
    });
  }
  running_ = true;
  core::global_logger().info(
      kj::str("worker pool ", options_.name, " running ", options_.concurrency, " loop(s)"));
}

void WorkerPool::stop() {
  *stop_.lockExclusive() = true;
  if (!running_) {
    return;
  }
  for (auto& slot : slots_) {
    slot->thread = kj::none; // joins after the current job
  }
  running_ = false;
  core::global_logger().info(kj::str("worker pool ", options_.name, " stopped after ",
                                     processed(), " message(s)"));
}

void WorkerPool::wait_for_stop() const {
  stop_.when([](const bool& stopped) { return stopped; }, [](const bool&) {});
}

std::uint64_t WorkerPool::processed() const {
  std::uint64_t total = 0;
  for (auto& slot : slots_) {
    total += slot->loop->processed();
  }
  return total;
}

} // namespace gentrade::jobs
