#include "gentrade/broker/connection_pool.h"

#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"
#include "gentrade/core/metrics.h"

#include <kj/debug.h>

namespace gentrade::broker {

namespace {

// Publish attempts per submit: the first plus one retry on a fresh connection
constexpr int kMaxAttempts = 2;

enum class Claim { Reuse, Create, Exhausted, Closed };

} // namespace

BrokerConnectionPool::BrokerConnectionPool(BrokerConnector& connector, PoolOptions options)
    : connector_(connector), options_(kj::mv(options)) {
  KJ_REQUIRE(options_.max_connections > 0, "pool needs at least one connection");
  KJ_REQUIRE(options_.max_idle <= options_.max_connections, "max_idle exceeds max_connections");
}

BrokerConnectionPool::~BrokerConnectionPool() noexcept {
  close();
}

DeliveryResult BrokerConnectionPool::submit(std::int64_t job_id, kj::StringPtr payload) {
  for (int attempt = 1;; ++attempt) {
    kj::Maybe<kj::Own<BrokerConnection>> borrowed;
    try {
      borrowed = borrow(attempt > 1);
      auto& connection = KJ_ASSERT_NONNULL(borrowed);
      auto receipt = connection->publish(options_.queue, payload);
      give_back(kj::mv(connection));
      return DeliveryResult{job_id, kj::mv(receipt.message_id), attempt};
    } catch (kj::Exception& e) {
      if (e.getType() != kj::Exception::Type::DISCONNECTED) {
        KJ_IF_SOME(connection, borrowed) {
          give_back(kj::mv(connection));
        }
        throw;
      }
      KJ_IF_SOME(connection, borrowed) {
        discard(kj::mv(connection));
      }
      if (attempt >= kMaxAttempts) {
        core::counter_inc(core::metric_names::kBrokerSubmitFailures);
        throw core::BrokerUnavailableException(
            kj::str("job ", job_id, " not submitted to '", options_.queue, "': ", e.getDescription()),
            attempt);
      }
      core::global_logger().warn(kj::str("broker connection lost while submitting job ", job_id,
                                         ", retrying on a fresh connection: ", e.getDescription()));
      state_.lockExclusive()->reconnects++;
      core::counter_inc(core::metric_names::kBrokerReconnects);
    } catch (...) {
      KJ_IF_SOME(connection, borrowed) {
        give_back(kj::mv(connection));
      }
      throw;
    }
  }
}

kj::Own<BrokerConnection> BrokerConnectionPool::borrow(bool fresh) {
  kj::Vector<kj::Own<BrokerConnection>> stale;
  kj::Maybe<kj::Own<BrokerConnection>> reused;

  auto claim = state_.when(
      [&](const State& s) {
        return s.closed || (!fresh && s.idle.size() > 0) || s.in_use < options_.max_connections;
      },
      [&](State& s) {
        if (s.closed) {
          return Claim::Closed;
        }
        // health check: skip connections that died while idle
        while (!fresh && s.idle.size() > 0) {
          auto candidate = kj::mv(s.idle.back());
          s.idle.removeLast();
          if (candidate->is_open()) {
            reused = kj::mv(candidate);
            ++s.in_use;
            return Claim::Reuse;
          }
          ++s.discarded;
          stale.add(kj::mv(candidate));
        }
        if (s.in_use < options_.max_connections) {
          ++s.in_use;
          ++s.created;
          return Claim::Create;
        }
        return Claim::Exhausted;
      },
      options_.borrow_timeout);

  switch (claim) {
  case Claim::Reuse:
    return kj::mv(KJ_ASSERT_NONNULL(reused));
  case Claim::Create:
    break;
  case Claim::Exhausted:
    throw core::BrokerUnavailableException(
        kj::str("all ", options_.max_connections, " broker connections are busy"));
  case Claim::Closed:
    throw core::BrokerUnavailableException("broker connection pool is closed");
  }

  // the slot is reserved; connecting happens outside the lock
  try {
    return connector_.connect();
  } catch (...) {
    state_.lockExclusive()->in_use--;
    throw;
  }
}

void BrokerConnectionPool::give_back(kj::Own<BrokerConnection> connection) {
  auto lock = state_.lockExclusive();
  lock->in_use--;
  if (!lock->closed && connection->is_open() && lock->idle.size() < options_.max_idle) {
    lock->idle.add(kj::mv(connection));
    return;
  }
  if (!connection->is_open()) {
    ++lock->discarded;
  }
  // surplus connections are closed when `connection` goes out of scope
}

void BrokerConnectionPool::discard(kj::Own<BrokerConnection> connection) {
  auto lock = state_.lockExclusive();
  lock->in_use--;
  ++lock->discarded;
}

void BrokerConnectionPool::close() {
  kj::Vector<kj::Own<BrokerConnection>> closing;
  {
    auto lock = state_.lockExclusive();
    lock->closed = true;
    closing = kj::mv(lock->idle);
    lock->idle = kj::Vector<kj::Own<BrokerConnection>>();
  }
}

PoolStats BrokerConnectionPool::stats() const {
  auto lock = state_.lockShared();
  PoolStats stats;
  stats.idle = lock->idle.size();
  stats.in_use = lock->in_use;
  stats.created = lock->created;
  stats.discarded = lock->discarded;
  stats.reconnects = lock->reconnects;
  return stats;
}

} // namespace gentrade::broker
