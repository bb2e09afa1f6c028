#pragma once

#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/string.h>

namespace gentrade::jobs {

/**
 * @brief Isolated asynchronous runtime for exactly one job
 *
 * Owns a fresh KJ event loop for the calling thread. Everything the job opens
 * on it (database sessions, child processes) is bound to this context and
 * must be released before the context is destroyed. A thread can hold only
 * one context at a time.
 */
class ExecutionContext final {
public:
  explicit ExecutionContext(kj::String id) : id_(kj::mv(id)), io_(kj::setupAsyncIo()) {}

  KJ_DISALLOW_COPY_AND_MOVE(ExecutionContext);

  [[nodiscard]] kj::StringPtr id() const {
    return id_;
  }
  kj::AsyncIoContext& io() {
    return io_;
  }

private:
  kj::String id_;
  kj::AsyncIoContext io_;
};

} // namespace gentrade::jobs
