#pragma once

#include "gentrade/db/repository.h"

#include <atomic>
#include <cstdint>
#include <kj/async-io.h>
#include <kj/common.h>
#include <type_traits>

namespace gentrade::db {

/**
 * @brief Scoped unit of work over a Database
 *
 * with_scope() opens a dedicated session, begins a transaction and hands the
 * repositories to `fn`. A normal return commits; an exception rolls back and
 * propagates unchanged. Nested calls open their own independent session. The
 * manager keeps no per-scope state, so one instance may be shared by threads.
 */
class TransactionManager final {
public:
  explicit TransactionManager(Database& database) : database_(database) {}

  template <typename Func>
  auto with_scope(kj::AsyncIoContext& io, Func&& fn) -> std::invoke_result_t<Func&, UnitOfWork&> {
    using Result = std::invoke_result_t<Func&, UnitOfWork&>;
    auto session = database_.open_session(io);
    session->begin();
    try {
      if constexpr (std::is_void_v<Result>) {
        fn(static_cast<UnitOfWork&>(*session));
        session->commit();
        committed_.fetch_add(1, std::memory_order_relaxed);
      } else {
        Result result = fn(static_cast<UnitOfWork&>(*session));
        session->commit();
        committed_.fetch_add(1, std::memory_order_relaxed);
        return result;
      }
    } catch (...) {
      rollback_after_failure(*session);
      throw;
    }
  }

  [[nodiscard]] std::uint64_t committed() const noexcept {
    return committed_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] std::uint64_t rolled_back() const noexcept {
    return rolled_back_.load(std::memory_order_relaxed);
  }

private:
  // A failing rollback is logged; the exception that triggered it wins.
  void rollback_after_failure(Session& session);

  Database& database_;
  std::atomic<std::uint64_t> committed_{0};
  std::atomic<std::uint64_t> rolled_back_{0};
};

} // namespace gentrade::db
