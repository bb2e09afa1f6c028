#include "gentrade/db/transaction.h"

#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"

#include <kj/exception.h>

namespace gentrade::db {

void TransactionManager::rollback_after_failure(Session& session) {
  rolled_back_.fetch_add(1, std::memory_order_relaxed);
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { session.rollback(); })) {
    core::global_logger().error(
        kj::str("rollback failed, session discarded: ", core::describe(exception)));
  }
}

} // namespace gentrade::db
