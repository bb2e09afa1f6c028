#pragma once

#include "gentrade/db/repository.h"

#include <cstdint>
#include <kj/string.h>

namespace gentrade::jobs {

enum class AccessDecision : std::uint8_t {
  Granted = 0,
  NotFound = 1,
  Forbidden = 2,
};

[[nodiscard]] kj::StringPtr to_string(AccessDecision decision);

struct StrategyAccess final {
  db::UserRecord user;
  db::StrategyRecord strategy;
};

/**
 * @brief Ownership precondition for service operations
 *
 * Resolves the calling principal, then compares the owner of the target
 * resource to it. A resource that does not exist and one that belongs to
 * somebody else are reported differently. Only reads through the unit of
 * work it is given.
 */
class OwnershipGuard final {
public:
  explicit OwnershipGuard(db::UnitOfWork& uow) : uow_(uow) {}

  /**
   * @throws core::AuthenticationRequiredException when no user has this principal
   */
  db::UserRecord resolve_principal(kj::StringPtr principal);

  AccessDecision check_strategy(const db::UserRecord& user, std::int64_t strategy_id);

  /**
   * @throws core::AuthenticationRequiredException, core::NotFoundException or
   *         core::ForbiddenException
   */
  StrategyAccess require_strategy(kj::StringPtr principal, std::int64_t strategy_id);

  // A job is owned through its strategy
  db::JobRecord require_job(kj::StringPtr principal, std::int64_t job_id);

private:
  static AccessDecision decide(const db::UserRecord& user,
                               const kj::Maybe<db::StrategyRecord>& strategy);
  static void enforce(AccessDecision decision, kj::StringPtr what, std::int64_t id);

  db::UnitOfWork& uow_;
};

} // namespace gentrade::jobs
