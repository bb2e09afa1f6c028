#include "gentrade/jobs/ownership_guard.h"

#include "gentrade/core/error.h"

namespace gentrade::jobs {

kj::StringPtr to_string(AccessDecision decision) {
  switch (decision) {
  case AccessDecision::Granted:
    return "granted"_kj;
  case AccessDecision::NotFound:
    return "not_found"_kj;
  case AccessDecision::Forbidden:
    return "forbidden"_kj;
  }
  return "unknown"_kj;
}

db::UserRecord OwnershipGuard::resolve_principal(kj::StringPtr principal) {
  KJ_IF_SOME(user, uow_.users().find_by_principal(principal)) {
    return kj::mv(user);
  }
  throw core::AuthenticationRequiredException(kj::str("unknown principal ", principal));
}

AccessDecision OwnershipGuard::decide(const db::UserRecord& user,
                                      const kj::Maybe<db::StrategyRecord>& strategy) {
  KJ_IF_SOME(s, strategy) {
    return s.user_id == user.id ? AccessDecision::Granted : AccessDecision::Forbidden;
  }
  return AccessDecision::NotFound;
}

void OwnershipGuard::enforce(AccessDecision decision, kj::StringPtr what, std::int64_t id) {
  switch (decision) {
  case AccessDecision::Granted:
    return;
  case AccessDecision::NotFound:
    throw core::NotFoundException(kj::str(what, " ", id, " not found"));
  case AccessDecision::Forbidden:
    throw core::ForbiddenException(kj::str(what, " ", id, " belongs to another user"));
  }
}

AccessDecision OwnershipGuard::check_strategy(const db::UserRecord& user,
                                              std::int64_t strategy_id) {
  return decide(user, uow_.strategies().find(strategy_id));
}

StrategyAccess OwnershipGuard::require_strategy(kj::StringPtr principal,
                                                std::int64_t strategy_id) {
  auto user = resolve_principal(principal);
  auto strategy = uow_.strategies().find(strategy_id);
  enforce(decide(user, strategy), "strategy"_kj, strategy_id);
  KJ_IF_SOME(s, strategy) {
    return StrategyAccess{kj::mv(user), kj::mv(s)};
  }
  KJ_UNREACHABLE;
}

db::JobRecord OwnershipGuard::require_job(kj::StringPtr principal, std::int64_t job_id) {
  auto user = resolve_principal(principal);
  KJ_IF_SOME(job, uow_.jobs().find(job_id)) {
    // a job whose strategy vanished has no owner left to grant access
    auto decision = decide(user, uow_.strategies().find(job.strategy_id));
    enforce(decision, "backtest"_kj, job_id);
    return kj::mv(job);
  }
  throw core::NotFoundException(kj::str("backtest ", job_id, " not found"));
}

} // namespace gentrade::jobs
