#include "gentrade/core/error.h"
#include "kj/test.h"

#include <stdexcept>

using namespace gentrade::core;

namespace {

KJ_TEST("ErrorCode and ExecutionCause names") {
  KJ_EXPECT(to_string(ErrorCode::BrokerUnavailable) == "Broker Unavailable"_kj);
  KJ_EXPECT(to_string(ErrorCode::InvalidTransition) == "Invalid Transition"_kj);
  KJ_EXPECT(to_string(ExecutionCause::Timeout) == "Timeout"_kj);
  KJ_EXPECT(to_string(ExecutionCause::MissingArtifact) == "MissingArtifact"_kj);
}

KJ_TEST("GentradeException: KJ type mapping and retryability") {
  BrokerUnavailableException broker("queue down"_kj, 2);
  KJ_EXPECT(broker.type() == kj::Exception::Type::DISCONNECTED);
  KJ_EXPECT(broker.is_retryable());
  KJ_EXPECT(broker.attempts() == 2);

  ForbiddenException forbidden("strategy 7"_kj);
  KJ_EXPECT(!forbidden.is_retryable());
  KJ_EXPECT(forbidden.code() == ErrorCode::Forbidden);

  ExecutionException runtime(ExecutionCause::RuntimeUnavailable, "daemon down"_kj);
  KJ_EXPECT(runtime.type() == kj::Exception::Type::DISCONNECTED);
  ExecutionException exit(ExecutionCause::NonZeroExit, "exit 2"_kj, 2);
  KJ_EXPECT(exit.type() == kj::Exception::Type::FAILED);
  KJ_EXPECT(exit.exit_code() == 2);
}

KJ_TEST("GentradeException: toKjException keeps code and message") {
  NotFoundException e("strategy 9 not found"_kj);
  auto kj_exception = e.toKjException();
  KJ_EXPECT(kj_exception.getType() == kj::Exception::Type::FAILED);
  KJ_EXPECT(kj_exception.getDescription() == "Not Found: strategy 9 not found"_kj);
}

KJ_TEST("describe_current_exception: typed, KJ and std exceptions") {
  try {
    throw ExecutionException(ExecutionCause::Timeout, "exceeded 5s"_kj);
  } catch (...) {
    KJ_EXPECT(describe_current_exception() == "Execution Error (Timeout): exceeded 5s"_kj);
  }

  try {
    throw DataPreparationException("no pairs"_kj);
  } catch (...) {
    KJ_EXPECT(describe_current_exception() == "Data Preparation Error: no pairs"_kj);
  }

  try {
    kj::throwFatalException(
        kj::Exception(kj::Exception::Type::DISCONNECTED, __FILE__, __LINE__, kj::str("socket")));
  } catch (...) {
    KJ_EXPECT(describe_current_exception() == "disconnected: socket"_kj);
  }

  try {
    throw std::runtime_error("plain");
  } catch (...) {
    auto text = describe_current_exception();
    KJ_EXPECT(text.size() > 0);
  }
}

} // namespace
