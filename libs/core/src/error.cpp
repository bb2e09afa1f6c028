#include "gentrade/core/error.h"

#include <exception>
#include <kj/common.h>
#include <kj/string.h>

namespace gentrade::core {

kj::StringPtr to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success"_kj;
  case ErrorCode::UnknownError:
    return "Unknown Error"_kj;
  case ErrorCode::NotFound:
    return "Not Found"_kj;
  case ErrorCode::Forbidden:
    return "Forbidden"_kj;
  case ErrorCode::AuthenticationRequired:
    return "Authentication Required"_kj;
  case ErrorCode::BrokerUnavailable:
    return "Broker Unavailable"_kj;
  case ErrorCode::DataPreparation:
    return "Data Preparation Error"_kj;
  case ErrorCode::Execution:
    return "Execution Error"_kj;
  case ErrorCode::Database:
    return "Database Error"_kj;
  case ErrorCode::Configuration:
    return "Configuration Error"_kj;
  case ErrorCode::InvalidTransition:
    return "Invalid Transition"_kj;
  }
  return "Invalid Error Code"_kj;
}

kj::StringPtr to_string(ExecutionCause cause) {
  switch (cause) {
  case ExecutionCause::Timeout:
    return "Timeout"_kj;
  case ExecutionCause::NonZeroExit:
    return "NonZeroExit"_kj;
  case ExecutionCause::MissingArtifact:
    return "MissingArtifact"_kj;
  case ExecutionCause::RuntimeUnavailable:
    return "RuntimeUnavailable"_kj;
  }
  return "Unknown"_kj;
}

kj::String describe(const kj::Exception& e) {
  switch (e.getType()) {
  case kj::Exception::Type::FAILED:
    return kj::str(e.getDescription());
  case kj::Exception::Type::OVERLOADED:
    return kj::str("overloaded: ", e.getDescription());
  case kj::Exception::Type::DISCONNECTED:
    return kj::str("disconnected: ", e.getDescription());
  case kj::Exception::Type::UNIMPLEMENTED:
    return kj::str("unimplemented: ", e.getDescription());
  }
  return kj::str(e.getDescription());
}

kj::String describe_current_exception() {
  try {
    throw;
  } catch (const ExecutionException& e) {
    return kj::str(to_string(e.code()), " (", to_string(e.cause()), "): ", e.message());
  } catch (const GentradeException& e) {
    return kj::str(to_string(e.code()), ": ", e.message());
  } catch (...) {
    // kj::Exception, std::exception and anything else
    return describe(kj::getCaughtExceptionAsKj());
  }
}

} // namespace gentrade::core
