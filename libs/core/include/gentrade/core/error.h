#pragma once

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace gentrade::core {

// Error code definitions
enum class ErrorCode : int {
  Success = 0,
  UnknownError = 1,
  NotFound = 2,
  Forbidden = 3,
  AuthenticationRequired = 4,
  BrokerUnavailable = 5,
  DataPreparation = 6,
  Execution = 7,
  Database = 8,
  Configuration = 9,
  InvalidTransition = 10,
};

[[nodiscard]] kj::StringPtr to_string(ErrorCode code);

/**
 * @brief Base exception for all gentrade errors
 *
 * Carries the message, the throw site and the KJ exception type used when the
 * error has to travel through KJ infrastructure (promises, runCatchingExceptions).
 */
class GentradeException {
public:
  explicit GentradeException(kj::StringPtr message, ErrorCode code = ErrorCode::UnknownError,
                             kj::Exception::Type type = kj::Exception::Type::FAILED,
                             const std::source_location& location = std::source_location::current())
      : message_(kj::str(message)), file_(kj::str(location.file_name())), line_(location.line()),
        function_(kj::str(location.function_name())), code_(code), type_(type) {}

  virtual ~GentradeException() = default;

  GentradeException(GentradeException&&) = default;
  GentradeException& operator=(GentradeException&&) = default;

  GentradeException(const GentradeException& other)
      : message_(kj::str(other.message_)), file_(kj::str(other.file_)), line_(other.line_),
        function_(kj::str(other.function_)), code_(other.code_), type_(other.type_) {}

  GentradeException& operator=(const GentradeException& other) {
    if (this != &other) {
      message_ = kj::str(other.message_);
      file_ = kj::str(other.file_);
      line_ = other.line_;
      function_ = kj::str(other.function_);
      code_ = other.code_;
      type_ = other.type_;
    }
    return *this;
  }

  [[nodiscard]] kj::StringPtr message() const noexcept {
    return message_;
  }
  [[nodiscard]] kj::StringPtr file() const noexcept {
    return file_;
  }
  [[nodiscard]] int line() const noexcept {
    return line_;
  }
  [[nodiscard]] kj::StringPtr function() const noexcept {
    return function_;
  }
  [[nodiscard]] ErrorCode code() const noexcept {
    return code_;
  }
  [[nodiscard]] kj::Exception::Type type() const noexcept {
    return type_;
  }

  [[nodiscard]] const char* what() const noexcept {
    return message_.cStr();
  }

  // Retryable failures map to OVERLOADED or DISCONNECTED
  [[nodiscard]] bool is_retryable() const noexcept {
    return type_ != kj::Exception::Type::FAILED;
  }

  [[nodiscard]] kj::Exception toKjException() const {
    return kj::Exception(type_, file_.cStr(), line_, kj::str(to_string(code_), ": ", message_));
  }

  [[noreturn]] void throwException() const {
    kj::throwFatalException(toKjException());
  }

protected:
  kj::String message_;
  kj::String file_;
  int line_;
  kj::String function_;
  ErrorCode code_;
  kj::Exception::Type type_;
};

class NotFoundException : public GentradeException {
public:
  explicit NotFoundException(kj::StringPtr message,
                             const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::NotFound, kj::Exception::Type::FAILED, location) {}
};

class ForbiddenException : public GentradeException {
public:
  explicit ForbiddenException(kj::StringPtr message,
                              const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::Forbidden, kj::Exception::Type::FAILED, location) {}
};

class AuthenticationRequiredException : public GentradeException {
public:
  explicit AuthenticationRequiredException(
      kj::StringPtr message, const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::AuthenticationRequired, kj::Exception::Type::FAILED,
                          location) {}
};

/**
 * @brief The broker could not accept a job message
 *
 * Raised at submission time after the pool exhausted its single retry. Retryable.
 */
class BrokerUnavailableException : public GentradeException {
public:
  explicit BrokerUnavailableException(
      kj::StringPtr message, int attempts = 0,
      const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::BrokerUnavailable,
                          kj::Exception::Type::DISCONNECTED, location),
        attempts_(attempts) {}

  [[nodiscard]] int attempts() const noexcept {
    return attempts_;
  }

private:
  int attempts_;
};

class DataPreparationException : public GentradeException {
public:
  explicit DataPreparationException(
      kj::StringPtr message, const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::DataPreparation, kj::Exception::Type::FAILED,
                          location) {}
};

/**
 * @brief Why a containerized execution did not produce an artifact
 */
enum class ExecutionCause : int {
  Timeout = 0,
  NonZeroExit = 1,
  MissingArtifact = 2,
  RuntimeUnavailable = 3,
};

[[nodiscard]] kj::StringPtr to_string(ExecutionCause cause);

class ExecutionException : public GentradeException {
public:
  explicit ExecutionException(ExecutionCause cause, kj::StringPtr message, int exit_code = 0,
                              const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::Execution,
                          cause == ExecutionCause::RuntimeUnavailable
                              ? kj::Exception::Type::DISCONNECTED
                              : kj::Exception::Type::FAILED,
                          location),
        cause_(cause), exit_code_(exit_code) {}

  [[nodiscard]] ExecutionCause cause() const noexcept {
    return cause_;
  }
  [[nodiscard]] int exit_code() const noexcept {
    return exit_code_;
  }

private:
  ExecutionCause cause_;
  int exit_code_;
};

class DatabaseException : public GentradeException {
public:
  explicit DatabaseException(kj::StringPtr message,
                             kj::Exception::Type type = kj::Exception::Type::FAILED,
                             const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::Database, type, location) {}
};

class ConfigException : public GentradeException {
public:
  explicit ConfigException(kj::StringPtr message,
                           const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::Configuration, kj::Exception::Type::FAILED,
                          location) {}
};

class InvalidTransitionException : public GentradeException {
public:
  explicit InvalidTransitionException(
      kj::StringPtr message, const std::source_location& location = std::source_location::current())
      : GentradeException(message, ErrorCode::InvalidTransition, kj::Exception::Type::FAILED,
                          location) {}
};

/**
 * @brief Human-readable summary of a KJ exception, without the stack trace
 */
[[nodiscard]] kj::String describe(const kj::Exception& e);

/**
 * @brief Summary of the exception currently being handled
 *
 * Must be called from inside a catch block. Recognises GentradeException,
 * kj::Exception and std::exception.
 */
[[nodiscard]] kj::String describe_current_exception();

} // namespace gentrade::core
