#pragma once

#include "gentrade/broker/transport.h"
#include "gentrade/core/error.h"
#include "gentrade/db/repository.h"
#include "gentrade/jobs/worker_config.h"

#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/function.h>
#include <kj/io.h>
#include <kj/string.h>

namespace gentrade::ctl {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitNotFound = 3;
constexpr int kExitForbidden = 4;
constexpr int kExitUnauthenticated = 5;
constexpr int kExitBrokerUnavailable = 6;

[[nodiscard]] int exit_code_for(core::ErrorCode code);

// Stores a command runs against
struct CtlBackends {
  db::Database& database;
  broker::BrokerConnector& broker;
  kj::Function<void(kj::AsyncIoContext&)> migrate;
};

/**
 * @brief Operator commands: migrate, create, get, requeue
 */
class CtlApp final {
public:
  CtlApp(kj::OutputStream& out, kj::OutputStream& err);

  // `args` excludes the program name; connects to the configured PostgreSQL
  int run(kj::ArrayPtr<const kj::StringPtr> args, const char* const* environ_block);

  // One command, options already stripped
  int execute(kj::ArrayPtr<const kj::StringPtr> command, CtlBackends& backends,
              const jobs::WorkerConfig& config);

private:
  int usage();
  void print(kj::StringPtr text);
  void print_error(kj::StringPtr text);

  kj::OutputStream& out_;
  kj::OutputStream& err_;
};

} // namespace gentrade::ctl
