#include "gentrade/ctl/ctl_app.h"

#include "gentrade/broker/connection_pool.h"
#include "gentrade/broker/pg_queue.h"
#include "gentrade/core/logger.h"
#include "gentrade/db/pg_database.h"
#include "gentrade/db/transaction.h"
#include "gentrade/jobs/backtest_service.h"

#include <exception>
#include <kj/vector.h>

namespace gentrade::ctl {

namespace {

constexpr auto kUsage =
    "usage: gentrade-ctl [--config <file>] <command>\n"
    "  migrate                                   create or update the schema\n"
    "  create <principal> <strategy_id> <range>  submit a backtest, prints its id\n"
    "  get <principal> <job_id>                  print a backtest as JSON\n"
    "  requeue [--min-age <seconds>]             resubmit created jobs never queued\n"_kj;

// Orphans younger than this may still be in flight
constexpr std::int64_t kDefaultRequeueAge = 300;

kj::Maybe<std::int64_t> parse_id(kj::StringPtr text) {
  KJ_IF_SOME(id, text.tryParseAs<std::int64_t>()) {
    if (id > 0) {
      return id;
    }
  }
  return kj::none;
}

} // namespace

int exit_code_for(core::ErrorCode code) {
  switch (code) {
  case core::ErrorCode::Success:
    return kExitOk;
  case core::ErrorCode::NotFound:
    return kExitNotFound;
  case core::ErrorCode::Forbidden:
    return kExitForbidden;
  case core::ErrorCode::AuthenticationRequired:
    return kExitUnauthenticated;
  case core::ErrorCode::BrokerUnavailable:
    return kExitBrokerUnavailable;
  default:
    return kExitError;
  }
}

CtlApp::CtlApp(kj::OutputStream& out, kj::OutputStream& err) : out_(out), err_(err) {}

void CtlApp::print(kj::StringPtr text) {
  out_.write(text.asBytes());
  out_.write("\n"_kj.asBytes());
}

void CtlApp::print_error(kj::StringPtr text) {
  err_.write(kj::str("gentrade-ctl: ", text, "\n").asBytes());
}

int CtlApp::usage() {
  err_.write(kUsage.asBytes());
  return kExitUsage;
}

int CtlApp::run(kj::ArrayPtr<const kj::StringPtr> args, const char* const* environ_block) {
  kj::Maybe<kj::StringPtr> config_path;
  kj::Vector<kj::StringPtr> command;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config"_kj) {
      if (i + 1 >= args.size()) {
        return usage();
      }
      config_path = args[++i];
    } else {
      command.add(args[i]);
    }
  }
  if (command.size() == 0) {
    return usage();
  }

  kj::Maybe<kj::String> failure;
  int rc = kExitError;
  try {
    auto settings = jobs::load_config(config_path, environ_block);
    auto config = jobs::WorkerConfig::from(settings, environ_block);
    jobs::configure_logging(core::global_logger(), config);

    db::PgDatabase database(config.database_options());
    broker::PgQueueConnector queue(config.queue_options());
    KJ_DEFER(database.close());
    CtlBackends backends{database, queue,
                         [&](kj::AsyncIoContext& io) { database.migrate(io); }};
    rc = execute(command.asPtr(), backends, config);
  } catch (const core::GentradeException& e) {
    failure = core::describe_current_exception();
    rc = exit_code_for(e.code());
  } catch (const kj::Exception& e) {
    failure = core::describe(e);
  } catch (const std::exception& e) {
    failure = kj::str(e.what());
  }
  KJ_IF_SOME(error, failure) {
    print_error(error);
  }
  core::global_logger().flush();
  return rc;
}

int CtlApp::execute(kj::ArrayPtr<const kj::StringPtr> command, CtlBackends& backends,
                    const jobs::WorkerConfig& config) {
  if (command.size() == 0) {
    return usage();
  }
  auto name = command[0];
  auto io = kj::setupAsyncIo();
  db::TransactionManager transactions(backends.database);

  try {
    if (name == "migrate"_kj) {
      if (command.size() != 1) {
        return usage();
      }
      backends.migrate(io);
      print("schema is up to date"_kj);
      return kExitOk;
    }

    broker::BrokerConnectionPool pool(backends.broker, config.pool_options());
    jobs::BacktestService service(transactions, pool);

    if (name == "create"_kj) {
      if (command.size() != 4) {
        return usage();
      }
      KJ_IF_SOME(strategy_id, parse_id(command[2])) {
        auto id = service.create(io, command[1], strategy_id, command[3]);
        print(kj::str(id));
        return kExitOk;
      }
      return usage();
    }

    if (name == "get"_kj) {
      if (command.size() != 3) {
        return usage();
      }
      KJ_IF_SOME(job_id, parse_id(command[2])) {
        print(service.get(io, command[1], job_id).to_json(true));
        return kExitOk;
      }
      return usage();
    }

    if (name == "requeue"_kj) {
      std::int64_t min_age = kDefaultRequeueAge;
      if (command.size() == 3 && command[1] == "--min-age"_kj) {
        KJ_IF_SOME(age, command[2].tryParseAs<std::int64_t>()) {
          if (age < 0) {
            return usage();
          }
          min_age = age;
        } else {
          return usage();
        }
      } else if (command.size() != 1) {
        return usage();
      }
      auto count = service.resubmit_orphans(io, min_age);
      print(kj::str("requeued ", count, " job(s)"));
      return kExitOk;
    }
  } catch (const core::GentradeException& e) {
    print_error(core::describe_current_exception());
    return exit_code_for(e.code());
  } catch (const kj::Exception& e) {
    print_error(core::describe(e));
    return kExitError;
  }

  print_error(kj::str("unknown command '", name, "'"));
  return usage();
}

} // namespace gentrade::ctl
