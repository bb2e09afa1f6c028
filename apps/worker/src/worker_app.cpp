#include "gentrade/worker/worker_app.h"

#include "gentrade/broker/memory_queue.h"
#include "gentrade/broker/pg_queue.h"
#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"
#include "gentrade/core/metrics.h"
#include "gentrade/db/memory_database.h"
#include "gentrade/db/pg_database.h"
#include "gentrade/db/transaction.h"
#include "gentrade/exec/container_runtime.h"
#include "gentrade/exec/execution_adapter.h"
#include "gentrade/exec/market_data.h"
#include "gentrade/exec/user_sandbox.h"
#include "gentrade/jobs/backtest_task.h"
#include "gentrade/jobs/dispatch_bridge.h"

// std::signal for POSIX signal handling (standard C library, KJ lacks signal API)
#include <csignal>
#include <exception>
#include <kj/filesystem.h>

namespace {

// Points at the running WorkerApp's stop flag; cleared when run() returns
kj::MutexGuarded<bool>* g_stop_ptr = nullptr;

void handle_signal(int) {
  if (g_stop_ptr) {
    *g_stop_ptr->lockExclusive() = true;
  }
}

} // namespace

namespace gentrade::worker {

WorkerApp::WorkerApp(jobs::WorkerConfig config, bool in_memory)
    : config_(kj::mv(config)), in_memory_(in_memory) {}

void WorkerApp::install_signal_handlers() {
  g_stop_ptr = &stop_;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
}

void WorkerApp::request_stop() {
  *stop_.lockExclusive() = true;
}

int WorkerApp::run() {
  install_signal_handlers();
  KJ_DEFER(g_stop_ptr = nullptr);
  auto& log = core::global_logger();

  kj::Maybe<kj::String> failure;
  int rc = 0;
  try {
    if (in_memory_) {
      log.warn("running on in-memory stores; nothing is persisted");
      db::MemoryDatabase database;
      broker::MemoryQueue queue;
      rc = serve(database, queue);
    } else {
      db::PgDatabase database(config_.database_options());
      broker::PgQueueConnector queue(config_.queue_options());
      rc = serve(database, queue);
    }
  } catch (const core::GentradeException&) {
    failure = core::describe_current_exception();
  } catch (const kj::Exception& e) {
    failure = core::describe(e);
  } catch (const std::exception& e) {
    failure = kj::str(e.what());
  }
  KJ_IF_SOME(error, failure) {
    log.critical(kj::str("worker stopped on error: ", error));
    rc = 1;
  }

  log.info(kj::str("metrics at shutdown:\n", core::global_metrics().to_prometheus()));
  log.flush();
  return rc;
}

int WorkerApp::serve(db::Database& database, broker::BrokerConnector& broker) {
  auto& log = core::global_logger();
  KJ_DEFER(database.close());

  auto fs = kj::newDiskFilesystem();
  auto sandbox = exec::UserSandbox::open(*fs, config_.userdata_dir, config_.common_data_dir);
  if (!sandbox.exists(sandbox.userdata_dir())) {
    throw core::ConfigException(
        kj::str("userdata directory ", exec::UserSandbox::native(sandbox.userdata_dir()),
                " does not exist"));
  }
  sandbox.ensure_directory(sandbox.common_data_dir());

  db::TransactionManager transactions(database);
  exec::ContainerRuntime runtime(config_.runtime_options());
  exec::ExecutionAdapter adapter(runtime, sandbox, config_.execution_timeout);
  exec::MarketDataPreparer preparer(runtime, sandbox, config_.market_data_options());
  jobs::BacktestTask task(transactions, preparer, adapter, config_.task_options());

  jobs::WorkerPool pool(
      config_.pool_options_for("worker"_kj),
      [&](size_t) { return broker.open_consumer(config_.queue); },
      [&](size_t) -> jobs::JobHandler {
        return [&](jobs::ExecutionContext& context, const broker::JobMessage& message) {
          return task.run(context, message);
        };
      });

  log.info(kj::str("worker consuming '", config_.queue, "' with ", config_.concurrency,
                   " slot(s), userdata at ", exec::UserSandbox::native(sandbox.userdata_dir())));
  pool.start();

  stop_.when([](const bool& stopped) { return stopped; }, [](const bool&) {});
  log.info("shutdown requested, waiting for running jobs");
  pool.stop();
  processed_.store(pool.processed(), std::memory_order_relaxed);

  auto failures = pool.failures().count();
  if (failures > 0) {
    log.warn(kj::str(failures, " message(s) ended in an unhandled error"));
  }
  return 0;
}

} // namespace gentrade::worker
