/**
 * @file worker_config.h
 * @brief Process settings shared by the worker and the operator CLI
 */

#pragma once

#include "gentrade/broker/connection_pool.h"
#include "gentrade/broker/pg_queue.h"
#include "gentrade/core/config.h"
#include "gentrade/core/logger.h"
#include "gentrade/db/pg_database.h"
#include "gentrade/exec/container_runtime.h"
#include "gentrade/exec/market_data.h"
#include "gentrade/jobs/backtest_task.h"
#include "gentrade/jobs/dispatch_bridge.h"

#include <cstdint>
#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::jobs {

struct WorkerConfig final {
  kj::String database_url = kj::str("postgresql://localhost/gentrade");
  kj::String broker_url = kj::str("postgresql://localhost/gentrade");
  kj::String queue = kj::str("backtests");
  size_t broker_max_idle{4};
  size_t broker_max_connections{16};
  kj::Duration visibility_timeout = 7200 * kj::SECONDS;
  kj::Duration poll_interval = 500 * kj::MILLISECONDS;

  size_t concurrency{2};
  kj::Duration receive_timeout = 1000 * kj::MILLISECONDS;

  kj::String runtime = kj::str("docker");
  kj::String userdata_dir = kj::str("./user_data_root");
  kj::String common_data_dir = kj::str("_common_data");
  kj::Duration execution_timeout = 3600 * kj::SECONDS;
  kj::Duration download_timeout = 1800 * kj::SECONDS;
  kj::String exchange = kj::str("binance");
  kj::String trading_mode = kj::str("futures");
  kj::Array<kj::String> default_pairs;

  core::LogLevel log_level{core::LogLevel::Info};
  bool log_json{false};
  kj::Maybe<kj::String> log_file;

  /**
   * @brief Read the settings from `config`, falling back to the defaults above
   *
   * `broker.url` defaults to the database url. FT_USERDATA_DIR in
   * `environ_block` supplies the userdata directory when the config has none.
   * @throws ConfigException for out-of-range or unknown values
   */
  static WorkerConfig from(const core::Config& config, const char* const* environ_block);

  [[nodiscard]] db::PgOptions database_options() const;
  [[nodiscard]] broker::PgQueueOptions queue_options() const;
  [[nodiscard]] broker::PoolOptions pool_options() const;
  [[nodiscard]] exec::RuntimeOptions runtime_options() const;
  [[nodiscard]] exec::MarketDataOptions market_data_options() const;
  [[nodiscard]] TaskOptions task_options() const;
  [[nodiscard]] WorkerPoolOptions pool_options_for(kj::StringPtr name) const;
};

/**
 * @brief Point `logger` at the configured level, format and outputs
 *
 * Console output always stays; a log file is added next to it.
 */
void configure_logging(core::Logger& logger, const WorkerConfig& config);

/**
 * @brief Load `path` (when given) and apply GENTRADE_ environment overrides
 * @throws ConfigException when the file is missing or malformed
 */
core::Config load_config(kj::Maybe<kj::StringPtr> path, const char* const* environ_block);

} // namespace gentrade::jobs
