#include "gentrade/jobs/worker_config.h"

#include "gentrade/core/error.h"

#include <kj/filesystem.h>

namespace gentrade::jobs {

namespace {

constexpr auto kEnvPrefix = "GENTRADE_"_kj;

kj::String string_or(const core::Config& config, kj::StringPtr key, kj::StringPtr fallback) {
  KJ_IF_SOME(value, config.get<kj::StringPtr>(key)) {
    if (value.size() == 0) {
      throw core::ConfigException(kj::str("config key '", key, "' must not be empty"));
    }
    return kj::str(value);
  }
  return kj::str(fallback);
}

std::int64_t positive(const core::Config& config, kj::StringPtr key, std::int64_t fallback) {
  auto value = config.get_or<int64_t>(key, fallback);
  if (value <= 0) {
    throw core::ConfigException(kj::str("config key '", key, "' must be positive, got ", value));
  }
  return value;
}

kj::Maybe<kj::StringPtr> env_value(const char* const* environ_block, kj::StringPtr name) {
  if (environ_block == nullptr) {
    return kj::none;
  }
  for (const char* const* entry = environ_block; *entry != nullptr; ++entry) {
    kj::StringPtr var(*entry);
    if (var.size() > name.size() && var.startsWith(name) && var[name.size()] == '=') {
      return var.slice(name.size() + 1);
    }
  }
  return kj::none;
}

} // namespace

WorkerConfig WorkerConfig::from(const core::Config& config, const char* const* environ_block) {
  WorkerConfig result;

  result.database_url = string_or(config, "database.url"_kj, result.database_url);
  result.broker_url = string_or(config, "broker.url"_kj, result.database_url);
  result.queue = string_or(config, "broker.queue"_kj, result.queue);
  result.broker_max_idle = static_cast<size_t>(config.get_or<int64_t>("broker.max_idle"_kj, 4));
  result.broker_max_connections =
      static_cast<size_t>(positive(config, "broker.max_connections"_kj, 16));
  if (result.broker_max_idle > result.broker_max_connections) {
    throw core::ConfigException(
        kj::str("broker.max_idle (", result.broker_max_idle, ") exceeds broker.max_connections (",
                result.broker_max_connections, ")"));
  }
  result.visibility_timeout = positive(config, "broker.visibility_timeout_s"_kj, 7200) * kj::SECONDS;
  result.poll_interval = positive(config, "broker.poll_interval_ms"_kj, 500) * kj::MILLISECONDS;

  result.concurrency = static_cast<size_t>(positive(config, "worker.concurrency"_kj, 2));
  result.receive_timeout =
      positive(config, "worker.receive_timeout_ms"_kj, 1000) * kj::MILLISECONDS;

  result.runtime = string_or(config, "exec.runtime"_kj, result.runtime);
  if (config.has_key("exec.userdata_dir"_kj)) {
    result.userdata_dir = string_or(config, "exec.userdata_dir"_kj, result.userdata_dir);
  } else {
    KJ_IF_SOME(dir, env_value(environ_block, "FT_USERDATA_DIR"_kj)) {
      if (dir.size() > 0) {
        result.userdata_dir = kj::str(dir);
      }
    }
  }
  result.common_data_dir = string_or(config, "exec.common_data_dir"_kj, result.common_data_dir);
  if (result.common_data_dir.findFirst('/') != kj::none) {
    throw core::ConfigException(kj::str("exec.common_data_dir must be a directory name, got '",
                                        result.common_data_dir, "'"));
  }
  result.execution_timeout = positive(config, "exec.timeout_s"_kj, 3600) * kj::SECONDS;
  result.download_timeout = positive(config, "exec.download_timeout_s"_kj, 1800) * kj::SECONDS;
  // a claimed message must stay hidden for as long as its job may legitimately run
  auto pipeline = result.download_timeout + result.execution_timeout + kStaleStepMargin;
  if (result.visibility_timeout <= pipeline) {
    throw core::ConfigException(kj::str(
        "broker.visibility_timeout_s (", result.visibility_timeout / kj::SECONDS,
        ") must exceed exec.download_timeout_s + exec.timeout_s + ", kStaleStepMargin / kj::SECONDS,
        " (", pipeline / kj::SECONDS, ")"));
  }
  result.exchange = string_or(config, "exec.exchange"_kj, result.exchange);
  result.trading_mode = string_or(config, "exec.trading_mode"_kj, result.trading_mode);
  if (result.trading_mode != "spot"_kj && result.trading_mode != "futures"_kj &&
      result.trading_mode != "margin"_kj) {
    throw core::ConfigException(
        kj::str("exec.trading_mode must be spot, futures or margin, got '", result.trading_mode,
                "'"));
  }
  KJ_IF_SOME(pairs, config.get_list("exec.default_pairs"_kj)) {
    result.default_pairs = kj::mv(pairs);
  }

  auto level_name = string_or(config, "log.level"_kj, "info"_kj);
  KJ_IF_SOME(level, core::parse_log_level(level_name)) {
    result.log_level = level;
  } else {
    throw core::ConfigException(kj::str("unknown log.level '", level_name, "'"));
  }
  auto format = string_or(config, "log.format"_kj, "text"_kj);
  if (format == "json"_kj) {
    result.log_json = true;
  } else if (format != "text"_kj) {
    throw core::ConfigException(kj::str("log.format must be text or json, got '", format, "'"));
  }
  KJ_IF_SOME(file, config.get<kj::StringPtr>("log.file"_kj)) {
    if (file.size() > 0) {
      result.log_file = kj::str(file);
    }
  }
  return result;
}

db::PgOptions WorkerConfig::database_options() const {
  db::PgOptions options;
  options.conninfo = kj::str(database_url);
  return options;
}

broker::PgQueueOptions WorkerConfig::queue_options() const {
  broker::PgQueueOptions options;
  options.conninfo = kj::str(broker_url);
  options.visibility_timeout = visibility_timeout;
  options.poll_interval = poll_interval;
  return options;
}

broker::PoolOptions WorkerConfig::pool_options() const {
  broker::PoolOptions options;
  options.queue = kj::str(queue);
  options.max_idle = broker_max_idle;
  options.max_connections = broker_max_connections;
  return options;
}

exec::RuntimeOptions WorkerConfig::runtime_options() const {
  exec::RuntimeOptions options;
  options.binary = kj::str(runtime);
  return options;
}

exec::MarketDataOptions WorkerConfig::market_data_options() const {
  exec::MarketDataOptions options;
  options.exchange = kj::str(exchange);
  options.trading_mode = kj::str(trading_mode);
  options.timeout = download_timeout;
  return options;
}

TaskOptions WorkerConfig::task_options() const {
  TaskOptions options;
  options.default_pairs = KJ_MAP(pair, default_pairs) { return kj::str(pair); };
  options.download_timeout = download_timeout;
  options.execution_timeout = execution_timeout;
  return options;
}

WorkerPoolOptions WorkerConfig::pool_options_for(kj::StringPtr name) const {
  WorkerPoolOptions options;
  options.concurrency = concurrency;
  options.receive_timeout = receive_timeout;
  options.name = kj::str(name);
  return options;
}

void configure_logging(core::Logger& logger, const WorkerConfig& config) {
  logger.set_level(config.log_level);
  if (config.log_json) {
    logger.set_formatter(kj::heap<core::JsonFormatter>());
  } else {
    logger.set_formatter(kj::heap<core::TextFormatter>());
  }
  KJ_IF_SOME(file, config.log_file) {
    auto fs = kj::newDiskFilesystem();
    logger.add_output(kj::heap<core::FileOutput>(fs->getCurrentPath().evalNative(file)));
  }
}

core::Config load_config(kj::Maybe<kj::StringPtr> path, const char* const* environ_block) {
  core::Config config;
  KJ_IF_SOME(file, path) {
    auto fs = kj::newDiskFilesystem();
    config.load_from_file(fs->getRoot(), fs->getCurrentPath().evalNative(file));
  }
  config.apply_env_overrides(kEnvPrefix, environ_block);
  return config;
}

} // namespace gentrade::jobs
