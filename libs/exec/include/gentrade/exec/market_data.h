#pragma once

#include "gentrade/exec/container_runtime.h"
#include "gentrade/exec/user_sandbox.h"

#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/filesystem.h>
#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::exec {

/**
 * @brief Market data a strategy needs before it can be backtested
 */
struct DataRequest {
  kj::StringPtr principal; // whose environment runs the download
  kj::ArrayPtr<const kj::String> pairs;
  kj::Maybe<kj::StringPtr> timeframe;
  kj::StringPtr date_range;
};

/**
 * @brief Makes sure the data for a request is present on the host
 *
 * Blocks on the given context. Failures are core::DataPreparationException.
 */
class DataPreparer {
public:
  virtual ~DataPreparer() = default;

  virtual void ensure(kj::AsyncIoContext& io, const DataRequest& request) = 0;
};

struct MarketDataOptions {
  kj::String exchange = kj::str("binance");
  kj::String trading_mode = kj::str("futures");
  kj::Duration timeout = 1800 * kj::SECONDS;
};

// "BTC/USDT:USDT" -> "BTC_USDT_USDT", the engine's file naming
[[nodiscard]] kj::String pair_file_stem(kj::StringPtr pair);

/**
 * @brief Downloads missing candles through the engine's download-data command
 *
 * Data is shared by all users under the sandbox's common data directory.
 */
class MarketDataPreparer final : public DataPreparer {
public:
  MarketDataPreparer(ContainerRuntime& runtime, const UserSandbox& sandbox,
                     MarketDataOptions options);

  void ensure(kj::AsyncIoContext& io, const DataRequest& request) override;

  /**
   * @brief Host files the engine reads for these pairs
   *
   * `<common>/<mode>/<PAIR>-<tf>-<mode>.feather`, plus the 8h mark and
   * funding rate series in futures mode.
   */
  [[nodiscard]] kj::Array<kj::Path> required_files(kj::ArrayPtr<const kj::String> pairs,
                                                   kj::StringPtr timeframe) const;

  [[nodiscard]] kj::Array<kj::String> download_args(kj::ArrayPtr<const kj::String> pairs,
                                                    kj::StringPtr timeframe,
                                                    kj::StringPtr date_range) const;

private:
  [[nodiscard]] kj::Array<kj::String> missing_files(kj::ArrayPtr<const kj::Path> files) const;

  ContainerRuntime& runtime_;
  const UserSandbox& sandbox_;
  MarketDataOptions options_;
};

} // namespace gentrade::exec
