#include "gentrade/exec/market_data.h"

#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"
#include "gentrade/core/uuid.h"
#include "gentrade/exec/date_range.h"
#include "gentrade/exec/log_parser.h"

#include <kj/vector.h>

namespace gentrade::exec {

kj::String pair_file_stem(kj::StringPtr pair) {
  auto stem = kj::heapString(pair);
  for (char& c : stem) {
    if (c == '/' || c == ':') {
      c = '_';
    }
  }
  return stem;
}

MarketDataPreparer::MarketDataPreparer(ContainerRuntime& runtime, const UserSandbox& sandbox,
                                       MarketDataOptions options)
    : runtime_(runtime), sandbox_(sandbox), options_(kj::mv(options)) {}

kj::Array<kj::Path> MarketDataPreparer::required_files(kj::ArrayPtr<const kj::String> pairs,
                                                       kj::StringPtr timeframe) const {
  auto dir = sandbox_.common_data_dir().append(options_.trading_mode);
  bool futures = options_.trading_mode == "futures"_kj;
  kj::Vector<kj::Path> files;
  for (auto& pair : pairs) {
    auto stem = pair_file_stem(pair);
    files.add(dir.append(kj::str(stem, "-", timeframe, "-", options_.trading_mode, ".feather")));
    if (futures) {
      files.add(dir.append(kj::str(stem, "-8h-mark.feather")));
      files.add(dir.append(kj::str(stem, "-8h-funding_rate.feather")));
    }
  }
  return files.releaseAsArray();
}

kj::Array<kj::String> MarketDataPreparer::download_args(kj::ArrayPtr<const kj::String> pairs,
                                                        kj::StringPtr timeframe,
                                                        kj::StringPtr date_range) const {
  kj::Vector<kj::String> args;
  args.add(kj::str("download-data"));
  args.add(kj::str("--datadir"));
  args.add(kj::str(kContainerCommonData));
  args.add(kj::str("--pairs"));
  for (auto& pair : pairs) {
    args.add(kj::str(pair));
  }
  args.add(kj::str("--timeframes"));
  args.add(kj::str(timeframe));
  args.add(kj::str("--timerange"));
  args.add(kj::str(date_range));
  args.add(kj::str("--exchange"));
  args.add(kj::str(options_.exchange));
  args.add(kj::str("--trading-mode"));
  args.add(kj::str(options_.trading_mode));
  return args.releaseAsArray();
}

kj::Array<kj::String> MarketDataPreparer::missing_files(kj::ArrayPtr<const kj::Path> files) const {
  kj::Vector<kj::String> missing;
  for (auto& file : files) {
    if (!sandbox_.exists(file)) {
      missing.add(file.basename().toString());
    }
  }
  return missing.releaseAsArray();
}

void MarketDataPreparer::ensure(kj::AsyncIoContext& io, const DataRequest& request) {
  if (request.pairs.size() == 0) {
    throw core::DataPreparationException("strategy defines no trading pairs"_kj);
  }
  kj::StringPtr timeframe;
  KJ_IF_SOME(tf, request.timeframe) {
    timeframe = tf;
  } else {
    throw core::DataPreparationException("strategy defines no timeframe"_kj);
  }
  if (parse_date_range(request.date_range) == kj::none) {
    throw core::DataPreparationException(kj::str("invalid date range ", request.date_range));
  }

  auto files = required_files(request.pairs, timeframe);
  if (missing_files(files).size() == 0) {
    core::global_logger().info(kj::str("market data for ", request.pairs.size(),
                                       " pair(s) already present"));
    return;
  }

  auto compose_file = sandbox_.compose_file(request.principal);
  if (!sandbox_.exists(compose_file)) {
    throw core::DataPreparationException(
        kj::str("no execution environment at ", UserSandbox::native(compose_file)));
  }

  ContainerRunSpec spec{UserSandbox::native(compose_file),
                        kj::str("gentrade-download-", core::generate_uuid()),
                        download_args(request.pairs, timeframe, request.date_range)};
  core::global_logger().info(kj::str("downloading ", timeframe, " data for ",
                                     kj::strArray(request.pairs, ","), " over ",
                                     request.date_range));
  auto result = runtime_.run(io, spec, options_.timeout).wait(io.waitScope);
  auto output = kj::str(result.stdout_text, "\n", result.stderr_text);

  switch (result.status) {
  case RunStatus::RuntimeUnavailable:
    throw core::DataPreparationException(
        kj::str("container runtime unavailable during download: ", result.detail));
  case RunStatus::TimedOut:
    throw core::DataPreparationException(kj::str("data download ", result.detail));
  case RunStatus::Exited:
    break;
  }
  if (result.exit_code != 0) {
    throw core::DataPreparationException(kj::str("data download exited with code ",
                                                 result.exit_code, ": ",
                                                 summarize_failure(output)));
  }

  // The engine exits 0 even when single pairs fail, so the log and the files decide
  auto errors = count_error_lines(output);
  if (errors > 0) {
    for (auto& line : parse_log(output)) {
      if (line.is_error()) {
        core::global_logger().error(kj::str("download: ", line.message));
      }
    }
    throw core::DataPreparationException(kj::str("data download reported ", errors,
                                                 " error(s): ", summarize_failure(output)));
  }
  auto missing = missing_files(files);
  if (missing.size() > 0) {
    throw core::DataPreparationException(
        kj::str("data files missing after download: ", kj::strArray(missing, ", ")));
  }
  core::global_logger().info(kj::str("downloaded ", files.size(), " data file(s)"));
}

} // namespace gentrade::exec
