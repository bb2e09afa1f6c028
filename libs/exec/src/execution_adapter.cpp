#include "gentrade/exec/execution_adapter.h"

#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"
#include "gentrade/core/uuid.h"
#include "gentrade/exec/date_range.h"
#include "gentrade/exec/log_parser.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace gentrade::exec {

namespace {

kj::StringPtr strip_suffix(kj::StringPtr text, kj::StringPtr suffix, kj::String& storage) {
  if (text.endsWith(suffix)) {
    storage = kj::heapString(text.asArray().first(text.size() - suffix.size()));
    return storage;
  }
  return text;
}

} // namespace

kj::String strategy_class_name(kj::StringPtr file) {
  KJ_REQUIRE(file.size() > 0, "strategy has no file");
  kj::String storage;
  return kj::str(strip_suffix(file, ".py"_kj, storage));
}

ExecutionAdapter::ExecutionAdapter(ContainerRuntime& runtime, const UserSandbox& sandbox,
                                   kj::Duration timeout)
    : runtime_(runtime), sandbox_(sandbox), timeout_(timeout) {}

kj::Array<kj::String> ExecutionAdapter::backtest_args(kj::StringPtr class_name,
                                                      kj::StringPtr date_range,
                                                      kj::StringPtr export_file) {
  return kj::arr(kj::str("backtesting"), kj::str("--datadir"), kj::str(kContainerCommonData),
                 kj::str("--strategy"), kj::str(class_name), kj::str("--timerange"),
                 kj::str(date_range), kj::str("--export"), kj::str("trades"),
                 kj::str("--export-filename"), kj::str(export_file));
}

kj::Array<kj::String> ExecutionAdapter::artifact_candidates(kj::Maybe<kj::StringPtr> reported,
                                                            kj::StringPtr requested) {
  kj::Vector<kj::String> candidates;
  KJ_IF_SOME(path, reported) {
    kj::String storage;
    auto stem = strip_suffix(path, ".meta.json"_kj, storage);
    if (stem.size() == path.size()) {
      stem = strip_suffix(path, ".json"_kj, storage);
    }
    candidates.add(kj::str(stem, ".zip"));
    candidates.add(kj::str(path));
    candidates.add(kj::str(stem, ".json"));
  }
  candidates.add(kj::str(requested));
  return candidates.releaseAsArray();
}

kj::String ExecutionAdapter::execute(kj::AsyncIoContext& io, const StrategyReference& reference,
                                     kj::StringPtr date_range) {
  require_date_range(date_range);
  auto class_name = strategy_class_name(reference.file);

  auto compose_file = sandbox_.compose_file(reference.principal);
  if (!sandbox_.exists(compose_file)) {
    throw core::ExecutionException(
        core::ExecutionCause::RuntimeUnavailable,
        kj::str("no execution environment at ", UserSandbox::native(compose_file)));
  }
  sandbox_.ensure_directory(sandbox_.results_dir(reference.principal));

  auto run_id = core::generate_uuid();
  auto export_file = kj::str(kContainerUserData, "/backtest_results/backtest_", run_id, ".json");
  ContainerRunSpec spec{UserSandbox::native(compose_file), kj::str("gentrade-backtest-", run_id),
                        backtest_args(class_name, date_range, export_file)};

  core::global_logger().info(kj::str("running backtest of ", class_name, " over ", date_range,
                                     " in ", spec.container_name));
  auto result = runtime_.run(io, spec, timeout_).wait(io.waitScope);
  auto output = kj::str(result.stdout_text, "\n", result.stderr_text);

  switch (result.status) {
  case RunStatus::RuntimeUnavailable:
    throw core::ExecutionException(core::ExecutionCause::RuntimeUnavailable,
                                   kj::str("container runtime unavailable: ", result.detail),
                                   result.exit_code);
  case RunStatus::TimedOut:
    throw core::ExecutionException(core::ExecutionCause::Timeout,
                                   kj::str("backtest ", result.detail));
  case RunStatus::Exited:
    break;
  }

  if (result.exit_code != 0) {
    throw core::ExecutionException(core::ExecutionCause::NonZeroExit,
                                   kj::str("backtest exited with code ", result.exit_code, ": ",
                                           summarize_failure(output)),
                                   result.exit_code);
  }

  return locate_artifact(reference.principal, output, export_file);
}

kj::String ExecutionAdapter::locate_artifact(kj::StringPtr principal, kj::StringPtr output,
                                             kj::StringPtr requested) const {
  auto reported = find_result_path(output);
  kj::Maybe<kj::StringPtr> reported_ptr;
  KJ_IF_SOME(path, reported) {
    reported_ptr = path.asPtr();
  } else {
    core::global_logger().warn("engine did not report a result file, using the requested name"_kj);
  }

  for (auto& candidate : artifact_candidates(reported_ptr, requested)) {
    KJ_IF_SOME(host_path, sandbox_.map_container_path(principal, candidate)) {
      if (sandbox_.exists(host_path)) {
        return UserSandbox::native(host_path);
      }
    } else {
      core::global_logger().warn(kj::str("result path outside the sandbox mounts: ", candidate));
    }
  }
  throw core::ExecutionException(core::ExecutionCause::MissingArtifact,
                                 kj::str("backtest finished without a result file for ",
                                         reported_ptr.orDefault(requested)));
}

} // namespace gentrade::exec
