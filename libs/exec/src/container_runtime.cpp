#include "gentrade/exec/container_runtime.h"

#include "gentrade/core/logger.h"

#include <cstring>
#include <kj/debug.h>
#include <kj/vector.h>

namespace gentrade::exec {

namespace {

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return std::strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

} // namespace

ContainerRuntime::ContainerRuntime(RuntimeOptions options) : options_(kj::mv(options)) {}

bool ContainerRuntime::indicates_unavailable(int exit_code, kj::StringPtr output) {
  // 125: the docker CLI failed; 126/127: the command could not be executed
  if (exit_code == 125 || exit_code == 126 || exit_code == 127) {
    return true;
  }
  return contains(output, "Cannot connect to the Docker daemon"_kj) ||
         contains(output, "Is the docker daemon running"_kj);
}

kj::Promise<RunResult> ContainerRuntime::run(kj::AsyncIoContext& io, const ContainerRunSpec& spec,
                                             kj::Duration timeout) {
  kj::Vector<kj::String> argv;
  argv.add(kj::str("compose"));
  argv.add(kj::str("-f"));
  argv.add(kj::str(spec.compose_file));
  argv.add(kj::str("run"));
  argv.add(kj::str("--rm"));
  argv.add(kj::str("--name"));
  argv.add(kj::str(spec.container_name));
  argv.add(kj::str(options_.service));
  for (auto& arg : spec.args) {
    argv.add(kj::str(arg));
  }
  auto container_name = kj::str(spec.container_name);

  RunResult result;
  auto process = kj::heap<SubprocessHandle>(io);
  try {
    process->spawn(options_.binary, argv.asPtr());
  } catch (const SpawnError& e) {
    result.status = RunStatus::RuntimeUnavailable;
    result.exit_code = -1;
    result.detail = kj::str(e.message());
    co_return result;
  }

  auto finished = process->collect().then(
      [](ProcessOutput output) -> kj::Maybe<ProcessOutput> { return kj::mv(output); });
  auto expired = io.provider->getTimer().afterDelay(timeout).then(
      []() -> kj::Maybe<ProcessOutput> { return kj::none; });

  KJ_IF_SOME(output, co_await finished.exclusiveJoin(kj::mv(expired))) {
    result.exit_code = output.exit_code;
    result.stdout_text = kj::mv(output.stdout_text);
    result.stderr_text = kj::mv(output.stderr_text);
    auto combined = kj::str(result.stdout_text, "\n", result.stderr_text);
    if (indicates_unavailable(result.exit_code, combined)) {
      result.status = RunStatus::RuntimeUnavailable;
      result.detail = kj::str(options_.binary, " exited with code ", result.exit_code);
    }
    co_return result;
  }

  process->kill();
  core::global_logger().warn(kj::str("container ", container_name, " exceeded ",
                                     timeout / kj::SECONDS, "s, removing it"));
  co_await force_remove(io, kj::mv(container_name));
  result.status = RunStatus::TimedOut;
  result.exit_code = -1;
  result.detail = kj::str("execution exceeded ", timeout / kj::SECONDS, "s");
  co_return result;
}

kj::Promise<void> ContainerRuntime::force_remove(kj::AsyncIoContext& io,
                                                 kj::String container_name) {
  auto args = kj::arr(kj::str("rm"), kj::str("-f"), kj::mv(container_name));
  auto cleanup = kj::heap<SubprocessHandle>(io);
  try {
    cleanup->spawn(options_.binary, args);
  } catch (const SpawnError& e) {
    core::global_logger().error(kj::str("cannot remove container ", args[2], ": ", e.message()));
    co_return;
  }

  auto finished = cleanup->collect().then(
      [](ProcessOutput output) -> kj::Maybe<ProcessOutput> { return kj::mv(output); });
  auto expired = io.provider->getTimer().afterDelay(options_.cleanup_timeout).then(
      []() -> kj::Maybe<ProcessOutput> { return kj::none; });
  KJ_IF_SOME(output, co_await finished.exclusiveJoin(kj::mv(expired))) {
    if (output.exit_code != 0) {
      core::global_logger().warn(kj::str("removing container ", args[2], " exited with code ",
                                         output.exit_code, ": ", output.stderr_text));
    }
  } else {
    cleanup->kill();
    core::global_logger().error(kj::str("removing container ", args[2], " timed out"));
  }
}

} // namespace gentrade::exec
