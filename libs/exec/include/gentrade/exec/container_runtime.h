#pragma once

#include "gentrade/exec/subprocess.h"

#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::exec {

struct RuntimeOptions final {
  kj::String binary = kj::str("docker");
  kj::String service = kj::str("freqtrade"); // compose service running the engine
  kj::Duration cleanup_timeout = 30 * kj::SECONDS;
};

struct ContainerRunSpec final {
  kj::String compose_file; // host path of the user's docker-compose.yml
  kj::String container_name;
  kj::Array<kj::String> args; // engine arguments after the service name
};

enum class RunStatus { Exited, TimedOut, RuntimeUnavailable };

struct RunResult final {
  RunStatus status{RunStatus::Exited};
  int exit_code{0};
  kj::String stdout_text;
  kj::String stderr_text;
  kj::String detail; // why the runtime was unavailable or the run timed out
};

/**
 * @brief Runs one-off engine containers through the compose CLI
 *
 * Invokes `<binary> compose -f <file> run --rm --name <name> <service> <args...>`.
 * When the deadline passes the CLI is killed and the container force-removed,
 * since killing the client does not stop the container.
 */
class ContainerRuntime {
public:
  explicit ContainerRuntime(RuntimeOptions options);

  kj::Promise<RunResult> run(kj::AsyncIoContext& io, const ContainerRunSpec& spec,
                             kj::Duration timeout);

  [[nodiscard]] const RuntimeOptions& options() const {
    return options_;
  }

  // Exit codes and output that mean the runtime itself failed, not the engine
  [[nodiscard]] static bool indicates_unavailable(int exit_code, kj::StringPtr output);

private:
  kj::Promise<void> force_remove(kj::AsyncIoContext& io, kj::String container_name);

  RuntimeOptions options_;
};

} // namespace gentrade::exec
