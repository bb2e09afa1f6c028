/**
 * @file subprocess.h
 * @brief Child process management on the KJ event loop
 */

#pragma once

#include "gentrade/core/error.h"

#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <unistd.h>

namespace gentrade::exec {

/**
 * @brief The child could not be started (fork or exec failed)
 */
class SpawnError final : public core::GentradeException {
public:
  SpawnError(kj::StringPtr message, int error_number,
             const std::source_location& location = std::source_location::current())
      : core::GentradeException(message, core::ErrorCode::Execution,
                                kj::Exception::Type::FAILED, location),
        error_number_(error_number) {}

  [[nodiscard]] int error_number() const noexcept {
    return error_number_;
  }

private:
  int error_number_;
};

struct ExitResult {
  int exit_code;                        // 128 + signal when killed
  kj::Maybe<kj::String> error_message;  // set for abnormal exits
};

struct ProcessOutput {
  int exit_code{0};
  kj::String stdout_text;
  kj::String stderr_text;
};

/**
 * @brief One child process with captured stdout and stderr
 *
 * The child runs in its own process group with stdin on /dev/null, so kill()
 * also reaches anything it spawned. Exit is detected by polling waitpid() on
 * the context's timer, which keeps several event loops in one process from
 * competing for SIGCHLD.
 */
class SubprocessHandle {
public:
  explicit SubprocessHandle(kj::AsyncIoContext& io);
  ~SubprocessHandle() noexcept;

  SubprocessHandle(const SubprocessHandle&) = delete;
  SubprocessHandle& operator=(const SubprocessHandle&) = delete;
  SubprocessHandle(SubprocessHandle&&) = delete;
  SubprocessHandle& operator=(SubprocessHandle&&) = delete;

  /**
   * @brief Start `command` (looked up in PATH) with `args`
   * @throws SpawnError carrying errno when the pipes, fork or exec fail
   */
  void spawn(kj::StringPtr command, kj::ArrayPtr<const kj::String> args);

  kj::AsyncInputStream& stdout_stream();
  kj::AsyncInputStream& stderr_stream();

  kj::Promise<ExitResult> wait_exit();

  /**
   * @brief Drain both pipes to EOF, then reap the child
   *
   * Each stream is capped at `limit` bytes.
   */
  kj::Promise<ProcessOutput> collect(uint64_t limit = 64ull << 20);

  // SIGKILL the process group and reap the child
  void kill();

  [[nodiscard]] bool is_running() const noexcept {
    return running_;
  }
  [[nodiscard]] pid_t pid() const noexcept {
    return pid_;
  }

private:
  kj::AsyncIoContext& io_;

  pid_t pid_{-1};
  bool running_{false};

  kj::Maybe<kj::Own<kj::AsyncInputStream>> stdout_;
  kj::Maybe<kj::Own<kj::AsyncInputStream>> stderr_;
};

} // namespace gentrade::exec
