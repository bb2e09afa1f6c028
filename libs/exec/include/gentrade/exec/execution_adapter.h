/**
 * @file execution_adapter.h
 * @brief Backtest execution inside a user's container environment
 */

#pragma once

#include "gentrade/exec/container_runtime.h"
#include "gentrade/exec/user_sandbox.h"

#include <kj/async-io.h>
#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::exec {

/**
 * @brief What to execute: a strategy file in its owner's sandbox
 */
struct StrategyReference {
  kj::String principal; // owner, selects the sandbox
  kj::String file;      // e.g. "MyStrategy.py" under user_data/strategies
};

// The engine addresses strategies by class name, the file name without ".py"
[[nodiscard]] kj::String strategy_class_name(kj::StringPtr file);

/**
 * @brief Runs a backtest and returns the host path of its result artifact
 *
 * Implementations block on the given context until the run completes.
 * Failures are reported as core::ExecutionException; nothing is retried.
 */
class ExecutionRunner {
public:
  virtual ~ExecutionRunner() = default;

  virtual kj::String execute(kj::AsyncIoContext& io, const StrategyReference& reference,
                             kj::StringPtr date_range) = 0;
};

class ExecutionAdapter final : public ExecutionRunner {
public:
  ExecutionAdapter(ContainerRuntime& runtime, const UserSandbox& sandbox, kj::Duration timeout);

  kj::String execute(kj::AsyncIoContext& io, const StrategyReference& reference,
                     kj::StringPtr date_range) override;

  [[nodiscard]] static kj::Array<kj::String> backtest_args(kj::StringPtr class_name,
                                                           kj::StringPtr date_range,
                                                           kj::StringPtr export_file);

  /**
   * @brief Container paths to look for, in order of preference
   *
   * The engine reports its metadata file; the result itself is stored next
   * to it as a zip or plain JSON depending on the engine version. The
   * requested export file is the last resort.
   */
  [[nodiscard]] static kj::Array<kj::String> artifact_candidates(kj::Maybe<kj::StringPtr> reported,
                                                                 kj::StringPtr requested);

private:
  kj::String locate_artifact(kj::StringPtr principal, kj::StringPtr output,
                             kj::StringPtr requested) const;

  ContainerRuntime& runtime_;
  const UserSandbox& sandbox_;
  kj::Duration timeout_;
};

} // namespace gentrade::exec
