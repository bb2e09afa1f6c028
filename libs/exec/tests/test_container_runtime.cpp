#include "fake_runtime.h"
#include "gentrade/exec/container_runtime.h"
#include "kj/test.h"

using namespace gentrade::exec;
using gentrade::testing::FakeRuntime;

namespace {

RuntimeOptions options_for(const FakeRuntime& fake) {
  RuntimeOptions options;
  options.binary = fake.binary();
  options.cleanup_timeout = 5 * kj::SECONDS;
  return options;
}

ContainerRunSpec backtest_spec(const FakeRuntime& fake, kj::StringPtr principal) {
  return ContainerRunSpec{
      fake.user_dir(principal).append("docker-compose.yml").toNativeString(true),
      kj::str("gentrade-test"),
      kj::arr(kj::str("backtesting"), kj::str("--export-filename"),
              kj::str("/freqtrade/user_data/backtest_results/backtest_t.json"))};
}

KJ_TEST("ContainerRuntime: exit code and output of a finished run") {
  FakeRuntime fake;
  fake.provision("alice"_kj);
  ContainerRuntime runtime(options_for(fake));
  auto io = kj::setupAsyncIo();

  auto result = runtime.run(io, backtest_spec(fake, "alice"_kj), 10 * kj::SECONDS).wait(io.waitScope);
  KJ_EXPECT(result.status == RunStatus::Exited);
  KJ_EXPECT(result.exit_code == 0);
  KJ_EXPECT(result.stdout_text.size() > 0);
  KJ_EXPECT(fake.backtest_runs() == 1);

  fake.set_backtest("alice"_kj, "fail"_kj);
  auto failed = runtime.run(io, backtest_spec(fake, "alice"_kj), 10 * kj::SECONDS).wait(io.waitScope);
  KJ_EXPECT(failed.status == RunStatus::Exited);
  KJ_EXPECT(failed.exit_code == 2);
}

KJ_TEST("ContainerRuntime: a missing binary means the runtime is unavailable") {
  RuntimeOptions options;
  options.binary = kj::str("/nonexistent/gentrade-docker");
  ContainerRuntime runtime(kj::mv(options));
  auto io = kj::setupAsyncIo();

  ContainerRunSpec spec{kj::str("/tmp/none.yml"), kj::str("c"), nullptr};
  auto result = runtime.run(io, spec, kj::SECONDS).wait(io.waitScope);
  KJ_EXPECT(result.status == RunStatus::RuntimeUnavailable);
  KJ_EXPECT(result.detail.size() > 0);
}

KJ_TEST("ContainerRuntime: an unreachable daemon is reported as unavailable") {
  FakeRuntime fake;
  fake.provision("alice"_kj);
  fake.set_backtest("alice"_kj, "unavailable"_kj);
  ContainerRuntime runtime(options_for(fake));
  auto io = kj::setupAsyncIo();

  auto result = runtime.run(io, backtest_spec(fake, "alice"_kj), 10 * kj::SECONDS).wait(io.waitScope);
  KJ_EXPECT(result.status == RunStatus::RuntimeUnavailable);
  KJ_EXPECT(result.exit_code == 1);
}

KJ_TEST("ContainerRuntime: timeout kills the client and removes the container") {
  FakeRuntime fake;
  fake.provision("alice"_kj);
  fake.set_backtest("alice"_kj, "sleep"_kj);
  ContainerRuntime runtime(options_for(fake));
  auto io = kj::setupAsyncIo();

  auto started = io.provider->getTimer().now();
  auto result =
      runtime.run(io, backtest_spec(fake, "alice"_kj), 300 * kj::MILLISECONDS).wait(io.waitScope);
  KJ_EXPECT(result.status == RunStatus::TimedOut);
  KJ_EXPECT(io.provider->getTimer().now() - started < 10 * kj::SECONDS);
  KJ_EXPECT(fake.removed_containers() == 1);
}

KJ_TEST("ContainerRuntime: unavailable classification") {
  KJ_EXPECT(ContainerRuntime::indicates_unavailable(125, ""_kj));
  KJ_EXPECT(ContainerRuntime::indicates_unavailable(127, ""_kj));
  KJ_EXPECT(ContainerRuntime::indicates_unavailable(
      1, "Cannot connect to the Docker daemon at unix:///var/run/docker.sock"_kj));
  KJ_EXPECT(!ContainerRuntime::indicates_unavailable(1, "strategy failed"_kj));
  KJ_EXPECT(!ContainerRuntime::indicates_unavailable(0, ""_kj));
}

} // namespace
