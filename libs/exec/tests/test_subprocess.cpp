#include "gentrade/exec/subprocess.h"
#include "kj/test.h"

#include <cerrno>
#include <cstring>
#include <signal.h>

using namespace gentrade::exec;

namespace {

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return std::strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

KJ_TEST("SubprocessHandle: captures stdout, stderr and the exit code") {
  auto io = kj::setupAsyncIo();
  SubprocessHandle process(io);
  auto args = kj::arr(kj::str("-c"), kj::str("echo out; echo err >&2; exit 3"));
  process.spawn("sh"_kj, args);
  KJ_EXPECT(process.is_running());
  KJ_EXPECT(process.pid() > 0);

  auto output = process.collect().wait(io.waitScope);
  KJ_EXPECT(output.exit_code == 3);
  KJ_EXPECT(output.stdout_text == "out\n"_kj);
  KJ_EXPECT(output.stderr_text == "err\n"_kj);
  KJ_EXPECT(!process.is_running());
}

KJ_TEST("SubprocessHandle: output larger than a pipe buffer does not deadlock") {
  auto io = kj::setupAsyncIo();
  SubprocessHandle process(io);
  auto args = kj::arr(kj::str("-c"),
                      kj::str("i=0; while [ $i -lt 20000 ]; do echo line $i; echo e $i >&2; "
                              "i=$((i+1)); done"));
  process.spawn("sh"_kj, args);
  auto output = process.collect().wait(io.waitScope);
  KJ_EXPECT(output.exit_code == 0);
  KJ_EXPECT(contains(output.stdout_text, "line 19999\n"_kj));
  KJ_EXPECT(contains(output.stderr_text, "e 19999\n"_kj));
}

KJ_TEST("SubprocessHandle: a missing program is a SpawnError with ENOENT") {
  auto io = kj::setupAsyncIo();
  SubprocessHandle process(io);
  bool thrown = false;
  try {
    process.spawn("gentrade-no-such-program"_kj, nullptr);
  } catch (const SpawnError& e) {
    thrown = true;
    KJ_EXPECT(e.error_number() == ENOENT);
    KJ_EXPECT(contains(e.message(), "gentrade-no-such-program"_kj), e.message());
  }
  KJ_EXPECT(thrown);
  KJ_EXPECT(!process.is_running());
}

KJ_TEST("SubprocessHandle: kill stops the whole process group") {
  auto io = kj::setupAsyncIo();
  SubprocessHandle process(io);
  // the shell forks sleep; both are in the killed group
  auto args = kj::arr(kj::str("-c"), kj::str("sleep 30; echo done"));
  process.spawn("sh"_kj, args);
  io.provider->getTimer().afterDelay(50 * kj::MILLISECONDS).wait(io.waitScope);
  process.kill();
  KJ_EXPECT(!process.is_running());
}

KJ_TEST("SubprocessHandle: wait_exit reports a signal") {
  auto io = kj::setupAsyncIo();
  SubprocessHandle process(io);
  auto args = kj::arr(kj::str("-c"), kj::str("kill -TERM $$"));
  process.spawn("sh"_kj, args);
  auto result = process.wait_exit().wait(io.waitScope);
  KJ_EXPECT(result.exit_code == 128 + SIGTERM);
  KJ_EXPECT(result.error_message != kj::none);
}

} // namespace
