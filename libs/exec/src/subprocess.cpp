#include "gentrade/exec/subprocess.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <signal.h>
#include <sys/wait.h>

namespace gentrade::exec {

namespace {

// How often a running child is checked for exit
constexpr auto kReapInterval = 20 * kj::MILLISECONDS;

// Closes the descriptors it still owns on every exit path of spawn()
struct Pipe {
  int fds[2]{-1, -1};

  ~Pipe() {
    close_read();
    close_write();
  }
  void close_read() {
    if (fds[0] >= 0) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] >= 0) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
  int release_read() {
    int fd = fds[0];
    fds[0] = -1;
    return fd;
  }
};

void open_pipe(Pipe& pipe, const char* what) {
  // close-on-exec so concurrently spawned children never inherit our ends
  if (::pipe2(pipe.fds, O_CLOEXEC) < 0) {
    int saved_errno = errno;
    throw SpawnError(kj::str("failed to create ", what, " pipe: ", std::strerror(saved_errno)),
                     saved_errno);
  }
}

ExitResult to_exit_result(int status) {
  ExitResult result;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
    result.error_message = kj::str("process killed by signal ", WTERMSIG(status));
  } else {
    result.exit_code = -1;
    result.error_message = kj::str("unknown exit status");
  }
  return result;
}

} // namespace

SubprocessHandle::SubprocessHandle(kj::AsyncIoContext& io) : io_(io) {}

SubprocessHandle::~SubprocessHandle() noexcept {
  kill();
}

void SubprocessHandle::spawn(kj::StringPtr command, kj::ArrayPtr<const kj::String> args) {
  KJ_REQUIRE(!running_, "subprocess already running");

  // argv is built before fork; the child may only make async-signal-safe calls
  kj::Vector<char*> argv(args.size() + 2);
  argv.add(const_cast<char*>(command.cStr()));
  for (auto& arg : args) {
    argv.add(const_cast<char*>(arg.cStr()));
  }
  argv.add(nullptr);

  Pipe out;
  Pipe err;
  Pipe status;
  open_pipe(out, "stdout");
  open_pipe(err, "stderr");
  open_pipe(status, "exec status");

  pid_ = ::fork();
  if (pid_ < 0) {
    int saved_errno = errno;
    pid_ = -1;
    throw SpawnError(kj::str("failed to fork: ", std::strerror(saved_errno)), saved_errno);
  }

  if (pid_ == 0) {
    // Child process
    ::setpgid(0, 0);
    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0 || ::dup2(null_fd, STDIN_FILENO) < 0 ||
        ::dup2(out.fds[1], STDOUT_FILENO) < 0 || ::dup2(err.fds[1], STDERR_FILENO) < 0) {
      int child_errno = errno;
      (void)!::write(status.fds[1], &child_errno, sizeof(child_errno));
      _exit(127);
    }
    ::execvp(command.cStr(), argv.begin());

    // only reached when exec failed; the status pipe reports why
    int child_errno = errno;
    (void)!::write(status.fds[1], &child_errno, sizeof(child_errno));
    _exit(127);
  }

  // Parent process
  ::setpgid(pid_, pid_);
  out.close_write();
  err.close_write();
  status.close_write();

  // EOF on the status pipe means exec succeeded and closed it
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status.fds[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int wait_status = 0;
    ::waitpid(pid_, &wait_status, 0);
    pid_ = -1;
    throw SpawnError(kj::str("failed to execute ", command, ": ", std::strerror(child_errno)),
                     child_errno);
  }

  for (Pipe* pipe : {&out, &err}) {
    int flags = ::fcntl(pipe->fds[0], F_GETFL, 0);
    if (flags < 0 || ::fcntl(pipe->fds[0], F_SETFL, flags | O_NONBLOCK) < 0) {
      int saved_errno = errno;
      running_ = true;
      kill();
      throw SpawnError(kj::str("failed to set pipe non-blocking: ", std::strerror(saved_errno)),
                       saved_errno);
    }
  }

  stdout_ = io_.lowLevelProvider->wrapInputFd(out.release_read(),
                                              kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP);
  stderr_ = io_.lowLevelProvider->wrapInputFd(err.release_read(),
                                              kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP);
  running_ = true;
}

kj::AsyncInputStream& SubprocessHandle::stdout_stream() {
  KJ_IF_SOME(stream, stdout_) {
    return *stream;
  }
  KJ_FAIL_REQUIRE("stdout stream not available");
}

kj::AsyncInputStream& SubprocessHandle::stderr_stream() {
  KJ_IF_SOME(stream, stderr_) {
    return *stream;
  }
  KJ_FAIL_REQUIRE("stderr stream not available");
}

kj::Promise<ExitResult> SubprocessHandle::wait_exit() {
  KJ_REQUIRE(pid_ > 0, "process not spawned");

  for (;;) {
    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      running_ = false;
      co_return ExitResult{-1, kj::str("waitpid failed: ", std::strerror(errno))};
    }
    if (result == pid_) {
      running_ = false;
      co_return to_exit_result(status);
    }
    co_await io_.provider->getTimer().afterDelay(kReapInterval);
  }
}

kj::Promise<ProcessOutput> SubprocessHandle::collect(uint64_t limit) {
  // Both pipes are read concurrently so a chatty stderr cannot block the child
  auto texts = co_await kj::joinPromises(
      kj::arr(stdout_stream().readAllText(limit), stderr_stream().readAllText(limit)));
  auto exit = co_await wait_exit();

  ProcessOutput output;
  output.exit_code = exit.exit_code;
  output.stdout_text = kj::mv(texts[0]);
  output.stderr_text = kj::mv(texts[1]);
  co_return output;
}

void SubprocessHandle::kill() {
  if (running_ && pid_ > 0) {
    ::kill(-pid_, SIGKILL);
    running_ = false;

    // Reap to avoid a zombie
    int status;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
  stdout_ = kj::none;
  stderr_ = kj::none;
}

} // namespace gentrade::exec
