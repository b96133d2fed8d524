// src/harness/process_runner.cpp
//
// POSIX child-process runner for the harness: fork/exec with the child's
// stdout and stderr redirected into one pipe, a poll() loop that drains it,
// and an optional wall-clock timeout that SIGKILLs the child.

#include "emx/harness/harness_runner.h"

#include "emx/core/logging.h"
#include "emx/core/timer.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <sstream>
#include <string>
#include <vector>

namespace emx {
namespace harness {

namespace {

// Closes the descriptor on scope exit.
class ScopedFd {
 public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ~ScopedFd() { Reset(); }

  int get() const noexcept { return fd_; }

  void Reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

bool MakePipe(ScopedFd* rd, ScopedFd* wr) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) return false;
  rd->Reset(fds[0]);
  wr->Reset(fds[1]);
  return true;
}

std::string JoinArgv(const std::vector<std::string>& argv) {
  std::ostringstream oss;
  for (usize i = 0; i < argv.size(); ++i) {
    if (i) oss << ' ';
    oss << argv[i];
  }
  return oss.str();
}

int ExitCodeOf(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

std::vector<std::string> BuildArgv(const HarnessConfig& cfg, const HarnessInvocation& inv) {
  std::vector<std::string> argv;
  argv.push_back(cfg.program);
  if (cfg.style == HarnessStyle::Direct) {
    argv.push_back(inv.test_name);
    for (const auto& kv : inv.params) argv.push_back(kv.first + "=" + kv.second);
    return argv;
  }

  std::string cmd = "testOnly " + inv.test_name;
  if (!inv.params.empty()) {
    cmd += " --";
    for (const auto& kv : inv.params) cmd += " -D" + kv.first + "=" + kv.second;
  }
  argv.push_back(std::move(cmd));
  argv.push_back("exit");
  return argv;
}

bool ProcessHarnessRunner::Run(const HarnessInvocation& inv, HarnessOutput* out, Error* err) {
  if (!out) return false;
  *out = HarnessOutput{};

  const std::vector<std::string> argv_str = BuildArgv(cfg_, inv);
  std::vector<char*> argv;
  argv.reserve(argv_str.size() + 1);
  for (const auto& s : argv_str) argv.push_back(const_cast<char*>(s.c_str()));
  argv.push_back(nullptr);

  const std::string cmdline = JoinArgv(argv_str);
  EMX_LOG_DEBUG("Launching harness:", cmdline, "in", cfg_.working_dir);

  // out_*: captured output. exec_*: carries errno if exec fails (closed on
  // successful exec through O_CLOEXEC, so the parent reads EOF).
  ScopedFd out_rd, out_wr, exec_rd, exec_wr;
  if (!MakePipe(&out_rd, &out_wr) || !MakePipe(&exec_rd, &exec_wr)) {
    SetErr(err, ErrorCode::HarnessLaunchFailed, std::string("pipe failed: ") + std::strerror(errno));
    return false;
  }

  Stopwatch sw;
  const Deadline deadline(cfg_.timeout_ms);
  const pid_t pid = ::fork();
  if (pid < 0) {
    SetErr(err, ErrorCode::HarnessLaunchFailed, std::string("fork failed: ") + std::strerror(errno));
    return false;
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    int e = 0;
    if (::dup2(out_wr.get(), STDOUT_FILENO) < 0 || ::dup2(out_wr.get(), STDERR_FILENO) < 0) {
      e = errno;
    } else if (!cfg_.working_dir.empty() && ::chdir(cfg_.working_dir.c_str()) != 0) {
      e = errno;
    } else {
      ::execvp(argv[0], argv.data());
      e = errno;
    }
    ssize_t w = ::write(exec_wr.get(), &e, sizeof(e));
    (void)w;
    ::_exit(127);
  }

  out_wr.Reset();
  exec_wr.Reset();

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_rd.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    (void)::waitpid(pid, &status, 0);
    SetErr(err, ErrorCode::HarnessLaunchFailed,
           "cannot launch harness '" + cmdline + "': " + std::strerror(exec_errno));
    return false;
  }

  char buf[4096];
  bool timed_out = false;
  while (true) {
    if (deadline.Expired()) {
      timed_out = true;
      break;
    }

    pollfd pfd{};
    pfd.fd = out_rd.get();
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, deadline.PollTimeoutMs());
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (pr == 0) continue;  // re-check the deadline

    const ssize_t r = ::read(out_rd.get(), buf, sizeof(buf));
    if (r > 0) {
      out->text.append(buf, static_cast<usize>(r));
      continue;
    }
    if (r < 0 && errno == EINTR) continue;
    break;  // EOF: the child closed its end
  }

  if (timed_out) {
    ::kill(pid, SIGKILL);
    int status = 0;
    (void)::waitpid(pid, &status, 0);
    out->elapsed_ms = sw.ElapsedMillis();
    SetErr(err, ErrorCode::HarnessTimeout,
           "harness '" + cmdline + "' did not finish within " + std::to_string(cfg_.timeout_ms) + " ms",
           out->text);
    return false;
  }

  int status = 0;
  pid_t w = 0;
  do {
    w = ::waitpid(pid, &status, 0);
  } while (w < 0 && errno == EINTR);

  out->exit_code = (w == pid) ? ExitCodeOf(status) : -1;
  out->elapsed_ms = sw.ElapsedMillis();
  EMX_LOG_DEBUG("Harness exited with code", out->exit_code, "after", out->elapsed_ms, "ms,",
                out->text.size(), "bytes of output");
  return true;
}

}  // namespace harness
}  // namespace emx
