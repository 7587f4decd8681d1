#include "client/child_process.hpp"

#include "core/time_utils.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace camhost::client {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
// Only the tail is kept; a chatty child must not grow the supervisor.
constexpr std::size_t kMaxStderrBytes = 64U * 1024U;
constexpr int kExecFailedCode = 127;

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return 1;
}

} // namespace

ChildProcess::~ChildProcess() {
  std::string error;
  if (running()) {
    // Destructors cannot report; the child is reaped either way.
    (void)Kill(error);
    (void)Wait(error);
  }
  std::lock_guard<std::mutex> lock(mu_);
  CloseStderrLocked();
}

bool ChildProcess::Spawn(const std::string& path, const std::vector<std::string>& args,
                         std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (pid_ > 0) {
    error = "child process was already spawned";
    return false;
  }

  int pipe_fds[2] = {-1, -1};
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    error = std::string("pipe2() failed: ") + std::strerror(errno);
    return false;
  }

  // argv must be built before fork; the child only calls async-signal-safe
  // functions.
  std::vector<char*> argv;
  argv.reserve(args.size() + 2U);
  argv.push_back(const_cast<char*>(path.c_str()));
  for (const std::string& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork() failed: ") + std::strerror(errno);
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);
    return false;
  }
  if (pid == 0) {
    ::dup2(pipe_fds[1], STDERR_FILENO);
    ::execv(path.c_str(), argv.data());
    const char prefix[] = "exec failed: ";
    (void)!::write(STDERR_FILENO, prefix, sizeof(prefix) - 1U);
    (void)!::write(STDERR_FILENO, argv[0], path.size());
    (void)!::write(STDERR_FILENO, "\n", 1);
    ::_exit(kExecFailedCode);
  }

  ::close(pipe_fds[1]);
  const int flags = ::fcntl(pipe_fds[0], F_GETFL, 0);
  if (flags < 0 || ::fcntl(pipe_fds[0], F_SETFL, flags | O_NONBLOCK) != 0) {
    error = std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno);
    ::close(pipe_fds[0]);
    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
    return false;
  }

  pid_ = pid;
  stderr_fd_ = pipe_fds[0];
  stderr_text_.clear();
  exit_code_.reset();
  return true;
}

bool ChildProcess::WaitFor(double timeout_s, bool& exited, std::string& error) {
  const double deadline = core::MonotonicSeconds() + timeout_s;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (pid_ <= 0) {
        error = "no child process was spawned";
        return false;
      }
      if (!PollLocked(error)) {
        return false;
      }
      if (exit_code_.has_value()) {
        exited = true;
        return true;
      }
    }
    if (timeout_s >= 0.0 && core::MonotonicSeconds() >= deadline) {
      exited = false;
      return true;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

bool ChildProcess::Wait(std::string& error) {
  bool exited = false;
  return WaitFor(-1.0, exited, error);
}

bool ChildProcess::Kill(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (pid_ <= 0) {
    error = "no child process was spawned";
    return false;
  }
  if (exit_code_.has_value()) {
    return true;
  }
  if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
    error = std::string("kill() failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

bool ChildProcess::spawned() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pid_ > 0;
}

bool ChildProcess::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pid_ > 0 && !exit_code_.has_value();
}

pid_t ChildProcess::pid() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pid_;
}

std::optional<int> ChildProcess::exit_code() const {
  std::lock_guard<std::mutex> lock(mu_);
  return exit_code_;
}

std::string ChildProcess::stderr_text() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stderr_text_;
}

bool ChildProcess::PollLocked(std::string& error) {
  DrainStderrLocked();
  if (exit_code_.has_value()) {
    return true;
  }

  int status = 0;
  pid_t reaped = -1;
  do {
    reaped = ::waitpid(pid_, &status, WNOHANG);
  } while (reaped < 0 && errno == EINTR);
  if (reaped < 0) {
    error = std::string("waitpid() failed: ") + std::strerror(errno);
    return false;
  }
  if (reaped == pid_) {
    exit_code_ = DecodeStatus(status);
    // Whatever the child wrote last is still in the pipe.
    DrainStderrLocked();
    CloseStderrLocked();
  }
  return true;
}

void ChildProcess::DrainStderrLocked() {
  if (stderr_fd_ < 0) {
    return;
  }
  char buffer[4096];
  while (true) {
    const ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
    if (n > 0) {
      stderr_text_.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  if (stderr_text_.size() > kMaxStderrBytes) {
    stderr_text_.erase(0, stderr_text_.size() - kMaxStderrBytes);
  }
}

void ChildProcess::CloseStderrLocked() {
  if (stderr_fd_ >= 0) {
    ::close(stderr_fd_);
    stderr_fd_ = -1;
  }
}

} // namespace camhost::client
