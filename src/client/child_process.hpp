#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace camhost::client {

// A spawned child whose stderr is captured through a pipe. stdout is
// inherited.
//
// Any thread may wait on or kill the child; reaping happens under one lock
// so exactly one waiter collects the exit status and all of them observe it.
class ChildProcess {
public:
  ChildProcess() = default;
  // Kills and reaps a child that is still running.
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Executes `path` with `args` (argv[0] is `path`). Fails if a child was
  // already spawned.
  bool Spawn(const std::string& path, const std::vector<std::string>& args, std::string& error);

  // Waits up to `timeout_s` seconds (negative waits forever). `exited`
  // reports whether the child is gone.
  bool WaitFor(double timeout_s, bool& exited, std::string& error);

  bool Wait(std::string& error);

  // SIGKILL. Killing an exited child succeeds.
  bool Kill(std::string& error);

  bool spawned() const;
  bool running() const;
  pid_t pid() const;

  // 0..255 for a normal exit, 128 + signal when killed by a signal.
  std::optional<int> exit_code() const;
  std::string stderr_text() const;

private:
  // Caller holds `mu_`.
  bool PollLocked(std::string& error);
  void DrainStderrLocked();
  void CloseStderrLocked();

  mutable std::mutex mu_;
  pid_t pid_ = -1;
  int stderr_fd_ = -1;
  std::string stderr_text_;
  std::optional<int> exit_code_;
};

} // namespace camhost::client
