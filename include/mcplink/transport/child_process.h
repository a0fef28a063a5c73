#ifndef MCPLINK_TRANSPORT_CHILD_PROCESS_H
#define MCPLINK_TRANSPORT_CHILD_PROCESS_H

#include <sys/types.h>

#include <string>
#include <vector>

#include "mcplink/core/result.h"
#include "mcplink/types.h"

namespace mcplink {
namespace transport {

/**
 * A spawned child process with its standard streams on pipes.
 *
 * spawn() returns as soon as fork() succeeds; whether exec() worked is
 * reported asynchronously on statusFd(). The pipe is close-on-exec, so a
 * successful exec shows up as EOF and a failed one as the errno written by
 * the child before it exits.
 *
 * All parent side descriptors are non-blocking and close-on-exec. The
 * destructor kills and reaps a child that is still running.
 */
class ChildProcess {
 public:
  struct Options {
    std::string command;
    std::vector<std::string> args;
    // Merged over the parent's environment
    EnvironmentMap env;
  };

  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  VoidResult spawn(const Options& options);

  pid_t pid() const { return pid_; }
  bool running() const { return pid_ > 0 && !reaped_; }

  int stdinFd() const { return stdin_fd_; }
  int stdoutFd() const { return stdout_fd_; }
  int stderrFd() const { return stderr_fd_; }
  int statusFd() const { return status_fd_; }

  /**
   * Read the exec result from the status pipe.
   *
   * @return nullopt while undecided, 0 when exec succeeded, or the errno
   *         the child reported.
   */
  optional<int> readExecStatus();

  void closeStdin();
  void closeStdout();
  void closeStderr();
  void closeStatus();

  bool kill(int signal_num);

  /**
   * Collect the exit status.
   *
   * @param block wait for the child instead of polling
   * @return the raw wait status once the child has been reaped
   */
  optional<int> reap(bool block);

  // SIGKILL then a blocking reap; no-op once reaped
  void terminate();

  // "exited with code 3", "killed by signal 9"
  static std::string describeExitStatus(int status);

 private:
  void closeAll();

  pid_t pid_{-1};
  bool reaped_{false};
  int exit_status_{0};
  int stdin_fd_{-1};
  int stdout_fd_{-1};
  int stderr_fd_{-1};
  int status_fd_{-1};
};

// Idempotent; writes to a dead child then surface as EPIPE
void ignoreSigpipe();

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_CHILD_PROCESS_H
