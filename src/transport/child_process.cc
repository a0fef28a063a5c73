#include "mcplink/transport/child_process.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>

extern char** environ;

namespace mcplink {
namespace transport {

namespace {

bool setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Parent environment with the overrides applied, as NAME=value strings
std::vector<std::string> buildEnvironment(const EnvironmentMap& overrides) {
  std::vector<std::string> result;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string item(*entry);
    auto eq = item.find('=');
    std::string name = eq == std::string::npos ? item : item.substr(0, eq);
    if (overrides.count(name) == 0) {
      result.push_back(std::move(item));
    }
  }
  for (const auto& kv : overrides) {
    result.push_back(kv.first + "=" + kv.second);
  }
  return result;
}

}  // namespace

void ignoreSigpipe() {
  static std::once_flag flag;
  std::call_once(flag, []() { ::signal(SIGPIPE, SIG_IGN); });
}

ChildProcess::~ChildProcess() {
  terminate();
  closeAll();
}

VoidResult ChildProcess::spawn(const Options& options) {
  if (pid_ > 0) {
    return makeVoidError(Error(EBUSY, "process already spawned"));
  }
  if (options.command.empty()) {
    return makeVoidError(Error(EINVAL, "empty command"));
  }

  ignoreSigpipe();

  // Everything the child needs is prepared before fork()
  std::vector<std::string> argv_storage;
  argv_storage.push_back(options.command);
  argv_storage.insert(argv_storage.end(), options.args.begin(),
                      options.args.end());
  std::vector<char*> argv;
  for (auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<std::string> env_storage = buildEnvironment(options.env);
  std::vector<char*> envp;
  for (auto& var : env_storage) {
    envp.push_back(const_cast<char*>(var.c_str()));
  }
  envp.push_back(nullptr);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  auto close_pipes = [&]() {
    for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
      closeFd(p[0]);
      closeFd(p[1]);
    }
  };

  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
      pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(status_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    close_pipes();
    return makeVoidError(
        Error(err, std::string("failed to create pipes: ") + strerror(err)));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close_pipes();
    return makeVoidError(Error(err, std::string("fork failed: ") +
                                        strerror(err)));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    ::signal(SIGPIPE, SIG_DFL);
    if (dup2(in_pipe[0], STDIN_FILENO) < 0 ||
        dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        dup2(err_pipe[1], STDERR_FILENO) < 0) {
      int err = errno;
      ssize_t rc = ::write(status_pipe[1], &err, sizeof(err));
      (void)rc;
      _exit(127);
    }
    environ = envp.data();
    execvp(argv[0], argv.data());

    int err = errno;
    ssize_t rc = ::write(status_pipe[1], &err, sizeof(err));
    (void)rc;
    _exit(127);
  }

  // Parent keeps the ends facing the child
  closeFd(in_pipe[0]);
  closeFd(out_pipe[1]);
  closeFd(err_pipe[1]);
  closeFd(status_pipe[1]);

  pid_ = pid;
  reaped_ = false;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  status_fd_ = status_pipe[0];

  setNonBlocking(stdin_fd_);
  setNonBlocking(stdout_fd_);
  setNonBlocking(stderr_fd_);
  setNonBlocking(status_fd_);

  return makeVoidSuccess();
}

optional<int> ChildProcess::readExecStatus() {
  if (status_fd_ < 0) {
    return 0;
  }

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_fd_, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    return nullopt;
  }
  closeStatus();
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    return child_errno;
  }
  if (n < 0) {
    return errno;
  }
  // EOF: the close-on-exec end went away with a successful exec
  return 0;
}

void ChildProcess::closeStdin() { closeFd(stdin_fd_); }
void ChildProcess::closeStdout() { closeFd(stdout_fd_); }
void ChildProcess::closeStderr() { closeFd(stderr_fd_); }
void ChildProcess::closeStatus() { closeFd(status_fd_); }

void ChildProcess::closeAll() {
  closeStdin();
  closeStdout();
  closeStderr();
  closeStatus();
}

bool ChildProcess::kill(int signal_num) {
  if (!running()) {
    return false;
  }
  return ::kill(pid_, signal_num) == 0;
}

optional<int> ChildProcess::reap(bool block) {
  if (pid_ <= 0) {
    return nullopt;
  }
  if (reaped_) {
    return exit_status_;
  }

  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (rc < 0 && errno == EINTR);

  if (rc == pid_) {
    reaped_ = true;
    exit_status_ = status;
    return status;
  }
  if (rc < 0 && errno == ECHILD) {
    // Someone else reaped it
    reaped_ = true;
    exit_status_ = 0;
    return exit_status_;
  }
  return nullopt;
}

void ChildProcess::terminate() {
  if (!running()) {
    return;
  }
  closeStdin();
  if (!reap(false).has_value()) {
    kill(SIGKILL);
    reap(true);
  }
}

std::string ChildProcess::describeExitStatus(int status) {
  if (WIFEXITED(status)) {
    return "exited with code " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "killed by signal " + std::to_string(WTERMSIG(status));
  }
  return "ended with status " + std::to_string(status);
}

}  // namespace transport
}  // namespace mcplink
