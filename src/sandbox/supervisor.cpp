#include "sandshell/sandbox/supervisor.hpp"

#include "sandshell/observability/global.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandshell::sandbox {

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void close_pipe(int (&fds)[2]) {
  close_fd(fds[0]);
  close_fd(fds[1]);
}

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Appends whatever is currently readable without blocking. Returns false once
// the write end is closed and the pipe is drained.
bool read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    return bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
  }
}

pid_t wait_for(const pid_t pid, int &status, const int flags) {
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, flags);
  } while (waited < 0 && errno == EINTR);
  return waited;
}

// Blocks until the child either execs (the close-on-exec pipe reports EOF) or
// writes the errno of a failed exec.
int read_exec_errno(const int fd) {
  int child_errno = 0;
  ssize_t bytes = 0;
  do {
    bytes = read(fd, &child_errno, sizeof(child_errno));
  } while (bytes < 0 && errno == EINTR);
  return bytes == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

// Non-reaping check: the child stays a zombie so its pid and group stay reserved.
bool has_exited(const pid_t pid) {
  siginfo_t info{};
  int rc = 0;
  do {
    rc = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
  } while (rc < 0 && errno == EINTR);
  return rc < 0 || info.si_pid == pid;
}

void kill_process_tree(const pid_t pid) {
  (void)kill(-pid, SIGKILL);
  (void)kill(pid, SIGKILL);
}

std::string errno_message(const std::string &what, const int err) {
  return what + ": " + std::strerror(err);
}

} // namespace

ExecutionOutcome PosixProcessRunner::run(const std::vector<std::string> &argv,
                                         const std::chrono::milliseconds timeout) {
  if (argv.empty() || argv.front().empty()) {
    return LaunchFailedOutcome{.message = "command line is empty"};
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    close_pipe(exec_pipe);
    return LaunchFailedOutcome{.message = errno_message("failed to create pipes", err)};
  }

  // Built before fork so the child only calls async-signal-safe functions.
  std::vector<char *> child_argv;
  child_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    child_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    close_pipe(exec_pipe);
    return LaunchFailedOutcome{.message = errno_message("failed to fork", err)};
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);

    execvp(child_argv[0], child_argv.data());
    const int err = errno;
    const ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  close_fd(exec_pipe[1]);

  const int exec_errno = read_exec_errno(exec_pipe[0]);
  close_fd(exec_pipe[0]);
  if (exec_errno != 0) {
    int status = 0;
    (void)wait_for(pid, status, 0);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    if (exec_errno == ENOENT) {
      return ToolMissingOutcome{.tool = argv.front()};
    }
    return LaunchFailedOutcome{.message = errno_message(argv.front(), exec_errno)};
  }

  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  bool stdout_open = true;
  bool stderr_open = true;

  while (true) {
    if (stdout_open) {
      stdout_open = read_into_buffer(stdout_pipe[0], stdout_text);
    }
    if (stderr_open) {
      stderr_open = read_into_buffer(stderr_pipe[0], stderr_text);
    }

    if (has_exited(pid)) {
      break;
    }

    // Compared in milliseconds: converting `timeout` to the clock's nanoseconds could overflow.
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed > timeout) {
      timed_out = true;
      break;
    }

    // poll() skips negative descriptors; closed pipes would otherwise report POLLHUP forever.
    struct pollfd poll_fds[2] = {
        {.fd = stdout_open ? stdout_pipe[0] : -1, .events = POLLIN, .revents = 0},
        {.fd = stderr_open ? stderr_pipe[0] : -1, .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  // The leader is not reaped yet, so its group id cannot have been recycled.
  kill_process_tree(pid);
  (void)wait_for(pid, status, 0);

  if (stdout_open) {
    (void)read_into_buffer(stdout_pipe[0], stdout_text);
  }
  if (stderr_open) {
    (void)read_into_buffer(stderr_pipe[0], stderr_text);
  }
  close_pipe(stdout_pipe);
  close_pipe(stderr_pipe);

  if (timed_out) {
    return TimedOutOutcome{.timeout = timeout};
  }

  CompletedOutcome completed;
  completed.stdout_text = std::move(stdout_text);
  completed.stderr_text = std::move(stderr_text);
  if (WIFEXITED(status)) {
    completed.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    completed.exit_code = -WTERMSIG(status);
  } else {
    completed.exit_code = -1;
  }
  return completed;
}

SandboxSupervisor::SandboxSupervisor(std::shared_ptr<IProcessRunner> runner)
    : runner_(std::move(runner)) {}

ExecutionOutcome SandboxSupervisor::execute(const SandboxPolicy &policy,
                                            std::string_view command) const {
  if (!runner_) {
    observability::record_error("sandbox", "process runner unavailable");
    return LaunchFailedOutcome{.message = "process runner unavailable"};
  }

  const auto argv = build_bwrap_args(policy, command);
  observability::record_sandbox_launch(policy.bwrap_path, command.size(),
                                       policy.drop_all_capabilities);

  const auto started = std::chrono::steady_clock::now();
  ExecutionOutcome outcome = runner_->run(argv, policy.timeout);
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  std::optional<int> exit_code;
  if (const auto *completed = std::get_if<CompletedOutcome>(&outcome); completed != nullptr) {
    exit_code = completed->exit_code;
    observability::record_metric(observability::OutputBytesMetric{
        .bytes = completed->stdout_text.size() + completed->stderr_text.size()});
  } else if (const auto *missing = std::get_if<ToolMissingOutcome>(&outcome); missing != nullptr) {
    observability::record_error("sandbox", missing->tool + " not found");
  } else if (const auto *failed = std::get_if<LaunchFailedOutcome>(&outcome); failed != nullptr) {
    observability::record_error("sandbox", failed->message);
  }
  observability::record_sandbox_outcome(std::string(outcome_kind(outcome)), exit_code, duration);
  return outcome;
}

} // namespace sandshell::sandbox
