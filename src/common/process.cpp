#include "hostwarden/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostwarden::common {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  if (fd < 0) {
    return;
  }
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

struct Pipes {
  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int exec_error[2] = {-1, -1};

  ~Pipes() {
    for (int *pair : {stdin_pipe, stdout_pipe, stderr_pipe, exec_error}) {
      close_fd(pair[0]);
      close_fd(pair[1]);
    }
  }

  bool open() {
    return pipe(stdin_pipe) == 0 && pipe(stdout_pipe) == 0 && pipe(stderr_pipe) == 0 &&
           pipe2(exec_error, O_CLOEXEC) == 0;
  }
};

void terminate_group(const pid_t pid, int &status, const std::chrono::milliseconds grace) {
  (void)kill(-pid, SIGTERM);
  (void)kill(pid, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (waitpid(pid, &status, WNOHANG) == pid) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  (void)kill(-pid, SIGKILL);
  (void)kill(pid, SIGKILL);
  (void)waitpid(pid, &status, 0);
}

} // namespace

std::string join_command(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                  const ProcessOptions &options) {
  if (argv.empty()) {
    return Result<ProcessResult>::failure("command is empty");
  }

  Pipes pipes;
  if (!pipes.open()) {
    return Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  std::vector<char *> child_argv;
  child_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    child_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    return Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    sigset_t all;
    sigemptyset(&all);
    (void)sigprocmask(SIG_SETMASK, &all, nullptr);

    (void)dup2(pipes.stdin_pipe[0], STDIN_FILENO);
    (void)dup2(pipes.stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(pipes.stderr_pipe[1], STDERR_FILENO);
    close(pipes.stdin_pipe[0]);
    close(pipes.stdin_pipe[1]);
    close(pipes.stdout_pipe[0]);
    close(pipes.stdout_pipe[1]);
    close(pipes.stderr_pipe[0]);
    close(pipes.stderr_pipe[1]);
    close(pipes.exec_error[0]);

    execvp(child_argv[0], child_argv.data());
    const int err = errno;
    (void)!write(pipes.exec_error[1], &err, sizeof(err));
    _exit(127);
  }

  close_fd(pipes.stdin_pipe[0]);
  close_fd(pipes.stdout_pipe[1]);
  close_fd(pipes.stderr_pipe[1]);
  close_fd(pipes.exec_error[1]);

  int exec_errno = 0;
  const ssize_t got = read(pipes.exec_error[0], &exec_errno, sizeof(exec_errno));
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    return Result<ProcessResult>::failure("cannot execute " + argv.front() + ": " +
                                          std::strerror(exec_errno));
  }

  set_non_blocking(pipes.stdout_pipe[0]);
  set_non_blocking(pipes.stderr_pipe[0]);
  set_non_blocking(pipes.stdin_pipe[1]);

  std::size_t stdin_offset = 0;
  if (options.stdin_data.empty()) {
    close_fd(pipes.stdin_pipe[1]);
  }

  ProcessResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    if (pipes.stdin_pipe[1] >= 0) {
      const ssize_t written =
          write(pipes.stdin_pipe[1], options.stdin_data.data() + stdin_offset,
                options.stdin_data.size() - stdin_offset);
      if (written > 0) {
        stdin_offset += static_cast<std::size_t>(written);
      }
      if (stdin_offset >= options.stdin_data.size() ||
          (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
        close_fd(pipes.stdin_pipe[1]);
      }
    }

    read_into_buffer(pipes.stdout_pipe[0], result.stdout_text);
    read_into_buffer(pipes.stderr_pipe[0], result.stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      terminate_group(pid, status, options.term_grace);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = pipes.stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = pipes.stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(pipes.stdout_pipe[0], result.stdout_text);
  read_into_buffer(pipes.stderr_pipe[0], result.stderr_text);

  if (result.timed_out) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return Result<ProcessResult>::success(std::move(result));
}

} // namespace hostwarden::common
