/**
 * @file process.cpp
 * @brief Child process implementation (fork/exec, pipes, process groups)
 */

#include "direct_play/process.hpp"

#include <cerrno>
#include <cstring>
#include <csignal>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "direct_play/cancellation.hpp"
#include "direct_play/errors.hpp"
#include "direct_play/logging.hpp"

namespace direct_play {

int exit_code_from_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

// **---- Spawn ----**

ChildProcess::ChildProcess(const std::vector<std::string> &argv) {
  if (argv.empty())
    throw SpawnError("empty argument vector");

  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1)
    throw SpawnError(fmt::format("pipe failed: {}", std::strerror(errno)));
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    int err = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw SpawnError(fmt::format("pipe failed: {}", std::strerror(err)));
  }

  /// Everything the child touches is prepared before fork()
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  c_argv.push_back(nullptr);
  std::string exec_error = fmt::format("failed to exec '{}'\n", argv[0]);

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    throw SpawnError(fmt::format("fork failed: {}", std::strerror(err)));
  }

  if (pid == 0) {
    /// Child: own process group, so a group signal reaches its helpers
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      if (devnull > STDERR_FILENO)
        close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    execvp(c_argv[0], c_argv.data());

    ssize_t ignored = write(STDERR_FILENO, exec_error.data(), exec_error.size());
    (void)ignored;
    _exit(127);
  }

  /// Parent: also set the group to close the race with the child's setpgid
  setpgid(pid, pid);

  close(out_pipe[1]);
  close(err_pipe[1]);
  pid_ = pid;
  out_fd_ = out_pipe[0];
  err_fd_ = err_pipe[0];
}

ChildProcess::~ChildProcess() {
  if (!reaped_ && pid_ > 0)
    terminate(std::chrono::milliseconds(2000));
  close_pipes();
}

void ChildProcess::close_pipes() {
  if (out_fd_ >= 0) {
    close(out_fd_);
    out_fd_ = -1;
  }
  if (err_fd_ >= 0) {
    close(err_fd_);
    err_fd_ = -1;
  }
  out_eof_ = true;
  err_eof_ = true;
}

// **---- Pipe I/O ----**

void ChildProcess::pump(int timeout_ms) {
  pollfd fds[2];
  nfds_t count = 0;
  if (!out_eof_)
    fds[count++] = {out_fd_, POLLIN, 0};
  if (!err_eof_)
    fds[count++] = {err_fd_, POLLIN, 0};

  if (count == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
    return;
  }

  int rc = poll(fds, count, timeout_ms);
  if (rc < 0) {
    if (errno == EINTR)
      return; //< Interrupted by a signal; caller re-checks the token
    throw std::system_error(errno, std::generic_category(), "poll");
  }

  char buf[4096];
  for (nfds_t i = 0; i < count; ++i) {
    if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
      continue;

    ssize_t n = read(fds[i].fd, buf, sizeof(buf));
    if (n < 0 && (errno == EINTR || errno == EAGAIN))
      continue;

    bool is_out = (fds[i].fd == out_fd_);
    if (n <= 0) {
      (is_out ? out_eof_ : err_eof_) = true;
      continue;
    }

    if (is_out) {
      out_buf_.append(buf, static_cast<size_t>(n));
    } else {
      err_tail_.append(buf, static_cast<size_t>(n));
      if (err_tail_.size() > STDERR_TAIL_BYTES)
        err_tail_.erase(0, err_tail_.size() - STDERR_TAIL_BYTES);
    }
  }
}

bool ChildProcess::read_line(std::string &line, const CancellationToken &token) {
  for (;;) {
    size_t nl = out_buf_.find('\n');
    if (nl != std::string::npos) {
      line.assign(out_buf_, 0, nl);
      out_buf_.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return true;
    }

    if (out_eof_) {
      if (out_buf_.empty())
        return false;
      line.swap(out_buf_);
      out_buf_.clear();
      return true;
    }

    token.throw_if_cancelled("reading process output");
    pump(PROCESS_POLL_MS);
  }
}

void ChildProcess::read_all(std::string &out, const CancellationToken &token) {
  while (!out_eof_ || !err_eof_) {
    token.throw_if_cancelled("reading process output");
    pump(PROCESS_POLL_MS);
  }
  out = std::move(out_buf_);
  out_buf_.clear();
}

// **---- Exit Handling ----**

bool ChildProcess::try_reap(int options) {
  if (reaped_)
    return true;

  int status = 0;
  pid_t r = waitpid(pid_, &status, options);
  if (r == pid_) {
    reaped_ = true;
    exit_code_ = exit_code_from_status(status);
    return true;
  }
  if (r < 0 && errno == ECHILD) {
    /// Already reaped elsewhere; exit status is lost
    reaped_ = true;
    exit_code_ = -1;
    return true;
  }
  return false;
}

int ChildProcess::wait(const CancellationToken &token) {
  while (!try_reap(WNOHANG)) {
    token.throw_if_cancelled("waiting for process exit");
    /// Keep draining so the child never blocks on a full pipe
    pump(PROCESS_POLL_MS);
  }
  return exit_code_;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
  if (pid_ <= 0 || reaped_)
    return;

  kill(-pid_, SIGTERM);

  auto deadline = std::chrono::steady_clock::now() + grace;
  while (!try_reap(WNOHANG) && std::chrono::steady_clock::now() < deadline) {
    pump(20);
  }

  if (!reaped_) {
    LOG_WARN("Process {} ignored SIGTERM for {}ms, sending SIGKILL", pid_,
             grace.count());
    kill(-pid_, SIGKILL);
    while (!try_reap(0)) {
      /// waitpid(0) only returns early on EINTR
    }
  }

  /// Helpers that outlived the group leader. An empty group's id may already
  /// belong to someone else, so only signal a group that still exists
  if (kill(-pid_, 0) == 0)
    kill(-pid_, SIGKILL);
}

// **---- Convenience ----**

CapturedOutput run_capture(const std::vector<std::string> &argv,
                           const CancellationToken &token,
                           std::chrono::milliseconds grace) {
  ChildProcess child(argv);
  CapturedOutput result;
  try {
    child.read_all(result.out, token);
    result.exit_code = child.wait(token);
  } catch (const CancelledError &) {
    child.terminate(grace);
    throw;
  }
  result.err = child.stderr_tail();
  return result;
}

} // namespace direct_play
