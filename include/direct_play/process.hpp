/**
 * @file process.hpp
 * @brief Child process with piped output and process-group control
 *
 * @details ChildProcess forks and execs a program (argument vector, no shell)
 *          in a new process group, with stdout and stderr on pipes and stdin
 *          on /dev/null. Every blocking call polls in short slices and checks
 *          a CancellationToken between slices.
 *
 * @attention PROCESS GROUP:
 *
 *   - The child calls setpgid(0, 0) before exec, so its pid is its pgid.
 *
 *   - terminate() signals the whole group, which also reaches helpers the
 *     encoder forked.
 */

#ifndef DIRECT_PLAY_PROCESS_HPP
#define DIRECT_PLAY_PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace direct_play {

class CancellationToken;

/// Poll slice for all blocking operations
constexpr int PROCESS_POLL_MS = 100;

/// Bytes of stderr kept for diagnostics
constexpr size_t STDERR_TAIL_BYTES = 2048;

/**
 * @brief Map a waitpid() status to a shell-style exit code.
 * @return exit status, 128 + signal for signalled children, -1 otherwise
 */
int exit_code_from_status(int status);

/**
 * @class ChildProcess
 * @brief RAII handle for one spawned program.
 * @note The destructor terminates and reaps a child that is still running.
 */
class ChildProcess {
public:
  /**
   * @brief Spawn argv[0] (PATH lookup) with the given arguments.
   * @throws SpawnError if pipe() or fork() fails. A failed exec is reported
   *         as exit code 127 instead, like a shell does.
   */
  explicit ChildProcess(const std::vector<std::string> &argv);
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  pid_t pid() const { return pid_; }
  bool running() const { return !reaped_; }

  /**
   * @brief Read the next stdout line (without the trailing newline).
   * @return false once stdout is closed and fully consumed
   * @throws CancelledError if the token is set while waiting
   */
  bool read_line(std::string &line, const CancellationToken &token);

  /**
   * @brief Read stdout and stderr until both are closed.
   * @param out Receives everything the child wrote to stdout
   * @throws CancelledError if the token is set while waiting
   */
  void read_all(std::string &out, const CancellationToken &token);

  /**
   * @brief Wait for exit, draining pipes meanwhile.
   * @return exit_code_from_status() of the child
   * @throws CancelledError if the token is set while waiting
   */
  int wait(const CancellationToken &token);

  /**
   * @brief SIGTERM the process group, wait up to grace, then SIGKILL.
   * @note Always reaps the child. Safe to call on an exited child.
   */
  void terminate(std::chrono::milliseconds grace);

  /// Last STDERR_TAIL_BYTES bytes the child wrote to stderr
  const std::string &stderr_tail() const { return err_tail_; }

private:
  /// Read whatever is available on the open pipes, waiting up to timeout_ms
  void pump(int timeout_ms);

  /// waitpid() wrapper; true once the child has been reaped
  bool try_reap(int options);

  void close_pipes();

  pid_t pid_ = -1;
  int out_fd_ = -1;
  int err_fd_ = -1;
  bool out_eof_ = false;
  bool err_eof_ = false;
  bool reaped_ = false;
  int exit_code_ = -1;

  std::string out_buf_;
  std::string err_tail_;
};

/**
 * @struct CapturedOutput
 * @brief Result of running a short-lived program to completion.
 */
struct CapturedOutput {
  int exit_code = -1;
  std::string out;
  std::string err; //< stderr tail
};

/**
 * @brief Run argv to completion, capturing stdout.
 * @note On cancellation the child's group is terminated with the given grace
 *       and CancelledError is rethrown.
 * @throws SpawnError, CancelledError
 */
CapturedOutput run_capture(const std::vector<std::string> &argv,
                           const CancellationToken &token,
                           std::chrono::milliseconds grace);

} // namespace direct_play

#endif // DIRECT_PLAY_PROCESS_HPP
