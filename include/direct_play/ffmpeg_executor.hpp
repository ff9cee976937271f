/**
 * @file ffmpeg_executor.hpp
 * @brief Runs one ffmpeg invocation and feeds its progress to a monitor
 *
 * @details The encoder is started in its own process group. Its stdout
 *          carries the -progress key=value feed, which is streamed line by
 *          line into a ProgressMonitor while the process runs; stderr is kept
 *          as a bounded tail for diagnostics.
 *
 *          EncodeRunner is the seam the orchestrator depends on, so tests can
 *          script exit codes and progress without spawning anything.
 */

#ifndef DIRECT_PLAY_FFMPEG_EXECUTOR_HPP
#define DIRECT_PLAY_FFMPEG_EXECUTOR_HPP

#include <chrono>
#include <string>
#include <vector>

namespace direct_play {

class CancellationToken;
class ProgressMonitor;

/**
 * @class EncodeRunner
 * @brief Executes an encoder argument vector to completion.
 */
class EncodeRunner {
public:
  virtual ~EncodeRunner() = default;

  /**
   * @brief Run args, streaming progress into monitor.
   *
   * @param args Full argument vector, args[0] is the program
   * @param monitor Receives every progress line
   * @param token Checked while the encoder runs
   * @param diagnostics Receives the encoder's error output on failure
   * @return Exit code; 0 on success, -1 if the program could not be started
   * @throws CancelledError after the process group was terminated
   */
  virtual int run(const std::vector<std::string> &args,
                  ProgressMonitor &monitor, const CancellationToken &token,
                  std::string &diagnostics) = 0;
};

/**
 * @class FfmpegRunner
 * @brief EncodeRunner that spawns the real encoder.
 */
class FfmpegRunner : public EncodeRunner {
public:
  /// @param grace SIGTERM -> SIGKILL delay used on cancellation
  explicit FfmpegRunner(std::chrono::milliseconds grace) : grace_(grace) {}

  int run(const std::vector<std::string> &args, ProgressMonitor &monitor,
          const CancellationToken &token, std::string &diagnostics) override;

private:
  std::chrono::milliseconds grace_;
};

} // namespace direct_play

#endif // DIRECT_PLAY_FFMPEG_EXECUTOR_HPP
