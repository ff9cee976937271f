/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "direct_play/ffmpeg_executor.hpp"

#include <memory>

#include <fmt/core.h>

#include "direct_play/cancellation.hpp"
#include "direct_play/errors.hpp"
#include "direct_play/ffmpeg_command.hpp"
#include "direct_play/logging.hpp"
#include "direct_play/process.hpp"
#include "direct_play/progress_monitor.hpp"

namespace direct_play {

namespace {

/// Progress lines straight from the child's stdout pipe
class ProcessLineSource : public LineSource {
public:
  ProcessLineSource(ChildProcess &child, const CancellationToken &token)
      : child_(child), token_(token) {}

  bool next_line(std::string &line) override {
    return child_.read_line(line, token_);
  }

private:
  ChildProcess &child_;
  const CancellationToken &token_;
};

/// Last non-empty line of the stderr tail, which is where ffmpeg puts the cause
std::string last_line(const std::string &text) {
  size_t end = text.find_last_not_of("\r\n ");
  if (end == std::string::npos)
    return "";
  size_t start = text.find_last_of('\n', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return text.substr(start, end - start + 1);
}

} // anonymous namespace

int FfmpegRunner::run(const std::vector<std::string> &args,
                      ProgressMonitor &monitor, const CancellationToken &token,
                      std::string &diagnostics) {
  LOG_DEBUG("Executing: {}", render_command(args));

  std::unique_ptr<ChildProcess> child;
  try {
    child = std::make_unique<ChildProcess>(args);
  } catch (const SpawnError &e) {
    diagnostics = e.what();
    LOG_ERROR("Could not start encoder: {}", diagnostics);
    return -1;
  }

  int status = -1;
  try {
    ProcessLineSource source(*child, token);
    monitor.drain(source);
    status = child->wait(token);
  } catch (const CancelledError &) {
    child->terminate(grace_);
    throw;
  }

  if (status != 0) {
    std::string cause = last_line(child->stderr_tail());
    diagnostics = cause.empty() ? fmt::format("encoder exited with status {}",
                                              status)
                                : fmt::format("encoder exited with status {}: {}",
                                              status, cause);
    LOG_DEBUG("Encoder stderr:\n{}", child->stderr_tail());
  }
  return status;
}

} // namespace direct_play
