/**
 * @file progress_monitor.hpp
 * @brief Converts ffmpeg's -progress key=value feed into a percentage
 *
 * @details Recognized keys:
 *
 *          - out_time_us / out_time_ms: elapsed output time in microseconds
 *            (ffmpeg prints microseconds under both names)
 *
 *          - out_time: elapsed output time as [-]HH:MM:SS[.ffffff]
 *
 *          - progress: "continue" or the terminal sentinel "end"
 *
 * @attention The published percentage is latched: it only ever increases,
 *            and reaches exactly 100 on the sentinel. With an unknown total
 *            duration nothing is published, but the feed is still consumed so
 *            the producer never blocks on a full pipe.
 */

#ifndef DIRECT_PLAY_PROGRESS_MONITOR_HPP
#define DIRECT_PLAY_PROGRESS_MONITOR_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace direct_play {

/**
 * @brief Parse "[-]HH:MM:SS[.fraction]" into seconds.
 * @return std::nullopt for "N/A" or malformed input
 */
std::optional<double> parse_clock_time(const std::string &text);

/**
 * @class LineSource
 * @brief Pull-based source of progress lines.
 */
class LineSource {
public:
  virtual ~LineSource() = default;

  /// @return false once the source is exhausted
  virtual bool next_line(std::string &line) = 0;
};

/// LineSource over an in-memory list, for replaying captured feeds
class VectorLineSource : public LineSource {
public:
  explicit VectorLineSource(std::vector<std::string> lines)
      : lines_(std::move(lines)) {}

  bool next_line(std::string &line) override;

private:
  std::vector<std::string> lines_;
  size_t pos_ = 0;
};

/**
 * @class ProgressMonitor
 * @brief Latched percentage over one encode run.
 */
class ProgressMonitor {
public:
  using Callback = std::function<void(int)>;

  /**
   * @param total_sec Input duration; nullopt or <= 0 disables reporting
   * @param on_progress Called with each strictly increasing percentage
   */
  explicit ProgressMonitor(std::optional<double> total_sec,
                           Callback on_progress = {});

  /// Feed one "key=value" line; blank and unknown lines are ignored
  void consume(const std::string &line);

  /// Consume every line of source
  void drain(LineSource &source);

  int percent() const { return percent_; }
  bool finished() const { return finished_; }
  bool reporting() const { return total_sec_.has_value(); }

private:
  void update_elapsed(double elapsed_sec);
  void publish(int percent);

  std::optional<double> total_sec_;
  Callback on_progress_;
  int percent_ = 0;
  bool finished_ = false;
};

} // namespace direct_play

#endif // DIRECT_PLAY_PROGRESS_MONITOR_HPP
