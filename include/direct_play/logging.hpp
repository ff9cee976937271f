/**
 * @file logging.hpp
 * @brief Logging macros, progress rendering and timing collection
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - LOG_DEBUG, additionally gated at runtime by LOG_VERBOSE
 *
 *          - A single-line console progress bar per encode tier
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END) feeding a
 *            thread-safe TimingCollector
 *
 * @note All output goes through fmt::print under one mutex and is flushed
 *       immediately so that log lines never tear through a progress bar.
 */

#ifndef DIRECT_PLAY_LOGGING_HPP
#define DIRECT_PLAY_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace direct_play {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Terminate an in-flight progress bar line before other output.
 * @attention Caller must hold log_mutex.
 */
void break_progress_line_locked();

/// Runtime switch for LOG_DEBUG (reads LOG_VERBOSE once)
bool debug_enabled();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(direct_play::log_mutex);                  \
    direct_play::break_progress_line_locked();                                 \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(direct_play::log_mutex);                  \
    direct_play::break_progress_line_locked();                                 \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(direct_play::log_mutex);                  \
    direct_play::break_progress_line_locked();                                 \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (direct_play::debug_enabled()) {                                        \
      std::lock_guard<std::mutex> lock(direct_play::log_mutex);                \
      direct_play::break_progress_line_locked();                               \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(direct_play::log_mutex);                  \
    direct_play::break_progress_line_locked();                                 \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(direct_play::log_mutex);                  \
    direct_play::break_progress_line_locked();                                 \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- PROGRESS BAR -----**

/**
 * @brief Redraw the progress bar line for the current tier.
 * @param label Tier and file, e.g. "SW encode movie.mkv"
 * @param percent 0..100
 */
void print_progress(const std::string &label, int percent);

/// Finish the current progress bar line (no-op if none is open)
void end_progress();

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Stage name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for per-stage timings.
 * @note Cleared between files in batch mode; printed in single-file mode.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   */
  static void print_summary();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    direct_play::TimingCollector::record(#name, timer_duration_##name);        \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace direct_play

#endif // DIRECT_PLAY_LOGGING_HPP
