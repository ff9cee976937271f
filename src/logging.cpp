/**
 * @file logging.cpp
 * @brief Logging, progress bar and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and progress line state
 *
 *          - TimingCollector static members and methods
 */

#include "direct_play/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

#include "direct_play/config.hpp"

namespace direct_play {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

namespace {

/// True while a progress bar line is drawn without its trailing newline
bool progress_line_open = false;

constexpr int PROGRESS_BAR_WIDTH = 30;

} // anonymous namespace

void break_progress_line_locked() {
  if (progress_line_open) {
    fmt::print("\n");
    progress_line_open = false;
  }
}

bool debug_enabled() { return Config::log_verbose(); }

// **----- PROGRESS BAR -----**

void print_progress(const std::string &label, int percent) {
  percent = std::clamp(percent, 0, 100);
  int filled = percent * PROGRESS_BAR_WIDTH / 100;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\r{:<40.40} [{}{}] {:>3}%", label, std::string(filled, '#'),
             std::string(PROGRESS_BAR_WIDTH - filled, '.'), percent);
  std::fflush(stdout);
  progress_line_open = true;
}

void end_progress() {
  std::lock_guard<std::mutex> lock(log_mutex);
  break_progress_line_locked();
  std::fflush(stdout);
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> out_lock(log_mutex);
  break_progress_line_locked();
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Stage", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace direct_play
