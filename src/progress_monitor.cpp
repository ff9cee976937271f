/**
 * @file progress_monitor.cpp
 * @brief ffmpeg progress feed parsing
 */

#include "direct_play/progress_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace direct_play {

namespace {

/// strtod/strtoll wrappers that reject trailing garbage
std::optional<double> parse_double(const std::string &text) {
  if (text.empty())
    return std::nullopt;
  char *end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(v))
    return std::nullopt;
  return v;
}

std::optional<long long> parse_integer(const std::string &text) {
  if (text.empty())
    return std::nullopt;
  char *end = nullptr;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (end != text.c_str() + text.size())
    return std::nullopt;
  return v;
}

} // anonymous namespace

std::optional<double> parse_clock_time(const std::string &text) {
  std::string t = text;
  bool negative = false;
  if (!t.empty() && t.front() == '-') {
    negative = true;
    t.erase(0, 1);
  }

  size_t c1 = t.find(':');
  if (c1 == std::string::npos)
    return std::nullopt;
  size_t c2 = t.find(':', c1 + 1);
  if (c2 == std::string::npos)
    return std::nullopt;

  auto h = parse_integer(t.substr(0, c1));
  auto m = parse_integer(t.substr(c1 + 1, c2 - c1 - 1));
  auto s = parse_double(t.substr(c2 + 1));
  if (!h || !m || !s || *h < 0 || *m < 0 || *s < 0)
    return std::nullopt;

  double seconds = *h * 3600.0 + *m * 60.0 + *s;
  return negative ? -seconds : seconds;
}

// **---- VectorLineSource ----**

bool VectorLineSource::next_line(std::string &line) {
  if (pos_ >= lines_.size())
    return false;
  line = lines_[pos_++];
  return true;
}

// **---- ProgressMonitor ----**

ProgressMonitor::ProgressMonitor(std::optional<double> total_sec,
                                 Callback on_progress)
    : on_progress_(std::move(on_progress)) {
  if (total_sec && *total_sec > 0)
    total_sec_ = total_sec;
}

void ProgressMonitor::consume(const std::string &raw) {
  size_t begin = raw.find_first_not_of(" \t\r");
  if (begin == std::string::npos)
    return;
  size_t end = raw.find_last_not_of(" \t\r");
  std::string line = raw.substr(begin, end - begin + 1);

  size_t eq = line.find('=');
  if (eq == std::string::npos)
    return;
  std::string key = line.substr(0, eq);
  std::string value = line.substr(eq + 1);

  if (key == "out_time_us" || key == "out_time_ms") {
    if (auto us = parse_integer(value))
      update_elapsed(*us / 1000000.0);
  } else if (key == "out_time") {
    if (auto sec = parse_clock_time(value))
      update_elapsed(*sec);
  } else if (key == "progress") {
    if (value == "end") {
      finished_ = true;
      publish(100);
    }
  }
}

void ProgressMonitor::drain(LineSource &source) {
  std::string line;
  while (source.next_line(line))
    consume(line);
}

void ProgressMonitor::update_elapsed(double elapsed_sec) {
  if (!total_sec_)
    return;
  double ratio = std::clamp(elapsed_sec / *total_sec_, 0.0, 1.0);
  publish(static_cast<int>(std::floor(ratio * 100.0)));
}

void ProgressMonitor::publish(int percent) {
  if (!total_sec_ || percent <= percent_)
    return;
  percent_ = percent;
  if (on_progress_)
    on_progress_(percent_);
}

} // namespace direct_play
