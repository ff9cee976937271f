/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Signal-to-token bridging for user interrupts
 *
 *          - Media file discovery
 *
 *          - Time formatting utilities
 */

#include "direct_play/system.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <filesystem>

#include <fmt/core.h>

#include "direct_play/cancellation.hpp"

namespace direct_play {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

CancellationToken *interrupt_token = nullptr;
volatile std::sig_atomic_t interrupt_signum = 0;

void handle_interrupt(int sig) {
  interrupt_signum = sig;
  if (interrupt_token)
    interrupt_token->request_cancel();
}

} // anonymous namespace

// **---- Interrupt Handling ----**

void install_interrupt_handlers(CancellationToken &token) {
  interrupt_token = &token;

  struct sigaction sa {};
  sa.sa_handler = handle_interrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; //< No SA_RESTART: blocking calls must see EINTR

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

int interrupt_signal() { return interrupt_signum; }

// **---- File Discovery ----**

std::string lower_extension(const std::string &path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

bool is_media_file(const std::string &path,
                   const std::vector<std::string> &extensions) {
  std::string ext = lower_extension(path);
  return !ext.empty() &&
         std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::vector<std::string>
collect_media_files(const std::string &dir,
                    const std::vector<std::string> &extensions) {
  std::vector<std::string> files;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file() &&
        is_media_file(entry.path().string(), extensions)) {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (seconds < 0)
    seconds = 0;
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace direct_play
