/**
 * @file main.cpp
 * @brief Entry point for Direct Play application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single file mode: transcode one file, print stage timings
 *
 *          - Batch directory mode: sequential processing with BatchProcessor
 *
 *          - Check mode: compatibility report, no transcoding
 *
 * @note Exit codes: 0 success, 1 failure or usage error, 2 configuration
 *       error, 130 interrupted.
 */

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "direct_play/artifacts.hpp"
#include "direct_play/batch_processor.hpp"
#include "direct_play/cancellation.hpp"
#include "direct_play/config.hpp"
#include "direct_play/errors.hpp"
#include "direct_play/ffmpeg_executor.hpp"
#include "direct_play/hardware.hpp"
#include "direct_play/logging.hpp"
#include "direct_play/media_probe.hpp"
#include "direct_play/orchestrator.hpp"
#include "direct_play/system.hpp"

using namespace direct_play;

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_ANY = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_INTERRUPTED = 130;

void print_usage() {
  LOG_WARN("Usage: direct_play <input_dir> <output_dir>");
  LOG_WARN("       direct_play <input_file> <output_file|output_dir>");
  LOG_WARN("       direct_play --check <input_dir|input_file>");
}

/// The file itself, or the media files of a directory
std::vector<std::string> input_set(const std::string &path,
                                   const AppConfig &config) {
  if (fs::is_directory(path))
    return collect_media_files(path, config.media_extensions);
  return {path};
}

int run_check(const std::string &path, const AppConfig &config,
              const CancellationToken &token) {
  LOG_INFO("Direct Play - Compatibility Check");
  std::vector<std::string> files = input_set(path, config);
  if (files.empty()) {
    LOG_WARN("No video files found in {}", path);
    return EXIT_OK;
  }

  FfprobeInspector inspector(config.ffprobe_binary,
                             std::chrono::milliseconds(config.kill_grace_ms));
  int needs_fixing = check_files(files, inspector, config.profile, token);
  return needs_fixing > 0 ? EXIT_FAILURE_ANY : EXIT_OK;
}

void print_banner(const AppConfig &config, const HardwareCapability &hw) {
  const TargetProfile &p = config.profile;
  LOG_PHASE("=======================================================");
  LOG_INFO("Target: {} {} level <= {}, {}x{}, audio {}", p.video_codec,
           p.pixel_format, p.max_level / 10.0, p.max_width, p.max_height,
           p.audio_codec);
  LOG_INFO("Encoder: {}", hw.usable() ? hw.description
                                      : config.encoder.software_encoder);
  LOG_INFO("Software CRF: {}   HW CQ: {}   HW maxrate: {}", config.encoder.crf,
           config.encoder.hardware_cq, config.encoder.hardware_maxrate);
  LOG_PHASE("=======================================================");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  static CancellationToken token;
  install_interrupt_handlers(token);

  if (argc < 3) {
    print_usage();
    return EXIT_FAILURE_ANY;
  }

  std::string first = argv[1];
  std::string second = argv[2];

  AppConfig config;
  try {
    config = load_app_config();
  } catch (const std::logic_error &e) {
    LOG_ERROR("Configuration error: {}", e.what());
    return EXIT_CONFIG;
  }

  try {
    if (first == "--check")
      return run_check(second, config, token);

    if (!fs::exists(first)) {
      LOG_ERROR("Input not found: {}", first);
      return EXIT_FAILURE_ANY;
    }

    HardwareCapability hw = detect_hardware_encoder(config.profile.video_codec,
                                                    config.use_hardware);
    print_banner(config, hw);

    std::chrono::milliseconds grace(config.kill_grace_ms);
    FfprobeInspector inspector(config.ffprobe_binary, grace);
    FfmpegRunner runner(grace);
    TranscodeOrchestrator orchestrator(config, inspector, runner, hw);

    if (fs::is_directory(first)) {
      // **---- BATCH MODE ----**

      LOG_INFO("Direct Play - Batch Mode");
      fs::create_directories(second);

      std::vector<std::string> files =
          collect_media_files(first, config.media_extensions);
      if (files.empty()) {
        LOG_WARN("No video files found in directory");
        return EXIT_OK;
      }
      LOG_INFO("Found {} video files", files.size());

      BatchProcessor processor(config, orchestrator);
      BatchTally tally = processor.process(files, second, token);
      return tally.failed > 0 ? EXIT_FAILURE_ANY : EXIT_OK;
    }

    // **---- SINGLE FILE MODE ----**

    LOG_INFO("Direct Play - Single File Mode");
    std::string output =
        fs::is_directory(second)
            ? derive_output_path(first, second, config.profile.output_extension)
            : second;
    LOG_INFO("Input: {}", first);
    LOG_INFO("Output: {}", output);

    TranscodeOutcome outcome = orchestrator.run(first, output, token);
    TimingCollector::print_summary();
    return outcome.state == OutcomeState::Failed ? EXIT_FAILURE_ANY : EXIT_OK;

  } catch (const CancelledError &e) {
    LOG_WARN("Interrupted (signal {}): {}", interrupt_signal(), e.what());
    return EXIT_INTERRUPTED;
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("{}", e.what());
    return EXIT_FAILURE_ANY;
  }
}
