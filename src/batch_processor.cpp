/**
 * @file batch_processor.cpp
 * @brief Sequential batch processing implementation
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Output derivation, collision and existing-output checks
 *
 *          - Per-file status lines and the final summary table
 *
 *          - Originals policy after success
 *
 *          - The read-only compatibility report
 */

#include "direct_play/batch_processor.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <set>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "direct_play/artifacts.hpp"
#include "direct_play/cancellation.hpp"
#include "direct_play/classifier.hpp"
#include "direct_play/errors.hpp"
#include "direct_play/logging.hpp"
#include "direct_play/media_probe.hpp"
#include "direct_play/orchestrator.hpp"
#include "direct_play/system.hpp"

namespace direct_play {

namespace fs = std::filesystem;

namespace {

/// Both paths name the same file (false if either cannot be resolved)
bool same_file(const std::string &a, const std::string &b) {
  std::error_code ec;
  bool same = fs::equivalent(a, b, ec);
  return !ec && same;
}

bool is_success(OutcomeState state) {
  return state == OutcomeState::Remuxed ||
         state == OutcomeState::HardwareEncoded ||
         state == OutcomeState::SoftwareEncoded;
}

} // anonymous namespace

// **---- BatchTally ----**

void BatchTally::add(OutcomeState state) {
  switch (state) {
  case OutcomeState::Skipped:
    ++skipped;
    break;
  case OutcomeState::Remuxed:
    ++remuxed;
    break;
  case OutcomeState::HardwareEncoded:
    ++hw_encoded;
    break;
  case OutcomeState::SoftwareEncoded:
    ++sw_encoded;
    break;
  case OutcomeState::Failed:
    ++failed;
    break;
  }
}

int BatchTally::count(OutcomeState state) const {
  switch (state) {
  case OutcomeState::Skipped:
    return skipped;
  case OutcomeState::Remuxed:
    return remuxed;
  case OutcomeState::HardwareEncoded:
    return hw_encoded;
  case OutcomeState::SoftwareEncoded:
    return sw_encoded;
  case OutcomeState::Failed:
    return failed;
  }
  return 0;
}

// **---- BatchProcessor ----**

BatchProcessor::BatchProcessor(const AppConfig &config,
                               TranscodeOrchestrator &orchestrator)
    : config_(config), orchestrator_(orchestrator) {}

BatchTally BatchProcessor::process(const std::vector<std::string> &input_files,
                                   const std::string &output_dir,
                                   const CancellationToken &token) {
  tally_ = BatchTally{};
  outcomes_.clear();

  if (input_files.empty()) {
    LOG_WARN("No input files to process");
    return tally_;
  }

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Files to process: {}", input_files.size());
  LOG_INFO("Output directory: {}", output_dir);
  LOG_INFO("Originals: {}", to_string(config_.originals));
  LOG_PHASE("=======================================================");

  auto batch_start = std::chrono::steady_clock::now();
  std::set<std::string> claimed_outputs;
  int index = 0;

  try {
    for (const auto &file : input_files) {
      token.throw_if_cancelled("starting next file");
      ++index;

      std::string name = fs::path(file).filename().string();
      std::string output =
          derive_output_path(file, output_dir, config_.profile.output_extension);

      LOG_PHASE("----------------------------------------");
      LOG_INFO("[{}/{}] {}", index, input_files.size(), name);

      TranscodeOutcome outcome;
      outcome.input_path = file;
      outcome.output_path = output;

      if (!claimed_outputs.insert(output).second) {
        outcome.state = OutcomeState::Failed;
        outcome.diagnostic = fmt::format(
            "output {} already claimed by another input",
            fs::path(output).filename().string());
        LOG_ERROR("✘ {}: {}", name, outcome.diagnostic);
        record(std::move(outcome));
        continue;
      }

      /// In-place runs derive the input itself as output; those still need
      /// classifying
      std::error_code ec;
      if (config_.skip_existing && !same_file(file, output) &&
          fs::exists(output, ec)) {
        outcome.state = OutcomeState::Skipped;
        outcome.diagnostic = "output already exists";
        LOG_INFO("Skipping existing output: {}", output);
        record(std::move(outcome));
        continue;
      }

      outcome = orchestrator_.run(file, output, token);
      if (is_success(outcome.state))
        handle_original(outcome);

      LOG_INFO("{}: {} ({:.1f}s)", name, to_string(outcome.state),
               outcome.elapsed_sec);
      record(std::move(outcome));

      /// Clear timing for next file
      TimingCollector::clear();
    }
  } catch (const CancelledError &) {
    double elapsed = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - batch_start)
                         .count();
    LOG_WARN("Batch interrupted after {} of {} files", outcomes_.size(),
             input_files.size());
    print_batch_summary(elapsed);
    throw;
  }

  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - batch_start)
                       .count();
  print_batch_summary(elapsed);
  return tally_;
}

void BatchProcessor::record(TranscodeOutcome outcome) {
  tally_.add(outcome.state);
  outcomes_.push_back(std::move(outcome));
}

void BatchProcessor::handle_original(const TranscodeOutcome &outcome) {
  /// In-place conversion: the output replaced the original already
  if (same_file(outcome.input_path, outcome.output_path))
    return;

  fs::path input(outcome.input_path);
  std::error_code ec;

  switch (config_.originals) {
  case OriginalsPolicy::Keep:
    return;

  case OriginalsPolicy::Backup: {
    fs::path backup_dir = input.parent_path() / ORIGINALS_BACKUP_DIR;
    fs::create_directories(backup_dir, ec);
    if (!ec)
      fs::rename(input, backup_dir / input.filename(), ec);
    if (ec)
      LOG_WARN("Could not back up original {}: {}", input.filename().string(),
               ec.message());
    else
      LOG_INFO("Moved original to {}", (backup_dir / input.filename()).string());
    return;
  }

  case OriginalsPolicy::Delete:
    fs::remove(input, ec);
    if (ec)
      LOG_WARN("Could not delete original {}: {}", input.filename().string(),
               ec.message());
    return;
  }
}

void BatchProcessor::print_batch_summary(double wall_clock_sec) const {
  std::lock_guard<std::mutex> lock(log_mutex);
  break_progress_line_locked();

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH PROCESSING SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", tally_.total());
  fmt::print("{:<25} {:>25}\n", "Skipped:", tally_.skipped);
  fmt::print("{:<25} {:>25}\n", "Remuxed:", tally_.remuxed);
  fmt::print("{:<25} {:>25}\n", "HW encoded:", tally_.hw_encoded);
  fmt::print("{:<25} {:>25}\n", "SW encoded:", tally_.sw_encoded);
  fmt::print("{:<25} {:>25}\n", "Failed:", tally_.failed);
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:", format_time(wall_clock_sec));

  if (tally_.total() > 0) {
    double avg_time = wall_clock_sec / tally_.total();
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per file:", avg_time);
  }

  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  /// List failed files if any
  if (tally_.failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &outcome : outcomes_) {
      if (outcome.state == OutcomeState::Failed) {
        fmt::print(fg(fmt::color::red), "  - {}: {}\n",
                   fs::path(outcome.input_path).filename().string(),
                   outcome.diagnostic);
      }
    }
  }
  std::fflush(stdout);
}

// **---- Compatibility Report ----**

int check_files(const std::vector<std::string> &files,
                MediaInspector &inspector, const TargetProfile &profile,
                const CancellationToken &token) {
  int ready = 0;
  int needs_fixing = 0;

  for (const auto &file : files) {
    std::string name = fs::path(file).filename().string();

    CompatibilityVerdict verdict;
    try {
      verdict = classify(inspector.probe(file, token), profile);
    } catch (const ProbeError &e) {
      verdict = probe_failed_verdict(e.what());
    }

    std::lock_guard<std::mutex> lock(log_mutex);
    if (verdict.compatible) {
      ++ready;
      fmt::print(fg(fmt::color::green), "✔ {}\n", name);
    } else {
      ++needs_fixing;
      fmt::print(fg(fmt::color::red), "✘ {}\n", name);
      for (const auto &issue : verdict.issues)
        fmt::print("    - {}\n", issue.message);
    }
    std::fflush(stdout);
  }

  LOG_PHASE("======================================================");
  LOG_INFO("Ready for direct play: {}", ready);
  LOG_INFO("Need fixing:           {}", needs_fixing);
  return needs_fixing;
}

} // namespace direct_play
