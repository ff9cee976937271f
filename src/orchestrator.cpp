/**
 * @file orchestrator.cpp
 * @brief Transcode state machine implementation
 *
 * @details One transition function per state. Each returns the next state;
 *          run() loops until Done or Failed. Cancellation is not a state: a
 *          CancelledError unwinds out of run() and the FileRun's ArtifactGuard
 *          removes whatever temporary file the current tier produced.
 */

#include "direct_play/orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "direct_play/cancellation.hpp"
#include "direct_play/classifier.hpp"
#include "direct_play/encode_planner.hpp"
#include "direct_play/errors.hpp"
#include "direct_play/ffmpeg_command.hpp"
#include "direct_play/ffmpeg_executor.hpp"
#include "direct_play/logging.hpp"
#include "direct_play/media_probe.hpp"
#include "direct_play/progress_monitor.hpp"

namespace fs = std::filesystem;

namespace direct_play {

namespace {

const char *tier_label(Strategy strategy) {
  switch (strategy) {
  case Strategy::Remux:
    return "Remux";
  case Strategy::HardwareEncode:
    return "HW encode";
  case Strategy::SoftwareEncode:
    return "SW encode";
  case Strategy::Skip:
    break;
  }
  return "Skip";
}

std::string summarize(const CompatibilityVerdict &verdict) {
  std::string out;
  for (const auto &issue : verdict.issues) {
    if (!out.empty())
      out += "; ";
    out += issue.message;
  }
  return out;
}

} // anonymous namespace

const char *to_string(TranscodeState state) {
  switch (state) {
  case TranscodeState::Planned:
    return "planned";
  case TranscodeState::Executing:
    return "executing";
  case TranscodeState::Verifying:
    return "verifying";
  case TranscodeState::Retrying:
    return "retrying";
  case TranscodeState::Done:
    return "done";
  case TranscodeState::Failed:
    return "failed";
  }
  return "unknown";
}

TranscodeOrchestrator::TranscodeOrchestrator(const AppConfig &config,
                                             MediaInspector &inspector,
                                             EncodeRunner &runner,
                                             HardwareCapability hw)
    : config_(config), inspector_(inspector), runner_(runner),
      hw_(std::move(hw)) {}

// **---- Driver ----**

TranscodeOutcome TranscodeOrchestrator::run(const std::string &input_path,
                                            const std::string &output_path,
                                            const CancellationToken &token) {
  auto start = std::chrono::steady_clock::now();
  trace_.clear();

  FileRun run;
  run.input = input_path;
  run.output = output_path;
  run.name = fs::path(input_path).filename().string();

  TranscodeState state = TranscodeState::Planned;
  try {
    while (state != TranscodeState::Done && state != TranscodeState::Failed) {
      trace_.push_back(state);
      switch (state) {
      case TranscodeState::Planned:
        state = plan(run, token);
        break;
      case TranscodeState::Executing:
        state = execute(run, token);
        break;
      case TranscodeState::Verifying:
        state = verify(run, token);
        break;
      case TranscodeState::Retrying:
        state = retry(run);
        break;
      case TranscodeState::Done:
      case TranscodeState::Failed:
        break;
      }
    }
  } catch (const CancelledError &) {
    end_progress();
    LOG_WARN("Interrupted while processing {}, removing partial output",
             run.name);
    throw;
  }
  trace_.push_back(state);

  if (state == TranscodeState::Failed)
    fail(run);

  TranscodeOutcome outcome;
  outcome.input_path = input_path;
  outcome.output_path = output_path;
  outcome.state = run.result;
  outcome.diagnostic = run.diagnostic;
  outcome.attempts = run.attempts;
  outcome.elapsed_sec = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - start)
                            .count();
  return outcome;
}

// **---- Transitions ----**

TranscodeState TranscodeOrchestrator::plan(FileRun &run,
                                           const CancellationToken &token) {
  LOG_PHASE("Inspecting {}", run.name);

  TIMER_START(probe);
  try {
    run.desc = inspector_.probe(run.input, token);
    run.verdict = classify(run.desc, config_.profile);
  } catch (const ProbeError &e) {
    LOG_WARN("Probe failed for {}: {}", run.name, e.what());
    run.desc = MediaDescription{};
    run.verdict = probe_failed_verdict(e.what());
  }
  TIMER_END(probe);

  run.plan = plan_encode(run.desc, run.verdict, config_.profile, hw_,
                         config_.encoder);

  if (run.plan.strategy == Strategy::Skip) {
    LOG_SUCCESS("✔ {} is already compatible, skipping", run.name);
    run.result = OutcomeState::Skipped;
    return TranscodeState::Done;
  }

  for (const auto &issue : run.verdict.issues)
    LOG_INFO("  - [{}] {}", to_string(issue.category), issue.message);
  LOG_INFO("Plan: {}{}{}", to_string(run.plan.strategy),
           run.plan.encoder.empty() ? "" : " with " + run.plan.encoder,
           run.plan.scale ? fmt::format(", scale to fit {}x{}",
                                        run.plan.target_width,
                                        run.plan.target_height)
                          : "");

  std::error_code ec;
  fs::path parent = fs::path(run.output).parent_path();
  if (!parent.empty())
    fs::create_directories(parent, ec);
  if (ec) {
    run.diagnostic = fmt::format("cannot create {}: {}", parent.string(),
                                 ec.message());
    return TranscodeState::Failed;
  }

  /// Queried once; every tier reports against the same total
  run.duration = inspector_.duration(run.input);
  if (!run.duration && run.desc.duration)
    run.duration = run.desc.duration;

  return TranscodeState::Executing;
}

TranscodeState TranscodeOrchestrator::execute(FileRun &run,
                                              const CancellationToken &token) {
  token.throw_if_cancelled("starting encoder");

  run.tmp_path = temporary_path_for(run.output, run.plan.strategy);
  run.artifacts.track(run.tmp_path);

  std::vector<std::string> args =
      build_ffmpeg_args(run.plan, run.input, run.tmp_path, config_);

  std::string label = fmt::format("{} {}", tier_label(run.plan.strategy),
                                  run.name);
  ProgressMonitor monitor(run.duration,
                          [&label](int pct) { print_progress(label, pct); });
  if (!monitor.reporting())
    LOG_INFO("{} (duration unknown, no progress)", label);

  ++run.attempts;
  std::string diagnostics;

  TIMER_START(encode);
  int status = runner_.run(args, monitor, token, diagnostics);
  TIMER_END(encode);
  end_progress();

  if (status != 0) {
    run.diagnostic = diagnostics.empty()
                         ? fmt::format("encoder exited with status {}", status)
                         : diagnostics;
    LOG_ERROR("{} failed: {}", label, run.diagnostic);
    return TranscodeState::Retrying;
  }
  return TranscodeState::Verifying;
}

TranscodeState TranscodeOrchestrator::verify(FileRun &run,
                                             const CancellationToken &token) {
  TIMER_START(verify);
  CompatibilityVerdict verdict;
  try {
    verdict = classify(inspector_.probe(run.tmp_path, token), config_.profile);
  } catch (const ProbeError &e) {
    verdict = probe_failed_verdict(e.what());
  }
  TIMER_END(verify);

  if (!verdict.compatible) {
    run.diagnostic =
        fmt::format("{} output not compliant: {}", tier_label(run.plan.strategy),
                    summarize(verdict));
    LOG_WARN("{}: {}", run.name, run.diagnostic);
    if (run.plan.strategy == Strategy::SoftwareEncode) {
      run.artifacts.discard(run.tmp_path);
      return TranscodeState::Failed;
    }
    return TranscodeState::Retrying;
  }

  std::string rename_error;
  if (!run.artifacts.commit(run.tmp_path, run.output, rename_error)) {
    run.diagnostic = rename_error;
    return TranscodeState::Failed;
  }

  run.result = success_state(run.plan.strategy);
  run.diagnostic.clear();
  LOG_SUCCESS("✔ {} -> {} ({})", run.name,
              fs::path(run.output).filename().string(), to_string(run.result));
  return TranscodeState::Done;
}

TranscodeState TranscodeOrchestrator::retry(FileRun &run) {
  run.artifacts.discard(run.tmp_path);

  if (run.retried || run.plan.strategy == Strategy::SoftwareEncode)
    return TranscodeState::Failed;

  LOG_WARN("Retrying {} with software encoder {}", run.name,
           config_.encoder.software_encoder);
  run.plan = plan_software_fallback(run.desc, config_.profile, config_.encoder);
  run.retried = true;
  return TranscodeState::Executing;
}

void TranscodeOrchestrator::fail(FileRun &run) {
  run.artifacts.remove_all();
  run.result = OutcomeState::Failed;
  if (run.diagnostic.empty())
    run.diagnostic = "transcode failed";
  LOG_ERROR("✘ {}: {}", run.name, run.diagnostic);
}

} // namespace direct_play
