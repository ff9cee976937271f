/**
 * @file orchestrator.hpp
 * @brief Per-file transcode state machine
 *
 * @details The TranscodeOrchestrator takes one input file through:
 *
 *          1. Planned: probe, classify and pick a strategy
 *
 *          2. Executing: run the encoder into a per-tier temporary file
 *
 *          3. Verifying: re-probe and reclassify the temporary file
 *
 *          4. Done (rename into place) or Retrying (forced software encode,
 *             at most once) or Failed
 *
 * @note The states are driven by a flat loop over transition functions; no
 *       transition calls another one.
 */

#ifndef DIRECT_PLAY_ORCHESTRATOR_HPP
#define DIRECT_PLAY_ORCHESTRATOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "artifacts.hpp"
#include "config.hpp"
#include "hardware.hpp"
#include "types.hpp"

namespace direct_play {

class CancellationToken;
class EncodeRunner;
class MediaInspector;

enum class TranscodeState { Planned, Executing, Verifying, Retrying, Done, Failed };

const char *to_string(TranscodeState state);

/**
 * @class TranscodeOrchestrator
 * @brief Drives one file from inspection to a verified output.
 *
 * @attention GUARANTEES:
 *
 *   - A skip plan never spawns a process.
 *
 *   - The output path only appears through a rename of a verified file.
 *
 *   - Every temporary file is removed on failure and on cancellation.
 *
 *   - The software fallback runs at most once, and never after a software
 *     tier.
 */
class TranscodeOrchestrator {
public:
  TranscodeOrchestrator(const AppConfig &config, MediaInspector &inspector,
                        EncodeRunner &runner, HardwareCapability hw);

  /**
   * @brief Transcode input into output (or skip it).
   * @throws CancelledError once the token is set; temporary files are gone
   *         by the time it propagates
   */
  TranscodeOutcome run(const std::string &input_path,
                       const std::string &output_path,
                       const CancellationToken &token);

  /// States entered during the last run(), in order
  const std::vector<TranscodeState> &last_trace() const { return trace_; }

private:
  /// Working state of the file currently being processed
  struct FileRun {
    std::string input;
    std::string output;
    std::string name; //< Input file name, for log lines

    MediaDescription desc;
    CompatibilityVerdict verdict;
    EncodePlan plan;
    std::optional<double> duration;

    std::string tmp_path; //< Artifact of the current tier
    bool retried = false;
    int attempts = 0;
    OutcomeState result = OutcomeState::Failed;
    std::string diagnostic;

    ArtifactGuard artifacts;
  };

  TranscodeState plan(FileRun &run, const CancellationToken &token);
  TranscodeState execute(FileRun &run, const CancellationToken &token);
  TranscodeState verify(FileRun &run, const CancellationToken &token);
  TranscodeState retry(FileRun &run);
  void fail(FileRun &run);

  const AppConfig &config_;
  MediaInspector &inspector_;
  EncodeRunner &runner_;
  HardwareCapability hw_;

  std::vector<TranscodeState> trace_;
};

} // namespace direct_play

#endif // DIRECT_PLAY_ORCHESTRATOR_HPP
