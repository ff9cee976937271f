/**
 * @file batch_processor.hpp
 * @brief Sequential batch transcoding and compatibility reporting
 *
 * @details The BatchProcessor runs the orchestrator over a file set, one file
 *          at a time:
 *
 *          - Derives <output_dir>/<stem><ext> for each input
 *
 *          - Skips inputs whose output already exists (SKIP_EXISTING)
 *
 *          - Reports a second input mapping onto an already claimed output as
 *            failed
 *
 *          - Keeps, backs up or deletes each successfully converted original
 *            (ORIGINALS_POLICY)
 *
 * @attention Cancellation is fail-fast: the partial tally is printed and the
 *            CancelledError is rethrown to the caller.
 */

#ifndef DIRECT_PLAY_BATCH_PROCESSOR_HPP
#define DIRECT_PLAY_BATCH_PROCESSOR_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace direct_play {

class CancellationToken;
class MediaInspector;
class TranscodeOrchestrator;

/// Name of the directory (beside the inputs) that receives backed up originals
constexpr const char *ORIGINALS_BACKUP_DIR = "originals_backup";

/**
 * @struct BatchTally
 * @brief Count of outcomes per state.
 */
struct BatchTally {
  int skipped = 0;
  int remuxed = 0;
  int hw_encoded = 0;
  int sw_encoded = 0;
  int failed = 0;

  void add(OutcomeState state);
  int count(OutcomeState state) const;
  int total() const {
    return skipped + remuxed + hw_encoded + sw_encoded + failed;
  }
};

/**
 * @class BatchProcessor
 * @brief Drives a TranscodeOrchestrator over many files.
 */
class BatchProcessor {
public:
  BatchProcessor(const AppConfig &config, TranscodeOrchestrator &orchestrator);

  /**
   * @brief Process every input, in order.
   * @return Tally over all inputs
   * @throws CancelledError after printing the partial tally
   */
  BatchTally process(const std::vector<std::string> &input_files,
                     const std::string &output_dir,
                     const CancellationToken &token);

  /// One outcome per input processed so far, in input order
  const std::vector<TranscodeOutcome> &outcomes() const { return outcomes_; }

private:
  /// Apply the originals policy after a successful transcode
  void handle_original(const TranscodeOutcome &outcome);

  void record(TranscodeOutcome outcome);

  void print_batch_summary(double wall_clock_sec) const;

  const AppConfig &config_;
  TranscodeOrchestrator &orchestrator_;

  BatchTally tally_;
  std::vector<TranscodeOutcome> outcomes_;
};

/**
 * @brief Probe and classify each file and print a readiness report.
 * @note Never spawns an encoder.
 * @return Number of files that need fixing
 * @throws CancelledError
 */
int check_files(const std::vector<std::string> &files,
                MediaInspector &inspector, const TargetProfile &profile,
                const CancellationToken &token);

} // namespace direct_play

#endif // DIRECT_PLAY_BATCH_PROCESSOR_HPP
