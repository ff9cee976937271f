/**
 * @file types.hpp
 * @brief Core data types for Direct Play
 *
 * @details Contains the data model shared by every stage of the pipeline:
 *          - MediaDescription / Stream: what the probe found in a file
 *
 *          - CompatibilityVerdict / Issue: what the classifier concluded
 *
 *          - EncodePlan: what the planner decided to do about it
 *
 *          - TranscodeOutcome: what actually happened
 */

#ifndef DIRECT_PLAY_TYPES_HPP
#define DIRECT_PLAY_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

namespace direct_play {

// **----- MEDIA DESCRIPTION -----**

enum class StreamKind { Video, Audio, Subtitle, Other };

/**
 * @struct Stream
 * @brief One elementary stream as reported by the inspection tool.
 * @note Video-only and subtitle-only fields stay at their defaults for other
 *       kinds.
 */
struct Stream {
  int index = -1;
  StreamKind kind = StreamKind::Other;
  std::string codec_name;

  std::string profile;         //< Video profile, e.g. "High" (may be empty)
  std::string pix_fmt;         //< Video pixel format (may be empty)
  std::optional<double> level; //< Raw level, either 41 or 4.1 style
  int width = 0;
  int height = 0;

  std::string language; //< Subtitle language tag (may be empty)
};

/**
 * @struct MediaDescription
 * @brief Container format plus ordered stream list of a media file.
 * @note format_name is never absent; an unknown container is "".
 */
struct MediaDescription {
  std::string format_name;
  std::vector<Stream> streams;
  std::optional<double> duration; //< Seconds, from the format section

  /// First video stream, or nullptr if the file has none
  const Stream *first_video() const;

  /// True if any audio stream uses the given codec
  bool has_audio_codec(const std::string &codec) const;

  int count(StreamKind kind) const;
};

// **----- COMPATIBILITY -----**

enum class IssueCategory {
  Container,
  VideoCodec,
  PixelFormat,
  Profile,
  Level,
  Resolution,
  AudioCodec,
  SubtitlePresent,
  NoVideoStream,
  ProbeFailed
};

struct Issue {
  IssueCategory category;
  std::string message;
};

/**
 * @struct CompatibilityVerdict
 * @brief Classifier result; compatible is true iff issues is empty.
 */
struct CompatibilityVerdict {
  bool compatible = false;
  std::vector<Issue> issues;

  bool has(IssueCategory category) const;

  /// True if there is at least one issue and every issue is of this category
  bool only(IssueCategory category) const;
};

// **----- PLANNING -----**

enum class Strategy { Skip, Remux, HardwareEncode, SoftwareEncode };

/**
 * @struct EncodePlan
 * @brief Options for one execution tier. Built fresh, never mutated.
 */
struct EncodePlan {
  Strategy strategy = Strategy::Skip;
  std::string encoder; //< ffmpeg encoder name, empty for skip/remux

  bool scale = false; //< Downscale into target box preserving aspect ratio
  int target_width = 0;
  int target_height = 0;

  bool copy_audio = true;       //< false = re-encode to target audio codec
  std::vector<int> copied_audio; //< Input indices to map when copying (empty = all)
  bool strip_subtitles = true;  //< Drop subtitle streams from the output
};

// **----- OUTCOME -----**

enum class OutcomeState { Skipped, Remuxed, HardwareEncoded, SoftwareEncoded, Failed };

/**
 * @struct TranscodeOutcome
 * @brief Per-file result appended to the batch report.
 */
struct TranscodeOutcome {
  std::string input_path;
  std::string output_path;
  OutcomeState state = OutcomeState::Failed;
  std::string diagnostic;
  double elapsed_sec = 0.0;
  int attempts = 0; //< Number of external encode processes spawned
};

// **----- NAMES -----**

const char *to_string(StreamKind kind);
const char *to_string(IssueCategory category);
const char *to_string(Strategy strategy);
const char *to_string(OutcomeState state);

/// Outcome state reached when a plan of this strategy succeeds
OutcomeState success_state(Strategy strategy);

} // namespace direct_play

#endif // DIRECT_PLAY_TYPES_HPP
