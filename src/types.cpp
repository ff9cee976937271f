/**
 * @file types.cpp
 * @brief Helpers on the core data types
 */

#include "direct_play/types.hpp"

#include <algorithm>

namespace direct_play {

// **---- MediaDescription ----**

const Stream *MediaDescription::first_video() const {
  for (const auto &s : streams) {
    if (s.kind == StreamKind::Video)
      return &s;
  }
  return nullptr;
}

bool MediaDescription::has_audio_codec(const std::string &codec) const {
  return std::any_of(streams.begin(), streams.end(), [&](const Stream &s) {
    return s.kind == StreamKind::Audio && s.codec_name == codec;
  });
}

int MediaDescription::count(StreamKind kind) const {
  return static_cast<int>(
      std::count_if(streams.begin(), streams.end(),
                    [kind](const Stream &s) { return s.kind == kind; }));
}

// **---- CompatibilityVerdict ----**

bool CompatibilityVerdict::has(IssueCategory category) const {
  return std::any_of(issues.begin(), issues.end(), [category](const Issue &i) {
    return i.category == category;
  });
}

bool CompatibilityVerdict::only(IssueCategory category) const {
  return !issues.empty() &&
         std::all_of(issues.begin(), issues.end(), [category](const Issue &i) {
           return i.category == category;
         });
}

// **---- Names ----**

const char *to_string(StreamKind kind) {
  switch (kind) {
  case StreamKind::Video:
    return "video";
  case StreamKind::Audio:
    return "audio";
  case StreamKind::Subtitle:
    return "subtitle";
  case StreamKind::Other:
    break;
  }
  return "other";
}

const char *to_string(IssueCategory category) {
  switch (category) {
  case IssueCategory::Container:
    return "container";
  case IssueCategory::VideoCodec:
    return "video-codec";
  case IssueCategory::PixelFormat:
    return "pix-fmt";
  case IssueCategory::Profile:
    return "profile";
  case IssueCategory::Level:
    return "level";
  case IssueCategory::Resolution:
    return "resolution";
  case IssueCategory::AudioCodec:
    return "audio-codec";
  case IssueCategory::SubtitlePresent:
    return "subtitle-present";
  case IssueCategory::NoVideoStream:
    return "no-video-stream";
  case IssueCategory::ProbeFailed:
    return "probe-failed";
  }
  return "unknown";
}

const char *to_string(Strategy strategy) {
  switch (strategy) {
  case Strategy::Skip:
    return "skip";
  case Strategy::Remux:
    return "remux";
  case Strategy::HardwareEncode:
    return "hw-encode";
  case Strategy::SoftwareEncode:
    return "sw-encode";
  }
  return "unknown";
}

const char *to_string(OutcomeState state) {
  switch (state) {
  case OutcomeState::Skipped:
    return "skipped";
  case OutcomeState::Remuxed:
    return "remuxed";
  case OutcomeState::HardwareEncoded:
    return "hw-encoded";
  case OutcomeState::SoftwareEncoded:
    return "sw-encoded";
  case OutcomeState::Failed:
    return "failed";
  }
  return "unknown";
}

OutcomeState success_state(Strategy strategy) {
  switch (strategy) {
  case Strategy::Skip:
    return OutcomeState::Skipped;
  case Strategy::Remux:
    return OutcomeState::Remuxed;
  case Strategy::HardwareEncode:
    return OutcomeState::HardwareEncoded;
  case Strategy::SoftwareEncode:
    return OutcomeState::SoftwareEncoded;
  }
  return OutcomeState::Failed;
}

} // namespace direct_play
