/**
 * @file classifier.cpp
 * @brief Compatibility rules implementation
 */

#include "direct_play/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/core.h>

namespace direct_play {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string join(const std::vector<std::string> &items, const char *sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0)
      out += sep;
    out += items[i];
  }
  return out;
}

void add_issue(CompatibilityVerdict &v, IssueCategory category,
               std::string message) {
  v.issues.push_back({category, std::move(message)});
}

void check_container(const MediaDescription &desc, const TargetProfile &profile,
                     CompatibilityVerdict &v) {
  bool allowed = std::any_of(
      profile.allowed_containers.begin(), profile.allowed_containers.end(),
      [&](const std::string &c) {
        return desc.format_name.find(c) != std::string::npos;
      });
  if (!allowed) {
    add_issue(v, IssueCategory::Container,
              fmt::format("Container: '{}' (expected {})", desc.format_name,
                          join(profile.allowed_containers, "/")));
  }
}

void check_video(const Stream &video, const TargetProfile &profile,
                 CompatibilityVerdict &v) {
  if (video.codec_name != profile.video_codec) {
    add_issue(v, IssueCategory::VideoCodec,
              fmt::format("Video codec: {} (expected {})", video.codec_name,
                          profile.video_codec));
  }

  if (!video.pix_fmt.empty() && video.pix_fmt != profile.pixel_format) {
    add_issue(v, IssueCategory::PixelFormat,
              fmt::format("Pixel format: {} (expected {})", video.pix_fmt,
                          profile.pixel_format));
  }

  if (!video.profile.empty()) {
    std::string p = to_lower(video.profile);
    if (std::find(profile.allowed_profiles.begin(),
                  profile.allowed_profiles.end(),
                  p) == profile.allowed_profiles.end()) {
      add_issue(v, IssueCategory::Profile,
                fmt::format("Profile: {} (expected {})", video.profile,
                            join(profile.allowed_profiles, "/")));
    }
  }

  if (video.level) {
    int level = normalize_level(*video.level);
    if (level > 0 && level > profile.max_level) {
      add_issue(v, IssueCategory::Level,
                fmt::format("Level {} > {}", format_level(level),
                            format_level(profile.max_level)));
    }
  }

  if (video.width > profile.max_width || video.height > profile.max_height) {
    add_issue(v, IssueCategory::Resolution,
              fmt::format("Resolution {}x{} > {}x{}", video.width, video.height,
                          profile.max_width, profile.max_height));
  }
}

} // anonymous namespace

int normalize_level(double raw) {
  if (!std::isfinite(raw) || raw <= 0)
    return 0;
  if (raw < 10)
    return static_cast<int>(std::lround(raw * 10));
  return static_cast<int>(std::lround(raw));
}

std::string format_level(int tenths) {
  return fmt::format("{}.{}", tenths / 10, tenths % 10);
}

CompatibilityVerdict classify(const MediaDescription &desc,
                              const TargetProfile &profile) {
  CompatibilityVerdict v;

  check_container(desc, profile, v);

  const Stream *video = desc.first_video();
  if (!video) {
    add_issue(v, IssueCategory::NoVideoStream, "No video stream");
    v.compatible = false;
    return v;
  }
  check_video(*video, profile, v);

  if (!desc.has_audio_codec(profile.audio_codec)) {
    add_issue(v, IssueCategory::AudioCodec,
              fmt::format("No {} audio track", profile.audio_codec));
  }

  if (!profile.tolerate_embedded_subtitles) {
    for (const auto &s : desc.streams) {
      if (s.kind != StreamKind::Subtitle)
        continue;
      add_issue(v, IssueCategory::SubtitlePresent,
                s.language.empty()
                    ? fmt::format("Embedded subtitle: {}", s.codec_name)
                    : fmt::format("Embedded subtitle: {} ({})", s.codec_name,
                                  s.language));
    }
  }

  v.compatible = v.issues.empty();
  return v;
}

CompatibilityVerdict probe_failed_verdict(const std::string &reason) {
  CompatibilityVerdict v;
  v.compatible = false;
  v.issues.push_back(
      {IssueCategory::ProbeFailed, fmt::format("Probe failed: {}", reason)});
  return v;
}

} // namespace direct_play
