/**
 * @file encode_planner.cpp
 * @brief Strategy selection implementation
 */

#include "direct_play/encode_planner.hpp"

#include <vector>

namespace direct_play {

namespace {

/// Audio streams that already use the target codec, by input index
std::vector<int> matching_audio(const MediaDescription &desc,
                                const TargetProfile &profile) {
  std::vector<int> indices;
  for (const auto &s : desc.streams) {
    if (s.kind == StreamKind::Audio && s.codec_name == profile.audio_codec)
      indices.push_back(s.index);
  }
  return indices;
}

/// Fields shared by every encode plan, whatever the tier
EncodePlan encode_plan(Strategy strategy, std::string encoder,
                       const MediaDescription &desc,
                       const TargetProfile &profile) {
  EncodePlan plan;
  plan.strategy = strategy;
  plan.encoder = std::move(encoder);
  plan.scale = needs_scaling(desc, profile);
  if (plan.scale) {
    plan.target_width = profile.max_width;
    plan.target_height = profile.max_height;
  }
  plan.copy_audio = desc.has_audio_codec(profile.audio_codec);
  if (plan.copy_audio)
    plan.copied_audio = matching_audio(desc, profile);
  plan.strip_subtitles = !profile.tolerate_embedded_subtitles;
  return plan;
}

} // anonymous namespace

bool needs_scaling(const MediaDescription &desc, const TargetProfile &profile) {
  const Stream *video = desc.first_video();
  return video &&
         (video->width > profile.max_width || video->height > profile.max_height);
}

EncodePlan plan_encode(const MediaDescription &desc,
                       const CompatibilityVerdict &verdict,
                       const TargetProfile &profile,
                       const HardwareCapability &hw,
                       const EncoderSettings &settings) {
  if (verdict.issues.empty()) {
    EncodePlan plan;
    plan.strategy = Strategy::Skip;
    return plan;
  }

  if (verdict.only(IssueCategory::Container)) {
    EncodePlan plan;
    plan.strategy = Strategy::Remux;
    plan.copy_audio = true;
    plan.copied_audio = matching_audio(desc, profile);
    plan.strip_subtitles = !profile.tolerate_embedded_subtitles;
    return plan;
  }

  if (hw.usable())
    return encode_plan(Strategy::HardwareEncode, hw.encoder, desc, profile);

  return encode_plan(Strategy::SoftwareEncode, settings.software_encoder, desc,
                     profile);
}

EncodePlan plan_software_fallback(const MediaDescription &desc,
                                  const TargetProfile &profile,
                                  const EncoderSettings &settings) {
  return encode_plan(Strategy::SoftwareEncode, settings.software_encoder, desc,
                     profile);
}

} // namespace direct_play
