/**
 * @file ffmpeg_command.cpp
 * @brief ffmpeg argument construction per encode tier
 */

#include "direct_play/ffmpeg_command.hpp"

#include <fmt/core.h>

#include "direct_play/classifier.hpp"
#include "direct_play/hardware.hpp"

namespace direct_play {

namespace {

using Args = std::vector<std::string>;

void append(Args &args, std::initializer_list<std::string> more) {
  args.insert(args.end(), more.begin(), more.end());
}

/// Video encoder options, quality first: CRF for x264, CQ/VBR for hardware
void append_video_options(Args &args, const EncodePlan &plan,
                          const AppConfig &config) {
  const TargetProfile &p = config.profile;
  const EncoderSettings &s = config.encoder;
  const std::string level = format_level(p.max_level);

  switch (encoder_family(plan.encoder)) {
  case EncoderFamily::Nvenc:
    append(args, {"-c:v", plan.encoder, "-pix_fmt", p.pixel_format,
                  "-profile:v", s.encode_profile, "-level", level, "-preset",
                  s.hardware_preset, "-rc", "vbr", "-cq",
                  std::to_string(s.hardware_cq), "-b:v", "0", "-maxrate",
                  s.hardware_maxrate, "-bufsize", s.hardware_bufsize});
    break;

  case EncoderFamily::VideoToolbox:
    /// No CQ mode: CRF-scale quality hint plus a generous bitrate ceiling
    append(args, {"-c:v", plan.encoder, "-pix_fmt", p.pixel_format,
                  "-profile:v", s.encode_profile, "-level", level, "-q:v",
                  std::to_string(s.crf), "-b:v", s.hardware_maxrate,
                  "-maxrate", s.hardware_maxrate, "-bufsize",
                  s.hardware_bufsize});
    break;

  case EncoderFamily::Software:
    append(args, {"-c:v", plan.encoder, "-preset", s.software_preset, "-crf",
                  std::to_string(s.crf), "-pix_fmt", p.pixel_format,
                  "-profile:v", s.encode_profile, "-level", level});
    break;
  }

  if (plan.scale)
    append(args, {"-vf", scale_filter(plan.target_width, plan.target_height)});
}

void append_audio_options(Args &args, const EncodePlan &plan,
                          const AppConfig &config) {
  if (plan.copy_audio) {
    append(args, {"-c:a", "copy"});
  } else {
    append(args, {"-c:a", config.profile.audio_codec, "-b:a",
                  config.encoder.audio_bitrate, "-ac",
                  std::to_string(config.encoder.audio_channels)});
  }
}

/// Copying maps only the tracks already in the target codec; MP4 rejects
/// many others (TrueHD, Vorbis, PCM)
void append_audio_maps(Args &args, const EncodePlan &plan) {
  if (!plan.copy_audio || plan.copied_audio.empty()) {
    append(args, {"-map", "0:a?"});
    return;
  }
  for (int index : plan.copied_audio)
    append(args, {"-map", fmt::format("0:{}", index)});
}

void append_subtitle_options(Args &args, const EncodePlan &plan) {
  if (plan.strip_subtitles) {
    args.push_back("-sn");
  } else {
    /// MP4 only carries text subtitles as mov_text
    append(args, {"-map", "0:s?", "-c:s", "mov_text"});
  }
}

} // anonymous namespace

std::string scale_filter(int max_width, int max_height) {
  double aspect = static_cast<double>(max_width) / max_height;
  return fmt::format("scale='if(gt(iw/ih,{ar:.6f}),{w},-2)'"
                     ":'if(gt(iw/ih,{ar:.6f}),-2,{h})'",
                     fmt::arg("ar", aspect), fmt::arg("w", max_width),
                     fmt::arg("h", max_height));
}

std::vector<std::string> build_ffmpeg_args(const EncodePlan &plan,
                                           const std::string &input_path,
                                           const std::string &output_path,
                                           const AppConfig &config) {
  Args args{config.ffmpeg_binary, "-hide_banner", "-nostdin", "-y",
            "-i", input_path, "-map", "0:v:0"};
  append_audio_maps(args, plan);

  if (plan.strategy == Strategy::Remux) {
    append(args, {"-c:v", "copy", "-c:a", "copy"});
  } else {
    append_video_options(args, plan, config);
    append_audio_options(args, plan, config);
  }
  append_subtitle_options(args, plan);

  append(args, {"-movflags", "+faststart", "-f", config.profile.output_container,
                "-progress", "pipe:1", "-nostats", "-loglevel", "error",
                output_path});
  return args;
}

std::string render_command(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &a : args) {
    if (!out.empty())
      out += ' ';
    if (a.find_first_of(" '\"()") != std::string::npos)
      out += fmt::format("\"{}\"", a);
    else
      out += a;
  }
  return out;
}

} // namespace direct_play
