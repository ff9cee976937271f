/**
 * @file config.cpp
 * @brief Environment parsing for TargetProfile, EncoderSettings, AppConfig
 */

#include "direct_play/config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>

#include "direct_play/classifier.hpp"

namespace direct_play {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

int positive(const char *name, int value) {
  if (value <= 0) {
    throw std::invalid_argument(
        fmt::format("{} must be positive (got {})", name, value));
  }
  return value;
}

} // anonymous namespace

// **---- Config helpers ----**

namespace Config {

bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  std::string v = to_lower(trim(val));
  return !(v == "0" || v == "false" || v == "no" || v == "off");
}

std::vector<std::string> get_env_list(const char *name,
                                      const std::vector<std::string> &default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  std::vector<std::string> items;
  std::string line(val);
  size_t pos = 0;
  while (pos <= line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = trim(line.substr(pos, end - pos));
    if (!item.empty())
      items.push_back(item);
    pos = end + 1;
  }
  return items;
}

} // namespace Config

// **---- Loaders ----**

TargetProfile load_target_profile() {
  TargetProfile p;
  p.allowed_containers =
      Config::get_env_list("TARGET_CONTAINERS", p.allowed_containers);
  p.video_codec = Config::get_env_string("TARGET_VIDEO_CODEC", p.video_codec);
  p.pixel_format = Config::get_env_string("TARGET_PIX_FMT", p.pixel_format);

  p.allowed_profiles = Config::get_env_list("TARGET_PROFILES", p.allowed_profiles);
  for (auto &profile : p.allowed_profiles)
    profile = to_lower(profile);

  /// Accepts "4.1" as well as "41"
  double raw_level = Config::get_env_double("TARGET_MAX_LEVEL", p.max_level);
  p.max_level = positive("TARGET_MAX_LEVEL", normalize_level(raw_level));

  p.max_width = positive("TARGET_MAX_WIDTH",
                         Config::get_env_int("TARGET_MAX_WIDTH", p.max_width));
  p.max_height = positive(
      "TARGET_MAX_HEIGHT", Config::get_env_int("TARGET_MAX_HEIGHT", p.max_height));
  p.audio_codec = Config::get_env_string("TARGET_AUDIO_CODEC", p.audio_codec);
  p.tolerate_embedded_subtitles =
      Config::get_env_bool("TOLERATE_SUBTITLES", p.tolerate_embedded_subtitles);

  if (p.allowed_containers.empty())
    throw std::invalid_argument("TARGET_CONTAINERS must not be empty");
  if (p.allowed_profiles.empty())
    throw std::invalid_argument("TARGET_PROFILES must not be empty");
  return p;
}

EncoderSettings load_encoder_settings() {
  EncoderSettings s;
  s.software_encoder = Config::get_env_string("SOFTWARE_ENCODER", s.software_encoder);
  s.software_preset = Config::get_env_string("SOFTWARE_PRESET", s.software_preset);
  s.crf = Config::get_env_int("DEFAULT_CRF", s.crf);
  s.hardware_preset = Config::get_env_string("HW_PRESET", s.hardware_preset);
  s.hardware_cq = Config::get_env_int("HW_CQ", s.hardware_cq);
  s.hardware_maxrate = Config::get_env_string("HW_MAXRATE", s.hardware_maxrate);
  s.hardware_bufsize = Config::get_env_string("HW_BUFSIZE", s.hardware_bufsize);
  s.encode_profile =
      to_lower(Config::get_env_string("ENCODE_PROFILE", s.encode_profile));
  s.audio_bitrate = Config::get_env_string("AUDIO_BITRATE", s.audio_bitrate);
  s.audio_channels = positive(
      "AUDIO_CHANNELS", Config::get_env_int("AUDIO_CHANNELS", s.audio_channels));
  return s;
}

AppConfig load_app_config() {
  AppConfig c;
  c.profile = load_target_profile();
  c.encoder = load_encoder_settings();
  c.ffmpeg_binary = Config::ffmpeg_binary();
  c.ffprobe_binary = Config::ffprobe_binary();
  c.use_hardware = Config::use_hardware_encoder();
  c.kill_grace_ms =
      positive("KILL_GRACE_MS", Config::get_env_int("KILL_GRACE_MS", c.kill_grace_ms));
  c.originals = parse_originals_policy(
      Config::get_env_string("ORIGINALS_POLICY", to_string(c.originals)));
  c.skip_existing = Config::get_env_bool("SKIP_EXISTING", c.skip_existing);

  c.media_extensions = Config::get_env_list("MEDIA_EXTENSIONS", c.media_extensions);
  for (auto &ext : c.media_extensions) {
    ext = to_lower(ext);
    if (ext.front() != '.')
      ext.insert(ext.begin(), '.');
  }
  return c;
}

OriginalsPolicy parse_originals_policy(const std::string &text) {
  std::string v = to_lower(trim(text));
  if (v == "keep")
    return OriginalsPolicy::Keep;
  if (v == "backup")
    return OriginalsPolicy::Backup;
  if (v == "delete")
    return OriginalsPolicy::Delete;
  throw std::invalid_argument(
      fmt::format("ORIGINALS_POLICY must be keep, backup or delete (got '{}')", text));
}

const char *to_string(OriginalsPolicy policy) {
  switch (policy) {
  case OriginalsPolicy::Keep:
    return "keep";
  case OriginalsPolicy::Backup:
    return "backup";
  case OriginalsPolicy::Delete:
    return "delete";
  }
  return "keep";
}

} // namespace direct_play
