/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Two layers:
 *
 *          - Config namespace: lazy-initialized, memoized process-level knobs
 *            (binaries, logging, hardware switch) read from the environment.
 *
 *          - AppConfig: an immutable snapshot of everything a transcode needs
 *            (target profile, encoder settings, policies), built once by
 *            load_app_config() and handed to each component at construction.
 *
 *          See config/direct_play.env for the documentation of each variable.
 */

#ifndef DIRECT_PLAY_CONFIG_HPP
#define DIRECT_PLAY_CONFIG_HPP

#include <cstdlib>
#include <string>
#include <vector>

namespace direct_play {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 * @throws std::invalid_argument if the value is not numeric
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @throws std::invalid_argument if the value is not numeric
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/// String value, default if unset or empty
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// Boolean value: "0", "false", "no", "off" are false, anything else true
bool get_env_bool(const char *name, bool default_val);

/// Comma separated list, entries trimmed, empty entries dropped
std::vector<std::string> get_env_list(const char *name,
                                      const std::vector<std::string> &default_val);

/// Path or name of the ffmpeg binary
inline const std::string &ffmpeg_binary() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Path or name of the ffprobe binary
inline const std::string &ffprobe_binary() {
  static std::string val = get_env_string("FFPROBE_BIN", "ffprobe");
  return val;
}

/**
 * @brief Whether hardware encoders may be used at all
 * @note When false, hardware detection is skipped entirely.
 */
inline bool use_hardware_encoder() {
  static bool val = get_env_bool("USE_HARDWARE_ENCODER", true);
  return val;
}

/// Enable LOG_DEBUG output (ffmpeg command lines, progress keys)
inline bool log_verbose() {
  static bool val = get_env_bool("LOG_VERBOSE", false);
  return val;
}

} // namespace Config

// **---- TARGET PROFILE ----**

/**
 * @struct TargetProfile
 * @brief What a file must look like to play without transcoding.
 * @note Defaults describe H.264 High@4.1 / yuv420p / AAC in MP4, up to 4K.
 */
struct TargetProfile {
  std::vector<std::string> allowed_containers{"mp4", "mov"};
  std::string video_codec{"h264"};
  std::string pixel_format{"yuv420p"};
  std::vector<std::string> allowed_profiles{"baseline", "main", "high"};
  int max_level = 41; //< Tenths: 41 = level 4.1
  int max_width = 3840;
  int max_height = 2160;
  std::string audio_codec{"aac"};
  bool tolerate_embedded_subtitles = false;

  std::string output_container{"mp4"};  //< ffmpeg muxer name
  std::string output_extension{".mp4"};
};

// **---- ENCODER SETTINGS ----**

/**
 * @struct EncoderSettings
 * @brief Quality and rate-control parameters for each encode tier.
 */
struct EncoderSettings {
  std::string software_encoder{"libx264"};
  std::string software_preset{"slow"};
  int crf = 18; //< libx264 CRF: lower is higher quality

  std::string hardware_preset{"p4"};
  int hardware_cq = 19; //< NVENC CQ / VideoToolbox q:v target
  std::string hardware_maxrate{"12M"};
  std::string hardware_bufsize{"24M"};

  std::string encode_profile{"high"}; //< -profile:v for encoded output

  std::string audio_bitrate{"128k"};
  int audio_channels = 2;
};

// **---- APPLICATION CONFIG ----**

/// What to do with a source file once its transcode succeeded
enum class OriginalsPolicy { Keep, Backup, Delete };

/**
 * @struct AppConfig
 * @brief Immutable configuration snapshot passed into each component.
 */
struct AppConfig {
  TargetProfile profile;
  EncoderSettings encoder;

  std::string ffmpeg_binary{"ffmpeg"};
  std::string ffprobe_binary{"ffprobe"};
  bool use_hardware = true;

  int kill_grace_ms = 2000; //< SIGTERM -> SIGKILL grace on cancellation
  OriginalsPolicy originals = OriginalsPolicy::Keep;
  bool skip_existing = true;

  std::vector<std::string> media_extensions{".mp4", ".mkv", ".mov", ".avi",
                                            ".m4v", ".webm", ".ts"};
};

/**
 * @brief Build the target profile from TARGET_* variables.
 * @throws std::invalid_argument on unparseable numeric values
 */
TargetProfile load_target_profile();

/**
 * @brief Build encoder settings from the quality/rate variables.
 * @throws std::invalid_argument on unparseable numeric values
 */
EncoderSettings load_encoder_settings();

/**
 * @brief Build the full application config.
 * @throws std::invalid_argument on unparseable or out-of-range values
 */
AppConfig load_app_config();

OriginalsPolicy parse_originals_policy(const std::string &text);
const char *to_string(OriginalsPolicy policy);

} // namespace direct_play

#endif // DIRECT_PLAY_CONFIG_HPP
