/**
 * @file hardware.hpp
 * @brief Hardware encoder detection through libavcodec / libavutil
 *
 * @details For the target codec (e.g. h264) the candidates are tried in
 *          order:
 *
 *          - <codec>_nvenc on a CUDA device
 *
 *          - <codec>_videotoolbox on a VideoToolbox device
 *
 *          An encoder counts as available only if libavcodec knows it AND a
 *          device context of its type can actually be created on this host.
 */

#ifndef DIRECT_PLAY_HARDWARE_HPP
#define DIRECT_PLAY_HARDWARE_HPP

#include <string>

namespace direct_play {

/**
 * @struct HardwareCapability
 * @brief Detected hardware encoder and whether configuration allows it.
 */
struct HardwareCapability {
  std::string encoder;     //< ffmpeg encoder name, empty if none
  std::string description; //< Human readable, for the startup banner
  bool available = false;  //< Encoder present and device opened
  bool enabled = false;    //< Hardware use permitted by configuration

  bool usable() const { return available && enabled; }
};

/// Encoder family, derived from the encoder name suffix
enum class EncoderFamily { Software, Nvenc, VideoToolbox };

EncoderFamily encoder_family(const std::string &encoder);

/**
 * @brief Probe this host for a hardware encoder of video_codec.
 * @param enabled When false, detection is skipped and nothing is reported
 *        available.
 */
HardwareCapability detect_hardware_encoder(const std::string &video_codec,
                                           bool enabled);

} // namespace direct_play

#endif // DIRECT_PLAY_HARDWARE_HPP
