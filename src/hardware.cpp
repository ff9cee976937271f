/**
 * @file hardware.cpp
 * @brief Hardware encoder detection implementation
 */

#include "direct_play/hardware.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/buffer.h>
#include <libavutil/hwcontext.h>
#include <libavutil/log.h>
}

#include <fmt/core.h>

#include "direct_play/logging.hpp"

namespace direct_play {

namespace {

struct Candidate {
  const char *suffix;
  AVHWDeviceType device;
  const char *vendor;
};

constexpr Candidate CANDIDATES[] = {
    {"_nvenc", AV_HWDEVICE_TYPE_CUDA, "NVIDIA NVENC"},
    {"_videotoolbox", AV_HWDEVICE_TYPE_VIDEOTOOLBOX, "Apple VideoToolbox"},
};

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Try to open a device of this type; the context is released right away
bool device_opens(AVHWDeviceType type) {
  AVBufferRef *device_ctx = nullptr;
  int ret = av_hwdevice_ctx_create(&device_ctx, type, nullptr, nullptr, 0);
  if (ret < 0)
    return false;
  av_buffer_unref(&device_ctx);
  return true;
}

} // anonymous namespace

EncoderFamily encoder_family(const std::string &encoder) {
  if (ends_with(encoder, "_nvenc"))
    return EncoderFamily::Nvenc;
  if (ends_with(encoder, "_videotoolbox"))
    return EncoderFamily::VideoToolbox;
  return EncoderFamily::Software;
}

HardwareCapability detect_hardware_encoder(const std::string &video_codec,
                                           bool enabled) {
  HardwareCapability cap;
  cap.enabled = enabled;
  cap.description = "Software";

  if (!enabled) {
    LOG_INFO("Hardware encoding disabled by configuration");
    return cap;
  }

  /// Device probing is chatty on hosts without the hardware
  int saved_level = av_log_get_level();
  av_log_set_level(AV_LOG_QUIET);

  for (const auto &c : CANDIDATES) {
    std::string name = video_codec + c.suffix;
    if (!avcodec_find_encoder_by_name(name.c_str())) {
      LOG_DEBUG("Encoder {} not built into libavcodec", name);
      continue;
    }
    if (!device_opens(c.device)) {
      LOG_DEBUG("Encoder {} present but no {} device", name,
                av_hwdevice_get_type_name(c.device));
      continue;
    }
    cap.encoder = name;
    cap.description = fmt::format("{} ({})", c.vendor, name);
    cap.available = true;
    break;
  }

  av_log_set_level(saved_level);
  return cap;
}

} // namespace direct_play
