/**
 * @file media_probe.cpp
 * @brief ffprobe JSON decoding and libavformat duration query
 */

#include "direct_play/media_probe.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/log.h>
}

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "direct_play/cancellation.hpp"
#include "direct_play/errors.hpp"
#include "direct_play/logging.hpp"
#include "direct_play/process.hpp"

namespace direct_play {

using json = nlohmann::json;

namespace {

StreamKind kind_from_codec_type(const std::string &type) {
  if (type == "video")
    return StreamKind::Video;
  if (type == "audio")
    return StreamKind::Audio;
  if (type == "subtitle")
    return StreamKind::Subtitle;
  return StreamKind::Other;
}

std::string string_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  return (it != obj.end() && it->is_string()) ? it->get<std::string>() : "";
}

int int_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  return (it != obj.end() && it->is_number_integer()) ? it->get<int>() : 0;
}

/// Number, or a string holding one ("41", "4.1", "N/A")
std::optional<double> number_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end())
    return std::nullopt;
  if (it->is_number())
    return it->get<double>();
  if (it->is_string()) {
    try {
      return std::stod(it->get<std::string>());
    } catch (const std::logic_error &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

Stream parse_stream(const json &s, int position) {
  Stream st;
  auto idx = s.find("index");
  st.index = (idx != s.end() && idx->is_number_integer()) ? idx->get<int>()
                                                          : position;
  st.kind = kind_from_codec_type(string_field(s, "codec_type"));
  st.codec_name = string_field(s, "codec_name");

  if (st.kind == StreamKind::Video) {
    st.profile = string_field(s, "profile");
    st.pix_fmt = string_field(s, "pix_fmt");
    st.level = number_field(s, "level");
    st.width = int_field(s, "width");
    st.height = int_field(s, "height");
  }

  auto tags = s.find("tags");
  if (tags != s.end() && tags->is_object())
    st.language = string_field(*tags, "language");
  return st;
}

} // anonymous namespace

MediaDescription parse_probe_output(const std::string &json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error &e) {
    throw ProbeError(fmt::format("unparseable probe output: {}", e.what()));
  }

  if (!root.is_object())
    throw ProbeError("probe output is not a JSON object");

  auto streams = root.find("streams");
  if (streams == root.end() || !streams->is_array())
    throw ProbeError("probe output has no stream list");

  MediaDescription desc;
  int position = 0;
  for (const auto &s : *streams) {
    if (s.is_object())
      desc.streams.push_back(parse_stream(s, position));
    ++position;
  }

  auto format = root.find("format");
  if (format != root.end() && format->is_object()) {
    desc.format_name = string_field(*format, "format_name");
    auto d = number_field(*format, "duration");
    if (d && *d > 0)
      desc.duration = d;
  }
  return desc;
}

// **---- FfprobeInspector ----**

MediaDescription FfprobeInspector::probe(const std::string &path,
                                         const CancellationToken &token) {
  std::vector<std::string> argv{ffprobe_binary_, "-v",           "error",
                                "-show_streams",  "-show_format", "-of",
                                "json",           path};

  CapturedOutput result;
  try {
    result = run_capture(argv, token, grace_);
  } catch (const SpawnError &e) {
    throw ProbeError(fmt::format("cannot start {}: {}", ffprobe_binary_,
                                 e.what()));
  }

  if (result.exit_code != 0) {
    std::string detail = result.err.empty()
                             ? fmt::format("exit code {}", result.exit_code)
                             : result.err;
    throw ProbeError(fmt::format("{} failed: {}", ffprobe_binary_, detail));
  }
  return parse_probe_output(result.out);
}

std::optional<double> FfprobeInspector::duration(const std::string &path) {
  AVFormatContext *fmt_ctx = nullptr;

  int saved_level = av_log_get_level();
  av_log_set_level(AV_LOG_QUIET);
  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret >= 0)
    ret = avformat_find_stream_info(fmt_ctx, nullptr);
  av_log_set_level(saved_level);

  std::optional<double> result;
  if (ret >= 0 && fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0)
    result = fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);
  else
    LOG_DEBUG("Duration unknown for {}, progress disabled", path);

  /// Safe on a null or partially opened context
  avformat_close_input(&fmt_ctx);
  return result;
}

} // namespace direct_play
