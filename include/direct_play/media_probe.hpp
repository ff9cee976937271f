/**
 * @file media_probe.hpp
 * @brief Media inspection: stream and container metadata of one file
 *
 * @details Two sources are used:
 *
 *          - ffprobe (-show_streams -show_format -of json) for the stream
 *            list the classifier evaluates
 *
 *          - libavformat for the container duration the progress monitor
 *            needs, without a second process
 *
 *          The MediaInspector interface is the seam the orchestrator depends
 *          on, so tests can replace the external tools.
 */

#ifndef DIRECT_PLAY_MEDIA_PROBE_HPP
#define DIRECT_PLAY_MEDIA_PROBE_HPP

#include <chrono>
#include <optional>
#include <string>

#include "types.hpp"

namespace direct_play {

class CancellationToken;

/**
 * @brief Decode ffprobe's JSON document into a MediaDescription.
 * @note Absent optional fields stay at their defaults; a level may be given
 *       as number or string, the format duration as string or number.
 * @throws ProbeError if the text is not JSON or has no "streams" array
 */
MediaDescription parse_probe_output(const std::string &json_text);

/**
 * @class MediaInspector
 * @brief Source of media metadata.
 */
class MediaInspector {
public:
  virtual ~MediaInspector() = default;

  /**
   * @brief Describe every stream of the file.
   * @throws ProbeError, CancelledError
   */
  virtual MediaDescription probe(const std::string &path,
                                 const CancellationToken &token) = 0;

  /// Container duration in seconds, nullopt if unknown
  virtual std::optional<double> duration(const std::string &path) = 0;
};

/**
 * @class FfprobeInspector
 * @brief MediaInspector backed by the ffprobe binary and libavformat.
 */
class FfprobeInspector : public MediaInspector {
public:
  FfprobeInspector(std::string ffprobe_binary, std::chrono::milliseconds grace)
      : ffprobe_binary_(std::move(ffprobe_binary)), grace_(grace) {}

  MediaDescription probe(const std::string &path,
                         const CancellationToken &token) override;

  std::optional<double> duration(const std::string &path) override;

private:
  std::string ffprobe_binary_;
  std::chrono::milliseconds grace_;
};

} // namespace direct_play

#endif // DIRECT_PLAY_MEDIA_PROBE_HPP
