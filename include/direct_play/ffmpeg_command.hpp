/**
 * @file ffmpeg_command.hpp
 * @brief EncodePlan -> ffmpeg argument vector
 *
 * @details Every command:
 *
 *          - maps the first video stream and all audio streams explicitly,
 *            or only the target-codec audio streams when audio is copied
 *            (subtitles are dropped by the remapping unless tolerated)
 *
 *          - writes a fast-start container of the profile's output format
 *
 *          - streams key=value progress on stdout (-progress pipe:1)
 */

#ifndef DIRECT_PLAY_FFMPEG_COMMAND_HPP
#define DIRECT_PLAY_FFMPEG_COMMAND_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace direct_play {

/**
 * @brief Downscale filter that preserves aspect ratio with even dimensions.
 * @note The constrained side is set to the box edge; the other is -2 so the
 *       scaler rounds it to a multiple of two (4:2:0 chroma needs even sizes).
 */
std::string scale_filter(int max_width, int max_height);

/**
 * @brief Build the full argument vector (argv[0] = ffmpeg binary).
 * @pre plan.strategy != Strategy::Skip
 */
std::vector<std::string> build_ffmpeg_args(const EncodePlan &plan,
                                           const std::string &input_path,
                                           const std::string &output_path,
                                           const AppConfig &config);

/// Shell-style rendering for logs only, never executed
std::string render_command(const std::vector<std::string> &args);

} // namespace direct_play

#endif // DIRECT_PLAY_FFMPEG_COMMAND_HPP
