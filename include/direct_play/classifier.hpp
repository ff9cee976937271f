/**
 * @file classifier.hpp
 * @brief Playback compatibility classification against a TargetProfile
 *
 * @details Rules, applied in order, with every deficiency collected:
 *
 *          1. Container name contains one of the allowed containers
 *
 *          2. A video stream exists (only the first one is evaluated);
 *             otherwise evaluation stops with no-video-stream
 *
 *          3. Video codec, pixel format, profile and level match
 *
 *          4. Resolution fits inside the target box
 *
 *          5. Some audio stream uses the required codec
 *
 *          6. No subtitle streams, unless the profile tolerates them
 */

#ifndef DIRECT_PLAY_CLASSIFIER_HPP
#define DIRECT_PLAY_CLASSIFIER_HPP

#include "config.hpp"
#include "types.hpp"

namespace direct_play {

/**
 * @brief Convert a raw level value to tenths.
 * @note 4.1 -> 41, 41 -> 41, 5.2 -> 52. Values below 10 are decimal levels;
 *       non-positive values (ffprobe reports -99 for "unknown") give 0.
 */
int normalize_level(double raw);

/// "4.1" for 41
std::string format_level(int tenths);

/**
 * @brief Classify a description; compatible iff no issue was found.
 */
CompatibilityVerdict classify(const MediaDescription &desc,
                              const TargetProfile &profile);

/// Verdict used when the inspection itself failed: never compatible
CompatibilityVerdict probe_failed_verdict(const std::string &reason);

} // namespace direct_play

#endif // DIRECT_PLAY_CLASSIFIER_HPP
