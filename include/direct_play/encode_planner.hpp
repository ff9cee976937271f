/**
 * @file encode_planner.hpp
 * @brief Strategy selection: skip, remux, hardware or software encode
 *
 * @details Pure functions: no I/O, no process is spawned. The resulting
 *          EncodePlan carries options only; ffmpeg_command.hpp turns it into
 *          an argument vector.
 */

#ifndef DIRECT_PLAY_ENCODE_PLANNER_HPP
#define DIRECT_PLAY_ENCODE_PLANNER_HPP

#include "config.hpp"
#include "hardware.hpp"
#include "types.hpp"

namespace direct_play {

/**
 * @brief Pick the cheapest strategy that makes the file compatible.
 *
 * @attention DECISION:
 *
 *   - no issues                        -> skip
 *
 *   - only container issues            -> remux (stream copy)
 *
 *   - anything else                    -> hw-encode if hw.usable(),
 *                                         else sw-encode
 */
EncodePlan plan_encode(const MediaDescription &desc,
                       const CompatibilityVerdict &verdict,
                       const TargetProfile &profile,
                       const HardwareCapability &hw,
                       const EncoderSettings &settings);

/**
 * @brief Forced software-encode plan used by the retry tier.
 */
EncodePlan plan_software_fallback(const MediaDescription &desc,
                                  const TargetProfile &profile,
                                  const EncoderSettings &settings);

/// True if the first video stream exceeds the profile's box
bool needs_scaling(const MediaDescription &desc, const TargetProfile &profile);

} // namespace direct_play

#endif // DIRECT_PLAY_ENCODE_PLANNER_HPP
