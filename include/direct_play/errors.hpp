/**
 * @file errors.hpp
 * @brief Exception types crossing component boundaries
 *
 * @details Only failures that must leave the component that saw them are
 *          exceptions. Encoder exit codes and verification misses are plain
 *          values handled by the orchestrator's retry tier.
 */

#ifndef DIRECT_PLAY_ERRORS_HPP
#define DIRECT_PLAY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace direct_play {

/// Inspection failed or produced output that is not structured metadata
class ProbeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// pipe()/fork() failed before the external program could start
class SpawnError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Raised at a suspension point once cancellation was requested.
 * @note Must always propagate to the batch driver; never swallowed.
 */
class CancelledError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace direct_play

#endif // DIRECT_PLAY_ERRORS_HPP
