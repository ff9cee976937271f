/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation token
 *
 * @details The token is set from a signal handler (see system.hpp) or from
 *          another thread, and checked at every blocking point: pipe reads,
 *          process waits and between pipeline stages.
 */

#ifndef DIRECT_PLAY_CANCELLATION_HPP
#define DIRECT_PLAY_CANCELLATION_HPP

#include <atomic>
#include <string>

#include "errors.hpp"

namespace direct_play {

class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /// Async-signal-safe: a lock-free atomic store
  void request_cancel() noexcept { cancelled_.store(true); }

  bool is_cancelled() const noexcept { return cancelled_.load(); }

  /**
   * @brief Throw CancelledError if cancellation was requested.
   * @param where Suspension point name, used in the exception message
   */
  void throw_if_cancelled(const char *where) const {
    if (is_cancelled())
      throw CancelledError(std::string("cancelled while ") + where);
  }

  void reset() noexcept { cancelled_.store(false); }

private:
  std::atomic<bool> cancelled_{false};
  static_assert(std::atomic<bool>::is_always_lock_free,
                "cancellation flag must be usable from a signal handler");
};

} // namespace direct_play

#endif // DIRECT_PLAY_CANCELLATION_HPP
