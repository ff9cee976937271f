/**
 * @file system.hpp
 * @brief System utilities: interrupt handling, file discovery, formatting
 *
 * @details Provides:
 *
 *          - SIGINT/SIGTERM handlers that set a CancellationToken
 *
 *          - Media file discovery by extension
 *
 *          - Time formatting utilities
 *
 * @note Handlers are installed without SA_RESTART so that a pending poll()
 *       or waitpid() returns EINTR and the token is checked right away.
 */

#ifndef DIRECT_PLAY_SYSTEM_HPP
#define DIRECT_PLAY_SYSTEM_HPP

#include <string>
#include <vector>

namespace direct_play {

class CancellationToken;

// **---- Interrupt Handling ----**

/**
 * @brief Route SIGINT and SIGTERM to token.request_cancel().
 * @note The token must outlive the process (typically a static in main).
 */
void install_interrupt_handlers(CancellationToken &token);

/// Signal number that triggered cancellation, 0 if none
int interrupt_signal();

// **---- File Discovery ----**

/// Lower-cased extension of path including the dot, "" if none
std::string lower_extension(const std::string &path);

bool is_media_file(const std::string &path,
                   const std::vector<std::string> &extensions);

/**
 * @brief Regular files in dir with a recognized extension, sorted by path.
 * @throws std::filesystem::filesystem_error if dir cannot be listed
 */
std::vector<std::string>
collect_media_files(const std::string &dir,
                    const std::vector<std::string> &extensions);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

} // namespace direct_play

#endif // DIRECT_PLAY_SYSTEM_HPP
