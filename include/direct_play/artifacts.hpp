/**
 * @file artifacts.hpp
 * @brief Output path derivation and scope-exit cleanup of temporary files
 *
 * @details Each encode tier writes to its own temporary file next to the
 *          final output:
 *
 *          - <outdir>/<stem>.remux.tmp<ext>
 *
 *          - <outdir>/<stem>.hw.tmp<ext>
 *
 *          - <outdir>/<stem>.sw.tmp<ext>
 *
 *          The final path only ever appears through a rename of a verified
 *          temporary file, so a partial file never sits at the final path.
 */

#ifndef DIRECT_PLAY_ARTIFACTS_HPP
#define DIRECT_PLAY_ARTIFACTS_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace direct_play {

/// <output_dir>/<input stem><extension>
std::string derive_output_path(const std::string &input_path,
                               const std::string &output_dir,
                               const std::string &extension);

/// Temporary path for one tier, in the directory of final_output
std::string temporary_path_for(const std::string &final_output,
                               Strategy strategy);

/**
 * @class ArtifactGuard
 * @brief Removes every tracked file on destruction unless committed.
 * @note Removal errors are logged, never thrown: the guard runs during stack
 *       unwinding.
 */
class ArtifactGuard {
public:
  ArtifactGuard() = default;
  ~ArtifactGuard();

  ArtifactGuard(const ArtifactGuard &) = delete;
  ArtifactGuard &operator=(const ArtifactGuard &) = delete;

  /// Remember path for cleanup (duplicates are ignored)
  void track(const std::string &path);

  /// Remove path now and stop tracking it
  void discard(const std::string &path);

  /**
   * @brief Atomically rename a tracked temporary file to its final path.
   * @return false (and a diagnostic) if the rename failed; the temporary file
   *         stays tracked and is removed by the destructor
   */
  bool commit(const std::string &tmp_path, const std::string &final_path,
              std::string &diagnostic);

  /// Remove every tracked file now
  void remove_all();

  const std::vector<std::string> &tracked() const { return paths_; }

private:
  std::vector<std::string> paths_;
};

} // namespace direct_play

#endif // DIRECT_PLAY_ARTIFACTS_HPP
