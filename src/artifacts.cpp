/**
 * @file artifacts.cpp
 * @brief Temporary artifact naming and cleanup
 */

#include "direct_play/artifacts.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "direct_play/logging.hpp"

namespace fs = std::filesystem;

namespace direct_play {

namespace {

const char *tier_tag(Strategy strategy) {
  switch (strategy) {
  case Strategy::Remux:
    return "remux";
  case Strategy::HardwareEncode:
    return "hw";
  case Strategy::SoftwareEncode:
    return "sw";
  case Strategy::Skip:
    break;
  }
  return "tmp";
}

} // anonymous namespace

std::string derive_output_path(const std::string &input_path,
                               const std::string &output_dir,
                               const std::string &extension) {
  fs::path stem = fs::path(input_path).stem();
  return (fs::path(output_dir) / (stem.string() + extension)).string();
}

std::string temporary_path_for(const std::string &final_output,
                               Strategy strategy) {
  fs::path out(final_output);
  std::string name = fmt::format("{}.{}.tmp{}", out.stem().string(),
                                 tier_tag(strategy), out.extension().string());
  return (out.parent_path() / name).string();
}

// **---- ArtifactGuard ----**

ArtifactGuard::~ArtifactGuard() { remove_all(); }

void ArtifactGuard::track(const std::string &path) {
  if (std::find(paths_.begin(), paths_.end(), path) == paths_.end())
    paths_.push_back(path);
}

void ArtifactGuard::discard(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec)
    LOG_WARN("Could not remove {}: {}", path, ec.message());
  paths_.erase(std::remove(paths_.begin(), paths_.end(), path), paths_.end());
}

bool ArtifactGuard::commit(const std::string &tmp_path,
                           const std::string &final_path,
                           std::string &diagnostic) {
  std::error_code ec;
  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    diagnostic = fmt::format("cannot move {} to {}: {}", tmp_path, final_path,
                             ec.message());
    return false;
  }
  paths_.erase(std::remove(paths_.begin(), paths_.end(), tmp_path),
               paths_.end());
  return true;
}

void ArtifactGuard::remove_all() {
  for (const auto &path : paths_) {
    std::error_code ec;
    if (fs::remove(path, ec))
      LOG_DEBUG("Removed artifact {}", path);
    else if (ec)
      LOG_WARN("Could not remove {}: {}", path, ec.message());
  }
  paths_.clear();
}

} // namespace direct_play
