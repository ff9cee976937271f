#include <gtest/gtest.h>

#include <csignal>

#include "direct_play/artifacts.hpp"
#include "direct_play/cancellation.hpp"
#include "direct_play/config.hpp"
#include "direct_play/hardware.hpp"
#include "direct_play/system.hpp"
#include "test_support.hpp"

using namespace direct_play;
using namespace direct_play::test_support;

// **---- File discovery ----**

TEST(FileDiscoveryTest, CollectsRecognizedFilesSorted) {
  TempDir dir;
  dir.touch("b.MKV");
  dir.touch("a.mp4");
  dir.touch("notes.txt");
  dir.touch("c.ts");
  dir.touch("nested/d.mp4");
  fs::create_directories(dir.path() / "folder.mp4");

  AppConfig config;
  auto files = collect_media_files(dir.path().string(), config.media_extensions);

  std::vector<std::string> names;
  for (const auto &f : files)
    names.push_back(fs::path(f).filename().string());
  EXPECT_EQ(names, (std::vector<std::string>{"a.mp4", "b.MKV", "c.ts"}));
}

TEST(FileDiscoveryTest, MissingDirectoryThrows) {
  EXPECT_THROW(collect_media_files("/nonexistent/direct_play", {".mp4"}),
               fs::filesystem_error);
}

TEST(FileDiscoveryTest, ExtensionIsLowerCased) {
  EXPECT_EQ(lower_extension("/x/Movie.M4V"), ".m4v");
  EXPECT_EQ(lower_extension("/x/README"), "");
  EXPECT_FALSE(is_media_file("/x/README", {".mp4"}));
}

TEST(FormatTimeTest, FormatsHoursMinutesSeconds) {
  EXPECT_EQ(format_time(0), "00:00:00");
  EXPECT_EQ(format_time(3723.9), "01:02:03");
  EXPECT_EQ(format_time(-4), "00:00:00");
}

// **---- Artifacts ----**

TEST(ArtifactPathTest, OutputIsStemPlusExtension) {
  EXPECT_EQ(derive_output_path("/in/My Movie.mkv", "/out", ".mp4"),
            "/out/My Movie.mp4");
}

TEST(ArtifactPathTest, EachTierHasItsOwnTemporaryFile) {
  EXPECT_EQ(temporary_path_for("/out/movie.mp4", Strategy::Remux),
            "/out/movie.remux.tmp.mp4");
  EXPECT_EQ(temporary_path_for("/out/movie.mp4", Strategy::HardwareEncode),
            "/out/movie.hw.tmp.mp4");
  EXPECT_EQ(temporary_path_for("/out/movie.mp4", Strategy::SoftwareEncode),
            "/out/movie.sw.tmp.mp4");
}

TEST(ArtifactGuardTest, RemovesTrackedFilesAtScopeExit) {
  TempDir dir;
  std::string a = dir.touch("a.tmp.mp4");
  std::string b = dir.touch("b.tmp.mp4");
  {
    ArtifactGuard guard;
    guard.track(a);
    guard.track(b);
    guard.track(a);
    EXPECT_EQ(guard.tracked().size(), 2u);
  }
  EXPECT_FALSE(fs::exists(a));
  EXPECT_FALSE(fs::exists(b));
}

TEST(ArtifactGuardTest, CommittedFileSurvives) {
  TempDir dir;
  std::string tmp = dir.touch("movie.sw.tmp.mp4", "encoded");
  std::string final_path = (dir.path() / "movie.mp4").string();
  {
    ArtifactGuard guard;
    guard.track(tmp);
    std::string diagnostic;
    EXPECT_TRUE(guard.commit(tmp, final_path, diagnostic));
    EXPECT_TRUE(guard.tracked().empty());
  }
  EXPECT_FALSE(fs::exists(tmp));
  EXPECT_EQ(read_file(final_path), "encoded");
}

TEST(ArtifactGuardTest, FailedCommitKeepsTrackingAndReports) {
  TempDir dir;
  std::string tmp = dir.touch("movie.hw.tmp.mp4");
  {
    ArtifactGuard guard;
    guard.track(tmp);
    std::string diagnostic;
    EXPECT_FALSE(guard.commit(tmp, "/nonexistent/dir/movie.mp4", diagnostic));
    EXPECT_FALSE(diagnostic.empty());
  }
  EXPECT_FALSE(fs::exists(tmp));
}

TEST(ArtifactGuardTest, MissingFileIsNotAnError) {
  TempDir dir;
  ArtifactGuard guard;
  guard.track((dir.path() / "never-written.mp4").string());
  guard.remove_all();
  EXPECT_TRUE(guard.tracked().empty());
}

// **---- Hardware ----**

TEST(HardwareTest, FamilyFollowsEncoderSuffix) {
  EXPECT_EQ(encoder_family("h264_nvenc"), EncoderFamily::Nvenc);
  EXPECT_EQ(encoder_family("hevc_videotoolbox"), EncoderFamily::VideoToolbox);
  EXPECT_EQ(encoder_family("libx264"), EncoderFamily::Software);
}

TEST(HardwareTest, DisabledDetectionReportsNothing) {
  auto hw = detect_hardware_encoder("h264", false);
  EXPECT_FALSE(hw.enabled);
  EXPECT_FALSE(hw.available);
  EXPECT_FALSE(hw.usable());
  EXPECT_TRUE(hw.encoder.empty());
}

TEST(HardwareTest, UnknownCodecHasNoHardwareEncoder) {
  auto hw = detect_hardware_encoder("no_such_codec", true);
  EXPECT_TRUE(hw.enabled);
  EXPECT_FALSE(hw.usable());
}

// **---- Interrupts ----**

TEST(InterruptTest, SignalSetsTheToken) {
  static CancellationToken token;
  install_interrupt_handlers(token);

  std::raise(SIGTERM);
  EXPECT_TRUE(token.is_cancelled());
  EXPECT_EQ(interrupt_signal(), SIGTERM);
  EXPECT_THROW(token.throw_if_cancelled("testing"), CancelledError);

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}
