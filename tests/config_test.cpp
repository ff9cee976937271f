#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "direct_play/config.hpp"

using namespace direct_play;

namespace {

const char *const VARIABLES[] = {
    "TARGET_CONTAINERS", "TARGET_VIDEO_CODEC", "TARGET_PIX_FMT",
    "TARGET_PROFILES",   "TARGET_MAX_LEVEL",   "TARGET_MAX_WIDTH",
    "TARGET_MAX_HEIGHT", "TARGET_AUDIO_CODEC", "TOLERATE_SUBTITLES",
    "SOFTWARE_ENCODER",  "SOFTWARE_PRESET",    "DEFAULT_CRF",
    "HW_CQ",             "HW_PRESET",          "HW_MAXRATE",
    "HW_BUFSIZE",        "AUDIO_BITRATE",      "AUDIO_CHANNELS",
    "ENCODE_PROFILE",    "KILL_GRACE_MS",      "ORIGINALS_POLICY",
    "SKIP_EXISTING",     "MEDIA_EXTENSIONS"};

} // namespace

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const char *name : VARIABLES)
      unsetenv(name);
  }
};

TEST_F(ConfigTest, DefaultsMatchTheStandardProfile) {
  AppConfig c = load_app_config();
  EXPECT_EQ(c.profile.allowed_containers,
            (std::vector<std::string>{"mp4", "mov"}));
  EXPECT_EQ(c.profile.video_codec, "h264");
  EXPECT_EQ(c.profile.pixel_format, "yuv420p");
  EXPECT_EQ(c.profile.max_level, 41);
  EXPECT_EQ(c.profile.max_width, 3840);
  EXPECT_EQ(c.profile.max_height, 2160);
  EXPECT_EQ(c.profile.audio_codec, "aac");
  EXPECT_FALSE(c.profile.tolerate_embedded_subtitles);
  EXPECT_EQ(c.encoder.crf, 18);
  EXPECT_EQ(c.encoder.hardware_maxrate, "12M");
  EXPECT_EQ(c.kill_grace_ms, 2000);
  EXPECT_EQ(c.originals, OriginalsPolicy::Keep);
  EXPECT_TRUE(c.skip_existing);
}

TEST_F(ConfigTest, LevelAcceptsDecimalOrTenths) {
  setenv("TARGET_MAX_LEVEL", "5.1", 1);
  EXPECT_EQ(load_target_profile().max_level, 51);
  setenv("TARGET_MAX_LEVEL", "42", 1);
  EXPECT_EQ(load_target_profile().max_level, 42);
}

TEST_F(ConfigTest, ListsAreTrimmedAndNormalized) {
  setenv("TARGET_PROFILES", " High , MAIN,,", 1);
  setenv("MEDIA_EXTENSIONS", "MKV, .Mp4", 1);
  AppConfig c = load_app_config();
  EXPECT_EQ(c.profile.allowed_profiles,
            (std::vector<std::string>{"high", "main"}));
  EXPECT_EQ(c.media_extensions, (std::vector<std::string>{".mkv", ".mp4"}));
}

TEST_F(ConfigTest, BooleansAcceptCommonSpellings) {
  setenv("TOLERATE_SUBTITLES", "yes", 1);
  setenv("SKIP_EXISTING", "Off", 1);
  AppConfig c = load_app_config();
  EXPECT_TRUE(c.profile.tolerate_embedded_subtitles);
  EXPECT_FALSE(c.skip_existing);
}

TEST_F(ConfigTest, EmptyValueMeansDefault) {
  setenv("DEFAULT_CRF", "", 1);
  EXPECT_EQ(load_encoder_settings().crf, 18);
}

TEST_F(ConfigTest, EncoderSettingsAreOverridable) {
  setenv("DEFAULT_CRF", "22", 1);
  setenv("HW_MAXRATE", "8M", 1);
  setenv("ENCODE_PROFILE", "Main", 1);
  EncoderSettings s = load_encoder_settings();
  EXPECT_EQ(s.crf, 22);
  EXPECT_EQ(s.hardware_maxrate, "8M");
  EXPECT_EQ(s.encode_profile, "main");
}

TEST_F(ConfigTest, NonNumericValueIsRejected) {
  setenv("TARGET_MAX_WIDTH", "wide", 1);
  EXPECT_THROW(load_app_config(), std::invalid_argument);
}

TEST_F(ConfigTest, NonPositiveValueIsRejected) {
  setenv("KILL_GRACE_MS", "0", 1);
  EXPECT_THROW(load_app_config(), std::invalid_argument);
  setenv("KILL_GRACE_MS", "1500", 1);
  EXPECT_EQ(load_app_config().kill_grace_ms, 1500);
}

TEST_F(ConfigTest, OriginalsPolicyIsParsed) {
  EXPECT_EQ(parse_originals_policy("Backup"), OriginalsPolicy::Backup);
  EXPECT_EQ(parse_originals_policy(" delete "), OriginalsPolicy::Delete);
  EXPECT_THROW(parse_originals_policy("shred"), std::invalid_argument);

  setenv("ORIGINALS_POLICY", "shred", 1);
  EXPECT_THROW(load_app_config(), std::invalid_argument);
}
