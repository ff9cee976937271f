#include <gtest/gtest.h>

#include "direct_play/batch_processor.hpp"
#include "direct_play/orchestrator.hpp"
#include "test_support.hpp"

using namespace direct_play;
using namespace direct_play::test_support;

class BatchProcessorTest : public ::testing::Test {
protected:
  void SetUp() override {
    in_dir = dir.path() / "in";
    out_dir = dir.path() / "out";
    fs::create_directories(in_dir);
    fs::create_directories(out_dir);
  }

  std::string add_input(const std::string &name, MediaDescription desc) {
    std::string path = dir.touch("in/" + name);
    inspector.by_path[path] = std::move(desc);
    return path;
  }

  BatchTally process(const std::vector<std::string> &files) {
    TranscodeOrchestrator orchestrator(config, inspector, runner, hw);
    BatchProcessor processor(config, orchestrator);
    BatchTally tally = processor.process(files, out_dir.string(), token);
    outcomes = processor.outcomes();
    return tally;
  }

  TempDir dir;
  fs::path in_dir;
  fs::path out_dir;
  AppConfig config;
  FakeInspector inspector;
  FakeRunner runner;
  CancellationToken token;
  HardwareCapability hw{"h264_nvenc", "NVIDIA NVENC (h264_nvenc)", true, true};
  std::vector<TranscodeOutcome> outcomes;
};

TEST_F(BatchProcessorTest, TalliesEveryOutcome) {
  std::vector<std::string> files{
      add_input("a.mp4", compatible_mp4()),
      add_input("b.mkv", h264_mkv()),
      add_input("c.mkv", hevc_4k_mkv()),
  };
  auto tally = process(files);

  EXPECT_EQ(tally.total(), 3);
  EXPECT_EQ(tally.skipped, 1);
  EXPECT_EQ(tally.remuxed, 1);
  EXPECT_EQ(tally.hw_encoded, 1);
  EXPECT_EQ(tally.failed, 0);
  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_EQ(outcomes[1].output_path, (out_dir / "b.mp4").string());
  EXPECT_EQ(list_names(out_dir), (std::vector<std::string>{"b.mp4", "c.mp4"}));
}

TEST_F(BatchProcessorTest, FailureDoesNotStopTheBatch) {
  /// Hardware and software tiers of the first encode both fail
  runner.exit_codes = {1, 1, 0};
  std::vector<std::string> files{
      add_input("a.mkv", hevc_4k_mkv()),
      add_input("b.mkv", h264_mkv()),
  };
  auto tally = process(files);

  EXPECT_EQ(tally.failed, 1);
  EXPECT_EQ(tally.remuxed, 1);
  EXPECT_EQ(tally.count(OutcomeState::Failed), 1);
  EXPECT_EQ(list_names(out_dir), std::vector<std::string>{"b.mp4"});
}

TEST_F(BatchProcessorTest, ExistingOutputIsSkipped) {
  auto file = add_input("b.mkv", h264_mkv());
  write_file(out_dir / "b.mp4", "previous run");

  auto tally = process({file});
  EXPECT_EQ(tally.skipped, 1);
  EXPECT_TRUE(runner.calls.empty());
  EXPECT_EQ(read_file(out_dir / "b.mp4"), "previous run");
}

TEST_F(BatchProcessorTest, ExistingOutputIsReplacedWhenNotSkipping) {
  config.skip_existing = false;
  auto file = add_input("b.mkv", h264_mkv());
  write_file(out_dir / "b.mp4", "previous run");

  auto tally = process({file});
  EXPECT_EQ(tally.remuxed, 1);
  EXPECT_EQ(read_file(out_dir / "b.mp4"), "encoded");
}

TEST_F(BatchProcessorTest, InPlaceRunClassifiesInsteadOfSkipping) {
  auto hevc_mp4 = hevc_4k_mkv();
  hevc_mp4.format_name = MP4_FORMAT;
  std::string incompatible = add_input("hevc.mp4", hevc_mp4);
  std::string compatible = add_input("ready.mp4", compatible_mp4());

  TranscodeOrchestrator orchestrator(config, inspector, runner, hw);
  BatchProcessor processor(config, orchestrator);
  auto tally = processor.process({incompatible, compatible}, in_dir.string(),
                                 token);

  EXPECT_EQ(tally.hw_encoded, 1);
  EXPECT_EQ(tally.skipped, 1);
  EXPECT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(read_file(incompatible), "encoded");
  EXPECT_EQ(processor.outcomes()[0].output_path, incompatible);
  EXPECT_NE(processor.outcomes()[1].diagnostic, "output already exists");
}

TEST_F(BatchProcessorTest, SecondInputOnSameOutputFails) {
  std::vector<std::string> files{
      add_input("movie.avi", hevc_4k_mkv()),
      add_input("movie.mkv", h264_mkv()),
  };
  auto tally = process(files);

  EXPECT_EQ(tally.hw_encoded, 1);
  EXPECT_EQ(tally.failed, 1);
  EXPECT_EQ(runner.calls.size(), 1u);
  EXPECT_NE(outcomes[1].diagnostic.find("already claimed"), std::string::npos);
}

TEST_F(BatchProcessorTest, CancellationIsFailFast) {
  runner.cancel_on_call = 1;
  runner.cancel_token = &token;
  std::vector<std::string> files{
      add_input("a.mkv", h264_mkv()),
      add_input("b.mkv", h264_mkv()),
      add_input("c.mkv", h264_mkv()),
  };

  TranscodeOrchestrator orchestrator(config, inspector, runner, hw);
  BatchProcessor processor(config, orchestrator);
  EXPECT_THROW(processor.process(files, out_dir.string(), token),
               CancelledError);

  EXPECT_EQ(processor.outcomes().size(), 1u);
  EXPECT_EQ(runner.calls.size(), 2u);
  EXPECT_EQ(list_names(out_dir), std::vector<std::string>{"a.mp4"});
}

TEST_F(BatchProcessorTest, BackupPolicyMovesConvertedOriginals) {
  config.originals = OriginalsPolicy::Backup;
  std::vector<std::string> files{add_input("a.mp4", compatible_mp4()),
                                 add_input("b.mkv", h264_mkv())};
  process(files);

  EXPECT_TRUE(fs::exists(files[0]));
  EXPECT_FALSE(fs::exists(files[1]));
  EXPECT_TRUE(fs::exists(in_dir / ORIGINALS_BACKUP_DIR / "b.mkv"));
}

TEST_F(BatchProcessorTest, DeletePolicyRemovesOnlyConvertedOriginals) {
  config.originals = OriginalsPolicy::Delete;
  runner.exit_codes = {1, 1};
  std::vector<std::string> files{add_input("a.mkv", hevc_4k_mkv()),
                                 add_input("b.mkv", h264_mkv())};
  process(files);

  EXPECT_TRUE(fs::exists(files[0]));
  EXPECT_FALSE(fs::exists(files[1]));
}

TEST_F(BatchProcessorTest, KeepPolicyLeavesOriginals) {
  auto file = add_input("b.mkv", h264_mkv());
  process({file});
  EXPECT_TRUE(fs::exists(file));
}

TEST_F(BatchProcessorTest, EmptyInputProducesEmptyTally) {
  EXPECT_EQ(process({}).total(), 0);
}

TEST_F(BatchProcessorTest, CheckReportCountsFilesNeedingFixes) {
  std::vector<std::string> files{
      add_input("a.mp4", compatible_mp4()),
      add_input("b.mkv", h264_mkv()),
      add_input("c.mp4", mp4_with_subtitle()),
  };
  std::string broken = dir.touch("in/d.avi");
  inspector.failing_paths.insert(broken);
  files.push_back(broken);

  EXPECT_EQ(check_files(files, inspector, config.profile, token), 3);
  EXPECT_TRUE(runner.calls.empty());
}

TEST(BatchTallyTest, CountsPerState) {
  BatchTally tally;
  tally.add(OutcomeState::SoftwareEncoded);
  tally.add(OutcomeState::SoftwareEncoded);
  tally.add(OutcomeState::Skipped);
  EXPECT_EQ(tally.sw_encoded, 2);
  EXPECT_EQ(tally.count(OutcomeState::Skipped), 1);
  EXPECT_EQ(tally.total(), 3);
}
