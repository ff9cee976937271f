#include <gtest/gtest.h>

#include <vector>

#include "direct_play/progress_monitor.hpp"

using namespace direct_play;

class ProgressMonitorTest : public ::testing::Test {
protected:
  ProgressMonitor make(std::optional<double> total) {
    return ProgressMonitor(total, [this](int pct) { events.push_back(pct); });
  }

  std::vector<int> events;
};

TEST(ClockTimeTest, ParsesHoursMinutesSeconds) {
  auto t = parse_clock_time("01:02:03.500000");
  ASSERT_TRUE(t.has_value());
  EXPECT_DOUBLE_EQ(*t, 3723.5);
}

TEST(ClockTimeTest, NegativeAndMalformedValues) {
  auto neg = parse_clock_time("-00:00:01.000000");
  ASSERT_TRUE(neg.has_value());
  EXPECT_DOUBLE_EQ(*neg, -1.0);
  EXPECT_FALSE(parse_clock_time("N/A").has_value());
  EXPECT_FALSE(parse_clock_time("12:34").has_value());
  EXPECT_FALSE(parse_clock_time("aa:bb:cc").has_value());
}

TEST_F(ProgressMonitorTest, MicrosecondKeysDrivePercent) {
  auto monitor = make(200.0);
  monitor.consume("out_time_us=50000000");
  EXPECT_EQ(monitor.percent(), 25);
  /// ffmpeg prints microseconds under the _ms key too
  monitor.consume("out_time_ms=100000000");
  EXPECT_EQ(monitor.percent(), 50);
  EXPECT_EQ(events, (std::vector<int>{25, 50}));
}

TEST_F(ProgressMonitorTest, ClockKeyDrivesPercent) {
  auto monitor = make(100.0);
  monitor.consume("out_time=00:00:33.300000");
  EXPECT_EQ(monitor.percent(), 33);
}

TEST_F(ProgressMonitorTest, PercentNeverDecreases) {
  auto monitor = make(100.0);
  VectorLineSource feed({"out_time_us=60000000", "out_time_us=30000000",
                         "out_time_us=60000000", "out_time_us=70000000"});
  monitor.drain(feed);
  EXPECT_EQ(events, (std::vector<int>{60, 70}));
}

TEST_F(ProgressMonitorTest, EndSentinelForcesExactly100) {
  auto monitor = make(100.0);
  VectorLineSource feed(
      {"out_time_us=10000000", "progress=continue", "progress=end"});
  monitor.drain(feed);
  EXPECT_TRUE(monitor.finished());
  EXPECT_EQ(monitor.percent(), 100);
  EXPECT_EQ(events.back(), 100);
}

TEST_F(ProgressMonitorTest, OvershootIsClampedAndNotRepeated) {
  auto monitor = make(10.0);
  VectorLineSource feed(
      {"out_time_us=12000000", "out_time_us=13000000", "progress=end"});
  monitor.drain(feed);
  EXPECT_EQ(events, (std::vector<int>{100}));
}

TEST_F(ProgressMonitorTest, UnknownTotalPublishesNothing) {
  for (std::optional<double> total : {std::optional<double>{},
                                      std::optional<double>{0.0},
                                      std::optional<double>{-5.0}}) {
    events.clear();
    auto monitor = make(total);
    VectorLineSource feed({"out_time_us=5000000", "progress=end"});
    monitor.drain(feed);
    EXPECT_FALSE(monitor.reporting());
    EXPECT_TRUE(monitor.finished());
    EXPECT_TRUE(events.empty());
  }
}

TEST_F(ProgressMonitorTest, MalformedLinesAreIgnored) {
  auto monitor = make(100.0);
  VectorLineSource feed({"", "garbage", "out_time_us=N/A", "out_time=N/A",
                         "out_time_us=12abc", "bitrate=1000kbits/s",
                         "  out_time_us=40000000\r"});
  monitor.drain(feed);
  EXPECT_EQ(events, (std::vector<int>{40}));
}

TEST_F(ProgressMonitorTest, NegativeElapsedPublishesNothing) {
  auto monitor = make(100.0);
  monitor.consume("out_time=-00:00:00.040000");
  monitor.consume("out_time_us=-40000");
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(monitor.percent(), 0);
}
