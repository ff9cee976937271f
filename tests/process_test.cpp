#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <fstream>
#include <thread>

#include <signal.h>
#include <unistd.h>

#include "direct_play/cancellation.hpp"
#include "direct_play/errors.hpp"
#include "direct_play/ffmpeg_executor.hpp"
#include "direct_play/process.hpp"
#include "direct_play/progress_monitor.hpp"

using namespace direct_play;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> sh(const std::string &script) {
  return {"/bin/sh", "-c", script};
}

/// False once pid is gone or a zombie
bool process_alive(pid_t pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string content;
  if (!std::getline(stat, content))
    return false;
  size_t paren = content.rfind(')');
  return paren != std::string::npos && paren + 2 < content.size() &&
         content[paren + 2] != 'Z';
}

bool wait_until_dead(pid_t pid, std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!process_alive(pid))
      return true;
    std::this_thread::sleep_for(20ms);
  }
  return !process_alive(pid);
}

} // namespace

class ProcessTest : public ::testing::Test {
protected:
  CancellationToken token;
};

TEST_F(ProcessTest, CapturesOutputAndExitCode) {
  auto result = run_capture(sh("echo hello; echo oops >&2; exit 3"), token, 1s);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.out, "hello\n");
  EXPECT_EQ(result.err, "oops\n");
}

TEST_F(ProcessTest, ExecFailureReportsShellStyle127) {
  auto result = run_capture({"/nonexistent/binary"}, token, 1s);
  EXPECT_EQ(result.exit_code, 127);
  EXPECT_NE(result.err.find("failed to exec"), std::string::npos);
}

TEST_F(ProcessTest, SignalledChildMapsTo128PlusSignal) {
  auto result = run_capture(sh("kill -9 $$"), token, 1s);
  EXPECT_EQ(result.exit_code, 128 + SIGKILL);
}

TEST_F(ProcessTest, ReadsLinesInOrder) {
  ChildProcess child(sh("printf 'a=1\\nb=2\\nlast'"));
  std::string line;
  std::vector<std::string> lines;
  while (child.read_line(line, token))
    lines.push_back(line);
  EXPECT_EQ(lines, (std::vector<std::string>{"a=1", "b=2", "last"}));
  EXPECT_EQ(child.wait(token), 0);
  EXPECT_FALSE(child.running());
}

TEST_F(ProcessTest, StderrTailIsBounded) {
  auto result =
      run_capture(sh("i=0; while [ $i -lt 500 ]; do echo 'xxxxxxxxxx' >&2; "
                     "i=$((i+1)); done"),
                  token, 1s);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_LE(result.err.size(), STDERR_TAIL_BYTES);
}

TEST_F(ProcessTest, EmptyArgumentVectorIsSpawnError) {
  EXPECT_THROW(ChildProcess child(std::vector<std::string>{}), SpawnError);
}

TEST_F(ProcessTest, CancellationInterruptsWait) {
  ChildProcess child(sh("sleep 30"));
  std::thread canceller([this] {
    std::this_thread::sleep_for(200ms);
    token.request_cancel();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(child.wait(token), CancelledError);
  canceller.join();
  child.terminate(500ms);

  EXPECT_FALSE(child.running());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(ProcessTest, TerminateReachesTheWholeGroup) {
  /// The shell prints the pid of a background helper, then waits on it
  ChildProcess child(sh("sleep 30 & echo $!; wait"));
  std::string line;
  ASSERT_TRUE(child.read_line(line, token));
  pid_t helper = static_cast<pid_t>(std::stol(line));
  ASSERT_TRUE(process_alive(helper));

  child.terminate(500ms);
  EXPECT_FALSE(child.running());
  EXPECT_TRUE(wait_until_dead(helper, 3000ms));
}

TEST_F(ProcessTest, SigtermIgnoringHelperIsSweptAfterLeaderExits) {
  /// The leader dies on SIGTERM; the background helper ignores it
  ChildProcess child(sh("(trap '' TERM; sleep 30) & echo $!; wait"));
  std::string line;
  ASSERT_TRUE(child.read_line(line, token));
  pid_t helper = static_cast<pid_t>(std::stol(line));
  pid_t group = child.pid();

  child.terminate(1000ms);
  EXPECT_FALSE(child.running());
  EXPECT_TRUE(wait_until_dead(helper, 3000ms));

  /// Once the helper is reaped the group is empty and no longer addressable
  if (access(("/proc/" + std::to_string(helper)).c_str(), F_OK) != 0) {
    errno = 0;
    EXPECT_EQ(kill(-group, 0), -1);
    EXPECT_EQ(errno, ESRCH);
  }
}

TEST_F(ProcessTest, SigtermIgnoringChildIsKilledAfterGrace) {
  ChildProcess child(sh("trap '' TERM; echo ready; sleep 30"));
  std::string line;
  ASSERT_TRUE(child.read_line(line, token));

  auto start = std::chrono::steady_clock::now();
  child.terminate(300ms);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(child.running());
  EXPECT_GE(elapsed, 300ms);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(ProcessTest, FfmpegRunnerStreamsProgress) {
  FfmpegRunner runner(500ms);
  ProgressMonitor monitor(10.0);
  std::string diagnostics;

  int code = runner.run(sh("printf 'out_time_us=5000000\\nprogress=continue\\n"
                           "out_time_us=10000000\\nprogress=end\\n'"),
                        monitor, token, diagnostics);
  EXPECT_EQ(code, 0);
  EXPECT_TRUE(monitor.finished());
  EXPECT_EQ(monitor.percent(), 100);
  EXPECT_TRUE(diagnostics.empty());
}

TEST_F(ProcessTest, FfmpegRunnerReportsStderrOnFailure) {
  FfmpegRunner runner(500ms);
  ProgressMonitor monitor(std::nullopt);
  std::string diagnostics;

  int code = runner.run(
      sh("echo 'Unknown encoder h264_nvenc' >&2; exit 1"), monitor, token,
      diagnostics);
  EXPECT_EQ(code, 1);
  EXPECT_NE(diagnostics.find("Unknown encoder h264_nvenc"), std::string::npos);
}

TEST_F(ProcessTest, FfmpegRunnerRethrowsCancellation) {
  FfmpegRunner runner(500ms);
  ProgressMonitor monitor(100.0);
  std::string diagnostics;
  token.request_cancel();

  EXPECT_THROW(runner.run(sh("sleep 30"), monitor, token, diagnostics),
               CancelledError);
}
