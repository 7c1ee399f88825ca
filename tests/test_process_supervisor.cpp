#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <fstream>

#include <fcntl.h>

#include <unistd.h>

#include "projectm_pod/process_supervisor.hpp"
#include "projectm_pod/system.hpp"

using namespace projectm_pod;

namespace {

ProcessOutcome sh(const std::string &script, double timeout_sec = 30) {
  return run_process({"/bin/sh", "-c", script}, timeout_sec);
}

} // namespace

TEST(ProcessSupervisor, CapturesBothStreams) {
  auto out = sh("echo hello; echo oops >&2; exit 0");
  EXPECT_EQ(out.status, ProcessStatus::Exited);
  EXPECT_EQ(out.exit_code, 0);
  EXPECT_EQ(out.stdout_text, "hello\n");
  EXPECT_EQ(out.stderr_text, "oops\n");
  EXPECT_GT(out.pid, 0);
}

TEST(ProcessSupervisor, ReportsExitCode) {
  auto out = sh("exit 3");
  EXPECT_EQ(out.status, ProcessStatus::Exited);
  EXPECT_EQ(out.exit_code, 3);
}

TEST(ProcessSupervisor, SignalGivesNegativeExitCode) {
  auto out = sh("kill -TERM $$");
  EXPECT_EQ(out.status, ProcessStatus::Exited);
  EXPECT_EQ(out.exit_code, -SIGTERM);
}

TEST(ProcessSupervisor, LargeOutputOnBothStreamsDoesNotDeadlock) {
  /// Well above the pipe buffer on each stream, written concurrently
  auto out = sh("head -c 524288 /dev/zero | tr '\\0' a & "
                "head -c 524288 /dev/zero | tr '\\0' b >&2; wait",
                60);
  EXPECT_EQ(out.status, ProcessStatus::Exited);
  EXPECT_EQ(out.exit_code, 0);
  EXPECT_EQ(out.stdout_text.size(), 524288u);
  EXPECT_EQ(out.stderr_text.size(), 524288u);
  EXPECT_EQ(out.stdout_text.find_first_not_of('a'), std::string::npos);
  EXPECT_EQ(out.stderr_text.find_first_not_of('b'), std::string::npos);
}

TEST(ProcessSupervisor, TimeoutKillsAndReaps) {
  auto out = sh("echo started; sleep 60", 1.0);
  EXPECT_EQ(out.status, ProcessStatus::TimedOut);
  EXPECT_LT(out.elapsed_sec, 10.0);
  EXPECT_EQ(out.stdout_text, "started\n");

  /// Reaped: the pid no longer exists
  ASSERT_GT(out.pid, 0);
  errno = 0;
  EXPECT_EQ(::kill(out.pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

TEST(ProcessSupervisor, TimeoutKillsWholeGroup) {
  TempDirectory dir("supervisor_test_");
  ASSERT_TRUE(dir.valid());
  auto marker = dir.path() / "grandchild";
  auto out = sh("(sleep 3; touch '" + marker.string() + "') & sleep 60", 1.0);
  EXPECT_EQ(out.status, ProcessStatus::TimedOut);
  ::sleep(3);
  EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(ProcessSupervisor, HugeTimeoutWaitsForExit) {
  auto out = sh("sleep 1; echo done", 1e12);
  EXPECT_EQ(out.status, ProcessStatus::Exited);
  EXPECT_EQ(out.exit_code, 0);
  EXPECT_EQ(out.stdout_text, "done\n");
  EXPECT_GE(out.elapsed_sec, 0.9);
}

TEST(ProcessSupervisor, ChildDoesNotInheritDescriptors) {
  TempDirectory dir("supervisor_fd_test_");
  ASSERT_TRUE(dir.valid());
  auto held = dir.path() / "held_by_parent";
  std::ofstream(held) << "x";

  /// Opened without O_CLOEXEC, like an Asio socket
  int fd = ::open(held.c_str(), O_RDONLY);
  ASSERT_GE(fd, 3);
  auto out = sh("readlink /proc/$$/fd/" + std::to_string(fd) +
                "; ls /proc/$$/fd");
  ::close(fd);

  EXPECT_EQ(out.exit_code, 0);
  EXPECT_EQ(out.stdout_text.find("held_by_parent"), std::string::npos)
      << out.stdout_text;
}

TEST(ProcessSupervisor, LaunchFailure) {
  auto out = run_process({"/nonexistent/renderer", "-i", "x"}, 5);
  EXPECT_EQ(out.status, ProcessStatus::LaunchFailed);
  EXPECT_NE(out.error.find("cannot execute /nonexistent/renderer"),
            std::string::npos);
  EXPECT_EQ(classify_render(out, "/nonexistent/out.mp4"),
            RenderStatus::LaunchFailed);
}

TEST(ProcessSupervisor, EmptyCommand) {
  auto out = run_process({}, 5);
  EXPECT_EQ(out.status, ProcessStatus::LaunchFailed);
  EXPECT_FALSE(out.error.empty());
}

TEST(ClassifyRender, Priority) {
  TempDirectory dir("classify_test_");
  ASSERT_TRUE(dir.valid());
  auto output = dir.path() / "output.mp4";

  ProcessOutcome outcome;
  outcome.status = ProcessStatus::Exited;
  outcome.exit_code = 0;
  EXPECT_EQ(classify_render(outcome, output), RenderStatus::OutputMissing);

  std::ofstream(output) << "video";
  EXPECT_EQ(classify_render(outcome, output), RenderStatus::Success);

  outcome.exit_code = 1;
  EXPECT_EQ(classify_render(outcome, output), RenderStatus::NonZeroExit);

  outcome.status = ProcessStatus::TimedOut;
  EXPECT_EQ(classify_render(outcome, output), RenderStatus::TimedOut);
}
