#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <vector>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/executor/process.hpp"
#include "polyglot/executor/session.hpp"
#include "polyglot/executor/step_executor.hpp"

namespace polyglot::executor {
namespace {

using std::chrono::milliseconds;

auto Shell(std::string script, milliseconds timeout = milliseconds(10000))
    -> CommandRequest {
  return CommandRequest{
      .spawn = SpawnRequest{.argv = {"/bin/sh", "-c", std::move(script)}},
      .stdin_text = {},
      .timeout = timeout,
  };
}

// A killed process may linger as a zombie until its new parent reaps it.
auto ProcessGone(pid_t pid, milliseconds within) -> bool {
  auto until = std::chrono::steady_clock::now() + within;
  while (std::chrono::steady_clock::now() < until) {
    if (kill(pid, 0) != 0 && errno == ESRCH) {
      return true;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (stat && std::getline(stat, line)) {
      auto close = line.rfind(')');
      if (close != std::string::npos && close + 2 < line.size() &&
          (line[close + 2] == 'Z' || line[close + 2] == 'X')) {
        return true;
      }
    }
    std::this_thread::sleep_for(milliseconds(20));
  }
  return false;
}

class FailingSpawner : public ProcessSpawner {
 public:
  auto Spawn(const SpawnRequest& /*request*/) -> Result<SpawnedProcess> override {
    ++calls;
    return std::unexpected(Diagnostic::ExecutionError("no processes today"));
  }

  int calls = 0;
};

class ExecutorTest : public ::testing::Test {
 protected:
  PosixProcessSpawner spawner_;
  StepExecutor executor_{spawner_};
};

// =============================================================================
// Completed commands
// =============================================================================

TEST_F(ExecutorTest, CapturesStreamsAndExitCode) {
  auto outcome = executor_.Run(
      Shell("echo out; echo err >&2; exit 3"), std::stop_token{});
  EXPECT_EQ(outcome.reason, ExitReason::kExited);
  EXPECT_EQ(outcome.exit_code, 3);
  EXPECT_EQ(outcome.stdout_text, "out\n");
  EXPECT_EQ(outcome.stderr_text, "err\n");
}

TEST_F(ExecutorTest, WritesStdinThenClosesIt) {
  auto request = Shell("cat");
  request.stdin_text = "line one\nline two\n";
  auto outcome = executor_.Run(request, std::stop_token{});
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(outcome.stdout_text, "line one\nline two\n");
}

TEST_F(ExecutorTest, EmptyStdinReadsEof) {
  auto outcome = executor_.Run(Shell("cat; echo done"), std::stop_token{});
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(outcome.stdout_text, "done\n");
}

TEST_F(ExecutorTest, AppliesWorkingDirectoryAndEnvironment) {
  auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path());
  auto request = Shell("pwd; echo \"$POLYGLOT_TEST_VALUE\"");
  request.spawn.working_dir = dir;
  request.spawn.env = {{"POLYGLOT_TEST_VALUE", "from test"}};
  auto outcome = executor_.Run(request, std::stop_token{});
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(outcome.stdout_text, dir.string() + "\nfrom test\n");
}

TEST_F(ExecutorTest, EnvironmentOverrideReplacesInheritedValue) {
  auto request = Shell("echo \"$HOME\"");
  request.spawn.env = {{"HOME", "/nowhere"}};
  auto outcome = executor_.Run(request, std::stop_token{});
  EXPECT_EQ(outcome.stdout_text, "/nowhere\n");
}

TEST_F(ExecutorTest, SignalledExitIsReportedAs128PlusSignal) {
  auto outcome = executor_.Run(Shell("kill -TERM $$"), std::stop_token{});
  EXPECT_EQ(outcome.reason, ExitReason::kExited);
  EXPECT_EQ(outcome.exit_code, 128 + SIGTERM);
}

TEST_F(ExecutorTest, OutputLargerThanPipeBuffer) {
  auto outcome = executor_.Run(
      Shell("i=0; while [ $i -lt 4000 ]; do "
            "echo 0123456789012345678901234567890123456789; i=$((i+1)); done"),
      std::stop_token{});
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(outcome.stdout_text.size(), 4000U * 41U);
}

// =============================================================================
// Failure to start
// =============================================================================

TEST_F(ExecutorTest, MissingProgramIsASpawnFailure) {
  CommandRequest request{
      .spawn = SpawnRequest{.argv = {"polyglot-no-such-program"}},
      .stdin_text = {},
      .timeout = milliseconds(5000),
  };
  auto outcome = executor_.Run(request, std::stop_token{});
  EXPECT_EQ(outcome.reason, ExitReason::kFailed);
  EXPECT_FALSE(outcome.exit_code.has_value());
  EXPECT_NE(
      outcome.error.find("cannot start 'polyglot-no-such-program'"),
      std::string::npos)
      << outcome.error;
}

TEST_F(ExecutorTest, MissingWorkingDirectoryIsASpawnFailure) {
  auto request = Shell("true");
  request.spawn.working_dir = "/polyglot/does/not/exist";
  auto outcome = executor_.Run(request, std::stop_token{});
  EXPECT_EQ(outcome.reason, ExitReason::kFailed);
}

TEST_F(ExecutorTest, InjectedSpawnerErrorIsReported) {
  FailingSpawner failing;
  StepExecutor executor(failing);
  auto outcome = executor.Run(Shell("true"), std::stop_token{});
  EXPECT_EQ(outcome.reason, ExitReason::kFailed);
  EXPECT_EQ(outcome.error, "no processes today");
  EXPECT_EQ(failing.calls, 1);
}

// =============================================================================
// Timeout and cancellation
// =============================================================================

TEST_F(ExecutorTest, TimeoutKillsTheWholeProcessGroup) {
  auto start = std::chrono::steady_clock::now();
  auto outcome = executor_.Run(
      Shell("sleep 30 & echo $!; wait", milliseconds(300)), std::stop_token{});
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(outcome.reason, ExitReason::kTimedOut);
  EXPECT_FALSE(outcome.exit_code.has_value());
  EXPECT_LT(elapsed, std::chrono::seconds(5));

  ASSERT_FALSE(outcome.stdout_text.empty());
  auto grandchild = static_cast<pid_t>(std::stol(outcome.stdout_text));
  EXPECT_TRUE(ProcessGone(grandchild, milliseconds(2000)));
}

TEST_F(ExecutorTest, OutputBeforeTimeoutIsKept) {
  auto outcome = executor_.Run(
      Shell("echo partial; sleep 30", milliseconds(300)), std::stop_token{});
  EXPECT_EQ(outcome.reason, ExitReason::kTimedOut);
  EXPECT_EQ(outcome.stdout_text, "partial\n");
}

TEST_F(ExecutorTest, StopRequestCancelsRunningCommand) {
  std::stop_source stop;
  std::jthread canceller([&stop] {
    std::this_thread::sleep_for(milliseconds(200));
    stop.request_stop();
  });

  auto start = std::chrono::steady_clock::now();
  auto outcome = executor_.Run(Shell("sleep 30"), stop.get_token());
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(outcome.reason, ExitReason::kCancelled);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ExecutorTest, StopBeforeStartNeverSpawns) {
  FailingSpawner counting;
  StepExecutor executor(counting);
  std::stop_source stop;
  stop.request_stop();
  auto outcome = executor.Run(Shell("true"), stop.get_token());
  EXPECT_EQ(outcome.reason, ExitReason::kCancelled);
  EXPECT_EQ(counting.calls, 0);
}

TEST_F(ExecutorTest, ExitReasonNames) {
  EXPECT_EQ(ExitReasonName(ExitReason::kExited), "exited");
  EXPECT_EQ(ExitReasonName(ExitReason::kTimedOut), "timed out");
  EXPECT_EQ(ExitReasonName(ExitReason::kCancelled), "cancelled");
  EXPECT_EQ(ExitReasonName(ExitReason::kFailed), "failed");
}

// =============================================================================
// Interactive sessions
// =============================================================================

auto Contains(std::string_view needle) -> InteractiveSession::Predicate {
  return [needle = std::string(needle)](
             std::string_view out, std::string_view /*err*/) {
    return out.find(needle) != std::string_view::npos;
  };
}

auto Never() -> InteractiveSession::Predicate {
  return [](std::string_view, std::string_view) { return false; };
}

auto StartShell(ProcessSpawner& spawner)
    -> std::unique_ptr<InteractiveSession> {
  auto session =
      InteractiveSession::Start(spawner, SpawnRequest{.argv = {"/bin/sh"}});
  EXPECT_TRUE(session.has_value());
  return session ? std::move(*session) : nullptr;
}

TEST_F(ExecutorTest, SessionExchangesKeepState) {
  auto session = StartShell(spawner_);
  ASSERT_NE(session, nullptr);

  auto first = session->Exchange(
      "x=41; echo set", milliseconds(5000), std::stop_token{}, Contains("set\n"));
  EXPECT_EQ(first.reason, ExitReason::kExited);
  EXPECT_EQ(first.stdout_text, "set\n");

  auto second = session->Exchange(
      "echo $((x+1))", milliseconds(5000), std::stop_token{}, Contains("\n"));
  EXPECT_EQ(second.reason, ExitReason::kExited);
  EXPECT_EQ(second.stdout_text, "42\n");
  EXPECT_TRUE(session->Running());
}

TEST_F(ExecutorTest, SessionTimeoutLeavesSessionRunning) {
  auto session = StartShell(spawner_);
  ASSERT_NE(session, nullptr);

  auto outcome = session->Exchange(
      "true", milliseconds(200), std::stop_token{}, Never());
  EXPECT_EQ(outcome.reason, ExitReason::kTimedOut);
  EXPECT_TRUE(session->Running());
}

TEST_F(ExecutorTest, SessionEndsWhenProcessExits) {
  auto session = StartShell(spawner_);
  ASSERT_NE(session, nullptr);

  auto outcome = session->Exchange(
      "echo bye; exit 0", milliseconds(5000), std::stop_token{}, Never());
  EXPECT_EQ(outcome.reason, ExitReason::kExited);
  EXPECT_EQ(outcome.stdout_text, "bye\n");

  auto after = session->Exchange(
      "echo again", milliseconds(1000), std::stop_token{}, Never());
  EXPECT_EQ(after.reason, ExitReason::kFailed);
}

TEST_F(ExecutorTest, TerminateKillsSessionProcess) {
  auto session = StartShell(spawner_);
  ASSERT_NE(session, nullptr);
  pid_t pid = session->Pid();

  session->Terminate();
  EXPECT_FALSE(session->Running());
  EXPECT_TRUE(ProcessGone(pid, milliseconds(2000)));
  // Idempotent
  session->Terminate();
}

TEST_F(ExecutorTest, SessionStopRequestCancels) {
  auto session = StartShell(spawner_);
  ASSERT_NE(session, nullptr);
  std::stop_source stop;
  stop.request_stop();

  auto outcome =
      session->Exchange("sleep 30", milliseconds(5000), stop.get_token(), Never());
  EXPECT_EQ(outcome.reason, ExitReason::kCancelled);
  EXPECT_FALSE(session->Running());
}

}  // namespace
}  // namespace polyglot::executor
