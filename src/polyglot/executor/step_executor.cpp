#include "polyglot/executor/step_executor.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stop_token>
#include <string_view>
#include <sys/types.h>
#include <utility>

#include <spdlog/spdlog.h>

#include "polyglot/common/internal_error.hpp"
#include "polyglot/executor/io_pump.hpp"
#include "polyglot/executor/process.hpp"

namespace polyglot::executor {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kPollSlice = std::chrono::milliseconds(100);
constexpr auto kReapSlice = std::chrono::milliseconds(20);
// Output still buffered in the pipes after a kill is collected for this long
constexpr auto kDrainGrace = std::chrono::milliseconds(250);

// Kills and reaps the child on every exit path.
class ChildGuard {
 public:
  explicit ChildGuard(pid_t pid) : pid_(pid) {
  }
  ~ChildGuard() {
    if (pid_ > 0) {
      KillProcessGroup(pid_);
      WaitForExit(pid_);
    }
  }
  ChildGuard(const ChildGuard&) = delete;
  auto operator=(const ChildGuard&) -> ChildGuard& = delete;
  ChildGuard(ChildGuard&&) = delete;
  auto operator=(ChildGuard&&) -> ChildGuard& = delete;

  // Kill the group and wait. Returns the exit status.
  auto KillAndReap() -> int {
    KillProcessGroup(pid_);
    int code = WaitForExit(pid_);
    pid_ = -1;
    return code;
  }

  // Child has been reaped by the caller; only the group remains.
  void Reaped() {
    // Background descendants may still hold the pipes open
    KillProcessGroup(pid_);
    pid_ = -1;
  }

 private:
  pid_t pid_;
};

auto Remaining(Clock::time_point deadline) -> std::chrono::milliseconds {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

void Drain(detail::IoPump& pump, std::chrono::milliseconds grace) {
  auto until = Clock::now() + grace;
  while (pump.ReadersOpen() && Clock::now() < until) {
    if (pump.Step(std::min(Remaining(until), kReapSlice)) !=
        detail::IoPump::State::kActive) {
      return;
    }
  }
}

}  // namespace

auto ExitReasonName(ExitReason reason) -> std::string_view {
  switch (reason) {
    case ExitReason::kExited:
      return "exited";
    case ExitReason::kTimedOut:
      return "timed out";
    case ExitReason::kCancelled:
      return "cancelled";
    case ExitReason::kFailed:
      return "failed";
  }
  common::ThrowInternalError("ExitReasonName", "unknown ExitReason");
}

auto StepExecutor::Run(const CommandRequest& request, std::stop_token stop)
    -> ExecutionOutcome {
  ExecutionOutcome outcome;
  auto start = Clock::now();
  auto finish = [&](ExecutionOutcome& o) {
    o.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start);
  };

  if (stop.stop_requested()) {
    outcome.reason = ExitReason::kCancelled;
    finish(outcome);
    return outcome;
  }

  auto spawned = spawner_.Spawn(request.spawn);
  if (!spawned) {
    outcome.reason = ExitReason::kFailed;
    outcome.error = spawned.error().Message();
    finish(outcome);
    return outcome;
  }

  SpawnedProcess& child = *spawned;
  ChildGuard guard(child.pid);
  detail::IoPump pump(stop);
  pump.Watch(child.stdout_fd, outcome.stdout_text);
  pump.Watch(child.stderr_fd, outcome.stderr_text);
  pump.Feed(child.stdin_fd, request.stdin_text, true);

  auto deadline = start + request.timeout;
  std::optional<int> exit_code;

  while (true) {
    if (!exit_code) {
      exit_code = TryReap(child.pid);
      if (exit_code) {
        guard.Reaped();
      }
    }
    if (exit_code && !pump.ReadersOpen()) {
      break;
    }

    auto left = Remaining(deadline);
    if (left.count() == 0) {
      spdlog::debug(
          "pid {} timed out after {} ms", child.pid, request.timeout.count());
      if (!exit_code) {
        guard.KillAndReap();
      } else {
        KillProcessGroup(child.pid);
      }
      Drain(pump, kDrainGrace);
      outcome.reason = ExitReason::kTimedOut;
      finish(outcome);
      return outcome;
    }

    // Readers close at EOF; afterwards only the exit status is awaited
    auto slice = pump.ReadersOpen() || pump.WritePending() ? kPollSlice
                                                           : kReapSlice;
    auto state = pump.Step(std::min(left, slice));
    if (state == detail::IoPump::State::kStopped) {
      spdlog::debug("pid {} cancelled", child.pid);
      if (!exit_code) {
        guard.KillAndReap();
      } else {
        KillProcessGroup(child.pid);
      }
      outcome.reason = ExitReason::kCancelled;
      finish(outcome);
      return outcome;
    }
    if (state == detail::IoPump::State::kError) {
      outcome.reason = ExitReason::kFailed;
      outcome.error = "poll() failed: " + pump.ErrorText();
      if (!exit_code) {
        guard.KillAndReap();
      }
      finish(outcome);
      return outcome;
    }
  }

  outcome.reason = ExitReason::kExited;
  outcome.exit_code = exit_code;
  finish(outcome);
  return outcome;
}

}  // namespace polyglot::executor
