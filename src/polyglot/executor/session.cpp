#include "polyglot/executor/session.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "polyglot/executor/io_pump.hpp"

namespace polyglot::executor {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr auto kExitGrace = std::chrono::milliseconds(500);

}  // namespace

auto InteractiveSession::Start(
    ProcessSpawner& spawner, const SpawnRequest& request)
    -> Result<std::unique_ptr<InteractiveSession>> {
  auto spawned = spawner.Spawn(request);
  if (!spawned) {
    return std::unexpected(std::move(spawned.error()));
  }
  spdlog::debug("started session pid {}", spawned->pid);
  // Private constructor, so make_unique is not available
  return std::unique_ptr<InteractiveSession>(
      new InteractiveSession(std::move(*spawned)));
}

InteractiveSession::~InteractiveSession() {
  Terminate();
}

auto InteractiveSession::Running() const -> bool {
  return !reaped_ && process_.stdin_fd.Valid() && process_.stdout_fd.Valid();
}

auto InteractiveSession::Exchange(
    std::string_view input, std::chrono::milliseconds timeout,
    std::stop_token stop, const Predicate& done) -> ExecutionOutcome {
  ExecutionOutcome outcome;
  auto start = Clock::now();
  auto finish = [&] {
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start);
  };

  if (!Running()) {
    outcome.reason = ExitReason::kFailed;
    outcome.error = "interactive session is not running";
    finish();
    return outcome;
  }

  detail::IoPump pump(stop);
  pump.Watch(process_.stdout_fd, outcome.stdout_text);
  pump.Watch(process_.stderr_fd, outcome.stderr_text);
  pump.Feed(process_.stdin_fd, std::string(input) + "\n", false);

  auto deadline = start + timeout;
  while (true) {
    if (!pump.WritePending() &&
        done(outcome.stdout_text, outcome.stderr_text)) {
      break;
    }
    if (!process_.stdout_fd.Valid()) {
      // Session closed its output; collect its exit status if it is gone
      if (auto code = TryReap(process_.pid)) {
        reaped_ = true;
        exit_code_ = code;
        outcome.exit_code = code;
      }
      break;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (left.count() <= 0) {
      outcome.reason = ExitReason::kTimedOut;
      pump.Clear();
      finish();
      return outcome;
    }
    auto state = pump.Step(std::min(left, kPollSlice));
    if (state == detail::IoPump::State::kStopped) {
      pump.Clear();
      Terminate();
      outcome.reason = ExitReason::kCancelled;
      finish();
      return outcome;
    }
    if (state == detail::IoPump::State::kError) {
      pump.Clear();
      outcome.reason = ExitReason::kFailed;
      outcome.error = "poll() failed: " + pump.ErrorText();
      finish();
      return outcome;
    }
  }

  pump.Clear();
  outcome.reason = ExitReason::kExited;
  finish();
  return outcome;
}

void InteractiveSession::Terminate() {
  if (reaped_ || process_.pid <= 0) {
    return;
  }
  process_.stdin_fd.Reset();
  auto until = Clock::now() + kExitGrace;
  while (Clock::now() < until) {
    if (auto code = TryReap(process_.pid)) {
      exit_code_ = code;
      reaped_ = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  KillProcessGroup(process_.pid);
  if (!reaped_) {
    exit_code_ = WaitForExit(process_.pid);
    reaped_ = true;
  }
  process_.stdout_fd.Reset();
  process_.stderr_fd.Reset();
  spdlog::debug("terminated session pid {}", process_.pid);
}

}  // namespace polyglot::executor
