#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/matcher/matcher.hpp"

namespace polyglot::result {

enum class Status : uint8_t {
  kPending,
  kRunning,
  kPassed,
  kSkipped,
  kFailed,
  kErrored,
  kCancelled,
};

enum class FailureKind : uint8_t {
  kNone,
  kBinding,              // Template could not be resolved
  kSpawn,                // Process could not be started
  kTimeout,              // Process killed after its timeout
  kCancelled,            // Stop was requested
  kMismatch,             // Output did not satisfy the expectation
  kInconsistentCapture,  // Captured value disagreed with an earlier binding
  kExitCode,             // Unexpected exit code
  kSetup,                // Environment setup failed
  kTeardown,             // Environment teardown failed
  kScheduling,           // Run could not be scheduled
};

auto ToString(Status status) -> std::string_view;
auto ToString(FailureKind kind) -> std::string_view;

// Ordering used to roll statuses up:
// passed < skipped < failed < errored < cancelled.
auto Severity(Status status) -> int;
auto Worse(Status a, Status b) -> Status;

// Worst non-skipped status; kSkipped if every entry is skipped and kPassed
// for an empty list.
auto CombineStatus(std::span<const Status> statuses) -> Status;

[[nodiscard]] inline auto IsTerminal(Status status) -> bool {
  return status != Status::kPending && status != Status::kRunning;
}

struct StepResult {
  std::string name;
  size_t index = 0;
  Status status = Status::kPending;
  FailureKind failure = FailureKind::kNone;
  std::string message;
  std::string command;  // Bound command, or the input sent to a session
  std::optional<int> exit_code;
  std::string stdout_text;
  std::string stderr_text;
  std::vector<matcher::PatternOutcome> patterns;
  matcher::Bindings captured;
  std::chrono::milliseconds elapsed{0};
};

struct ScenarioResult {
  std::string scenario;
  std::string environment;
  size_t index = 0;  // Submission index within the suite run
  Status status = Status::kPending;
  FailureKind failure = FailureKind::kNone;
  std::string message;
  std::vector<StepResult> setup;
  std::vector<StepResult> steps;
  std::vector<StepResult> teardown;
  int attempts = 0;
  std::chrono::milliseconds elapsed{0};
  std::string workspace;
};

// Shared-scope setup and teardown of one environment.
struct EnvironmentSetupResult {
  std::string environment;
  Status status = Status::kPassed;
  std::vector<StepResult> setup;
  std::vector<StepResult> teardown;
};

struct StatusCounts {
  size_t passed = 0;
  size_t failed = 0;
  size_t errored = 0;
  size_t skipped = 0;
  size_t cancelled = 0;

  [[nodiscard]] auto Total() const -> size_t {
    return passed + failed + errored + skipped + cancelled;
  }
};

struct SuiteResult {
  std::string suite;
  Status status = Status::kPassed;
  std::vector<ScenarioResult> runs;  // Submission order
  std::vector<EnvironmentSetupResult> environments;
  std::vector<Diagnostic> diagnostics;
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] auto Counts() const -> StatusCounts;
  // True when every run passed or was skipped and no error was reported.
  [[nodiscard]] auto Passed() const -> bool;
};

// Collects run results from concurrent workers into submission-order slots.
class ResultAggregator {
 public:
  void Reserve(size_t count);
  void Record(ScenarioResult result);
  [[nodiscard]] auto Size() const -> size_t;

  // Move the collected runs into `suite` and compute its status.
  void Finish(SuiteResult& suite);

 private:
  mutable std::mutex mutex_;
  std::vector<std::optional<ScenarioResult>> slots_;
};

}  // namespace polyglot::result
