#include "polyglot/result/result.hpp"

#include <algorithm>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "polyglot/common/internal_error.hpp"

namespace polyglot::result {

auto ToString(Status status) -> std::string_view {
  switch (status) {
    case Status::kPending:
      return "pending";
    case Status::kRunning:
      return "running";
    case Status::kPassed:
      return "passed";
    case Status::kSkipped:
      return "skipped";
    case Status::kFailed:
      return "failed";
    case Status::kErrored:
      return "errored";
    case Status::kCancelled:
      return "cancelled";
  }
  common::ThrowInternalError("ToString", "unknown Status");
}

auto ToString(FailureKind kind) -> std::string_view {
  switch (kind) {
    case FailureKind::kNone:
      return "none";
    case FailureKind::kBinding:
      return "binding";
    case FailureKind::kSpawn:
      return "spawn";
    case FailureKind::kTimeout:
      return "timeout";
    case FailureKind::kCancelled:
      return "cancelled";
    case FailureKind::kMismatch:
      return "mismatch";
    case FailureKind::kInconsistentCapture:
      return "inconsistent capture";
    case FailureKind::kExitCode:
      return "exit code";
    case FailureKind::kSetup:
      return "setup";
    case FailureKind::kTeardown:
      return "teardown";
    case FailureKind::kScheduling:
      return "scheduling";
  }
  common::ThrowInternalError("ToString", "unknown FailureKind");
}

auto Severity(Status status) -> int {
  switch (status) {
    case Status::kPassed:
      return 0;
    case Status::kSkipped:
      return 1;
    case Status::kFailed:
      return 2;
    case Status::kErrored:
      return 3;
    case Status::kCancelled:
      return 4;
    case Status::kPending:
    case Status::kRunning:
      break;
  }
  common::ThrowInternalError(
      "Severity", fmt::format("status '{}' is not terminal", ToString(status)));
}

auto Worse(Status a, Status b) -> Status {
  return Severity(b) > Severity(a) ? b : a;
}

auto CombineStatus(std::span<const Status> statuses) -> Status {
  if (statuses.empty()) {
    return Status::kPassed;
  }
  bool all_skipped = true;
  Status worst = Status::kPassed;
  for (Status status : statuses) {
    if (status == Status::kSkipped) {
      continue;
    }
    all_skipped = false;
    worst = Worse(worst, status);
  }
  return all_skipped ? Status::kSkipped : worst;
}

auto SuiteResult::Counts() const -> StatusCounts {
  StatusCounts counts;
  for (const auto& run : runs) {
    switch (run.status) {
      case Status::kPassed:
        ++counts.passed;
        break;
      case Status::kFailed:
        ++counts.failed;
        break;
      case Status::kErrored:
        ++counts.errored;
        break;
      case Status::kSkipped:
        ++counts.skipped;
        break;
      case Status::kCancelled:
        ++counts.cancelled;
        break;
      case Status::kPending:
      case Status::kRunning:
        break;
    }
  }
  return counts;
}

auto SuiteResult::Passed() const -> bool {
  bool has_error = std::ranges::any_of(
      diagnostics, [](const Diagnostic& d) { return d.IsError(); });
  return !has_error &&
         (status == Status::kPassed || status == Status::kSkipped);
}

void ResultAggregator::Reserve(size_t count) {
  std::lock_guard lock(mutex_);
  slots_.resize(count);
}

void ResultAggregator::Record(ScenarioResult result) {
  std::lock_guard lock(mutex_);
  if (result.index >= slots_.size()) {
    common::ThrowInternalError(
        "ResultAggregator::Record",
        fmt::format(
            "run index {} outside {} reserved slots", result.index,
            slots_.size()));
  }
  if (slots_[result.index].has_value()) {
    common::ThrowInternalError(
        "ResultAggregator::Record",
        fmt::format("run index {} recorded twice", result.index));
  }
  slots_[result.index] = std::move(result);
}

auto ResultAggregator::Size() const -> size_t {
  std::lock_guard lock(mutex_);
  return slots_.size();
}

void ResultAggregator::Finish(SuiteResult& suite) {
  std::lock_guard lock(mutex_);
  std::vector<Status> statuses;
  suite.runs.clear();
  suite.runs.reserve(slots_.size());
  for (size_t i = 0; i < slots_.size(); ++i) {
    if (!slots_[i].has_value()) {
      common::ThrowInternalError(
          "ResultAggregator::Finish",
          fmt::format("run index {} was never recorded", i));
    }
    statuses.push_back(slots_[i]->status);
    suite.runs.push_back(std::move(*slots_[i]));
  }
  slots_.clear();
  for (const auto& env : suite.environments) {
    statuses.push_back(env.status);
  }
  suite.status = CombineStatus(statuses);
  if (std::ranges::any_of(
          suite.diagnostics, [](const Diagnostic& d) { return d.IsError(); })) {
    suite.status = Worse(suite.status, Status::kErrored);
  }
}

}  // namespace polyglot::result
