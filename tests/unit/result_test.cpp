#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/common/internal_error.hpp"
#include "polyglot/result/result.hpp"

namespace polyglot::result {
namespace {

auto MakeRun(size_t index, Status status) -> ScenarioResult {
  ScenarioResult run;
  run.index = index;
  run.scenario = "s" + std::to_string(index);
  run.environment = "e";
  run.status = status;
  return run;
}

// =============================================================================
// Status roll-up
// =============================================================================

TEST(ResultTest, SeverityOrder) {
  EXPECT_LT(Severity(Status::kPassed), Severity(Status::kSkipped));
  EXPECT_LT(Severity(Status::kSkipped), Severity(Status::kFailed));
  EXPECT_LT(Severity(Status::kFailed), Severity(Status::kErrored));
  EXPECT_LT(Severity(Status::kErrored), Severity(Status::kCancelled));
  EXPECT_EQ(Worse(Status::kFailed, Status::kErrored), Status::kErrored);
  EXPECT_EQ(Worse(Status::kCancelled, Status::kPassed), Status::kCancelled);
}

TEST(ResultTest, SeverityOfNonTerminalStatusIsInternalError) {
  EXPECT_THROW(Severity(Status::kPending), common::InternalError);
  EXPECT_FALSE(IsTerminal(Status::kRunning));
  EXPECT_TRUE(IsTerminal(Status::kSkipped));
}

TEST(ResultTest, CombineStatusTakesWorstNonSkipped) {
  std::vector<Status> mixed{Status::kPassed, Status::kSkipped, Status::kFailed};
  EXPECT_EQ(CombineStatus(mixed), Status::kFailed);

  std::vector<Status> skipped_and_passed{Status::kSkipped, Status::kPassed};
  EXPECT_EQ(CombineStatus(skipped_and_passed), Status::kPassed);

  std::vector<Status> all_skipped{Status::kSkipped, Status::kSkipped};
  EXPECT_EQ(CombineStatus(all_skipped), Status::kSkipped);

  EXPECT_EQ(CombineStatus({}), Status::kPassed);

  std::vector<Status> worst{
      Status::kErrored, Status::kCancelled, Status::kFailed};
  EXPECT_EQ(CombineStatus(worst), Status::kCancelled);
}

TEST(ResultTest, StatusAndFailureNames) {
  EXPECT_EQ(ToString(Status::kErrored), "errored");
  EXPECT_EQ(ToString(FailureKind::kInconsistentCapture), "inconsistent capture");
  EXPECT_EQ(ToString(FailureKind::kExitCode), "exit code");
}

// =============================================================================
// SuiteResult
// =============================================================================

TEST(ResultTest, CountsAndPassed) {
  SuiteResult suite;
  suite.runs = {
      MakeRun(0, Status::kPassed), MakeRun(1, Status::kSkipped),
      MakeRun(2, Status::kFailed), MakeRun(3, Status::kCancelled)};
  auto counts = suite.Counts();
  EXPECT_EQ(counts.passed, 1U);
  EXPECT_EQ(counts.skipped, 1U);
  EXPECT_EQ(counts.failed, 1U);
  EXPECT_EQ(counts.cancelled, 1U);
  EXPECT_EQ(counts.Total(), 4U);

  suite.status = Status::kSkipped;
  EXPECT_TRUE(suite.Passed());
  suite.diagnostics.push_back(Diagnostic::HostError("disk full"));
  EXPECT_FALSE(suite.Passed());
}

TEST(ResultTest, WarningsDoNotFailTheSuite) {
  SuiteResult suite;
  suite.diagnostics.push_back(Diagnostic::Warning({}, "slow"));
  EXPECT_TRUE(suite.Passed());
}

// =============================================================================
// ResultAggregator
// =============================================================================

TEST(ResultTest, AggregatorKeepsSubmissionOrder) {
  ResultAggregator aggregator;
  aggregator.Reserve(3);
  aggregator.Record(MakeRun(2, Status::kPassed));
  aggregator.Record(MakeRun(0, Status::kFailed));
  aggregator.Record(MakeRun(1, Status::kPassed));

  SuiteResult suite;
  aggregator.Finish(suite);
  ASSERT_EQ(suite.runs.size(), 3U);
  EXPECT_EQ(suite.runs[0].index, 0U);
  EXPECT_EQ(suite.runs[1].index, 1U);
  EXPECT_EQ(suite.runs[2].index, 2U);
  EXPECT_EQ(suite.status, Status::kFailed);
}

TEST(ResultTest, AggregatorAcceptsConcurrentRecords) {
  constexpr size_t kRuns = 64;
  ResultAggregator aggregator;
  aggregator.Reserve(kRuns);
  {
    std::vector<std::jthread> threads;
    for (size_t t = 0; t < 4; ++t) {
      threads.emplace_back([&aggregator, t] {
        for (size_t i = t; i < kRuns; i += 4) {
          aggregator.Record(MakeRun(i, Status::kPassed));
        }
      });
    }
  }
  SuiteResult suite;
  aggregator.Finish(suite);
  ASSERT_EQ(suite.runs.size(), kRuns);
  for (size_t i = 0; i < kRuns; ++i) {
    EXPECT_EQ(suite.runs[i].index, i);
  }
  EXPECT_EQ(suite.status, Status::kPassed);
}

TEST(ResultTest, AggregatorRejectsBadIndexes) {
  ResultAggregator aggregator;
  aggregator.Reserve(1);
  EXPECT_THROW(aggregator.Record(MakeRun(1, Status::kPassed)), common::InternalError);
  aggregator.Record(MakeRun(0, Status::kPassed));
  EXPECT_THROW(aggregator.Record(MakeRun(0, Status::kPassed)), common::InternalError);
}

TEST(ResultTest, AggregatorRequiresEverySlot) {
  ResultAggregator aggregator;
  aggregator.Reserve(2);
  aggregator.Record(MakeRun(0, Status::kPassed));
  SuiteResult suite;
  EXPECT_THROW(aggregator.Finish(suite), common::InternalError);
}

TEST(ResultTest, FinishIncludesSharedSetupAndDiagnostics) {
  ResultAggregator aggregator;
  aggregator.Reserve(1);
  aggregator.Record(MakeRun(0, Status::kPassed));

  SuiteResult suite;
  suite.environments.push_back(
      EnvironmentSetupResult{.environment = "e", .status = Status::kErrored});
  aggregator.Finish(suite);
  EXPECT_EQ(suite.status, Status::kErrored);

  ResultAggregator second;
  second.Reserve(0);
  SuiteResult empty;
  empty.diagnostics.push_back(Diagnostic::SchedulingError("no threads"));
  second.Finish(empty);
  EXPECT_EQ(empty.status, Status::kErrored);
}

}  // namespace
}  // namespace polyglot::result
