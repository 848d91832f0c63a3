#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stop_token>
#include <vector>

#include "polyglot/binder/binder.hpp"
#include "polyglot/executor/process.hpp"
#include "polyglot/executor/step_executor.hpp"
#include "polyglot/matcher/matcher.hpp"
#include "polyglot/result/result.hpp"
#include "polyglot/runtime/execution_context.hpp"
#include "polyglot/suite/suite.hpp"

namespace polyglot::runner {

// Per-run parameters chosen by the scheduler.
struct RunSettings {
  size_t index = 0;
  std::filesystem::path workspace;
  matcher::Bindings seed;  // Variables captured by a shared setup
};

// Outcome of a shared-scope setup: the recorded steps plus the variables
// they captured, which seed every run of the environment.
struct SharedSetup {
  result::EnvironmentSetupResult result;
  matcher::Bindings captured;
};

// Executes scenarios against environments, one run at a time per call.
// Holds no per-run state, so one instance may be used from many threads.
class ScenarioRunner {
 public:
  ScenarioRunner(
      const suite::Suite& suite, executor::ProcessSpawner& spawner,
      std::chrono::milliseconds default_timeout);

  // Runs one (scenario, environment) pair, including retries and isolated
  // setup/teardown. Always returns a terminal status.
  auto Run(
      const suite::Scenario& scenario, const suite::Environment& environment,
      const RunSettings& settings, std::stop_token stop)
      -> result::ScenarioResult;

  // Shared-scope setup. A non-passed status means the environment's runs
  // must not start.
  auto RunEnvironmentSetup(
      const suite::Environment& environment,
      const std::filesystem::path& workspace, std::stop_token stop)
      -> SharedSetup;

  // Shared-scope teardown. Runs every step with a fresh stop token.
  void RunEnvironmentTeardown(
      const suite::Environment& environment,
      const std::filesystem::path& workspace, SharedSetup& shared);

 private:
  enum class SequenceMode : uint8_t {
    kStopAtFailure,  // Setup: the first failing step ends the sequence
    kRunAll,         // Teardown: every step runs
  };

  auto RunAttempt(
      const suite::Scenario& scenario, const suite::Environment& environment,
      const RunSettings& settings, std::stop_token stop)
      -> result::ScenarioResult;

  auto RunSequence(
      std::span<const suite::Step> steps, runtime::ExecutionContext& context,
      std::stop_token stop, SequenceMode mode,
      std::vector<result::StepResult>& out) -> result::Status;

  auto RunStep(
      const suite::Step& step, size_t index,
      runtime::ExecutionContext& context, std::stop_token stop)
      -> result::StepResult;

  auto RunInteractiveStep(
      const suite::Step& step, const binder::Binder& binder,
      runtime::ExecutionContext& context, std::chrono::milliseconds timeout,
      std::stop_token stop, result::StepResult& out)
      -> executor::ExecutionOutcome;

  void Verify(
      const suite::Step& step, const executor::ExecutionOutcome& outcome,
      std::chrono::milliseconds timeout, runtime::ExecutionContext& context,
      result::StepResult& out) const;

  auto ResolveTimeout(
      const suite::Step& step, const suite::Scenario& scenario) const
      -> std::chrono::milliseconds;

  const suite::Suite& suite_;
  executor::ProcessSpawner& spawner_;
  executor::StepExecutor executor_;
  std::chrono::milliseconds default_timeout_;
  suite::Scenario shared_scope_;  // Stand-in scenario for shared setup
};

}  // namespace polyglot::runner
