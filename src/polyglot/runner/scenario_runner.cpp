#include "polyglot/runner/scenario_runner.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "polyglot/binder/binder.hpp"
#include "polyglot/common/diagnostic.hpp"
#include "polyglot/common/internal_error.hpp"
#include "polyglot/executor/session.hpp"
#include "polyglot/executor/step_executor.hpp"
#include "polyglot/matcher/matcher.hpp"
#include "polyglot/result/result.hpp"
#include "polyglot/runtime/execution_context.hpp"

namespace polyglot::runner {

namespace {

using Clock = std::chrono::steady_clock;
using result::FailureKind;
using result::Status;
using result::StepResult;

auto StepName(const suite::Step& step, size_t index) -> std::string {
  if (!step.name.empty()) {
    return step.name;
  }
  if (step.run) {
    return *step.run;
  }
  if (step.send) {
    return fmt::format("send {}", *step.send);
  }
  return fmt::format("step {}", index + 1);
}

auto NewStep(const suite::Step& step, size_t index) -> StepResult {
  StepResult out;
  out.name = StepName(step, index);
  out.index = index;
  return out;
}

auto SkippedStep(const suite::Step& step, size_t index, std::string reason)
    -> StepResult {
  auto out = NewStep(step, index);
  out.status = Status::kSkipped;
  out.message = std::move(reason);
  return out;
}

void MarkFailed(
    StepResult& out, Status status, FailureKind kind, std::string message) {
  out.status = status;
  out.failure = kind;
  out.message = std::move(message);
}

// Text a step verifies. `both` joins stdout and stderr on a line boundary.
auto SelectStream(
    suite::Stream stream, std::string_view stdout_text,
    std::string_view stderr_text) -> std::string {
  switch (stream) {
    case suite::Stream::kStdout:
      return std::string(stdout_text);
    case suite::Stream::kStderr:
      return std::string(stderr_text);
    case suite::Stream::kBoth: {
      std::string text(stdout_text);
      if (!text.empty() && text.back() != '\n' && !stderr_text.empty()) {
        text += '\n';
      }
      text += stderr_text;
      return text;
    }
  }
  common::ThrowInternalError("SelectStream", "unknown Stream");
}

// First required pattern that failed, as "description: detail".
auto DescribeMismatch(const matcher::MatchResult& match) -> std::string {
  for (const auto& outcome : match.outcomes) {
    if (!outcome.matched && !outcome.optional) {
      return fmt::format("{}: {}", outcome.description, outcome.detail);
    }
  }
  return "output did not match";
}

// Applies the Environment's run-wide state to a fresh context: seeded
// variables, process environment and working directory.
auto PrepareContext(
    const suite::Environment& environment, const matcher::Bindings& seed,
    runtime::ExecutionContext& context) -> Result<void> {
  context.Bind(seed);
  binder::Binder binder(environment, context);
  for (const auto& [name, value] : environment.env) {
    auto expanded = binder.Expand(value);
    if (!expanded) {
      return std::unexpected(std::move(expanded.error()));
    }
    context.SetEnv(name, std::move(*expanded));
  }
  if (environment.working_dir) {
    auto dir = binder.ResolvePath(*environment.working_dir, context.Workspace());
    if (!dir) {
      return std::unexpected(std::move(dir.error()));
    }
    context.SetWorkingDirectory(std::move(*dir));
  }
  return {};
}

void ResetWorkspace(const std::filesystem::path& workspace) {
  if (workspace.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(workspace, ec);
  std::filesystem::create_directories(workspace, ec);
  if (ec) {
    spdlog::warn(
        "cannot recreate workspace '{}': {}", workspace.string(), ec.message());
  }
}

auto Elapsed(Clock::time_point start) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - start);
}

}  // namespace

ScenarioRunner::ScenarioRunner(
    const suite::Suite& suite, executor::ProcessSpawner& spawner,
    std::chrono::milliseconds default_timeout)
    : suite_(suite),
      spawner_(spawner),
      executor_(spawner),
      default_timeout_(default_timeout) {
  shared_scope_.name = "shared";
}

auto ScenarioRunner::ResolveTimeout(
    const suite::Step& step, const suite::Scenario& scenario) const
    -> std::chrono::milliseconds {
  if (step.timeout) {
    return *step.timeout;
  }
  if (scenario.timeout) {
    return *scenario.timeout;
  }
  if (suite_.defaults.timeout) {
    return *suite_.defaults.timeout;
  }
  return default_timeout_;
}

auto ScenarioRunner::Run(
    const suite::Scenario& scenario, const suite::Environment& environment,
    const RunSettings& settings, std::stop_token stop)
    -> result::ScenarioResult {
  auto start = Clock::now();

  if (scenario.skip_reason) {
    result::ScenarioResult skipped;
    skipped.scenario = scenario.name;
    skipped.environment = environment.name;
    skipped.index = settings.index;
    skipped.workspace = settings.workspace.string();
    skipped.status = Status::kSkipped;
    skipped.message = *scenario.skip_reason;
    for (size_t i = 0; i < scenario.steps.size(); ++i) {
      skipped.steps.push_back(
          SkippedStep(scenario.steps[i], i, "scenario skipped"));
    }
    spdlog::info(
        "[{}] {} / {}: skipped ({})", settings.index, scenario.name,
        environment.name, *scenario.skip_reason);
    return skipped;
  }

  int max_attempts = 1 + std::max(scenario.retries, 0);
  result::ScenarioResult outcome;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (attempt > 1) {
      ResetWorkspace(settings.workspace);
    }
    outcome = RunAttempt(scenario, environment, settings, stop);
    outcome.attempts = attempt;
    bool retryable =
        outcome.status == Status::kFailed || outcome.status == Status::kErrored;
    if (!retryable || stop.stop_requested()) {
      break;
    }
    if (attempt < max_attempts) {
      spdlog::info(
          "[{}] {} / {}: {} on attempt {}, retrying", settings.index,
          scenario.name, environment.name, result::ToString(outcome.status),
          attempt);
    }
  }
  outcome.elapsed = Elapsed(start);
  spdlog::info(
      "[{}] {} / {}: {} in {} ms", settings.index, scenario.name,
      environment.name, result::ToString(outcome.status),
      outcome.elapsed.count());
  return outcome;
}

auto ScenarioRunner::RunAttempt(
    const suite::Scenario& scenario, const suite::Environment& environment,
    const RunSettings& settings, std::stop_token stop)
    -> result::ScenarioResult {
  result::ScenarioResult out;
  out.scenario = scenario.name;
  out.environment = environment.name;
  out.index = settings.index;
  out.workspace = settings.workspace.string();
  out.status = Status::kRunning;

  runtime::ExecutionContext context(
      scenario, environment, settings.workspace, stop);
  bool run_steps = true;

  if (auto prepared = PrepareContext(environment, settings.seed, context);
      !prepared) {
    out.status = Status::kErrored;
    out.failure = FailureKind::kBinding;
    out.message = prepared.error().Message();
    run_steps = false;
  }

  bool isolated = environment.setup_scope == suite::SetupScope::kIsolated;
  if (run_steps && isolated && !environment.setup.empty()) {
    spdlog::debug(
        "[{}] running setup of '{}'", settings.index, environment.name);
    auto setup_status = RunSequence(
        environment.setup, context, stop, SequenceMode::kStopAtFailure,
        out.setup);
    if (setup_status != Status::kPassed) {
      out.status = setup_status == Status::kCancelled ? Status::kCancelled
                                                      : Status::kErrored;
      out.failure = setup_status == Status::kCancelled ? FailureKind::kCancelled
                                                       : FailureKind::kSetup;
      out.message = fmt::format(
          "setup of environment '{}' {}", environment.name,
          result::ToString(setup_status));
      run_steps = false;
    }
  }

  if (run_steps) {
    bool halted = false;
    for (size_t i = 0; i < scenario.steps.size(); ++i) {
      const auto& step = scenario.steps[i];
      if (halted) {
        out.steps.push_back(SkippedStep(step, i, "previous step failed"));
        continue;
      }
      auto step_result = RunStep(step, i, context, stop);
      if (step_result.status != Status::kPassed) {
        bool keep_going = step.continue_on_failure.value_or(
            scenario.continue_on_failure.value_or(false));
        if (step_result.failure == FailureKind::kBinding ||
            step_result.status == Status::kCancelled || !keep_going) {
          halted = true;
        }
        if (out.message.empty()) {
          out.failure = step_result.failure;
          out.message = fmt::format(
              "step '{}': {}", step_result.name, step_result.message);
        }
      }
      out.steps.push_back(std::move(step_result));
    }

    std::vector<Status> statuses;
    statuses.reserve(out.steps.size());
    for (const auto& step : out.steps) {
      statuses.push_back(step.status);
    }
    out.status = result::CombineStatus(statuses);
    // A scenario whose steps were all skipped still ran
    if (out.status == Status::kSkipped) {
      out.status = Status::kPassed;
    }
  } else {
    for (size_t i = 0; i < scenario.steps.size(); ++i) {
      out.steps.push_back(SkippedStep(
          scenario.steps[i], i,
          out.failure == FailureKind::kSetup ? "setup failed"
                                             : "run did not start"));
    }
  }

  context.CloseSession();

  if (isolated && !environment.teardown.empty()) {
    spdlog::debug(
        "[{}] running teardown of '{}'", settings.index, environment.name);
    // Teardown runs even after cancellation, so it gets its own token
    auto teardown_status = RunSequence(
        environment.teardown, context, std::stop_token{}, SequenceMode::kRunAll,
        out.teardown);
    context.CloseSession();
    if (teardown_status != Status::kPassed &&
        teardown_status != Status::kSkipped && out.status == Status::kPassed) {
      out.status = Status::kErrored;
      out.failure = FailureKind::kTeardown;
      out.message = fmt::format(
          "teardown of environment '{}' {}", environment.name,
          result::ToString(teardown_status));
    }
  }

  if (out.status == Status::kPassed) {
    out.failure = FailureKind::kNone;
    out.message.clear();
  }
  return out;
}

auto ScenarioRunner::RunSequence(
    std::span<const suite::Step> steps, runtime::ExecutionContext& context,
    std::stop_token stop, SequenceMode mode, std::vector<StepResult>& out)
    -> Status {
  std::vector<Status> statuses;
  bool halted = false;
  for (size_t i = 0; i < steps.size(); ++i) {
    if (halted) {
      out.push_back(SkippedStep(steps[i], i, "previous step failed"));
      continue;
    }
    auto step_result = RunStep(steps[i], i, context, stop);
    statuses.push_back(step_result.status);
    if (step_result.status != Status::kPassed &&
        mode == SequenceMode::kStopAtFailure) {
      halted = true;
    }
    out.push_back(std::move(step_result));
  }
  return result::CombineStatus(statuses);
}

auto ScenarioRunner::RunStep(
    const suite::Step& step, size_t index, runtime::ExecutionContext& context,
    std::stop_token stop) -> StepResult {
  auto out = NewStep(step, index);
  auto start = Clock::now();

  if (stop.stop_requested()) {
    MarkFailed(out, Status::kCancelled, FailureKind::kCancelled, "cancelled");
    return out;
  }

  binder::Binder binder(context.Environment(), context);
  auto timeout = ResolveTimeout(step, context.Scenario());

  if (step.cwd) {
    auto dir = binder.ResolvePath(*step.cwd, context.WorkingDirectory());
    if (!dir) {
      MarkFailed(
          out, Status::kErrored, FailureKind::kBinding,
          dir.error().Message());
      return out;
    }
    context.SetWorkingDirectory(std::move(*dir));
  }
  for (const auto& [name, value] : step.exports) {
    auto expanded = binder.Expand(value);
    if (!expanded) {
      MarkFailed(
          out, Status::kErrored, FailureKind::kBinding,
          expanded.error().Message());
      return out;
    }
    context.SetEnv(name, std::move(*expanded));
  }

  executor::ExecutionOutcome outcome;
  if (step.IsInteractive()) {
    outcome = RunInteractiveStep(step, binder, context, timeout, stop, out);
    if (out.status == Status::kErrored) {
      return out;
    }
  } else if (step.run) {
    auto bound = binder.BindCommand(*step.run);
    if (!bound) {
      MarkFailed(
          out, Status::kErrored, FailureKind::kBinding,
          bound.error().Message());
      return out;
    }
    std::string stdin_text;
    if (step.input) {
      auto input = binder.Expand(*step.input);
      if (!input) {
        MarkFailed(
            out, Status::kErrored, FailureKind::kBinding,
            input.error().Message());
        return out;
      }
      stdin_text = std::move(*input);
    }
    out.command = bound->command;
    spdlog::debug("running '{}' in '{}'", out.command, bound->working_dir.string());
    executor::CommandRequest request{
        .spawn =
            {.argv = std::move(bound->argv),
             .working_dir = std::move(bound->working_dir),
             .env = std::move(bound->env)},
        .stdin_text = std::move(stdin_text),
        .timeout = timeout,
    };
    outcome = executor_.Run(request, stop);
  } else {
    // Steps that only change cwd or exports
    out.status = Status::kPassed;
    out.elapsed = Elapsed(start);
    return out;
  }

  out.stdout_text = outcome.stdout_text;
  out.stderr_text = outcome.stderr_text;
  out.exit_code = outcome.exit_code;

  switch (outcome.reason) {
    case executor::ExitReason::kFailed:
      MarkFailed(out, Status::kErrored, FailureKind::kSpawn, outcome.error);
      break;
    case executor::ExitReason::kCancelled:
      MarkFailed(out, Status::kCancelled, FailureKind::kCancelled, "cancelled");
      break;
    case executor::ExitReason::kTimedOut:
      if (step.IsInteractive()) {
        // Unsatisfied output is a verification failure, not an error
        Verify(step, outcome, timeout, context, out);
      } else {
        MarkFailed(
            out, Status::kErrored, FailureKind::kTimeout,
            fmt::format("timed out after {} ms", timeout.count()));
      }
      break;
    case executor::ExitReason::kExited:
      Verify(step, outcome, timeout, context, out);
      break;
  }
  out.elapsed = Elapsed(start);
  return out;
}

auto ScenarioRunner::RunInteractiveStep(
    const suite::Step& step, const binder::Binder& binder,
    runtime::ExecutionContext& context, std::chrono::milliseconds timeout,
    std::stop_token stop, StepResult& out) -> executor::ExecutionOutcome {
  const auto& environment = context.Environment();
  if (!environment.session) {
    MarkFailed(
        out, Status::kErrored, FailureKind::kSpawn,
        fmt::format(
            "environment '{}' defines no interactive session",
            environment.name));
    return {};
  }

  if (context.Session() == nullptr) {
    auto bound = binder.BindCommand(*environment.session);
    if (!bound) {
      MarkFailed(
          out, Status::kErrored, FailureKind::kBinding,
          bound.error().Message());
      return {};
    }
    executor::SpawnRequest request{
        .argv = std::move(bound->argv),
        .working_dir = std::move(bound->working_dir),
        .env = std::move(bound->env),
    };
    auto session = executor::InteractiveSession::Start(spawner_, request);
    if (!session) {
      MarkFailed(
          out, Status::kErrored, FailureKind::kSpawn,
          session.error().Message());
      return {};
    }
    spdlog::debug("session for '{}' started", environment.name);
    context.AttachSession(std::move(*session));
  }

  auto input = binder.Expand(*step.send);
  if (!input) {
    MarkFailed(
        out, Status::kErrored, FailureKind::kBinding, input.error().Message());
    return {};
  }
  out.command = *input;

  const auto& bound = context.Variables();
  auto satisfied = [&](std::string_view stdout_text,
                       std::string_view stderr_text) {
    auto text = SelectStream(step.stream, stdout_text, stderr_text);
    return matcher::MatchOutput(step.expect, text, bound).satisfied;
  };
  return context.Session()->Exchange(*input, timeout, stop, satisfied);
}

void ScenarioRunner::Verify(
    const suite::Step& step, const executor::ExecutionOutcome& outcome,
    std::chrono::milliseconds timeout, runtime::ExecutionContext& context,
    StepResult& out) const {
  auto text = SelectStream(step.stream, outcome.stdout_text, outcome.stderr_text);
  auto match = matcher::MatchOutput(step.expect, text, context.Variables());
  out.patterns = match.outcomes;

  if (!match.satisfied) {
    auto kind = match.failure == matcher::MatchFailure::kInconsistentCapture
                    ? FailureKind::kInconsistentCapture
                    : FailureKind::kMismatch;
    auto message = DescribeMismatch(match);
    if (outcome.reason == executor::ExitReason::kTimedOut) {
      message += fmt::format(
          " (no matching output within {} ms)", timeout.count());
    }
    MarkFailed(out, Status::kFailed, kind, std::move(message));
    return;
  }

  // A session keeps running between exchanges, so only commands have an
  // exit code to check
  if (!step.IsInteractive() && step.exit_code) {
    if (!outcome.exit_code || *outcome.exit_code != *step.exit_code) {
      MarkFailed(
          out, Status::kFailed, FailureKind::kExitCode,
          fmt::format(
              "expected exit code {}, got {}", *step.exit_code,
              outcome.exit_code ? std::to_string(*outcome.exit_code)
                                : std::string("none")));
      return;
    }
  }

  out.status = Status::kPassed;
  out.captured = match.captured;
  context.Bind(match.captured);
}

auto ScenarioRunner::RunEnvironmentSetup(
    const suite::Environment& environment,
    const std::filesystem::path& workspace, std::stop_token stop)
    -> SharedSetup {
  SharedSetup shared;
  shared.result.environment = environment.name;

  runtime::ExecutionContext context(shared_scope_, environment, workspace, stop);
  if (auto prepared = PrepareContext(environment, {}, context); !prepared) {
    StepResult failed;
    failed.name = "prepare environment";
    MarkFailed(
        failed, Status::kErrored, FailureKind::kBinding,
        prepared.error().Message());
    shared.result.setup.push_back(std::move(failed));
    shared.result.status = Status::kErrored;
    return shared;
  }

  spdlog::info("running shared setup of '{}'", environment.name);
  shared.result.status = RunSequence(
      environment.setup, context, stop, SequenceMode::kStopAtFailure,
      shared.result.setup);
  context.CloseSession();
  shared.captured = context.Variables();
  return shared;
}

void ScenarioRunner::RunEnvironmentTeardown(
    const suite::Environment& environment,
    const std::filesystem::path& workspace, SharedSetup& shared) {
  if (environment.teardown.empty()) {
    return;
  }
  runtime::ExecutionContext context(
      shared_scope_, environment, workspace, std::stop_token{});
  if (auto prepared = PrepareContext(environment, shared.captured, context);
      !prepared) {
    StepResult failed;
    failed.name = "prepare environment";
    MarkFailed(
        failed, Status::kErrored, FailureKind::kBinding,
        prepared.error().Message());
    shared.result.teardown.push_back(std::move(failed));
    shared.result.status = Status::kErrored;
    return;
  }

  spdlog::info("running shared teardown of '{}'", environment.name);
  auto status = RunSequence(
      environment.teardown, context, std::stop_token{}, SequenceMode::kRunAll,
      shared.result.teardown);
  context.CloseSession();
  if (status != Status::kPassed && status != Status::kSkipped) {
    shared.result.status = result::Worse(shared.result.status, Status::kErrored);
  }
}

}  // namespace polyglot::runner
