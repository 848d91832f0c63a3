#include "polyglot/scheduler/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/common/string_utils.hpp"
#include "polyglot/executor/process.hpp"
#include "polyglot/result/result.hpp"
#include "polyglot/runner/scenario_runner.hpp"

namespace polyglot::scheduler {

namespace {

using Clock = std::chrono::steady_clock;
using result::FailureKind;
using result::Status;

struct Job {
  size_t index;
  const suite::Scenario* scenario;
  const suite::Environment* environment;
  size_t environment_slot;
};

// Shared-scope state of one selected environment.
struct EnvironmentState {
  const suite::Environment* environment;
  std::filesystem::path workspace;
  std::optional<runner::SharedSetup> shared;

  [[nodiscard]] auto Blocked() const -> bool {
    return shared.has_value() && shared->result.status != Status::kPassed;
  }
};

template <typename T>
auto Select(
    const std::vector<T>& all, const std::vector<std::string>& names,
    std::string_view what, std::vector<Diagnostic>& diagnostics)
    -> std::vector<const T*> {
  std::vector<const T*> selected;
  for (const auto& name : names) {
    if (std::ranges::find(all, name, &T::name) == all.end()) {
      diagnostics.push_back(Diagnostic::LoadError(
          {}, fmt::format("unknown {} '{}'", what, name)));
    }
  }
  // Suite order, not selection order
  for (const auto& item : all) {
    if (names.empty() || std::ranges::find(names, item.name) != names.end()) {
      selected.push_back(&item);
    }
  }
  return selected;
}

auto MakeWorkspaceRoot(const RunOptions& options, bool& owned)
    -> Result<std::filesystem::path> {
  std::error_code ec;
  std::filesystem::path root = options.workspace_root;
  owned = false;
  if (root.empty()) {
    static std::atomic<unsigned> counter{0};
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
      return std::unexpected(Diagnostic::HostError(
          fmt::format("cannot locate temporary directory: {}", ec.message())));
    }
    root = base / fmt::format("polyglot-{}-{}", getpid(), counter++);
    owned = true;
  }
  std::filesystem::create_directories(root, ec);
  if (ec) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "cannot create workspace root '{}': {}", root.string(), ec.message())));
  }
  return std::filesystem::absolute(root, ec);
}

void RemoveDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  if (ec) {
    spdlog::warn("cannot remove '{}': {}", dir.string(), ec.message());
  }
}

// Result of a run that never started.
auto Unstarted(
    const Job& job, Status status, FailureKind kind, std::string message)
    -> result::ScenarioResult {
  result::ScenarioResult out;
  out.scenario = job.scenario->name;
  out.environment = job.environment->name;
  out.index = job.index;
  out.status = status;
  out.failure = kind;
  out.message = std::move(message);
  for (size_t i = 0; i < job.scenario->steps.size(); ++i) {
    result::StepResult step;
    step.name = job.scenario->steps[i].name;
    step.index = i;
    step.status = Status::kSkipped;
    step.message = "run did not start";
    out.steps.push_back(std::move(step));
  }
  return out;
}

auto WorkerCount(const RunOptions& options, size_t runs) -> size_t {
  size_t jobs = options.jobs;
  if (jobs == 0) {
    jobs = std::max<size_t>(std::thread::hardware_concurrency(), 1);
  }
  return std::max<size_t>(std::min(jobs, runs), 1);
}

}  // namespace

auto RunSuite(const suite::Suite& suite, const RunOptions& options)
    -> result::SuiteResult {
  auto start = Clock::now();
  result::SuiteResult out;
  out.suite = suite.name;

  auto environments = Select(
      suite.environments, options.environments, "environment",
      out.diagnostics);
  auto scenarios =
      Select(suite.scenarios, options.scenarios, "scenario", out.diagnostics);
  if (!out.diagnostics.empty()) {
    out.status = Status::kErrored;
    return out;
  }

  bool owned_root = false;
  auto root = MakeWorkspaceRoot(options, owned_root);
  if (!root) {
    out.diagnostics.push_back(std::move(root.error()));
    out.status = Status::kErrored;
    return out;
  }

  std::stop_source stop;
  std::stop_callback forward(
      options.stop_token, [&stop] { stop.request_stop(); });

  executor::ProcessSpawner& spawner = options.spawner != nullptr
                                          ? *options.spawner
                                          : executor::DefaultSpawner();
  runner::ScenarioRunner runner(suite, spawner, options.default_timeout);

  std::vector<EnvironmentState> states;
  for (const auto* env : environments) {
    states.push_back(EnvironmentState{
        .environment = env,
        .workspace = *root / fmt::format(
                                 "shared-{}", common::SanitizeFileName(env->name)),
        .shared = std::nullopt,
    });
  }

  std::vector<Job> plan;
  for (const auto* scenario : scenarios) {
    for (size_t e = 0; e < environments.size(); ++e) {
      plan.push_back(Job{
          .index = plan.size(),
          .scenario = scenario,
          .environment = environments[e],
          .environment_slot = e,
      });
    }
  }
  spdlog::info(
      "suite '{}': {} scenario(s) x {} environment(s) = {} run(s)", suite.name,
      scenarios.size(), environments.size(), plan.size());

  // Shared setup runs before any run of its environment is dispatched
  for (auto& state : states) {
    const auto& env = *state.environment;
    if (env.setup_scope != suite::SetupScope::kShared ||
        (env.setup.empty() && env.teardown.empty())) {
      continue;
    }
    std::error_code ec;
    std::filesystem::create_directories(state.workspace, ec);
    state.shared =
        runner.RunEnvironmentSetup(env, state.workspace, stop.get_token());
    if (state.Blocked()) {
      spdlog::warn(
          "shared setup of '{}' {}; its runs will not start", env.name,
          result::ToString(state.shared->result.status));
    }
  }

  result::ResultAggregator aggregator;
  aggregator.Reserve(plan.size());
  std::atomic<size_t> next{0};

  auto execute = [&](const Job& job) -> result::ScenarioResult {
    const auto& state = states[job.environment_slot];
    if (stop.stop_requested()) {
      return Unstarted(
          job, Status::kCancelled, FailureKind::kCancelled,
          "cancelled before start");
    }
    if (state.Blocked()) {
      bool cancelled = state.shared->result.status == Status::kCancelled;
      return Unstarted(
          job, cancelled ? Status::kCancelled : Status::kErrored,
          cancelled ? FailureKind::kCancelled : FailureKind::kSetup,
          fmt::format(
              "shared setup of environment '{}' {}", job.environment->name,
              result::ToString(state.shared->result.status)));
    }

    auto workspace =
        *root / fmt::format(
                    "{}-{}-{}", job.index,
                    common::SanitizeFileName(job.scenario->name),
                    common::SanitizeFileName(job.environment->name));
    // Leftovers of an earlier kept run must not leak into this one
    std::error_code ec;
    std::filesystem::remove_all(workspace, ec);
    std::filesystem::create_directories(workspace, ec);
    if (ec) {
      return Unstarted(
          job, Status::kErrored, FailureKind::kSpawn,
          fmt::format(
              "cannot create workspace '{}': {}", workspace.string(),
              ec.message()));
    }

    runner::RunSettings settings{
        .index = job.index,
        .workspace = workspace,
        .seed = state.shared ? state.shared->captured : matcher::Bindings{},
    };
    spdlog::debug(
        "[{}] dispatching {} / {}", job.index, job.scenario->name,
        job.environment->name);
    auto run = runner.Run(
        *job.scenario, *job.environment, settings, stop.get_token());
    if (!options.keep_workspaces) {
      RemoveDirectory(workspace);
    }
    return run;
  };

  auto worker = [&] {
    while (true) {
      size_t i = next.fetch_add(1);
      if (i >= plan.size()) {
        return;
      }
      try {
        aggregator.Record(execute(plan[i]));
      } catch (const std::exception& e) {
        spdlog::error("[{}] run aborted: {}", i, e.what());
        aggregator.Record(
            Unstarted(plan[i], Status::kErrored, FailureKind::kScheduling,
                      fmt::format("run aborted: {}", e.what())));
      }
    }
  };

  {
    std::vector<std::jthread> workers;
    size_t count = WorkerCount(options, plan.size());
    for (size_t w = 0; w < count && !plan.empty(); ++w) {
      try {
        workers.emplace_back(worker);
      } catch (const std::system_error& e) {
        spdlog::warn("cannot start worker {}: {}", w, e.what());
        if (workers.empty()) {
          out.diagnostics.push_back(Diagnostic::SchedulingError(
              fmt::format("cannot create worker threads: {}", e.what())));
        }
        break;
      }
    }
    if (workers.empty()) {
      // Nothing will drain the queue; every run is errored in place
      for (size_t i = next.exchange(plan.size()); i < plan.size(); ++i) {
        aggregator.Record(Unstarted(
            plan[i], Status::kErrored, FailureKind::kScheduling,
            "no worker thread available"));
      }
    }
  }  // jthreads join here

  for (auto& state : states) {
    if (!state.shared) {
      continue;
    }
    runner.RunEnvironmentTeardown(
        *state.environment, state.workspace, *state.shared);
    out.environments.push_back(std::move(state.shared->result));
    if (!options.keep_workspaces) {
      RemoveDirectory(state.workspace);
    }
  }
  if (owned_root && !options.keep_workspaces) {
    RemoveDirectory(*root);
  }

  aggregator.Finish(out);
  out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - start);
  auto counts = out.Counts();
  spdlog::info(
      "suite '{}' {}: {} passed, {} failed, {} errored, {} skipped, {} "
      "cancelled",
      suite.name, result::ToString(out.status), counts.passed, counts.failed,
      counts.errored, counts.skipped, counts.cancelled);
  return out;
}

}  // namespace polyglot::scheduler
