#include "commands.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "interrupt.hpp"
#include "polyglot/common/diagnostic.hpp"
#include "polyglot/scheduler/scheduler.hpp"
#include "polyglot/suite/suite.hpp"
#include "polyglot/suite/suite_loader.hpp"
#include "print.hpp"
#include "report.hpp"

namespace polyglot::driver {

namespace {

namespace fs = std::filesystem;

// Logs go to stderr so stdout carries only the report.
auto SetupLogging(const std::string& level) -> Result<void> {
  auto logger = spdlog::get("polyglot");
  if (!logger) {
    logger = spdlog::stderr_color_mt("polyglot");
  }
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  if (level == "none") {
    spdlog::set_level(spdlog::level::off);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "unknown log level '{}', use 'none', 'info' or 'debug'", level)));
  }
  return {};
}

// CLI files replace the config's list entirely.
auto ResolveFiles(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config)
    -> Result<std::vector<fs::path>> {
  std::vector<std::string> names;
  if (auto files = cmd.present<std::vector<std::string>>("files")) {
    names = *files;
  } else if (config) {
    names = config->files;
  }
  if (names.empty()) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "no suite files given and no {} found", kConfigFileName)));
  }
  return std::vector<fs::path>(names.begin(), names.end());
}

auto LoadSuite(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config) -> Result<suite::Suite> {
  auto files = ResolveFiles(cmd, config);
  if (!files) {
    return std::unexpected(std::move(files.error()));
  }
  return suite::LoadSuiteFromFiles(*files);
}

auto BuildOptions(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config)
    -> Result<scheduler::RunOptions> {
  scheduler::RunOptions options;

  std::optional<double> timeout;
  if (config) {
    if (config->jobs) {
      options.jobs = *config->jobs;
    }
    timeout = config->timeout_seconds;
    if (config->workspace) {
      options.workspace_root = *config->workspace;
    }
    options.keep_workspaces = config->keep_workspace;
  }

  if (auto jobs = cmd.present<int>("--jobs")) {
    if (*jobs < 0) {
      return std::unexpected(
          Diagnostic::HostError("--jobs must not be negative"));
    }
    options.jobs = static_cast<size_t>(*jobs);
  }
  if (auto seconds = cmd.present<double>("--timeout")) {
    timeout = *seconds;
  }
  if (timeout) {
    if (*timeout <= 0) {
      return std::unexpected(
          Diagnostic::HostError("timeout must be a positive number of seconds"));
    }
    options.default_timeout = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(*timeout * 1000));
  }
  if (auto envs = cmd.present<std::vector<std::string>>("--env")) {
    options.environments = *envs;
  }
  if (auto scenarios = cmd.present<std::vector<std::string>>("--scenario")) {
    options.scenarios = *scenarios;
  }
  if (auto workspace = cmd.present<std::string>("--workspace")) {
    options.workspace_root = *workspace;
  }
  if (cmd.get<bool>("--keep-workspace")) {
    options.keep_workspaces = true;
  }
  return options;
}

auto ReportPath(
    const argparse::ArgumentParser& cmd, const char* flag,
    const std::optional<std::string>& from_config)
    -> std::optional<std::string> {
  if (auto path = cmd.present<std::string>(flag)) {
    return path;
  }
  return from_config;
}

}  // namespace

auto RunCommand(const argparse::ArgumentParser& cmd) -> int {
  auto logging = SetupLogging(cmd.get<std::string>("--log-level"));
  if (!logging) {
    PrintDiagnostic(logging.error());
    return kExitError;
  }

  auto config_result = LoadOptionalConfig();
  if (!config_result) {
    PrintDiagnostic(config_result.error());
    return kExitError;
  }
  const auto& config = *config_result;

  auto suite = LoadSuite(cmd, config);
  if (!suite) {
    PrintDiagnostic(suite.error());
    return kExitError;
  }

  auto options = BuildOptions(cmd, config);
  if (!options) {
    PrintDiagnostic(options.error());
    return kExitError;
  }

  auto json_path =
      ReportPath(cmd, "--json", config ? config->json_report : std::nullopt);
  auto xunit_path =
      ReportPath(cmd, "--xunit", config ? config->xunit_report : std::nullopt);
  // A report on stdout replaces the text output
  bool quiet = json_path == "-" || xunit_path == "-";

  result::SuiteResult result;
  {
    InterruptWatcher interrupts;
    options->stop_token = interrupts.Token();
    result = scheduler::RunSuite(*suite, *options);
    if (interrupts.Signal() != 0) {
      PrintWarning(
          fmt::format("interrupted by signal {}", interrupts.Signal()));
    }
  }

  for (const auto& diag : result.diagnostics) {
    PrintDiagnostic(diag);
  }
  if (!quiet) {
    PrintRuns(result, cmd.get<bool>("--verbose"));
    if (cmd.get<bool>("--summary")) {
      PrintSummary(result);
    }
    PrintTotals(result);
  }

  int exit_code = result.Passed() ? kExitSuccess : kExitTestFailure;
  for (const auto& diag : result.diagnostics) {
    if (diag.IsError()) {
      exit_code = kExitError;
    }
  }

  if (json_path) {
    auto written = WriteJsonReport(result, *json_path);
    if (!written) {
      PrintDiagnostic(written.error());
      exit_code = kExitError;
    }
  }
  if (xunit_path) {
    auto written = WriteXunitReport(result, *xunit_path);
    if (!written) {
      PrintDiagnostic(written.error());
      exit_code = kExitError;
    }
  }
  return exit_code;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config_result = LoadOptionalConfig();
  if (!config_result) {
    PrintDiagnostic(config_result.error());
    return kExitError;
  }

  auto suite = LoadSuite(cmd, *config_result);
  if (!suite) {
    PrintDiagnostic(suite.error());
    return kExitError;
  }

  fmt::print(
      "suite '{}': {} environment(s), {} scenario(s), {} run(s)\n",
      suite->name, suite->environments.size(), suite->scenarios.size(),
      suite->environments.size() * suite->scenarios.size());
  return kExitSuccess;
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  bool force = cmd.get<bool>("--force");
  fs::path project_dir = fs::current_path();
  if (auto dir = cmd.present<std::string>("dir")) {
    project_dir = fs::absolute(*dir);
  }

  const fs::path toml_path = project_dir / kConfigFileName;
  const fs::path suite_path = project_dir / "suite.yaml";
  if (!force) {
    for (const auto& path : {toml_path, suite_path}) {
      if (fs::exists(path)) {
        PrintError(fmt::format(
            "{} already exists (use --force to overwrite)",
            path.filename().string()));
        return kExitError;
      }
    }
  }

  std::error_code ec;
  fs::create_directories(project_dir, ec);
  if (ec) {
    PrintError(fmt::format(
        "cannot create '{}': {}", project_dir.string(), ec.message()));
    return kExitError;
  }

  std::string project_name = project_dir.filename().string();
  std::ofstream toml_file(toml_path);
  toml_file << "[suite]\n"
               "files = [\"suite.yaml\"]\n"
               "\n"
               "[run]\n"
               "jobs = 0\n"
               "timeout = 30\n";

  std::ofstream suite_file(suite_path);
  suite_file << fmt::format(
      "type: suite\n"
      "name: {}\n"
      "environments:\n"
      "  shell:\n"
      "    placeholders:\n"
      "      greet: \"echo Hello,\"\n"
      "scenarios:\n"
      "  - name: greets\n"
      "    steps:\n"
      "      - run: \"{{greet}} World\"\n"
      "        expect:\n"
      "          - \"Hello, World\"\n",
      project_name);

  if (!toml_file || !suite_file) {
    PrintError(fmt::format("cannot write to '{}'", project_dir.string()));
    return kExitError;
  }
  fmt::print("Created project '{}'\n", project_name);
  return kExitSuccess;
}

}  // namespace polyglot::driver
