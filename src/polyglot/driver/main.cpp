#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "commands.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddSuiteFiles(argparse::ArgumentParser& cmd) {
  cmd.add_argument("files").remaining().help(
      "Suite files (uses polyglot.toml if not specified)");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("polyglot", "0.1.0");
  program.add_description(
      "Run the same sample scenarios against several language environments");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Run a suite");
  run_cmd.add_argument("-j", "--jobs")
      .scan<'i', int>()
      .help("Parallel runs (0 = one per CPU)");
  run_cmd.add_argument("--timeout")
      .scan<'g', double>()
      .help("Default step timeout in seconds");
  run_cmd.add_argument("--env").append().help(
      "Environment to run (repeatable)");
  run_cmd.add_argument("--scenario")
      .append()
      .help("Scenario to run (repeatable)");
  run_cmd.add_argument("-s", "--summary")
      .default_value(false)
      .implicit_value(true)
      .help("Print per-environment counts");
  run_cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Show steps, patterns and output of each run");
  run_cmd.add_argument("--json").help("Write a JSON report ('-' for stdout)");
  run_cmd.add_argument("--xunit").help(
      "Write an xUnit XML report ('-' for stdout)");
  run_cmd.add_argument("--log-level")
      .default_value(std::string("none"))
      .help("Log level on stderr: none, info or debug");
  run_cmd.add_argument("--workspace").help("Parent directory of run workspaces");
  run_cmd.add_argument("--keep-workspace")
      .default_value(false)
      .implicit_value(true)
      .help("Do not delete run workspaces");
  AddSuiteFiles(run_cmd);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Load and validate a suite without running it");
  AddSuiteFiles(check_cmd);

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create polyglot.toml and an example suite");
  init_cmd.add_argument("dir").nargs(0, 1).help("Project directory");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing files");

  program.add_subparser(run_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    polyglot::driver::PrintError(err.what());
    std::cerr << program;
    return polyglot::driver::kExitError;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      polyglot::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return polyglot::driver::kExitError;
    }
  }

  if (program.is_subcommand_used("run")) {
    return polyglot::driver::RunCommand(run_cmd);
  }
  if (program.is_subcommand_used("check")) {
    return polyglot::driver::CheckCommand(check_cmd);
  }
  if (program.is_subcommand_used("init")) {
    return polyglot::driver::InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return polyglot::driver::kExitSuccess;
}
