#include "tests/cli/cli_test_fixture.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "polyglot/executor/process.hpp"
#include "polyglot/executor/step_executor.hpp"

namespace polyglot::test {
namespace {

// Bounds a wedged binary; no CLI test legitimately runs this long.
constexpr std::chrono::seconds kCommandTimeout{60};

}  // namespace

void CliTestFixture::SetUp() {
  std::random_device rd;
  test_dir_ = std::filesystem::temp_directory_path() /
              fmt::format("polyglot_cli_test_{}", rd());
  std::filesystem::create_directories(test_dir_);
  binary_ = POLYGLOT_BINARY;
}

void CliTestFixture::TearDown() {
  std::error_code ec;
  std::filesystem::remove_all(test_dir_, ec);
}

auto CliTestFixture::Run(std::initializer_list<std::string> args) -> CliResult {
  return RunIn(test_dir_, std::vector<std::string>(args));
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  return RunIn(test_dir_, args);
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, const std::vector<std::string>& args)
    -> CliResult {
  executor::CommandRequest request;
  request.spawn.argv.push_back(binary_.string());
  request.spawn.argv.insert(request.spawn.argv.end(), args.begin(), args.end());
  request.spawn.working_dir = dir;
  request.timeout = kCommandTimeout;

  executor::PosixProcessSpawner spawner;
  executor::StepExecutor runner(spawner);
  auto outcome = runner.Run(request, std::stop_token{});

  CliResult result{
      .exit_code = outcome.exit_code.value_or(-1),
      .stdout_output = std::move(outcome.stdout_text),
      .stderr_output = std::move(outcome.stderr_text),
      .combined_output = {},
  };
  if (outcome.reason != executor::ExitReason::kExited) {
    result.stderr_output += fmt::format(
        "\n[fixture] {}: {}", executor::ExitReasonName(outcome.reason),
        outcome.error);
  }
  result.combined_output = result.stdout_output + result.stderr_output;
  return result;
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto path = test_dir_ / relative_path;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("cannot create " + path.string());
  }
  out << content;
}

void CliTestFixture::WriteProjectToml(
    const std::vector<std::string>& files, const std::string& extra) {
  std::string list;
  for (const auto& file : files) {
    list += fmt::format("{}\"{}\"", list.empty() ? "" : ", ", file);
  }
  WriteFile("polyglot.toml", fmt::format("[suite]\nfiles = [{}]\n{}", list, extra));
}

auto CliTestFixture::FileExists(
    const std::filesystem::path& relative_path) const -> bool {
  return std::filesystem::exists(test_dir_ / relative_path);
}

auto CliTestFixture::ReadFile(const std::filesystem::path& relative_path) const
    -> std::string {
  std::ifstream in(test_dir_ / relative_path);
  if (!in) {
    throw std::runtime_error("cannot read " + relative_path.string());
  }
  std::ostringstream text;
  text << in.rdbuf();
  return text.str();
}

}  // namespace polyglot::test
