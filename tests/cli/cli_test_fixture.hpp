#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace polyglot::test {

// Exit status and streams of one polyglot invocation. exit_code is -1 when
// the binary could not be started or had to be killed.
struct CliResult {
  int exit_code;
  std::string stdout_output;
  std::string stderr_output;
  std::string combined_output;  // stdout followed by stderr

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Runs the built polyglot binary through the engine's own StepExecutor,
// inside a scratch directory that is removed after each test.
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create a polyglot.toml listing the given suite files
  void WriteProjectToml(
      const std::vector<std::string>& files, const std::string& extra = "");

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path binary_;
};

}  // namespace polyglot::test
