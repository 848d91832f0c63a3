#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace polyglot::test {
namespace {

class InitTest : public CliTestFixture {};

TEST_F(InitTest, CreatesConfigAndSuite) {
  auto result = Run({"init"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("polyglot.toml"));
  EXPECT_TRUE(FileExists("suite.yaml"));
  EXPECT_NE(
      ReadFile("polyglot.toml").find("files = [\"suite.yaml\"]"),
      std::string::npos);
}

TEST_F(InitTest, CreatesProjectInNamedDirectory) {
  auto result = Run({"init", "demo"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("demo/polyglot.toml"));
  EXPECT_NE(ReadFile("demo/suite.yaml").find("name: demo"), std::string::npos);
}

TEST_F(InitTest, GeneratedProjectRunsAndPasses) {
  ASSERT_TRUE(Run({"init", "demo"}).Success());

  auto result = RunIn(TestDir() / "demo", {"run"});

  EXPECT_EQ(result.exit_code, 0) << result.combined_output;
  EXPECT_NE(result.stdout_output.find("1 passed"), std::string::npos);
}

TEST_F(InitTest, FailsIfConfigExistsWithoutForce) {
  WriteFile("polyglot.toml", "[suite]\nfiles = []\n");

  auto result = Run({"init"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("already exists"), std::string::npos);
  EXPECT_EQ(ReadFile("polyglot.toml"), "[suite]\nfiles = []\n");
}

TEST_F(InitTest, ForceOverwritesExistingFiles) {
  WriteFile("polyglot.toml", "[suite]\nfiles = []\n");

  auto result = Run({"init", "--force"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(ReadFile("polyglot.toml").find("suite.yaml"), std::string::npos);
}

}  // namespace
}  // namespace polyglot::test
