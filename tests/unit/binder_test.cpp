#include <gtest/gtest.h>

#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

#include "polyglot/binder/binder.hpp"
#include "polyglot/runtime/execution_context.hpp"
#include "polyglot/suite/suite.hpp"

namespace polyglot::binder {
namespace {

// =============================================================================
// SplitCommandLine
// =============================================================================

TEST(SplitCommandLineTest, SplitsOnWhitespace) {
  auto words = SplitCommandLine("  python3   main.py\t--flag ");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(
      *words, (std::vector<std::string>{"python3", "main.py", "--flag"}));
}

TEST(SplitCommandLineTest, HonorsQuotesAndEscapes) {
  auto words = SplitCommandLine(
      R"(echo 'a b' "c \"d\" $e" f\ g h'i'"j")");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(
      *words, (std::vector<std::string>{
                  "echo", "a b", "c \"d\" $e", "f g", "hij"}));
}

TEST(SplitCommandLineTest, EmptyQuotesMakeAnEmptyWord) {
  auto words = SplitCommandLine("cmd '' x");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (std::vector<std::string>{"cmd", "", "x"}));
}

TEST(SplitCommandLineTest, UnterminatedQuoteIsBindingError) {
  auto single = SplitCommandLine("echo 'oops");
  ASSERT_FALSE(single.has_value());
  EXPECT_EQ(single.error().Kind(), DiagKind::kBindingError);

  auto dbl = SplitCommandLine("echo \"oops");
  ASSERT_FALSE(dbl.has_value());
  EXPECT_EQ(dbl.error().Kind(), DiagKind::kBindingError);
}

// =============================================================================
// Binder
// =============================================================================

class BinderTest : public ::testing::Test {
 protected:
  BinderTest() {
    scenario_.name = "greets";
    environment_.name = "python";
    environment_.placeholders = {
        {"run", "{bin} {root}/hello.py"},
        {"bin", "python3"},
        {"root", "samples/py"},
        {"loop", "{loop}"},
    };
  }

  auto Context() -> runtime::ExecutionContext {
    return runtime::ExecutionContext(
        scenario_, environment_, "/work/run-1", std::stop_token{});
  }

  suite::Scenario scenario_;
  suite::Environment environment_;
};

TEST_F(BinderTest, ExpandsNestedPlaceholders) {
  auto context = Context();
  Binder binder(environment_, context);
  auto text = binder.Expand("{run} World");
  ASSERT_TRUE(text.has_value()) << text.error().Message();
  EXPECT_EQ(*text, "python3 samples/py/hello.py World");
}

TEST_F(BinderTest, ExpandsBuiltins) {
  auto context = Context();
  Binder binder(environment_, context);
  auto text = binder.Expand("{scenario}@{environment} in {workspace}");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "greets@python in /work/run-1");
}

TEST_F(BinderTest, EscapedBracesInPlaceholderStayLiteral) {
  environment_.placeholders.emplace("count", "awk 'END {{ print NR }}'");
  auto context = Context();
  Binder binder(environment_, context);
  auto text = binder.Expand("{count} < {root}/in.txt");
  ASSERT_TRUE(text.has_value()) << text.error().Message();
  EXPECT_EQ(*text, "awk 'END { print NR }' < samples/py/in.txt");
}

TEST_F(BinderTest, ExpandsCapturedVariables) {
  auto context = Context();
  context.Bind({{"id", "42"}});
  Binder binder(environment_, context);
  auto text = binder.Expand("get ${id}");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "get 42");
}

TEST_F(BinderTest, UnknownPlaceholderIsBindingError) {
  auto context = Context();
  Binder binder(environment_, context);
  auto text = binder.Expand("{missing}");
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error().Kind(), DiagKind::kBindingError);
  EXPECT_EQ(
      text.error().Message(),
      "environment 'python' has no placeholder '{missing}'");
}

TEST_F(BinderTest, UncapturedVariableIsBindingError) {
  auto context = Context();
  Binder binder(environment_, context);
  auto text = binder.Expand("get ${id}");
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(
      text.error().Message(),
      "variable '${id}' has not been captured by an earlier step");
}

TEST_F(BinderTest, SelfReferenceStopsAtDepthLimit) {
  auto context = Context();
  Binder binder(environment_, context);
  auto text = binder.Expand("{loop}");
  ASSERT_FALSE(text.has_value());
  EXPECT_NE(text.error().Message().find("nested too deeply"), std::string::npos);
}

TEST_F(BinderTest, ShellCommandRunsThroughSh) {
  auto context = Context();
  context.SetEnv("LANG", "C");
  Binder binder(environment_, context);
  auto bound = binder.BindCommand("{bin} -c 'print(1)'");
  ASSERT_TRUE(bound.has_value());
  EXPECT_EQ(bound->command, "python3 -c 'print(1)'");
  EXPECT_EQ(
      bound->argv, (std::vector<std::string>{
                       "/bin/sh", "-c", "python3 -c 'print(1)'"}));
  EXPECT_EQ(bound->working_dir, std::filesystem::path("/work/run-1"));
  ASSERT_EQ(bound->env.size(), 1U);
  EXPECT_EQ(bound->env[0].first, "LANG");
}

TEST_F(BinderTest, DirectCommandIsSplit) {
  environment_.shell = false;
  auto context = Context();
  Binder binder(environment_, context);
  auto bound = binder.BindCommand("{bin} -c 'print(1)'");
  ASSERT_TRUE(bound.has_value());
  EXPECT_EQ(
      bound->argv, (std::vector<std::string>{"python3", "-c", "print(1)"}));
}

TEST_F(BinderTest, DirectCommandMustNotBeEmpty) {
  environment_.shell = false;
  environment_.placeholders["nothing"] = "";
  auto context = Context();
  Binder binder(environment_, context);
  auto bound = binder.BindCommand("{nothing}");
  ASSERT_FALSE(bound.has_value());
  EXPECT_EQ(bound.error().Kind(), DiagKind::kBindingError);
}

TEST_F(BinderTest, ResolvePathIsRelativeToBase) {
  auto context = Context();
  Binder binder(environment_, context);
  auto relative = binder.ResolvePath("{root}/../data", "/base");
  ASSERT_TRUE(relative.has_value());
  EXPECT_EQ(*relative, std::filesystem::path("/base/samples/data"));

  auto absolute = binder.ResolvePath("{workspace}/sub", "/base");
  ASSERT_TRUE(absolute.has_value());
  EXPECT_EQ(*absolute, std::filesystem::path("/work/run-1/sub"));
}

}  // namespace
}  // namespace polyglot::binder
