#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "polyglot/binder/template.hpp"

namespace polyglot::binder {
namespace {

TEST(TemplateTest, SplitsTextPlaceholdersAndVariables) {
  auto tmpl = ParseTemplate("{run} --id ${id} done");
  ASSERT_TRUE(tmpl.has_value()) << tmpl.error().Message();
  ASSERT_EQ(tmpl->segments.size(), 4U);
  EXPECT_EQ(tmpl->segments[0].kind, Segment::Kind::kPlaceholder);
  EXPECT_EQ(tmpl->segments[0].value, "run");
  EXPECT_EQ(tmpl->segments[1].kind, Segment::Kind::kText);
  EXPECT_EQ(tmpl->segments[1].value, " --id ");
  EXPECT_EQ(tmpl->segments[2].kind, Segment::Kind::kVariable);
  EXPECT_EQ(tmpl->segments[2].value, "id");
  EXPECT_EQ(tmpl->segments[3].value, " done");
}

TEST(TemplateTest, DoubledBracesAndBareDollarAreText) {
  auto tmpl = ParseTemplate("echo {{x}} $HOME $");
  ASSERT_TRUE(tmpl.has_value()) << tmpl.error().Message();
  ASSERT_EQ(tmpl->segments.size(), 1U);
  EXPECT_EQ(tmpl->segments[0].value, "echo {x} $HOME $");
}

TEST(TemplateTest, NamesAreCollectedOnce) {
  auto tmpl = ParseTemplate("{a} {b} {a} ${v} ${v}");
  ASSERT_TRUE(tmpl.has_value());
  EXPECT_EQ(tmpl->Placeholders(), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(tmpl->Variables(), (std::vector<std::string>{"v"}));
}

TEST(TemplateTest, DottedAndDashedNamesAreAllowed) {
  auto tmpl = ParseTemplate("{py.bin} {my-tool}");
  ASSERT_TRUE(tmpl.has_value()) << tmpl.error().Message();
  EXPECT_EQ(
      tmpl->Placeholders(), (std::vector<std::string>{"py.bin", "my-tool"}));
}

TEST(TemplateTest, MalformedTemplatesAreLoadErrors) {
  for (const char* bad : {"{unterminated", "a } b", "{}", "{a b}", "${}"}) {
    auto tmpl = ParseTemplate(bad);
    ASSERT_FALSE(tmpl.has_value()) << bad;
    EXPECT_EQ(tmpl.error().Kind(), DiagKind::kLoadError);
    EXPECT_NE(
        tmpl.error().Message().find("invalid template"), std::string::npos);
  }
}

TEST(TemplateTest, BuiltinsAreRecognized) {
  EXPECT_TRUE(IsBuiltinPlaceholder("workspace"));
  EXPECT_TRUE(IsBuiltinPlaceholder("environment"));
  EXPECT_TRUE(IsBuiltinPlaceholder("scenario"));
  EXPECT_FALSE(IsBuiltinPlaceholder("run"));
}

TEST(TemplateTest, CheckPlaceholdersFollowsDefinitions) {
  PlaceholderTable table{{"run", "{bin} main.py"}, {"bin", "python3"}};
  EXPECT_TRUE(CheckPlaceholders("{run} {workspace}", table).has_value());
}

TEST(TemplateTest, CheckPlaceholdersReportsUndefinedName) {
  PlaceholderTable table{{"run", "{bin} main.py"}};
  auto checked = CheckPlaceholders("{run}", table);
  ASSERT_FALSE(checked.has_value());
  EXPECT_EQ(checked.error().Message(), "undefined placeholder '{bin}'");
}

TEST(TemplateTest, CheckPlaceholdersReportsCycle) {
  PlaceholderTable table{{"a", "{b}"}, {"b", "x {a}"}};
  auto checked = CheckPlaceholders("run {a}", table);
  ASSERT_FALSE(checked.has_value());
  EXPECT_EQ(checked.error().Message(), "placeholder cycle: a -> b -> a");
}

TEST(TemplateTest, VariablesAreNotCheckedAgainstTheTable) {
  PlaceholderTable table;
  EXPECT_TRUE(CheckPlaceholders("echo ${later}", table).has_value());
}

}  // namespace
}  // namespace polyglot::binder
