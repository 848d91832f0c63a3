#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "polyglot/matcher/matcher.hpp"
#include "polyglot/matcher/pattern.hpp"

namespace polyglot::matcher {
namespace {

auto Lit(std::string text, LiteralMode mode = LiteralMode::kSubstring)
    -> Pattern {
  return Pattern{.kind = Literal{.text = std::move(text), .mode = mode}};
}

auto Re(std::string_view source, bool full_line = false) -> Pattern {
  auto compiled = CompileRegex(source, full_line);
  EXPECT_TRUE(compiled.has_value());
  return Pattern{.kind = std::move(*compiled)};
}

auto Comp(std::string_view source) -> Pattern {
  auto compiled = CompileComposite(source, false);
  EXPECT_TRUE(compiled.has_value());
  return Pattern{.kind = std::move(*compiled)};
}

auto Ordered(std::vector<Pattern> patterns) -> Block {
  return Block{.order = BlockOrder::kOrdered, .patterns = std::move(patterns)};
}

auto Unordered(std::vector<Pattern> patterns) -> Block {
  return Block{.order = BlockOrder::kUnordered, .patterns = std::move(patterns)};
}

auto Expect(std::vector<Block> blocks) -> Expectation {
  return Expectation{.blocks = std::move(blocks)};
}

const Bindings kNone;

// =============================================================================
// SplitLines
// =============================================================================

TEST(MatcherTest, SplitLinesHandlesCrLfAndTrailingNewline) {
  EXPECT_EQ(SplitLines("a\r\nb\n"), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(SplitLines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
  EXPECT_TRUE(SplitLines("").empty());
}

// =============================================================================
// Literal and ordered matching
// =============================================================================

TEST(MatcherTest, EmptyExpectationAlwaysMatches) {
  auto result = MatchOutput(Expectation{}, "anything", kNone);
  EXPECT_TRUE(result.satisfied);
  EXPECT_TRUE(result.outcomes.empty());
}

TEST(MatcherTest, SubstringAndLineModes) {
  auto text = "Hello, World\n";
  EXPECT_TRUE(
      MatchOutput(Expect({Ordered({Lit("World")})}), text, kNone).satisfied);
  EXPECT_FALSE(MatchOutput(
                   Expect({Ordered({Lit("World", LiteralMode::kLine)})}), text,
                   kNone)
                   .satisfied);
  EXPECT_TRUE(MatchOutput(
                  Expect({Ordered({Lit("Hello, World", LiteralMode::kLine)})}),
                  text, kNone)
                  .satisfied);
}

TEST(MatcherTest, OrderedPatternsMustAppearInOrder) {
  auto text = "first\nsecond\nthird\n";
  auto in_order = MatchOutput(
      Expect({Ordered({Lit("first"), Lit("third")})}), text, kNone);
  EXPECT_TRUE(in_order.satisfied);
  ASSERT_EQ(in_order.outcomes.size(), 2U);
  EXPECT_EQ(in_order.outcomes[0].line, 0U);
  EXPECT_EQ(in_order.outcomes[1].line, 2U);

  auto reversed = MatchOutput(
      Expect({Ordered({Lit("third"), Lit("first")})}), text, kNone);
  EXPECT_FALSE(reversed.satisfied);
  EXPECT_EQ(reversed.failure, MatchFailure::kMismatch);
  EXPECT_TRUE(reversed.outcomes[0].matched);
  EXPECT_FALSE(reversed.outcomes[1].matched);
  EXPECT_EQ(reversed.outcomes[1].detail, "output ended before a match");
}

TEST(MatcherTest, EachLineIsConsumedOnce) {
  auto result = MatchOutput(
      Expect({Ordered({Lit("x"), Lit("x")})}), "x\n", kNone);
  EXPECT_FALSE(result.satisfied);
}

TEST(MatcherTest, AdjacentRequiresTheNextLine) {
  auto text = "a\nb\nc\n";
  auto next = Lit("b");
  next.adjacent = true;
  EXPECT_TRUE(
      MatchOutput(Expect({Ordered({Lit("a"), next})}), text, kNone).satisfied);

  auto skip = Lit("c");
  skip.adjacent = true;
  auto result = MatchOutput(Expect({Ordered({Lit("a"), skip})}), text, kNone);
  EXPECT_FALSE(result.satisfied);
  EXPECT_EQ(result.outcomes[1].detail, "line 2 does not match");
}

TEST(MatcherTest, OptionalPatternDoesNotFailTheStep) {
  auto maybe = Lit("warning");
  maybe.optional = true;
  auto result = MatchOutput(
      Expect({Ordered({Lit("start"), maybe, Lit("end")})}), "start\nend\n",
      kNone);
  EXPECT_TRUE(result.satisfied);
  EXPECT_FALSE(result.outcomes[1].matched);
  EXPECT_TRUE(result.outcomes[1].optional);
  EXPECT_TRUE(result.outcomes[2].matched);
}

TEST(MatcherTest, WildcardConsumesNothing) {
  auto result = MatchOutput(
      Expect({Ordered({Pattern{.kind = Wildcard{}}, Lit("only")})}), "only\n",
      kNone);
  EXPECT_TRUE(result.satisfied);
  EXPECT_TRUE(result.outcomes[0].matched);
  EXPECT_FALSE(result.outcomes[0].line.has_value());
  EXPECT_EQ(result.outcomes[1].line, 0U);
}

TEST(MatcherTest, BlocksShareOneCursor) {
  auto text = "a\nb\nc\n";
  auto ok = MatchOutput(
      Expect({Ordered({Lit("b")}), Ordered({Lit("c")})}), text, kNone);
  EXPECT_TRUE(ok.satisfied);

  auto behind = MatchOutput(
      Expect({Ordered({Lit("b")}), Ordered({Lit("a")})}), text, kNone);
  EXPECT_FALSE(behind.satisfied);
}

// =============================================================================
// Regex and composite capture
// =============================================================================

TEST(MatcherTest, RegexCapturesNamedGroups) {
  auto result = MatchOutput(
      Expect({Ordered({Re(R"(id=(?<id>\d+))")})}), "created id=42\n", kNone);
  ASSERT_TRUE(result.satisfied);
  EXPECT_EQ(result.captured.at("id"), "42");
}

TEST(MatcherTest, FullLineRegexMustCoverTheLine) {
  EXPECT_FALSE(
      MatchOutput(Expect({Ordered({Re("\\d+", true)})}), "x 12\n", kNone)
          .satisfied);
  EXPECT_TRUE(
      MatchOutput(Expect({Ordered({Re("\\d+", true)})}), "12\n", kNone)
          .satisfied);
}

TEST(MatcherTest, CompositeCapturesSlots) {
  auto result = MatchOutput(
      Expect({Ordered({Comp("order {order:[0-9]+} shipped to {city}")})}),
      "order 7 shipped to Oslo\n", kNone);
  ASSERT_TRUE(result.satisfied);
  EXPECT_EQ(result.captured.at("order"), "7");
  EXPECT_EQ(result.captured.at("city"), "Oslo");
}

TEST(MatcherTest, CapturedValueIsAReferenceWithinAStep) {
  auto text = "id=5\nlookup 5 ok\n";
  auto good = MatchOutput(
      Expect({Ordered({Re(R"(id=(?<id>\d+))"), Comp("lookup {id} ok")})}),
      text, kNone);
  EXPECT_TRUE(good.satisfied);

  auto bad = MatchOutput(
      Expect({Ordered({Re(R"(id=(?<id>\d+))"), Comp("lookup {id} ok")})}),
      "id=5\nlookup 6 ok\n", kNone);
  EXPECT_FALSE(bad.satisfied);
  EXPECT_EQ(bad.failure, MatchFailure::kInconsistentCapture);
  EXPECT_NE(bad.outcomes[1].detail.find("\"5\""), std::string::npos);
  EXPECT_TRUE(bad.captured.empty());
}

TEST(MatcherTest, EarlierBindingsConstrainCapture) {
  Bindings bound{{"id", "42"}};
  auto same = MatchOutput(
      Expect({Ordered({Re(R"(id=(?<id>\d+))")})}), "id=42\n", bound);
  EXPECT_TRUE(same.satisfied);

  auto differs = MatchOutput(
      Expect({Ordered({Re(R"(id=(?<id>\d+))")})}), "id=43\n", bound);
  EXPECT_FALSE(differs.satisfied);
  EXPECT_EQ(differs.failure, MatchFailure::kInconsistentCapture);
}

TEST(MatcherTest, InconsistentLineIsSkippedForALaterConsistentOne) {
  Bindings bound{{"id", "42"}};
  auto result = MatchOutput(
      Expect({Ordered({Re(R"(id=(?<id>\d+))")})}), "id=43\nid=42\n", bound);
  EXPECT_TRUE(result.satisfied);
  EXPECT_EQ(result.outcomes[0].line, 1U);
}

TEST(MatcherTest, RebindOverwritesEarlierBinding) {
  Bindings bound{{"id", "42"}};
  auto pattern = Re(R"(id=(?<id>\d+))");
  pattern.rebind = true;
  auto result =
      MatchOutput(Expect({Ordered({std::move(pattern)})}), "id=43\n", bound);
  ASSERT_TRUE(result.satisfied);
  EXPECT_EQ(result.captured.at("id"), "43");
}

// =============================================================================
// Unordered blocks
// =============================================================================

TEST(MatcherTest, UnorderedBlockAcceptsAnyOrder) {
  auto result = MatchOutput(
      Expect({Unordered({Lit("b"), Lit("a")})}), "a\nb\n", kNone);
  EXPECT_TRUE(result.satisfied);
  EXPECT_EQ(result.outcomes[0].line, 1U);
  EXPECT_EQ(result.outcomes[1].line, 0U);
}

TEST(MatcherTest, UnorderedBlockBacktracksToDistinctLines) {
  // Greedy assignment of "a" to line 0 would starve "ab"
  auto result = MatchOutput(
      Expect({Unordered({Lit("a"), Lit("ab", LiteralMode::kLine)})}),
      "ab\na\n", kNone);
  EXPECT_TRUE(result.satisfied);
  EXPECT_EQ(result.outcomes[0].line, 1U);
  EXPECT_EQ(result.outcomes[1].line, 0U);
}

TEST(MatcherTest, UnorderedBlockReportsMissingPattern) {
  auto result = MatchOutput(
      Expect({Unordered({Lit("a"), Lit("z")})}), "a\nb\n", kNone);
  EXPECT_FALSE(result.satisfied);
  EXPECT_TRUE(result.outcomes[0].matched);
  EXPECT_FALSE(result.outcomes[1].matched);
  EXPECT_EQ(result.outcomes[1].detail, "no remaining line matches");
}

TEST(MatcherTest, UnorderedBlockAdvancesCursorPastLastLine) {
  auto result = MatchOutput(
      Expect(
          {Unordered({Lit("b"), Lit("a")}), Ordered({Lit("c")})}),
      "a\nb\nc\n", kNone);
  EXPECT_TRUE(result.satisfied);

  auto behind = MatchOutput(
      Expect({Unordered({Lit("c"), Lit("b")}), Ordered({Lit("a")})}),
      "a\nb\nc\n", kNone);
  EXPECT_FALSE(behind.satisfied);
}

TEST(MatcherTest, UnorderedBlockKeepsCapturesConsistent) {
  auto result = MatchOutput(
      Expect({Unordered({Comp("user {u} logged in"), Comp("bye {u}")})}),
      "bye bob\nuser alice logged in\nuser bob logged in\n", kNone);
  ASSERT_TRUE(result.satisfied);
  EXPECT_EQ(result.captured.at("u"), "bob");
  EXPECT_EQ(result.outcomes[0].line, 2U);
}

// =============================================================================
// Purity
// =============================================================================

TEST(MatcherTest, MatchingIsRepeatable) {
  auto expectation =
      Expect({Ordered({Re(R"(v=(?<v>\w+))"), Lit("done")})});
  auto first = MatchOutput(expectation, "v=1\ndone\n", kNone);
  auto second = MatchOutput(expectation, "v=1\ndone\n", kNone);
  EXPECT_EQ(first.satisfied, second.satisfied);
  EXPECT_EQ(first.captured, second.captured);
}

}  // namespace
}  // namespace polyglot::matcher
