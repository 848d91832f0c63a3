#include "polyglot/matcher/matcher.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "polyglot/common/overloaded.hpp"
#include "polyglot/matcher/pattern.hpp"

namespace polyglot::matcher {

namespace {

// Upper bound on nodes visited while searching an unordered assignment.
constexpr size_t kSearchBudget = 100000;

auto MatchRegex(
    const std::regex& re, const std::vector<CaptureSlot>& slots,
    bool full_line, const std::string& line, Bindings& captures) -> bool {
  std::smatch match;
  bool found = full_line ? std::regex_match(line, match, re)
                         : std::regex_search(line, match, re);
  if (!found) {
    return false;
  }
  for (const auto& slot : slots) {
    // Groups that did not participate in the match bind nothing
    if (slot.group < match.size() && match[slot.group].matched) {
      captures[slot.name] = match[slot.group].str();
    }
  }
  return true;
}

// Textual match of one pattern against one line, ignoring consistency.
auto MatchText(const Pattern& pattern, const std::string& line,
               Bindings& captures) -> bool {
  return std::visit(
      Overloaded{
          [&](const Literal& l) {
            if (l.mode == LiteralMode::kLine) {
              return line == l.text;
            }
            return line.find(l.text) != std::string::npos;
          },
          [&](const Regex& r) {
            return MatchRegex(r.compiled, r.slots, r.full_line, line, captures);
          },
          [](const Wildcard&) { return true; },
          [&](const Composite& c) {
            return MatchRegex(c.compiled, c.slots, c.full_line, line, captures);
          },
      },
      pattern.kind);
}

auto IsWildcard(const Pattern& pattern) -> bool {
  return std::holds_alternative<Wildcard>(pattern.kind);
}

// Variables visible while matching one step: the run's bindings overlaid
// with the ones captured earlier in this step.
class Scope {
 public:
  explicit Scope(const Bindings& bound) : bound_(bound) {
  }

  [[nodiscard]] auto Lookup(const std::string& name) const
      -> const std::string* {
    if (auto it = pending_.find(name); it != pending_.end()) {
      return &it->second;
    }
    if (auto it = bound_.find(name); it != bound_.end()) {
      return &it->second;
    }
    return nullptr;
  }

  void Commit(const Bindings& captures) {
    for (const auto& [name, value] : captures) {
      pending_[name] = value;
    }
  }

  [[nodiscard]] auto Pending() const -> const Bindings& {
    return pending_;
  }

 private:
  const Bindings& bound_;
  Bindings pending_;
};

// Checks captures against the scope, with `extra` taking precedence.
// On conflict fills `detail` and returns false.
auto IsConsistent(
    const Pattern& pattern, const Bindings& captures, const Scope& scope,
    const Bindings& extra, std::string* detail) -> bool {
  if (pattern.rebind) {
    return true;
  }
  for (const auto& [name, value] : captures) {
    const std::string* existing = nullptr;
    if (auto it = extra.find(name); it != extra.end()) {
      existing = &it->second;
    } else {
      existing = scope.Lookup(name);
    }
    if (existing != nullptr && *existing != value) {
      if (detail != nullptr) {
        *detail = fmt::format(
            "'{}' is bound to \"{}\" but output has \"{}\"", name, *existing,
            value);
      }
      return false;
    }
  }
  return true;
}

struct Evaluation {
  explicit Evaluation(const Bindings& bound) : scope(bound) {
  }

  void Fail(MatchFailure kind) {
    if (failure == MatchFailure::kNone) {
      failure = kind;
    }
  }

  Scope scope;
  size_t cursor = 0;
  MatchFailure failure = MatchFailure::kNone;
  std::vector<PatternOutcome> outcomes;
};

auto NewOutcome(const Pattern& pattern) -> PatternOutcome {
  return PatternOutcome{
      .description = Describe(pattern),
      .matched = false,
      .optional = pattern.optional,
      .line = std::nullopt,
      .failure = MatchFailure::kNone,
      .detail = {},
  };
}

void MatchOrdered(
    const Block& block, const std::vector<std::string>& lines,
    Evaluation& eval) {
  for (const auto& pattern : block.patterns) {
    auto outcome = NewOutcome(pattern);
    if (IsWildcard(pattern)) {
      outcome.matched = true;
      eval.outcomes.push_back(std::move(outcome));
      continue;
    }

    size_t end = pattern.adjacent ? std::min(eval.cursor + 1, lines.size())
                                  : lines.size();
    bool saw_inconsistent = false;
    std::string inconsistency;
    for (size_t i = eval.cursor; i < end; ++i) {
      Bindings captures;
      if (!MatchText(pattern, lines[i], captures)) {
        continue;
      }
      std::string detail;
      if (!IsConsistent(pattern, captures, eval.scope, {}, &detail)) {
        if (!saw_inconsistent) {
          saw_inconsistent = true;
          inconsistency = std::move(detail);
        }
        continue;
      }
      eval.scope.Commit(captures);
      eval.cursor = i + 1;
      outcome.matched = true;
      outcome.line = i;
      break;
    }

    if (!outcome.matched) {
      if (saw_inconsistent) {
        outcome.failure = MatchFailure::kInconsistentCapture;
        outcome.detail = std::move(inconsistency);
      } else {
        outcome.failure = MatchFailure::kMismatch;
        if (eval.cursor >= lines.size()) {
          outcome.detail = "output ended before a match";
        } else if (pattern.adjacent) {
          outcome.detail =
              fmt::format("line {} does not match", eval.cursor + 1);
        } else {
          outcome.detail = fmt::format(
              "no matching line at or after line {}", eval.cursor + 1);
        }
      }
      if (!pattern.optional) {
        eval.Fail(outcome.failure);
      }
    }
    eval.outcomes.push_back(std::move(outcome));
  }
}

// Backtracking search for an assignment of patterns to distinct lines.
class UnorderedSearch {
 public:
  UnorderedSearch(
      const Block& block, const std::vector<std::string>& lines, size_t cursor,
      const Scope& scope)
      : block_(block),
        scope_(scope),
        cursor_(cursor),
        line_count_(lines.size() > cursor ? lines.size() - cursor : 0),
        table_(block.patterns.size()),
        assignment_(block.patterns.size()),
        used_(line_count_, false) {
    for (size_t p = 0; p < block.patterns.size(); ++p) {
      table_[p].resize(line_count_);
      if (IsWildcard(block.patterns[p])) {
        continue;
      }
      for (size_t j = 0; j < line_count_; ++j) {
        Bindings captures;
        if (MatchText(block.patterns[p], lines[cursor + j], captures)) {
          table_[p][j] = std::move(captures);
        }
      }
    }
  }

  auto Solve() -> bool {
    return Visit(0, {});
  }

  // Line chosen for pattern p, as an absolute line index.
  [[nodiscard]] auto LineFor(size_t p) const -> std::optional<size_t> {
    if (!assignment_[p]) {
      return std::nullopt;
    }
    return cursor_ + *assignment_[p];
  }

  [[nodiscard]] auto CapturesFor(size_t p) const -> const Bindings& {
    return *table_[p][*assignment_[p]];
  }

  [[nodiscard]] auto LineCount() const -> size_t {
    return line_count_;
  }

  [[nodiscard]] auto TextualMatch(size_t p, size_t j) const
      -> const std::optional<Bindings>& {
    return table_[p][j];
  }

 private:
  auto Visit(size_t p, const Bindings& pending) -> bool {
    if (++visited_ > kSearchBudget) {
      return false;
    }
    if (p == block_.patterns.size()) {
      return true;
    }
    const auto& pattern = block_.patterns[p];
    if (IsWildcard(pattern)) {
      assignment_[p] = std::nullopt;
      return Visit(p + 1, pending);
    }
    for (size_t j = 0; j < line_count_; ++j) {
      if (used_[j] || !table_[p][j]) {
        continue;
      }
      const auto& captures = *table_[p][j];
      if (!IsConsistent(pattern, captures, scope_, pending, nullptr)) {
        continue;
      }
      Bindings next = pending;
      for (const auto& [name, value] : captures) {
        next[name] = value;
      }
      used_[j] = true;
      assignment_[p] = j;
      if (Visit(p + 1, next)) {
        return true;
      }
      used_[j] = false;
    }
    assignment_[p] = std::nullopt;
    if (pattern.optional) {
      return Visit(p + 1, pending);
    }
    return false;
  }

  const Block& block_;
  const Scope& scope_;
  size_t cursor_;
  size_t line_count_;
  std::vector<std::vector<std::optional<Bindings>>> table_;
  std::vector<std::optional<size_t>> assignment_;
  std::vector<bool> used_;
  size_t visited_ = 0;
};

void MatchUnordered(
    const Block& block, const std::vector<std::string>& lines,
    Evaluation& eval) {
  UnorderedSearch search(block, lines, eval.cursor, eval.scope);
  std::vector<PatternOutcome> outcomes;
  outcomes.reserve(block.patterns.size());

  if (search.Solve()) {
    size_t next_cursor = eval.cursor;
    for (size_t p = 0; p < block.patterns.size(); ++p) {
      const auto& pattern = block.patterns[p];
      auto outcome = NewOutcome(pattern);
      auto line = search.LineFor(p);
      if (IsWildcard(pattern)) {
        outcome.matched = true;
      } else if (line) {
        outcome.matched = true;
        outcome.line = line;
        eval.scope.Commit(search.CapturesFor(p));
        next_cursor = std::max(next_cursor, *line + 1);
      } else {
        outcome.failure = MatchFailure::kMismatch;
        outcome.detail = "no remaining line matches";
      }
      outcomes.push_back(std::move(outcome));
    }
    eval.cursor = next_cursor;
    for (auto& outcome : outcomes) {
      eval.outcomes.push_back(std::move(outcome));
    }
    return;
  }

  // No complete assignment: report a first-fit pass so each pattern says why
  std::vector<bool> used(search.LineCount(), false);
  Bindings pending;
  for (size_t p = 0; p < block.patterns.size(); ++p) {
    const auto& pattern = block.patterns[p];
    auto outcome = NewOutcome(pattern);
    if (IsWildcard(pattern)) {
      outcome.matched = true;
      outcomes.push_back(std::move(outcome));
      continue;
    }
    bool saw_inconsistent = false;
    std::string inconsistency;
    for (size_t j = 0; j < search.LineCount(); ++j) {
      const auto& captures = search.TextualMatch(p, j);
      if (used[j] || !captures) {
        continue;
      }
      std::string detail;
      if (!IsConsistent(pattern, *captures, eval.scope, pending, &detail)) {
        if (!saw_inconsistent) {
          saw_inconsistent = true;
          inconsistency = std::move(detail);
        }
        continue;
      }
      used[j] = true;
      for (const auto& [name, value] : *captures) {
        pending[name] = value;
      }
      outcome.matched = true;
      outcome.line = eval.cursor + j;
      break;
    }
    if (!outcome.matched) {
      outcome.failure = saw_inconsistent ? MatchFailure::kInconsistentCapture
                                         : MatchFailure::kMismatch;
      outcome.detail = saw_inconsistent ? std::move(inconsistency)
                                        : "no remaining line matches";
      if (!pattern.optional) {
        eval.Fail(outcome.failure);
      }
    }
    outcomes.push_back(std::move(outcome));
  }
  // Only reached when the search budget ran out on a satisfiable block
  if (eval.failure == MatchFailure::kNone) {
    eval.scope.Commit(pending);
    for (const auto& outcome : outcomes) {
      if (outcome.line) {
        eval.cursor = std::max(eval.cursor, *outcome.line + 1);
      }
    }
  }
  for (auto& outcome : outcomes) {
    eval.outcomes.push_back(std::move(outcome));
  }
}

}  // namespace

auto MatchFailureName(MatchFailure failure) -> std::string_view {
  switch (failure) {
    case MatchFailure::kNone:
      return "none";
    case MatchFailure::kMismatch:
      return "mismatch";
    case MatchFailure::kInconsistentCapture:
      return "inconsistent capture";
  }
  return "mismatch";
}

auto SplitLines(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::string current;
  for (char c : text) {
    if (c == '\r') {
      continue;
    }
    if (c == '\n') {
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current += c;
  }
  if (!current.empty()) {
    lines.push_back(std::move(current));
  }
  return lines;
}

auto MatchOutput(
    const Expectation& expectation, std::string_view text,
    const Bindings& bound) -> MatchResult {
  auto lines = SplitLines(text);
  Evaluation eval(bound);

  for (const auto& block : expectation.blocks) {
    if (block.order == BlockOrder::kOrdered) {
      MatchOrdered(block, lines, eval);
    } else {
      MatchUnordered(block, lines, eval);
    }
  }

  MatchResult result;
  result.satisfied = eval.failure == MatchFailure::kNone;
  result.failure = eval.failure;
  result.outcomes = std::move(eval.outcomes);
  if (result.satisfied) {
    result.captured = eval.scope.Pending();
  }
  return result;
}

}  // namespace polyglot::matcher
