#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "polyglot/matcher/pattern.hpp"

namespace polyglot::matcher {

// Variable name -> captured value. Ordered so results are reproducible.
using Bindings = std::map<std::string, std::string, std::less<>>;

enum class MatchFailure : uint8_t {
  kNone,
  kMismatch,             // No line satisfied the pattern
  kInconsistentCapture,  // A line matched, but a slot disagreed with a
                         // variable bound earlier in the run
};

auto MatchFailureName(MatchFailure failure) -> std::string_view;

struct PatternOutcome {
  std::string description;
  bool matched = false;
  bool optional = false;
  std::optional<size_t> line;  // 0-based index into the matched lines
  MatchFailure failure = MatchFailure::kNone;
  std::string detail;
};

struct MatchResult {
  bool satisfied = false;
  MatchFailure failure = MatchFailure::kNone;  // First required failure
  std::vector<PatternOutcome> outcomes;        // Declaration order
  Bindings captured;  // New bindings; empty unless satisfied
};

// Split captured text into lines. "\r\n" is treated as "\n" and a trailing
// newline does not produce an empty last line.
auto SplitLines(std::string_view text) -> std::vector<std::string>;

// Evaluate an expectation against captured text.
// `bound` holds the variables already captured in the current run; a slot
// naming one of them must reproduce its value unless the pattern rebinds.
auto MatchOutput(
    const Expectation& expectation, std::string_view text,
    const Bindings& bound) -> MatchResult;

}  // namespace polyglot::matcher
