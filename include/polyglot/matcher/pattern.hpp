#pragma once

#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "polyglot/common/diagnostic.hpp"

namespace polyglot::matcher {

enum class LiteralMode : uint8_t {
  kSubstring,  // Text occurs anywhere in the line
  kLine,       // Text equals the whole line
};

// Named capture slot: the regex group that binds a variable.
struct CaptureSlot {
  std::string name;
  size_t group;
};

struct Literal {
  std::string text;
  LiteralMode mode = LiteralMode::kSubstring;
};

// ECMAScript regex. Named groups "(?<name>...)" are rewritten to plain
// groups when compiled; `slots` records which group binds which name.
struct Regex {
  std::string source;
  std::regex compiled;
  std::vector<CaptureSlot> slots;
  bool full_line = false;
};

// Always succeeds. Binds nothing and consumes no line.
struct Wildcard {};

// Literal text with embedded slots, e.g. "order {id:[0-9]+} shipped to {city}".
// A slot without an explicit regex matches a run of non-whitespace.
struct Composite {
  std::string source;
  std::regex compiled;
  std::vector<CaptureSlot> slots;
  bool full_line = false;
};

using PatternKind = std::variant<Literal, Regex, Wildcard, Composite>;

struct Pattern {
  PatternKind kind;
  bool optional = false;  // Failure does not fail the step; nothing is bound
  bool adjacent = false;  // Must match the line right after the previous match
  bool rebind = false;    // May overwrite an already bound variable
};

enum class BlockOrder : uint8_t {
  kOrdered,
  kUnordered,
};

struct Block {
  BlockOrder order = BlockOrder::kOrdered;
  std::vector<Pattern> patterns;
};

// Expected output of one step. Blocks share a single line cursor and are
// evaluated in sequence.
struct Expectation {
  std::vector<Block> blocks;

  [[nodiscard]] auto Empty() const -> bool {
    return blocks.empty();
  }

  [[nodiscard]] auto PatternCount() const -> size_t {
    size_t count = 0;
    for (const auto& block : blocks) {
      count += block.patterns.size();
    }
    return count;
  }
};

// Compile a regex pattern, extracting named capture slots.
// Returns a LoadError diagnostic (without location) on malformed input.
auto CompileRegex(std::string_view source, bool full_line) -> Result<Regex>;

// Compile a composite template into a regex with one group per slot.
auto CompileComposite(std::string_view source, bool full_line)
    -> Result<Composite>;

// Short human-readable form used in results, e.g. `regex "id=(?<id>\d+)"`.
auto Describe(const Pattern& pattern) -> std::string;

// Names of all variables a pattern can bind.
auto SlotNames(const Pattern& pattern) -> std::vector<std::string>;

}  // namespace polyglot::matcher
