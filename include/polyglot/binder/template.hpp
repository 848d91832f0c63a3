#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "polyglot/common/diagnostic.hpp"

namespace polyglot::binder {

// Template syntax:
//   {name}   environment placeholder (or a builtin, see kBuiltinPlaceholders)
//   ${name}  variable captured by an earlier step of the same run
//   {{ }}    literal braces
// A '$' not followed by '{' is literal, so shell variables pass through.
struct Segment {
  enum class Kind : uint8_t {
    kText,
    kPlaceholder,
    kVariable,
  };

  Kind kind;
  std::string value;
};

struct Template {
  std::string source;
  std::vector<Segment> segments;

  [[nodiscard]] auto Placeholders() const -> std::vector<std::string>;
  [[nodiscard]] auto Variables() const -> std::vector<std::string>;
};

inline constexpr std::array<std::string_view, 3> kBuiltinPlaceholders = {
    "workspace", "environment", "scenario"};

auto IsBuiltinPlaceholder(std::string_view name) -> bool;

// Returns a LoadError diagnostic (without location) for malformed templates.
auto ParseTemplate(std::string_view source) -> Result<Template>;

using PlaceholderTable = std::map<std::string, std::string, std::less<>>;

// Checks that every placeholder reachable from `source` is defined in
// `table` (or builtin) and that placeholder definitions are acyclic.
auto CheckPlaceholders(std::string_view source, const PlaceholderTable& table)
    -> Result<void>;

}  // namespace polyglot::binder
