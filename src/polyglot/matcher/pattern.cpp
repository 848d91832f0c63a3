#include "polyglot/matcher/pattern.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/common/overloaded.hpp"
#include "polyglot/common/string_utils.hpp"

namespace polyglot::matcher {

namespace {

auto IsNameStart(char c) -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto IsNameChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto HasSlot(const std::vector<CaptureSlot>& slots, std::string_view name)
    -> bool {
  return std::ranges::any_of(
      slots, [&](const CaptureSlot& slot) { return slot.name == name; });
}

struct RewrittenRegex {
  std::string source;
  std::vector<CaptureSlot> slots;
  size_t group_count = 0;
};

// Rewrite "(?<name>" to "(" and number every capturing group. std::regex
// (ECMAScript) has no named groups, so names live beside the compiled regex.
auto RewriteNamedGroups(std::string_view source) -> Result<RewrittenRegex> {
  RewrittenRegex out;
  out.source.reserve(source.size());
  bool in_class = false;

  for (size_t i = 0; i < source.size(); ++i) {
    char c = source[i];
    if (c == '\\') {
      out.source += c;
      if (i + 1 < source.size()) {
        out.source += source[++i];
      }
      continue;
    }
    if (in_class) {
      if (c == ']') {
        in_class = false;
      }
      out.source += c;
      continue;
    }
    if (c == '[') {
      in_class = true;
      out.source += c;
      continue;
    }
    if (c != '(') {
      out.source += c;
      continue;
    }

    bool is_question = i + 1 < source.size() && source[i + 1] == '?';
    if (!is_question) {
      ++out.group_count;
      out.source += c;
      continue;
    }

    // (?<name>...) is a named group; (?<= and (?<! would be lookbehind
    bool is_named = i + 3 < source.size() && source[i + 2] == '<' &&
                    source[i + 3] != '=' && source[i + 3] != '!';
    if (!is_named) {
      out.source += c;
      continue;
    }

    size_t name_begin = i + 3;
    size_t j = name_begin;
    while (j < source.size() && IsNameChar(source[j])) {
      ++j;
    }
    if (j == name_begin || j >= source.size() || source[j] != '>' ||
        !IsNameStart(source[name_begin])) {
      return std::unexpected(
          Diagnostic::LoadError(
              {}, fmt::format(
                      "invalid regex '{}': malformed named group at offset {}",
                      source, i)));
    }
    std::string name(source.substr(name_begin, j - name_begin));
    if (HasSlot(out.slots, name)) {
      return std::unexpected(
          Diagnostic::LoadError(
              {}, fmt::format(
                      "invalid regex '{}': duplicate capture name '{}'", source,
                      name)));
    }
    ++out.group_count;
    out.slots.push_back(CaptureSlot{.name = name, .group = out.group_count});
    out.source += '(';
    i = j;
  }
  return out;
}

auto CompileStdRegex(const std::string& rewritten, std::string_view original)
    -> Result<std::regex> {
  try {
    return std::regex(rewritten, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    return std::unexpected(
        Diagnostic::LoadError(
            {}, fmt::format("invalid regex '{}': {}", original, e.what())));
  }
}

}  // namespace

auto CompileRegex(std::string_view source, bool full_line) -> Result<Regex> {
  auto rewritten = RewriteNamedGroups(source);
  if (!rewritten) {
    return std::unexpected(std::move(rewritten.error()));
  }
  auto compiled = CompileStdRegex(rewritten->source, source);
  if (!compiled) {
    return std::unexpected(std::move(compiled.error()));
  }
  return Regex{
      .source = std::string(source),
      .compiled = std::move(*compiled),
      .slots = std::move(rewritten->slots),
      .full_line = full_line,
  };
}

auto CompileComposite(std::string_view source, bool full_line)
    -> Result<Composite> {
  std::string regex;
  std::string literal;
  std::vector<CaptureSlot> slots;
  size_t group_count = 0;

  auto error = [&](std::string detail) {
    return std::unexpected(
        Diagnostic::LoadError(
            {}, fmt::format("invalid composite '{}': {}", source, detail)));
  };
  auto flush_literal = [&] {
    regex += common::EscapeRegex(literal);
    literal.clear();
  };

  for (size_t i = 0; i < source.size(); ++i) {
    char c = source[i];
    if (c == '}') {
      if (i + 1 < source.size() && source[i + 1] == '}') {
        literal += '}';
        ++i;
        continue;
      }
      return error(fmt::format("unmatched '}}' at offset {}", i));
    }
    if (c != '{') {
      literal += c;
      continue;
    }
    if (i + 1 < source.size() && source[i + 1] == '{') {
      literal += '{';
      ++i;
      continue;
    }

    size_t name_begin = i + 1;
    size_t j = name_begin;
    while (j < source.size() && IsNameChar(source[j])) {
      ++j;
    }
    if (j == name_begin || !IsNameStart(source[name_begin])) {
      return error(fmt::format("expected slot name at offset {}", name_begin));
    }
    std::string name(source.substr(name_begin, j - name_begin));
    if (HasSlot(slots, name)) {
      return error(fmt::format("duplicate slot '{}'", name));
    }

    std::string slot_regex = "\\S+";
    if (j < source.size() && source[j] == ':') {
      size_t k = j + 1;
      int depth = 0;
      while (k < source.size()) {
        if (source[k] == '\\') {
          k += 2;
          continue;
        }
        if (source[k] == '{') {
          ++depth;
        } else if (source[k] == '}') {
          if (depth == 0) {
            break;
          }
          --depth;
        }
        ++k;
      }
      if (k >= source.size()) {
        return error(fmt::format("unterminated slot '{}'", name));
      }
      slot_regex = std::string(source.substr(j + 1, k - j - 1));
      if (slot_regex.empty()) {
        return error(fmt::format("empty regex for slot '{}'", name));
      }
      j = k;
    } else if (j >= source.size() || source[j] != '}') {
      return error(fmt::format("unterminated slot '{}'", name));
    }

    auto inner = RewriteNamedGroups(slot_regex);
    if (!inner) {
      return std::unexpected(std::move(inner.error()));
    }
    if (!inner->slots.empty()) {
      return error(fmt::format("slot '{}' contains a named group", name));
    }

    flush_literal();
    ++group_count;
    slots.push_back(CaptureSlot{.name = name, .group = group_count});
    regex += "(" + inner->source + ")";
    group_count += inner->group_count;
    i = j;
  }
  flush_literal();

  auto compiled = CompileStdRegex(regex, source);
  if (!compiled) {
    return std::unexpected(std::move(compiled.error()));
  }
  return Composite{
      .source = std::string(source),
      .compiled = std::move(*compiled),
      .slots = std::move(slots),
      .full_line = full_line,
  };
}

auto Describe(const Pattern& pattern) -> std::string {
  std::string text = std::visit(
      Overloaded{
          [](const Literal& l) {
            return l.mode == LiteralMode::kLine
                       ? fmt::format("line \"{}\"", l.text)
                       : fmt::format("literal \"{}\"", l.text);
          },
          [](const Regex& r) {
            return fmt::format(
                "regex /{}/{}", r.source, r.full_line ? " (full line)" : "");
          },
          [](const Wildcard&) { return std::string("wildcard"); },
          [](const Composite& c) {
            return fmt::format(
                "composite \"{}\"{}", c.source,
                c.full_line ? " (full line)" : "");
          },
      },
      pattern.kind);
  if (pattern.optional) {
    text += " [optional]";
  }
  if (pattern.adjacent) {
    text += " [adjacent]";
  }
  return text;
}

auto SlotNames(const Pattern& pattern) -> std::vector<std::string> {
  const std::vector<CaptureSlot>* slots = std::visit(
      Overloaded{
          [](const Literal&) -> const std::vector<CaptureSlot>* {
            return nullptr;
          },
          [](const Regex& r) -> const std::vector<CaptureSlot>* {
            return &r.slots;
          },
          [](const Wildcard&) -> const std::vector<CaptureSlot>* {
            return nullptr;
          },
          [](const Composite& c) -> const std::vector<CaptureSlot>* {
            return &c.slots;
          },
      },
      pattern.kind);

  std::vector<std::string> names;
  if (slots != nullptr) {
    for (const auto& slot : *slots) {
      names.push_back(slot.name);
    }
  }
  return names;
}

}  // namespace polyglot::matcher
