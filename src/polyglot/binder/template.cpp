#include "polyglot/binder/template.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "polyglot/common/diagnostic.hpp"

namespace polyglot::binder {

namespace {

auto IsNameChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
         c == '-' || c == '.';
}

auto TemplateError(std::string_view source, std::string detail)
    -> Diagnostic {
  return Diagnostic::LoadError(
      {}, fmt::format("invalid template '{}': {}", source, detail));
}

// Parses the name starting at `begin` up to the closing '}'.
// On success stores the name and returns the index of the '}'.
auto ParseName(std::string_view source, size_t begin, std::string& name)
    -> Result<size_t> {
  size_t end = source.find('}', begin);
  if (end == std::string_view::npos) {
    return std::unexpected(TemplateError(
        source, fmt::format("unterminated reference at offset {}", begin - 1)));
  }
  name = std::string(source.substr(begin, end - begin));
  if (name.empty() || !std::ranges::all_of(name, IsNameChar)) {
    return std::unexpected(TemplateError(
        source, fmt::format(
                    "invalid name '{}' (use {{{{ and }}}} for literal braces)",
                    name)));
  }
  return end;
}

auto CollectNames(const Template& tmpl, Segment::Kind kind)
    -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& segment : tmpl.segments) {
    if (segment.kind == kind &&
        std::ranges::find(names, segment.value) == names.end()) {
      names.push_back(segment.value);
    }
  }
  return names;
}

auto VisitPlaceholders(
    std::string_view source, const PlaceholderTable& table,
    std::vector<std::string>& stack) -> Result<void> {
  auto tmpl = ParseTemplate(source);
  if (!tmpl) {
    return std::unexpected(std::move(tmpl.error()));
  }
  for (const auto& name : tmpl->Placeholders()) {
    if (IsBuiltinPlaceholder(name)) {
      continue;
    }
    if (std::ranges::find(stack, name) != stack.end()) {
      std::string chain;
      for (const auto& entry : stack) {
        chain += entry + " -> ";
      }
      return std::unexpected(Diagnostic::LoadError(
          {}, fmt::format("placeholder cycle: {}{}", chain, name)));
    }
    auto it = table.find(name);
    if (it == table.end()) {
      return std::unexpected(Diagnostic::LoadError(
          {}, fmt::format("undefined placeholder '{{{}}}'", name)));
    }
    stack.push_back(name);
    auto nested = VisitPlaceholders(it->second, table, stack);
    stack.pop_back();
    if (!nested) {
      return nested;
    }
  }
  return {};
}

}  // namespace

auto Template::Placeholders() const -> std::vector<std::string> {
  return CollectNames(*this, Segment::Kind::kPlaceholder);
}

auto Template::Variables() const -> std::vector<std::string> {
  return CollectNames(*this, Segment::Kind::kVariable);
}

auto IsBuiltinPlaceholder(std::string_view name) -> bool {
  return std::ranges::find(kBuiltinPlaceholders, name) !=
         kBuiltinPlaceholders.end();
}

auto ParseTemplate(std::string_view source) -> Result<Template> {
  Template tmpl;
  tmpl.source = std::string(source);
  std::string text;

  auto flush_text = [&] {
    if (!text.empty()) {
      tmpl.segments.push_back(
          Segment{.kind = Segment::Kind::kText, .value = std::move(text)});
      text.clear();
    }
  };

  for (size_t i = 0; i < source.size(); ++i) {
    char c = source[i];
    bool has_next = i + 1 < source.size();

    if (c == '$' && has_next && source[i + 1] == '{') {
      std::string name;
      auto end = ParseName(source, i + 2, name);
      if (!end) {
        return std::unexpected(std::move(end.error()));
      }
      flush_text();
      tmpl.segments.push_back(
          Segment{.kind = Segment::Kind::kVariable, .value = std::move(name)});
      i = *end;
      continue;
    }
    if (c == '{') {
      if (has_next && source[i + 1] == '{') {
        text += '{';
        ++i;
        continue;
      }
      std::string name;
      auto end = ParseName(source, i + 1, name);
      if (!end) {
        return std::unexpected(std::move(end.error()));
      }
      flush_text();
      tmpl.segments.push_back(Segment{
          .kind = Segment::Kind::kPlaceholder, .value = std::move(name)});
      i = *end;
      continue;
    }
    if (c == '}') {
      if (has_next && source[i + 1] == '}') {
        text += '}';
        ++i;
        continue;
      }
      return std::unexpected(
          TemplateError(source, fmt::format("unmatched '}}' at offset {}", i)));
    }
    text += c;
  }
  flush_text();
  return tmpl;
}

auto CheckPlaceholders(std::string_view source, const PlaceholderTable& table)
    -> Result<void> {
  std::vector<std::string> stack;
  return VisitPlaceholders(source, table, stack);
}

}  // namespace polyglot::binder
