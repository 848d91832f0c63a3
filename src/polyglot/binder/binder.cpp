#include "polyglot/binder/binder.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "polyglot/binder/template.hpp"
#include "polyglot/common/diagnostic.hpp"

namespace polyglot::binder {

namespace {

// Placeholder chains deeper than this are treated as cyclic
constexpr int kMaxDepth = 16;

auto IsBlank(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}  // namespace

auto SplitCommandLine(std::string_view command)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;

  for (size_t i = 0; i < command.size(); ++i) {
    char c = command[i];
    if (IsBlank(c)) {
      if (in_word) {
        words.push_back(std::move(current));
        current.clear();
        in_word = false;
      }
      continue;
    }
    in_word = true;
    if (c == '\\') {
      if (i + 1 < command.size()) {
        current += command[++i];
      }
      continue;
    }
    if (c == '\'') {
      size_t end = command.find('\'', i + 1);
      if (end == std::string_view::npos) {
        return std::unexpected(Diagnostic::BindingError(
            fmt::format("unterminated single quote in '{}'", command)));
      }
      current.append(command.substr(i + 1, end - i - 1));
      i = end;
      continue;
    }
    if (c == '"') {
      size_t j = i + 1;
      bool closed = false;
      for (; j < command.size(); ++j) {
        char d = command[j];
        if (d == '"') {
          closed = true;
          break;
        }
        if (d == '\\' && j + 1 < command.size()) {
          char next = command[j + 1];
          if (next == '"' || next == '\\' || next == '$' || next == '`') {
            current += next;
            ++j;
            continue;
          }
        }
        current += d;
      }
      if (!closed) {
        return std::unexpected(Diagnostic::BindingError(
            fmt::format("unterminated double quote in '{}'", command)));
      }
      i = j;
      continue;
    }
    current += c;
  }
  if (in_word) {
    words.push_back(std::move(current));
  }
  return words;
}

auto Binder::LookupPlaceholder(const std::string& name, int depth) const
    -> Result<std::string> {
  if (name == "workspace") {
    return context_.Workspace().string();
  }
  if (name == "environment") {
    return environment_.name;
  }
  if (name == "scenario") {
    return context_.Scenario().name;
  }
  auto it = environment_.placeholders.find(name);
  if (it == environment_.placeholders.end()) {
    return std::unexpected(Diagnostic::BindingError(fmt::format(
        "environment '{}' has no placeholder '{{{}}}'", environment_.name,
        name)));
  }
  return ExpandAt(it->second, depth + 1);
}

auto Binder::ExpandAt(std::string_view text, int depth) const
    -> Result<std::string> {
  if (depth > kMaxDepth) {
    return std::unexpected(Diagnostic::BindingError(fmt::format(
        "placeholder expansion of '{}' nested too deeply", text)));
  }
  auto tmpl = ParseTemplate(text);
  if (!tmpl) {
    return std::unexpected(
        Diagnostic::BindingError(tmpl.error().Message()));
  }

  std::string result;
  for (const auto& segment : tmpl->segments) {
    switch (segment.kind) {
      case Segment::Kind::kText:
        result += segment.value;
        break;
      case Segment::Kind::kPlaceholder: {
        auto value = LookupPlaceholder(segment.value, depth);
        if (!value) {
          return value;
        }
        result += *value;
        break;
      }
      case Segment::Kind::kVariable: {
        const std::string* value = context_.FindVariable(segment.value);
        if (value == nullptr) {
          return std::unexpected(Diagnostic::BindingError(fmt::format(
              "variable '${{{}}}' has not been captured by an earlier step",
              segment.value)));
        }
        result += *value;
        break;
      }
    }
  }
  return result;
}

auto Binder::Expand(std::string_view text) const -> Result<std::string> {
  return ExpandAt(text, 0);
}

auto Binder::BindCommand(std::string_view run) const -> Result<BoundCommand> {
  auto command = Expand(run);
  if (!command) {
    return std::unexpected(std::move(command.error()));
  }

  BoundCommand bound;
  bound.command = std::move(*command);
  if (environment_.shell) {
    bound.argv = {"/bin/sh", "-c", bound.command};
  } else {
    auto argv = SplitCommandLine(bound.command);
    if (!argv) {
      return std::unexpected(std::move(argv.error()));
    }
    if (argv->empty()) {
      return std::unexpected(Diagnostic::BindingError(
          fmt::format("command '{}' expands to nothing", run)));
    }
    bound.argv = std::move(*argv);
  }
  bound.working_dir = context_.WorkingDirectory();
  bound.env = context_.EnvOverrides();
  return bound;
}

auto Binder::ResolvePath(
    std::string_view text, const std::filesystem::path& base) const
    -> Result<std::filesystem::path> {
  auto expanded = Expand(text);
  if (!expanded) {
    return std::unexpected(std::move(expanded.error()));
  }
  std::filesystem::path path(*expanded);
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal();
}

}  // namespace polyglot::binder
