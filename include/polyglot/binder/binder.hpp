#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/runtime/execution_context.hpp"
#include "polyglot/suite/suite.hpp"

namespace polyglot::binder {

// A step template resolved for one environment and run.
struct BoundCommand {
  std::string command;            // Fully substituted command string
  std::vector<std::string> argv;  // What is actually executed
  std::filesystem::path working_dir;
  suite::EnvList env;
};

// Split a command line the way a POSIX shell tokenizes words: whitespace
// separates, single quotes are literal, double quotes allow \" \\ \$ \`
// escapes, and a backslash outside quotes escapes the next character.
// An unterminated quote is a BindingError.
auto SplitCommandLine(std::string_view command)
    -> Result<std::vector<std::string>>;

// Resolves templates against an Environment's placeholders, the builtins
// and the run's captured variables. Resolution failures are BindingErrors.
class Binder {
 public:
  Binder(
      const suite::Environment& environment,
      const runtime::ExecutionContext& context)
      : environment_(environment), context_(context) {
  }

  // Substitute every {placeholder} and ${variable} in `text`.
  [[nodiscard]] auto Expand(std::string_view text) const -> Result<std::string>;

  // Build the concrete invocation of a `run` template.
  [[nodiscard]] auto BindCommand(std::string_view run) const
      -> Result<BoundCommand>;

  // Expand a path template; relative results are resolved against `base`.
  [[nodiscard]] auto ResolvePath(
      std::string_view text, const std::filesystem::path& base) const
      -> Result<std::filesystem::path>;

 private:
  auto ExpandAt(std::string_view text, int depth) const -> Result<std::string>;
  auto LookupPlaceholder(const std::string& name, int depth) const
      -> Result<std::string>;

  const suite::Environment& environment_;
  const runtime::ExecutionContext& context_;
};

}  // namespace polyglot::binder
