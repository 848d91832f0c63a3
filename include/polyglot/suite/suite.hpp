#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/matcher/pattern.hpp"

namespace polyglot::suite {

// Which captured stream a step verifies.
enum class Stream : uint8_t {
  kStdout,
  kStderr,
  kBoth,  // stdout followed by stderr
};

// Whether an environment's setup/teardown is shared by all of its runs or
// repeated inside each run. Shared setup must not hold per-run state.
enum class SetupScope : uint8_t {
  kIsolated,
  kShared,
};

using EnvList = std::vector<std::pair<std::string, std::string>>;

struct Step {
  std::string name;
  std::optional<std::string> run;   // Command template
  std::optional<std::string> send;  // Input for the interactive session
  std::optional<std::string> input;  // Text written to the command's stdin
  matcher::Expectation expect;
  std::optional<int> exit_code = 0;  // nullopt accepts any exit code
  Stream stream = Stream::kStdout;
  std::optional<bool> continue_on_failure;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::string> cwd;  // Sticky for the rest of the run
  EnvList exports;                 // Sticky for the rest of the run
  SourceLocation location;

  [[nodiscard]] auto IsInteractive() const -> bool {
    return send.has_value();
  }
};

struct Environment {
  std::string name;
  std::map<std::string, std::string, std::less<>> placeholders;
  std::vector<Step> setup;
  std::vector<Step> teardown;
  SetupScope setup_scope = SetupScope::kIsolated;
  std::optional<std::string> working_dir;
  EnvList env;
  std::optional<std::string> session;  // Interactive session command
  bool shell = true;  // Run commands via /bin/sh -c instead of splitting
  SourceLocation location;
};

struct Scenario {
  std::string name;
  std::vector<Step> steps;
  std::optional<bool> continue_on_failure;
  std::optional<std::chrono::milliseconds> timeout;
  int retries = 0;
  std::optional<std::string> skip_reason;
  SourceLocation location;
};

struct SuiteDefaults {
  std::optional<std::chrono::milliseconds> timeout;
  matcher::LiteralMode literal_match = matcher::LiteralMode::kSubstring;
};

// Suite owns its environments and scenarios; both are read-only once loaded
// and shared by every concurrent run.
struct Suite {
  std::string name;
  SuiteDefaults defaults;
  std::vector<Environment> environments;
  std::vector<Scenario> scenarios;

  [[nodiscard]] auto FindEnvironment(std::string_view name) const
      -> const Environment*;
  [[nodiscard]] auto FindScenario(std::string_view name) const
      -> const Scenario*;
};

}  // namespace polyglot::suite
