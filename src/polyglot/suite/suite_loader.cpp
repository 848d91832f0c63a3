#include "polyglot/suite/suite_loader.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "polyglot/binder/template.hpp"
#include "polyglot/common/diagnostic.hpp"
#include "polyglot/matcher/pattern.hpp"
#include "polyglot/suite/suite.hpp"

namespace polyglot::suite {

enum class DocumentType : uint8_t {
  kSuite,
  kEnvironments,
  kScenarios,
};

struct SuiteBuilder::Document {
  YAML::Node node;
  std::string source;
  DocumentType type;
};

namespace {

constexpr std::string_view kEnvironmentSuffix = ".env.yaml";
constexpr double kMaxTimeoutMs = 24.0 * 60 * 60 * 1000;

auto LocationOf(const std::string& source, const YAML::Mark& mark)
    -> SourceLocation {
  return SourceLocation{
      .file = source, .line = mark.line >= 0 ? mark.line + 1 : 0};
}

// Resolves a document's type from its `type` key or its source name.
auto ResolveType(const YAML::Node& node, const std::string& source)
    -> Result<DocumentType> {
  if (node.IsMap() && node["type"]) {
    const auto& type_node = node["type"];
    if (!type_node.IsScalar()) {
      return std::unexpected(Diagnostic::LoadError(
          LocationOf(source, type_node.Mark()), "'type' must be a string"));
    }
    std::string_view type = type_node.Scalar();
    // "scenarios/v2" and the like: only the part before '/' matters
    type = type.substr(0, type.find('/'));
    if (type == "suite") {
      return DocumentType::kSuite;
    }
    if (type == "environments") {
      return DocumentType::kEnvironments;
    }
    if (type == "scenarios") {
      return DocumentType::kScenarios;
    }
    return std::unexpected(Diagnostic::LoadError(
        LocationOf(source, type_node.Mark()),
        fmt::format(
            "unknown document type '{}' (expected suite, environments or "
            "scenarios)",
            type_node.Scalar())));
  }
  if (source.ends_with(kEnvironmentSuffix)) {
    return DocumentType::kEnvironments;
  }
  return DocumentType::kSuite;
}

// Turns YAML nodes into model objects. Every error throws a
// DiagnosticException, caught once in SuiteBuilder::Build.
class DocumentParser {
 public:
  DocumentParser(std::string source, matcher::LiteralMode literal_default)
      : source_(std::move(source)), literal_default_(literal_default) {
  }

  [[nodiscard]] auto Location(const YAML::Node& node) const -> SourceLocation {
    return LocationOf(source_, node.Mark());
  }

  [[noreturn]] void Fail(const YAML::Node& node, std::string message) const {
    throw DiagnosticException(
        Diagnostic::LoadError(Location(node), std::move(message)));
  }

  void ValidateKeys(
      const YAML::Node& node, std::initializer_list<std::string_view> allowed,
      std::string_view context) const {
    if (!node.IsMap()) {
      Fail(node, fmt::format("{} must be a mapping", context));
    }
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      if (std::ranges::find(allowed, key) == allowed.end()) {
        Fail(pair.first, fmt::format("unknown field '{}' in {}", key, context));
      }
    }
  }

  [[nodiscard]] auto String(const YAML::Node& node, std::string_view what) const
      -> std::string {
    if (!node.IsScalar()) {
      Fail(node, fmt::format("'{}' must be a string", what));
    }
    return node.Scalar();
  }

  [[nodiscard]] auto Bool(const YAML::Node& node, std::string_view what) const
      -> bool {
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
      Fail(node, fmt::format("'{}' must be true or false", what));
    }
    return value;
  }

  [[nodiscard]] auto Int(const YAML::Node& node, std::string_view what) const
      -> int {
    int value = 0;
    if (!node.IsScalar() || !YAML::convert<int>::decode(node, value)) {
      Fail(node, fmt::format("'{}' must be an integer", what));
    }
    return value;
  }

  // Seconds as a number, or a string with an ms/s/m suffix.
  [[nodiscard]] auto Timeout(const YAML::Node& node) const
      -> std::chrono::milliseconds {
    if (!node.IsScalar()) {
      Fail(node, "'timeout' must be a duration");
    }
    std::string_view text = node.Scalar();
    double scale = 1000.0;
    if (text.ends_with("ms")) {
      scale = 1.0;
      text.remove_suffix(2);
    } else if (text.ends_with('s')) {
      text.remove_suffix(1);
    } else if (text.ends_with('m')) {
      scale = 60000.0;
      text.remove_suffix(1);
    }
    double value = 0;
    auto [end, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value <= 0) {
      Fail(
          node,
          fmt::format(
              "invalid timeout '{}' (use seconds or a ms/s/m suffix)",
              node.Scalar()));
    }
    double ms = value * scale;
    if (!std::isfinite(ms) || ms > kMaxTimeoutMs) {
      Fail(
          node,
          fmt::format("timeout '{}' exceeds the 24h limit", node.Scalar()));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
  }

  [[nodiscard]] auto ParseEnvList(
      const YAML::Node& node, std::string_view what) const -> EnvList {
    if (!node.IsMap()) {
      Fail(node, fmt::format("'{}' must map variable names to values", what));
    }
    EnvList list;
    for (const auto& pair : node) {
      list.emplace_back(
          String(pair.first, what), String(pair.second, pair.first.Scalar()));
    }
    return list;
  }

  void CheckTemplate(const YAML::Node& node, const std::string& text) const {
    if (auto parsed = binder::ParseTemplate(text); !parsed) {
      Fail(node, parsed.error().Message());
    }
  }

  [[nodiscard]] auto ParseEnvironment(
      const std::string& name, const YAML::Node& key, const YAML::Node& node)
      const -> Environment {
    Environment env;
    env.name = name;
    env.location = Location(key);
    if (node.IsNull()) {
      return env;
    }
    auto context = fmt::format("environment '{}'", name);
    ValidateKeys(
        node,
        {"description", "placeholders", "setup", "teardown", "setup_scope",
         "working_dir", "env", "session", "shell"},
        context);

    if (const auto& placeholders = node["placeholders"]) {
      if (!placeholders.IsMap()) {
        Fail(placeholders, "'placeholders' must be a mapping");
      }
      for (const auto& pair : placeholders) {
        auto key_name = String(pair.first, "placeholder name");
        if (binder::IsBuiltinPlaceholder(key_name)) {
          Fail(
              pair.first,
              fmt::format("placeholder '{}' is reserved", key_name));
        }
        auto value = String(pair.second, key_name);
        CheckTemplate(pair.second, value);
        env.placeholders.emplace(std::move(key_name), std::move(value));
      }
    }
    if (const auto& setup = node["setup"]) {
      env.setup = ParseSteps(setup, context + " setup");
    }
    if (const auto& teardown = node["teardown"]) {
      env.teardown = ParseSteps(teardown, context + " teardown");
    }
    if (const auto& scope = node["setup_scope"]) {
      auto text = String(scope, "setup_scope");
      if (text == "isolated") {
        env.setup_scope = SetupScope::kIsolated;
      } else if (text == "shared") {
        env.setup_scope = SetupScope::kShared;
      } else {
        Fail(
            scope,
            fmt::format(
                "invalid setup_scope '{}' (expected isolated or shared)",
                text));
      }
    }
    if (const auto& dir = node["working_dir"]) {
      env.working_dir = String(dir, "working_dir");
      CheckTemplate(dir, *env.working_dir);
    }
    if (const auto& vars = node["env"]) {
      env.env = ParseEnvList(vars, "env");
      for (const auto& pair : vars) {
        CheckTemplate(pair.second, pair.second.Scalar());
      }
    }
    if (const auto& session = node["session"]) {
      env.session = String(session, "session");
      CheckTemplate(session, *env.session);
    }
    if (const auto& shell = node["shell"]) {
      env.shell = Bool(shell, "shell");
    }
    return env;
  }

  [[nodiscard]] auto ParseScenario(const YAML::Node& node) const -> Scenario {
    if (!node.IsMap() || !node["name"]) {
      Fail(node, "scenario must be a mapping with a 'name'");
    }
    Scenario scenario;
    scenario.name = String(node["name"], "name");
    scenario.location = Location(node);
    auto context = fmt::format("scenario '{}'", scenario.name);
    ValidateKeys(
        node,
        {"name", "description", "steps", "continue_on_failure", "timeout",
         "retries", "skip"},
        context);

    if (const auto& steps = node["steps"]) {
      scenario.steps = ParseSteps(steps, context);
    }
    if (const auto& cof = node["continue_on_failure"]) {
      scenario.continue_on_failure = Bool(cof, "continue_on_failure");
    }
    if (const auto& timeout = node["timeout"]) {
      scenario.timeout = Timeout(timeout);
    }
    if (const auto& retries = node["retries"]) {
      scenario.retries = Int(retries, "retries");
      if (scenario.retries < 0) {
        Fail(retries, "'retries' must not be negative");
      }
    }
    if (const auto& skip = node["skip"]) {
      bool flag = false;
      if (YAML::convert<bool>::decode(skip, flag)) {
        if (flag) {
          scenario.skip_reason = "skipped";
        }
      } else {
        scenario.skip_reason = String(skip, "skip");
      }
    }
    return scenario;
  }

  [[nodiscard]] auto ParseSteps(
      const YAML::Node& node, const std::string& context) const
      -> std::vector<Step> {
    if (!node.IsSequence()) {
      Fail(node, fmt::format("steps of {} must be a list", context));
    }
    std::vector<Step> steps;
    for (const auto& item : node) {
      steps.push_back(ParseStep(item, context));
    }
    return steps;
  }

  [[nodiscard]] auto ParseStep(
      const YAML::Node& node, const std::string& context) const -> Step {
    Step step;
    step.location = Location(node);
    // A bare string is a command with default expectations
    if (node.IsScalar()) {
      step.run = node.Scalar();
      CheckTemplate(node, *step.run);
      return step;
    }
    ValidateKeys(
        node,
        {"name", "run", "send", "input", "expect", "exit_code", "stream",
         "continue_on_failure", "timeout", "cwd", "export"},
        fmt::format("step of {}", context));

    if (const auto& name = node["name"]) {
      step.name = String(name, "name");
    }
    if (const auto& run = node["run"]) {
      step.run = String(run, "run");
      CheckTemplate(run, *step.run);
    }
    if (const auto& send = node["send"]) {
      step.send = String(send, "send");
      CheckTemplate(send, *step.send);
    }
    if (step.run && step.send) {
      Fail(node, "a step cannot have both 'run' and 'send'");
    }
    if (const auto& input = node["input"]) {
      if (step.send) {
        Fail(input, "'input' applies to 'run' steps only");
      }
      step.input = String(input, "input");
      CheckTemplate(input, *step.input);
    }
    if (const auto& expect = node["expect"]) {
      step.expect = ParseExpectation(expect);
    }
    if (const auto& exit_code = node["exit_code"]) {
      if (exit_code.IsScalar() && exit_code.Scalar() == "any") {
        step.exit_code = std::nullopt;
      } else {
        step.exit_code = Int(exit_code, "exit_code");
      }
    }
    if (const auto& stream = node["stream"]) {
      auto text = String(stream, "stream");
      if (text == "stdout") {
        step.stream = Stream::kStdout;
      } else if (text == "stderr") {
        step.stream = Stream::kStderr;
      } else if (text == "both") {
        step.stream = Stream::kBoth;
      } else {
        Fail(
            stream,
            fmt::format(
                "invalid stream '{}' (expected stdout, stderr or both)", text));
      }
    }
    if (const auto& cof = node["continue_on_failure"]) {
      step.continue_on_failure = Bool(cof, "continue_on_failure");
    }
    if (const auto& timeout = node["timeout"]) {
      step.timeout = Timeout(timeout);
    }
    if (const auto& cwd = node["cwd"]) {
      step.cwd = String(cwd, "cwd");
      CheckTemplate(cwd, *step.cwd);
    }
    if (const auto& exports = node["export"]) {
      step.exports = ParseEnvList(exports, "export");
      for (const auto& pair : exports) {
        CheckTemplate(pair.second, pair.second.Scalar());
      }
    }
    if (!step.run && !step.send && !step.cwd && step.exports.empty()) {
      Fail(node, "step needs 'run' or 'send'");
    }
    if (!step.run && !step.send && !step.expect.Empty()) {
      Fail(node, "'expect' needs a 'run' or 'send' to verify");
    }
    return step;
  }

  [[nodiscard]] auto ParseExpectation(const YAML::Node& node) const
      -> matcher::Expectation {
    matcher::Expectation expectation;
    if (node.IsScalar()) {
      expectation.blocks.push_back(
          matcher::Block{.order = matcher::BlockOrder::kOrdered,
                         .patterns = {ParsePattern(node)}});
      return expectation;
    }
    if (!node.IsSequence()) {
      Fail(node, "'expect' must be a string or a list");
    }
    bool plain_block_open = false;
    for (const auto& entry : node) {
      if (auto order = BlockOrderOf(entry)) {
        matcher::Block block{.order = *order, .patterns = {}};
        const auto& items = entry.begin()->second;
        if (!items.IsSequence()) {
          Fail(items, "block entries must be a list");
        }
        for (const auto& item : items) {
          if (BlockOrderOf(item)) {
            Fail(item, "nested blocks are not supported");
          }
          block.patterns.push_back(ParsePattern(item));
        }
        expectation.blocks.push_back(std::move(block));
        plain_block_open = false;
        continue;
      }
      // Consecutive plain patterns share one ordered block
      if (!plain_block_open) {
        expectation.blocks.push_back(
            matcher::Block{.order = matcher::BlockOrder::kOrdered,
                           .patterns = {}});
        plain_block_open = true;
      }
      expectation.blocks.back().patterns.push_back(ParsePattern(entry));
    }
    return expectation;
  }

  [[nodiscard]] auto ParsePattern(const YAML::Node& node) const
      -> matcher::Pattern {
    if (node.IsScalar()) {
      return matcher::Pattern{
          .kind = matcher::Literal{.text = node.Scalar(),
                                   .mode = literal_default_}};
    }
    ValidateKeys(
        node,
        {"literal", "regex", "composite", "wildcard", "match", "full_line",
         "optional", "adjacent", "rebind"},
        "pattern");

    int kinds = (node["literal"] ? 1 : 0) + (node["regex"] ? 1 : 0) +
                (node["composite"] ? 1 : 0) + (node["wildcard"] ? 1 : 0);
    if (kinds != 1) {
      Fail(
          node,
          "pattern needs exactly one of 'literal', 'regex', 'composite' or "
          "'wildcard'");
    }

    bool full_line = false;
    if (const auto& fl = node["full_line"]) {
      if (node["literal"] || node["wildcard"]) {
        Fail(fl, "'full_line' applies to regex and composite patterns");
      }
      full_line = Bool(fl, "full_line");
    }
    if (node["match"] && !node["literal"]) {
      Fail(node["match"], "'match' applies to literal patterns");
    }

    matcher::Pattern pattern;
    if (const auto& literal = node["literal"]) {
      matcher::Literal lit{
          .text = String(literal, "literal"), .mode = literal_default_};
      if (const auto& match = node["match"]) {
        lit.mode = LiteralModeOf(match);
      }
      pattern.kind = std::move(lit);
    } else if (const auto& regex = node["regex"]) {
      auto compiled = matcher::CompileRegex(String(regex, "regex"), full_line);
      if (!compiled) {
        Fail(regex, compiled.error().Message());
      }
      pattern.kind = std::move(*compiled);
    } else if (const auto& composite = node["composite"]) {
      auto compiled =
          matcher::CompileComposite(String(composite, "composite"), full_line);
      if (!compiled) {
        Fail(composite, compiled.error().Message());
      }
      pattern.kind = std::move(*compiled);
    } else {
      if (!Bool(node["wildcard"], "wildcard")) {
        Fail(node["wildcard"], "'wildcard' can only be true");
      }
      pattern.kind = matcher::Wildcard{};
    }

    if (const auto& optional = node["optional"]) {
      pattern.optional = Bool(optional, "optional");
    }
    if (const auto& adjacent = node["adjacent"]) {
      pattern.adjacent = Bool(adjacent, "adjacent");
    }
    if (const auto& rebind = node["rebind"]) {
      pattern.rebind = Bool(rebind, "rebind");
    }
    return pattern;
  }

  [[nodiscard]] auto LiteralModeOf(const YAML::Node& node) const
      -> matcher::LiteralMode {
    auto text = String(node, "match");
    if (text == "substring") {
      return matcher::LiteralMode::kSubstring;
    }
    if (text == "line") {
      return matcher::LiteralMode::kLine;
    }
    Fail(
        node,
        fmt::format("invalid match mode '{}' (expected substring or line)",
                    text));
  }

  // Block entries are single-key maps: {ordered: [...]} or {unordered: [...]}.
  [[nodiscard]] auto BlockOrderOf(const YAML::Node& node) const
      -> std::optional<matcher::BlockOrder> {
    if (!node.IsMap() || node.size() != 1) {
      return std::nullopt;
    }
    auto key = node.begin()->first.as<std::string>();
    if (key == "ordered") {
      return matcher::BlockOrder::kOrdered;
    }
    if (key == "unordered") {
      return matcher::BlockOrder::kUnordered;
    }
    return std::nullopt;
  }

 private:
  std::string source_;
  matcher::LiteralMode literal_default_;
};

// Wraps a placeholder failure with the location and environment it was
// found for.
auto PlaceholderError(
    const SourceLocation& location, const Diagnostic& error,
    const Environment& env) -> Diagnostic {
  return Diagnostic::LoadError(
      location,
      fmt::format("{} in environment '{}'", error.Message(), env.name));
}

auto StepTemplates(const Step& step) -> std::vector<const std::string*> {
  std::vector<const std::string*> templates;
  for (const auto* field : {&step.run, &step.send, &step.input, &step.cwd}) {
    if (field->has_value()) {
      templates.push_back(&**field);
    }
  }
  for (const auto& [name, value] : step.exports) {
    templates.push_back(&value);
  }
  return templates;
}

auto CheckSteps(const std::vector<Step>& steps, const Environment& env)
    -> Result<void> {
  for (const auto& step : steps) {
    for (const auto* text : StepTemplates(step)) {
      if (auto checked = binder::CheckPlaceholders(*text, env.placeholders);
          !checked) {
        return std::unexpected(
            PlaceholderError(step.location, checked.error(), env));
      }
    }
    if (step.IsInteractive() && !env.session) {
      return std::unexpected(Diagnostic::LoadError(
          step.location,
          fmt::format(
              "step sends input but environment '{}' has no session",
              env.name)));
    }
  }
  return {};
}

auto CheckEnvironment(const Environment& env) -> Result<void> {
  for (const auto& [name, value] : env.placeholders) {
    if (auto checked = binder::CheckPlaceholders(value, env.placeholders);
        !checked) {
      return std::unexpected(
          PlaceholderError(env.location, checked.error(), env));
    }
  }
  std::vector<const std::string*> templates;
  if (env.working_dir) {
    templates.push_back(&*env.working_dir);
  }
  if (env.session) {
    templates.push_back(&*env.session);
  }
  for (const auto& [name, value] : env.env) {
    templates.push_back(&value);
  }
  for (const auto* text : templates) {
    if (auto checked = binder::CheckPlaceholders(*text, env.placeholders);
        !checked) {
      return std::unexpected(
          PlaceholderError(env.location, checked.error(), env));
    }
  }
  if (auto checked = CheckSteps(env.setup, env); !checked) {
    return checked;
  }
  return CheckSteps(env.teardown, env);
}

auto Validate(const Suite& suite) -> Result<void> {
  std::set<std::string, std::less<>> seen;
  for (const auto& env : suite.environments) {
    if (!seen.insert(env.name).second) {
      return std::unexpected(Diagnostic::LoadError(
          env.location, fmt::format("duplicate environment '{}'", env.name)));
    }
    if (auto checked = CheckEnvironment(env); !checked) {
      return checked;
    }
  }
  seen.clear();
  for (const auto& scenario : suite.scenarios) {
    if (!seen.insert(scenario.name).second) {
      return std::unexpected(Diagnostic::LoadError(
          scenario.location,
          fmt::format("duplicate scenario '{}'", scenario.name)));
    }
    for (const auto& env : suite.environments) {
      if (auto checked = CheckSteps(scenario.steps, env); !checked) {
        return checked;
      }
    }
  }
  return {};
}

}  // namespace

SuiteBuilder::SuiteBuilder() = default;
SuiteBuilder::~SuiteBuilder() = default;
SuiteBuilder::SuiteBuilder(SuiteBuilder&&) noexcept = default;
auto SuiteBuilder::operator=(SuiteBuilder&&) noexcept
    -> SuiteBuilder& = default;

auto SuiteBuilder::AddDocuments(std::string_view yaml, std::string source_name)
    -> Result<void> {
  std::vector<YAML::Node> nodes;
  try {
    nodes = YAML::LoadAll(std::string(yaml));
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Diagnostic::LoadError(LocationOf(source_name, e.mark), e.msg));
  }
  for (auto& node : nodes) {
    if (node.IsNull()) {
      continue;
    }
    if (!node.IsMap()) {
      return std::unexpected(Diagnostic::LoadError(
          LocationOf(source_name, node.Mark()),
          "document must be a mapping"));
    }
    auto type = ResolveType(node, source_name);
    if (!type) {
      return std::unexpected(std::move(type.error()));
    }
    documents_.push_back(std::make_unique<Document>(
        Document{.node = node, .source = source_name, .type = *type}));
  }
  spdlog::debug("loaded {} document(s) from {}", nodes.size(), source_name);
  return {};
}

auto SuiteBuilder::AddFile(const std::filesystem::path& path) -> Result<void> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot read '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return AddDocuments(buffer.str(), path.string());
}

auto SuiteBuilder::Build() && -> Result<Suite> {
  Suite suite;
  try {
    // Suite-level settings first: defaults shape how patterns are parsed
    for (const auto& doc : documents_) {
      if (doc->type != DocumentType::kSuite) {
        continue;
      }
      DocumentParser parser(doc->source, suite.defaults.literal_match);
      parser.ValidateKeys(
          doc->node,
          {"type", "name", "description", "defaults", "environments",
           "scenarios"},
          "suite");
      if (const auto& name = doc->node["name"]) {
        auto text = parser.String(name, "name");
        if (!suite.name.empty() && suite.name != text) {
          parser.Fail(
              name,
              fmt::format(
                  "suite name '{}' conflicts with '{}'", text, suite.name));
        }
        suite.name = std::move(text);
      }
      if (const auto& defaults = doc->node["defaults"]) {
        parser.ValidateKeys(defaults, {"timeout", "literal_match"}, "defaults");
        if (const auto& timeout = defaults["timeout"]) {
          suite.defaults.timeout = parser.Timeout(timeout);
        }
        if (const auto& match = defaults["literal_match"]) {
          suite.defaults.literal_match = parser.LiteralModeOf(match);
        }
      }
    }

    for (const auto& doc : documents_) {
      DocumentParser parser(doc->source, suite.defaults.literal_match);
      const auto& node = doc->node;
      if (doc->type == DocumentType::kEnvironments) {
        parser.ValidateKeys(
            node, {"type", "description", "environments"}, "environments");
      } else if (doc->type == DocumentType::kScenarios) {
        parser.ValidateKeys(
            node, {"type", "description", "scenarios"}, "scenarios");
      }
      if (doc->type != DocumentType::kScenarios) {
        if (const auto& envs = node["environments"]) {
          if (!envs.IsMap()) {
            parser.Fail(envs, "'environments' must map names to definitions");
          }
          for (const auto& pair : envs) {
            suite.environments.push_back(parser.ParseEnvironment(
                parser.String(pair.first, "environment name"), pair.first,
                pair.second));
          }
        }
      }
      if (doc->type != DocumentType::kEnvironments) {
        if (const auto& scenarios = node["scenarios"]) {
          if (!scenarios.IsSequence()) {
            parser.Fail(scenarios, "'scenarios' must be a list");
          }
          for (const auto& item : scenarios) {
            suite.scenarios.push_back(parser.ParseScenario(item));
          }
        }
      }
    }
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    return std::unexpected(Diagnostic::LoadError({}, e.msg));
  }

  if (suite.name.empty() && !documents_.empty()) {
    suite.name = std::filesystem::path(documents_.front()->source).stem().string();
  }
  if (auto valid = Validate(suite); !valid) {
    return std::unexpected(std::move(valid.error()));
  }
  spdlog::debug(
      "suite '{}': {} environment(s), {} scenario(s)", suite.name,
      suite.environments.size(), suite.scenarios.size());
  return suite;
}

auto LoadSuiteFromString(std::string_view yaml, std::string source_name)
    -> Result<Suite> {
  SuiteBuilder builder;
  if (auto added = builder.AddDocuments(yaml, std::move(source_name)); !added) {
    return std::unexpected(std::move(added.error()));
  }
  return std::move(builder).Build();
}

auto LoadSuiteFromFiles(const std::vector<std::filesystem::path>& paths)
    -> Result<Suite> {
  SuiteBuilder builder;
  for (const auto& path : paths) {
    if (auto added = builder.AddFile(path); !added) {
      return std::unexpected(std::move(added.error()));
    }
  }
  return std::move(builder).Build();
}

}  // namespace polyglot::suite
