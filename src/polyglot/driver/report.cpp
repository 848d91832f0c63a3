#include "report.hpp"

#include <cstddef>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/common/string_utils.hpp"
#include "polyglot/result/result.hpp"

namespace polyglot::driver {

namespace {

using Json = nlohmann::ordered_json;
using result::Status;

auto ToJson(const result::StepResult& step) -> Json {
  Json patterns = Json::array();
  for (const auto& pattern : step.patterns) {
    Json entry = {
        {"description", pattern.description},
        {"matched", pattern.matched},
        {"optional", pattern.optional},
    };
    if (pattern.line) {
      entry["line"] = *pattern.line + 1;
    }
    if (!pattern.detail.empty()) {
      entry["detail"] = pattern.detail;
    }
    patterns.push_back(std::move(entry));
  }

  Json out = {
      {"name", step.name},
      {"status", result::ToString(step.status)},
  };
  if (step.failure != result::FailureKind::kNone) {
    out["failure"] = result::ToString(step.failure);
  }
  if (!step.message.empty()) {
    out["message"] = step.message;
  }
  if (!step.command.empty()) {
    out["command"] = step.command;
  }
  if (step.exit_code) {
    out["exit_code"] = *step.exit_code;
  }
  out["stdout"] = step.stdout_text;
  out["stderr"] = step.stderr_text;
  out["patterns"] = std::move(patterns);
  out["captured"] = step.captured;
  out["elapsed_ms"] = step.elapsed.count();
  return out;
}

auto ToJson(const std::vector<result::StepResult>& steps) -> Json {
  Json out = Json::array();
  for (const auto& step : steps) {
    out.push_back(ToJson(step));
  }
  return out;
}

auto FailureType(const result::ScenarioResult& run) -> std::string {
  return std::string(result::ToString(run.failure));
}

auto WriteOutput(const std::string& text, const std::string& path)
    -> Result<void> {
  if (path == "-") {
    std::cout << text;
    std::cout.flush();
    return {};
  }
  std::ofstream out(path);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot write '{}'", path)));
  }
  out << text;
  out.close();
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("error while writing '{}'", path)));
  }
  return {};
}

}  // namespace

auto RenderJsonReport(const result::SuiteResult& result) -> std::string {
  auto counts = result.Counts();
  Json runs = Json::array();
  for (const auto& run : result.runs) {
    Json entry = {
        {"index", run.index},
        {"scenario", run.scenario},
        {"environment", run.environment},
        {"status", result::ToString(run.status)},
    };
    if (run.failure != result::FailureKind::kNone) {
      entry["failure"] = result::ToString(run.failure);
    }
    if (!run.message.empty()) {
      entry["message"] = run.message;
    }
    entry["attempts"] = run.attempts;
    entry["elapsed_ms"] = run.elapsed.count();
    entry["setup"] = ToJson(run.setup);
    entry["steps"] = ToJson(run.steps);
    entry["teardown"] = ToJson(run.teardown);
    runs.push_back(std::move(entry));
  }

  Json environments = Json::array();
  for (const auto& env : result.environments) {
    environments.push_back({
        {"environment", env.environment},
        {"status", result::ToString(env.status)},
        {"setup", ToJson(env.setup)},
        {"teardown", ToJson(env.teardown)},
    });
  }

  Json diagnostics = Json::array();
  for (const auto& diag : result.diagnostics) {
    diagnostics.push_back({
        {"kind", DiagKindName(diag.Kind())},
        {"message", diag.Format()},
    });
  }

  Json root = {
      {"suite", result.suite},
      {"status", result::ToString(result.status)},
      {"counts",
       {
           {"passed", counts.passed},
           {"failed", counts.failed},
           {"errored", counts.errored},
           {"skipped", counts.skipped},
           {"cancelled", counts.cancelled},
       }},
      {"elapsed_ms", result.elapsed.count()},
      {"runs", std::move(runs)},
      {"environments", std::move(environments)},
      {"diagnostics", std::move(diagnostics)},
  };
  return root.dump(2, ' ', false, Json::error_handler_t::replace) + "\n";
}

auto RenderXunitReport(const result::SuiteResult& result) -> std::string {
  using common::EscapeXml;

  // Environment -> runs, in first-seen order
  std::vector<std::string> order;
  std::map<std::string, std::vector<const result::ScenarioResult*>> by_env;
  for (const auto& run : result.runs) {
    auto [it, inserted] = by_env.try_emplace(run.environment);
    if (inserted) {
      order.push_back(run.environment);
    }
    it->second.push_back(&run);
  }

  auto counts = result.Counts();
  std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  xml += fmt::format(
      "<testsuites name=\"{}\" tests=\"{}\" failures=\"{}\" errors=\"{}\" "
      "skipped=\"{}\" time=\"{:.3f}\">\n",
      EscapeXml(result.suite), counts.Total(), counts.failed,
      counts.errored + counts.cancelled, counts.skipped,
      static_cast<double>(result.elapsed.count()) / 1000.0);

  for (const auto& env : order) {
    const auto& runs = by_env[env];
    size_t failures = 0;
    size_t errors = 0;
    size_t skipped = 0;
    double time = 0;
    for (const auto* run : runs) {
      failures += run->status == Status::kFailed ? 1 : 0;
      errors += run->status == Status::kErrored ||
                        run->status == Status::kCancelled
                    ? 1
                    : 0;
      skipped += run->status == Status::kSkipped ? 1 : 0;
      time += static_cast<double>(run->elapsed.count()) / 1000.0;
    }
    xml += fmt::format(
        "  <testsuite name=\"{}\" tests=\"{}\" failures=\"{}\" errors=\"{}\" "
        "skipped=\"{}\" time=\"{:.3f}\">\n",
        EscapeXml(env), runs.size(), failures, errors, skipped, time);

    for (const auto* run : runs) {
      xml += fmt::format(
          "    <testcase classname=\"{}\" name=\"{}\" time=\"{:.3f}\"",
          EscapeXml(run->environment), EscapeXml(run->scenario),
          static_cast<double>(run->elapsed.count()) / 1000.0);
      switch (run->status) {
        case Status::kPassed:
          xml += "/>\n";
          continue;
        case Status::kSkipped:
          xml += fmt::format(
              ">\n      <skipped message=\"{}\"/>\n    </testcase>\n",
              EscapeXml(run->message));
          continue;
        case Status::kFailed:
          xml += fmt::format(
              ">\n      <failure type=\"{}\" message=\"{}\"/>\n",
              EscapeXml(FailureType(*run)), EscapeXml(run->message));
          break;
        case Status::kErrored:
        case Status::kCancelled:
        case Status::kPending:
        case Status::kRunning:
          xml += fmt::format(
              ">\n      <error type=\"{}\" message=\"{}\"/>\n",
              EscapeXml(FailureType(*run)), EscapeXml(run->message));
          break;
      }
      std::string out;
      std::string err;
      for (const auto& step : run->steps) {
        out += step.stdout_text;
        err += step.stderr_text;
      }
      if (!out.empty()) {
        xml += fmt::format(
            "      <system-out>{}</system-out>\n", EscapeXml(out));
      }
      if (!err.empty()) {
        xml += fmt::format(
            "      <system-err>{}</system-err>\n", EscapeXml(err));
      }
      xml += "    </testcase>\n";
    }
    xml += "  </testsuite>\n";
  }
  xml += "</testsuites>\n";
  return xml;
}

auto WriteJsonReport(const result::SuiteResult& result, const std::string& path)
    -> Result<void> {
  return WriteOutput(RenderJsonReport(result), path);
}

auto WriteXunitReport(
    const result::SuiteResult& result, const std::string& path)
    -> Result<void> {
  return WriteOutput(RenderXunitReport(result), path);
}

}  // namespace polyglot::driver
