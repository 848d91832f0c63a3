#include "print.hpp"

#include <cstddef>
#include <cstdio>
#include <map>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/common/string_utils.hpp"
#include "polyglot/result/result.hpp"

namespace polyglot::driver {

namespace {

using result::Status;

constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;
constexpr size_t kMaxShownOutput = 2000;

// Escape sequences only go to terminals
auto Styled(FILE* stream, fmt::text_style style) -> fmt::text_style {
  static const bool kStdoutTty = isatty(fileno(stdout)) != 0;
  static const bool kStderrTty = isatty(fileno(stderr)) != 0;
  bool tty = stream == stderr ? kStderrTty : kStdoutTty;
  return tty ? style : fmt::text_style{};
}

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kLoadError:
    case DiagKind::kBindingError:
    case DiagKind::kExecutionError:
    case DiagKind::kSchedulingError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
    default:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  }
}

auto StatusLabel(Status status) -> std::string_view {
  switch (status) {
    case Status::kPassed:
      return "PASS";
    case Status::kFailed:
      return "FAIL";
    case Status::kErrored:
      return "ERROR";
    case Status::kSkipped:
      return "SKIP";
    case Status::kCancelled:
      return "CANCEL";
    case Status::kPending:
    case Status::kRunning:
      break;
  }
  return "?";
}

auto StatusStyle(Status status) -> fmt::text_style {
  switch (status) {
    case Status::kPassed:
      return fmt::fg(fmt::terminal_color::bright_green) | fmt::emphasis::bold;
    case Status::kFailed:
    case Status::kErrored:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case Status::kSkipped:
    case Status::kCancelled:
      return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
    case Status::kPending:
    case Status::kRunning:
      break;
  }
  return fmt::text_style{};
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  std::string location;
  if (item.location.IsKnown()) {
    location = item.location.line > 0 ? fmt::format(
                                            "{}:{}", item.location.file,
                                            item.location.line)
                                      : item.location.file;
  }
  auto message_style = Styled(
      stderr, is_primary ? fmt::emphasis::bold : fmt::text_style{});
  fmt::print(
      stderr, "{}: {} {}\n",
      location.empty()
          ? fmt::styled(std::string("polyglot"), Styled(stderr, kToolStyle))
          : fmt::styled(location, Styled(stderr, fmt::emphasis::bold)),
      fmt::styled(
          DiagKindToString(item.kind), Styled(stderr, DiagKindToStyle(item.kind))),
      fmt::styled(item.message, message_style));
}

void PrintIndented(std::string_view label, const std::string& text) {
  if (text.empty()) {
    return;
  }
  fmt::print("      {}:\n", label);
  auto shown = common::TruncateForDisplay(text, kMaxShownOutput);
  size_t begin = 0;
  while (begin < shown.size()) {
    size_t end = shown.find('\n', begin);
    if (end == std::string::npos) {
      end = shown.size();
    }
    fmt::print("        | {}\n", std::string_view(shown).substr(begin, end - begin));
    begin = end + 1;
  }
}

void PrintStep(const result::StepResult& step, std::string_view phase) {
  fmt::print(
      "    {} {}{}", fmt::styled(StatusLabel(step.status),
                                 Styled(stdout, StatusStyle(step.status))),
      phase, step.name);
  if (step.status != Status::kPassed && !step.message.empty()) {
    fmt::print(": {}", step.message);
  }
  fmt::print("\n");
  if (step.status != Status::kFailed && step.status != Status::kErrored) {
    return;
  }
  if (!step.command.empty()) {
    fmt::print("      command: {}\n", step.command);
  }
  if (step.exit_code) {
    fmt::print("      exit code: {}\n", *step.exit_code);
  }
  for (const auto& pattern : step.patterns) {
    if (pattern.matched) {
      fmt::print(
          "      ok   {} (line {})\n", pattern.description,
          pattern.line ? *pattern.line + 1 : 0);
    } else {
      fmt::print(
          "      {} {}: {}\n", pattern.optional ? "opt " : "miss",
          pattern.description, pattern.detail);
    }
  }
  PrintIndented("stdout", step.stdout_text);
  PrintIndented("stderr", step.stderr_text);
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n",
      fmt::styled("polyglot", Styled(stderr, kToolStyle)),
      fmt::styled(
          "error:",
          Styled(
              stderr,
              fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold)),
      fmt::styled(message, Styled(stderr, fmt::emphasis::bold)));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n",
      fmt::styled("polyglot", Styled(stderr, kToolStyle)),
      fmt::styled(
          "warning:",
          Styled(
              stderr, fmt::fg(fmt::terminal_color::bright_yellow) |
                          fmt::emphasis::bold)),
      fmt::styled(message, Styled(stderr, fmt::emphasis::bold)));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, false);
  }
}

void PrintRuns(const result::SuiteResult& result, bool verbose) {
  for (const auto& run : result.runs) {
    fmt::print(
        "{:<6} {} [{}]",
        fmt::styled(StatusLabel(run.status), Styled(stdout, StatusStyle(run.status))),
        run.scenario, run.environment);
    if (run.status != Status::kPassed && !run.message.empty()) {
      fmt::print(": {}", run.message);
    }
    if (run.attempts > 1) {
      fmt::print(" (attempt {})", run.attempts);
    }
    fmt::print(" ({} ms)\n", run.elapsed.count());
    if (!verbose) {
      continue;
    }
    for (const auto& step : run.setup) {
      PrintStep(step, "setup: ");
    }
    for (const auto& step : run.steps) {
      PrintStep(step, "");
    }
    for (const auto& step : run.teardown) {
      PrintStep(step, "teardown: ");
    }
  }
  for (const auto& env : result.environments) {
    if (env.status != Status::kPassed || verbose) {
      fmt::print(
          "{:<6} shared setup/teardown [{}]\n",
          fmt::styled(StatusLabel(env.status), Styled(stdout, StatusStyle(env.status))),
          env.environment);
      if (verbose || env.status != Status::kPassed) {
        for (const auto& step : env.setup) {
          PrintStep(step, "setup: ");
        }
        for (const auto& step : env.teardown) {
          PrintStep(step, "teardown: ");
        }
      }
    }
  }
}

void PrintSummary(const result::SuiteResult& result) {
  // Environment name -> counts, in first-seen order
  std::vector<std::string> order;
  std::map<std::string, result::StatusCounts> per_env;
  for (const auto& run : result.runs) {
    auto [it, inserted] = per_env.try_emplace(run.environment);
    if (inserted) {
      order.push_back(run.environment);
    }
    auto& counts = it->second;
    switch (run.status) {
      case Status::kPassed:
        ++counts.passed;
        break;
      case Status::kFailed:
        ++counts.failed;
        break;
      case Status::kErrored:
        ++counts.errored;
        break;
      case Status::kSkipped:
        ++counts.skipped;
        break;
      case Status::kCancelled:
        ++counts.cancelled;
        break;
      case Status::kPending:
      case Status::kRunning:
        break;
    }
  }

  fmt::print("\nSummary for suite '{}':\n", result.suite);
  for (const auto& env : order) {
    const auto& counts = per_env[env];
    fmt::print(
        "  {:<20} {} passed, {} failed, {} errored, {} skipped, {} "
        "cancelled\n",
        env, counts.passed, counts.failed, counts.errored, counts.skipped,
        counts.cancelled);
  }
}

void PrintTotals(const result::SuiteResult& result) {
  auto counts = result.Counts();
  std::vector<std::string> parts;
  auto add = [&](size_t n, std::string_view label) {
    if (n > 0) {
      parts.push_back(fmt::format("{} {}", n, label));
    }
  };
  add(counts.passed, "passed");
  add(counts.failed, "failed");
  add(counts.errored, "errored");
  add(counts.skipped, "skipped");
  add(counts.cancelled, "cancelled");
  if (parts.empty()) {
    parts.emplace_back("no runs");
  }
  std::string joined;
  for (size_t i = 0; i < parts.size(); ++i) {
    joined += i == 0 ? parts[i] : ", " + parts[i];
  }
  fmt::print(
      "{} in {:.2f}s\n",
      fmt::styled(
          joined, Styled(stdout, result.Passed()
                                     ? StatusStyle(Status::kPassed)
                                     : StatusStyle(Status::kFailed))),
      static_cast<double>(result.elapsed.count()) / 1000.0);
}

}  // namespace polyglot::driver
