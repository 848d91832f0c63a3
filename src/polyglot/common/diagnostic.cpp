#include "polyglot/common/diagnostic.hpp"

#include <string>
#include <string_view>

#include <fmt/core.h>

namespace polyglot {

namespace {

auto FormatItem(const DiagItem& item) -> std::string {
  std::string prefix;
  if (item.location.IsKnown()) {
    prefix = item.location.line > 0
                 ? fmt::format("{}:{}: ", item.location.file, item.location.line)
                 : fmt::format("{}: ", item.location.file);
  }
  return fmt::format(
      "{}{}: {}", prefix, DiagKindName(item.kind), item.message);
}

}  // namespace

auto DiagKindName(DiagKind kind) -> std::string_view {
  switch (kind) {
    case DiagKind::kLoadError:
      return "load error";
    case DiagKind::kBindingError:
      return "binding error";
    case DiagKind::kExecutionError:
      return "execution error";
    case DiagKind::kSchedulingError:
      return "scheduling error";
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "error";
}

auto Diagnostic::Format() const -> std::string {
  std::string out = FormatItem(primary);
  for (const auto& note : notes) {
    out += "\n  ";
    out += FormatItem(note);
  }
  return out;
}

}  // namespace polyglot
