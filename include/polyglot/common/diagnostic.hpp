#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyglot {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kLoadError,        // Malformed suite document, bad regex, unresolved reference
  kBindingError,     // Template references unknown placeholder or variable
  kExecutionError,   // Process failed to start, timed out or was cancelled
  kSchedulingError,  // Worker pool could not be created
  kHostError,        // I/O, malformed input outside the suite document
  kWarning,          // Non-fatal
  kNote,             // Auxiliary message
};

// Position inside a suite document. Line is 1-based; 0 means unknown.
struct SourceLocation {
  std::string file;
  int line = 0;

  auto operator==(const SourceLocation&) const -> bool = default;

  [[nodiscard]] auto IsKnown() const -> bool {
    return !file.empty();
  }
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  SourceLocation location;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: malformed suite definition
  static auto LoadError(SourceLocation location, std::string msg)
      -> Diagnostic {
    return Make(DiagKind::kLoadError, std::move(location), std::move(msg));
  }

  // Factory: template cannot be resolved against environment and variables
  static auto BindingError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kBindingError, {}, std::move(msg));
  }

  // Factory: process could not be started or did not finish
  static auto ExecutionError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kExecutionError, {}, std::move(msg));
  }

  static auto SchedulingError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kSchedulingError, {}, std::move(msg));
  }

  // Factory: host error without suite location (file I/O, config)
  static auto HostError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kHostError, {}, std::move(msg));
  }

  static auto Warning(SourceLocation location, std::string msg) -> Diagnostic {
    return Make(DiagKind::kWarning, std::move(location), std::move(msg));
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .location = {},
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  [[nodiscard]] auto Kind() const -> DiagKind {
    return primary.kind;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return primary.message;
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind != DiagKind::kWarning &&
           primary.kind != DiagKind::kNote;
  }

  // Render as "file:line: kind: message" followed by one line per note.
  [[nodiscard]] auto Format() const -> std::string;

 private:
  static auto Make(DiagKind kind, SourceLocation location, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = kind,
             .location = std::move(location),
             .message = std::move(msg)},
        .notes = {},
    };
  }
};

auto DiagKindName(DiagKind kind) -> std::string_view;

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

}  // namespace polyglot
