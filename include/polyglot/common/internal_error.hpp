#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace polyglot::common {

// Broken engine invariant. Never used for suite or program errors, which are
// reported as Diagnostic values or step failure kinds.
class InternalError : public std::logic_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::logic_error(
            fmt::format(
                "internal error in {}: {}\n"
                "This is a bug in polyglot, not in the suite under test.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace polyglot::common
