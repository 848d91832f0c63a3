#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "polyglot/executor/process.hpp"

namespace polyglot::executor {

enum class ExitReason : uint8_t {
  kExited,     // Child exited on its own (possibly by signal)
  kTimedOut,   // Killed after the timeout elapsed
  kCancelled,  // Killed because stop was requested
  kFailed,     // Could not be started or monitored; see `error`
};

auto ExitReasonName(ExitReason reason) -> std::string_view;

struct ExecutionOutcome {
  ExitReason reason = ExitReason::kExited;
  std::optional<int> exit_code;  // Set when the child was reaped normally
  std::string stdout_text;
  std::string stderr_text;
  std::string error;
  std::chrono::milliseconds elapsed{0};
};

struct CommandRequest {
  SpawnRequest spawn;
  std::string stdin_text;  // Written then closed; empty closes immediately
  std::chrono::milliseconds timeout{30000};
};

// Runs one command to completion. On timeout or cancellation the child's
// whole process group is killed and reaped before Run returns.
class StepExecutor {
 public:
  explicit StepExecutor(ProcessSpawner& spawner) : spawner_(spawner) {
  }

  auto Run(const CommandRequest& request, std::stop_token stop)
      -> ExecutionOutcome;

 private:
  ProcessSpawner& spawner_;
};

}  // namespace polyglot::executor
