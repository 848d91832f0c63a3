#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/executor/process.hpp"
#include "polyglot/executor/step_executor.hpp"

namespace polyglot::executor {

// Long-lived interactive process owned by one run. Each exchange writes a
// line to its stdin and collects output until the caller is satisfied.
class InteractiveSession {
 public:
  // Receives everything read so far in this exchange (stdout, stderr).
  using Predicate =
      std::function<bool(std::string_view stdout_text,
                         std::string_view stderr_text)>;

  static auto Start(ProcessSpawner& spawner, const SpawnRequest& request)
      -> Result<std::unique_ptr<InteractiveSession>>;

  ~InteractiveSession();

  InteractiveSession(const InteractiveSession&) = delete;
  auto operator=(const InteractiveSession&) -> InteractiveSession& = delete;
  InteractiveSession(InteractiveSession&&) = delete;
  auto operator=(InteractiveSession&&) -> InteractiveSession& = delete;

  // Sends `input` followed by a newline and reads until `done` returns true,
  // the session closes its stdout, or `timeout` elapses (reason kTimedOut).
  // Output read during one exchange is not carried into the next.
  auto Exchange(
      std::string_view input, std::chrono::milliseconds timeout,
      std::stop_token stop, const Predicate& done) -> ExecutionOutcome;

  [[nodiscard]] auto Running() const -> bool;

  [[nodiscard]] auto Pid() const -> pid_t {
    return process_.pid;
  }

  // Closes stdin, gives the process a short grace period to exit, then
  // kills its group. Idempotent.
  void Terminate();

 private:
  explicit InteractiveSession(SpawnedProcess process)
      : process_(std::move(process)) {
  }

  SpawnedProcess process_;
  bool reaped_ = false;
  std::optional<int> exit_code_;
};

}  // namespace polyglot::executor
