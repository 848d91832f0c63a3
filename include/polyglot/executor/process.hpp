#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

#include "polyglot/common/diagnostic.hpp"

namespace polyglot::executor {

// Owning file descriptor. Closed on destruction.
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {
  }
  ~UniqueFd() {
    Reset();
  }

  UniqueFd(const UniqueFd&) = delete;
  auto operator=(const UniqueFd&) -> UniqueFd& = delete;

  UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {
  }
  auto operator=(UniqueFd&& other) noexcept -> UniqueFd& {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }
  [[nodiscard]] auto Valid() const -> bool {
    return fd_ >= 0;
  }

  void Reset(int fd = -1);

  auto Release() -> int {
    return std::exchange(fd_, -1);
  }

 private:
  int fd_ = -1;
};

struct SpawnRequest {
  std::vector<std::string> argv;  // argv[0] is looked up in PATH
  std::optional<std::filesystem::path> working_dir;
  std::vector<std::pair<std::string, std::string>> env;  // Added to parent env
};

// A started child. It leads its own process group, so killing the group
// reaches every descendant that did not create a new group.
struct SpawnedProcess {
  pid_t pid = -1;
  UniqueFd stdin_fd;
  UniqueFd stdout_fd;
  UniqueFd stderr_fd;
};

// OS boundary of the engine. Returns an ExecutionError diagnostic when the
// child could not be started (fork, pipe, chdir or exec failure).
class ProcessSpawner {
 public:
  ProcessSpawner() = default;
  virtual ~ProcessSpawner() = default;
  ProcessSpawner(const ProcessSpawner&) = delete;
  auto operator=(const ProcessSpawner&) -> ProcessSpawner& = delete;
  ProcessSpawner(ProcessSpawner&&) = delete;
  auto operator=(ProcessSpawner&&) -> ProcessSpawner& = delete;

  virtual auto Spawn(const SpawnRequest& request) -> Result<SpawnedProcess> = 0;
};

// fork/exec with pipes for all three standard streams. Parent-side
// descriptors are non-blocking and close-on-exec.
class PosixProcessSpawner final : public ProcessSpawner {
 public:
  auto Spawn(const SpawnRequest& request) -> Result<SpawnedProcess> override;
};

auto DefaultSpawner() -> ProcessSpawner&;

// SIGKILL the whole process group led by `pid`. Ignores groups that are gone.
void KillProcessGroup(pid_t pid);

// Blocks until `pid` exits. Signalled exits are reported as 128 + signal.
auto WaitForExit(pid_t pid) -> int;

// Non-blocking reap. Returns the exit code if the child has exited.
auto TryReap(pid_t pid) -> std::optional<int>;

}  // namespace polyglot::executor
