#include "polyglot/executor/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "polyglot/common/diagnostic.hpp"

namespace polyglot::executor {

namespace {

auto ErrnoText(int err) -> std::string {
  return std::strerror(err);
}

auto MakePipe(UniqueFd& read_end, UniqueFd& write_end) -> bool {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) != 0) {
    return false;
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

void SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Writes to a closed stdin pipe must surface as EPIPE, not kill the engine.
void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Parent environment with `overrides` applied, as NAME=VALUE entries.
auto BuildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides)
    -> std::vector<std::string> {
  std::vector<std::string> entries;
  for (char** env = environ; *env != nullptr; ++env) {
    std::string_view entry(*env);
    auto name = entry.substr(0, entry.find('='));
    bool overridden = std::ranges::any_of(
        overrides, [&](const auto& kv) { return kv.first == name; });
    if (!overridden) {
      entries.emplace_back(entry);
    }
  }
  for (const auto& [name, value] : overrides) {
    auto prefix = name + "=";
    std::erase_if(entries, [&](const std::string& e) {
      return e.starts_with(prefix);
    });
    entries.push_back(prefix + value);
  }
  return entries;
}

// Child side after fork. Only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(
    const std::vector<char*>& argv, const std::vector<char*>& envp,
    const char* working_dir,
    const std::array<int, 3>& stdio, int error_fd) {
  setpgid(0, 0);

  sigset_t all;
  sigemptyset(&all);
  sigprocmask(SIG_SETMASK, &all, nullptr);
  signal(SIGPIPE, SIG_DFL);

  for (int target = 0; target < 3; ++target) {
    if (dup2(stdio[target], target) < 0) {
      int err = errno;
      (void)write(error_fd, &err, sizeof(err));
      _exit(127);
    }
  }
  if (working_dir != nullptr && chdir(working_dir) != 0) {
    int err = errno;
    (void)write(error_fd, &err, sizeof(err));
    _exit(127);
  }
  execvpe(argv[0], argv.data(), envp.data());
  int err = errno;
  (void)write(error_fd, &err, sizeof(err));
  _exit(127);
}

}  // namespace

void UniqueFd::Reset(int fd) {
  if (fd_ >= 0) {
    close(fd_);
  }
  fd_ = fd;
}

auto PosixProcessSpawner::Spawn(const SpawnRequest& request)
    -> Result<SpawnedProcess> {
  if (request.argv.empty()) {
    return std::unexpected(Diagnostic::ExecutionError("empty command"));
  }
  IgnoreSigpipeOnce();

  UniqueFd in_read;
  UniqueFd in_write;
  UniqueFd out_read;
  UniqueFd out_write;
  UniqueFd err_read;
  UniqueFd err_write;
  UniqueFd status_read;
  UniqueFd status_write;
  if (!MakePipe(in_read, in_write) || !MakePipe(out_read, out_write) ||
      !MakePipe(err_read, err_write) || !MakePipe(status_read, status_write)) {
    return std::unexpected(Diagnostic::ExecutionError(
        fmt::format("pipe() failed: {}", ErrnoText(errno))));
  }

  // Everything the child touches is prepared before fork
  std::vector<char*> c_argv;
  c_argv.reserve(request.argv.size() + 1);
  for (const auto& arg : request.argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);
  std::string working_dir =
      request.working_dir ? request.working_dir->string() : std::string{};
  std::array<int, 3> stdio = {in_read.Get(), out_write.Get(), err_write.Get()};

  std::vector<std::string> env_storage = BuildEnvironment(request.env);
  std::vector<char*> c_env;
  c_env.reserve(env_storage.size() + 1);
  for (auto& entry : env_storage) {
    c_env.push_back(entry.data());
  }
  c_env.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    return std::unexpected(Diagnostic::ExecutionError(
        fmt::format("fork() failed: {}", ErrnoText(errno))));
  }
  if (pid == 0) {
    ExecChild(
        c_argv, c_env, working_dir.empty() ? nullptr : working_dir.c_str(),
        stdio, status_write.Get());
  }

  // Both sides call setpgid so the group exists before either proceeds
  setpgid(pid, pid);

  in_read.Reset();
  out_write.Reset();
  err_write.Reset();
  status_write.Reset();

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(status_read.Get(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  if (n == sizeof(child_errno)) {
    WaitForExit(pid);
    return std::unexpected(Diagnostic::ExecutionError(fmt::format(
        "cannot start '{}': {}", request.argv.front(),
        ErrnoText(child_errno))));
  }

  SetNonBlocking(in_write.Get());
  SetNonBlocking(out_read.Get());
  SetNonBlocking(err_read.Get());
  spdlog::debug("spawned pid {} for '{}'", pid, request.argv.front());

  return SpawnedProcess{
      .pid = pid,
      .stdin_fd = std::move(in_write),
      .stdout_fd = std::move(out_read),
      .stderr_fd = std::move(err_read),
  };
}

auto DefaultSpawner() -> ProcessSpawner& {
  static PosixProcessSpawner spawner;
  return spawner;
}

void KillProcessGroup(pid_t pid) {
  if (pid <= 0) {
    return;
  }
  if (killpg(pid, SIGKILL) == 0) {
    spdlog::debug("killed process group {}", pid);
  }
}

auto WaitForExit(pid_t pid) -> int {
  int status = 0;
  pid_t r = 0;
  do {
    r = waitpid(pid, &status, 0);
  } while (r < 0 && errno == EINTR);
  if (r < 0) {
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto TryReap(pid_t pid) -> std::optional<int> {
  int status = 0;
  pid_t r = waitpid(pid, &status, WNOHANG);
  if (r == 0) {
    return std::nullopt;
  }
  if (r < 0) {
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace polyglot::executor
