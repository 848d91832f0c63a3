#pragma once

#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "polyglot/executor/session.hpp"
#include "polyglot/matcher/matcher.hpp"
#include "polyglot/suite/suite.hpp"

namespace polyglot::runtime {

// Mutable state of one (scenario, environment) run. Created when the run
// starts and destroyed when it ends; never shared between runs.
class ExecutionContext {
 public:
  ExecutionContext(
      const suite::Scenario& scenario, const suite::Environment& environment,
      std::filesystem::path workspace, std::stop_token stop)
      : scenario_(scenario),
        environment_(environment),
        workspace_(std::move(workspace)),
        working_dir_(workspace_),
        stop_(std::move(stop)) {
  }

  ExecutionContext(const ExecutionContext&) = delete;
  auto operator=(const ExecutionContext&) -> ExecutionContext& = delete;
  ExecutionContext(ExecutionContext&&) = delete;
  auto operator=(ExecutionContext&&) -> ExecutionContext& = delete;
  ~ExecutionContext() = default;

  [[nodiscard]] auto Scenario() const -> const suite::Scenario& {
    return scenario_;
  }
  [[nodiscard]] auto Environment() const -> const suite::Environment& {
    return environment_;
  }
  [[nodiscard]] auto Workspace() const -> const std::filesystem::path& {
    return workspace_;
  }

  [[nodiscard]] auto WorkingDirectory() const -> const std::filesystem::path& {
    return working_dir_;
  }
  void SetWorkingDirectory(std::filesystem::path dir) {
    working_dir_ = std::move(dir);
  }

  [[nodiscard]] auto Variables() const -> const matcher::Bindings& {
    return variables_;
  }
  [[nodiscard]] auto FindVariable(std::string_view name) const
      -> const std::string* {
    auto it = variables_.find(name);
    return it == variables_.end() ? nullptr : &it->second;
  }
  void Bind(const matcher::Bindings& captured) {
    for (const auto& [name, value] : captured) {
      variables_[name] = value;
    }
  }

  // Process environment overrides: the Environment's own, then sticky
  // exports from earlier steps.
  [[nodiscard]] auto EnvOverrides() const -> const suite::EnvList& {
    return env_;
  }
  void SetEnv(std::string name, std::string value) {
    for (auto& [key, existing] : env_) {
      if (key == name) {
        existing = std::move(value);
        return;
      }
    }
    env_.emplace_back(std::move(name), std::move(value));
  }

  [[nodiscard]] auto StopToken() const -> std::stop_token {
    return stop_;
  }

  [[nodiscard]] auto Session() const -> executor::InteractiveSession* {
    return session_.get();
  }
  void AttachSession(std::unique_ptr<executor::InteractiveSession> session) {
    session_ = std::move(session);
  }
  void CloseSession() {
    session_.reset();
  }

 private:
  const suite::Scenario& scenario_;
  const suite::Environment& environment_;
  std::filesystem::path workspace_;
  std::filesystem::path working_dir_;
  matcher::Bindings variables_;
  suite::EnvList env_;
  std::stop_token stop_;
  std::unique_ptr<executor::InteractiveSession> session_;
};

}  // namespace polyglot::runtime
