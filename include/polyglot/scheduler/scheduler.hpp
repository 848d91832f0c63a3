#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

#include "polyglot/executor/process.hpp"
#include "polyglot/result/result.hpp"
#include "polyglot/suite/suite.hpp"

namespace polyglot::scheduler {

struct RunOptions {
  // Used when neither the step, the scenario nor the suite sets a timeout
  std::chrono::milliseconds default_timeout{30000};
  // Worker count; 0 means std::thread::hardware_concurrency()
  size_t jobs = 0;
  // Names to run; empty selects everything
  std::vector<std::string> environments;
  std::vector<std::string> scenarios;
  // Parent of the per-run workspaces; empty uses a fresh temporary directory
  std::filesystem::path workspace_root;
  bool keep_workspaces = false;
  std::stop_token stop_token;
  // Defaults to the POSIX spawner
  executor::ProcessSpawner* spawner = nullptr;
};

// Runs every selected scenario against every selected environment on a
// bounded worker pool. Runs are queued scenario-major and results come back
// in that order regardless of completion order. Never throws for suite or
// program errors; they are recorded in the returned result.
auto RunSuite(const suite::Suite& suite, const RunOptions& options)
    -> result::SuiteResult;

}  // namespace polyglot::scheduler
