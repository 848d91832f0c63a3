#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "polyglot/common/diagnostic.hpp"

namespace polyglot::driver {

inline constexpr const char* kConfigFileName = "polyglot.toml";

// Contents of polyglot.toml. Every field is optional; command-line flags
// override what is set here.
struct ProjectConfig {
  std::vector<std::string> files;  // Resolved against root_dir
  std::optional<size_t> jobs;
  std::optional<double> timeout_seconds;
  std::optional<std::string> workspace;
  bool keep_workspace = false;
  std::optional<std::string> json_report;
  std::optional<std::string> xunit_report;

  // Directory where polyglot.toml was found
  std::filesystem::path root_dir;
};

// Search for polyglot.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse polyglot.toml.
// Returns a HostError diagnostic on parse errors or mistyped fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// FindConfig + LoadConfig; nullopt when there is no config file.
auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>>;

}  // namespace polyglot::driver
