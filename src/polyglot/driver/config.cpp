#include "config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "polyglot/common/diagnostic.hpp"

namespace polyglot::driver {

namespace fs = std::filesystem;

namespace {

auto FieldError(const fs::path& config_path, std::string_view field,
                std::string_view expected) -> Diagnostic {
  return Diagnostic::HostError(fmt::format(
      "{}: '{}' must be {}", config_path.string(), field, expected));
}

// Relative paths in the config are relative to the config's directory.
auto Resolve(const fs::path& root, const std::string& path) -> std::string {
  fs::path p(path);
  if (p.is_relative()) {
    p = root / p;
  }
  return p.lexically_normal().string();
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to parse {}: {}", config_path.string(),
        e.description())));
  }

  // [suite] section
  if (auto suite = tbl["suite"]) {
    if (auto files = suite["files"]) {
      auto* files_arr = files.as_array();
      if (files_arr == nullptr) {
        return std::unexpected(
            FieldError(config_path, "suite.files", "an array of paths"));
      }
      for (const auto& elem : *files_arr) {
        auto str = elem.value<std::string>();
        if (!str) {
          return std::unexpected(
              FieldError(config_path, "suite.files", "an array of paths"));
        }
        config.files.push_back(Resolve(config.root_dir, *str));
      }
    }
  }

  // [run] section
  if (auto run = tbl["run"]) {
    if (auto jobs = run["jobs"]) {
      auto value = jobs.value<int64_t>();
      if (!value || *value < 0) {
        return std::unexpected(
            FieldError(config_path, "run.jobs", "a non-negative integer"));
      }
      config.jobs = static_cast<size_t>(*value);
    }
    if (auto timeout = run["timeout"]) {
      // Integers convert to double, so `timeout = 5` works too
      auto value = timeout.value<double>();
      if (!value || *value <= 0) {
        return std::unexpected(FieldError(
            config_path, "run.timeout", "a positive number of seconds"));
      }
      config.timeout_seconds = *value;
    }
    if (auto workspace = run["workspace"]) {
      auto value = workspace.value<std::string>();
      if (!value) {
        return std::unexpected(
            FieldError(config_path, "run.workspace", "a path"));
      }
      config.workspace = Resolve(config.root_dir, *value);
    }
    if (auto keep = run["keep_workspace"]) {
      auto value = keep.value<bool>();
      if (!value) {
        return std::unexpected(
            FieldError(config_path, "run.keep_workspace", "a boolean"));
      }
      config.keep_workspace = *value;
    }
  }

  // [report] section
  if (auto report = tbl["report"]) {
    if (auto json = report["json"]) {
      auto value = json.value<std::string>();
      if (!value) {
        return std::unexpected(
            FieldError(config_path, "report.json", "a path"));
      }
      config.json_report = *value == "-" ? *value
                                         : Resolve(config.root_dir, *value);
    }
    if (auto xunit = report["xunit"]) {
      auto value = xunit.value<std::string>();
      if (!value) {
        return std::unexpected(
            FieldError(config_path, "report.xunit", "a path"));
      }
      config.xunit_report = *value == "-" ? *value
                                          : Resolve(config.root_dir, *value);
    }
  }

  return config;
}

auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>> {
  auto config_path = FindConfig();
  if (!config_path) {
    return std::optional<ProjectConfig>{};
  }
  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::optional<ProjectConfig>(std::move(*config));
}

}  // namespace polyglot::driver
