#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/suite/suite.hpp"

namespace polyglot::suite {

// Assembles a Suite from one or more YAML streams. Each document declares
// a `type` of suite, environments or scenarios; untyped documents are
// environments when their source ends in ".env.yaml" and a suite otherwise.
//
// Documents are only parsed into the model by Build(), after suite
// defaults from every document are known. All problems are LoadErrors
// carrying the file and line of the offending node.
class SuiteBuilder {
 public:
  SuiteBuilder();
  ~SuiteBuilder();
  SuiteBuilder(SuiteBuilder&&) noexcept;
  auto operator=(SuiteBuilder&&) noexcept -> SuiteBuilder&;
  SuiteBuilder(const SuiteBuilder&) = delete;
  auto operator=(const SuiteBuilder&) -> SuiteBuilder& = delete;

  auto AddDocuments(std::string_view yaml, std::string source_name)
      -> Result<void>;
  auto AddFile(const std::filesystem::path& path) -> Result<void>;

  // Validates cross references: unique names, placeholders resolvable in
  // every environment, acyclic placeholder tables, sessions for `send`.
  auto Build() && -> Result<Suite>;

 private:
  struct Document;
  std::vector<std::unique_ptr<Document>> documents_;
};

auto LoadSuiteFromString(
    std::string_view yaml, std::string source_name = "<string>")
    -> Result<Suite>;

auto LoadSuiteFromFiles(const std::vector<std::filesystem::path>& paths)
    -> Result<Suite>;

}  // namespace polyglot::suite
