#pragma once

#include <string>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/result/result.hpp"

namespace polyglot::driver {

// Whole result tree as JSON. Path "-" writes to stdout.
auto WriteJsonReport(const result::SuiteResult& result, const std::string& path)
    -> Result<void>;

// JUnit-style XML: one <testsuite> per environment and one <testcase> per
// scenario run. Path "-" writes to stdout.
auto WriteXunitReport(
    const result::SuiteResult& result, const std::string& path)
    -> Result<void>;

// Rendering only, for tests.
auto RenderJsonReport(const result::SuiteResult& result) -> std::string;
auto RenderXunitReport(const result::SuiteResult& result) -> std::string;

}  // namespace polyglot::driver
