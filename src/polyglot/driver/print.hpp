#pragma once

#include <string>

#include "polyglot/common/diagnostic.hpp"
#include "polyglot/result/result.hpp"

namespace polyglot::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

// One line per run on stdout. Verbose mode adds each step, the patterns of
// failing steps and their captured output.
void PrintRuns(const result::SuiteResult& result, bool verbose);

// Per-environment counts followed by the suite totals.
void PrintSummary(const result::SuiteResult& result);

// Single totals line, e.g. "4 passed, 1 failed in 1.20s".
void PrintTotals(const result::SuiteResult& result);

}  // namespace polyglot::driver
