#pragma once

#include <string>

#include "orchestrator/trace_report.h"

namespace TraceDiff {

// "PASS trace04" / "FAIL trace11: line 3 differs"
std::string FormatSummaryLine(const TraceReport& report);

/**
 * Full diagnostic for a failed trace: what went wrong, followed by both
 * transcripts in full ("actual" is the candidate, "expected" the
 * reference). Empty for a passing trace.
 */
std::string FormatDiagnostic(const TraceReport& report);

// Summary lines for every trace, diagnostics for the failures, and a totals line.
std::string FormatSuite(const SuiteReport& reports);

} // namespace TraceDiff
