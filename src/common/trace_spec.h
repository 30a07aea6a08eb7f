#pragma once

#include <optional>
#include <string>
#include <vector>

namespace TraceDiff {

/**
 * How the two captures of a trace may be scheduled.
 * kSequential is required when the scripted scenario observes the process
 * table (e.g. runs `ps`), so no other capture may overlap it.
 */
enum class ExecutionMode {
    kConcurrent,
    kSequential
};

/**
 * How the two transcripts of a trace are compared.
 */
enum class CompareMode {
    kExact,               // every line byte-for-byte
    kMaskNondeterminism   // pid / job annotation fields are masked
};

struct TraceSpec {
    int trace = 0;
    ExecutionMode execution = ExecutionMode::kConcurrent;
    CompareMode compare = CompareMode::kMaskNondeterminism;
};

const char* ExecutionModeName(ExecutionMode mode);
const char* CompareModeName(CompareMode mode);

// Accepts "concurrent"/"sequential" (case-insensitive).
std::optional<ExecutionMode> ParseExecutionMode(const std::string& value);
// Accepts "exact"/"mask" (case-insensitive).
std::optional<CompareMode> ParseCompareMode(const std::string& value);

// trace01..trace16: 1-3 exact, 11 and 12 sequential.
std::vector<TraceSpec> DefaultSuite();

} // namespace TraceDiff
