#pragma once

#include <optional>
#include <string>

#include <absl/container/btree_map.h>

#include "capture/capture_error.h"
#include "common/trace_spec.h"
#include "compare/verdict.h"

namespace TraceDiff {

struct CaptureFailure {
    CaptureError::Kind kind = CaptureError::Kind::kSpawn;
    std::string program;   // which side failed; empty when the comparison itself failed
    std::string message;
    int exit_status = -1;
};

/**
 * Result of one trace. Exactly one of verdict / failure is set. Both
 * transcripts are kept (partial output on failure) since they are what a
 * human needs to diagnose the divergence.
 */
struct TraceReport {
    TraceSpec spec;
    std::optional<Verdict> verdict;
    std::optional<CaptureFailure> failure;
    std::string candidate_output;
    std::string reference_output;

    bool passed() const { return !failure && verdict && verdict->ok(); }
};

// Ordered by trace id
using SuiteReport = absl::btree_map<int, TraceReport>;

} // namespace TraceDiff
