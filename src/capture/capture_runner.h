#pragma once

#include <string>

#include "common/trace_spec.h"

namespace TraceDiff {

/**
 * Interface for transcript capture.
 * Returns the combined stdout+stderr of running program_path against the
 * given trace, or throws CaptureError. mode tells the runner how the caller
 * scheduled the capture; scheduling itself is the orchestrator's job.
 */
class ICaptureRunner {
public:
    virtual ~ICaptureRunner() = default;

    virtual std::string Capture(int trace, const std::string& program_path, ExecutionMode mode) = 0;
};

} // namespace TraceDiff
