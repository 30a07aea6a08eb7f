#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace TraceDiff {

/**
 * Raised when a transcript cannot be captured. Never retried; the
 * orchestrator records it as the failure of the trace being processed.
 */
class CaptureError : public std::runtime_error {
public:
    enum class Kind {
        kSpawn,    // pipe/fork/exec of the shell failed
        kStream,   // reading the merged output stream failed
        kExit,     // child exited nonzero or was killed
        kTimeout,  // caller-supplied timeout elapsed; child was killed
        kInternal  // any other error while processing the trace
    };

    CaptureError(Kind kind, const std::string& message,
                 std::string partial_output = "", int exit_status = -1)
        : std::runtime_error(message),
          kind_(kind),
          partial_output_(std::move(partial_output)),
          exit_status_(exit_status) {}

    Kind kind() const { return kind_; }
    // Whatever was read before the failure
    const std::string& partial_output() const { return partial_output_; }
    // Raw waitpid status, -1 when the child was never reaped normally
    int exit_status() const { return exit_status_; }

    static const char* KindName(Kind kind) {
        switch (kind) {
            case Kind::kSpawn: return "spawn";
            case Kind::kStream: return "stream";
            case Kind::kExit: return "exit";
            case Kind::kTimeout: return "timeout";
            case Kind::kInternal: return "internal";
        }
        return "unknown";
    }

private:
    Kind kind_;
    std::string partial_output_;
    int exit_status_;
};

} // namespace TraceDiff
