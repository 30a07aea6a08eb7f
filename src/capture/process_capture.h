#ifndef TRACEDIFF_SRC_CAPTURE_PROCESS_CAPTURE_H_
#define TRACEDIFF_SRC_CAPTURE_PROCESS_CAPTURE_H_

#include <string>

#include "capture_runner.h"
#include "common/configuration.h"

namespace TraceDiff {

/**
 * Captures transcripts by running the trace driver under /bin/sh -c.
 *
 * The child gets its own process group, /dev/null as stdin and a single
 * pipe as both stdout and stderr, so the two streams arrive interleaved in
 * the order they were written. The capture thread blocks in poll() until
 * EOF and then reaps the child. With a nonzero timeout the whole process
 * group is killed once the deadline passes and CaptureError(kTimeout) is
 * thrown with the partial output.
 */
class ProcessCaptureRunner : public ICaptureRunner {
public:
    struct Options {
        std::string driver = "./sdriver.pl";
        std::string flags = "-p";
        int timeout_ms = 0;  // 0: wait forever
        bool require_zero_exit = true;
    };

    explicit ProcessCaptureRunner(Options options);
    explicit ProcessCaptureRunner(const Configuration& config);

    std::string Capture(int trace, const std::string& program_path, ExecutionMode mode) override;

    // Runs an arbitrary shell command under the same capture discipline.
    std::string CaptureCommand(const std::string& command) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};

} // namespace TraceDiff

#endif // TRACEDIFF_SRC_CAPTURE_PROCESS_CAPTURE_H_
