#ifndef TRACEDIFF_SRC_ORCHESTRATOR_ORCHESTRATOR_H_
#define TRACEDIFF_SRC_ORCHESTRATOR_ORCHESTRATOR_H_

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "capture/capture_runner.h"
#include "common/configuration.h"
#include "compare/equivalence_engine.h"
#include "capture_executor.h"
#include "execution_gate.h"
#include "trace_report.h"

namespace TraceDiff {

/**
 * Runs traces against the candidate and the reference and compares the
 * transcripts.
 *
 * Suite order is the caller's order. Consecutive concurrent traces form a
 * window: all of their captures are submitted to the executor at once and
 * the window drains before the next sequential trace starts. A sequential
 * trace holds the execution gate exclusively and runs candidate, then
 * reference, on the calling thread. A capture failure becomes that trace's
 * report and never stops the suite.
 */
class Orchestrator {
public:
    struct Options {
        std::string candidate = "./tsh";
        std::string reference = "./tshref";
        size_t max_parallel_captures = 16;
    };

    Orchestrator(Options options,
                 std::shared_ptr<ICaptureRunner> runner,
                 std::shared_ptr<const ILineLocator> locator,
                 ExecutionGate& gate = ExecutionGate::Global());

    // Program paths, parallelism and locator tokens come from config.
    Orchestrator(const Configuration& config, std::shared_ptr<ICaptureRunner> runner);

    TraceReport RunTrace(const TraceSpec& spec);

    // Throws std::invalid_argument on duplicate trace ids.
    SuiteReport RunSuite(const std::vector<TraceSpec>& specs);

    const Options& options() const { return options_; }

private:
    struct PendingTrace {
        TraceSpec spec;
        std::future<std::string> candidate;
        std::future<std::string> reference;
    };

    PendingTrace LaunchConcurrent(const TraceSpec& spec);
    std::future<std::string> SubmitCapture(int trace, const std::string& program);
    TraceReport Collect(PendingTrace& pending);
    TraceReport RunSequential(const TraceSpec& spec);
    void RunWindow(const std::vector<TraceSpec>& window, SuiteReport& reports);
    void Finish(TraceReport& report) const;

    Options options_;
    std::shared_ptr<ICaptureRunner> runner_;
    EquivalenceEngine engine_;
    ExecutionGate& gate_;
    CaptureExecutor executor_;
};

} // namespace TraceDiff

#endif // TRACEDIFF_SRC_ORCHESTRATOR_ORCHESTRATOR_H_
