#include "orchestrator.h"

#include <set>
#include <stdexcept>

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "capture/capture_error.h"
#include "capture/invocation.h"
#include "compare/nondeterminism_locator.h"

namespace TraceDiff {

namespace {

Orchestrator::Options OptionsFromConfig(const Configuration& config) {
    Orchestrator::Options options;
    options.candidate = config.getCandidate();
    options.reference = config.getReference();
    options.max_parallel_captures = static_cast<size_t>(config.getMaxParallelCaptures());
    return options;
}

CaptureFailure ToFailure(CaptureError::Kind kind, const std::string& program,
                         const std::string& message, int exit_status = -1) {
    CaptureFailure failure;
    failure.kind = kind;
    failure.program = program;
    failure.message = message;
    failure.exit_status = exit_status;
    return failure;
}

// Runs one capture, storing the transcript, or the partial output and the
// first failure. Returns false on failure.
template<typename CaptureFn>
bool RunCapture(CaptureFn&& capture, const std::string& program, TraceReport& report, std::string& output) {
    try {
        output = capture();
        return true;
    } catch (const CaptureError& e) {
        LOG(ERROR) << TraceFileName(report.spec.trace) << ": capture of " << program
                   << " failed (" << CaptureError::KindName(e.kind()) << "): " << e.what();
        output = e.partial_output();
        if (!report.failure) {
            report.failure = ToFailure(e.kind(), program, e.what(), e.exit_status());
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << TraceFileName(report.spec.trace) << ": capture of " << program
                   << " failed: " << e.what();
        if (!report.failure) {
            report.failure = ToFailure(CaptureError::Kind::kInternal, program, e.what());
        }
    }
    return false;
}

} // namespace

Orchestrator::Orchestrator(Options options,
                           std::shared_ptr<ICaptureRunner> runner,
                           std::shared_ptr<const ILineLocator> locator,
                           ExecutionGate& gate)
    : options_(std::move(options)),
      runner_(std::move(runner)),
      engine_(std::move(locator)),
      gate_(gate),
      executor_(options_.max_parallel_captures) {
    if (!runner_) {
        throw std::invalid_argument("Orchestrator requires a capture runner");
    }
}

Orchestrator::Orchestrator(const Configuration& config, std::shared_ptr<ICaptureRunner> runner)
    : Orchestrator(OptionsFromConfig(config), std::move(runner),
                   std::make_shared<NondeterminismLocator>(config.getProgramTokens())) {}

TraceReport Orchestrator::RunTrace(const TraceSpec& spec) {
    if (spec.execution == ExecutionMode::kSequential) {
        return RunSequential(spec);
    }
    PendingTrace pending = LaunchConcurrent(spec);
    return Collect(pending);
}

SuiteReport Orchestrator::RunSuite(const std::vector<TraceSpec>& specs) {
    std::set<int> seen;
    for (const auto& spec : specs) {
        if (!seen.insert(spec.trace).second) {
            throw std::invalid_argument(absl::StrCat("Duplicate trace id in suite: ", spec.trace));
        }
    }

    SuiteReport reports;
    std::vector<TraceSpec> window;
    for (const auto& spec : specs) {
        if (spec.execution == ExecutionMode::kConcurrent) {
            window.push_back(spec);
            continue;
        }
        // The open window must drain before a sequential trace may start.
        RunWindow(window, reports);
        window.clear();
        reports.emplace(spec.trace, RunSequential(spec));
    }
    RunWindow(window, reports);

    size_t passed = 0;
    for (const auto& entry : reports) {
        if (entry.second.passed()) ++passed;
    }
    LOG(INFO) << "Suite finished: " << passed << "/" << reports.size() << " traces passed";
    return reports;
}

Orchestrator::PendingTrace Orchestrator::LaunchConcurrent(const TraceSpec& spec) {
    PendingTrace pending;
    pending.spec = spec;
    pending.candidate = SubmitCapture(spec.trace, options_.candidate);
    pending.reference = SubmitCapture(spec.trace, options_.reference);
    return pending;
}

std::future<std::string> Orchestrator::SubmitCapture(int trace, const std::string& program) {
    return executor_.ExecuteAsync([this, trace, program]() {
        auto hold = gate_.EnterConcurrent();
        return runner_->Capture(trace, program, ExecutionMode::kConcurrent);
    });
}

TraceReport Orchestrator::Collect(PendingTrace& pending) {
    TraceReport report;
    report.spec = pending.spec;
    // Both futures are awaited even if the first failed, so no capture
    // outlives its trace.
    RunCapture([&pending]() { return pending.candidate.get(); }, options_.candidate,
               report, report.candidate_output);
    RunCapture([&pending]() { return pending.reference.get(); }, options_.reference,
               report, report.reference_output);
    Finish(report);
    return report;
}

TraceReport Orchestrator::RunSequential(const TraceSpec& spec) {
    TraceReport report;
    report.spec = spec;

    auto hold = gate_.EnterSequential();
    VLOG(1) << TraceFileName(spec.trace) << ": running sequentially";

    // The reference is skipped once the candidate has failed.
    if (!RunCapture([this, &spec]() {
                        return runner_->Capture(spec.trace, options_.candidate, ExecutionMode::kSequential);
                    },
                    options_.candidate, report, report.candidate_output)) {
        return report;
    }
    if (!RunCapture([this, &spec]() {
                        return runner_->Capture(spec.trace, options_.reference, ExecutionMode::kSequential);
                    },
                    options_.reference, report, report.reference_output)) {
        return report;
    }

    Finish(report);
    return report;
}

void Orchestrator::RunWindow(const std::vector<TraceSpec>& window, SuiteReport& reports) {
    if (window.empty()) return;
    VLOG(1) << "Launching " << window.size() << " concurrent traces";

    std::vector<PendingTrace> pending;
    pending.reserve(window.size());
    for (const auto& spec : window) {
        pending.push_back(LaunchConcurrent(spec));
    }
    for (auto& trace : pending) {
        reports.emplace(trace.spec.trace, Collect(trace));
    }
}

void Orchestrator::Finish(TraceReport& report) const {
    if (report.failure) return;
    try {
        report.verdict = engine_.CompareTranscripts(report.candidate_output, report.reference_output,
                                                    report.spec.compare);
    } catch (const std::exception& e) {
        LOG(ERROR) << TraceFileName(report.spec.trace) << ": comparison failed: " << e.what();
        report.failure = ToFailure(CaptureError::Kind::kInternal, "", e.what());
        return;
    }
    if (report.verdict->ok()) {
        VLOG(1) << TraceFileName(report.spec.trace) << ": equal";
    } else {
        LOG(INFO) << TraceFileName(report.spec.trace) << ": " << report.verdict->ToString();
    }
}

} // namespace TraceDiff
