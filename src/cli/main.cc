#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <cxxopts.hpp>
#include <glog/logging.h>

#include "capture/process_capture.h"
#include "common/configuration.h"
#include "orchestrator/orchestrator.h"
#include "report/report_formatter.h"

using namespace TraceDiff;

namespace {

constexpr int kExitAllPassed = 0;
constexpr int kExitFailures = 1;
constexpr int kExitUsage = 2;

bool ParseTraceList(const std::string& value, std::vector<int>& ids) {
    for (absl::string_view piece : absl::StrSplit(value, ',', absl::SkipWhitespace())) {
        int id = 0;
        if (!absl::SimpleAtoi(piece, &id)) {
            LOG(ERROR) << "Invalid trace id '" << piece << "' in '" << value << "'";
            return false;
        }
        ids.push_back(id);
    }
    return true;
}

TraceSpec* FindSpec(std::vector<TraceSpec>& suite, int trace) {
    for (auto& spec : suite) {
        if (spec.trace == trace) return &spec;
    }
    return nullptr;
}

// --traces picks ids out of the configured suite; unknown ids get defaults.
bool ApplySuiteOverrides(const cxxopts::ParseResult& result, TraceDiffConfig& config) {
    if (result.count("traces")) {
        std::vector<int> ids;
        if (!ParseTraceList(result["traces"].as<std::string>(), ids)) return false;
        std::vector<TraceSpec> suite;
        for (int id : ids) {
            TraceSpec* configured = FindSpec(config.suite, id);
            TraceSpec spec;
            if (configured) {
                spec = *configured;
            } else {
                spec.trace = id;
            }
            suite.push_back(spec);
        }
        config.suite = std::move(suite);
    }

    if (result.count("sequential")) {
        std::vector<int> ids;
        if (!ParseTraceList(result["sequential"].as<std::string>(), ids)) return false;
        for (int id : ids) {
            if (TraceSpec* spec = FindSpec(config.suite, id)) {
                spec->execution = ExecutionMode::kSequential;
            } else {
                LOG(WARNING) << "--sequential names trace " << id << " which is not in the suite";
            }
        }
    }

    if (result.count("exact")) {
        std::vector<int> ids;
        if (!ParseTraceList(result["exact"].as<std::string>(), ids)) return false;
        for (int id : ids) {
            if (TraceSpec* spec = FindSpec(config.suite, id)) {
                spec->compare = CompareMode::kExact;
            } else {
                LOG(WARNING) << "--exact names trace " << id << " which is not in the suite";
            }
        }
    }
    return true;
}

void LogValidationErrors(const Configuration& config) {
    for (const auto& error : config.getValidationErrors()) {
        LOG(ERROR) << "Config validation error: " << error;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("tracediff", "Compare a shell against its reference over scripted traces");

    options.add_options()
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("d,driver", "Trace-driving tool", cxxopts::value<std::string>())
        ("c,candidate", "Program under test", cxxopts::value<std::string>())
        ("r,reference", "Reference program", cxxopts::value<std::string>())
        ("a,flags", "Flags passed to the driver's -a option", cxxopts::value<std::string>())
        ("t,traces", "Comma-separated trace ids to run", cxxopts::value<std::string>())
        ("sequential", "Comma-separated trace ids that must run alone", cxxopts::value<std::string>())
        ("exact", "Comma-separated trace ids compared without masking", cxxopts::value<std::string>())
        ("timeout_ms", "Per-capture timeout in ms (0 = none)", cxxopts::value<int>())
        ("j,jobs", "Maximum parallel captures", cxxopts::value<int>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << "tracediff: " << e.what() << "\n" << options.help() << std::endl;
        return kExitUsage;
    }
    const cxxopts::ParseResult& result = *parsed;

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return kExitAllPassed;
    }
    FLAGS_v = result["log_level"].as<int>();

    Configuration config;
    if (result.count("config") && !config.loadFromFile(result["config"].as<std::string>())) {
        LOG(ERROR) << "Failed to load configuration file";
        LogValidationErrors(config);
        return kExitUsage;
    }

    // Command line wins over environment and file
    TraceDiffConfig& cfg = config.config();
    if (result.count("driver")) cfg.driver.setOverride(result["driver"].as<std::string>());
    if (result.count("candidate")) cfg.candidate.setOverride(result["candidate"].as<std::string>());
    if (result.count("reference")) cfg.reference.setOverride(result["reference"].as<std::string>());
    if (result.count("flags")) cfg.flags.setOverride(result["flags"].as<std::string>());
    if (result.count("timeout_ms")) cfg.capture.timeout_ms.setOverride(result["timeout_ms"].as<int>());
    if (result.count("jobs")) cfg.orchestrator.max_parallel_captures.setOverride(result["jobs"].as<int>());
    if (!ApplySuiteOverrides(result, cfg)) {
        return kExitUsage;
    }

    if (!config.validate()) {
        LOG(ERROR) << "Configuration validation failed";
        LogValidationErrors(config);
        return kExitUsage;
    }

    LOG(INFO) << "Candidate " << config.getCandidate() << " vs reference " << config.getReference()
              << " via " << config.getDriver() << " (" << cfg.suite.size() << " traces)";

    auto runner = std::make_shared<ProcessCaptureRunner>(config);
    Orchestrator orchestrator(config, runner);
    SuiteReport reports = orchestrator.RunSuite(cfg.suite);

    std::cout << FormatSuite(reports);

    for (const auto& entry : reports) {
        if (!entry.second.passed()) return kExitFailures;
    }
    return kExitAllPassed;
}
