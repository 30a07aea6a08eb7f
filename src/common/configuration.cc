#include "configuration.h"

#include <algorithm>
#include <cstdlib>
#include <set>

#include <absl/strings/str_cat.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "env_flags.h"

namespace TraceDiff {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        if (IsEnvTrueValue(env_val)) return true;
        if (IsEnvFalseValue(env_val)) return false;
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        return loadFromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        return loadFromNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::loadFromNode(const YAML::Node& yaml) {
    if (!yaml["tracediff"]) {
        LOG(WARNING) << "Configuration has no top-level 'tracediff' key; using defaults";
        return validate();
    }
    auto root = yaml["tracediff"];

    if (root["driver"]) config_.driver.set(root["driver"].as<std::string>());
    if (root["candidate"]) config_.candidate.set(root["candidate"].as<std::string>());
    if (root["reference"]) config_.reference.set(root["reference"].as<std::string>());
    if (root["flags"]) config_.flags.set(root["flags"].as<std::string>());

    // Capture
    if (root["capture"]) {
        auto capture = root["capture"];
        if (capture["timeout_ms"]) config_.capture.timeout_ms.set(capture["timeout_ms"].as<int>());
        if (capture["require_zero_exit"]) config_.capture.require_zero_exit.set(capture["require_zero_exit"].as<bool>());
    }

    // Orchestrator
    if (root["orchestrator"]) {
        auto orchestrator = root["orchestrator"];
        if (orchestrator["max_parallel_captures"]) {
            config_.orchestrator.max_parallel_captures.set(orchestrator["max_parallel_captures"].as<int>());
        }
    }

    // Locator
    if (root["locator"] && root["locator"]["program_tokens"]) {
        config_.locator.program_tokens.clear();
        for (const auto& token : root["locator"]["program_tokens"]) {
            config_.locator.program_tokens.push_back(token.as<std::string>());
        }
    }

    // Suite
    if (root["suite"]) {
        std::vector<TraceSpec> suite;
        for (const auto& entry : root["suite"]) {
            TraceSpec spec;
            spec.trace = entry["trace"].as<int>();
            if (entry["mode"]) {
                auto mode = ParseExecutionMode(entry["mode"].as<std::string>());
                if (!mode) {
                    LOG(ERROR) << "Unknown execution mode '" << entry["mode"].as<std::string>()
                               << "' for trace " << spec.trace;
                    return false;
                }
                spec.execution = *mode;
            }
            if (entry["compare"]) {
                auto compare = ParseCompareMode(entry["compare"].as<std::string>());
                if (!compare) {
                    LOG(ERROR) << "Unknown compare mode '" << entry["compare"].as<std::string>()
                               << "' for trace " << spec.trace;
                    return false;
                }
                spec.compare = *compare;
            }
            suite.push_back(spec);
        }
        config_.suite = std::move(suite);
    }

    return validate();
}

std::vector<std::string> Configuration::getProgramTokens() const {
    std::vector<std::string> tokens = config_.locator.program_tokens;
    for (const std::string& path : {getCandidate(), getReference()}) {
        const size_t slash = path.find_last_of('/');
        std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
        if (!base.empty()) tokens.push_back(std::move(base));
    }
    std::sort(tokens.begin(), tokens.end(), [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() > b.size() : a < b;
    });
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (getDriver().empty()) {
        validation_errors_.push_back("Driver path must not be empty");
    }
    if (getCandidate().empty()) {
        validation_errors_.push_back("Candidate program path must not be empty");
    }
    if (getReference().empty()) {
        validation_errors_.push_back("Reference program path must not be empty");
    }

    if (getCaptureTimeoutMs() < 0) {
        validation_errors_.push_back("Capture timeout must be >= 0 (0 disables it)");
    }
    if (getMaxParallelCaptures() < 1) {
        validation_errors_.push_back("Max parallel captures must be at least 1");
    }

    if (config_.locator.program_tokens.empty()) {
        validation_errors_.push_back("At least one locator program token is required");
    }
    for (const auto& token : config_.locator.program_tokens) {
        if (token.empty()) {
            validation_errors_.push_back("Locator program tokens must not be empty");
            break;
        }
    }

    std::set<int> seen;
    for (const auto& spec : config_.suite) {
        if (spec.trace < 1) {
            validation_errors_.push_back(absl::StrCat("Trace id must be positive: ", spec.trace));
        } else if (!seen.insert(spec.trace).second) {
            validation_errors_.push_back(absl::StrCat("Duplicate trace id in suite: ", spec.trace));
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace TraceDiff
