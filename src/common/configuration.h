#ifndef TRACEDIFF_CONFIGURATION_H_
#define TRACEDIFF_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "trace_spec.h"

namespace YAML {
class Node;
}

namespace TraceDiff {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (override_.has_value()) {
            return override_.value();
        }
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    // File/default value; the environment still wins over it
    void set(T value) { value_ = value; }
    // Command-line value; wins over the environment
    void setOverride(T value) { override_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::optional<T> override_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Harness configuration. Passed explicitly to the orchestrator and the
 * capture runner; there is no process-wide instance.
 */
struct TraceDiffConfig {
    // Trace-driving tool and the two programs under comparison
    ConfigValue<std::string> driver{"./sdriver.pl", "TRACEDIFF_DRIVER"};
    ConfigValue<std::string> candidate{"./tsh", "TRACEDIFF_CANDIDATE"};
    ConfigValue<std::string> reference{"./tshref", "TRACEDIFF_REFERENCE"};
    // Passed verbatim to the driver's -a option
    ConfigValue<std::string> flags{"-p", "TRACEDIFF_FLAGS"};

    struct Capture {
        // 0 disables the timeout
        ConfigValue<int> timeout_ms{0, "TRACEDIFF_CAPTURE_TIMEOUT_MS"};
        ConfigValue<bool> require_zero_exit{true, "TRACEDIFF_REQUIRE_ZERO_EXIT"};
    } capture;

    struct Orchestrator {
        ConfigValue<int> max_parallel_captures{16, "TRACEDIFF_MAX_PARALLEL_CAPTURES"};
    } orchestrator;

    struct Locator {
        // Program names stripped from process listing lines
        std::vector<std::string> program_tokens{"tsh", "tshref"};
    } locator;

    std::vector<TraceSpec> suite = DefaultSuite();
};

/**
 * Loads, overrides and validates a TraceDiffConfig.
 */
class Configuration {
public:
    Configuration() = default;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const TraceDiffConfig& config() const { return config_; }
    TraceDiffConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getDriver() const { return config_.driver.get(); }
    std::string getCandidate() const { return config_.candidate.get(); }
    std::string getReference() const { return config_.reference.get(); }
    std::string getFlags() const { return config_.flags.get(); }
    int getCaptureTimeoutMs() const { return config_.capture.timeout_ms.get(); }
    int getMaxParallelCaptures() const { return config_.orchestrator.max_parallel_captures.get(); }

    // Configured tokens plus the basenames of both programs, longest first
    std::vector<std::string> getProgramTokens() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    TraceDiffConfig config_;
    mutable std::vector<std::string> validation_errors_;

    bool loadFromNode(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace TraceDiff

#endif // TRACEDIFF_CONFIGURATION_H_
