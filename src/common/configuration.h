#ifndef SUBGATE_CONFIGURATION_H_
#define SUBGATE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace Subgate {

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
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct SubgateConfig {
    // Companion settings read by the invisible-row quota owner
    struct Limits {
        ConfigValue<int64_t> default_inactive_base_limit{kDefaultInactiveBaseLimit,
            "SUBGATE_DEFAULT_INACTIVE_BASE_LIMIT"};
    } limits;

    struct Logging {
        // Forwarded to FLAGS_v
        ConfigValue<int> verbosity{0, "SUBGATE_LOG_VERBOSITY"};
        ConfigValue<bool> to_stderr{true, "SUBGATE_LOG_TO_STDERR"};
    } logging;

    struct Replay {
        // Log a metrics line after every replayed operation
        ConfigValue<bool> print_metrics{true, "SUBGATE_REPLAY_PRINT_METRICS"};
    } replay;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments. Returns false if --config could
    // not be loaded or an option value is malformed.
    bool overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const SubgateConfig& config() const { return config_; }
    SubgateConfig& config() { return config_; }

    // Helper methods for common access patterns
    int64_t getDefaultInactiveBaseLimit() const { return config_.limits.default_inactive_base_limit.get(); }
    int getLogVerbosity() const { return config_.logging.verbosity.get(); }
    bool getLogToStderr() const { return config_.logging.to_stderr.get(); }

    // Restore compiled-in defaults (used between tests)
    void resetToDefaults() { config_ = SubgateConfig{}; validation_errors_.clear(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SubgateConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Subgate

#endif // SUBGATE_CONFIGURATION_H_
