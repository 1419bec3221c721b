#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Subgate {

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
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
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
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["subgate"]) {
        LOG(WARNING) << "Configuration has no 'subgate' root, keeping defaults";
        return;
    }
    auto root = yaml["subgate"];

    // Limits
    if (root["limits"]) {
        auto limits = root["limits"];
        if (limits["default_inactive_base_limit"]) {
            config_.limits.default_inactive_base_limit.set(
                limits["default_inactive_base_limit"].as<int64_t>());
        }
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
        if (logging["to_stderr"]) config_.logging.to_stderr.set(logging["to_stderr"].as<bool>());
    }

    // Replay
    if (root["replay"]) {
        auto replay = root["replay"];
        if (replay["print_metrics"]) config_.replay.print_metrics.set(replay["print_metrics"].as<bool>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"default-base-limit", required_argument, 0, 'b'},
        {"verbosity", required_argument, 0, 'v'},
        {"config", required_argument, 0, 'f'},
        // Accept flags owned by the replay tool so getopt_long doesn't error
        {"trace", required_argument, 0, 0},
        {"quiet", no_argument, 0, 0},
        {"help", no_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    bool ok = true;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "b:v:f:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'b':
                    config_.limits.default_inactive_base_limit.set(std::stoll(optarg));
                    break;
                case 'v':
                    config_.logging.verbosity.set(std::stoi(optarg));
                    break;
                case 'f':
                    if (!loadFromFile(optarg)) {
                        LOG(ERROR) << "Failed to load configuration from " << optarg;
                        ok = false;
                    }
                    break;
                case 0:
                    // Known app flags we intentionally ignore here (handled elsewhere)
                    break;
                default:
                    // Ignore unknown flags; the app parser handles them
                    break;
            }
        } catch (const std::exception& e) {
            LOG(ERROR) << "Malformed value for option -" << static_cast<char>(c)
                       << ": " << e.what();
            ok = false;
        }
    }
    return ok;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.limits.default_inactive_base_limit.get() < 0) {
        validation_errors_.push_back("Default inactive base limit must be non-negative");
    }

    int verbosity = config_.logging.verbosity.get();
    if (verbosity < 0 || verbosity > 4) {
        validation_errors_.push_back("Log verbosity must be between 0 and 4");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Subgate
