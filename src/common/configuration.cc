#include "configuration.h"
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Leasehold {

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
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
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

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
    return validate();
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
    return validate();
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["leasehold"]) {
        LOG(WARNING) << "Configuration has no 'leasehold' section, keeping current values";
        return;
    }
    auto root = yaml["leasehold"];

    // Coordinator
    if (root["coordinator"]) {
        auto coordinator = root["coordinator"];
        if (coordinator["lease_time_ms"]) config_.coordinator.lease_time_ms.set(coordinator["lease_time_ms"].as<int64_t>());
        if (coordinator["refresh_interval_ms"]) config_.coordinator.refresh_interval_ms.set(coordinator["refresh_interval_ms"].as<int64_t>());
        if (coordinator["lease_collection"]) config_.coordinator.lease_collection.set(coordinator["lease_collection"].as<std::string>());
    }

    // Retry
    if (root["retry"]) {
        auto retry = root["retry"];
        if (retry["strategy"]) config_.retry.strategy.set(retry["strategy"].as<std::string>());
        if (retry["initial_backoff_ms"]) config_.retry.initial_backoff_ms.set(retry["initial_backoff_ms"].as<int64_t>());
        if (retry["max_backoff_ms"]) config_.retry.max_backoff_ms.set(retry["max_backoff_ms"].as<int64_t>());
        if (retry["multiplier"]) config_.retry.multiplier.set(retry["multiplier"].as<double>());
        if (retry["max_attempts"]) config_.retry.max_attempts.set(retry["max_attempts"].as<int>());
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"lease-time", required_argument, 0, 'l'},
        {"refresh-interval", required_argument, 0, 'r'},
        {"lease-collection", required_argument, 0, 'c'},
        {"retry-strategy", required_argument, 0, 's'},
        {"max-attempts", required_argument, 0, 'a'},
        {"config", required_argument, 0, 'f'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    // Long options only; short ones belong to the application parser
    while ((c = getopt_long(argc, argv, "", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'l':
                    config_.coordinator.lease_time_ms.set(std::stoll(optarg));
                    break;
                case 'r':
                    config_.coordinator.refresh_interval_ms.set(std::stoll(optarg));
                    break;
                case 'c':
                    config_.coordinator.lease_collection.set(optarg);
                    break;
                case 's':
                    config_.retry.strategy.set(optarg);
                    break;
                case 'a':
                    config_.retry.max_attempts.set(std::stoi(optarg));
                    break;
                case 'f':
                    if (!loadFromFile(optarg)) {
                        LOG(ERROR) << "Ignoring invalid configuration file " << optarg;
                    }
                    break;
                default:
                    // Ignore unknown flags, the application parser handles them
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse command line value '" << optarg << "': " << e.what();
        }
    }
}

void Configuration::resetToDefaults() {
    config_ = LeaseholdConfig();
    validation_errors_.clear();
}

int64_t Configuration::getRefreshIntervalMs() const {
    int64_t interval = config_.coordinator.refresh_interval_ms.get();
    if (interval > 0) {
        return interval;
    }
    return config_.coordinator.lease_time_ms.get() / 2;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const auto& coordinator = config_.coordinator;
    int64_t lease_time_ms = coordinator.lease_time_ms.get();
    if (lease_time_ms <= 0) {
        validation_errors_.push_back("Lease time must be positive");
    }

    int64_t refresh_interval_ms = coordinator.refresh_interval_ms.get();
    if (refresh_interval_ms < 0) {
        validation_errors_.push_back("Refresh interval cannot be negative");
    } else if (refresh_interval_ms >= lease_time_ms && lease_time_ms > 0) {
        validation_errors_.push_back("Refresh interval must be smaller than the lease time");
    }

    if (coordinator.lease_collection.get().empty()) {
        validation_errors_.push_back("Lease collection cannot be empty");
    }

    const auto& retry = config_.retry;
    std::string strategy = retry.strategy.get();
    if (strategy != "exponential" && strategy != "fixed" && strategy != "none") {
        validation_errors_.push_back("Unknown retry strategy '" + strategy + "'");
    }

    if (retry.initial_backoff_ms.get() <= 0 || retry.max_backoff_ms.get() <= 0) {
        validation_errors_.push_back("Retry backoff must be positive");
    } else if (retry.initial_backoff_ms.get() > retry.max_backoff_ms.get()) {
        validation_errors_.push_back("Initial retry backoff cannot exceed the maximum backoff");
    }

    if (retry.multiplier.get() < 1.0) {
        validation_errors_.push_back("Retry multiplier must be at least 1.0");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Leasehold
