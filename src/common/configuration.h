#ifndef LEASEHOLD_CONFIGURATION_H_
#define LEASEHOLD_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace Leasehold {

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
struct LeaseholdConfig {
    struct Coordinator {
        ConfigValue<int64_t> lease_time_ms{kDefaultLeaseTimeMs, "LEASEHOLD_LEASE_TIME_MS"};
        // 0 = half of lease_time_ms
        ConfigValue<int64_t> refresh_interval_ms{kDefaultRefreshIntervalMs, "LEASEHOLD_REFRESH_INTERVAL_MS"};
        ConfigValue<std::string> lease_collection{kDefaultLeaseCollection, "LEASEHOLD_LEASE_COLLECTION"};
    } coordinator;

    struct Retry {
        // Supported strategies: exponential, fixed, none
        ConfigValue<std::string> strategy{"exponential", "LEASEHOLD_RETRY_STRATEGY"};
        ConfigValue<int64_t> initial_backoff_ms{kDefaultInitialBackoffMs, "LEASEHOLD_RETRY_INITIAL_BACKOFF_MS"};
        ConfigValue<int64_t> max_backoff_ms{kDefaultMaxBackoffMs, "LEASEHOLD_RETRY_MAX_BACKOFF_MS"};
        ConfigValue<double> multiplier{kDefaultBackoffMultiplier, "LEASEHOLD_RETRY_MULTIPLIER"};
        // <= 0 retries until the call succeeds or the coordinator shuts down
        ConfigValue<int> max_attempts{kDefaultMaxAttempts, "LEASEHOLD_RETRY_MAX_ATTEMPTS"};
    } retry;
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

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Drop everything loaded so far
    void resetToDefaults();

    // Get the configuration
    const LeaseholdConfig& config() const { return config_; }
    LeaseholdConfig& config() { return config_; }

    // Helper methods for common access patterns
    int64_t getLeaseTimeMs() const { return config_.coordinator.lease_time_ms.get(); }
    int64_t getRefreshIntervalMs() const;
    std::string getLeaseCollection() const { return config_.coordinator.lease_collection.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    LeaseholdConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Leasehold

#endif // LEASEHOLD_CONFIGURATION_H_
