#ifndef ESTUARY_CONFIGURATION_H_
#define ESTUARY_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Estuary {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), default_(default_value), env_var_(env_var) {}

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
    void reset() { value_ = default_; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    T default_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

// Template specializations for getEnvValue
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

/**
 * Main configuration structure
 */
struct EstuaryConfig {
    // Merge engine
    struct Engine {
        // Rows per output batch; a full output batch is flushed downstream.
        ConfigValue<size_t> data_batch_size{80000, "ESTUARY_DATA_BATCH_SIZE"};
        // Right side never overtakes a left event of equal sync-time at batch boundaries.
        ConfigValue<bool> deterministic_within_timestamp{false, "ESTUARY_DETERMINISTIC_WITHIN_TIMESTAMP"};
    } engine;

    // Batch pools
    struct Pool {
        // Upper bound on returned batches cached per pool; extra returns are destroyed.
        ConfigValue<size_t> max_cached_batches{64, "ESTUARY_POOL_MAX_CACHED_BATCHES"};
        ConfigValue<bool> force_row_oriented{false, "ESTUARY_POOL_FORCE_ROW_ORIENTED"};
    } pool;
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

    // Restore every value to its built-in default
    void resetToDefaults();

    // Get the configuration
    const EstuaryConfig& config() const { return config_; }
    EstuaryConfig& config() { return config_; }

    // Helper methods for common access patterns
    size_t getDataBatchSize() const { return config_.engine.data_batch_size.get(); }
    bool getDeterministicWithinTimestamp() const { return config_.engine.deterministic_within_timestamp.get(); }
    size_t getMaxCachedBatches() const { return config_.pool.max_cached_batches.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    EstuaryConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies the recognized keys under the root node
    void applyYAML(const YAML::Node& yaml);
};

} // namespace Estuary

#endif // ESTUARY_CONFIGURATION_H_
