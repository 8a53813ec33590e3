#include "configuration.h"
#include "env_flags.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Estuary {

// Template specializations for environment variable parsing
template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        if (IsEnvTrueValue(env_val)) {
            return true;
        } else if (IsEnvFalseValue(env_val)) {
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
    if (!yaml["estuary"]) {
        LOG(WARNING) << "Configuration has no top-level 'estuary' key; keeping current values";
        return;
    }
    auto root = yaml["estuary"];

    // Engine
    if (root["engine"]) {
        auto engine = root["engine"];
        if (engine["data_batch_size"]) config_.engine.data_batch_size.set(engine["data_batch_size"].as<size_t>());
        if (engine["deterministic_within_timestamp"]) config_.engine.deterministic_within_timestamp.set(engine["deterministic_within_timestamp"].as<bool>());
    }

    // Pool
    if (root["pool"]) {
        auto pool = root["pool"];
        if (pool["max_cached_batches"]) config_.pool.max_cached_batches.set(pool["max_cached_batches"].as<size_t>());
        if (pool["force_row_oriented"]) config_.pool.force_row_oriented.set(pool["force_row_oriented"].as<bool>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::resetToDefaults() {
    config_.engine.data_batch_size.reset();
    config_.engine.deterministic_within_timestamp.reset();
    config_.pool.max_cached_batches.reset();
    config_.pool.force_row_oriented.reset();
    validation_errors_.clear();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.engine.data_batch_size.get() < 1) {
        validation_errors_.push_back("Data batch size must be at least 1");
    }

    if (config_.pool.max_cached_batches.get() < 1) {
        validation_errors_.push_back("Pool must cache at least 1 batch");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Estuary
