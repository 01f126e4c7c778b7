#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include "logging.hpp"

namespace graphembed {

/**
 * Process-wide key/value configuration.
 *
 * Values come from GRAPHEMBED_* environment variables first, then from an
 * optional `key = value` file (file entries win). Keys:
 *
 *   embedding.maximum_dimensions     GRAPHEMBED_MAX_DIMENSIONS
 *   embedding.elbow_cut              GRAPHEMBED_ELBOW_CUT ("none" disables)
 *   embedding.weight_attribute       GRAPHEMBED_WEIGHT_ATTRIBUTE
 *   embedding.svd_seed               GRAPHEMBED_SVD_SEED
 *   svd.num_iterations               GRAPHEMBED_SVD_ITERATIONS
 *   svd.power_iteration_normalizer   GRAPHEMBED_SVD_NORMALIZER
 *   svd.num_oversamples              GRAPHEMBED_SVD_OVERSAMPLES
 *   omnibus.embedding_method         GRAPHEMBED_EMBEDDING_METHOD
 *   log.level                        GRAPHEMBED_LOG_LEVEL
 *   log.file                         GRAPHEMBED_LOG_FILE
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            if (std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            } else {
                LOG_WARN("Config file not found: ", config_file);
            }
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return static_cast<std::uint64_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.erase(key);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        set_from_env("embedding.maximum_dimensions", "GRAPHEMBED_MAX_DIMENSIONS");
        set_from_env("embedding.elbow_cut", "GRAPHEMBED_ELBOW_CUT");
        set_from_env("embedding.weight_attribute", "GRAPHEMBED_WEIGHT_ATTRIBUTE");
        set_from_env("embedding.svd_seed", "GRAPHEMBED_SVD_SEED");

        set_from_env("svd.num_iterations", "GRAPHEMBED_SVD_ITERATIONS");
        set_from_env("svd.power_iteration_normalizer", "GRAPHEMBED_SVD_NORMALIZER");
        set_from_env("svd.num_oversamples", "GRAPHEMBED_SVD_OVERSAMPLES");

        set_from_env("omnibus.embedding_method", "GRAPHEMBED_EMBEDDING_METHOD");

        set_from_env("log.level", "GRAPHEMBED_LOG_LEVEL");
        set_from_env("log.file", "GRAPHEMBED_LOG_FILE");
    }

    void set_from_env(const std::string& key, const char* env_var) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, equals_pos));
            std::string value = trim(line.substr(equals_pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    static std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        return s;
    }

    // Called with mutex_ held
    bool validate() {
        auto it = values_.find("log.level");
        if (it != values_.end() && !parse_log_level(it->second)) {
            LOG_WARN("Unknown log level '", it->second, "', defaulting to 'info'");
            it->second = "info";
        }
        return true;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Loads the configuration and applies its logging settings
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (auto level = parse_log_level(config.get<std::string>("log.level", "info"))) {
        set_log_level(*level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        // The logger keeps pointing at the current file until the new one opens
        static std::ofstream log_stream;
        std::ofstream opened(log_file, std::ios::app);
        if (opened.is_open()) {
            log_stream = std::move(opened);
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace graphembed
