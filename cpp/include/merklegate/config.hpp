#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "logging.hpp"

namespace merklegate {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            load_from_env();
        }

        if (!config_file.empty()) {
            if (!std::filesystem::exists(config_file)) {
                LOG_WARN("Config file not found: ", config_file);
            } else {
                std::lock_guard<std::mutex> lock(mutex_);
                load_from_file(config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, size_t>) {
                return static_cast<size_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    // Print current configuration (for debugging)
    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_DEBUG("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_DEBUG("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        // Logging configuration
        set_if_env("log.level", "MG_LOG_LEVEL", "info");
        set_if_env("log.file", "MG_LOG_FILE", "");

        // Build configuration
        set_if_env("build.input", "MG_INPUT", "voters.csv");
        set_if_env("build.output", "MG_OUTPUT", "out/merkle.json");
        set_if_env("build.format", "MG_FORMAT", "merkle");
        set_if_env("build.adapter", "MG_ADAPTER", "csv");
        set_if_env("build.sort_leaves", "MG_SORT_LEAVES", "false");

        // Performance configuration
        set_if_env("perf.max_threads", "MG_MAX_THREADS", "0");  // 0 = auto-detect
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
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
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            // Parse key=value
            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);

                // Trim whitespace
                key.erase(key.begin(), std::find_if(key.begin(), key.end(), [](int ch) { return !std::isspace(ch); }));
                key.erase(std::find_if(key.rbegin(), key.rend(), [](int ch) { return !std::isspace(ch); }).base(), key.end());

                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](int ch) { return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](int ch) { return !std::isspace(ch); }).base(), value.end());

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_DEBUG("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        LogLevel level;
        if (!parse_log_level(get<std::string>("log.level"), level)) {
            LOG_WARN("Unknown log level '", get<std::string>("log.level"), "', defaulting to 'info'");
            set("log.level", "info");
        }

        std::string format = get<std::string>("build.format");
        if (format != "merkle" && format != "voters") {
            LOG_WARN("Unknown artifact format '", format, "', defaulting to 'merkle'");
            set("build.format", "merkle");
        }

        std::string adapter = get<std::string>("build.adapter");
        if (adapter != "csv" && adapter != "voters") {
            LOG_WARN("Unknown record adapter '", adapter, "', defaulting to 'csv'");
            set("build.adapter", "csv");
        }

        if (get<std::string>("build.output").empty()) {
            LOG_ERROR("Output path not configured");
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration and apply the logging section
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level;
    if (parse_log_level(config.get<std::string>("log.level"), level)) {
        set_log_level(level);
    }

    // Set log output file if specified
    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    config.print();
    return true;
}

} // namespace merklegate
