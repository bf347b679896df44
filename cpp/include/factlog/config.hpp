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

namespace factlog {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            if (key == "db.password") {
                LOG_INFO("  ", key, " = ", value.empty() ? "" : "********");
            } else {
                LOG_INFO("  ", key, " = ", value);
            }
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
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

    void load_from_env() {
        set_if_env("db.host", "FACTLOG_DB_HOST", "localhost");
        set_if_env("db.port", "FACTLOG_DB_PORT", "5432");
        set_if_env("db.user", "FACTLOG_DB_USER", "postgres");
        set_if_env("db.password", "FACTLOG_DB_PASS", "");
        set_if_env("db.name", "FACTLOG_DB_NAME", "factlog");
        set_if_env("db.pool_size", "FACTLOG_DB_POOL_SIZE", "4");

        set_if_env("log.level", "FACTLOG_LOG_LEVEL", "info");
        set_if_env("log.file", "FACTLOG_LOG_FILE", "");

        set_if_env("reconstruct.retraction_policy", "FACTLOG_RETRACTION_POLICY", "freeze");

        set_if_env("perf.max_threads", "FACTLOG_MAX_THREADS", "0");  // 0 = hardware concurrency
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

        auto not_space = [](int ch) { return !std::isspace(ch); };

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);

                key.erase(key.begin(), std::find_if(key.begin(), key.end(), not_space));
                key.erase(std::find_if(key.rbegin(), key.rend(), not_space).base(), key.end());

                value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
                value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        if (get_unlocked<std::string>("db.host", "").empty()) {
            LOG_ERROR("Database host not configured");
            valid = false;
        }

        int port = get_unlocked<int>("db.port", 0);
        if (port <= 0 || port > 65535) {
            LOG_ERROR("Invalid database port: ", get_unlocked<std::string>("db.port", ""));
            valid = false;
        }

        if (get_unlocked<std::string>("db.user", "").empty()) {
            LOG_ERROR("Database user not configured");
            valid = false;
        }

        if (get_unlocked<int>("db.pool_size", 0) <= 0) {
            LOG_ERROR("Invalid connection pool size: ", get_unlocked<std::string>("db.pool_size", ""));
            valid = false;
        }

        std::string policy = get_unlocked<std::string>("reconstruct.retraction_policy", "");
        if (policy != "freeze" && policy != "remove") {
            LOG_ERROR("Unknown retraction policy '", policy, "' (expected freeze or remove)");
            valid = false;
        }

        LogLevel ignored;
        std::string log_level = get_unlocked<std::string>("log.level", "");
        if (!parse_log_level(log_level, ignored)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Load configuration and apply the logging settings it names
inline bool init_config(const std::string& config_file = "factlog.env") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(config.get<std::string>("log.level"), level)) {
        set_log_level(level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace factlog
