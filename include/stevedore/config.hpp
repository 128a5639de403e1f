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
#include <vector>

#include "stevedore/logging.hpp"

namespace stevedore {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file.
    // Values from the file override the environment.
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            if (!std::filesystem::exists(config_file)) {
                LOG_ERROR("Config file does not exist: ", config_file);
                return false;
            }
            if (!load_from_file(config_file)) {
                return false;
            }
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    // Split a delimited value into trimmed, non-empty items.
    std::vector<std::string> get_list(const std::string& key, char separator = ',') const {
        std::vector<std::string> items;
        std::string value = get<std::string>(key);
        size_t start = 0;
        while (start <= value.size()) {
            size_t end = value.find(separator, start);
            if (end == std::string::npos) end = value.size();
            std::string item = trim(value.substr(start, end - start));
            if (!item.empty()) items.push_back(item);
            start = end + 1;
        }
        return items;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    // Drop every value. Tests use this to start from a clean slate.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return static_cast<std::int64_t>(std::stoll(it->second));
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                return static_cast<std::size_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
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
        // Database configuration
        set_if_env("db.host", "SD_DB_HOST", "localhost");
        set_if_env("db.port", "SD_DB_PORT", "5432");
        set_if_env("db.user", "SD_DB_USER", "postgres");
        set_if_env("db.password", "SD_DB_PASS", "");
        set_if_env("db.name", "SD_DB_NAME", "postgres");

        // Logging configuration
        set_if_env("log.level", "SD_LOG_LEVEL", "info");
        set_if_env("log.file", "SD_LOG_FILE", "");

        // Pool configuration
        set_if_env("pool.workers", "SD_WORKERS", "8");
        set_if_env("pool.timeout_ms", "SD_TIMEOUT_MS", "60000");
        set_if_env("pool.timeout_step_ms", "SD_TIMEOUT_STEP_MS", "60000");
        set_if_env("pool.retries", "SD_RETRIES", "3");
        set_if_env("pool.max_escalations", "SD_MAX_ESCALATIONS", "0");  // 0 = unbounded
        set_if_env("pool.progress_interval_ms", "SD_PROGRESS_INTERVAL_MS", "10000");
        set_if_env("copy.batch_size", "SD_BATCH_SIZE", "100000");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    static std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
        return s;
    }

    bool load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_ERROR("Could not open config file: ", filename);
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed config line: ", line);
                continue;
            }

            std::string key = trim(line.substr(0, equals_pos));
            std::string value = trim(line.substr(equals_pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
        return true;
    }

    bool validate() {
        bool valid = true;

        if (get_unlocked<std::string>("db.host", "").empty()) {
            LOG_ERROR("Database host not configured");
            valid = false;
        }

        int port = get_unlocked<int>("db.port", 0);
        if (port <= 0 || port > 65535) {
            LOG_ERROR("Invalid database port: ", port);
            valid = false;
        }

        if (get_unlocked<int>("pool.workers", 0) < 1) {
            LOG_ERROR("pool.workers must be at least 1");
            valid = false;
        }

        if (get_unlocked<std::int64_t>("pool.timeout_ms", 0) < 0 ||
            get_unlocked<std::int64_t>("pool.timeout_step_ms", 0) <= 0) {
            LOG_ERROR("pool.timeout_ms must be >= 0 and pool.timeout_step_ms > 0");
            valid = false;
        }

        if (get_unlocked<int>("pool.retries", 0) < 0 || get_unlocked<int>("pool.max_escalations", 0) < 0) {
            LOG_ERROR("pool.retries and pool.max_escalations must not be negative");
            valid = false;
        }

        if (get_unlocked<std::int64_t>("copy.batch_size", 0) < 1) {
            LOG_ERROR("copy.batch_size must be at least 1");
            valid = false;
        }

        std::string log_level = get_unlocked<std::string>("log.level", "info");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" && log_level != "error") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    // Set log level from environment (before loading config)
    if (const char* log_level_env = std::getenv("SD_LOG_LEVEL")) {
        set_log_level(parse_log_level(log_level_env));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded successfully");
    return true;
}

} // namespace stevedore
