//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::config {
    struct TransportConfig {
        int port = 990;
        std::string username = "bblp";
        int connectTimeoutMs = 30000;
        int socketTimeoutMs = 60000; // per blocking socket operation
        int operationDeadlineMs = 1800000; // whole connect -> op -> quit cycle
        bool retryEnabled = true;
        int retryCount = 3;
        int retryDelayMs = 2000;
        size_t chunkSize = 1024 * 1024;
        // Models whose firmware cannot run TLS on the data channel and never acks a finished upload
        std::vector<std::string> clearDataModels{"A1", "A1 Mini", "P1S", "P1P", "P2S"};
    };

    struct SchedulerConfig {
        int pollIntervalMs = 30000;
        int powerOnSettleMs = 30000;
        int powerOnCheckIntervalMs = 10000;
        int powerOnTimeoutMs = 180000;
        int stabiliseDelayMs = 5000;
        double cooldownTargetTemp = 50.0;
        int cooldownTimeoutMs = 600000;
    };

    struct DispatchConfig {
        int progressIntervalMs = 200;
        size_t progressBytes = 256 * 1024;
    };

    struct StorageConfig {
        std::string baseDir = ".";
        std::string repositoryFile = "data/fleet.json";
        int deviceStaleMs = 30000; // status older than this counts as disconnected
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        bool reload();

        // Restores defaults and forgets the file, used by tests
        void reset();

        void set(const std::string &key, const std::string &value);

        // Configuration access
        TransportConfig getTransportConfig() const;

        SchedulerConfig getSchedulerConfig() const;

        DispatchConfig getDispatchConfig() const;

        StorageConfig getStorageConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Change notifications
        using ConfigChangeCallback = std::function<void(const std::string &key, const std::string &oldValue,
                                                        const std::string &newValue)>;

        void registerChangeCallback(const std::string &key, ConfigChangeCallback callback);

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::unordered_map<std::string, ConfigChangeCallback> changeCallbacks_;

        std::string configPath_;
        std::filesystem::file_time_type lastModified_;

        void notifyChange(const std::string &key, const std::string &oldValue, const std::string &newValue);

        void setDefaults();

        void loadFileLocked(const std::string &configPath);
    };

    /**
     * @brief Splits a comma separated setting, trimming blanks around each item
     */
    std::vector<std::string> splitList(const std::string &value);

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }
} // namespace core::config
