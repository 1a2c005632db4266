//
// Created by Andrea on 27/08/2025.
//

#include "application/config/ConfigManager.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace core::config {
    namespace {
        std::string toSetting(const nlohmann::json &value) {
            if (value.is_string()) {
                return value.get<std::string>();
            }
            if (value.is_array()) {
                // Lists are kept in the same comma separated form the environment uses
                std::string joined;
                for (const auto &item: value) {
                    if (!joined.empty()) joined += ",";
                    joined += item.is_string() ? item.get<std::string>() : item.dump();
                }
                return joined;
            }
            return value.dump();
        }

        std::string joinList(const std::vector<std::string> &items) {
            std::string joined;
            for (const auto &item: items) {
                if (!joined.empty()) joined += ",";
                joined += item;
            }
            return joined;
        }
    }

    std::vector<std::string> splitList(const std::string &value) {
        std::vector<std::string> items;
        size_t start = 0;
        while (start <= value.size()) {
            size_t end = value.find(',', start);
            if (end == std::string::npos) end = value.size();

            std::string item = value.substr(start, end - start);
            auto first = item.find_first_not_of(" \t");
            auto last = item.find_last_not_of(" \t");
            if (first != std::string::npos) {
                items.push_back(item.substr(first, last - first + 1));
            }
            start = end + 1;
        }
        return items;
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        loadFileLocked(configPath);
    }

    void ConfigManager::loadFileLocked(const std::string &configPath) {
        configPath_ = configPath;

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            // Flatten JSON into key-value pairs
            size_t loaded = 0;
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else {
                        config_[key] = toSetting(it.value());
                        loaded++;
                    }
                }
            };

            flatten(json, "");
            lastModified_ = std::filesystem::last_write_time(configPath);

            Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        const char *envVars[] = {
            "FLEET_TRANSPORT_PORT", "FLEET_TRANSPORT_CONNECT_TIMEOUT_MS", "FLEET_TRANSPORT_SOCKET_TIMEOUT_MS",
            "FLEET_TRANSPORT_OPERATION_DEADLINE_MS", "FLEET_TRANSPORT_RETRY_ENABLED",
            "FLEET_TRANSPORT_RETRY_COUNT", "FLEET_TRANSPORT_RETRY_DELAY_MS", "FLEET_TRANSPORT_CLEAR_DATA_MODELS",
            "FLEET_SCHEDULER_POLL_INTERVAL_MS", "FLEET_SCHEDULER_POWER_ON_TIMEOUT_MS",
            "FLEET_DISPATCH_PROGRESS_INTERVAL_MS", "FLEET_STORAGE_BASE_DIR", "FLEET_STORAGE_REPOSITORY_FILE",
            "FLEET_LOG_DEBUG"
        };

        int loaded = 0;
        for (const char *envVar: envVars) {
            const char *value = std::getenv(envVar);
            if (value) {
                // FLEET_TRANSPORT_RETRY_COUNT -> transport.retry.count
                std::string key = std::string(envVar).substr(6);
                std::transform(key.begin(), key.end(), key.begin(), ::tolower);
                std::replace(key.begin(), key.end(), '_', '.');

                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    bool ConfigManager::reload() {
        std::unordered_map<std::string, std::string> oldConfig;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            if (configPath_.empty()) return false;
            oldConfig = config_;
            loadFileLocked(configPath_);
        }

        std::unordered_map<std::string, std::string> newConfig;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            newConfig = config_;
        }

        // Notify changes
        for (const auto &[key, newValue]: newConfig) {
            auto it = oldConfig.find(key);
            if (it == oldConfig.end() || it->second != newValue) {
                std::string oldValue = (it != oldConfig.end()) ? it->second : "";
                notifyChange(key, oldValue, newValue);
            }
        }
        return true;
    }

    void ConfigManager::reset() {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_.clear();
        changeCallbacks_.clear();
        setDefaults();
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    TransportConfig ConfigManager::getTransportConfig() const {
        TransportConfig config;
        config.port = get<int>("transport.port", config.port);
        config.username = get<std::string>("transport.username", config.username);
        config.connectTimeoutMs = get<int>("transport.connect.timeout.ms", config.connectTimeoutMs);
        config.socketTimeoutMs = get<int>("transport.socket.timeout.ms", config.socketTimeoutMs);
        config.operationDeadlineMs = get<int>("transport.operation.deadline.ms", config.operationDeadlineMs);
        config.retryEnabled = get<bool>("transport.retry.enabled", config.retryEnabled);
        config.retryCount = get<int>("transport.retry.count", config.retryCount);
        config.retryDelayMs = get<int>("transport.retry.delay.ms", config.retryDelayMs);
        config.chunkSize = static_cast<size_t>(get<int>("transport.chunk.size", static_cast<int>(config.chunkSize)));
        config.clearDataModels = splitList(
            get<std::string>("transport.clear.data.models", joinList(config.clearDataModels)));
        return config;
    }

    SchedulerConfig ConfigManager::getSchedulerConfig() const {
        SchedulerConfig config;
        config.pollIntervalMs = get<int>("scheduler.poll.interval.ms", config.pollIntervalMs);
        config.powerOnSettleMs = get<int>("scheduler.power.on.settle.ms", config.powerOnSettleMs);
        config.powerOnCheckIntervalMs = get<int>("scheduler.power.on.check.interval.ms",
                                                 config.powerOnCheckIntervalMs);
        config.powerOnTimeoutMs = get<int>("scheduler.power.on.timeout.ms", config.powerOnTimeoutMs);
        config.stabiliseDelayMs = get<int>("scheduler.stabilise.delay.ms", config.stabiliseDelayMs);
        config.cooldownTargetTemp = get<double>("scheduler.cooldown.target.temp", config.cooldownTargetTemp);
        config.cooldownTimeoutMs = get<int>("scheduler.cooldown.timeout.ms", config.cooldownTimeoutMs);
        return config;
    }

    DispatchConfig ConfigManager::getDispatchConfig() const {
        DispatchConfig config;
        config.progressIntervalMs = get<int>("dispatch.progress.interval.ms", config.progressIntervalMs);
        config.progressBytes = static_cast<size_t>(
            get<int>("dispatch.progress.bytes", static_cast<int>(config.progressBytes)));
        return config;
    }

    StorageConfig ConfigManager::getStorageConfig() const {
        StorageConfig config;
        config.baseDir = get<std::string>("storage.base.dir", config.baseDir);
        config.repositoryFile = get<std::string>("storage.repository.file", config.repositoryFile);
        config.deviceStaleMs = get<int>("storage.device.stale.ms", config.deviceStaleMs);
        return config;
    }

    void ConfigManager::registerChangeCallback(const std::string &key, ConfigChangeCallback callback) {
        std::lock_guard<std::mutex> lock(configMutex_);
        changeCallbacks_[key] = std::move(callback);
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        const int port = get<int>("transport.port", -1);
        if (port < 1 || port > 65535) {
            result.errors.push_back("transport.port must be between 1 and 65535");
        }

        if (get<int>("transport.retry.count", -1) < 0) {
            result.errors.push_back("transport.retry.count must be >= 0");
        }

        if (get<int>("transport.socket.timeout.ms", -1) < 100) {
            result.errors.push_back("transport.socket.timeout.ms must be >= 100");
        }

        if (get<int>("transport.chunk.size", -1) < 1024) {
            result.errors.push_back("transport.chunk.size must be >= 1024");
        }

        if (get<int>("scheduler.poll.interval.ms", -1) < 1000) {
            result.errors.push_back("scheduler.poll.interval.ms must be >= 1000");
        }

        if (get<int>("scheduler.power.on.timeout.ms", -1) < get<int>("scheduler.power.on.settle.ms", 0)) {
            result.errors.push_back("scheduler.power.on.timeout.ms must not be shorter than the settle period");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        const TransportConfig transport;
        config_["transport.port"] = std::to_string(transport.port);
        config_["transport.username"] = transport.username;
        config_["transport.connect.timeout.ms"] = std::to_string(transport.connectTimeoutMs);
        config_["transport.socket.timeout.ms"] = std::to_string(transport.socketTimeoutMs);
        config_["transport.operation.deadline.ms"] = std::to_string(transport.operationDeadlineMs);
        config_["transport.retry.enabled"] = "true";
        config_["transport.retry.count"] = std::to_string(transport.retryCount);
        config_["transport.retry.delay.ms"] = std::to_string(transport.retryDelayMs);
        config_["transport.chunk.size"] = std::to_string(transport.chunkSize);
        config_["transport.clear.data.models"] = joinList(transport.clearDataModels);

        const SchedulerConfig scheduler;
        config_["scheduler.poll.interval.ms"] = std::to_string(scheduler.pollIntervalMs);
        config_["scheduler.power.on.settle.ms"] = std::to_string(scheduler.powerOnSettleMs);
        config_["scheduler.power.on.check.interval.ms"] = std::to_string(scheduler.powerOnCheckIntervalMs);
        config_["scheduler.power.on.timeout.ms"] = std::to_string(scheduler.powerOnTimeoutMs);
        config_["scheduler.stabilise.delay.ms"] = std::to_string(scheduler.stabiliseDelayMs);
        config_["scheduler.cooldown.target.temp"] = "50";
        config_["scheduler.cooldown.timeout.ms"] = std::to_string(scheduler.cooldownTimeoutMs);

        const DispatchConfig dispatch;
        config_["dispatch.progress.interval.ms"] = std::to_string(dispatch.progressIntervalMs);
        config_["dispatch.progress.bytes"] = std::to_string(dispatch.progressBytes);

        const StorageConfig storage;
        config_["storage.base.dir"] = storage.baseDir;
        config_["storage.repository.file"] = storage.repositoryFile;
        config_["storage.device.stale.ms"] = std::to_string(storage.deviceStaleMs);

        config_["log.debug"] = "false";
    }

    void ConfigManager::notifyChange(const std::string &key, const std::string &oldValue, const std::string &newValue) {
        ConfigChangeCallback callback;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            auto it = changeCallbacks_.find(key);
            if (it == changeCallbacks_.end()) return;
            callback = it->second;
        }
        try {
            callback(key, oldValue, newValue);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Change callback failed for " + key + ": " + e.what());
        }
    }
} // namespace core::config
