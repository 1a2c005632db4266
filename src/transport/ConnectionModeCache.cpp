//
// Created by Andrea on 16/10/2025.
//

#include "transport/ConnectionModeCache.hpp"
#include "logger/Logger.hpp"

namespace transport {
    std::optional<ConnectionMode> ConnectionModeCache::get(const std::string &address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = modes_.find(address);
        return (it != modes_.end()) ? std::optional<ConnectionMode>(it->second) : std::nullopt;
    }

    void ConnectionModeCache::set(const std::string &address, ConnectionMode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = modes_.find(address);
        if (it != modes_.end() && it->second == mode) return;

        modes_[address] = mode;
        Logger::logInfo("[ConnectionModeCache] " + address + " uses " + connectionModeToString(mode) +
                        " data channel");
    }

    void ConnectionModeCache::forget(const std::string &address) {
        std::lock_guard<std::mutex> lock(mutex_);
        modes_.erase(address);
    }

    size_t ConnectionModeCache::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return modes_.size();
    }
}
