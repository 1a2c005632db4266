//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace transport {
    enum class ConnectionMode {
        Protected, // data channel wrapped in TLS, reusing the control session
        Clear, // data channel left unencrypted, control stays on TLS
    };

    inline std::string connectionModeToString(ConnectionMode mode) {
        return mode == ConnectionMode::Protected ? "protected" : "clear";
    }

    /**
     * @brief Remembers, per device address, the data-channel mode that last worked
     *
     * Lives for the whole process and is shared by every transfer.
     */
    class ConnectionModeCache {
    public:
        std::optional<ConnectionMode> get(const std::string &address) const;

        void set(const std::string &address, ConnectionMode mode);

        void forget(const std::string &address);

        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, ConnectionMode> modes_;
    };
}
