//
// Created by redeg on 03/05/2025.
//

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace core::utils {
    using Timestamp = std::chrono::system_clock::time_point;

    inline long long currentTimeMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief UTC timestamp as "YYYY-MM-DDTHH:MM:SSZ"
     */
    std::string toIso8601(Timestamp time);

    /**
     * @brief Parses the format produced by toIso8601, nullopt on anything else
     */
    std::optional<Timestamp> fromIso8601(const std::string &text);
}
