//
// Created by redeg on 03/05/2025.
//

#include "core/utils/Time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace core::utils {
    std::string toIso8601(Timestamp time) {
        const std::time_t raw = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&raw, &utc);

        std::ostringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::optional<Timestamp> fromIso8601(const std::string &text) {
        std::tm utc{};
        std::istringstream ss(text);
        ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(timegm(&utc));
    }
}
