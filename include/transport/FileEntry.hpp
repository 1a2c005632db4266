//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/utils/Time.hpp"

namespace transport {
    struct FileEntry {
        std::string name;
        std::string path;
        bool isDirectory = false;
        uint64_t size = 0;
        std::optional<core::utils::Timestamp> modified;
    };

    /**
     * @brief Device storage figures; either value may be unknown
     */
    struct StorageInfo {
        std::optional<uint64_t> freeBytes;
        std::optional<uint64_t> usedBytes;

        bool empty() const { return !freeBytes && !usedBytes; }
    };
}
