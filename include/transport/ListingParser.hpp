//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "transport/FileEntry.hpp"

namespace transport {
    /**
     * @brief Parses one line of a unix-style LIST reply
     *
     * Lines with fewer than nine fields yield nullopt. The name is everything from the
     * ninth field on, so names containing spaces survive.
     *
     * @param basePath directory that was listed, used to build FileEntry::path
     * @param now reference time for year-less dates ("Mon DD HH:MM")
     */
    std::optional<FileEntry> parseListingLine(const std::string &line, const std::string &basePath,
                                              core::utils::Timestamp now);

    std::vector<FileEntry> parseListing(const std::string &listing, const std::string &basePath,
                                        core::utils::Timestamp now);

    /**
     * @brief Size column of a LIST line for non-directories, used by the storage estimate
     */
    std::optional<uint64_t> listingLineFileSize(const std::string &line);
}
