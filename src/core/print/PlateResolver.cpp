//
// Created by Andrea on 18/10/2025.
//

#include "core/print/PlateResolver.hpp"
#include "logger/Logger.hpp"

#include <miniz.h>

#include <cctype>
#include <cstring>

namespace core::print {
    namespace {
        const std::string PLATE_PREFIX = "Metadata/plate_";
        const std::string PLATE_SUFFIX = ".gcode";
    }

    std::optional<int> plateIdFromEntryName(const std::string &entryName) {
        if (entryName.size() <= PLATE_PREFIX.size() + PLATE_SUFFIX.size() ||
            entryName.compare(0, PLATE_PREFIX.size(), PLATE_PREFIX) != 0 ||
            entryName.compare(entryName.size() - PLATE_SUFFIX.size(), PLATE_SUFFIX.size(), PLATE_SUFFIX) != 0) {
            return std::nullopt;
        }

        const std::string digits = entryName.substr(PLATE_PREFIX.size(),
                                                    entryName.size() - PLATE_PREFIX.size() - PLATE_SUFFIX.size());
        for (char c: digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        try {
            return std::stoi(digits);
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

    int resolvePlateId(const std::string &packagePath, std::optional<int> requestedPlateId) {
        if (requestedPlateId) {
            return *requestedPlateId;
        }

        mz_zip_archive archive;
        std::memset(&archive, 0, sizeof(archive));
        if (!mz_zip_reader_init_file(&archive, packagePath.c_str(), 0)) {
            Logger::logDebug("[PlateResolver] " + packagePath + " is not a zip package (" +
                             std::string(mz_zip_get_error_string(mz_zip_get_last_error(&archive))) +
                             "), using plate " + std::to_string(DEFAULT_PLATE_ID));
            return DEFAULT_PLATE_ID;
        }

        int plateId = DEFAULT_PLATE_ID;
        const mz_uint entries = mz_zip_reader_get_num_files(&archive);
        mz_zip_archive_file_stat stat;
        for (mz_uint i = 0; i < entries; ++i) {
            if (!mz_zip_reader_file_stat(&archive, i, &stat)) continue;
            if (auto found = plateIdFromEntryName(stat.m_filename)) {
                plateId = *found;
                break;
            }
        }
        mz_zip_reader_end(&archive);

        Logger::logDebug("[PlateResolver] " + packagePath + " -> plate " + std::to_string(plateId));
        return plateId;
    }
}
