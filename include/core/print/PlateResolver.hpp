//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include <optional>
#include <string>

namespace core::print {
    constexpr int DEFAULT_PLATE_ID = 1;

    /**
     * @brief Plate to print from a sliced 3MF package
     *
     * The requested plate wins. Otherwise the first "Metadata/plate_<N>.gcode" entry of the
     * package gives N. Unreadable packages and plain gcode files fall back to plate 1.
     */
    int resolvePlateId(const std::string &packagePath, std::optional<int> requestedPlateId);

    /**
     * @return N for "Metadata/plate_<N>.gcode", nullopt for any other entry name
     */
    std::optional<int> plateIdFromEntryName(const std::string &entryName);
}
