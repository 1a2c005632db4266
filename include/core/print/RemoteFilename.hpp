//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include <string>

namespace core::print {
    /**
     * @brief Name the sliced file gets on the printer: known slicer suffixes replaced by ".3mf"
     *
     * "cube.gcode.3mf" -> "cube.3mf", "cube.3mf" -> "cube.3mf", "cube.gcode" -> "cube.3mf"
     */
    std::string remoteFilenameFor(const std::string &filename);

    // Uploads always land in the storage root
    std::string remotePathFor(const std::string &remoteFilename);

    // Name shown in notifications: "cube.gcode.3mf" -> "cube"
    std::string displayNameFor(const std::string &filename);

    // Only sliced output (.gcode / .gcode.3mf, any case) can be sent to a printer
    bool isSlicedFile(const std::string &filename);
}
