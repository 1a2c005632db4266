//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <optional>
#include <string>

namespace core::model {
    struct PrinterRecord {
        int id = 0;
        std::string name;
        std::string model;
        std::string address;
        std::string accessCode;
        std::string serial;
        std::optional<std::string> location;
        bool active = true;
    };

    struct ArchiveRecord {
        int id = 0;
        std::optional<int> printerId;
        std::string filename;
        std::string filePath; // relative to the storage base directory
        std::optional<int> printTimeSeconds;
        std::string status = "archived";
    };

    struct LibraryFileRecord {
        int id = 0;
        std::string filename;
        std::string filePath;
        std::optional<int> printTimeSeconds;
    };

    struct SmartPlugRecord {
        int id = 0;
        std::string name;
        std::optional<int> printerId;
        std::string address;
        std::optional<std::string> username;
        std::optional<std::string> password;
        bool enabled = true;
        bool autoOn = true;
        bool autoOff = true;
    };
}
