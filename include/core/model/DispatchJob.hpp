//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/model/PrintOptions.hpp"

namespace core::model {
    enum class DispatchKind {
        ReprintArchive,
        PrintLibraryFile,
    };

    inline std::string dispatchKindToString(DispatchKind kind) {
        switch (kind) {
            case DispatchKind::ReprintArchive: return "reprint_archive";
            case DispatchKind::PrintLibraryFile: return "print_library_file";
            default: return "unknown";
        }
    }

    struct DispatchOptions {
        PrintOptions print{true, false, false, false, false, true};
        std::optional<int> plateId;
        std::optional<std::vector<int> > amsMapping;
    };

    /**
     * @brief In-memory one-off upload-and-print request, never persisted
     */
    struct DispatchJob {
        int id = 0;
        DispatchKind kind = DispatchKind::ReprintArchive;
        int sourceId = 0;
        std::string sourceName;
        int printerId = 0;
        std::string printerName;
        DispatchOptions options;
        std::optional<int> requesterId;
        std::optional<std::string> requesterName;
    };
}
