//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include <string>

namespace core::model {
    // Global slot id reserved for the spool hanging outside the AMS
    constexpr int EXTERNAL_SPOOL_SLOT = 254;
    constexpr int UNMAPPED_SLOT = -1;

    struct FilamentRequirement {
        int slotId = 0; // 1-based position in the sliced file
        std::string type;
        std::string color;
        std::string trayInfoIdx;
    };

    struct LoadedFilament {
        std::string type;
        std::string color; // normalised rrggbb
        std::string trayInfoIdx;
        int amsId = 0;
        int trayId = 0;
        int globalSlotId = 0;
        bool isExternalSpool = false;
        bool isSingleSlotUnit = false;
    };
}
