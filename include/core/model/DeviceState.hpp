//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace core::model {
    struct AmsTray {
        int trayId = 0;
        std::string type;
        std::string color; // RRGGBBAA as reported by the device
        std::string trayInfoIdx;
    };

    struct AmsUnit {
        int id = 0;
        std::vector<AmsTray> trays;
    };

    /**
     * @brief Snapshot of a device as reported by its telemetry
     *
     * state uses the firmware's vocabulary: IDLE, RUNNING, PAUSE, PAUSED, FINISH, FAILED...
     */
    struct DeviceState {
        std::string state;
        std::string gcodeFile;
        double nozzleTemp = 0.0;
        double bedTemp = 0.0;
        std::vector<AmsUnit> amsUnits;
        std::optional<AmsTray> externalSpool;

        bool isBusyPrinting() const {
            return (state == "RUNNING" || state == "PAUSE" || state == "PAUSED") && !gcodeFile.empty();
        }
    };
}
