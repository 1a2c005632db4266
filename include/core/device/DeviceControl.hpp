//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/model/DeviceState.hpp"
#include "core/model/PrintOptions.hpp"
#include "core/model/Records.hpp"

namespace core::device {
    /**
     * @brief Live device-state tracker and command channel for the fleet
     *
     * Implementations are shared by the scheduler, the dispatch queue and their
     * worker threads, so every method must be thread safe.
     */
    class DeviceControl {
    public:
        virtual ~DeviceControl() = default;

        virtual bool isConnected(int printerId) const = 0;

        virtual std::optional<model::DeviceState> getStatus(int printerId) const = 0;

        /**
         * @brief (Re)establishes the telemetry session for a printer
         */
        virtual bool connect(const model::PrinterRecord &printer) = 0;

        virtual bool startPrint(int printerId, const std::string &remoteFilename, int plateId,
                                const std::optional<std::vector<int> > &amsMapping,
                                const model::PrintOptions &options) = 0;

        virtual bool stopPrint(int printerId) = 0;

        /**
         * @brief Blocks until the nozzle is at or below targetTemp
         * @return false when the timeout expired first
         */
        virtual bool waitForCooldown(int printerId, double targetTemp, std::chrono::milliseconds timeout) = 0;

        virtual void markOffline(int printerId) = 0;

        // Set by the user (or the device) once the build plate has been emptied
        virtual bool isPlateCleared(int printerId) const = 0;

        virtual void consumePlateCleared(int printerId) = 0;

        virtual void setCurrentPrintUser(int printerId, int userId, const std::string &userName) = 0;
    };
}
