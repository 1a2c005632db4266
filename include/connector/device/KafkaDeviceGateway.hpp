//
// Created by Andrea on 19/10/2025.
//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "connector/events/BaseSender.hpp"
#include "connector/models/device/DeviceStatusMessage.hpp"
#include "core/device/DeviceControl.hpp"
#include "core/jobs/ExpectedPrintRegistry.hpp"

namespace connector::device {
    /**
     * @brief DeviceControl backed by the device bridge
     *
     * Status snapshots arrive through handleStatusMessage() (fed by the printer-status consumer);
     * commands leave through the printer-control sender. A printer counts as connected while its
     * last status is younger than the configured staleness window.
     */
    class KafkaDeviceGateway : public core::device::DeviceControl {
    public:
        KafkaDeviceGateway(events::BaseSender &commands, core::jobs::ExpectedPrintRegistry &expectedPrints,
                           std::string serviceId, std::chrono::milliseconds staleAfter);

        ~KafkaDeviceGateway() override;

        bool isConnected(int printerId) const override;

        std::optional<core::model::DeviceState> getStatus(int printerId) const override;

        bool connect(const core::model::PrinterRecord &printer) override;

        bool startPrint(int printerId, const std::string &remoteFilename, int plateId,
                        const std::optional<std::vector<int> > &amsMapping,
                        const core::model::PrintOptions &options) override;

        bool stopPrint(int printerId) override;

        bool waitForCooldown(int printerId, double targetTemp, std::chrono::milliseconds timeout) override;

        void markOffline(int printerId) override;

        bool isPlateCleared(int printerId) const override;

        void consumePlateCleared(int printerId) override;

        void setCurrentPrintUser(int printerId, int userId, const std::string &userName) override;

        /**
         * @brief Applies one raw printer-status payload; malformed payloads are logged and dropped
         */
        void handleStatusMessage(const std::string &payload);

        void applyStatus(const models::device::DeviceStatusMessage &message);

        std::optional<std::pair<int, std::string> > getCurrentPrintUser(int printerId) const;

        /**
         * @brief Wakes every pending cooldown wait; they report false
         */
        void shutdown();

    private:
        struct TrackedDevice {
            std::optional<core::model::DeviceState> status;
            std::optional<std::chrono::steady_clock::time_point> lastSeen;
            bool offline = false;
            bool plateCleared = false;
            std::optional<std::pair<int, std::string> > currentUser;
        };

        events::BaseSender &commands_;
        core::jobs::ExpectedPrintRegistry &expectedPrints_;
        std::string serviceId_;
        std::chrono::milliseconds staleAfter_;

        mutable std::mutex mutex_;
        std::condition_variable statusChanged_;
        std::unordered_map<int, TrackedDevice> devices_;
        std::atomic<bool> stopping_{false};

        bool sendCommand(int printerId, const std::string &action, const nlohmann::json &parameters);

        bool isFreshLocked(const TrackedDevice &device) const;
    };
}
