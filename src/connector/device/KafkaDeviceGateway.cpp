//
// Created by Andrea on 19/10/2025.
//

#include "connector/device/KafkaDeviceGateway.hpp"

#include "connector/models/device/DeviceCommand.hpp"
#include "core/model/Serialization.hpp"
#include "logger/Logger.hpp"

namespace connector::device {
    using core::model::DeviceState;
    using models::device::DeviceCommand;
    using models::device::DeviceStatusMessage;

    namespace {
        bool isRunning(const std::optional<DeviceState> &status) {
            return status && status->state == "RUNNING" && !status->gcodeFile.empty();
        }

        bool isFinished(const std::string &state) {
            return state == "FINISH" || state == "FAILED";
        }
    }

    KafkaDeviceGateway::KafkaDeviceGateway(events::BaseSender &commands,
                                           core::jobs::ExpectedPrintRegistry &expectedPrints,
                                           std::string serviceId, std::chrono::milliseconds staleAfter)
        : commands_(commands), expectedPrints_(expectedPrints), serviceId_(std::move(serviceId)),
          staleAfter_(staleAfter) {
    }

    KafkaDeviceGateway::~KafkaDeviceGateway() {
        shutdown();
    }

    bool KafkaDeviceGateway::isFreshLocked(const TrackedDevice &device) const {
        if (device.offline || !device.lastSeen) return false;
        return std::chrono::steady_clock::now() - *device.lastSeen <= staleAfter_;
    }

    bool KafkaDeviceGateway::isConnected(int printerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(printerId);
        return it != devices_.end() && isFreshLocked(it->second);
    }

    std::optional<DeviceState> KafkaDeviceGateway::getStatus(int printerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(printerId);
        if (it == devices_.end()) return std::nullopt;
        return it->second.status;
    }

    bool KafkaDeviceGateway::connect(const core::model::PrinterRecord &printer) {
        const nlohmann::json parameters{
            {"name", printer.name},
            {"model", printer.model},
            {"ipAddress", printer.address},
            {"accessCode", printer.accessCode},
            {"serialNumber", printer.serial}
        };

        if (!sendCommand(printer.id, "connect", parameters)) return false;

        // The bridge answers with status reports; until one arrives the printer stays disconnected
        return isConnected(printer.id);
    }

    bool KafkaDeviceGateway::startPrint(int printerId, const std::string &remoteFilename, int plateId,
                                        const std::optional<std::vector<int> > &amsMapping,
                                        const core::model::PrintOptions &options) {
        nlohmann::json parameters{
            {"filename", remoteFilename},
            {"plateId", plateId},
            {"options", options}
        };
        parameters["amsMapping"] = amsMapping ? nlohmann::json(*amsMapping) : nlohmann::json(nullptr);

        {
            // The requester of the previous print does not own this one
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = devices_.find(printerId);
            if (it != devices_.end()) it->second.currentUser.reset();
        }

        return sendCommand(printerId, "start_print", parameters);
    }

    bool KafkaDeviceGateway::stopPrint(int printerId) {
        return sendCommand(printerId, "stop_print", nlohmann::json::object());
    }

    bool KafkaDeviceGateway::waitForCooldown(int printerId, double targetTemp, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool cooled = statusChanged_.wait_for(lock, timeout, [&]() {
            if (stopping_) return true;
            auto it = devices_.find(printerId);
            return it != devices_.end() && it->second.status && it->second.status->nozzleTemp <= targetTemp;
        });
        return cooled && !stopping_;
    }

    void KafkaDeviceGateway::markOffline(int printerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[printerId].offline = true;
        Logger::logInfo("[KafkaDeviceGateway] Printer " + std::to_string(printerId) + " marked offline");
    }

    bool KafkaDeviceGateway::isPlateCleared(int printerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(printerId);
        return it != devices_.end() && it->second.plateCleared;
    }

    void KafkaDeviceGateway::consumePlateCleared(int printerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(printerId);
        if (it != devices_.end()) {
            it->second.plateCleared = false;
        }
    }

    void KafkaDeviceGateway::setCurrentPrintUser(int printerId, int userId, const std::string &userName) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[printerId].currentUser = std::make_pair(userId, userName);
    }

    std::optional<std::pair<int, std::string> > KafkaDeviceGateway::getCurrentPrintUser(int printerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(printerId);
        if (it == devices_.end()) return std::nullopt;
        return it->second.currentUser;
    }

    void KafkaDeviceGateway::handleStatusMessage(const std::string &payload) {
        DeviceStatusMessage message;
        try {
            message.fromJson(nlohmann::json::parse(payload));
        } catch (const nlohmann::json::exception &e) {
            Logger::logWarning("[KafkaDeviceGateway] Dropping malformed status message: " + std::string(e.what()));
            return;
        }

        if (!message.isValid()) {
            Logger::logWarning("[KafkaDeviceGateway] Dropping status message without printer id");
            return;
        }

        applyStatus(message);
    }

    void KafkaDeviceGateway::applyStatus(const DeviceStatusMessage &message) {
        std::optional<std::string> startedFile;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            TrackedDevice &device = devices_[message.printerId];

            if (!message.online) {
                device.offline = true;
            } else {
                const auto previous = device.status;
                device.status = message.status;
                device.lastSeen = std::chrono::steady_clock::now();
                device.offline = false;

                if (message.plateCleared) {
                    device.plateCleared = *message.plateCleared;
                } else if (isFinished(message.status.state) && !(previous && isFinished(previous->state))) {
                    // A print just ended, the plate holds its part
                    device.plateCleared = false;
                }

                if (isRunning(device.status) &&
                    (!isRunning(previous) || previous->gcodeFile != device.status->gcodeFile)) {
                    startedFile = device.status->gcodeFile;
                }
            }
        }
        statusChanged_.notify_all();

        if (startedFile) {
            if (auto expected = expectedPrints_.consume(message.printerId, *startedFile)) {
                Logger::logInfo("[KafkaDeviceGateway] Printer " + std::to_string(message.printerId) +
                                " started " + *startedFile + " from archive " + std::to_string(expected->archiveId));
            } else {
                Logger::logInfo("[KafkaDeviceGateway] Printer " + std::to_string(message.printerId) +
                                " started " + *startedFile);
            }
        }
    }

    void KafkaDeviceGateway::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        statusChanged_.notify_all();
    }

    bool KafkaDeviceGateway::sendCommand(int printerId, const std::string &action, const nlohmann::json &parameters) {
        const DeviceCommand command(serviceId_, printerId, action, parameters);
        if (!commands_.sendMessage(command.toJson().dump(), std::to_string(printerId))) {
            Logger::logWarning("[KafkaDeviceGateway] Could not send " + action + " to printer " +
                               std::to_string(printerId));
            return false;
        }
        return true;
    }
}
