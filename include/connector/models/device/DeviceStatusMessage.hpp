#pragma once

#include "../BaseModel.hpp"
#include "core/model/DeviceState.hpp"
#include "core/model/Serialization.hpp"
#include <optional>
#include <string>

namespace connector::models::device {
    /**
     * @brief Telemetry snapshot published by the device bridge on printer-status
     *
     * status carries the firmware-style field names (state, gcode_file, nozzle_temper, ams...).
     */
    class DeviceStatusMessage : public BaseModel {
    public:
        int printerId = 0;
        std::string serialNumber;
        core::model::DeviceState status;
        // Present only when the bridge knows whether the plate was emptied
        std::optional<bool> plateCleared;
        bool online = true;

        DeviceStatusMessage() = default;

        explicit DeviceStatusMessage(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            nlohmann::json json{
                {"printerId", printerId},
                {"serialNumber", serialNumber},
                {"online", online},
                {"status", status}
            };
            if (plateCleared) {
                json["plateCleared"] = *plateCleared;
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            printerId = json.at("printerId").get<int>();
            serialNumber = json.value("serialNumber", "");
            online = json.value("online", true);

            if (json.contains("status") && json["status"].is_object()) {
                status = json["status"].get<core::model::DeviceState>();
            }
            if (json.contains("plateCleared") && json["plateCleared"].is_boolean()) {
                plateCleared = json["plateCleared"].get<bool>();
            } else {
                plateCleared.reset();
            }
        }

        bool isValid() const override {
            return printerId > 0;
        }

        std::string getTypeName() const override {
            return "DeviceStatusMessage";
        }
    };
}
