#pragma once

#include "../BaseModel.hpp"
#include <string>

namespace connector::models::device {
    /**
     * @brief Command forwarded to the device bridge on printer-control
     *
     * action is one of "connect", "start_print", "stop_print".
     */
    class DeviceCommand : public BaseModel {
    public:
        std::string serviceId;
        int printerId = 0;
        std::string action;
        nlohmann::json parameters = nlohmann::json::object();

        DeviceCommand() = default;

        DeviceCommand(std::string serviceId, int printerId, std::string action,
                      nlohmann::json parameters = nlohmann::json::object())
            : serviceId(std::move(serviceId)), printerId(printerId), action(std::move(action)),
              parameters(std::move(parameters)) {
        }

        explicit DeviceCommand(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            return nlohmann::json{
                {"serviceId", serviceId},
                {"printerId", printerId},
                {"action", action},
                {"parameters", parameters}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            serviceId = json.value("serviceId", "");
            printerId = json.at("printerId").get<int>();
            action = json.at("action").get<std::string>();
            parameters = json.contains("parameters") && json["parameters"].is_object()
                             ? json["parameters"]
                             : nlohmann::json::object();
        }

        bool isValid() const override {
            return printerId > 0 && (action == "connect" || action == "start_print" || action == "stop_print");
        }

        std::string getTypeName() const override {
            return "DeviceCommand";
        }
    };
}
