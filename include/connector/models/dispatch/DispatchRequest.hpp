#pragma once

#include "../BaseModel.hpp"
#include "core/model/DispatchJob.hpp"
#include "core/model/Serialization.hpp"
#include <optional>
#include <string>

namespace connector::models::dispatch {
    /**
     * @brief One-off dispatch request received on print-dispatch-requests
     *
     * action: "reprint_archive" / "print_library_file" (sourceId, printerId required),
     * "cancel" (jobId required) or "state".
     */
    class DispatchRequest : public BaseModel {
    public:
        std::string requestId;
        std::string action;
        int sourceId = 0;
        std::string sourceName;
        int printerId = 0;
        std::string printerName;
        core::model::DispatchOptions options;
        std::optional<int> requesterId;
        std::optional<std::string> requesterName;
        std::optional<int> jobId;

        DispatchRequest() = default;

        explicit DispatchRequest(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            nlohmann::json json{
                {"requestId", requestId},
                {"action", action},
                {"sourceId", sourceId},
                {"sourceName", sourceName},
                {"printerId", printerId},
                {"printerName", printerName},
                {"options", options.print}
            };
            json["plateId"] = options.plateId ? nlohmann::json(*options.plateId) : nlohmann::json(nullptr);
            json["amsMapping"] = options.amsMapping ? nlohmann::json(*options.amsMapping) : nlohmann::json(nullptr);
            json["requesterId"] = requesterId ? nlohmann::json(*requesterId) : nlohmann::json(nullptr);
            json["requesterName"] = requesterName ? nlohmann::json(*requesterName) : nlohmann::json(nullptr);
            json["jobId"] = jobId ? nlohmann::json(*jobId) : nlohmann::json(nullptr);
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            requestId = json.value("requestId", "");
            action = json.at("action").get<std::string>();
            sourceId = json.value("sourceId", 0);
            sourceName = json.value("sourceName", "");
            printerId = json.value("printerId", 0);
            printerName = json.value("printerName", "");

            options = core::model::DispatchOptions{};
            if (json.contains("options") && json["options"].is_object()) {
                // Missing flags keep the dispatch defaults
                core::model::from_json(json["options"], options.print);
            }
            if (json.contains("plateId") && json["plateId"].is_number_integer()) {
                options.plateId = json["plateId"].get<int>();
            }
            if (json.contains("amsMapping") && json["amsMapping"].is_array()) {
                options.amsMapping = json["amsMapping"].get<std::vector<int> >();
            }

            requesterId.reset();
            requesterName.reset();
            jobId.reset();
            if (json.contains("requesterId") && json["requesterId"].is_number_integer()) {
                requesterId = json["requesterId"].get<int>();
            }
            if (json.contains("requesterName") && json["requesterName"].is_string()) {
                requesterName = json["requesterName"].get<std::string>();
            }
            if (json.contains("jobId") && json["jobId"].is_number_integer()) {
                jobId = json["jobId"].get<int>();
            }
        }

        bool isValid() const override {
            if (action == "reprint_archive" || action == "print_library_file") {
                return sourceId > 0 && printerId > 0;
            }
            if (action == "cancel") return jobId.has_value();
            return action == "state";
        }

        std::string getTypeName() const override {
            return "DispatchRequest";
        }
    };
}
