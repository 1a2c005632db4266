//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/PrintOptions.hpp"
#include "core/utils/Time.hpp"

namespace core::model {
    enum class QueueStatus {
        Pending,
        Printing,
        Completed,
        Failed,
        Skipped,
        Cancelled,
    };

    inline std::string queueStatusToString(QueueStatus status) {
        switch (status) {
            case QueueStatus::Pending: return "pending";
            case QueueStatus::Printing: return "printing";
            case QueueStatus::Completed: return "completed";
            case QueueStatus::Failed: return "failed";
            case QueueStatus::Skipped: return "skipped";
            case QueueStatus::Cancelled: return "cancelled";
            default: return "pending";
        }
    }

    inline std::optional<QueueStatus> queueStatusFromString(const std::string &value) {
        if (value == "pending") return QueueStatus::Pending;
        if (value == "printing") return QueueStatus::Printing;
        if (value == "completed") return QueueStatus::Completed;
        if (value == "failed") return QueueStatus::Failed;
        if (value == "skipped") return QueueStatus::Skipped;
        if (value == "cancelled") return QueueStatus::Cancelled;
        return std::nullopt;
    }

    inline bool isTerminal(QueueStatus status) {
        return status == QueueStatus::Completed || status == QueueStatus::Failed ||
               status == QueueStatus::Skipped || status == QueueStatus::Cancelled;
    }

    /**
     * @brief One persisted print request, either bound to a printer or to a model pool
     */
    struct QueueEntry {
        int id = 0;

        // Exactly one of printerId / targetModel is set
        std::optional<int> printerId;
        std::optional<std::string> targetModel;
        std::optional<std::string> targetLocation;
        std::vector<std::string> requiredFilamentTypes;

        // Exactly one of archiveId / libraryFileId is set
        std::optional<int> archiveId;
        std::optional<int> libraryFileId;

        int position = 0;
        std::optional<utils::Timestamp> scheduledTime;
        bool manualStart = false;
        bool requirePreviousSuccess = false;
        bool autoOffAfter = false;

        // Opaque blobs: array of global slot ids / ordered list of {type, color}
        std::optional<nlohmann::json> amsMapping;
        std::optional<nlohmann::json> requiredSlots;
        std::optional<int> plateId;

        PrintOptions options;

        QueueStatus status = QueueStatus::Pending;
        std::optional<utils::Timestamp> startedAt;
        std::optional<utils::Timestamp> completedAt;
        std::optional<std::string> errorMessage;
        std::optional<std::string> waitingReason;
    };
}
