//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include <nlohmann/json.hpp>

#include "core/model/DeviceState.hpp"
#include "core/model/PrintOptions.hpp"
#include "core/model/QueueEntry.hpp"
#include "core/model/Records.hpp"

// JSON mapping used by the file repository and the Kafka bridge
namespace core::model {
    void to_json(nlohmann::json &json, const PrintOptions &options);

    void from_json(const nlohmann::json &json, PrintOptions &options);

    void to_json(nlohmann::json &json, const QueueEntry &entry);

    void from_json(const nlohmann::json &json, QueueEntry &entry);

    void to_json(nlohmann::json &json, const PrinterRecord &printer);

    void from_json(const nlohmann::json &json, PrinterRecord &printer);

    void to_json(nlohmann::json &json, const ArchiveRecord &archive);

    void from_json(const nlohmann::json &json, ArchiveRecord &archive);

    void to_json(nlohmann::json &json, const LibraryFileRecord &file);

    void from_json(const nlohmann::json &json, LibraryFileRecord &file);

    void to_json(nlohmann::json &json, const SmartPlugRecord &plug);

    void from_json(const nlohmann::json &json, SmartPlugRecord &plug);

    void to_json(nlohmann::json &json, const AmsTray &tray);

    void from_json(const nlohmann::json &json, AmsTray &tray);

    void to_json(nlohmann::json &json, const DeviceState &state);

    void from_json(const nlohmann::json &json, DeviceState &state);
}
