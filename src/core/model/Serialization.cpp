//
// Created by Andrea on 15/10/2025.
//

#include "core/model/Serialization.hpp"

namespace core::model {
    namespace {
        template<typename T>
        void readOptional(const nlohmann::json &json, const char *key, std::optional<T> &target) {
            if (json.contains(key) && !json[key].is_null()) {
                target = json[key].get<T>();
            } else {
                target.reset();
            }
        }

        template<typename T>
        void writeOptional(nlohmann::json &json, const char *key, const std::optional<T> &value) {
            if (value) {
                json[key] = *value;
            } else {
                json[key] = nullptr;
            }
        }

        void readTimestamp(const nlohmann::json &json, const char *key, std::optional<utils::Timestamp> &target) {
            target.reset();
            if (json.contains(key) && json[key].is_string()) {
                target = utils::fromIso8601(json[key].get<std::string>());
            }
        }

        void writeTimestamp(nlohmann::json &json, const char *key, const std::optional<utils::Timestamp> &value) {
            if (value) {
                json[key] = utils::toIso8601(*value);
            } else {
                json[key] = nullptr;
            }
        }
    }

    void to_json(nlohmann::json &json, const PrintOptions &options) {
        json = nlohmann::json{
            {"bed_levelling", options.bedLevelling},
            {"flow_cali", options.flowCali},
            {"vibration_cali", options.vibrationCali},
            {"layer_inspect", options.layerInspect},
            {"timelapse", options.timelapse},
            {"use_ams", options.useAms}
        };
    }

    void from_json(const nlohmann::json &json, PrintOptions &options) {
        options.bedLevelling = json.value("bed_levelling", options.bedLevelling);
        options.flowCali = json.value("flow_cali", options.flowCali);
        options.vibrationCali = json.value("vibration_cali", options.vibrationCali);
        options.layerInspect = json.value("layer_inspect", options.layerInspect);
        options.timelapse = json.value("timelapse", options.timelapse);
        options.useAms = json.value("use_ams", options.useAms);
    }

    void to_json(nlohmann::json &json, const QueueEntry &entry) {
        json = nlohmann::json::object();
        json["id"] = entry.id;
        writeOptional(json, "printer_id", entry.printerId);
        writeOptional(json, "target_model", entry.targetModel);
        writeOptional(json, "target_location", entry.targetLocation);
        json["required_filament_types"] = entry.requiredFilamentTypes;
        writeOptional(json, "archive_id", entry.archiveId);
        writeOptional(json, "library_file_id", entry.libraryFileId);
        json["position"] = entry.position;
        writeTimestamp(json, "scheduled_time", entry.scheduledTime);
        json["manual_start"] = entry.manualStart;
        json["require_previous_success"] = entry.requirePreviousSuccess;
        json["auto_off_after"] = entry.autoOffAfter;
        writeOptional(json, "ams_mapping", entry.amsMapping);
        writeOptional(json, "required_slots", entry.requiredSlots);
        writeOptional(json, "plate_id", entry.plateId);
        json["options"] = entry.options;
        json["status"] = queueStatusToString(entry.status);
        writeTimestamp(json, "started_at", entry.startedAt);
        writeTimestamp(json, "completed_at", entry.completedAt);
        writeOptional(json, "error_message", entry.errorMessage);
        writeOptional(json, "waiting_reason", entry.waitingReason);
    }

    void from_json(const nlohmann::json &json, QueueEntry &entry) {
        entry.id = json.at("id").get<int>();
        readOptional(json, "printer_id", entry.printerId);
        readOptional(json, "target_model", entry.targetModel);
        readOptional(json, "target_location", entry.targetLocation);
        entry.requiredFilamentTypes = json.value("required_filament_types", std::vector<std::string>{});
        readOptional(json, "archive_id", entry.archiveId);
        readOptional(json, "library_file_id", entry.libraryFileId);
        entry.position = json.value("position", 0);
        readTimestamp(json, "scheduled_time", entry.scheduledTime);
        entry.manualStart = json.value("manual_start", false);
        entry.requirePreviousSuccess = json.value("require_previous_success", false);
        entry.autoOffAfter = json.value("auto_off_after", false);
        readOptional(json, "ams_mapping", entry.amsMapping);
        readOptional(json, "required_slots", entry.requiredSlots);
        readOptional(json, "plate_id", entry.plateId);
        if (json.contains("options") && json["options"].is_object()) {
            entry.options = json["options"].get<PrintOptions>();
        }
        entry.status = queueStatusFromString(json.value("status", "pending")).value_or(QueueStatus::Pending);
        readTimestamp(json, "started_at", entry.startedAt);
        readTimestamp(json, "completed_at", entry.completedAt);
        readOptional(json, "error_message", entry.errorMessage);
        readOptional(json, "waiting_reason", entry.waitingReason);
    }

    void to_json(nlohmann::json &json, const PrinterRecord &printer) {
        json = nlohmann::json{
            {"id", printer.id},
            {"name", printer.name},
            {"model", printer.model},
            {"ip_address", printer.address},
            {"access_code", printer.accessCode},
            {"serial_number", printer.serial},
            {"is_active", printer.active}
        };
        writeOptional(json, "location", printer.location);
    }

    void from_json(const nlohmann::json &json, PrinterRecord &printer) {
        printer.id = json.at("id").get<int>();
        printer.name = json.value("name", "");
        printer.model = json.value("model", "");
        printer.address = json.at("ip_address").get<std::string>();
        printer.accessCode = json.value("access_code", "");
        printer.serial = json.value("serial_number", "");
        readOptional(json, "location", printer.location);
        printer.active = json.value("is_active", true);
    }

    void to_json(nlohmann::json &json, const ArchiveRecord &archive) {
        json = nlohmann::json{
            {"id", archive.id},
            {"filename", archive.filename},
            {"file_path", archive.filePath},
            {"status", archive.status}
        };
        writeOptional(json, "printer_id", archive.printerId);
        writeOptional(json, "print_time_seconds", archive.printTimeSeconds);
    }

    void from_json(const nlohmann::json &json, ArchiveRecord &archive) {
        archive.id = json.at("id").get<int>();
        readOptional(json, "printer_id", archive.printerId);
        archive.filename = json.value("filename", "");
        archive.filePath = json.value("file_path", "");
        readOptional(json, "print_time_seconds", archive.printTimeSeconds);
        archive.status = json.value("status", "archived");
    }

    void to_json(nlohmann::json &json, const LibraryFileRecord &file) {
        json = nlohmann::json{
            {"id", file.id},
            {"filename", file.filename},
            {"file_path", file.filePath}
        };
        writeOptional(json, "print_time_seconds", file.printTimeSeconds);
    }

    void from_json(const nlohmann::json &json, LibraryFileRecord &file) {
        file.id = json.at("id").get<int>();
        file.filename = json.value("filename", "");
        file.filePath = json.value("file_path", "");
        readOptional(json, "print_time_seconds", file.printTimeSeconds);
    }

    void to_json(nlohmann::json &json, const SmartPlugRecord &plug) {
        json = nlohmann::json{
            {"id", plug.id},
            {"name", plug.name},
            {"ip_address", plug.address},
            {"enabled", plug.enabled},
            {"auto_on", plug.autoOn},
            {"auto_off", plug.autoOff}
        };
        writeOptional(json, "printer_id", plug.printerId);
        writeOptional(json, "username", plug.username);
        writeOptional(json, "password", plug.password);
    }

    void from_json(const nlohmann::json &json, SmartPlugRecord &plug) {
        plug.id = json.at("id").get<int>();
        plug.name = json.value("name", "");
        readOptional(json, "printer_id", plug.printerId);
        plug.address = json.at("ip_address").get<std::string>();
        readOptional(json, "username", plug.username);
        readOptional(json, "password", plug.password);
        plug.enabled = json.value("enabled", true);
        plug.autoOn = json.value("auto_on", true);
        plug.autoOff = json.value("auto_off", true);
    }

    void to_json(nlohmann::json &json, const AmsTray &tray) {
        json = nlohmann::json{
            {"id", tray.trayId},
            {"tray_type", tray.type},
            {"tray_color", tray.color},
            {"tray_info_idx", tray.trayInfoIdx}
        };
    }

    void from_json(const nlohmann::json &json, AmsTray &tray) {
        tray.trayId = json.value("id", 0);
        tray.type = json.value("tray_type", "");
        tray.color = json.value("tray_color", "");
        tray.trayInfoIdx = json.value("tray_info_idx", "");
    }

    void to_json(nlohmann::json &json, const DeviceState &state) {
        nlohmann::json units = nlohmann::json::array();
        for (const auto &unit: state.amsUnits) {
            units.push_back({{"id", unit.id}, {"tray", unit.trays}});
        }
        json = nlohmann::json{
            {"state", state.state},
            {"gcode_file", state.gcodeFile},
            {"nozzle_temper", state.nozzleTemp},
            {"bed_temper", state.bedTemp},
            {"ams", units}
        };
        writeOptional(json, "vt_tray", state.externalSpool);
    }

    void from_json(const nlohmann::json &json, DeviceState &state) {
        state.state = json.value("state", "");
        state.gcodeFile = json.value("gcode_file", "");
        state.nozzleTemp = json.value("nozzle_temper", 0.0);
        state.bedTemp = json.value("bed_temper", 0.0);

        state.amsUnits.clear();
        if (json.contains("ams") && json["ams"].is_array()) {
            for (const auto &unitJson: json["ams"]) {
                AmsUnit unit;
                unit.id = unitJson.value("id", 0);
                if (unitJson.contains("tray") && unitJson["tray"].is_array()) {
                    unit.trays = unitJson["tray"].get<std::vector<AmsTray> >();
                }
                state.amsUnits.push_back(std::move(unit));
            }
        }
        readOptional(json, "vt_tray", state.externalSpool);
    }
}
