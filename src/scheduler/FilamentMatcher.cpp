//
// Created by Andrea on 18/10/2025.
//

#include "scheduler/FilamentMatcher.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>

namespace scheduler {
    using core::model::EXTERNAL_SPOOL_SLOT;
    using core::model::FilamentRequirement;
    using core::model::LoadedFilament;
    using core::model::UNMAPPED_SLOT;

    namespace {
        const std::string FALLBACK_COLOR = "808080";

        std::string toUpper(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return value;
        }

        std::optional<int> channel(const std::string &hex, size_t offset) {
            const std::string part = hex.substr(offset, 2);
            if (!std::isxdigit(static_cast<unsigned char>(part[0])) ||
                !std::isxdigit(static_cast<unsigned char>(part[1]))) {
                return std::nullopt;
            }
            return static_cast<int>(std::strtol(part.c_str(), nullptr, 16));
        }

        // Null or wrongly typed fields read as absent
        std::string stringField(const nlohmann::json &slot, const char *key) {
            auto it = slot.find(key);
            if (it == slot.end() || !it->is_string()) return {};
            return it->get<std::string>();
        }

        int intField(const nlohmann::json &slot, const char *key, int fallback) {
            auto it = slot.find(key);
            if (it == slot.end() || !it->is_number_integer()) return fallback;
            return it->get<int>();
        }

        // Picks the first exact, similar and type-only candidates of a pool
        struct Candidates {
            const LoadedFilament *exact = nullptr;
            const LoadedFilament *similar = nullptr;
            const LoadedFilament *typeOnly = nullptr;

            const LoadedFilament *best() const {
                if (exact) return exact;
                if (similar) return similar;
                return typeOnly;
            }

            void offer(const LoadedFilament &tray, const std::string &wantedColor) {
                if (FilamentMatcher::normalizeColor(tray.color) == FilamentMatcher::normalizeColor(wantedColor)) {
                    if (!exact) exact = &tray;
                } else if (FilamentMatcher::colorsSimilar(tray.color, wantedColor)) {
                    if (!similar) similar = &tray;
                } else if (!typeOnly) {
                    typeOnly = &tray;
                }
            }
        };
    }

    std::string FilamentMatcher::normalizeColor(const std::string &color) {
        std::string hex;
        hex.reserve(color.size());
        for (char c: color) {
            if (c == '#') continue;
            hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (hex.size() > 6) hex.resize(6);
        return hex;
    }

    bool FilamentMatcher::colorsSimilar(const std::string &a, const std::string &b, int tolerance) {
        const std::string first = normalizeColor(a);
        const std::string second = normalizeColor(b);
        if (first.size() < 6 || second.size() < 6) return false;

        for (size_t offset = 0; offset < 6; offset += 2) {
            auto x = channel(first, offset);
            auto y = channel(second, offset);
            if (!x || !y) return false;
            if (std::abs(*x - *y) > tolerance) return false;
        }
        return true;
    }

    std::vector<LoadedFilament> FilamentMatcher::loadedFilaments(const core::model::DeviceState &state) {
        std::vector<LoadedFilament> loaded;

        for (const auto &unit: state.amsUnits) {
            const bool singleSlot = unit.trays.size() == 1;
            for (const auto &tray: unit.trays) {
                if (tray.type.empty()) continue;

                LoadedFilament filament;
                filament.type = tray.type;
                filament.color = tray.color.empty() ? FALLBACK_COLOR : normalizeColor(tray.color);
                filament.trayInfoIdx = tray.trayInfoIdx;
                filament.amsId = unit.id;
                filament.trayId = tray.trayId;
                // Single-tray units are numbered from 128 and addressed by their own id
                filament.globalSlotId = unit.id >= 128 ? unit.id : unit.id * 4 + tray.trayId;
                filament.isSingleSlotUnit = singleSlot;
                loaded.push_back(filament);
            }
        }

        if (state.externalSpool && !state.externalSpool->type.empty()) {
            LoadedFilament filament;
            filament.type = state.externalSpool->type;
            filament.color = state.externalSpool->color.empty()
                                 ? FALLBACK_COLOR
                                 : normalizeColor(state.externalSpool->color);
            filament.trayInfoIdx = state.externalSpool->trayInfoIdx;
            filament.amsId = -1;
            filament.globalSlotId = EXTERNAL_SPOOL_SLOT;
            filament.isExternalSpool = true;
            loaded.push_back(filament);
        }
        return loaded;
    }

    std::vector<FilamentRequirement> FilamentMatcher::parseRequirements(const nlohmann::json &requiredSlots) {
        std::vector<FilamentRequirement> required;
        if (!requiredSlots.is_array()) {
            Logger::logWarning("[FilamentMatcher] Ignoring required slots that are not a list");
            return required;
        }

        int position = 0;
        for (const auto &slot: requiredSlots) {
            ++position;
            if (!slot.is_object()) continue;

            FilamentRequirement requirement;
            requirement.slotId = intField(slot, "slot_id", position);
            requirement.type = stringField(slot, "type");
            requirement.color = stringField(slot, "color");
            requirement.trayInfoIdx = stringField(slot, "tray_info_idx");
            required.push_back(requirement);
        }
        return required;
    }

    std::vector<int> FilamentMatcher::match(const std::vector<FilamentRequirement> &required,
                                            const std::vector<LoadedFilament> &loaded) {
        std::set<int> claimed;
        std::vector<std::pair<int, int> > assignments; // slot id -> global slot id

        for (const auto &requirement: required) {
            std::vector<const LoadedFilament *> available;
            for (const auto &tray: loaded) {
                if (claimed.count(tray.globalSlotId) == 0) available.push_back(&tray);
            }

            const LoadedFilament *chosen = nullptr;
            Candidates candidates;

            if (!requirement.trayInfoIdx.empty()) {
                std::vector<const LoadedFilament *> sameIdx;
                for (const auto *tray: available) {
                    if (tray->trayInfoIdx == requirement.trayInfoIdx) sameIdx.push_back(tray);
                }
                if (sameIdx.size() == 1) {
                    chosen = sameIdx.front();
                } else {
                    for (const auto *tray: sameIdx) candidates.offer(*tray, requirement.color);
                }
            }

            if (!chosen && !candidates.best()) {
                const std::string wantedType = toUpper(requirement.type);
                for (const auto *tray: available) {
                    if (toUpper(tray->type) != wantedType) continue;
                    candidates.offer(*tray, requirement.color);
                }
            }

            if (!chosen) chosen = candidates.best();

            if (chosen) {
                claimed.insert(chosen->globalSlotId);
                assignments.emplace_back(requirement.slotId, chosen->globalSlotId);
            } else {
                Logger::logDebug("[FilamentMatcher] No tray for slot " + std::to_string(requirement.slotId) + " (" +
                                 requirement.type + " " + requirement.color + ")");
                assignments.emplace_back(requirement.slotId, UNMAPPED_SLOT);
            }
        }

        int highestSlot = 0;
        for (const auto &assignment: assignments) highestSlot = std::max(highestSlot, assignment.first);
        if (highestSlot <= 0) return {};

        std::vector<int> mapping(static_cast<size_t>(highestSlot), UNMAPPED_SLOT);
        for (const auto &assignment: assignments) {
            if (assignment.first > 0) mapping[static_cast<size_t>(assignment.first - 1)] = assignment.second;
        }
        return mapping;
    }

    std::vector<std::string> FilamentMatcher::missingTypes(const std::vector<std::string> &requiredTypes,
                                                           const std::optional<core::model::DeviceState> &state) {
        if (!state) return requiredTypes;

        std::set<std::string> loadedTypes;
        for (const auto &unit: state->amsUnits) {
            for (const auto &tray: unit.trays) {
                if (!tray.type.empty()) loadedTypes.insert(toUpper(tray.type));
            }
        }
        if (state->externalSpool && !state->externalSpool->type.empty()) {
            loadedTypes.insert(toUpper(state->externalSpool->type));
        }

        std::vector<std::string> missing;
        for (const auto &type: requiredTypes) {
            if (loadedTypes.count(toUpper(type)) == 0) missing.push_back(type);
        }
        return missing;
    }
} // namespace scheduler
