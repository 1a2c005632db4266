//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/DeviceState.hpp"
#include "core/model/Filament.hpp"

namespace scheduler {
    /**
     * @brief Maps the filament slots of a sliced file onto the spools loaded in a printer
     *
     * For every required slot, in order, the best unclaimed tray wins:
     *  0. the only available tray carrying the same tray info index
     *     (several such trays: the colour tiers below are applied among them, type is not checked)
     *  1. same type, same colour
     *  2. same type, every RGB channel within COLOR_TOLERANCE
     *  3. same type
     * A claimed tray is not offered again. Slots without a candidate map to UNMAPPED_SLOT.
     */
    class FilamentMatcher {
    public:
        static constexpr int COLOR_TOLERANCE = 40;

        static std::vector<core::model::LoadedFilament> loadedFilaments(const core::model::DeviceState &state);

        /**
         * @return lower-case "rrggbb": '#' and alpha removed
         */
        static std::string normalizeColor(const std::string &color);

        static bool colorsSimilar(const std::string &a, const std::string &b, int tolerance = COLOR_TOLERANCE);

        /**
         * @brief Reads the stored requiredSlots blob: [{"slot_id", "type", "color", "tray_info_idx"}]
         *
         * A missing slot_id defaults to the 1-based position in the array.
         */
        static std::vector<core::model::FilamentRequirement> parseRequirements(const nlohmann::json &requiredSlots);

        /**
         * @return global slot id per slot position (slot_id - 1), empty when nothing was required
         */
        static std::vector<int> match(const std::vector<core::model::FilamentRequirement> &required,
                                      const std::vector<core::model::LoadedFilament> &loaded);

        /**
         * @brief Required types (case-insensitive) not loaded in any tray or on the external spool
         *
         * Without telemetry every required type counts as missing.
         */
        static std::vector<std::string> missingTypes(const std::vector<std::string> &requiredTypes,
                                                     const std::optional<core::model::DeviceState> &state);
    };
} // namespace scheduler
