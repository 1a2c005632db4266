//
// Created by Andrea on 19/10/2025.
//

#pragma once

#include <optional>
#include <string>

#include "core/device/PowerControl.hpp"

namespace connector::power {
    /**
     * @brief Smart plugs running Tasmota firmware, driven through its HTTP command endpoint
     *
     * Every call is a single GET on http://<address>/cm?cmnd=...; an unreachable plug or an
     * unexpected reply is reported as a soft failure.
     */
    class TasmotaPowerControl : public core::device::PowerControl {
    public:
        explicit TasmotaPowerControl(long timeoutSeconds = 5);

        ~TasmotaPowerControl() override;

        TasmotaPowerControl(const TasmotaPowerControl &) = delete;

        TasmotaPowerControl &operator=(const TasmotaPowerControl &) = delete;

        core::device::PlugStatus getStatus(const core::model::SmartPlugRecord &plug) override;

        bool turnOn(const core::model::SmartPlugRecord &plug) override;

        bool turnOff(const core::model::SmartPlugRecord &plug) override;

        /**
         * @brief "Power", "Power On" or "Power Off" against the plug, credentials appended when set
         */
        static std::string commandUrl(const core::model::SmartPlugRecord &plug, const std::string &command);

        /**
         * @brief Extracts "ON"/"OFF" from {"POWER":"ON"} (or {"POWER1":"ON"} on multi-relay plugs)
         */
        static std::optional<std::string> parsePowerState(const std::string &body);

    private:
        long timeoutSeconds_;

        std::optional<std::string> sendCommand(const core::model::SmartPlugRecord &plug, const std::string &command);

        static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);
    };
}
