//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <string>

#include "core/model/Records.hpp"

namespace core::device {
    struct PlugStatus {
        bool reachable = false;
        std::string state; // "ON" / "OFF" when reachable
    };

    /**
     * @brief Smart outlet linked to a printer
     */
    class PowerControl {
    public:
        virtual ~PowerControl() = default;

        virtual PlugStatus getStatus(const model::SmartPlugRecord &plug) = 0;

        virtual bool turnOn(const model::SmartPlugRecord &plug) = 0;

        virtual bool turnOff(const model::SmartPlugRecord &plug) = 0;
    };
}
