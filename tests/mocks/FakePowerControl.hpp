//
// Created by Andrea on 20/10/2025.
//

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "core/device/PowerControl.hpp"

namespace mocks {
    class FakePowerControl : public core::device::PowerControl {
    public:
        bool reachable = true;
        std::string state = "OFF";
        bool switchResult = true;
        // Runs after a successful turnOn, e.g. to bring the printer online
        std::function<void()> onTurnOn;

        core::device::PlugStatus getStatus(const core::model::SmartPlugRecord &) override {
            std::lock_guard<std::mutex> lock(mutex_);
            return {reachable, reachable ? state : ""};
        }

        bool turnOn(const core::model::SmartPlugRecord &plug) override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                calls_.push_back("on:" + plug.name);
                if (!switchResult) return false;
                state = "ON";
            }
            if (onTurnOn) onTurnOn();
            return true;
        }

        bool turnOff(const core::model::SmartPlugRecord &plug) override {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back("off:" + plug.name);
            if (!switchResult) return false;
            state = "OFF";
            return true;
        }

        std::vector<std::string> calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> calls_;
    };
}
