//
// Created by Andrea on 20/10/2025.
//

#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "connector/events/BaseSender.hpp"

namespace mocks {
    /**
     * @brief Kafka sender stand-in keeping every (key, payload) pair
     */
    class RecordingSender : public connector::events::BaseSender {
    public:
        bool ready = true;

        bool sendMessage(const std::string &message, const std::string &key = "") override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!ready) return false;
            messages_.emplace_back(key, message);
            return true;
        }

        bool isReady() const override { return ready; }

        std::string getTopicName() const override { return "test-topic"; }

        std::string getSenderName() const override { return "RecordingSender"; }

        std::vector<std::pair<std::string, std::string> > messages() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return messages_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::pair<std::string, std::string> > messages_;
    };
}
