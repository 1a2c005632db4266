//
// Created by Andrea on 20/10/2025.
//

#pragma once

#include <algorithm>
#include <iterator>
#include <mutex>
#include <vector>

#include "core/events/EventSystem.hpp"

namespace mocks {
    class RecordingEventSink : public core::events::EventSink {
    public:
        void publish(const core::events::DispatchEvent &event) override {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }

        std::vector<core::events::DispatchEvent> events() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }

        std::vector<core::events::DispatchEvent> ofType(core::events::EventType type) const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<core::events::DispatchEvent> matching;
            std::copy_if(events_.begin(), events_.end(), std::back_inserter(matching),
                         [type](const core::events::DispatchEvent &event) { return event.type == type; });
            return matching;
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.clear();
        }

    private:
        mutable std::mutex mutex_;
        std::vector<core::events::DispatchEvent> events_;
    };
}
