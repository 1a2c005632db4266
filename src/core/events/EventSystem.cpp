//
// Created by redeg on 31/08/2025.
//

#include "core/events/EventSystem.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"

namespace core::events {
    std::string eventTypeToString(EventType type) {
        switch (type) {
            case EventType::DISPATCH_QUEUED: return "dispatch_queued";
            case EventType::DISPATCH_STARTED: return "dispatch_started";
            case EventType::DISPATCH_PROGRESS: return "dispatch_progress";
            case EventType::DISPATCH_CANCELLING: return "dispatch_cancelling";
            case EventType::DISPATCH_CANCELLED: return "dispatch_cancelled";
            case EventType::DISPATCH_COMPLETED: return "dispatch_completed";
            case EventType::DISPATCH_FAILED: return "dispatch_failed";
            case EventType::QUEUE_ENTRY_STARTED: return "queue_entry_started";
            case EventType::QUEUE_ENTRY_SKIPPED: return "queue_entry_skipped";
            case EventType::QUEUE_ENTRY_FAILED: return "queue_entry_failed";
            case EventType::QUEUE_ENTRY_WAITING: return "queue_entry_waiting";
            case EventType::PRINTER_POWERED_ON: return "printer_powered_on";
            case EventType::PRINTER_POWERED_OFF: return "printer_powered_off";
            default: return "unknown";
        }
    }

    nlohmann::json DispatchEvent::toJson() const {
        nlohmann::json json{
            {"type", eventTypeToString(type)},
            {"printer_id", printerId},
            {"printer_name", printerName},
            {"source_name", sourceName},
            {"message", message},
            {"bytes_sent", bytesSent},
            {"total_bytes", totalBytes},
            {"timestamp", utils::toIso8601(timestamp)}
        };
        json["job_id"] = jobId ? nlohmann::json(*jobId) : nlohmann::json(nullptr);
        json["queue_entry_id"] = queueEntryId ? nlohmann::json(*queueEntryId) : nlohmann::json(nullptr);
        if (state) {
            json["state"] = *state;
        }
        return json;
    }

    void EventBus::subscribe(std::shared_ptr<IEventObserver> observer) {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers_.push_back(observer);
    }

    void EventBus::publish(const DispatchEvent &event) {
        std::vector<std::shared_ptr<IEventObserver> > active;
        {
            std::lock_guard<std::mutex> lock(observersMutex_);

            // Clean up expired observers and collect active ones
            auto it = observers_.begin();
            while (it != observers_.end()) {
                if (auto observer = it->lock()) {
                    active.push_back(std::move(observer));
                    ++it;
                } else {
                    it = observers_.erase(it);
                }
            }
        }

        for (const auto &observer: active) {
            try {
                observer->onEvent(event);
            } catch (const std::exception &e) {
                Logger::logError("[EventBus] Observer failed on " + eventTypeToString(event.type) + ": " + e.what());
            }
        }
    }

    size_t EventBus::observerCount() const {
        std::lock_guard<std::mutex> lock(observersMutex_);
        return observers_.size();
    }
} // namespace core::events
