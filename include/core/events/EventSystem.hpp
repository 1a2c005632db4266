//
// Created by redeg on 31/08/2025.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace core::events {
    enum class EventType {
        DISPATCH_QUEUED,
        DISPATCH_STARTED,
        DISPATCH_PROGRESS,
        DISPATCH_CANCELLING,
        DISPATCH_CANCELLED,
        DISPATCH_COMPLETED,
        DISPATCH_FAILED,
        QUEUE_ENTRY_STARTED,
        QUEUE_ENTRY_SKIPPED,
        QUEUE_ENTRY_FAILED,
        QUEUE_ENTRY_WAITING,
        PRINTER_POWERED_ON,
        PRINTER_POWERED_OFF
    };

    std::string eventTypeToString(EventType type);

    /**
     * @brief Payload shared by dispatch progress and scheduler notifications
     */
    struct DispatchEvent {
        EventType type;
        std::optional<int> jobId;
        std::optional<int> queueEntryId;
        int printerId = 0;
        std::string printerName;
        std::string sourceName;
        std::string message;
        uint64_t bytesSent = 0;
        uint64_t totalBytes = 0;
        // Dispatch queue snapshot attached by the dispatch queue
        std::optional<nlohmann::json> state;
        std::chrono::system_clock::time_point timestamp;

        DispatchEvent(EventType t, int printer, std::string msg = "")
            : type(t), printerId(printer), message(std::move(msg)),
              timestamp(std::chrono::system_clock::now()) {
        }

        nlohmann::json toJson() const;
    };

    /**
     * @brief Fire-and-forget publication point; never throws to the caller
     */
    class EventSink {
    public:
        virtual ~EventSink() = default;

        virtual void publish(const DispatchEvent &event) = 0;
    };

    class IEventObserver {
    public:
        virtual ~IEventObserver() = default;

        virtual void onEvent(const DispatchEvent &event) = 0;
    };

    /**
     * @brief Fans events out to subscribed observers, isolating observer failures
     */
    class EventBus : public EventSink {
    private:
        mutable std::mutex observersMutex_;
        std::vector<std::weak_ptr<IEventObserver> > observers_;

    public:
        void subscribe(std::shared_ptr<IEventObserver> observer);

        void publish(const DispatchEvent &event) override;

        size_t observerCount() const;
    };
} // namespace core::events
