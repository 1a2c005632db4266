//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "connector/controllers/DispatchRequestController.hpp"
#include "connector/events/BaseReceiver.hpp"
#include "connector/events/BaseSender.hpp"
#include "dispatch/DispatchQueue.hpp"
#include "scheduler/PrintScheduler.hpp"
#include "transport/ConnectionModeCache.hpp"

/**
 * @brief Periodic status report of the running pipeline
 *
 * Pointers to optional components may be null (Kafka offline).
 */
class SystemMonitor {
public:
    struct Components {
        scheduler::PrintScheduler *scheduler = nullptr;
        dispatch::DispatchQueue *dispatchQueue = nullptr;
        transport::ConnectionModeCache *modeCache = nullptr;
        connector::controllers::DispatchRequestController *requestController = nullptr;
        connector::events::BaseReceiver *statusReceiver = nullptr;
        connector::events::BaseSender *eventSender = nullptr;
    };

    explicit SystemMonitor(Components components,
                           std::chrono::seconds reportInterval = std::chrono::seconds(30));

    ~SystemMonitor();

    void start();

    void stop();

    bool isRunning() const;

    void reportStatus() const;

private:
    Components components_;
    std::chrono::seconds reportInterval_;

    std::atomic<bool> running_{false};
    std::thread monitorThread_;
    std::mutex waitMutex_;
    std::condition_variable wakeUp_;

    void monitorLoop();
};
