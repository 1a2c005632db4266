//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "application/config/ConfigManager.hpp"
#include "application/monitor/SystemMonitor.hpp"
#include "connector/controllers/DispatchRequestController.hpp"
#include "connector/device/KafkaDeviceGateway.hpp"
#include "connector/events/device/DeviceCommandSender.hpp"
#include "connector/events/device/DeviceStatusReceiver.hpp"
#include "connector/events/dispatch/DispatchEventSender.hpp"
#include "connector/kafka/KafkaConfig.hpp"
#include "connector/persistence/JsonFileRepository.hpp"
#include "connector/power/TasmotaPowerControl.hpp"
#include "core/events/EventSystem.hpp"
#include "core/jobs/ExpectedPrintRegistry.hpp"
#include "core/print/PrintJobLauncher.hpp"
#include "dispatch/DispatchQueue.hpp"
#include "scheduler/PrintScheduler.hpp"
#include "transport/ConnectionModeCache.hpp"
#include "transport/TransportClient.hpp"

/**
 * @class ApplicationController
 * @brief Owns and wires every component of the fleet dispatch service
 *
 * Initialization order:
 * 1. Configuration (config.json, environment, Kafka placeholders)
 * 2. Repository
 * 3. Shared stores and transport (mode cache, expected prints, FTPS client)
 * 4. Kafka bridge (events, device status/commands, dispatch requests); optional
 * 5. Scheduler and dispatch queue
 * 6. System monitor
 *
 * Shutdown runs the same steps in reverse.
 */
class ApplicationController {
public:
    explicit ApplicationController(std::string configPath = "config.json");

    ~ApplicationController();

    ApplicationController(const ApplicationController &) = delete;

    ApplicationController &operator=(const ApplicationController &) = delete;

    /**
     * @return false when a mandatory component (configuration, repository) could not start
     */
    bool initialize();

    void shutdown();

    /**
     * @brief Restarts the scheduler or dispatcher if they stopped unexpectedly
     */
    void performHealthCheck();

    dispatch::DispatchQueue *dispatchQueue() { return dispatchQueue_.get(); }

private:
    std::string configPath_;
    connector::kafka::KafkaConfig kafkaConfig_;

    // Stores shared between the scheduler and the dispatch queue
    std::unique_ptr<connector::persistence::JsonFileRepository> repository_;
    std::unique_ptr<transport::ConnectionModeCache> modeCache_;
    std::unique_ptr<core::jobs::ExpectedPrintRegistry> expectedPrints_;
    std::unique_ptr<transport::TransportClient> transport_;

    // Kafka bridge
    std::unique_ptr<core::events::EventBus> eventBus_;
    std::shared_ptr<connector::events::dispatch::DispatchEventSender> eventSender_;
    std::unique_ptr<connector::events::device::DeviceCommandSender> commandSender_;
    std::unique_ptr<connector::device::KafkaDeviceGateway> devices_;
    std::unique_ptr<connector::events::device::DeviceStatusReceiver> statusReceiver_;
    std::unique_ptr<connector::power::TasmotaPowerControl> power_;

    std::unique_ptr<core::print::PrintJobLauncher> launcher_;
    std::unique_ptr<scheduler::PrintScheduler> scheduler_;
    std::unique_ptr<dispatch::DispatchQueue> dispatchQueue_;
    std::unique_ptr<connector::controllers::DispatchRequestController> requestController_;

    std::unique_ptr<SystemMonitor> monitor_;

    std::atomic<bool> initializationComplete_{false};

    bool loadConfiguration();

    void initializeKafkaBridge(const core::config::StorageConfig &storage);

    void printInitializationSummary() const;
};
