//
// Created by Andrea on 23/08/2025.
//

#include "application/controllers/ApplicationController.hpp"

#include <filesystem>

#include "logger/Logger.hpp"

using core::config::ConfigManager;

ApplicationController::ApplicationController(std::string configPath) : configPath_(std::move(configPath)) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize() {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] STARTING FLEET DISPATCH SERVICE");
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] Build Date: " + std::string(__DATE__) + " " + std::string(__TIME__));

    Logger::logInfo("[ApplicationController] [1/6] Loading configuration...");
    if (!loadConfiguration()) {
        Logger::logError("[ApplicationController] Configuration is invalid");
        return false;
    }

    auto &config = ConfigManager::getInstance();
    const auto storage = config.getStorageConfig();

    Logger::logInfo("[ApplicationController] [2/6] Opening repository...");
    try {
        std::filesystem::path repositoryPath(storage.repositoryFile);
        if (repositoryPath.is_relative()) {
            repositoryPath = std::filesystem::path(storage.baseDir) / repositoryPath;
        }
        repository_ = std::make_unique<connector::persistence::JsonFileRepository>(repositoryPath);
    } catch (const core::types::PersistenceError &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        return false;
    }

    Logger::logInfo("[ApplicationController] [3/6] Creating transport...");
    modeCache_ = std::make_unique<transport::ConnectionModeCache>();
    expectedPrints_ = std::make_unique<core::jobs::ExpectedPrintRegistry>();
    transport_ = std::make_unique<transport::TransportClient>(*modeCache_, config.getTransportConfig());

    Logger::logInfo("[ApplicationController] [4/6] Connecting Kafka bridge...");
    initializeKafkaBridge(storage);

    Logger::logInfo("[ApplicationController] [5/6] Starting scheduler and dispatch queue...");
    power_ = std::make_unique<connector::power::TasmotaPowerControl>();
    launcher_ = std::make_unique<core::print::PrintJobLauncher>(*transport_, *devices_, *expectedPrints_,
                                                               storage.baseDir);
    scheduler_ = std::make_unique<scheduler::PrintScheduler>(*repository_, *devices_, *power_, *launcher_,
                                                             *eventBus_, config.getSchedulerConfig());
    dispatchQueue_ = std::make_unique<dispatch::DispatchQueue>(*repository_, *devices_, *launcher_, *eventBus_,
                                                               config.getDispatchConfig());
    scheduler_->start();
    dispatchQueue_->start();

    requestController_ = std::make_unique<connector::controllers::DispatchRequestController>(kafkaConfig_,
        *dispatchQueue_);
    requestController_->start();

    Logger::logInfo("[ApplicationController] [6/6] Starting System Monitor...");
    SystemMonitor::Components components;
    components.scheduler = scheduler_.get();
    components.dispatchQueue = dispatchQueue_.get();
    components.modeCache = modeCache_.get();
    components.requestController = requestController_.get();
    components.statusReceiver = statusReceiver_.get();
    components.eventSender = eventSender_.get();
    monitor_ = std::make_unique<SystemMonitor>(components);
    monitor_->start();

    printInitializationSummary();
    initializationComplete_ = true;

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SYSTEM READY");
    Logger::logInfo("===============================================");
    return true;
}

bool ApplicationController::loadConfiguration() {
    auto &config = ConfigManager::getInstance();
    config.loadFromFile(configPath_);
    config.loadFromEnv();

    Logger::setDebugEnabled(config.get<bool>("log.debug", false));

    const auto validation = config.validate();
    for (const auto &error: validation.errors) {
        Logger::logError("[ApplicationController]   " + error);
    }

    kafkaConfig_.resolveFromEnvironment();
    kafkaConfig_.printConfig();
    return validation.isValid;
}

void ApplicationController::initializeKafkaBridge(const core::config::StorageConfig &storage) {
    eventBus_ = std::make_unique<core::events::EventBus>();

    eventSender_ = std::make_shared<connector::events::dispatch::DispatchEventSender>(kafkaConfig_);
    eventBus_->subscribe(eventSender_);

    commandSender_ = std::make_unique<connector::events::device::DeviceCommandSender>(kafkaConfig_);
    devices_ = std::make_unique<connector::device::KafkaDeviceGateway>(
        *commandSender_, *expectedPrints_, kafkaConfig_.serviceId, std::chrono::milliseconds(storage.deviceStaleMs));

    statusReceiver_ = std::make_unique<connector::events::device::DeviceStatusReceiver>(kafkaConfig_);
    statusReceiver_->setMessageCallback([this](const std::string &message, const std::string &) {
        devices_->handleStatusMessage(message);
    });

    try {
        statusReceiver_->startReceiving();
    } catch (const std::exception &e) {
        // Without telemetry every printer reads as disconnected; queue entries simply wait
        Logger::logWarning("[ApplicationController] Device status feed unavailable: " + std::string(e.what()));
    }
}

void ApplicationController::performHealthCheck() {
    if (!initializationComplete_) return;

    if (scheduler_ && !scheduler_->isRunning()) {
        Logger::logWarning("[ApplicationController] Health Check: Scheduler stopped - restarting!");
        scheduler_->start();
    }

    if (dispatchQueue_ && !dispatchQueue_->isRunning()) {
        Logger::logWarning("[ApplicationController] Health Check: Dispatch queue stopped - restarting!");
        dispatchQueue_->start();
    }
}

void ApplicationController::shutdown() {
    if (!initializationComplete_.exchange(false) && !repository_) {
        return;
    }

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SHUTTING DOWN APPLICATION");
    Logger::logInfo("===============================================");

    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
    }

    if (requestController_) {
        requestController_->stop();
        requestController_.reset();
    }

    // Wakes cooldown waits so the scheduler's auto-off tasks can finish
    if (devices_) {
        devices_->shutdown();
    }

    if (scheduler_) {
        scheduler_->stop();
        scheduler_.reset();
    }

    if (dispatchQueue_) {
        dispatchQueue_->stop();
        dispatchQueue_.reset();
    }

    if (statusReceiver_) {
        statusReceiver_->stopReceiving();
        statusReceiver_.reset();
    }

    if (eventSender_) {
        eventSender_->flush(5000);
    }

    launcher_.reset();
    power_.reset();
    devices_.reset();
    commandSender_.reset();
    eventSender_.reset();
    eventBus_.reset();
    transport_.reset();
    expectedPrints_.reset();
    modeCache_.reset();
    repository_.reset();

    Logger::logInfo("[ApplicationController] APPLICATION SHUTDOWN COMPLETE");
}

void ApplicationController::printInitializationSummary() const {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] INITIALIZATION SUMMARY");
    Logger::logInfo("===============================================");
    Logger::logInfo("  Scheduler: " + std::string(scheduler_ && scheduler_->isRunning() ? "RUNNING" : "STOPPED"));
    Logger::logInfo("  Dispatch queue: " +
                    std::string(dispatchQueue_ && dispatchQueue_->isRunning() ? "RUNNING" : "STOPPED"));
    Logger::logInfo("  Event publisher: " + std::string(eventSender_ && eventSender_->isReady() ? "READY" : "OFFLINE"));
    Logger::logInfo("  Device status feed: " +
                    std::string(statusReceiver_ && statusReceiver_->isReceiving() ? "ONLINE" : "OFFLINE"));
    Logger::logInfo("  Dispatch requests: " +
                    std::string(requestController_ && requestController_->isRunning() ? "ONLINE" : "OFFLINE"));
    Logger::logInfo("  System Monitor: " + std::string(monitor_ ? "ACTIVE" : "INACTIVE"));
    Logger::logInfo("===============================================");
}
