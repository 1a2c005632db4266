#include "application/monitor/SystemMonitor.hpp"
#include "logger/Logger.hpp"

SystemMonitor::SystemMonitor(Components components, std::chrono::seconds reportInterval)
    : components_(components), reportInterval_(reportInterval) {
}

SystemMonitor::~SystemMonitor() {
    stop();
}

void SystemMonitor::start() {
    if (running_) {
        Logger::logWarning("[SystemMonitor] Already running");
        return;
    }

    running_ = true;
    monitorThread_ = std::thread([this]() {
        try {
            monitorLoop();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Monitor thread crashed: " + std::string(e.what()));
        }
    });

    Logger::logInfo("[SystemMonitor] Started");
}

void SystemMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (!running_) return;
        running_ = false;
    }
    wakeUp_.notify_all();

    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }

    Logger::logInfo("[SystemMonitor] Stopped");
}

bool SystemMonitor::isRunning() const {
    return running_;
}

void SystemMonitor::monitorLoop() {
    std::unique_lock<std::mutex> lock(waitMutex_);
    while (running_) {
        if (wakeUp_.wait_for(lock, reportInterval_, [this]() { return !running_; })) break;

        lock.unlock();
        try {
            reportStatus();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Loop error: " + std::string(e.what()));
        }
        lock.lock();
    }
}

void SystemMonitor::reportStatus() const {
    Logger::logInfo("[SystemMonitor] ===== System Status Report =====");

    if (components_.scheduler) {
        Logger::logInfo("[SystemMonitor] Scheduler: " +
                        std::string(components_.scheduler->isRunning() ? "RUNNING" : "STOPPED"));
    }

    if (components_.dispatchQueue) {
        const auto state = components_.dispatchQueue->state();
        Logger::logInfo("[SystemMonitor] Dispatch queue: " +
                        std::string(components_.dispatchQueue->isRunning() ? "RUNNING" : "STOPPED"));
        Logger::logInfo("  Queued: " + std::to_string(state.value("dispatched", 0)));
        Logger::logInfo("  Active: " + std::to_string(state.value("processing", 0)));
        Logger::logInfo("  Batch: " + std::to_string(state.value("completed", 0)) + "/" +
                        std::to_string(state.value("total", 0)) + " done, " +
                        std::to_string(state.value("failed", 0)) + " failed");
    }

    if (components_.modeCache) {
        Logger::logInfo("[SystemMonitor] Cached transport modes: " + std::to_string(components_.modeCache->size()));
    }

    if (components_.requestController) {
        const auto stats = components_.requestController->getStatistics();
        Logger::logInfo("[SystemMonitor] Dispatch requests:");
        Logger::logInfo("  Running: " + std::string(components_.requestController->isRunning() ? "true" : "false"));
        Logger::logInfo("  Messages RX: " + std::to_string(stats.messagesReceived));
        Logger::logInfo("  Messages TX: " + std::to_string(stats.messagesSent));
        Logger::logInfo("  Errors: " + std::to_string(stats.processingErrors));
    } else {
        Logger::logInfo("[SystemMonitor] Dispatch requests: NOT AVAILABLE");
    }

    if (components_.statusReceiver) {
        Logger::logInfo("[SystemMonitor] Device status feed: " +
                        std::string(components_.statusReceiver->isReceiving() ? "RECEIVING" : "OFFLINE"));
    }

    if (components_.eventSender) {
        Logger::logInfo("[SystemMonitor] Event publisher: " +
                        std::string(components_.eventSender->isReady() ? "READY" : "NOT READY"));
    }

    Logger::logInfo("[SystemMonitor] =======================================");
}
