#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>

// Global shutdown mechanism
std::atomic<bool> running{true};
std::condition_variable shutdownCondition;
std::mutex shutdownMutex;

void handleSignal(int signal) {
    (void) signal;
    running = false;
    shutdownCondition.notify_all();
}

int main(int argc, char *argv[]) {
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    try {
        Logger::init();
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        ApplicationController app(configPath);

        if (!app.initialize()) {
            Logger::logError("Application initialization failed");
            app.shutdown();
            Logger::shutdown();
            return 1;
        }

        Logger::logInfo("Press Ctrl+C to shutdown gracefully...");
        {
            std::unique_lock<std::mutex> lock(shutdownMutex);
            while (!shutdownCondition.wait_for(lock, std::chrono::seconds(30), [] { return !running.load(); })) {
                lock.unlock();
                app.performHealthCheck();
                lock.lock();
            }
        }

        Logger::logInfo("Shutdown signal received");
        app.shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        Logger::shutdown();
        return 1;
    }

    Logger::shutdown();
    return 0;
}
