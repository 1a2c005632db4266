//
// Created by redeg on 26/04/2025.
//

#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <thread>
#include <atomic>

/**
 * @brief Process-wide logger writing to the console and to a rotating file under logs/
 *
 * Messages carry a "[Component]" prefix chosen by the caller. The file sink is only
 * active between init() and shutdown(); before that (unit tests) output goes to the console only.
 */
class Logger {
public:
    static void init(const std::string &logsFolder = "logs");

    static void shutdown();

    static void setDebugEnabled(bool enabled);

    static void setConsoleEnabled(bool enabled);

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static std::string logsFolder_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<bool> rotationEnabled_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;
    static std::atomic<bool> debugEnabled_;
    static std::atomic<bool> consoleEnabled_;

    static void log(const std::string &level, const std::string &message);

    static void rotateLogFile();

    static void startCleanupThread();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
