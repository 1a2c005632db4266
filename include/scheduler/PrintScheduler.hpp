//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "application/config/ConfigManager.hpp"
#include "core/device/DeviceControl.hpp"
#include "core/device/PowerControl.hpp"
#include "core/events/EventSystem.hpp"
#include "core/model/QueueEntry.hpp"
#include "core/persistence/Repository.hpp"
#include "core/print/PrintJobLauncher.hpp"

namespace scheduler {
    /**
     * @brief Periodically promotes pending queue entries to printing
     *
     * Per cycle, at most one entry is started per printer: the first eligible one in
     * (printer, position) order. Entries bound to a model pool are assigned to any idle
     * printer of that model that carries the required filament types.
     */
    class PrintScheduler {
    public:
        static constexpr const char *SKIPPED_PREVIOUS_FAILED = "Previous print failed or was aborted";
        static constexpr const char *UPLOAD_FAILED =
                "Failed to upload file to printer. Check if SD card is inserted and properly formatted "
                "(FAT32/exFAT). See server logs for detailed diagnostics.";
        static constexpr const char *START_FAILED = "Failed to send print command to printer";

        PrintScheduler(core::persistence::Repository &repository, core::device::DeviceControl &devices,
                       core::device::PowerControl &power, core::print::PrintJobLauncher &launcher,
                       core::events::EventSink &events, core::config::SchedulerConfig config);

        ~PrintScheduler();

        PrintScheduler(const PrintScheduler &) = delete;

        PrintScheduler &operator=(const PrintScheduler &) = delete;

        void start();

        void stop();

        bool isRunning() const { return running_.load(); }

        /**
         * @brief Runs one scheduling cycle on the calling thread
         * @throws core::types::PersistenceError when an entry cannot be saved
         */
        void checkQueue();

        // Blocks until every pending power-off task has finished
        void waitForBackgroundTasks();

    private:
        struct PoolMatch {
            std::optional<int> printerId;
            std::optional<std::string> waitingReason;
        };

        core::persistence::Repository &repository_;
        core::device::DeviceControl &devices_;
        core::device::PowerControl &power_;
        core::print::PrintJobLauncher &launcher_;
        core::events::EventSink &events_;
        core::config::SchedulerConfig config_;

        std::thread loopThread_;
        std::mutex waitMutex_;
        std::condition_variable waitCondition_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};

        std::mutex tasksMutex_;
        std::vector<std::future<void> > backgroundTasks_;

        void loop();

        // false when stop() interrupted the wait
        bool waitFor(std::chrono::milliseconds duration);

        bool isPrinterIdle(int printerId) const;

        bool powerOnAndWait(const core::model::SmartPlugRecord &plug, int printerId);

        bool previousPrintSucceeded(int printerId, int entryId);

        void skipEntry(core::model::QueueEntry &entry, int printerId);

        PoolMatch findIdlePrinterForModel(const std::string &model, const std::set<int> &considered,
                                          const std::vector<std::string> &requiredTypes,
                                          const std::optional<std::string> &location);

        void startEntry(core::model::QueueEntry &entry);

        void failEntry(core::model::QueueEntry &entry, const std::string &message, const std::string &printerName);

        std::optional<std::vector<int> > resolveAmsMapping(core::model::QueueEntry &entry, int printerId);

        void powerOffIfNeeded(const core::model::QueueEntry &entry);

        void publish(core::events::DispatchEvent event);
    };
} // namespace scheduler
