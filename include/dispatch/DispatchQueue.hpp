//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/config/ConfigManager.hpp"
#include "core/device/DeviceControl.hpp"
#include "core/events/EventSystem.hpp"
#include "core/model/DispatchJob.hpp"
#include "core/persistence/Repository.hpp"
#include "core/print/PrintJobLauncher.hpp"
#include "core/types/CancellationToken.hpp"
#include "core/types/Error.hpp"

namespace dispatch {
    /**
     * @brief The printer already has a dispatch queued or running, or is printing
     */
    class DispatchRejected : public core::types::FleetException {
    public:
        explicit DispatchRejected(const std::string &msg) : FleetException(msg) {
        }
    };

    struct EnqueueResult {
        int jobId = 0;
        int position = 0; // 1-based, counting queued and active jobs
    };

    struct CancelResult {
        bool cancelled = false;
        bool pending = false; // the job is still running and stops at its next checkpoint
        std::optional<std::string> reason;
        std::optional<int> jobId;
        std::string sourceName;
        int printerId = 0;
        std::string printerName;

        nlohmann::json toJson() const;
    };

    /**
     * @brief Background upload-and-start of one-off print jobs, at most one per printer
     *
     * A dispatcher thread moves queued jobs whose printer is free into the active table and
     * runs each on its own thread. Every state change is published together with a snapshot
     * of the whole queue (see state()).
     */
    class DispatchQueue {
    public:
        DispatchQueue(core::persistence::Repository &repository, core::device::DeviceControl &devices,
                      core::print::PrintJobLauncher &launcher, core::events::EventSink &events,
                      core::config::DispatchConfig config);

        ~DispatchQueue();

        DispatchQueue(const DispatchQueue &) = delete;

        DispatchQueue &operator=(const DispatchQueue &) = delete;

        void start();

        /**
         * @brief Drops queued jobs, cancels running ones and joins every thread
         */
        void stop();

        bool isRunning() const { return running_.load(); }

        /**
         * @throws DispatchRejected
         */
        EnqueueResult enqueue(core::model::DispatchJob job);

        EnqueueResult dispatchReprintArchive(int archiveId, const std::string &archiveName, int printerId,
                                             const std::string &printerName,
                                             const core::model::DispatchOptions &options,
                                             std::optional<int> requesterId = std::nullopt,
                                             std::optional<std::string> requesterName = std::nullopt);

        EnqueueResult dispatchPrintLibraryFile(int fileId, const std::string &filename, int printerId,
                                               const std::string &printerName,
                                               const core::model::DispatchOptions &options,
                                               std::optional<int> requesterId = std::nullopt,
                                               std::optional<std::string> requesterName = std::nullopt);

        /**
         * @brief Queued jobs are dropped at once, active ones are asked to stop
         */
        CancelResult cancel(int jobId);

        // Snapshot for newly connected clients
        nlohmann::json state() const;

        /**
         * @return false when jobs were still queued or running after the timeout
         */
        bool waitUntilIdle(std::chrono::milliseconds timeout);

    private:
        struct ActiveJob {
            core::model::DispatchJob job;
            std::string message;
            std::optional<uint64_t> uploadBytes;
            std::optional<uint64_t> uploadTotalBytes;
            std::shared_ptr<core::types::CancellationToken> cancel;
        };

        struct BatchCounters {
            int total = 0;
            int completed = 0;
            int failed = 0;
        };

        core::persistence::Repository &repository_;
        core::device::DeviceControl &devices_;
        core::print::PrintJobLauncher &launcher_;
        core::events::EventSink &events_;
        core::config::DispatchConfig config_;

        mutable std::mutex mutex_;
        std::condition_variable jobSignal_;
        std::condition_variable idleSignal_;
        bool jobPending_ = false;
        bool stopping_ = false;
        std::atomic<bool> running_{false};

        std::deque<core::model::DispatchJob> queued_;
        std::map<int, ActiveJob> active_;
        std::map<int, std::thread> workers_;
        std::vector<int> finishedWorkers_;
        int liveWorkers_ = 0;
        int nextJobId_ = 1;
        BatchCounters batch_;

        // Serialises start() and stop()
        std::mutex lifecycleMutex_;
        std::thread dispatcherThread_;

        void dispatcherLoop();

        void runJob(const core::model::DispatchJob &job, std::shared_ptr<core::types::CancellationToken> cancel);

        void runReprintArchive(const core::model::DispatchJob &job, const core::types::CancellationToken &cancel);

        void runPrintLibraryFile(const core::model::DispatchJob &job, const core::types::CancellationToken &cancel);

        /**
         * @brief Upload, register and start steps shared by both job kinds
         */
        void deliver(const core::model::DispatchJob &job, const core::model::PrinterRecord &printer,
                     const std::string &localPath, const std::string &sourceFilename, int archiveId,
                     const core::types::CancellationToken &cancel);

        void setActiveMessage(const core::model::DispatchJob &job, const std::string &message);

        void setUploadProgress(const core::model::DispatchJob &job, uint64_t sent, uint64_t total);

        void markFinished(const core::model::DispatchJob &job, bool failed, const std::string &message);

        void markCancelled(const core::model::DispatchJob &job, const std::string &message);

        void resetBatchIfIdleLocked();

        nlohmann::json buildStateLocked(const std::optional<nlohmann::json> &recentEvent) const;

        core::events::DispatchEvent makeEventLocked(core::events::EventType type, const core::model::DispatchJob &job,
                                                    const std::string &status, const std::string &message) const;

        void publish(const core::events::DispatchEvent &event);

        void joinFinishedWorkers();
    };
} // namespace dispatch
