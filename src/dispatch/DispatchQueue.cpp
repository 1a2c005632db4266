//
// Created by Andrea on 18/10/2025.
//

#include "dispatch/DispatchQueue.hpp"
#include "core/print/PlateResolver.hpp"
#include "core/print/RemoteFilename.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace dispatch {
    using core::events::DispatchEvent;
    using core::events::EventType;
    using core::model::DispatchJob;
    using core::model::DispatchKind;
    using core::types::CancelledDirtyError;
    using core::types::CancelledError;
    using core::types::CancellationToken;
    using core::types::FleetException;
    using core::types::NotFoundError;

    namespace {
        const std::string UPLOAD_FAILED =
                "Failed to upload file to printer. Check if SD card is inserted and properly formatted (FAT32/exFAT).";

        void throwIfCancelled(const DispatchJob &job, const CancellationToken &cancel) {
            if (cancel.isCancelled()) {
                throw CancelledError("Dispatch job " + std::to_string(job.id) + " cancelled");
            }
        }

        std::string jobTag(const DispatchJob &job) {
            return "Dispatch job " + std::to_string(job.id);
        }
    }

    nlohmann::json CancelResult::toJson() const {
        nlohmann::json json{{"cancelled", cancelled}};
        if (reason) {
            json["reason"] = *reason;
            return json;
        }
        json["pending"] = pending;
        json["job_id"] = jobId ? nlohmann::json(*jobId) : nlohmann::json(nullptr);
        json["source_name"] = sourceName;
        json["printer_id"] = printerId;
        json["printer_name"] = printerName;
        return json;
    }

    DispatchQueue::DispatchQueue(core::persistence::Repository &repository, core::device::DeviceControl &devices,
                                 core::print::PrintJobLauncher &launcher, core::events::EventSink &events,
                                 core::config::DispatchConfig config)
        : repository_(repository), devices_(devices), launcher_(launcher), events_(events), config_(config) {
    }

    DispatchQueue::~DispatchQueue() {
        stop();
    }

    // ==================== Lifecycle ====================

    void DispatchQueue::start() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (running_) {
            Logger::logWarning("[DispatchQueue] Already running");
            return;
        }

        // A crashed dispatcher leaves its thread behind
        if (dispatcherThread_.joinable()) {
            dispatcherThread_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        jobPending_ = !queued_.empty();
        running_ = true;
        dispatcherThread_ = std::thread([this]() {
            try {
                dispatcherLoop();
            } catch (const std::exception &e) {
                Logger::logError("[DispatchQueue] Dispatcher thread crashed: " + std::string(e.what()));
                running_ = false;
            }
        });
        Logger::logInfo("[DispatchQueue] Dispatcher started");
    }

    void DispatchQueue::stop() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            for (auto &entry: active_) {
                entry.second.cancel->cancel();
            }
            active_.clear();
            queued_.clear();
            batch_ = BatchCounters{};
            jobPending_ = true;
        }
        jobSignal_.notify_all();
        idleSignal_.notify_all();

        if (dispatcherThread_.joinable()) {
            dispatcherThread_.join();
        }

        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &worker: workers_) {
                threads.push_back(std::move(worker.second));
            }
            workers_.clear();
            finishedWorkers_.clear();
        }
        for (auto &thread: threads) {
            if (thread.joinable()) thread.join();
        }

        if (running_.exchange(false)) {
            Logger::logInfo("[DispatchQueue] Dispatcher stopped");
        }
    }

    // ==================== Enqueue / cancel ====================

    EnqueueResult DispatchQueue::enqueue(DispatchJob job) {
        // Telemetry is read outside the table lock
        const auto status = devices_.getStatus(job.printerId);

        DispatchEvent event(EventType::DISPATCH_QUEUED, job.printerId);
        EnqueueResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            const bool queuedForPrinter = std::any_of(queued_.begin(), queued_.end(), [&](const DispatchJob &queued) {
                return queued.printerId == job.printerId;
            });
            const bool activeForPrinter = std::any_of(active_.begin(), active_.end(), [&](const auto &active) {
                return active.second.job.printerId == job.printerId;
            });
            if (queuedForPrinter || activeForPrinter) {
                throw DispatchRejected("Printer " + job.printerName + " already has a background dispatch in progress");
            }
            if (status && status->isBusyPrinting()) {
                throw DispatchRejected("Printer " + job.printerName + " is currently busy printing");
            }

            result.position = static_cast<int>(queued_.size() + active_.size()) + 1;
            job.id = nextJobId_++;
            result.jobId = job.id;
            batch_.total++;
            queued_.push_back(job);
            jobPending_ = true;

            event = makeEventLocked(EventType::DISPATCH_QUEUED, job, "dispatched", "Dispatched to " + job.printerName);
        }
        jobSignal_.notify_all();

        Logger::logInfo("[DispatchQueue] Queued " + jobTag(job) + " (" + core::model::dispatchKindToString(job.kind) +
                        " " + job.sourceName + " -> " + job.printerName + ") at position " +
                        std::to_string(result.position));
        publish(event);
        return result;
    }

    EnqueueResult DispatchQueue::dispatchReprintArchive(int archiveId, const std::string &archiveName, int printerId,
                                                        const std::string &printerName,
                                                        const core::model::DispatchOptions &options,
                                                        std::optional<int> requesterId,
                                                        std::optional<std::string> requesterName) {
        DispatchJob job;
        job.kind = DispatchKind::ReprintArchive;
        job.sourceId = archiveId;
        job.sourceName = archiveName;
        job.printerId = printerId;
        job.printerName = printerName;
        job.options = options;
        job.requesterId = requesterId;
        job.requesterName = std::move(requesterName);
        return enqueue(std::move(job));
    }

    EnqueueResult DispatchQueue::dispatchPrintLibraryFile(int fileId, const std::string &filename, int printerId,
                                                          const std::string &printerName,
                                                          const core::model::DispatchOptions &options,
                                                          std::optional<int> requesterId,
                                                          std::optional<std::string> requesterName) {
        DispatchJob job;
        job.kind = DispatchKind::PrintLibraryFile;
        job.sourceId = fileId;
        job.sourceName = filename;
        job.printerId = printerId;
        job.printerName = printerName;
        job.options = options;
        job.requesterId = requesterId;
        job.requesterName = std::move(requesterName);
        return enqueue(std::move(job));
    }

    CancelResult DispatchQueue::cancel(int jobId) {
        CancelResult result;
        std::optional<DispatchEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto active = active_.find(jobId);
            if (active != active_.end()) {
                const auto &job = active->second.job;
                result.cancelled = true;
                result.pending = true;
                result.jobId = job.id;
                result.sourceName = job.sourceName;
                result.printerId = job.printerId;
                result.printerName = job.printerName;

                // Repeated requests only confirm the pending cancellation
                if (active->second.cancel->cancel()) {
                    Logger::logInfo("[DispatchQueue] Cancel requested for active " + jobTag(job));
                    event = makeEventLocked(EventType::DISPATCH_CANCELLING, job, "cancelling",
                                            "Cancelling current dispatch...");
                }
            } else {
                auto queued = std::find_if(queued_.begin(), queued_.end(), [jobId](const DispatchJob &job) {
                    return job.id == jobId;
                });
                if (queued == queued_.end()) {
                    Logger::logInfo("[DispatchQueue] Cancel requested for unknown dispatch job " +
                                    std::to_string(jobId));
                    result.reason = "not_found";
                    return result;
                }

                const DispatchJob job = *queued;
                queued_.erase(queued);
                batch_.total = std::max(0, batch_.total - 1);
                if (batch_.total == 0) resetBatchIfIdleLocked();

                result.cancelled = true;
                result.pending = false;
                result.jobId = job.id;
                result.sourceName = job.sourceName;
                result.printerId = job.printerId;
                result.printerName = job.printerName;

                Logger::logInfo("[DispatchQueue] Cancelled queued " + jobTag(job));
                event = makeEventLocked(EventType::DISPATCH_CANCELLED, job, "cancelled", "Cancelled from queue");
            }
        }
        idleSignal_.notify_all();

        if (event) publish(*event);
        return result;
    }

    // ==================== Dispatcher ====================

    void DispatchQueue::dispatcherLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            jobSignal_.wait(lock, [this]() { return jobPending_ || stopping_; });
            if (stopping_) break;
            jobPending_ = false;

            lock.unlock();
            joinFinishedWorkers();
            lock.lock();

            while (!stopping_) {
                std::set<int> busyPrinters;
                for (const auto &active: active_) {
                    busyPrinters.insert(active.second.job.printerId);
                }

                auto next = std::find_if(queued_.begin(), queued_.end(), [&](const DispatchJob &job) {
                    return busyPrinters.count(job.printerId) == 0;
                });
                if (next == queued_.end()) break;

                const DispatchJob job = *next;
                queued_.erase(next);

                auto token = std::make_shared<CancellationToken>();
                active_[job.id] = ActiveJob{job, "Preparing background dispatch...", std::nullopt, std::nullopt, token};
                liveWorkers_++;
                std::thread worker;
                try {
                    // The worker blocks on the table lock until this iteration releases it
                    worker = std::thread([this, job, token]() { runJob(job, token); });
                } catch (const std::system_error &e) {
                    active_.erase(job.id);
                    liveWorkers_--;
                    batch_.failed++;
                    Logger::logError("[DispatchQueue] " + jobTag(job) + ": could not start worker: " + e.what());

                    const auto event = makeEventLocked(EventType::DISPATCH_FAILED, job, "failed",
                                                       std::string("Could not start dispatch: ") + e.what());
                    resetBatchIfIdleLocked();
                    lock.unlock();
                    idleSignal_.notify_all();
                    publish(event);
                    lock.lock();
                    continue;
                }
                workers_[job.id] = std::move(worker);

                const auto event = makeEventLocked(EventType::DISPATCH_STARTED, job, "processing",
                                                   "Preparing background dispatch...");
                lock.unlock();
                publish(event);
                lock.lock();
            }
        }
    }

    void DispatchQueue::joinFinishedWorkers() {
        std::vector<std::thread> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int jobId: finishedWorkers_) {
                auto it = workers_.find(jobId);
                if (it == workers_.end()) continue;
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
            finishedWorkers_.clear();
        }
        for (auto &thread: done) {
            if (thread.joinable()) thread.join();
        }
    }

    // ==================== Execution ====================

    void DispatchQueue::runJob(const DispatchJob &job, std::shared_ptr<CancellationToken> cancel) {
        try {
            if (job.kind == DispatchKind::ReprintArchive) {
                runReprintArchive(job, *cancel);
            } else {
                runPrintLibraryFile(job, *cancel);
            }
            markFinished(job, false, "Background dispatch complete");
        } catch (const CancelledDirtyError &e) {
            Logger::logWarning("[DispatchQueue] " + jobTag(job) + ": " + e.what());
            markCancelled(job, std::string("Cancelled during dispatch. ") + e.what());
        } catch (const CancelledError &) {
            markCancelled(job, "Cancelled during dispatch");
        } catch (const std::exception &e) {
            Logger::logError("[DispatchQueue] " + jobTag(job) + " failed: " + e.what());
            markFinished(job, true, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            finishedWorkers_.push_back(job.id);
            liveWorkers_--;
            jobPending_ = true;
        }
        jobSignal_.notify_all();
        idleSignal_.notify_all();
    }

    void DispatchQueue::runReprintArchive(const DispatchJob &job, const CancellationToken &cancel) {
        auto archive = repository_.getArchive(job.sourceId);
        if (!archive) throw NotFoundError("Archive not found");

        auto printer = repository_.getPrinter(job.printerId);
        if (!printer) throw NotFoundError("Printer not found");

        if (!devices_.isConnected(job.printerId)) throw FleetException("Printer is not connected");

        const std::string localPath = launcher_.localPathFor(archive->filePath);
        std::error_code ec;
        if (!fs::exists(localPath, ec)) throw NotFoundError("Archive file not found");

        deliver(job, *printer, localPath, archive->filename, archive->id, cancel);
    }

    void DispatchQueue::runPrintLibraryFile(const DispatchJob &job, const CancellationToken &cancel) {
        auto file = repository_.getLibraryFile(job.sourceId);
        if (!file) throw NotFoundError("File not found");

        if (!core::print::isSlicedFile(file->filename)) {
            throw FleetException("Not a sliced file. Only .gcode or .gcode.3mf files can be printed.");
        }

        const std::string localPath = launcher_.localPathFor(file->filePath);
        std::error_code ec;
        if (!fs::exists(localPath, ec)) throw NotFoundError("File not found on disk");

        auto printer = repository_.getPrinter(job.printerId);
        if (!printer) throw NotFoundError("Printer not found");

        if (!devices_.isConnected(job.printerId)) throw FleetException("Printer is not connected");

        setActiveMessage(job, "Creating archive for " + file->filename + "...");
        core::model::ArchiveRecord record;
        record.printerId = job.printerId;
        record.filename = file->filename;
        record.filePath = file->filePath;
        record.printTimeSeconds = file->printTimeSeconds;

        core::model::ArchiveRecord archive;
        try {
            archive = repository_.createArchive(record);
        } catch (const core::types::PersistenceError &e) {
            throw FleetException(std::string("Failed to create archive: ") + e.what());
        }

        try {
            deliver(job, *printer, localPath, file->filename, archive.id, cancel);
        } catch (const std::exception &) {
            // The archive only exists for prints that actually started
            try {
                repository_.deleteArchive(archive.id);
                Logger::logInfo("[DispatchQueue] " + jobTag(job) + ": rolled back archive " +
                                std::to_string(archive.id));
            } catch (const std::exception &e) {
                Logger::logError("[DispatchQueue] " + jobTag(job) + ": could not roll back archive " +
                                 std::to_string(archive.id) + ": " + e.what());
            }
            throw;
        }
    }

    void DispatchQueue::deliver(const DispatchJob &job, const core::model::PrinterRecord &printer,
                                const std::string &localPath, const std::string &sourceFilename, int archiveId,
                                const CancellationToken &cancel) {
        const std::string remoteFilename = core::print::remoteFilenameFor(sourceFilename);
        const std::string remotePath = core::print::remotePathFor(remoteFilename);

        throwIfCancelled(job, cancel);
        setActiveMessage(job, "Preparing upload to " + printer.name + "...");
        launcher_.clearRemote(printer, remotePath);

        throwIfCancelled(job, cancel);
        try {
            setActiveMessage(job, "Uploading " + sourceFilename + " to " + printer.name + "...");

            std::error_code ec;
            const uint64_t totalBytes = fs::file_size(localPath, ec);

            auto lastEmit = std::chrono::steady_clock::time_point{};
            uint64_t lastBytes = 0;
            auto onProgress = [&](uint64_t sent, uint64_t total) {
                // A retry restarts from zero; reported progress never goes back
                if (sent <= lastBytes) return;

                const auto now = std::chrono::steady_clock::now();
                const bool due = sent >= total ||
                                 now - lastEmit >= std::chrono::milliseconds(config_.progressIntervalMs) ||
                                 sent - lastBytes >= config_.progressBytes;
                if (!due) return;

                lastEmit = now;
                lastBytes = sent;
                setUploadProgress(job, sent, total);
            };

            const bool uploaded = launcher_.upload(printer, localPath, remotePath, onProgress, &cancel);
            if (!uploaded) throw FleetException(UPLOAD_FAILED);

            if (totalBytes == 0 || lastBytes < totalBytes) {
                setUploadProgress(job, totalBytes, totalBytes);
            }

            launcher_.registerExpectedPrint(job.printerId, remoteFilename, archiveId);
            const int plateId = core::print::resolvePlateId(localPath, job.options.plateId);

            throwIfCancelled(job, cancel);
            setActiveMessage(job, "Starting print on " + printer.name + "...");
            if (!launcher_.startPrint(job.printerId, remoteFilename, plateId, job.options.amsMapping,
                                      job.options.print)) {
                throw FleetException("Failed to start print");
            }

            if (job.requesterId && job.requesterName) {
                devices_.setCurrentPrintUser(job.printerId, *job.requesterId, *job.requesterName);
            }
        } catch (const CancelledError &) {
            setActiveMessage(job, "Cancelled upload on " + printer.name + ".");
            throw;
        }
    }

    // ==================== State updates ====================

    void DispatchQueue::setActiveMessage(const DispatchJob &job, const std::string &message) {
        std::optional<DispatchEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = active_.find(job.id);
            if (it == active_.end()) return;

            it->second.message = message;
            event = makeEventLocked(EventType::DISPATCH_PROGRESS, job, "processing", message);
        }
        publish(*event);
    }

    void DispatchQueue::setUploadProgress(const DispatchJob &job, uint64_t sent, uint64_t total) {
        std::optional<DispatchEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = active_.find(job.id);
            if (it == active_.end()) return;

            it->second.uploadBytes = sent;
            it->second.uploadTotalBytes = total;
            event = makeEventLocked(EventType::DISPATCH_PROGRESS, job, "processing", it->second.message);
            event->bytesSent = sent;
            event->totalBytes = total;
        }
        publish(*event);
    }

    void DispatchQueue::markFinished(const DispatchJob &job, bool failed, const std::string &message) {
        std::optional<DispatchEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // stop() already dropped the tables
            if (active_.erase(job.id) == 0 && stopping_) return;

            if (failed) {
                batch_.failed++;
            } else {
                batch_.completed++;
            }

            event = makeEventLocked(failed ? EventType::DISPATCH_FAILED : EventType::DISPATCH_COMPLETED, job,
                                    failed ? "failed" : "completed", message);
            resetBatchIfIdleLocked();
        }
        Logger::logInfo("[DispatchQueue] " + jobTag(job) + (failed ? " failed: " : " finished: ") + message);
        publish(*event);
    }

    void DispatchQueue::markCancelled(const DispatchJob &job, const std::string &message) {
        std::optional<DispatchEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (active_.erase(job.id) == 0 && stopping_) return;

            batch_.total = std::max(0, batch_.total - 1);
            if (batch_.total == 0) resetBatchIfIdleLocked();

            event = makeEventLocked(EventType::DISPATCH_CANCELLED, job, "cancelled", message);
        }
        Logger::logInfo("[DispatchQueue] " + jobTag(job) + " cancelled");
        publish(*event);
    }

    void DispatchQueue::resetBatchIfIdleLocked() {
        if (queued_.empty() && active_.empty()) {
            batch_ = BatchCounters{};
        }
    }

    bool DispatchQueue::waitUntilIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idleSignal_.wait_for(lock, timeout, [this]() {
            return queued_.empty() && active_.empty() && liveWorkers_ == 0;
        });
    }

    // ==================== Snapshots ====================

    nlohmann::json DispatchQueue::state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buildStateLocked(std::nullopt);
    }

    nlohmann::json DispatchQueue::buildStateLocked(const std::optional<nlohmann::json> &recentEvent) const {
        nlohmann::json queuedJobs = nlohmann::json::array();
        for (const auto &job: queued_) {
            queuedJobs.push_back({
                {"job_id", job.id},
                {"kind", core::model::dispatchKindToString(job.kind)},
                {"source_id", job.sourceId},
                {"source_name", job.sourceName},
                {"printer_id", job.printerId},
                {"printer_name", job.printerName}
            });
        }

        // std::map keeps active jobs ordered by id
        nlohmann::json activeJobs = nlohmann::json::array();
        for (const auto &entry: active_) {
            const auto &active = entry.second;
            nlohmann::json item{
                {"job_id", active.job.id},
                {"kind", core::model::dispatchKindToString(active.job.kind)},
                {"source_id", active.job.sourceId},
                {"source_name", active.job.sourceName},
                {"printer_id", active.job.printerId},
                {"printer_name", active.job.printerName},
                {"message", active.message}
            };
            item["upload_bytes"] = active.uploadBytes ? nlohmann::json(*active.uploadBytes) : nlohmann::json(nullptr);
            item["upload_total_bytes"] = active.uploadTotalBytes
                                             ? nlohmann::json(*active.uploadTotalBytes)
                                             : nlohmann::json(nullptr);
            if (active.uploadBytes && active.uploadTotalBytes && *active.uploadTotalBytes > 0) {
                double pct = static_cast<double>(*active.uploadBytes) * 100.0 /
                             static_cast<double>(*active.uploadTotalBytes);
                pct = std::max(0.0, std::min(100.0, pct));
                item["upload_progress_pct"] = std::round(pct * 10.0) / 10.0;
            } else {
                item["upload_progress_pct"] = nullptr;
            }
            activeJobs.push_back(item);
        }

        nlohmann::json state{
            {"total", batch_.total},
            {"dispatched", queued_.size()},
            {"processing", active_.size()},
            {"completed", batch_.completed},
            {"failed", batch_.failed},
            {"dispatched_jobs", queuedJobs},
            {"active_jobs", activeJobs}
        };
        state["active_job"] = activeJobs.empty() ? nlohmann::json(nullptr) : activeJobs.front();
        state["recent_event"] = recentEvent ? *recentEvent : nlohmann::json(nullptr);
        return state;
    }

    DispatchEvent DispatchQueue::makeEventLocked(EventType type, const DispatchJob &job, const std::string &status,
                                                 const std::string &message) const {
        DispatchEvent event(type, job.printerId, message);
        event.jobId = job.id;
        event.printerName = job.printerName;
        event.sourceName = job.sourceName;
        event.state = buildStateLocked(nlohmann::json{
            {"status", status},
            {"job_id", job.id},
            {"source_name", job.sourceName},
            {"printer_id", job.printerId},
            {"printer_name", job.printerName},
            {"message", message}
        });
        return event;
    }

    void DispatchQueue::publish(const DispatchEvent &event) {
        try {
            events_.publish(event);
        } catch (const std::exception &e) {
            Logger::logError("[DispatchQueue] Event publication failed: " + std::string(e.what()));
        }
    }
} // namespace dispatch
