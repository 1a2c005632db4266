//
// Created by Andrea on 18/10/2025.
//

#include "scheduler/PrintScheduler.hpp"
#include "core/print/PlateResolver.hpp"
#include "core/print/RemoteFilename.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include "scheduler/FilamentMatcher.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace scheduler {
    using core::events::DispatchEvent;
    using core::events::EventType;
    using core::model::QueueEntry;
    using core::model::QueueStatus;

    namespace {
        std::string join(const std::vector<std::string> &items, const std::string &separator) {
            std::string result;
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) result += separator;
                result += items[i];
            }
            return result;
        }

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string entryTag(const QueueEntry &entry) {
            return "Queue entry " + std::to_string(entry.id);
        }
    }

    PrintScheduler::PrintScheduler(core::persistence::Repository &repository, core::device::DeviceControl &devices,
                                   core::device::PowerControl &power, core::print::PrintJobLauncher &launcher,
                                   core::events::EventSink &events, core::config::SchedulerConfig config)
        : repository_(repository), devices_(devices), power_(power), launcher_(launcher), events_(events),
          config_(config) {
    }

    PrintScheduler::~PrintScheduler() {
        stop();
    }

    void PrintScheduler::start() {
        if (running_) {
            Logger::logWarning("[PrintScheduler] Already running");
            return;
        }

        running_ = true;
        stopping_ = false;
        loopThread_ = std::thread([this]() { loop(); });
        Logger::logInfo("[PrintScheduler] Started (poll every " + std::to_string(config_.pollIntervalMs) + "ms)");
    }

    void PrintScheduler::stop() {
        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            stopping_ = true;
        }
        waitCondition_.notify_all();

        if (loopThread_.joinable()) {
            loopThread_.join();
        }
        waitForBackgroundTasks();

        if (running_.exchange(false)) {
            Logger::logInfo("[PrintScheduler] Stopped");
        }
    }

    void PrintScheduler::loop() {
        while (!stopping_) {
            try {
                checkQueue();
            } catch (const std::exception &e) {
                Logger::logError("[PrintScheduler] Scheduling cycle aborted: " + std::string(e.what()));
            }

            if (!waitFor(std::chrono::milliseconds(config_.pollIntervalMs))) break;
        }
    }

    bool PrintScheduler::waitFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(waitMutex_);
        return !waitCondition_.wait_for(lock, duration, [this]() { return stopping_.load(); });
    }

    void PrintScheduler::waitForBackgroundTasks() {
        std::vector<std::future<void> > tasks;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            tasks.swap(backgroundTasks_);
        }
        for (auto &task: tasks) {
            if (task.valid()) task.get();
        }
    }

    void PrintScheduler::publish(DispatchEvent event) {
        try {
            events_.publish(event);
        } catch (const std::exception &e) {
            Logger::logError("[PrintScheduler] Event publication failed: " + std::string(e.what()));
        }
    }

    void PrintScheduler::checkQueue() {
        const auto entries = repository_.getPendingEntries();
        if (entries.empty()) return;

        const auto now = std::chrono::system_clock::now();
        // Printers that already had their turn this cycle
        std::set<int> considered;

        for (auto entry: entries) {
            if (stopping_) break;

            try {
                if (entry.scheduledTime && *entry.scheduledTime > now) continue;
                if (entry.manualStart) continue;

                if (entry.printerId) {
                    const int printerId = *entry.printerId;
                    if (considered.count(printerId)) continue;

                    if (!devices_.isConnected(printerId)) {
                        auto plug = repository_.getSmartPlugForPrinter(printerId);
                        if (!plug || !plug->enabled || !plug->autoOn) {
                            considered.insert(printerId);
                            continue;
                        }

                        Logger::logInfo("[PrintScheduler] Printer " + std::to_string(printerId) +
                                        " offline, powering on via smart plug " + plug->name);
                        if (!powerOnAndWait(*plug, printerId)) {
                            Logger::logWarning("[PrintScheduler] Could not power on printer " +
                                               std::to_string(printerId));
                            considered.insert(printerId);
                            continue;
                        }
                    }

                    if (!isPrinterIdle(printerId)) {
                        considered.insert(printerId);
                        continue;
                    }

                    if (entry.requirePreviousSuccess && !previousPrintSucceeded(printerId, entry.id)) {
                        skipEntry(entry, printerId);
                        continue;
                    }

                    startEntry(entry);
                    considered.insert(printerId);
                } else if (entry.targetModel) {
                    const auto match = findIdlePrinterForModel(*entry.targetModel, considered,
                                                               entry.requiredFilamentTypes, entry.targetLocation);

                    if (entry.waitingReason != match.waitingReason) {
                        const bool wasWaiting = entry.waitingReason.has_value();
                        entry.waitingReason = match.waitingReason;
                        repository_.updateEntry(entry);

                        if (match.waitingReason && !wasWaiting) {
                            DispatchEvent event(EventType::QUEUE_ENTRY_WAITING, 0, *match.waitingReason);
                            event.queueEntryId = entry.id;
                            publish(event);
                        }
                    }

                    if (!match.printerId) continue;
                    const int printerId = *match.printerId;

                    if (entry.requirePreviousSuccess && !previousPrintSucceeded(printerId, entry.id)) {
                        skipEntry(entry, printerId);
                        continue;
                    }

                    entry.printerId = printerId;
                    entry.waitingReason.reset();
                    Logger::logInfo("[PrintScheduler] " + entryTag(entry) + " (model " + *entry.targetModel +
                                    ") assigned to printer " + std::to_string(printerId));

                    startEntry(entry);
                    considered.insert(printerId);
                }
            } catch (const core::types::PersistenceError &) {
                throw;
            } catch (const std::exception &e) {
                // One broken entry must not hold up the rest of the queue
                Logger::logError("[PrintScheduler] " + entryTag(entry) + " failed: " + e.what());
                if (entry.printerId) {
                    considered.insert(*entry.printerId);
                    auto printer = repository_.getPrinter(*entry.printerId);
                    failEntry(entry, e.what(), printer ? printer->name : "Unknown");
                }
            }
        }
    }

    bool PrintScheduler::isPrinterIdle(int printerId) const {
        if (!devices_.isConnected(printerId)) return false;

        auto status = devices_.getStatus(printerId);
        if (!status) return false;

        // A finished or failed job still occupies the plate until someone clears it
        return status->state == "IDLE" ||
               ((status->state == "FINISH" || status->state == "FAILED") && devices_.isPlateCleared(printerId));
    }

    bool PrintScheduler::powerOnAndWait(const core::model::SmartPlugRecord &plug, int printerId) {
        const auto status = power_.getStatus(plug);
        if (!status.reachable) {
            Logger::logWarning("[PrintScheduler] Smart plug " + plug.name + " is not reachable");
            return false;
        }

        if (status.state != "ON") {
            if (!power_.turnOn(plug)) {
                Logger::logWarning("[PrintScheduler] Failed to turn on smart plug " + plug.name);
                return false;
            }
            Logger::logInfo("[PrintScheduler] Powered on smart plug " + plug.name + " for printer " +
                            std::to_string(printerId));
            publish(DispatchEvent(EventType::PRINTER_POWERED_ON, printerId, "Powered on via " + plug.name));
        }

        auto printer = repository_.getPrinter(printerId);
        if (!printer) {
            Logger::logError("[PrintScheduler] Printer " + std::to_string(printerId) + " not found");
            return false;
        }

        Logger::logInfo("[PrintScheduler] Waiting " + std::to_string(config_.powerOnSettleMs) + "ms for " +
                        printer->name + " to boot...");
        if (!waitFor(std::chrono::milliseconds(config_.powerOnSettleMs))) return false;

        int elapsedMs = config_.powerOnSettleMs;
        while (elapsedMs < config_.powerOnTimeoutMs) {
            try {
                if (devices_.connect(*printer)) {
                    Logger::logInfo("[PrintScheduler] " + printer->name + " connected after " +
                                    std::to_string(elapsedMs) + "ms");
                    // Let the first status reports arrive
                    return waitFor(std::chrono::milliseconds(config_.stabiliseDelayMs));
                }
            } catch (const std::exception &e) {
                Logger::logDebug("[PrintScheduler] Connection attempt to " + printer->name + " failed: " + e.what());
            }

            if (!waitFor(std::chrono::milliseconds(config_.powerOnCheckIntervalMs))) return false;
            elapsedMs += config_.powerOnCheckIntervalMs;
        }

        Logger::logWarning("[PrintScheduler] " + printer->name + " did not connect within " +
                           std::to_string(config_.powerOnTimeoutMs) + "ms after power on");
        return false;
    }

    bool PrintScheduler::previousPrintSucceeded(int printerId, int entryId) {
        auto previous = repository_.getLastTerminalEntry(printerId, entryId);
        if (!previous) return true;
        return previous->status == QueueStatus::Completed;
    }

    void PrintScheduler::skipEntry(QueueEntry &entry, int printerId) {
        entry.status = QueueStatus::Skipped;
        entry.errorMessage = SKIPPED_PREVIOUS_FAILED;
        entry.completedAt = std::chrono::system_clock::now();
        repository_.updateEntry(entry);
        Logger::logInfo("[PrintScheduler] Skipped " + entryTag(entry) + ": previous print failed");

        auto printer = repository_.getPrinter(printerId);
        DispatchEvent event(EventType::QUEUE_ENTRY_SKIPPED, printerId, SKIPPED_PREVIOUS_FAILED);
        event.queueEntryId = entry.id;
        event.printerName = printer ? printer->name : "Unknown";
        publish(event);
    }

    PrintScheduler::PoolMatch PrintScheduler::findIdlePrinterForModel(
        const std::string &model, const std::set<int> &considered, const std::vector<std::string> &requiredTypes,
        const std::optional<std::string> &location) {
        std::vector<core::model::PrinterRecord> printers;
        for (auto &printer: repository_.getPrintersByModel(model)) {
            if (!printer.active || toLower(printer.model) != toLower(model)) continue;
            if (location && printer.location != location) continue;
            printers.push_back(std::move(printer));
        }

        const std::string locationSuffix = location ? " in " + *location : "";
        if (printers.empty()) {
            return {std::nullopt, "No active " + model + " printers" + locationSuffix + " configured"};
        }

        std::vector<std::string> busy;
        std::vector<std::string> offline;
        std::vector<std::string> missingFilament;

        for (const auto &printer: printers) {
            if (considered.count(printer.id)) {
                busy.push_back(printer.name);
                continue;
            }
            if (!devices_.isConnected(printer.id)) {
                offline.push_back(printer.name);
                continue;
            }
            if (!isPrinterIdle(printer.id)) {
                busy.push_back(printer.name);
                continue;
            }

            if (!requiredTypes.empty()) {
                const auto missing = FilamentMatcher::missingTypes(requiredTypes, devices_.getStatus(printer.id));
                if (!missing.empty()) {
                    Logger::logDebug("[PrintScheduler] Skipping " + printer.name + ", missing filaments: " +
                                     join(missing, ", "));
                    missingFilament.push_back(printer.name + " (needs " + join(missing, ", ") + ")");
                    continue;
                }
            }

            return {printer.id, std::nullopt};
        }

        std::vector<std::string> reasons;
        if (!missingFilament.empty()) reasons.push_back("Waiting for filament: " + join(missingFilament, "; "));
        if (!busy.empty()) reasons.push_back("Busy: " + join(busy, ", "));
        if (!offline.empty()) reasons.push_back("Offline: " + join(offline, ", "));

        if (reasons.empty()) {
            return {std::nullopt, "No available " + model + " printers" + locationSuffix};
        }
        return {std::nullopt, join(reasons, " | ")};
    }

    std::optional<std::vector<int> > PrintScheduler::resolveAmsMapping(QueueEntry &entry, int printerId) {
        if (entry.amsMapping) {
            try {
                return entry.amsMapping->get<std::vector<int> >();
            } catch (const nlohmann::json::exception &e) {
                Logger::logWarning("[PrintScheduler] " + entryTag(entry) + ": invalid AMS mapping ignored (" +
                                   e.what() + ")");
                return std::nullopt;
            }
        }

        if (!entry.requiredSlots) return std::nullopt;

        auto status = devices_.getStatus(printerId);
        if (!status) {
            Logger::logWarning("[PrintScheduler] Cannot compute AMS mapping: no status for printer " +
                               std::to_string(printerId));
            return std::nullopt;
        }

        const auto required = FilamentMatcher::parseRequirements(*entry.requiredSlots);
        const auto loaded = FilamentMatcher::loadedFilaments(*status);
        if (required.empty() || loaded.empty()) return std::nullopt;

        auto mapping = FilamentMatcher::match(required, loaded);
        if (mapping.empty()) return std::nullopt;

        entry.amsMapping = nlohmann::json(mapping);
        Logger::logInfo("[PrintScheduler] " + entryTag(entry) + ": computed AMS mapping " + entry.amsMapping->dump() +
                        " for printer " + std::to_string(printerId));
        return mapping;
    }

    void PrintScheduler::startEntry(QueueEntry &entry) {
        const int printerId = *entry.printerId;
        Logger::logInfo("[PrintScheduler] Starting " + entryTag(entry));

        auto printer = repository_.getPrinter(printerId);
        if (!printer) {
            failEntry(entry, "Printer not found", "Unknown");
            return;
        }
        if (!devices_.isConnected(printerId)) {
            failEntry(entry, "Printer not connected", printer->name);
            return;
        }

        std::string localPath;
        std::string filename;
        std::optional<int> archiveId;

        if (entry.archiveId) {
            auto archive = repository_.getArchive(*entry.archiveId);
            if (!archive) {
                failEntry(entry, "Archive not found", printer->name);
                return;
            }
            localPath = launcher_.localPathFor(archive->filePath);
            filename = archive->filename;
            archiveId = archive->id;
        } else if (entry.libraryFileId) {
            auto file = repository_.getLibraryFile(*entry.libraryFileId);
            if (!file) {
                failEntry(entry, "Library file not found", printer->name);
                return;
            }
            localPath = launcher_.localPathFor(file->filePath);
            filename = file->filename;
        } else {
            failEntry(entry, "No source file specified", printer->name);
            return;
        }

        std::error_code ec;
        if (!fs::exists(localPath, ec)) {
            Logger::logError("[PrintScheduler] " + entryTag(entry) + ": file not found: " + localPath);
            failEntry(entry, "Source file not found on disk", printer->name);
            return;
        }

        const std::string remoteFilename = core::print::remoteFilenameFor(filename);
        const std::string remotePath = core::print::remotePathFor(remoteFilename);

        Logger::logInfo("[PrintScheduler] " + entryTag(entry) + ": uploading " + localPath + " to " + printer->name +
                        " (" + printer->model + ", " + printer->address + ") as " + remoteFilename);
        launcher_.clearRemote(*printer, remotePath);

        bool uploaded = false;
        try {
            uploaded = launcher_.upload(*printer, localPath, remotePath);
        } catch (const core::types::FleetException &e) {
            Logger::logError("[PrintScheduler] " + entryTag(entry) + ": upload error: " + e.what());
        }
        if (!uploaded) {
            failEntry(entry, UPLOAD_FAILED, printer->name);
            return;
        }

        if (archiveId) {
            launcher_.registerExpectedPrint(printerId, remoteFilename, *archiveId);
        }

        const auto mapping = resolveAmsMapping(entry, printerId);

        // Persisted before the start command: after a crash the entry must not be printed twice
        entry.status = QueueStatus::Printing;
        entry.startedAt = std::chrono::system_clock::now();
        repository_.updateEntry(entry);

        devices_.consumePlateCleared(printerId);
        const int plateId = entry.plateId.value_or(core::print::DEFAULT_PLATE_ID);

        if (!launcher_.startPrint(printerId, remoteFilename, plateId, mapping, entry.options)) {
            Logger::logError("[PrintScheduler] " + entryTag(entry) + ": start command rejected by " + printer->name);
            failEntry(entry, START_FAILED, printer->name);
            return;
        }

        Logger::logInfo("[PrintScheduler] " + entryTag(entry) + ": print started - " + filename);
        DispatchEvent event(EventType::QUEUE_ENTRY_STARTED, printerId,
                            "Started " + core::print::displayNameFor(filename));
        event.queueEntryId = entry.id;
        event.printerName = printer->name;
        event.sourceName = filename;
        publish(event);
    }

    void PrintScheduler::failEntry(QueueEntry &entry, const std::string &message, const std::string &printerName) {
        entry.status = QueueStatus::Failed;
        entry.errorMessage = message;
        entry.completedAt = std::chrono::system_clock::now();
        repository_.updateEntry(entry);
        Logger::logError("[PrintScheduler] " + entryTag(entry) + " failed: " + message);

        DispatchEvent event(EventType::QUEUE_ENTRY_FAILED, entry.printerId.value_or(0), message);
        event.queueEntryId = entry.id;
        event.printerName = printerName;
        publish(event);

        powerOffIfNeeded(entry);
    }

    void PrintScheduler::powerOffIfNeeded(const QueueEntry &entry) {
        if (!entry.autoOffAfter || !entry.printerId) return;

        const int printerId = *entry.printerId;
        auto plug = repository_.getSmartPlugForPrinter(printerId);
        if (!plug || !plug->enabled) return;

        const auto target = config_.cooldownTargetTemp;
        const auto timeout = std::chrono::milliseconds(config_.cooldownTimeoutMs);
        auto task = std::async(std::launch::async, [this, printerId, plug = *plug, target, timeout]() {
            try {
                Logger::logInfo("[PrintScheduler] Auto-off: waiting for printer " + std::to_string(printerId) +
                                " to cool down");
                if (!devices_.waitForCooldown(printerId, target, timeout)) {
                    Logger::logWarning("[PrintScheduler] Auto-off: printer " + std::to_string(printerId) +
                                       " still hot after timeout");
                }
                if (stopping_) return;

                Logger::logInfo("[PrintScheduler] Auto-off: powering off printer " + std::to_string(printerId));
                if (power_.turnOff(plug)) {
                    publish(DispatchEvent(EventType::PRINTER_POWERED_OFF, printerId, "Powered off via " + plug.name));
                } else {
                    Logger::logWarning("[PrintScheduler] Auto-off: failed to turn off " + plug.name);
                }
            } catch (const std::exception &e) {
                Logger::logError("[PrintScheduler] Auto-off for printer " + std::to_string(printerId) + " failed: " +
                                 e.what());
            }
        });

        std::lock_guard<std::mutex> lock(tasksMutex_);
        backgroundTasks_.erase(std::remove_if(backgroundTasks_.begin(), backgroundTasks_.end(),
                                              [](std::future<void> &pending) {
                                                  return pending.wait_for(std::chrono::seconds(0)) ==
                                                         std::future_status::ready;
                                              }),
                               backgroundTasks_.end());
        backgroundTasks_.push_back(std::move(task));
    }
} // namespace scheduler
