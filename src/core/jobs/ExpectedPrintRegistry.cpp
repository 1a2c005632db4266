//
// Created by Andrea on 18/10/2025.
//

#include "core/jobs/ExpectedPrintRegistry.hpp"
#include "logger/Logger.hpp"

namespace core::jobs {
    std::vector<std::string> ExpectedPrintRegistry::filenameVariants(const std::string &remoteFilename) {
        std::vector<std::string> variants{remoteFilename};
        const std::string suffix = ".3mf";
        if (remoteFilename.size() > suffix.size() &&
            remoteFilename.compare(remoteFilename.size() - suffix.size(), suffix.size(), suffix) == 0) {
            const std::string base = remoteFilename.substr(0, remoteFilename.size() - suffix.size());
            variants.push_back(base);
            variants.push_back(base + ".gcode");
        }
        return variants;
    }

    std::string ExpectedPrintRegistry::keyFor(int printerId, const std::string &filename) {
        return std::to_string(printerId) + ":" + filename;
    }

    void ExpectedPrintRegistry::registerPrint(int printerId, const std::string &remoteFilename, int archiveId) {
        std::lock_guard<std::mutex> lock(mutex_);

        ExpectedPrint info;
        info.printerId = printerId;
        info.archiveId = archiveId;
        info.remoteFilename = remoteFilename;
        info.registeredAt = std::chrono::steady_clock::now();

        for (const auto &variant: filenameVariants(remoteFilename)) {
            expected_[keyFor(printerId, variant)] = info;
        }

        Logger::logInfo("[ExpectedPrintRegistry] Registered expected print for printer " + std::to_string(printerId) +
                        ": " + remoteFilename + " (archive " + std::to_string(archiveId) + ")");
    }

    std::optional<ExpectedPrint> ExpectedPrintRegistry::consume(int printerId, const std::string &reportedFilename) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = expected_.find(keyFor(printerId, reportedFilename));
        if (it == expected_.end()) return std::nullopt;

        ExpectedPrint info = it->second;
        for (const auto &variant: filenameVariants(info.remoteFilename)) {
            expected_.erase(keyFor(printerId, variant));
        }

        Logger::logDebug("[ExpectedPrintRegistry] Printer " + std::to_string(printerId) + " started " +
                         reportedFilename + " -> archive " + std::to_string(info.archiveId));
        return info;
    }

    std::optional<ExpectedPrint> ExpectedPrintRegistry::find(int printerId, const std::string &reportedFilename) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = expected_.find(keyFor(printerId, reportedFilename));
        return (it != expected_.end()) ? std::optional<ExpectedPrint>(it->second) : std::nullopt;
    }

    size_t ExpectedPrintRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return expected_.size();
    }
} // namespace core::jobs
