//
// Created by Andrea on 18/10/2025.
//

#include "core/print/PrintJobLauncher.hpp"
#include "core/recovery/RetryPolicy.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace core::print {
    using types::AuthFailure;
    using types::CancelledError;

    PrintJobLauncher::PrintJobLauncher(transport::TransportClient &transport, device::DeviceControl &devices,
                                       jobs::ExpectedPrintRegistry &expectedPrints, std::string baseDir)
        : transport_(transport), devices_(devices), expectedPrints_(expectedPrints), baseDir_(std::move(baseDir)) {
    }

    transport::Endpoint PrintJobLauncher::endpointFor(const model::PrinterRecord &printer) {
        return transport::Endpoint{printer.address, printer.accessCode, printer.model};
    }

    std::string PrintJobLauncher::localPathFor(const std::string &filePath) const {
        fs::path path(filePath);
        if (path.is_absolute()) {
            return path.string();
        }
        return (fs::path(baseDir_) / path).string();
    }

    void PrintJobLauncher::clearRemote(const model::PrinterRecord &printer, const std::string &remotePath) {
        try {
            if (transport_.deleteFile(endpointFor(printer), remotePath)) {
                Logger::logDebug("[PrintJobLauncher] Removed stale " + remotePath + " from " + printer.name);
            }
        } catch (const std::exception &e) {
            Logger::logDebug("[PrintJobLauncher] Could not clear " + remotePath + " on " + printer.name + ": " +
                             e.what());
        }
    }

    bool PrintJobLauncher::upload(const model::PrinterRecord &printer, const std::string &localPath,
                                  const std::string &remotePath, const transport::ProgressCallback &onProgress,
                                  const types::CancellationToken *cancel) {
        const auto &config = transport_.config();
        const auto endpoint = endpointFor(printer);

        recovery::RetryConfig retry;
        retry.enabled = config.retryEnabled;
        retry.maxRetries = config.retryCount;
        retry.delay = std::chrono::milliseconds(config.retryDelayMs);
        retry.isNonRetryable = [](const std::exception &e) {
            return dynamic_cast<const CancelledError *>(&e) != nullptr ||
                   dynamic_cast<const AuthFailure *>(&e) != nullptr;
        };

        try {
            return recovery::withRetry([&]() {
                if (cancel && cancel->isCancelled()) {
                    throw CancelledError("Upload of " + remotePath + " cancelled");
                }
                return transport_.uploadFile(endpoint, localPath, remotePath, onProgress, cancel);
            }, retry, "Upload to " + printer.name);
        } catch (const AuthFailure &e) {
            Logger::logError("[PrintJobLauncher] " + printer.name + " rejected the access code: " + e.what());
            return false;
        }
    }

    void PrintJobLauncher::registerExpectedPrint(int printerId, const std::string &remoteFilename, int archiveId) {
        expectedPrints_.registerPrint(printerId, remoteFilename, archiveId);
    }

    bool PrintJobLauncher::startPrint(int printerId, const std::string &remoteFilename, int plateId,
                                      const std::optional<std::vector<int> > &amsMapping,
                                      const model::PrintOptions &options) {
        Logger::logInfo("[PrintJobLauncher] Starting " + remoteFilename + " (plate " + std::to_string(plateId) +
                        ") on printer " + std::to_string(printerId));
        try {
            return devices_.startPrint(printerId, remoteFilename, plateId, amsMapping, options);
        } catch (const std::exception &e) {
            Logger::logError("[PrintJobLauncher] Start command for printer " + std::to_string(printerId) +
                             " failed: " + e.what());
            return false;
        }
    }
} // namespace core::print
