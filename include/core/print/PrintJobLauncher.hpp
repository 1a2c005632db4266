//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/device/DeviceControl.hpp"
#include "core/jobs/ExpectedPrintRegistry.hpp"
#include "core/model/PrintOptions.hpp"
#include "core/model/Records.hpp"
#include "core/types/CancellationToken.hpp"
#include "transport/TransportClient.hpp"

namespace core::print {
    /**
     * @brief Upload, register and start sequence shared by the scheduler and the dispatch queue
     *
     * The steps are separate calls so each caller can put its own checkpoints (cancellation,
     * persisting the entry) between them.
     */
    class PrintJobLauncher {
    public:
        PrintJobLauncher(transport::TransportClient &transport, device::DeviceControl &devices,
                         jobs::ExpectedPrintRegistry &expectedPrints, std::string baseDir);

        static transport::Endpoint endpointFor(const model::PrinterRecord &printer);

        // Absolute paths are kept, relative ones are resolved against the storage directory
        std::string localPathFor(const std::string &filePath) const;

        /**
         * @brief Removes a previous copy of the file from the printer, failures are only logged
         */
        void clearRemote(const model::PrinterRecord &printer, const std::string &remotePath);

        /**
         * @brief Uploads with the configured retry policy
         * @return false when every attempt failed or the access code was rejected
         * @throws core::types::CancelledError when the token fired during the transfer
         */
        bool upload(const model::PrinterRecord &printer, const std::string &localPath, const std::string &remotePath,
                    const transport::ProgressCallback &onProgress = {},
                    const types::CancellationToken *cancel = nullptr);

        void registerExpectedPrint(int printerId, const std::string &remoteFilename, int archiveId);

        bool startPrint(int printerId, const std::string &remoteFilename, int plateId,
                        const std::optional<std::vector<int> > &amsMapping, const model::PrintOptions &options);

    private:
        transport::TransportClient &transport_;
        device::DeviceControl &devices_;
        jobs::ExpectedPrintRegistry &expectedPrints_;
        std::string baseDir_;
    };
} // namespace core::print
