//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "application/config/ConfigManager.hpp"
#include "core/types/CancellationToken.hpp"
#include "transport/ConnectionModeCache.hpp"
#include "transport/FileEntry.hpp"
#include "transport/FtpClient.hpp"
#include "transport/FtpSession.hpp"

namespace transport {
    /**
     * @brief Printer file transfer over implicit FTPS, one short-lived connection per call
     *
     * The data-channel mode is taken from the cache when known. Otherwise the protected mode
     * is tried first and, for models listed in TransportConfig::clearDataModels, a failed
     * operation is repeated once with a clear data channel. The mode that worked is cached.
     *
     * Failure reporting:
     *  - listFiles and storageInfo never throw (empty list / nullopt)
     *  - other calls return false / nullopt for transport failures, but let
     *    CancelledError, AuthFailure and TimeoutException propagate
     */
    class TransportClient {
    public:
        TransportClient(ConnectionModeCache &modeCache, core::config::TransportConfig config,
                        SessionFactory factory = {});

        std::vector<FileEntry> listFiles(const Endpoint &endpoint, const std::string &path);

        bool uploadFile(const Endpoint &endpoint, const std::string &localPath, const std::string &remotePath,
                        const ProgressCallback &onProgress = {},
                        const core::types::CancellationToken *cancel = nullptr);

        bool uploadBytes(const Endpoint &endpoint, const std::string &data, const std::string &remotePath);

        std::optional<std::string> downloadFile(const Endpoint &endpoint, const std::string &remotePath);

        bool downloadToFile(const Endpoint &endpoint, const std::string &remotePath, const std::string &localPath);

        /**
         * @brief Tries each candidate path in order on a single connection
         */
        bool downloadFirstOf(const Endpoint &endpoint, const std::vector<std::string> &remotePaths,
                             const std::string &localPath);

        bool deleteFile(const Endpoint &endpoint, const std::string &remotePath);

        std::optional<uint64_t> fileSize(const Endpoint &endpoint, const std::string &remotePath);

        std::optional<StorageInfo> storageInfo(const Endpoint &endpoint);

        bool isClearDataModel(const std::string &model) const;

        const core::config::TransportConfig &config() const { return config_; }

    private:
        ConnectionModeCache &modeCache_;
        core::config::TransportConfig config_;
        SessionFactory factory_;

        std::unique_ptr<FtpClient> open(const Endpoint &endpoint, ConnectionMode mode);

        std::vector<ConnectionMode> candidateModes(const Endpoint &endpoint) const;

        template<typename Op>
        auto withConnection(const Endpoint &endpoint, const std::string &operation, Op &&op)
            -> decltype(op(std::declval<FtpClient &>()));

        bool downloadInto(FtpClient &client, const std::string &remotePath, const std::string &localPath);
    };
}
