//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "core/types/CancellationToken.hpp"
#include "transport/ConnectionModeCache.hpp"
#include "transport/FileEntry.hpp"
#include "transport/FtpSession.hpp"

namespace transport {
    using ProgressCallback = std::function<void(uint64_t bytesSent, uint64_t totalBytes)>;

    /**
     * @brief File operations over one logged-in session
     *
     * Every method throws on failure (FleetException subclasses); turning failures into
     * soft results is TransportClient's job.
     */
    class FtpClient {
    public:
        /**
         * @param skipFinalAck do not wait for the 226 after an upload, the firmware never sends it
         */
        FtpClient(std::unique_ptr<FtpSession> session, ConnectionMode mode, bool skipFinalAck, size_t chunkSize);

        ~FtpClient();

        FtpClient(const FtpClient &) = delete;

        FtpClient &operator=(const FtpClient &) = delete;

        /**
         * @brief USER/PASS followed by PBSZ 0, PROT P and TYPE I
         * @throws AuthFailure when the access code is rejected
         */
        void login(const std::string &username, const std::string &password);

        void changeDirectory(const std::string &path);

        // Raw LIST output of the current directory
        std::string listRaw();

        std::vector<FileEntry> listFiles(const std::string &path);

        /**
         * @brief STOR in fixed-size chunks, reporting progress after each chunk
         *
         * The token is polled after every progress report. On cancellation the data socket
         * is dropped and the partial remote file deleted; CancelledError is thrown, or
         * CancelledDirtyError when the delete failed too.
         */
        void upload(std::istream &source, uint64_t totalBytes, const std::string &remotePath,
                    const ProgressCallback &onProgress, const core::types::CancellationToken *cancel);

        /**
         * @return number of bytes written to sink
         */
        uint64_t download(const std::string &remotePath, std::ostream &sink);

        void deleteFile(const std::string &remotePath);

        std::optional<uint64_t> fileSize(const std::string &remotePath);

        // Vendor AVBL extension, nullopt when unsupported
        std::optional<uint64_t> availableBytes();

        void quit();

        ConnectionMode mode() const { return mode_; }

    private:
        std::unique_ptr<FtpSession> session_;
        ConnectionMode mode_;
        bool skipFinalAck_;
        size_t chunkSize_;
        bool closed_ = false;

        uint16_t enterPassive();

        std::unique_ptr<DataChannel> openTransfer(const std::string &command);

        void awaitTransferComplete(const std::string &context);

        void readAll(DataChannel &channel, std::ostream &sink, uint64_t &total);

        bool deleteAfterAbort(const std::string &remotePath);
    };

    /**
     * @brief Extracts the data port from a 227 reply
     */
    std::optional<uint16_t> parsePassivePort(const std::string &replyText);
}
