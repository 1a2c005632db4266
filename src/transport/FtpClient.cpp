//
// Created by Andrea on 16/10/2025.
//

#include "transport/FtpClient.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include "transport/ListingParser.hpp"

#include <regex>
#include <sstream>

namespace transport {
    using core::types::AuthFailure;
    using core::types::CancelledDirtyError;
    using core::types::CancelledError;
    using core::types::ProtocolError;

    namespace {
        void expectCode(const FtpReply &reply, int expected, const std::string &context) {
            if (reply.code != expected) {
                throw ProtocolError(reply.code, context + " failed: " + reply.text);
            }
        }

        // Replies the server may still owe for a transfer that was dropped on its side
        bool isTransferReply(int code) {
            return code == 225 || code == 226 || code == 425 || code == 426 || code == 451;
        }
    }

    std::optional<uint16_t> parsePassivePort(const std::string &replyText) {
        static const std::regex pattern(R"((\d+),(\d+),(\d+),(\d+),(\d+),(\d+))");
        std::smatch match;
        if (!std::regex_search(replyText, match, pattern)) {
            return std::nullopt;
        }
        const int high = std::stoi(match[5].str());
        const int low = std::stoi(match[6].str());
        if (high > 255 || low > 255) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(high * 256 + low);
    }

    FtpClient::FtpClient(std::unique_ptr<FtpSession> session, ConnectionMode mode, bool skipFinalAck,
                         size_t chunkSize)
        : session_(std::move(session)), mode_(mode), skipFinalAck_(skipFinalAck), chunkSize_(chunkSize) {
    }

    FtpClient::~FtpClient() {
        quit();
    }

    void FtpClient::login(const std::string &username, const std::string &password) {
        FtpReply reply = session_->command("USER " + username);
        if (reply.code == 331) {
            reply = session_->command("PASS " + password);
        }
        if (reply.code == 530) {
            throw AuthFailure(reply.text);
        }
        expectCode(reply, 230, "Login");

        expectCode(session_->command("PBSZ 0"), 200, "PBSZ");
        // PROT P is negotiated in both modes; clear mode only skips wrapping the data socket
        expectCode(session_->command("PROT P"), 200, "PROT");
        expectCode(session_->command("TYPE I"), 200, "TYPE");
    }

    void FtpClient::changeDirectory(const std::string &path) {
        FtpReply reply = session_->command("CWD " + path);
        if (!reply.isPositive()) {
            throw ProtocolError(reply.code, "CWD " + path + " failed: " + reply.text);
        }
    }

    uint16_t FtpClient::enterPassive() {
        FtpReply reply = session_->command("PASV");
        expectCode(reply, 227, "PASV");

        auto port = parsePassivePort(reply.text);
        if (!port) {
            throw ProtocolError(reply.code, "Cannot parse passive reply: " + reply.text);
        }
        return *port;
    }

    std::unique_ptr<DataChannel> FtpClient::openTransfer(const std::string &command) {
        const uint16_t port = enterPassive();
        auto channel = session_->openDataChannel(port);

        FtpReply reply = session_->command(command);
        if (!reply.isPreliminary()) {
            channel->abort();
            throw ProtocolError(reply.code, command + " refused: " + reply.text);
        }

        if (mode_ == ConnectionMode::Protected) {
            channel->secure();
        }
        return channel;
    }

    void FtpClient::awaitTransferComplete(const std::string &context) {
        FtpReply reply = session_->readReply();
        if (reply.code != 226 && reply.code != 250) {
            throw ProtocolError(reply.code, context + " did not complete: " + reply.text);
        }
    }

    void FtpClient::readAll(DataChannel &channel, std::ostream &sink, uint64_t &total) {
        std::vector<char> buffer(chunkSize_);
        while (true) {
            const size_t received = channel.read(buffer.data(), buffer.size());
            if (received == 0) break;
            sink.write(buffer.data(), static_cast<std::streamsize>(received));
            total += received;
        }
    }

    std::string FtpClient::listRaw() {
        auto channel = openTransfer("LIST");

        std::ostringstream listing;
        uint64_t total = 0;
        readAll(*channel, listing, total);
        channel->finish();
        awaitTransferComplete("LIST");
        return listing.str();
    }

    std::vector<FileEntry> FtpClient::listFiles(const std::string &path) {
        changeDirectory(path);
        return parseListing(listRaw(), path, std::chrono::system_clock::now());
    }

    void FtpClient::upload(std::istream &source, uint64_t totalBytes, const std::string &remotePath,
                           const ProgressCallback &onProgress, const core::types::CancellationToken *cancel) {
        auto channel = openTransfer("STOR " + remotePath);

        std::vector<char> buffer(chunkSize_);
        uint64_t sent = 0;
        while (source) {
            source.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<size_t>(source.gcount());
            if (count == 0) break;

            channel->write(buffer.data(), count);
            sent += count;

            if (onProgress) {
                onProgress(sent, totalBytes);
            }

            if (cancel && cancel->isCancelled()) {
                Logger::logWarning("[FtpClient] Upload of " + remotePath + " cancelled after " +
                                   std::to_string(sent) + " bytes");
                channel->abort();
                if (!deleteAfterAbort(remotePath)) {
                    throw CancelledDirtyError(remotePath);
                }
                throw CancelledError("Upload of " + remotePath + " cancelled");
            }
        }

        if (source.bad()) {
            channel->abort();
            throw core::types::FleetException("Read error on local source for " + remotePath);
        }

        channel->finish();
        if (skipFinalAck_) {
            Logger::logDebug("[FtpClient] Not waiting for transfer acknowledgment of " + remotePath);
            return;
        }
        awaitTransferComplete("STOR " + remotePath);
    }

    bool FtpClient::deleteAfterAbort(const std::string &remotePath) {
        try {
            FtpReply reply = session_->command("DELE " + remotePath);
            // The aborted STOR may answer first
            while (isTransferReply(reply.code)) {
                reply = session_->readReply();
            }
            if (reply.code == 250) {
                Logger::logInfo("[FtpClient] Removed partial upload " + remotePath);
                return true;
            }
            Logger::logError("[FtpClient] Could not remove partial upload " + remotePath + ": " + reply.text);
        } catch (const std::exception &e) {
            Logger::logError("[FtpClient] Could not remove partial upload " + remotePath + ": " + e.what());
        }
        return false;
    }

    uint64_t FtpClient::download(const std::string &remotePath, std::ostream &sink) {
        auto channel = openTransfer("RETR " + remotePath);

        uint64_t total = 0;
        readAll(*channel, sink, total);
        channel->finish();
        awaitTransferComplete("RETR " + remotePath);
        return total;
    }

    void FtpClient::deleteFile(const std::string &remotePath) {
        expectCode(session_->command("DELE " + remotePath), 250, "DELE " + remotePath);
    }

    std::optional<uint64_t> FtpClient::fileSize(const std::string &remotePath) {
        FtpReply reply = session_->command("SIZE " + remotePath);
        if (reply.code != 213) {
            return std::nullopt;
        }
        try {
            return std::stoull(reply.text.substr(4));
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

    std::optional<uint64_t> FtpClient::availableBytes() {
        FtpReply reply = session_->command("AVBL");
        if (reply.code != 213) {
            Logger::logDebug("[FtpClient] AVBL not supported: " + reply.text);
            return std::nullopt;
        }

        std::istringstream fields(reply.text);
        std::string code;
        std::string value;
        fields >> code >> value;
        try {
            return std::stoull(value);
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

    void FtpClient::quit() {
        if (closed_ || !session_) return;
        closed_ = true;
        session_->close();
    }
}
