//
// Created by Andrea on 20/10/2025.
//

#pragma once

#include <algorithm>
#include <cstring>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/types/Error.hpp"
#include "transport/FtpSession.hpp"

namespace mocks {
    /**
     * @brief In-memory printer storage answering the command set FtpClient uses
     *
     * Sessions created through factory() share this state, so a test can script the device
     * (clear-data-only firmware, missing upload ack, failing delete) and inspect the result.
     */
    class FakeFtpServer : public std::enable_shared_from_this<FakeFtpServer> {
    public:
        struct Transfer {
            enum class Kind { None, List, Store, Retrieve };

            Kind kind = Kind::None;
            std::string path;
            std::string buffer;
            size_t readOffset = 0;
            bool done = false;
        };

        using ReplyQueue = std::deque<transport::FtpReply>;

        std::string accessCode = "12345678";
        // Data channel TLS handshake fails, like firmwares that only speak clear data
        bool rejectProtectedData = false;
        // No 226 after STOR; the next readReply() times out instead
        bool ackUploads = true;
        bool failDelete = false;
        bool refuseConnections = false;
        std::optional<uint64_t> availableBytes;
        // Invoked with the running byte count after every chunk the client writes
        std::function<void(uint64_t)> onUploadChunk;

        transport::SessionFactory factory() {
            auto self = shared_from_this();
            return [self](const transport::Endpoint &, const core::config::TransportConfig &)
                -> std::unique_ptr<transport::FtpSession> {
                if (self->refuseConnections) {
                    throw core::types::ConnectionError("Connection refused");
                }
                {
                    std::lock_guard<std::mutex> lock(self->mutex_);
                    self->sessions_++;
                }
                return std::make_unique<Session>(self);
            };
        }

        void addFile(const std::string &path, const std::string &content) {
            std::lock_guard<std::mutex> lock(mutex_);
            files_[path] = content;
        }

        void addDirectory(const std::string &path) {
            std::lock_guard<std::mutex> lock(mutex_);
            directories_.insert(path);
        }

        bool hasFile(const std::string &path) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return files_.count(path) > 0;
        }

        std::optional<std::string> file(const std::string &path) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = files_.find(path);
            if (it == files_.end()) return std::nullopt;
            return it->second;
        }

        std::vector<std::string> commands() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return commands_;
        }

        size_t countCommand(const std::string &prefix) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<size_t>(std::count_if(commands_.begin(), commands_.end(), [&](const std::string &c) {
                return c.compare(0, prefix.size(), prefix) == 0;
            }));
        }

        int sessionsOpened() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sessions_;
        }

        int securedChannels() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return secured_;
        }

    private:
        class DataChannel : public transport::DataChannel {
        public:
            DataChannel(std::shared_ptr<FakeFtpServer> server, std::shared_ptr<Transfer> transfer,
                        std::shared_ptr<ReplyQueue> replies)
                : server_(std::move(server)), transfer_(std::move(transfer)), replies_(std::move(replies)) {
            }

            void secure() override {
                if (server_->rejectProtectedData) {
                    throw core::types::TlsFailure("data channel handshake rejected");
                }
                std::lock_guard<std::mutex> lock(server_->mutex_);
                server_->secured_++;
            }

            void write(const char *data, size_t size) override {
                transfer_->buffer.append(data, size);
                if (server_->onUploadChunk) {
                    server_->onUploadChunk(transfer_->buffer.size());
                }
            }

            size_t read(char *buffer, size_t size) override {
                const size_t remaining = transfer_->buffer.size() - transfer_->readOffset;
                const size_t count = std::min(size, remaining);
                if (count > 0) {
                    std::memcpy(buffer, transfer_->buffer.data() + transfer_->readOffset, count);
                    transfer_->readOffset += count;
                }
                return count;
            }

            void finish() override {
                if (transfer_->done) return;
                transfer_->done = true;
                if (transfer_->kind == Transfer::Kind::Store) {
                    server_->addFile(transfer_->path, transfer_->buffer);
                    if (!server_->ackUploads) return;
                }
                replies_->push_back({226, "226 Transfer complete"});
            }

            void abort() override {
                if (transfer_->done) return;
                transfer_->done = true;
                if (transfer_->kind == Transfer::Kind::Store) {
                    // What was received so far stays on the card
                    server_->addFile(transfer_->path, transfer_->buffer);
                    replies_->push_back({426, "426 Connection closed; transfer aborted"});
                }
            }

        private:
            std::shared_ptr<FakeFtpServer> server_;
            std::shared_ptr<Transfer> transfer_;
            std::shared_ptr<ReplyQueue> replies_;
        };

        class Session : public transport::FtpSession {
        public:
            explicit Session(std::shared_ptr<FakeFtpServer> server)
                : server_(std::move(server)), replies_(std::make_shared<ReplyQueue>()) {
            }

            transport::FtpReply command(const std::string &line) override {
                {
                    std::lock_guard<std::mutex> lock(server_->mutex_);
                    server_->commands_.push_back(line);
                }
                return server_->handle(line, cwd_, pending_);
            }

            transport::FtpReply readReply() override {
                if (replies_->empty()) {
                    throw core::types::TimeoutException("no reply from fake server");
                }
                auto reply = replies_->front();
                replies_->pop_front();
                return reply;
            }

            std::unique_ptr<transport::DataChannel> openDataChannel(uint16_t) override {
                pending_ = std::make_shared<Transfer>();
                return std::make_unique<DataChannel>(server_, pending_, replies_);
            }

            void close() override {
            }

        private:
            std::shared_ptr<FakeFtpServer> server_;
            std::shared_ptr<ReplyQueue> replies_;
            std::shared_ptr<Transfer> pending_;
            std::string cwd_ = "/";
        };

        mutable std::mutex mutex_;
        std::map<std::string, std::string> files_;
        std::set<std::string> directories_{"/"};
        std::vector<std::string> commands_;
        int sessions_ = 0;
        int secured_ = 0;

        static std::string argument(const std::string &line) {
            auto space = line.find(' ');
            return space == std::string::npos ? "" : line.substr(space + 1);
        }

        static std::string parentOf(const std::string &path) {
            auto slash = path.find_last_of('/');
            if (slash == std::string::npos || slash == 0) return "/";
            return path.substr(0, slash);
        }

        static std::string nameOf(const std::string &path) {
            auto slash = path.find_last_of('/');
            return slash == std::string::npos ? path : path.substr(slash + 1);
        }

        std::string listing(const std::string &dir) const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string out;
            for (const auto &sub: directories_) {
                if (sub != dir && parentOf(sub) == dir) {
                    out += "drwxr-xr-x    2 root  root         0 Jan 01  2024 " + nameOf(sub) + "\r\n";
                }
            }
            for (const auto &entry: files_) {
                if (parentOf(entry.first) == dir) {
                    out += "-rw-r--r--    1 root  root  " + std::to_string(entry.second.size()) + " Jan 01  2024 " +
                           nameOf(entry.first) + "\r\n";
                }
            }
            return out;
        }

        transport::FtpReply handle(const std::string &line, std::string &cwd, std::shared_ptr<Transfer> &pending) {
            const std::string verb = line.substr(0, line.find(' '));
            const std::string arg = argument(line);

            if (verb == "USER") return {331, "331 Password required"};
            if (verb == "PASS") {
                return arg == accessCode ? transport::FtpReply{230, "230 Logged in"}
                                         : transport::FtpReply{530, "530 Login incorrect"};
            }
            if (verb == "PBSZ" || verb == "PROT" || verb == "TYPE") return {200, "200 OK"};
            if (verb == "CWD") {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!directories_.count(arg)) return {550, "550 No such directory"};
                cwd = arg;
                return {250, "250 Directory changed"};
            }
            if (verb == "PASV") return {227, "227 Entering Passive Mode (127,0,0,1,195,80)"};
            if (verb == "LIST") {
                if (!pending) return {425, "425 No data connection"};
                pending->kind = Transfer::Kind::List;
                pending->buffer = listing(cwd);
                return {150, "150 Opening data connection"};
            }
            if (verb == "STOR") {
                if (!pending) return {425, "425 No data connection"};
                pending->kind = Transfer::Kind::Store;
                pending->path = arg;
                return {150, "150 Ok to send data"};
            }
            if (verb == "RETR") {
                auto content = file(arg);
                if (!content) return {550, "550 File not found"};
                if (!pending) return {425, "425 No data connection"};
                pending->kind = Transfer::Kind::Retrieve;
                pending->path = arg;
                pending->buffer = *content;
                return {150, "150 Opening data connection"};
            }
            if (verb == "DELE") {
                std::lock_guard<std::mutex> lock(mutex_);
                if (failDelete || files_.erase(arg) == 0) return {550, "550 Delete failed"};
                return {250, "250 Deleted"};
            }
            if (verb == "SIZE") {
                auto content = file(arg);
                if (!content) return {550, "550 File not found"};
                return {213, "213 " + std::to_string(content->size())};
            }
            if (verb == "AVBL") {
                if (!availableBytes) return {502, "502 Command not implemented"};
                return {213, "213 " + std::to_string(*availableBytes)};
            }
            return {502, "502 Command not implemented"};
        }
    };
}
