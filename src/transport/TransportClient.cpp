//
// Created by Andrea on 17/10/2025.
//

#include "transport/TransportClient.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include "transport/ListingParser.hpp"
#include "transport/impl/FtpsSession.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace transport {
    using core::types::AuthFailure;
    using core::types::CancelledError;
    using core::types::FleetException;
    using core::types::ProtocolError;
    using core::types::TimeoutException;

    namespace {
        const std::vector<std::string> STORAGE_SCAN_DIRS{
            "/cache", "/timelapse", "/model", "/data", "/data/Metadata", "/"
        };
    }

    TransportClient::TransportClient(ConnectionModeCache &modeCache, core::config::TransportConfig config,
                                     SessionFactory factory)
        : modeCache_(modeCache), config_(std::move(config)), factory_(std::move(factory)) {
        if (!factory_) {
            factory_ = FtpsSession::factory();
        }
    }

    bool TransportClient::isClearDataModel(const std::string &model) const {
        if (model.empty()) return false;
        return std::find(config_.clearDataModels.begin(), config_.clearDataModels.end(), model) !=
               config_.clearDataModels.end();
    }

    std::vector<ConnectionMode> TransportClient::candidateModes(const Endpoint &endpoint) const {
        auto cached = modeCache_.get(endpoint.address);
        if (cached == ConnectionMode::Clear) {
            return {ConnectionMode::Clear};
        }

        std::vector<ConnectionMode> modes{ConnectionMode::Protected};
        if (isClearDataModel(endpoint.model)) {
            modes.push_back(ConnectionMode::Clear);
        }
        return modes;
    }

    std::unique_ptr<FtpClient> TransportClient::open(const Endpoint &endpoint, ConnectionMode mode) {
        Logger::logDebug("[TransportClient] Connecting to " + endpoint.address + ":" + std::to_string(config_.port) +
                         " (model=" + endpoint.model + ", mode=" + connectionModeToString(mode) + ")");

        auto client = std::make_unique<FtpClient>(factory_(endpoint, config_), mode,
                                                  isClearDataModel(endpoint.model), config_.chunkSize);
        client->login(config_.username, endpoint.accessCode);
        return client;
    }

    template<typename Op>
    auto TransportClient::withConnection(const Endpoint &endpoint, const std::string &operation, Op &&op)
        -> decltype(op(std::declval<FtpClient &>())) {
        const auto modes = candidateModes(endpoint);

        for (size_t i = 0; i < modes.size(); ++i) {
            const bool lastAttempt = i + 1 == modes.size();
            try {
                auto client = open(endpoint, modes[i]);
                auto result = op(*client);
                client->quit();

                modeCache_.set(endpoint.address, modes[i]);
                return result;
            } catch (const CancelledError &) {
                throw;
            } catch (const AuthFailure &) {
                throw;
            } catch (const FleetException &e) {
                if (lastAttempt) throw;
                Logger::logWarning("[TransportClient] " + operation + " on " + endpoint.address + " failed in " +
                                   connectionModeToString(modes[i]) + " mode (" + e.what() +
                                   "), retrying with " + connectionModeToString(modes[i + 1]) + " data channel");
            }
        }
        throw FleetException("No connection mode available for " + endpoint.address);
    }

    std::vector<FileEntry> TransportClient::listFiles(const Endpoint &endpoint, const std::string &path) {
        try {
            return withConnection(endpoint, "LIST " + path, [&](FtpClient &client) {
                return client.listFiles(path);
            });
        } catch (const std::exception &e) {
            Logger::logWarning("[TransportClient] Listing " + path + " on " + endpoint.address + " failed: " + e.what());
            return {};
        }
    }

    bool TransportClient::uploadFile(const Endpoint &endpoint, const std::string &localPath,
                                     const std::string &remotePath, const ProgressCallback &onProgress,
                                     const core::types::CancellationToken *cancel) {
        std::error_code ec;
        const auto totalBytes = fs::file_size(localPath, ec);
        if (ec) {
            Logger::logError("[TransportClient] Cannot read " + localPath + ": " + ec.message());
            return false;
        }

        Logger::logInfo("[TransportClient] Uploading " + localPath + " (" + std::to_string(totalBytes) +
                        " bytes) to " + endpoint.address + ":" + remotePath);
        try {
            withConnection(endpoint, "STOR " + remotePath, [&](FtpClient &client) {
                std::ifstream source(localPath, std::ios::binary);
                if (!source) {
                    throw FleetException("Cannot open " + localPath);
                }
                client.upload(source, totalBytes, remotePath, onProgress, cancel);
                return true;
            });
        } catch (const CancelledError &) {
            throw;
        } catch (const AuthFailure &) {
            throw;
        } catch (const TimeoutException &) {
            throw;
        } catch (const std::exception &e) {
            Logger::logError("[TransportClient] Upload of " + remotePath + " to " + endpoint.address + " failed: " +
                             e.what());
            return false;
        }

        Logger::logInfo("[TransportClient] Upload complete: " + remotePath);
        return true;
    }

    bool TransportClient::uploadBytes(const Endpoint &endpoint, const std::string &data,
                                      const std::string &remotePath) {
        try {
            withConnection(endpoint, "STOR " + remotePath, [&](FtpClient &client) {
                std::istringstream source(data);
                client.upload(source, data.size(), remotePath, {}, nullptr);
                return true;
            });
            return true;
        } catch (const AuthFailure &) {
            throw;
        } catch (const TimeoutException &) {
            throw;
        } catch (const std::exception &e) {
            Logger::logError("[TransportClient] Upload of " + remotePath + " to " + endpoint.address + " failed: " +
                             e.what());
            return false;
        }
    }

    std::optional<std::string> TransportClient::downloadFile(const Endpoint &endpoint, const std::string &remotePath) {
        try {
            return withConnection(endpoint, "RETR " + remotePath, [&](FtpClient &client) {
                std::ostringstream sink;
                if (client.download(remotePath, sink) == 0) {
                    throw ProtocolError(0, "Downloaded zero bytes from " + remotePath);
                }
                return std::optional<std::string>(sink.str());
            });
        } catch (const AuthFailure &) {
            throw;
        } catch (const TimeoutException &) {
            throw;
        } catch (const std::exception &e) {
            Logger::logWarning("[TransportClient] Download of " + remotePath + " from " + endpoint.address +
                               " failed: " + e.what());
            return std::nullopt;
        }
    }

    bool TransportClient::downloadInto(FtpClient &client, const std::string &remotePath,
                                       const std::string &localPath) {
        uint64_t received = 0;
        {
            std::ofstream sink(localPath, std::ios::binary | std::ios::trunc);
            if (!sink) {
                throw FleetException("Cannot write " + localPath);
            }
            try {
                received = client.download(remotePath, sink);
            } catch (const std::exception &) {
                sink.close();
                std::error_code ignored;
                fs::remove(localPath, ignored);
                throw;
            }
        }

        // Several firmwares answer a missing path with an empty stream instead of an error
        if (received == 0) {
            std::error_code ignored;
            fs::remove(localPath, ignored);
            Logger::logWarning("[TransportClient] " + remotePath + " returned zero bytes");
            return false;
        }
        return true;
    }

    bool TransportClient::downloadToFile(const Endpoint &endpoint, const std::string &remotePath,
                                         const std::string &localPath) {
        try {
            return withConnection(endpoint, "RETR " + remotePath, [&](FtpClient &client) {
                if (!downloadInto(client, remotePath, localPath)) {
                    throw ProtocolError(0, "Downloaded zero bytes from " + remotePath);
                }
                return true;
            });
        } catch (const AuthFailure &) {
            throw;
        } catch (const TimeoutException &) {
            throw;
        } catch (const std::exception &e) {
            Logger::logWarning("[TransportClient] Download of " + remotePath + " from " + endpoint.address +
                               " failed: " + e.what());
            return false;
        }
    }

    bool TransportClient::downloadFirstOf(const Endpoint &endpoint, const std::vector<std::string> &remotePaths,
                                          const std::string &localPath) {
        try {
            return withConnection(endpoint, "RETR", [&](FtpClient &client) {
                for (const auto &remotePath: remotePaths) {
                    try {
                        if (downloadInto(client, remotePath, localPath)) {
                            Logger::logInfo("[TransportClient] Downloaded " + remotePath + " from " +
                                            endpoint.address);
                            return true;
                        }
                    } catch (const ProtocolError &e) {
                        Logger::logDebug("[TransportClient] " + remotePath + " not available: " + e.what());
                    }
                }
                return false;
            });
        } catch (const AuthFailure &) {
            throw;
        } catch (const TimeoutException &) {
            throw;
        } catch (const std::exception &e) {
            Logger::logWarning("[TransportClient] Download from " + endpoint.address + " failed: " + e.what());
            return false;
        }
    }

    bool TransportClient::deleteFile(const Endpoint &endpoint, const std::string &remotePath) {
        try {
            return withConnection(endpoint, "DELE " + remotePath, [&](FtpClient &client) {
                client.deleteFile(remotePath);
                return true;
            });
        } catch (const AuthFailure &) {
            throw;
        } catch (const TimeoutException &) {
            throw;
        } catch (const std::exception &e) {
            Logger::logWarning("[TransportClient] Failed to delete " + remotePath + " on " + endpoint.address + ": " +
                               e.what());
            return false;
        }
    }

    std::optional<uint64_t> TransportClient::fileSize(const Endpoint &endpoint, const std::string &remotePath) {
        try {
            return withConnection(endpoint, "SIZE " + remotePath, [&](FtpClient &client) {
                return client.fileSize(remotePath);
            });
        } catch (const AuthFailure &) {
            throw;
        } catch (const TimeoutException &) {
            throw;
        } catch (const std::exception &e) {
            Logger::logWarning("[TransportClient] SIZE " + remotePath + " on " + endpoint.address + " failed: " +
                               e.what());
            return std::nullopt;
        }
    }

    std::optional<StorageInfo> TransportClient::storageInfo(const Endpoint &endpoint) {
        try {
            StorageInfo info = withConnection(endpoint, "storage info", [&](FtpClient &client) {
                StorageInfo result;
                result.freeBytes = client.availableBytes();

                uint64_t used = 0;
                bool scanned = false;
                for (const auto &dir: STORAGE_SCAN_DIRS) {
                    try {
                        client.changeDirectory(dir);
                        std::istringstream lines(client.listRaw());
                        std::string line;
                        while (std::getline(lines, line)) {
                            if (auto size = listingLineFileSize(line)) {
                                used += *size;
                            }
                        }
                        scanned = true;
                    } catch (const FleetException &e) {
                        Logger::logDebug("[TransportClient] Skipping " + dir + ": " + e.what());
                    }
                }
                if (scanned) {
                    result.usedBytes = used;
                }

                if (result.empty()) {
                    throw ProtocolError(0, "No storage information available");
                }
                return result;
            });
            return info;
        } catch (const std::exception &e) {
            Logger::logWarning("[TransportClient] Storage info for " + endpoint.address + " unavailable: " + e.what());
            return std::nullopt;
        }
    }
}
