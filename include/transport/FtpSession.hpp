//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "application/config/ConfigManager.hpp"

namespace transport {
    struct Endpoint {
        std::string address;
        std::string accessCode;
        std::string model;
    };

    struct FtpReply {
        int code = 0;
        std::string text; // full last line, code included

        bool isPreliminary() const { return code >= 100 && code < 200; }

        bool isPositive() const { return code >= 200 && code < 300; }
    };

    /**
     * @brief One passive-mode data connection
     *
     * All calls block and honour the session timeouts; failures throw
     * ConnectionError, TlsFailure or TimeoutException.
     */
    class DataChannel {
    public:
        virtual ~DataChannel() = default;

        /**
         * @brief TLS client handshake, resuming the control channel's session
         */
        virtual void secure() = 0;

        virtual void write(const char *data, size_t size) = 0;

        /**
         * @return bytes read, 0 once the server closed the stream
         */
        virtual size_t read(char *buffer, size_t size) = 0;

        // Orderly end of transfer
        virtual void finish() = 0;

        // Drops the connection without any shutdown exchange
        virtual void abort() = 0;
    };

    /**
     * @brief Control connection of an implicit-TLS file transfer session
     *
     * A session is handed out already connected with the greeting consumed; the
     * login and protection commands are driven by FtpClient.
     */
    class FtpSession {
    public:
        virtual ~FtpSession() = default;

        /**
         * @brief Sends one command line and reads the (possibly multi-line) reply
         */
        virtual FtpReply command(const std::string &line) = 0;

        virtual FtpReply readReply() = 0;

        /**
         * @brief Opens a data connection to the control host on the passive port
         */
        virtual std::unique_ptr<DataChannel> openDataChannel(uint16_t port) = 0;

        virtual void close() = 0;
    };

    using SessionFactory = std::function<std::unique_ptr<FtpSession>(const Endpoint &,
                                                                     const core::config::TransportConfig &)>;
}
