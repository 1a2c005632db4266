//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "transport/FtpSession.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace transport {
    /**
     * @brief Blocking wait on asynchronous asio operations with a time limit
     *
     * Every operation is bounded by the per-operation timeout and by the session deadline,
     * whichever comes first. On expiry the sockets are closed and TimeoutException is thrown.
     */
    class IoRunner {
    public:
        IoRunner(std::chrono::milliseconds operationTimeout, std::chrono::steady_clock::time_point deadline);

        boost::asio::io_context &context() { return io_; }

        /**
         * @param onTimeout closes whatever socket the pending operation is using
         */
        void run(const std::string &what, const std::function<void()> &onTimeout);

        void run(const std::string &what, const std::function<void()> &onTimeout, std::chrono::milliseconds timeout);

        std::chrono::milliseconds operationTimeout() const { return operationTimeout_; }

    private:
        boost::asio::io_context io_;
        std::chrono::milliseconds operationTimeout_;
        std::chrono::steady_clock::time_point deadline_;
    };

    /**
     * @brief Implicit FTPS control connection on Boost.Asio and OpenSSL
     */
    class FtpsSession : public FtpSession {
    public:
        FtpsSession(const Endpoint &endpoint, const core::config::TransportConfig &config);

        ~FtpsSession() override;

        FtpReply command(const std::string &line) override;

        FtpReply readReply() override;

        std::unique_ptr<DataChannel> openDataChannel(uint16_t port) override;

        void close() override;

        static SessionFactory factory();

    private:
        std::string host_;
        IoRunner runner_;
        boost::asio::ssl::context ssl_;
        boost::asio::ssl::stream<boost::asio::ip::tcp::socket> control_;
        boost::asio::streambuf buffer_;
        bool open_ = false;

        void connect(uint16_t port, std::chrono::milliseconds timeout);

        std::string readLine();

        void closeSocket();
    };

    class FtpsDataChannel : public DataChannel {
    public:
        FtpsDataChannel(IoRunner &runner, boost::asio::ssl::context &ssl, SSL *controlSsl,
                        const std::string &host, const boost::asio::ip::tcp::endpoint &endpoint);

        ~FtpsDataChannel() override;

        void secure() override;

        void write(const char *data, size_t size) override;

        size_t read(char *buffer, size_t size) override;

        void finish() override;

        void abort() override;

    private:
        IoRunner &runner_;
        SSL *controlSsl_;
        std::string host_;
        boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream_;
        bool secured_ = false;

        void closeSocket();
    };
}
