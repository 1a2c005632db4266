//
// Created by Andrea on 16/10/2025.
//

#include "transport/impl/FtpsSession.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <istream>

namespace transport {
    using boost::asio::ip::tcp;
    using core::types::ConnectionError;
    using core::types::ProtocolError;
    using core::types::TimeoutException;
    using core::types::TlsFailure;

    namespace {
        constexpr std::chrono::milliseconds DATA_SHUTDOWN_TIMEOUT{5000};

        bool isEndOfStream(const boost::system::error_code &ec) {
            // Many device firmwares drop the data socket without a TLS close_notify
            return ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated;
        }
    }

    // ==================== IoRunner ====================

    IoRunner::IoRunner(std::chrono::milliseconds operationTimeout, std::chrono::steady_clock::time_point deadline)
        : operationTimeout_(operationTimeout), deadline_(deadline) {
    }

    void IoRunner::run(const std::string &what, const std::function<void()> &onTimeout) {
        run(what, onTimeout, operationTimeout_);
    }

    void IoRunner::run(const std::string &what, const std::function<void()> &onTimeout,
                       std::chrono::milliseconds timeout) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_ - std::chrono::steady_clock::now());
        const bool deadlineBound = remaining < timeout;
        const auto limit = std::min(timeout, remaining);

        io_.restart();
        if (limit.count() > 0) {
            io_.run_for(limit);
        }

        if (!io_.stopped()) {
            // Closing the socket completes the pending handler with operation_aborted
            onTimeout();
            io_.run();
            throw TimeoutException(what + (deadlineBound ? " (operation deadline exceeded)" : ""));
        }
    }

    // ==================== FtpsSession ====================

    FtpsSession::FtpsSession(const Endpoint &endpoint, const core::config::TransportConfig &config)
        : host_(endpoint.address),
          runner_(std::chrono::milliseconds(config.socketTimeoutMs),
                  std::chrono::steady_clock::now() + std::chrono::milliseconds(config.operationDeadlineMs)),
          ssl_(boost::asio::ssl::context::tls_client),
          control_(runner_.context(), ssl_) {
        // Printers present self-signed certificates
        ssl_.set_verify_mode(boost::asio::ssl::verify_none);

        connect(static_cast<uint16_t>(config.port), std::chrono::milliseconds(config.connectTimeoutMs));
    }

    FtpsSession::~FtpsSession() {
        closeSocket();
    }

    SessionFactory FtpsSession::factory() {
        return [](const Endpoint &endpoint, const core::config::TransportConfig &config) {
            return std::unique_ptr<FtpSession>(std::make_unique<FtpsSession>(endpoint, config));
        };
    }

    void FtpsSession::connect(uint16_t port, std::chrono::milliseconds timeout) {
        tcp::resolver resolver(runner_.context());
        tcp::resolver::results_type results;
        boost::system::error_code ec = boost::asio::error::would_block;

        resolver.async_resolve(host_, std::to_string(port),
                               [&](const boost::system::error_code &error, tcp::resolver::results_type found) {
                                   ec = error;
                                   results = std::move(found);
                               });
        runner_.run("resolving " + host_, [&resolver]() { resolver.cancel(); }, timeout);
        if (ec) {
            throw ConnectionError("Cannot resolve " + host_ + ": " + ec.message());
        }

        ec = boost::asio::error::would_block;
        boost::asio::async_connect(control_.lowest_layer(), results,
                                   [&](const boost::system::error_code &error, const tcp::endpoint &) {
                                       ec = error;
                                   });
        runner_.run("connecting to " + host_, [this]() { closeSocket(); }, timeout);
        if (ec) {
            throw ConnectionError("Connection to " + host_ + ":" + std::to_string(port) + " failed: " + ec.message());
        }

        // Implicit TLS: the handshake happens before any protocol exchange
        SSL_set_tlsext_host_name(control_.native_handle(), host_.c_str());
        ec = boost::asio::error::would_block;
        control_.async_handshake(boost::asio::ssl::stream_base::client,
                                 [&](const boost::system::error_code &error) { ec = error; });
        runner_.run("TLS handshake with " + host_, [this]() { closeSocket(); }, timeout);
        if (ec) {
            closeSocket();
            throw TlsFailure("control channel to " + host_ + ": " + ec.message());
        }

        open_ = true;
        FtpReply greeting = readReply();
        if (greeting.code != 220) {
            throw ProtocolError(greeting.code, "Unexpected greeting from " + host_ + ": " + greeting.text);
        }
        Logger::logDebug("[FtpsSession] Connected to " + host_ + ": " + greeting.text);
    }

    FtpReply FtpsSession::command(const std::string &line) {
        const bool secret = line.rfind("PASS ", 0) == 0;
        Logger::logDebug("[FtpsSession] > " + (secret ? std::string("PASS ****") : line));

        const std::string payload = line + "\r\n";
        boost::system::error_code ec = boost::asio::error::would_block;
        boost::asio::async_write(control_, boost::asio::buffer(payload),
                                 [&](const boost::system::error_code &error, std::size_t) { ec = error; });
        runner_.run("sending command to " + host_, [this]() { closeSocket(); });
        if (ec) {
            throw ConnectionError("Control connection to " + host_ + " lost: " + ec.message());
        }

        FtpReply reply = readReply();
        Logger::logDebug("[FtpsSession] < " + reply.text);
        return reply;
    }

    FtpReply FtpsSession::readReply() {
        std::string line = readLine();
        if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
            !std::isdigit(static_cast<unsigned char>(line[1])) || !std::isdigit(static_cast<unsigned char>(line[2]))) {
            throw ProtocolError(0, "Malformed reply from " + host_ + ": " + line);
        }

        FtpReply reply;
        reply.code = std::stoi(line.substr(0, 3));

        // Multi-line replies end with the same code followed by a space
        if (line.size() > 3 && line[3] == '-') {
            const std::string terminator = line.substr(0, 3) + " ";
            do {
                line = readLine();
            } while (line.compare(0, terminator.size(), terminator) != 0);
        }

        reply.text = line;
        return reply;
    }

    std::unique_ptr<DataChannel> FtpsSession::openDataChannel(uint16_t port) {
        boost::system::error_code ec;
        const auto remote = control_.lowest_layer().remote_endpoint(ec);
        if (ec) {
            throw ConnectionError("Control connection to " + host_ + " lost: " + ec.message());
        }

        // The advertised passive host is ignored, devices sometimes report an internal address
        return std::make_unique<FtpsDataChannel>(runner_, ssl_, control_.native_handle(), host_,
                                                 tcp::endpoint(remote.address(), port));
    }

    std::string FtpsSession::readLine() {
        boost::system::error_code ec = boost::asio::error::would_block;
        boost::asio::async_read_until(control_, buffer_, '\n',
                                      [&](const boost::system::error_code &error, std::size_t) { ec = error; });
        runner_.run("waiting for reply from " + host_, [this]() { closeSocket(); });
        if (ec) {
            throw ConnectionError("Control connection to " + host_ + " lost: " + ec.message());
        }

        std::istream stream(&buffer_);
        std::string line;
        std::getline(stream, line);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    void FtpsSession::close() {
        if (!open_) return;

        try {
            command("QUIT");
        } catch (const std::exception &e) {
            Logger::logDebug("[FtpsSession] QUIT to " + host_ + " failed: " + std::string(e.what()));
        }
        closeSocket();
    }

    void FtpsSession::closeSocket() {
        open_ = false;
        boost::system::error_code ignored;
        control_.lowest_layer().close(ignored);
    }

    // ==================== FtpsDataChannel ====================

    FtpsDataChannel::FtpsDataChannel(IoRunner &runner, boost::asio::ssl::context &ssl, SSL *controlSsl,
                                     const std::string &host, const tcp::endpoint &endpoint)
        : runner_(runner), controlSsl_(controlSsl), host_(host), stream_(runner.context(), ssl) {
        boost::system::error_code ec = boost::asio::error::would_block;
        stream_.next_layer().async_connect(endpoint, [&](const boost::system::error_code &error) { ec = error; });
        runner_.run("opening data connection to " + host_, [this]() { closeSocket(); });
        if (ec) {
            closeSocket();
            throw ConnectionError("Data connection to " + host_ + ":" + std::to_string(endpoint.port()) +
                                  " failed: " + ec.message());
        }
    }

    FtpsDataChannel::~FtpsDataChannel() {
        closeSocket();
    }

    void FtpsDataChannel::secure() {
        SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str());

        // vsFTPd refuses data connections that do not resume the control session
        SSL_SESSION *session = SSL_get1_session(controlSsl_);
        if (session) {
            SSL_set_session(stream_.native_handle(), session);
            SSL_SESSION_free(session);
        }

        boost::system::error_code ec = boost::asio::error::would_block;
        stream_.async_handshake(boost::asio::ssl::stream_base::client,
                                [&](const boost::system::error_code &error) { ec = error; });
        runner_.run("data channel TLS handshake with " + host_, [this]() { closeSocket(); });
        if (ec) {
            closeSocket();
            throw TlsFailure("data channel to " + host_ + ": " + ec.message());
        }
        secured_ = true;
    }

    void FtpsDataChannel::write(const char *data, size_t size) {
        boost::system::error_code ec = boost::asio::error::would_block;
        auto handler = [&](const boost::system::error_code &error, std::size_t) { ec = error; };
        if (secured_) {
            boost::asio::async_write(stream_, boost::asio::buffer(data, size), handler);
        } else {
            boost::asio::async_write(stream_.next_layer(), boost::asio::buffer(data, size), handler);
        }
        runner_.run("sending data to " + host_, [this]() { closeSocket(); });
        if (ec) {
            throw ConnectionError("Data connection to " + host_ + " failed: " + ec.message());
        }
    }

    size_t FtpsDataChannel::read(char *buffer, size_t size) {
        boost::system::error_code ec = boost::asio::error::would_block;
        size_t received = 0;
        auto handler = [&](const boost::system::error_code &error, std::size_t count) {
            ec = error;
            received = count;
        };
        if (secured_) {
            stream_.async_read_some(boost::asio::buffer(buffer, size), handler);
        } else {
            stream_.next_layer().async_read_some(boost::asio::buffer(buffer, size), handler);
        }
        runner_.run("receiving data from " + host_, [this]() { closeSocket(); });

        if (ec) {
            if (isEndOfStream(ec)) {
                return received;
            }
            throw ConnectionError("Data connection to " + host_ + " failed: " + ec.message());
        }
        return received;
    }

    void FtpsDataChannel::finish() {
        if (secured_) {
            boost::system::error_code ec = boost::asio::error::would_block;
            stream_.async_shutdown([&](const boost::system::error_code &error) { ec = error; });
            try {
                runner_.run("closing data channel to " + host_, [this]() { closeSocket(); },
                            std::min(DATA_SHUTDOWN_TIMEOUT, runner_.operationTimeout()));
            } catch (const TimeoutException &) {
                // The payload is already flushed, a missing close_notify does not invalidate it
                Logger::logDebug("[FtpsSession] TLS shutdown of data channel to " + host_ + " timed out");
            }
            if (ec && !isEndOfStream(ec) && ec != boost::asio::error::operation_aborted) {
                Logger::logDebug("[FtpsSession] TLS shutdown of data channel: " + ec.message());
            }
        }

        boost::system::error_code ignored;
        stream_.next_layer().shutdown(tcp::socket::shutdown_both, ignored);
        closeSocket();
    }

    void FtpsDataChannel::abort() {
        closeSocket();
    }

    void FtpsDataChannel::closeSocket() {
        boost::system::error_code ignored;
        stream_.next_layer().close(ignored);
    }
}
