#pragma once

#include <stdexcept>
#include <string>

namespace core::types {

/**
 * @brief Root of every error raised by the dispatch pipeline
 */
class FleetException : public std::runtime_error {
public:
    explicit FleetException(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief Connection refused, reset or unreachable. Retryable.
 */
class ConnectionError : public FleetException {
public:
    explicit ConnectionError(const std::string& msg)
        : FleetException(msg) {}
};

/**
 * @brief TLS handshake failed on the control or the data channel. Retryable.
 */
class TlsFailure : public ConnectionError {
public:
    explicit TlsFailure(const std::string& msg)
        : ConnectionError("TLS failure: " + msg) {}
};

class TimeoutException : public FleetException {
public:
    TimeoutException() : FleetException("Timeout waiting for response") {}

    explicit TimeoutException(const std::string& what)
        : FleetException("Timeout: " + what) {}
};

/**
 * @brief Credentials rejected by the device. Never retried.
 */
class AuthFailure : public FleetException {
public:
    explicit AuthFailure(const std::string& msg)
        : FleetException("Authentication failed: " + msg) {}
};

/**
 * @brief The device answered with a reply code the client did not expect
 */
class ProtocolError : public FleetException {
public:
    ProtocolError(int code, const std::string& msg)
        : FleetException(msg), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

/**
 * @brief Raised when the user cancels a transfer. Survives the retry wrapper unmodified.
 */
class CancelledError : public FleetException {
public:
    explicit CancelledError(const std::string& msg = "Operation cancelled")
        : FleetException(msg) {}
};

/**
 * @brief Cancelled, but the partially written remote file could not be removed
 */
class CancelledDirtyError : public CancelledError {
public:
    explicit CancelledDirtyError(const std::string& remotePath)
        : CancelledError("Cancelled, but partial remote file could not be removed: " + remotePath),
          remotePath_(remotePath) {}

    const std::string& remotePath() const noexcept { return remotePath_; }

private:
    std::string remotePath_;
};

/**
 * @brief Printer, archive or file missing. Fatal for the current entry or job only.
 */
class NotFoundError : public FleetException {
public:
    explicit NotFoundError(const std::string& msg)
        : FleetException(msg) {}
};

/**
 * @brief Persistence layer could not read or write a record
 */
class PersistenceError : public FleetException {
public:
    explicit PersistenceError(const std::string& msg)
        : FleetException("Persistence error: " + msg) {}
};

}
