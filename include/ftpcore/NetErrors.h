/**
 * @file NetErrors.h
 * @brief Exception types raised by the listener, port pool and config loaders
 *
 * Every exception carries a stable code from ErrorCodes.h. what() returns
 * "<code>: <message>" so a single log line is enough to troubleshoot.
 *
 * Pool exhaustion is deliberately not an exception: see PortLease.
 */

#pragma once

#include "ftpcore/ErrorCodes.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace FtpCore {

/**
 * @brief Base class of all FtpCore errors
 */
class NetError : public std::runtime_error {
public:
    NetError(const char* code, const std::string& message)
        : std::runtime_error(std::string(code) + ": " + message)
        , m_code(code)
        , m_message(message) {}

    /// Stable error code (e.g. "FTPC-NET-1100")
    const char* code() const noexcept { return m_code; }

    /// Message without the code prefix
    const std::string& message() const noexcept { return m_message; }

private:
    const char* m_code;
    std::string m_message;
};

/**
 * @brief Invalid configuration value (port, range, host, file contents)
 *
 * Fatal to constructing the affected instance.
 */
class ConfigurationError : public NetError {
public:
    using NetError::NetError;
};

/**
 * @brief Host name resolution failed or produced no usable address
 */
class ResolveError : public NetError {
public:
    ResolveError(const char* code, const std::string& host, const std::string& message)
        : NetError(code, "cannot resolve \"" + host + "\": " + message)
        , m_host(host) {}

    const std::string& host() const noexcept { return m_host; }

private:
    std::string m_host;
};

/**
 * @brief A socket could not be created, bound or put into listening state
 *
 * Raised by start() after every socket it opened has been closed again.
 */
class BindFailure : public NetError {
public:
    BindFailure(const char* code, const std::string& endpoint, int sysError, const std::string& message)
        : NetError(code, "bind " + endpoint + " failed: " + message)
        , m_endpoint(endpoint)
        , m_sysError(sysError) {}

    /// "address:port" that failed
    const std::string& endpoint() const noexcept { return m_endpoint; }

    /// errno value reported by the failing call (0 if none)
    int sysError() const noexcept { return m_sysError; }

private:
    std::string m_endpoint;
    int m_sysError;
};

/**
 * @brief An outstanding accept on one of the bound listeners failed
 */
class AcceptFailure : public NetError {
public:
    AcceptFailure(size_t listenerIndex, const std::string& endpoint, int sysError, const std::string& message)
        : NetError(ErrorCodes::NET_ACCEPT_FAILED, "accept on " + endpoint + " failed: " + message)
        , m_listenerIndex(listenerIndex)
        , m_endpoint(endpoint)
        , m_sysError(sysError) {}

    size_t listenerIndex() const noexcept { return m_listenerIndex; }
    const std::string& endpoint() const noexcept { return m_endpoint; }
    int sysError() const noexcept { return m_sysError; }

private:
    size_t m_listenerIndex;
    std::string m_endpoint;
    int m_sysError;
};

/**
 * @brief Lifecycle misuse of a listener (e.g. start() on a bound instance)
 */
class ListenerStateError : public NetError {
public:
    explicit ListenerStateError(const std::string& message)
        : NetError(ErrorCodes::NET_INVALID_STATE, message) {}
};

/**
 * @brief A port was returned that is not in the pool or is not leased
 *
 * This is a bookkeeping bug in the caller, not a transient condition.
 */
class PortPoolMisuse : public NetError {
public:
    PortPoolMisuse(const char* code, uint16_t port, const std::string& message)
        : NetError(code, "port " + std::to_string(port) + ": " + message)
        , m_port(port) {}

    uint16_t port() const noexcept { return m_port; }

private:
    uint16_t m_port;
};

}  // namespace FtpCore
