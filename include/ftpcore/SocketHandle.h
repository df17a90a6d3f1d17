/**
 * @file SocketHandle.h
 * @brief Owning socket descriptor and listening-socket helpers
 */

#pragma once

#include "ftpcore/NetAddress.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace FtpCore {

/**
 * @brief Move-only owner of a socket file descriptor
 *
 * Closes the descriptor on destruction.
 */
class SocketHandle {
public:
    static constexpr int INVALID = -1;

    SocketHandle() = default;
    explicit SocketHandle(int fd) : m_fd(fd) {}
    ~SocketHandle() { close(); }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    SocketHandle(SocketHandle&& other) noexcept : m_fd(other.release()) {}
    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }
    explicit operator bool() const { return valid(); }

    /// Give up ownership without closing
    int release() {
        int fd = m_fd;
        m_fd = INVALID;
        return fd;
    }

    /// Close the current descriptor (if any) and take ownership of fd
    void reset(int fd = INVALID);

    /// Close the descriptor (idempotent)
    void close() { reset(); }

private:
    int m_fd{INVALID};
};

/**
 * @brief An accepted client connection
 *
 * Owns the connected socket. listenerIndex identifies which bound listener
 * (position in MultiBindingListener::getBoundEndpoints()) accepted it.
 */
struct ClientConnection {
    SocketHandle socket;
    NetAddress peerAddress;
    NetAddress localAddress;
    size_t listenerIndex{0};
};

/**
 * @brief strerror() text for an errno value
 */
std::string sysErrorString(int err);

/**
 * @brief Create, bind and listen a TCP socket on address
 *
 * Sets SO_REUSEADDR (TIME_WAIT reuse only; Linux still refuses a second live
 * listener on the same endpoint), IPV6_V6ONLY for IPv6 addresses, and
 * FD_CLOEXEC.
 *
 * @throws BindFailure if any step fails; nothing stays open in that case.
 */
SocketHandle openListeningSocket(const NetAddress& address, int backlog);

/**
 * @brief Local address a socket is bound to (getsockname)
 * @return Empty NetAddress on failure
 */
NetAddress getLocalAddress(int fd);

/**
 * @brief Set SO_RCVTIMEO on a socket
 * @return true on success
 */
bool setSocketRecvTimeout(int fd, uint32_t timeoutMs);

}  // namespace FtpCore
