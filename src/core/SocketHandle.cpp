/**
 * @file SocketHandle.cpp
 * @brief Owning socket descriptor and listening-socket helpers
 */

#include "ftpcore/SocketHandle.h"
#include "ftpcore/NetErrors.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace FtpCore {

void SocketHandle::reset(int fd) {
    if (m_fd >= 0 && m_fd != fd) {
        ::close(m_fd);
    }
    m_fd = fd;
}

std::string sysErrorString(int err) {
    char buf[256] = {};
    // GNU strerror_r may return a static string instead of filling buf
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    return std::string(strerror_r(err, buf, sizeof(buf)));
#else
    if (strerror_r(err, buf, sizeof(buf)) != 0) {
        return "errno " + std::to_string(err);
    }
    return std::string(buf);
#endif
}

SocketHandle openListeningSocket(const NetAddress& address, int backlog) {
    const std::string endpoint = address.toEndpointString();

    SocketHandle sock(::socket(address.family(), SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP));
    if (!sock) {
        const int err = errno;
        throw BindFailure(ErrorCodes::NET_SOCKET_FAILED, endpoint, err, "socket(): " + sysErrorString(err));
    }

    int yes = 1;
    if (::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
        const int err = errno;
        throw BindFailure(ErrorCodes::NET_SOCKET_FAILED, endpoint, err,
                          "setsockopt(SO_REUSEADDR): " + sysErrorString(err));
    }

    // Keep "::" from also claiming the IPv4 wildcard, so 0.0.0.0 and :: can
    // both be bound on the same port.
    if (address.isIPv6()) {
        if (::setsockopt(sock.get(), IPPROTO_IPV6, IPV6_V6ONLY, &yes, sizeof(yes)) != 0) {
            const int err = errno;
            throw BindFailure(ErrorCodes::NET_SOCKET_FAILED, endpoint, err,
                              "setsockopt(IPV6_V6ONLY): " + sysErrorString(err));
        }
    }

    if (::bind(sock.get(), address.data(), address.length) != 0) {
        const int err = errno;
        throw BindFailure(ErrorCodes::NET_BIND_FAILED, endpoint, err, sysErrorString(err));
    }

    if (::listen(sock.get(), backlog) != 0) {
        const int err = errno;
        throw BindFailure(ErrorCodes::NET_LISTEN_FAILED, endpoint, err, "listen(): " + sysErrorString(err));
    }

    return sock;
}

NetAddress getLocalAddress(int fd) {
    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        return {};
    }
    return NetAddress::fromSockaddr(reinterpret_cast<const sockaddr*>(&bound), len);
}

bool setSocketRecvTimeout(int fd, uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

}  // namespace FtpCore
