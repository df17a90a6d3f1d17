/**
 * @file PassiveDataListener.cpp
 * @brief Private single-connection listener for a passive-mode data channel
 */

#include "ftpcore/PassiveDataListener.h"
#include "ftpcore/NetErrors.h"
#include "ftpcore/config.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <poll.h>
#include <sys/socket.h>

namespace FtpCore {

PassiveDataListener::PassiveDataListener(const NetAddress& bindAddress)
    : m_socket(openListeningSocket(bindAddress, DATA_LISTEN_BACKLOG))
    , m_localAddress(FtpCore::getLocalAddress(m_socket.get()))
{
    if (m_localAddress.family() == AF_UNSPEC) {
        const int err = errno;
        throw BindFailure(ErrorCodes::NET_BIND_FAILED, bindAddress.toEndpointString(), err,
                          "getsockname(): " + sysErrorString(err));
    }
}

std::optional<ClientConnection> PassiveDataListener::acceptClient(uint32_t timeoutMs,
                                                                  const CancellationToken& token) {
    const std::string endpoint = m_localAddress.toEndpointString();
    if (!m_socket) {
        throw AcceptFailure(0, endpoint, EBADF, "data listener is closed");
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (!token.isCancellationRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int slice = static_cast<int>(std::min<long long>(remaining, DATA_ACCEPT_POLL_SLICE_MS));

        pollfd pfd{};
        pfd.fd = m_socket.get();
        pfd.events = POLLIN;

        const int rc = ::poll(&pfd, 1, slice);
        if (rc < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            throw AcceptFailure(0, endpoint, err, "poll(): " + sysErrorString(err));
        }
        if (rc == 0) {
            continue;
        }

        sockaddr_storage peer{};
        socklen_t peerLen = sizeof(peer);
        SocketHandle client(::accept4(m_socket.get(), reinterpret_cast<sockaddr*>(&peer), &peerLen, SOCK_CLOEXEC));
        if (!client) {
            const int err = errno;
            if (err == EINTR || err == ECONNABORTED || err == EAGAIN) {
                continue;
            }
            throw AcceptFailure(0, endpoint, err, sysErrorString(err));
        }

        ClientConnection conn;
        conn.peerAddress = NetAddress::fromSockaddr(reinterpret_cast<const sockaddr*>(&peer), peerLen);
        conn.localAddress = FtpCore::getLocalAddress(client.get());
        conn.socket = std::move(client);
        return conn;
    }

    return std::nullopt;
}

}  // namespace FtpCore
