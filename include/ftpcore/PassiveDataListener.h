/**
 * @file PassiveDataListener.h
 * @brief Private single-connection listener for a passive-mode data channel
 */

#pragma once

#include "ftpcore/CancellationToken.h"
#include "ftpcore/NetAddress.h"
#include "ftpcore/SocketHandle.h"

#include <cstdint>
#include <optional>

namespace FtpCore {

/**
 * @class PassiveDataListener
 * @brief Listening socket a session opens on a leased passive port
 *
 * Binds immediately on construction. acceptClient() waits for the one data
 * connection the client is expected to open.
 */
class PassiveDataListener {
public:
    /**
     * @brief Bind and listen on bindAddress (its port may be 0)
     * @throws BindFailure if the port cannot be bound
     */
    explicit PassiveDataListener(const NetAddress& bindAddress);

    PassiveDataListener(const PassiveDataListener&) = delete;
    PassiveDataListener& operator=(const PassiveDataListener&) = delete;

    /// Actual bound port (differs from the request only when it was 0)
    uint16_t getPort() const { return m_localAddress.port(); }

    const NetAddress& getLocalAddress() const { return m_localAddress; }

    bool isOpen() const { return m_socket.valid(); }

    /**
     * @brief Wait up to timeoutMs for the client's data connection
     * @return The connection, or std::nullopt on timeout or cancellation
     * @throws AcceptFailure if poll()/accept() fails or the listener is closed
     */
    std::optional<ClientConnection> acceptClient(uint32_t timeoutMs,
                                                 const CancellationToken& token = CancellationToken());

    /// Close the listening socket (idempotent)
    void close() { m_socket.close(); }

private:
    SocketHandle m_socket;
    NetAddress m_localAddress;
};

}  // namespace FtpCore
