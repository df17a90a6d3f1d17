/**
 * @file NetAddress.h
 * @brief IPv4/IPv6 socket address value type
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sys/socket.h>

namespace FtpCore {

/**
 * @brief A resolved IPv4 or IPv6 endpoint (address plus port)
 *
 * Wraps sockaddr_storage so it can be passed straight to bind()/connect().
 */
struct NetAddress {
    sockaddr_storage storage{};
    socklen_t length{0};

    /// AF_INET, AF_INET6, or AF_UNSPEC for an empty address
    int family() const { return length == 0 ? AF_UNSPEC : storage.ss_family; }

    bool isIPv4() const { return family() == AF_INET; }
    bool isIPv6() const { return family() == AF_INET6; }

    /// Port in host byte order
    uint16_t port() const;

    /// Set the port (host byte order); no-op on an empty address
    void setPort(uint16_t port);

    /// Copy of this address with another port
    NetAddress withPort(uint16_t port) const;

    /// Numeric host part, e.g. "127.0.0.1" or "::1"
    std::string toString() const;

    /// "127.0.0.1:21" or "[::1]:21"
    std::string toEndpointString() const;

    const sockaddr* data() const { return reinterpret_cast<const sockaddr*>(&storage); }
    sockaddr* data() { return reinterpret_cast<sockaddr*>(&storage); }

    /**
     * @brief Parse a numeric IPv4 or IPv6 literal (no DNS lookup)
     * @return The address, or std::nullopt if text is not a literal
     */
    static std::optional<NetAddress> fromLiteral(const std::string& text, uint16_t port = 0);

    /**
     * @brief Copy an address returned by the socket API
     *
     * Only AF_INET and AF_INET6 are accepted; anything else yields an empty address.
     */
    static NetAddress fromSockaddr(const sockaddr* addr, socklen_t len);

    /// Same family, address bytes and port
    bool operator==(const NetAddress& other) const;
    bool operator!=(const NetAddress& other) const { return !(*this == other); }
};

}  // namespace FtpCore
