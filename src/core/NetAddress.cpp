/**
 * @file NetAddress.cpp
 * @brief IPv4/IPv6 socket address value type
 */

#include "ftpcore/NetAddress.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>

namespace FtpCore {

uint16_t NetAddress::port() const {
    if (isIPv4()) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
    }
    if (isIPv6()) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
    }
    return 0;
}

void NetAddress::setPort(uint16_t port) {
    if (isIPv4()) {
        reinterpret_cast<sockaddr_in*>(&storage)->sin_port = htons(port);
    } else if (isIPv6()) {
        reinterpret_cast<sockaddr_in6*>(&storage)->sin6_port = htons(port);
    }
}

NetAddress NetAddress::withPort(uint16_t port) const {
    NetAddress copy = *this;
    copy.setPort(port);
    return copy;
}

std::string NetAddress::toString() const {
    char buf[INET6_ADDRSTRLEN] = {};
    if (isIPv4()) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&storage);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            return buf;
        }
    } else if (isIPv6()) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&storage);
        if (inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf))) {
            return buf;
        }
    }
    return {};
}

std::string NetAddress::toEndpointString() const {
    if (isIPv6()) {
        return "[" + toString() + "]:" + std::to_string(port());
    }
    return toString() + ":" + std::to_string(port());
}

std::optional<NetAddress> NetAddress::fromLiteral(const std::string& text, uint16_t port) {
    NetAddress out;

    sockaddr_in sin{};
    if (inet_pton(AF_INET, text.c_str(), &sin.sin_addr) == 1) {
        sin.sin_family = AF_INET;
        sin.sin_port = htons(port);
        std::memcpy(&out.storage, &sin, sizeof(sin));
        out.length = sizeof(sin);
        return out;
    }

    // Accept the bracketed form used in endpoint strings too
    std::string v6 = text;
    if (v6.size() > 2 && v6.front() == '[' && v6.back() == ']') {
        v6 = v6.substr(1, v6.size() - 2);
    }

    sockaddr_in6 sin6{};
    if (inet_pton(AF_INET6, v6.c_str(), &sin6.sin6_addr) == 1) {
        sin6.sin6_family = AF_INET6;
        sin6.sin6_port = htons(port);
        std::memcpy(&out.storage, &sin6, sizeof(sin6));
        out.length = sizeof(sin6);
        return out;
    }

    return std::nullopt;
}

NetAddress NetAddress::fromSockaddr(const sockaddr* addr, socklen_t len) {
    NetAddress out;
    if (!addr) {
        return out;
    }
    if (addr->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
        std::memcpy(&out.storage, addr, sizeof(sockaddr_in));
        out.length = sizeof(sockaddr_in);
    } else if (addr->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
        std::memcpy(&out.storage, addr, sizeof(sockaddr_in6));
        out.length = sizeof(sockaddr_in6);
    }
    return out;
}

bool NetAddress::operator==(const NetAddress& other) const {
    if (family() != other.family()) {
        return false;
    }
    if (isIPv4()) {
        const auto* a = reinterpret_cast<const sockaddr_in*>(&storage);
        const auto* b = reinterpret_cast<const sockaddr_in*>(&other.storage);
        return a->sin_port == b->sin_port && a->sin_addr.s_addr == b->sin_addr.s_addr;
    }
    if (isIPv6()) {
        const auto* a = reinterpret_cast<const sockaddr_in6*>(&storage);
        const auto* b = reinterpret_cast<const sockaddr_in6*>(&other.storage);
        return a->sin6_port == b->sin6_port &&
               a->sin6_scope_id == b->sin6_scope_id &&
               std::memcmp(&a->sin6_addr, &b->sin6_addr, sizeof(in6_addr)) == 0;
    }
    return true;  // both empty
}

}  // namespace FtpCore
