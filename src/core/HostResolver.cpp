/**
 * @file HostResolver.cpp
 * @brief getaddrinfo()-backed and static host resolvers
 */

#include "ftpcore/HostResolver.h"
#include "ftpcore/NetErrors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>

namespace FtpCore {

namespace {

    void appendUnique(std::vector<NetAddress>& out, const NetAddress& address) {
        if (std::find(out.begin(), out.end(), address) == out.end()) {
            out.push_back(address);
        }
    }

} // anonymous namespace

//=============================================================================
// SystemHostResolver
//=============================================================================

std::vector<NetAddress> SystemHostResolver::resolve(const std::string& host) {
    std::vector<NetAddress> out;

    if (auto literal = NetAddress::fromLiteral(host)) {
        out.push_back(*literal);
        return out;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0) {
        std::string detail = gai_strerror(rc);
        if (rc == EAI_SYSTEM) {
            detail += " (" + std::string(std::strerror(errno)) + ")";
        }
        throw ResolveError(ErrorCodes::NET_RESOLVE_FAILED, host, detail);
    }

    for (const addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) {
            continue;
        }
        NetAddress address = NetAddress::fromSockaddr(ai->ai_addr, ai->ai_addrlen);
        if (address.family() == AF_UNSPEC) {
            continue;
        }
        address.setPort(0);
        appendUnique(out, address);
    }

    ::freeaddrinfo(res);
    return out;
}

//=============================================================================
// StaticHostResolver
//=============================================================================

StaticHostResolver StaticHostResolver::fromLiterals(const std::vector<std::string>& literals) {
    std::vector<NetAddress> addresses;
    addresses.reserve(literals.size());

    for (const auto& text : literals) {
        auto address = NetAddress::fromLiteral(text);
        if (!address) {
            throw ConfigurationError(ErrorCodes::CONFIG_INVALID_HOST,
                                     "\"" + text + "\" is not a numeric IPv4/IPv6 address");
        }
        addresses.push_back(*address);
    }

    return StaticHostResolver(std::move(addresses));
}

std::vector<NetAddress> StaticHostResolver::resolve(const std::string& host) {
    (void)host;
    return m_addresses;
}

}  // namespace FtpCore
