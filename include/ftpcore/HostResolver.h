/**
 * @file HostResolver.h
 * @brief Host name resolution capability used by MultiBindingListener
 *
 * The listener never calls getaddrinfo() itself; it asks a HostResolver.
 * Tests inject StaticHostResolver to get a fixed, DNS-free address set.
 */

#pragma once

#include "ftpcore/NetAddress.h"

#include <string>
#include <vector>

namespace FtpCore {

/**
 * @brief Resolves a host name or literal to IPv4/IPv6 addresses
 */
class HostResolver {
public:
    virtual ~HostResolver() = default;

    /**
     * @brief Resolve host to its addresses (port fields set to 0)
     * @param host Host name or numeric literal
     * @return Addresses in resolver order; only AF_INET and AF_INET6
     * @throws ResolveError if the lookup itself fails
     */
    virtual std::vector<NetAddress> resolve(const std::string& host) = 0;
};

/**
 * @brief getaddrinfo()-backed resolver
 *
 * Numeric literals are parsed without a DNS query. Duplicate addresses are
 * dropped while keeping the first occurrence's position.
 */
class SystemHostResolver final : public HostResolver {
public:
    std::vector<NetAddress> resolve(const std::string& host) override;
};

/**
 * @brief Resolver returning a fixed address list regardless of the host
 */
class StaticHostResolver final : public HostResolver {
public:
    explicit StaticHostResolver(std::vector<NetAddress> addresses)
        : m_addresses(std::move(addresses)) {}

    /**
     * @brief Build from numeric literals
     * @throws ConfigurationError if any entry is not an IPv4/IPv6 literal
     */
    static StaticHostResolver fromLiterals(const std::vector<std::string>& literals);

    std::vector<NetAddress> resolve(const std::string& host) override;

private:
    std::vector<NetAddress> m_addresses;
};

}  // namespace FtpCore
