/**
 * @file PortSet.h
 * @brief Configured set of candidate passive ports
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace FtpCore {

/**
 * @brief Sorted, duplicate-free set of port numbers (1-65535)
 *
 * Built from an inclusive range ("50000-50100"), an explicit list
 * ("50000,50002,50010") or a mix of both ("50000-50010,50100"). An empty
 * set means "no passive range configured".
 */
class PortSet {
public:
    PortSet() = default;

    /**
     * @brief Inclusive range [minPort, maxPort]
     * @throws ConfigurationError if either bound is outside 1-65535 or minPort > maxPort
     */
    static PortSet range(int minPort, int maxPort);

    /**
     * @brief Explicit list; duplicates are merged
     * @throws ConfigurationError if any entry is outside 1-65535
     */
    static PortSet list(const std::vector<int>& ports);

    /**
     * @brief Parse comma-separated ports and "min-max" ranges
     *
     * Whitespace around items is ignored. An empty or all-blank string gives
     * an empty set.
     * @throws ConfigurationError on malformed text or invalid ports
     */
    static PortSet parse(const std::string& text);

    const std::vector<uint16_t>& ports() const { return m_ports; }
    bool empty() const { return m_ports.empty(); }
    size_t size() const { return m_ports.size(); }
    bool contains(uint16_t port) const;

    uint16_t minPort() const { return m_ports.empty() ? 0 : m_ports.front(); }
    uint16_t maxPort() const { return m_ports.empty() ? 0 : m_ports.back(); }

    /// Compact text form that parse() accepts, e.g. "50000-50010,50100"
    std::string toString() const;

    bool operator==(const PortSet& other) const { return m_ports == other.m_ports; }
    bool operator!=(const PortSet& other) const { return m_ports != other.m_ports; }

private:
    explicit PortSet(std::vector<uint16_t> ports);

    std::vector<uint16_t> m_ports;
};

}  // namespace FtpCore
