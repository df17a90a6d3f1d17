/**
 * @file PortSet.cpp
 * @brief Configured set of candidate passive ports
 */

#include "ftpcore/PortSet.h"
#include "ftpcore/NetErrors.h"
#include "ftpcore/config.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace FtpCore {

namespace {

    void checkPort(int port) {
        if (port < MIN_PORT_NUMBER || port > MAX_PORT_NUMBER) {
            throw ConfigurationError(ErrorCodes::CONFIG_INVALID_PORT,
                                     "passive port " + std::to_string(port) + " is out of range (1-65535)");
        }
    }

    std::string trim(const std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
            ++b;
        }
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
            --e;
        }
        return s.substr(b, e - b);
    }

    int parsePortNumber(const std::string& text, const std::string& item) {
        const std::string t = trim(text);
        if (t.empty() || t.size() > 5 ||
            !std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw ConfigurationError(ErrorCodes::CONFIG_INVALID_RANGE,
                                     "malformed passive port item \"" + item + "\"");
        }
        return std::stoi(t);
    }

} // anonymous namespace

PortSet::PortSet(std::vector<uint16_t> ports)
    : m_ports(std::move(ports))
{
    std::sort(m_ports.begin(), m_ports.end());
    m_ports.erase(std::unique(m_ports.begin(), m_ports.end()), m_ports.end());
}

PortSet PortSet::range(int minPort, int maxPort) {
    checkPort(minPort);
    checkPort(maxPort);
    if (minPort > maxPort) {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_RANGE,
                                 "passive range " + std::to_string(minPort) + "-" + std::to_string(maxPort) +
                                 " has min greater than max");
    }

    std::vector<uint16_t> ports;
    ports.reserve(static_cast<size_t>(maxPort - minPort + 1));
    for (int p = minPort; p <= maxPort; ++p) {
        ports.push_back(static_cast<uint16_t>(p));
    }
    return PortSet(std::move(ports));
}

PortSet PortSet::list(const std::vector<int>& ports) {
    std::vector<uint16_t> out;
    out.reserve(ports.size());
    for (int p : ports) {
        checkPort(p);
        out.push_back(static_cast<uint16_t>(p));
    }
    return PortSet(std::move(out));
}

PortSet PortSet::parse(const std::string& text) {
    std::vector<uint16_t> out;
    std::stringstream ss(text);
    std::string item;
    bool sawItem = false;

    while (std::getline(ss, item, ',')) {
        const std::string t = trim(item);
        if (t.empty()) {
            // "a,,b" or a trailing comma is malformed; a blank string is not
            if (!trim(text).empty()) {
                throw ConfigurationError(ErrorCodes::CONFIG_INVALID_RANGE,
                                         "empty item in passive port list \"" + text + "\"");
            }
            continue;
        }
        sawItem = true;

        const size_t dash = t.find('-');
        if (dash == std::string::npos) {
            const int port = parsePortNumber(t, t);
            checkPort(port);
            out.push_back(static_cast<uint16_t>(port));
            continue;
        }

        const PortSet sub = range(parsePortNumber(t.substr(0, dash), t), parsePortNumber(t.substr(dash + 1), t));
        out.insert(out.end(), sub.m_ports.begin(), sub.m_ports.end());
    }

    if (!sawItem) {
        return PortSet();
    }
    // getline() does not report the empty item after a trailing comma
    if (trim(text).back() == ',') {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_RANGE,
                                 "empty item in passive port list \"" + text + "\"");
    }
    return PortSet(std::move(out));
}

bool PortSet::contains(uint16_t port) const {
    return std::binary_search(m_ports.begin(), m_ports.end(), port);
}

std::string PortSet::toString() const {
    std::ostringstream oss;
    size_t i = 0;
    while (i < m_ports.size()) {
        size_t j = i;
        while (j + 1 < m_ports.size() && m_ports[j + 1] == m_ports[j] + 1) {
            ++j;
        }
        if (i > 0) {
            oss << ',';
        }
        oss << m_ports[i];
        if (j > i) {
            oss << '-' << m_ports[j];
        }
        i = j + 1;
    }
    return oss.str();
}

}  // namespace FtpCore
