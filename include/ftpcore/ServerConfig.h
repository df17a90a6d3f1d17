/**
 * @file ServerConfig.h
 * @brief Runtime configuration for the listener and passive port pool
 */

#pragma once

#include "ftpcore/Logger.h"
#include "ftpcore/PortSet.h"
#include "ftpcore/config.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace FtpCore {

/**
 * @brief Server configuration
 *
 * JSON form (every key optional, unknown keys ignored):
 * @code
 * {
 *   "host": "ftp.example.org",
 *   "port": 2121,
 *   "pasv": "50000-50100",
 *   "log_level": "info",
 *   "log_file": "ftpcore-trace.log",
 *   "data_accept_timeout_ms": 30000
 * }
 * @endcode
 *
 * "pasv" may also be an array of ports, or an object {"min": a, "max": b}.
 * An absent or empty "pasv" means no range: data listeners bind to a port
 * the system picks.
 */
struct ServerConfig {
    std::string host = DEFAULT_LISTEN_HOST;
    int port = DEFAULT_LISTEN_PORT;
    PortSet pasvPorts;
    LogLevel logLevel = LogLevel::Info;
    std::string logFile;
    uint32_t dataAcceptTimeoutMs = DATA_ACCEPT_TIMEOUT_MS;

    /**
     * @brief Check value ranges
     * @throws ConfigurationError on the first invalid value
     */
    void validate() const;

    nlohmann::json toJson() const;

    /**
     * @brief Build from JSON, starting from defaults
     * @throws ConfigurationError on wrong types or invalid values
     */
    static ServerConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Read and parse a JSON config file
     * @throws ConfigurationError if the file cannot be read or parsed
     */
    static ServerConfig loadFile(const std::filesystem::path& path);
};

}  // namespace FtpCore
