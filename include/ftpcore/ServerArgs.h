/**
 * @file ServerArgs.h
 * @brief Command line parsing for ftpcore_server
 */

#pragma once

#include "ftpcore/ServerConfig.h"

#include <optional>
#include <string>

namespace FtpCore {

struct ServerArgs {
    bool showHelp = false;

    std::optional<std::string> configPath;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> pasv;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;

    /**
     * @brief Parse argv
     * @throws ConfigurationError on unknown flags, missing or malformed values
     */
    static ServerArgs parseOrThrow(int argc, const char* const* argv);

    /**
     * @brief Build the effective configuration
     *
     * Starts from the config file (if given) or defaults, then applies every
     * flag that was set.
     * @throws ConfigurationError if the result is invalid
     */
    ServerConfig resolveConfig() const;

    static std::string usage(const std::string& program);
};

}  // namespace FtpCore
