/**
 * @file ErrorCodes.h
 * @brief Stable, log-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace FtpCore {
namespace ErrorCodes {

// Configuration (rejected at construction or load time)
inline constexpr const char* CONFIG_INVALID_PORT = "FTPC-CFG-1000";
inline constexpr const char* CONFIG_INVALID_RANGE = "FTPC-CFG-1001";
inline constexpr const char* CONFIG_INVALID_HOST = "FTPC-CFG-1002";
inline constexpr const char* CONFIG_PARSE_ERROR = "FTPC-CFG-1100";
inline constexpr const char* CONFIG_FILE_UNREADABLE = "FTPC-CFG-1101";
inline constexpr const char* CONFIG_INVALID_ARGUMENT = "FTPC-CFG-1200";

// Control-channel listener
inline constexpr const char* NET_RESOLVE_FAILED = "FTPC-NET-1000";
inline constexpr const char* NET_NO_USABLE_ADDRESS = "FTPC-NET-1001";
inline constexpr const char* NET_BIND_FAILED = "FTPC-NET-1100";
inline constexpr const char* NET_LISTEN_FAILED = "FTPC-NET-1101";
inline constexpr const char* NET_SOCKET_FAILED = "FTPC-NET-1102";
inline constexpr const char* NET_ACCEPT_FAILED = "FTPC-NET-1200";
inline constexpr const char* NET_INVALID_STATE = "FTPC-NET-1300";

// Passive port pool
inline constexpr const char* POOL_RETURN_UNKNOWN_PORT = "FTPC-POOL-2000";
inline constexpr const char* POOL_RETURN_NOT_LEASED = "FTPC-POOL-2001";

}  // namespace ErrorCodes
}  // namespace FtpCore
