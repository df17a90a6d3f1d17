/**
 * @file config.h
 * @brief Configuration constants for FtpCore
 *
 * This file contains the compile-time configuration constants used by the
 * listener and passive port pool: default endpoints, socket options, timing
 * values and the defaults applied when a configuration file leaves a value out.
 *
 * Runtime configuration (host, port, passive range) lives in ServerConfig;
 * the values here are only the defaults and hard limits.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/socket.h>

/**
 * @namespace FtpCore
 * @brief FtpCore namespace containing all public APIs
 *
 * All FtpCore classes, functions, and constants are within this namespace to
 * prevent naming conflicts with user code or third-party libraries.
 */
namespace FtpCore {

//=========================================================================
// Network Ports
//=========================================================================

/** @defgroup NetworkPorts Network Ports Configuration
 * @brief Control-channel listening port and passive port limits
 * @{
 */

/**
 * @brief Default host the control listener binds to.
 *
 * "localhost" usually resolves to both 127.0.0.1 and ::1, which makes the
 * default configuration exercise the multi-address path.
 */
constexpr const char* DEFAULT_LISTEN_HOST = "localhost";

/**
 * @brief Default control-channel port.
 *
 * 0 lets the first bind pick an ephemeral port; every further address of
 * the same host is then bound on that exact number.
 */
constexpr uint16_t DEFAULT_LISTEN_PORT = 0;

/**
 * @brief Lowest and highest valid TCP port numbers.
 *
 * Port 0 is accepted only as a listener request ("system assigned") and
 * never as a member of a passive port pool.
 */
constexpr int MIN_PORT_NUMBER = 1;
constexpr int MAX_PORT_NUMBER = 65535;

/** @} */ // end of NetworkPorts

//=========================================================================
// Socket Configuration
//=========================================================================

/** @defgroup SocketConfig Socket Configuration
 * @{
 */

/**
 * @brief Listen backlog used for control and data listeners
 */
constexpr int SOMAXCONN_VALUE = SOMAXCONN;

/**
 * @brief Backlog for the private passive data listener.
 *
 * A passive data channel serves exactly one client connection.
 */
constexpr int DATA_LISTEN_BACKLOG = 1;

/**
 * @brief Maximum textual length of a host name or literal address in config
 */
constexpr size_t MAX_HOST_LENGTH = 253;

/** @} */ // end of SocketConfig

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timeouts (in milliseconds)
 * @{
 */

/**
 * @brief Default time a passive data listener waits for the client to connect.
 */
constexpr uint32_t DATA_ACCEPT_TIMEOUT_MS = 30000;  // 30 seconds

/**
 * @brief Poll slice used by PassiveDataListener while waiting for a client.
 *
 * Keeps the wait responsive to cancellation without busy looping.
 */
constexpr uint32_t DATA_ACCEPT_POLL_SLICE_MS = 100;

/**
 * @brief Receive timeout applied to sockets handed to session code.
 */
constexpr uint32_t CONNECTION_TIMEOUT_MS = 30000;   // 30 seconds

/**
 * @brief Pause after an accept fails for lack of descriptors or memory.
 */
constexpr uint32_t ACCEPT_BACKOFF_MS = 100;

/**
 * @brief Minimum gap between two logged accept failures in ftpcore_server.
 */
constexpr uint32_t ACCEPT_FAILURE_LOG_INTERVAL_MS = 5000;   // 5 seconds

/** @} */ // end of Timing

//=========================================================================
// Threading
//=========================================================================

/** @defgroup Threading Multi-threading Configuration
 * @{
 */

/**
 * @brief Maximum number of concurrent session threads in ftpcore_server.
 *
 * Connections beyond this cap are closed immediately after accept.
 */
constexpr size_t MAX_CONCURRENT_SESSIONS = 64;

/** @} */ // end of Threading

//=========================================================================
// Logging
//=========================================================================

/**
 * @brief Default minimum level for ConsoleLogger ("debug", "info", "warning", "error")
 */
constexpr const char* DEFAULT_LOG_LEVEL = "info";

}  // namespace FtpCore
