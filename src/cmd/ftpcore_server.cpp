/**
 * @file ftpcore_server.cpp
 * @brief Passive-mode data channel server built on MultiBindingListener
 *
 * Each control connection gets a session thread that:
 * - leases a passive port from the configured pool
 * - opens a private data listener on the address the client connected to
 * - reports that endpoint to the client as one text line
 * - waits for exactly one data connection, then returns the port
 *
 * Usage:
 *   ftpcore_server [--config FILE] [--host HOST] [--port PORT] [--pasv PORTS]
 *                  [--log-level LEVEL] [--log-file FILE]
 */

#include "ftpcore/CancellationToken.h"
#include "ftpcore/Debug.h"
#include "ftpcore/Logger.h"
#include "ftpcore/MultiBindingListener.h"
#include "ftpcore/NetErrors.h"
#include "ftpcore/PassiveDataListener.h"
#include "ftpcore/PasvPortPool.h"
#include "ftpcore/ServerArgs.h"
#include "ftpcore/ServerConfig.h"
#include "ftpcore/ThreadSafeLog.h"
#include "ftpcore/config.h"

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <list>
#include <memory>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <system_error>
#include <thread>

using namespace FtpCore;

//=============================================================================
// Global Variables for Signal Handling
//=============================================================================

static std::atomic<bool> g_running(true);

//=============================================================================
// Signal Handler
//=============================================================================

// Only async-signal-safe work here; the main thread notices the flag and cancels
extern "C" void signalHandler(int signal) {
    (void)signal;
    g_running.store(false);
}

//=============================================================================
// Helper Functions
//=============================================================================

namespace {

/**
 * @brief Write a whole line to a connected socket
 * @return true if every byte was sent
 */
bool sendLine(int fd, const std::string& line) {
    const std::string data = line + "\r\n";
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

/**
 * @brief Reply announcing the data endpoint
 *
 * IPv4 uses the classic "h1,h2,h3,h4,p1,p2" form, IPv6 the extended form.
 */
std::string passiveReply(const NetAddress& dataAddress) {
    std::ostringstream oss;
    const uint16_t port = dataAddress.port();

    if (dataAddress.isIPv4()) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(dataAddress.data());
        const uint32_t ip = ntohl(sin->sin_addr.s_addr);
        oss << "227 Entering Passive Mode ("
            << ((ip >> 24) & 0xFF) << "," << ((ip >> 16) & 0xFF) << ","
            << ((ip >> 8) & 0xFF) << "," << (ip & 0xFF) << ","
            << (port >> 8) << "," << (port & 0xFF) << ")";
    } else {
        oss << "229 Entering Extended Passive Mode (|||" << port << "|)";
    }
    return oss.str();
}

//=============================================================================
// Session
//=============================================================================

/**
 * @brief Serve one control connection
 *
 * Runs on its own thread. Never throws: every failure is logged and reported
 * to the client where possible.
 */
void runSession(ClientConnection conn,
                PortPool& pool,
                const ServerConfig& cfg,
                const CancellationToken& shutdown,
                const std::shared_ptr<Logger>& logger) {
    const std::string peer = conn.peerAddress.toEndpointString();
    const int fd = conn.socket.get();

    if (!setSocketRecvTimeout(fd, CONNECTION_TIMEOUT_MS)) {
        logger->warning("Could not set receive timeout for " + peer);
    }

    auto reply = [&](const std::string& line) {
        if (!sendLine(fd, line)) {
            logger->debug("Session " + peer + ": could not send \"" + line + "\"");
        }
    };

    PortLeaseGuard lease(pool, pool.leasePort());
    if (!lease) {
        logger->warning("No passive port for " + peer + " (" + leaseStatusToString(lease.status()) + ")");
        reply("425 Can't open passive connection");
        return;
    }

    try {
        PassiveDataListener data(conn.localAddress.withPort(lease.port()));
        logger->info("Session " + peer + ": data listener on " + data.getLocalAddress().toEndpointString());

        if (!sendLine(fd, passiveReply(data.getLocalAddress()))) {
            logger->warning("Session " + peer + ": client went away before the reply");
            return;
        }

        auto dataConn = data.acceptClient(cfg.dataAcceptTimeoutMs, shutdown);
        if (!dataConn) {
            logger->info("Session " + peer + ": no data connection");
            reply("425 No data connection");
            return;
        }

        logger->info("Session " + peer + ": data connection from " + dataConn->peerAddress.toEndpointString());
        if (!sendLine(dataConn->socket.get(), "FtpCore data channel " + data.getLocalAddress().toEndpointString())) {
            logger->warning("Session " + peer + ": data connection closed early");
        }
        reply("226 Transfer complete");
    } catch (const NetError& e) {
        logger->error("Session " + peer + ": " + e.what());
        reply("425 Can't open data connection");
    }
}

/**
 * @brief A running session thread and its completion flag
 */
struct SessionThread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

/**
 * @brief Join every finished session thread
 */
void reapSessions(std::list<SessionThread>& sessions) {
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = sessions.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<Logger> makeLogger(const ServerConfig& cfg) {
    auto console = std::make_shared<ConsoleLogger>(cfg.logLevel);
    if (cfg.logFile.empty()) {
        return console;
    }
    ThreadSafeLog::initialize(cfg.logFile);
    return std::make_shared<TeeLogger>(console, std::make_shared<TraceFileLogger>(LogLevel::Debug));
}

} // anonymous namespace

//=============================================================================
// Main Function
//=============================================================================

int main(int argc, char* argv[]) {
    ServerConfig cfg;
    try {
        const ServerArgs args = ServerArgs::parseOrThrow(argc, argv);
        if (args.showHelp) {
            std::cout << ServerArgs::usage(argv[0]);
            return 0;
        }
        cfg = args.resolveConfig();
    } catch (const ConfigurationError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n\n" << ServerArgs::usage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    //=========================================================================
    // Banner
    //=========================================================================

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "  FtpCore Server\n";
    std::cout << "========================================\n";
    std::cout << "Host: " << cfg.host << "\n";
    std::cout << "Port: " << cfg.port << (cfg.port == 0 ? " (system assigned)" : "") << "\n";
    std::cout << "Passive Ports: " << (cfg.pasvPorts.empty() ? "any" : cfg.pasvPorts.toString()) << "\n";
    std::cout << "Max Concurrent Sessions: " << MAX_CONCURRENT_SESSIONS << "\n";
    std::cout << "========================================\n\n";

    auto logger = makeLogger(cfg);
    auto pool = makePortPool(cfg.pasvPorts, logger);

    //=========================================================================
    // Start Listener
    //=========================================================================

    MultiBindingListener listener(logger, cfg.host, cfg.port);
    try {
        listener.start();
        listener.beginAccepting();
    } catch (const NetError& e) {
        LOG_ERROR("Failed to start listener: " << e.what());
        return 1;
    }

    for (const auto& endpoint : listener.getBoundEndpoints()) {
        LOG_INFO("Listening on " << endpoint);
    }
    LOG_INFO("Server is running. Press Ctrl+C to stop.");

    CancellationSource shutdown;

    // Signal watcher: turns the flag set by the handler into a cancellation
    std::thread watcher([&shutdown]() {
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        shutdown.cancel();
    });

    //=========================================================================
    // Main Loop
    //=========================================================================

    std::list<SessionThread> sessions;
    AcceptFailureThrottle acceptLog{std::chrono::milliseconds(ACCEPT_FAILURE_LOG_INTERVAL_MS)};
    int exitCode = 0;

    while (!shutdown.isCancellationRequested()) {
        WaitResult result;
        try {
            result = listener.waitForNextClient(shutdown.token());
        } catch (const AcceptFailure& e) {
            const AcceptErrorAction action = classifyAcceptError(e.sysError());
            if (action == AcceptErrorAction::Fatal) {
                LOG_ERROR(e.what() << "; listener " << e.listenerIndex() << " is unusable, shutting down");
                exitCode = 1;
                break;
            }
            if (acceptLog.shouldLog()) {
                LOG_WARNING(e.what() << " (" << acceptErrorActionToString(action) << ")"
                            << (acceptLog.suppressed() ? ", " + std::to_string(acceptLog.suppressed()) +
                                                         " similar failure(s) suppressed" : std::string()));
            }
            if (action == AcceptErrorAction::BackOff) {
                (void)shutdown.token().waitFor(std::chrono::milliseconds(ACCEPT_BACKOFF_MS));
            }
            continue;
        }

        if (!result.accepted()) {
            break;
        }

        reapSessions(sessions);
        if (sessions.size() >= MAX_CONCURRENT_SESSIONS) {
            LOG_WARNING("Session limit reached, dropping " << result.client.peerAddress.toEndpointString());
            if (!sendLine(result.client.socket.get(), "421 Too many connections")) {
                LOG_DEBUG("Could not send 421 to " << result.client.peerAddress.toEndpointString());
            }
            continue;
        }

        LOG_DEBUG("Client " << result.client.peerAddress.toEndpointString()
                  << " on listener " << result.client.listenerIndex);

        // The list entry exists before its thread, so no joinable thread is
        // ever left without an owner
        auto done = std::make_shared<std::atomic<bool>>(false);
        sessions.push_back(SessionThread{std::thread(), done});
        try {
            sessions.back().thread = std::thread(
                [conn = std::move(result.client), &pool, &cfg, token = shutdown.token(), logger, done]() mutable {
                    runSession(std::move(conn), *pool, cfg, token, logger);
                    done->store(true);
                });
        } catch (const std::system_error& e) {
            sessions.pop_back();
            LOG_ERROR("Could not start session thread: " << e.what());
            exitCode = 1;
            break;
        }
    }

    //=========================================================================
    // Cleanup
    //=========================================================================

    LOG_INFO("Stopping listener...");
    g_running.store(false);
    shutdown.cancel();
    listener.stop();

    for (auto& s : sessions) {
        if (s.thread.joinable()) {
            s.thread.join();
        }
    }
    if (watcher.joinable()) {
        watcher.join();
    }

    LOG_INFO("Server stopped.");
    return exitCode;
}
