/**
 * @file MultiBindingListener.h
 * @brief Control-channel listener bound to every address of a host name
 */

#pragma once

#include "ftpcore/CancellationToken.h"
#include "ftpcore/HostResolver.h"
#include "ftpcore/Logger.h"
#include "ftpcore/NetAddress.h"
#include "ftpcore/SocketHandle.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace FtpCore {

//=============================================================================
// Wait result
//=============================================================================

/**
 * @brief Outcome of MultiBindingListener::waitForNextClient()
 */
enum class WaitStatus {
    Accepted,   ///< client holds a new connection
    Cancelled,  ///< the token fired before any connection completed
    Stopped     ///< the listener is not accepting (never begun, or stopped)
};

const char* waitStatusToString(WaitStatus status);

struct WaitResult {
    WaitStatus status{WaitStatus::Stopped};
    ClientConnection client;

    bool accepted() const { return status == WaitStatus::Accepted; }
};

//=============================================================================
// Accept failure handling
//=============================================================================

/**
 * @brief What a caller should do after waitForNextClient() threw AcceptFailure
 */
enum class AcceptErrorAction {
    Retry,    ///< transient; wait again at once
    BackOff,  ///< resource exhaustion; pause before waiting again
    Fatal     ///< the listening socket is unusable; stop the listener
};

/**
 * @brief Classify an AcceptFailure by its errno value
 *
 * EBADF, EINVAL, ENOTSOCK, EOPNOTSUPP and EFAULT are Fatal. EMFILE, ENFILE,
 * ENOBUFS and ENOMEM are BackOff. Everything else is Retry.
 */
AcceptErrorAction classifyAcceptError(int sysError);

const char* acceptErrorActionToString(AcceptErrorAction action);

/**
 * @brief Rate limiter for repeated accept failure log lines
 *
 * The first failure is always logged; after that at most one per interval.
 * Failures skipped in between are counted and reported with the next one.
 */
class AcceptFailureThrottle {
public:
    explicit AcceptFailureThrottle(std::chrono::milliseconds interval) : m_interval(interval) {}

    /// True if the failure seen at `now` should be logged
    bool shouldLog(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /// Failures skipped before the last one shouldLog() allowed
    size_t suppressed() const { return m_lastSuppressed; }

private:
    std::chrono::milliseconds m_interval;
    std::optional<std::chrono::steady_clock::time_point> m_lastLogged;
    size_t m_pending{0};
    size_t m_lastSuppressed{0};
};

//=============================================================================
// MultiBindingListener Class
//=============================================================================

/**
 * @class MultiBindingListener
 * @brief One logical accept point over one listening socket per resolved address
 *
 * A host name may resolve to several IPv4/IPv6 addresses that all have to be
 * served. start() binds every address on the same port number: with a
 * requested port of 0 the first bind picks the port and every later address
 * must bind on that exact number, otherwise start() rolls back.
 *
 * Architecture:
 * - One acceptor thread per bound socket, each holding exactly one
 *   outstanding accept()
 * - A completed accept is parked in its slot until waitForNextClient()
 *   claims it; claiming re-arms the slot, so no address is ever left without
 *   an outstanding accept and nothing queues up behind it
 * - stop() shuts the sockets down to wake the blocked accept() calls and
 *   joins the acceptor threads
 *
 * Thread Safety:
 * - waitForNextClient() and the getters may be called from any thread
 * - start(), beginAccepting() and stop() are serialized internally, but the
 *   lifecycle order (start, beginAccepting, wait..., stop) is the caller's job
 *
 * Usage:
 * @code
 * MultiBindingListener listener(logger, "ftp.example.org", 21);
 * listener.start();
 * listener.beginAccepting();
 * for (;;) {
 *     WaitResult r = listener.waitForNextClient(shutdown.token());
 *     if (!r.accepted()) break;
 *     dispatch(std::move(r.client));
 * }
 * listener.stop();
 * @endcode
 */
class MultiBindingListener {
public:
    /**
     * @brief Constructor
     * @param logger Optional logger (may be null)
     * @param host Host name or literal address to bind
     * @param port Port to listen on; 0 lets the system choose
     * @param resolver Host resolver; null means SystemHostResolver
     *
     * @throws ConfigurationError if port is outside 0-65535 or host is empty
     */
    MultiBindingListener(std::shared_ptr<Logger> logger,
                         const std::string& host,
                         int port,
                         std::shared_ptr<HostResolver> resolver = nullptr);

    /**
     * @brief Destructor
     *
     * Stops the listener if still bound.
     */
    ~MultiBindingListener();

    MultiBindingListener(const MultiBindingListener&) = delete;
    MultiBindingListener& operator=(const MultiBindingListener&) = delete;
    MultiBindingListener(MultiBindingListener&&) = delete;
    MultiBindingListener& operator=(MultiBindingListener&&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Resolve the host and bind one listening socket per address
     *
     * @throws ResolveError if the host cannot be resolved to any IPv4/IPv6 address
     * @throws BindFailure if any address cannot be bound; every socket opened
     *         by this call is closed before the exception leaves
     * @throws ListenerStateError if the listener is already bound
     */
    void start();

    /**
     * @brief Issue one outstanding accept per bound socket
     *
     * No-op if already accepting.
     * @throws ListenerStateError if start() has not succeeded
     */
    void beginAccepting();

    /**
     * @brief Block until a connection arrives on any address or token fires
     *
     * The slot that produced the connection is re-armed before returning.
     * Cancellation only ends this wait; outstanding accepts stay valid.
     * Connections are handed out in the order their accepts completed.
     *
     * @throws AcceptFailure if the earliest completed accept failed; its slot
     *         is re-armed so the caller may keep waiting
     */
    WaitResult waitForNextClient(const CancellationToken& token = CancellationToken());

    /**
     * @brief Close every bound socket and abandon outstanding accepts
     *
     * Connections accepted but not yet claimed are closed. Idempotent. The
     * instance may be started again afterwards.
     */
    void stop();

    //=========================================================================
    // Queries
    //=========================================================================

    /**
     * @brief Port every bound socket listens on; 0 when not bound
     */
    uint16_t getPort() const;

    /**
     * @brief Bound addresses, in bind order ("address:port" strings)
     */
    std::vector<std::string> getBoundEndpoints() const;

    /**
     * @brief Bound addresses, in bind order
     */
    std::vector<NetAddress> getBoundAddresses() const;

    size_t getListenerCount() const;
    bool isBound() const;
    bool isAccepting() const;

    const std::string& getHost() const { return m_host; }
    uint16_t getRequestedPort() const { return m_requestedPort; }

private:
    enum class State { Unbound, Bound, Accepting };
    enum class SlotState { Idle, Pending, Completed, Failed };

    /**
     * @brief One bound socket and its single outstanding accept
     */
    struct AcceptSlot {
        size_t index{0};
        SocketHandle listenSocket;
        NetAddress boundAddress;
        std::thread acceptor;
        SlotState state{SlotState::Idle};
        ClientConnection result;
        int error{0};
        uint64_t completionSeq{0};
    };

    void acceptorThreadFunc(AcceptSlot* slot);
    AcceptSlot* findCompletedSlotLocked() const;
    void stopAcceptorsAndClose();
    void log(LogLevel level, const std::string& message) const;

    // Configuration
    std::shared_ptr<Logger> m_logger;
    std::shared_ptr<HostResolver> m_resolver;
    std::string m_host;
    uint16_t m_requestedPort;

    // Serializes start()/beginAccepting()/stop()
    std::mutex m_lifecycleMutex;

    // Protects everything below
    mutable std::mutex m_mutex;
    std::condition_variable m_slotCv;    ///< wakes acceptors when re-armed or stopping
    std::condition_variable m_clientCv;  ///< wakes waiters on completion, cancel or stop
    std::vector<std::unique_ptr<AcceptSlot>> m_slots;
    State m_state{State::Unbound};
    uint16_t m_port{0};
    bool m_stopRequested{false};
    uint64_t m_generation{0};
    uint64_t m_completionCounter{0};
};

}  // namespace FtpCore
