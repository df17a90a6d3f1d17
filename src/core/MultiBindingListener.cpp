/**
 * @file MultiBindingListener.cpp
 * @brief Control-channel listener bound to every address of a host name
 */

#include "ftpcore/MultiBindingListener.h"
#include "ftpcore/NetErrors.h"
#include "ftpcore/config.h"

#include <cerrno>
#include <system_error>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace FtpCore {

const char* waitStatusToString(WaitStatus status) {
    switch (status) {
        case WaitStatus::Accepted:  return "accepted";
        case WaitStatus::Cancelled: return "cancelled";
        case WaitStatus::Stopped:   return "stopped";
    }
    return "unknown";
}

AcceptErrorAction classifyAcceptError(int sysError) {
    switch (sysError) {
        case EBADF:
        case EINVAL:
        case ENOTSOCK:
        case EOPNOTSUPP:
        case EFAULT:
            return AcceptErrorAction::Fatal;
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
            return AcceptErrorAction::BackOff;
        default:
            return AcceptErrorAction::Retry;
    }
}

const char* acceptErrorActionToString(AcceptErrorAction action) {
    switch (action) {
        case AcceptErrorAction::Retry:   return "retry";
        case AcceptErrorAction::BackOff: return "back off";
        case AcceptErrorAction::Fatal:   return "fatal";
    }
    return "unknown";
}

bool AcceptFailureThrottle::shouldLog(std::chrono::steady_clock::time_point now) {
    if (m_lastLogged && now - *m_lastLogged < m_interval) {
        ++m_pending;
        return false;
    }
    m_lastLogged = now;
    m_lastSuppressed = m_pending;
    m_pending = 0;
    return true;
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

MultiBindingListener::MultiBindingListener(std::shared_ptr<Logger> logger,
                                           const std::string& host,
                                           int port,
                                           std::shared_ptr<HostResolver> resolver)
    : m_logger(std::move(logger))
    , m_resolver(std::move(resolver))
    , m_host(host)
    , m_requestedPort(0)
{
    if (port < 0 || port > MAX_PORT_NUMBER) {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_PORT,
                                 "listener port " + std::to_string(port) + " is out of range (0-65535)");
    }
    if (host.empty() || host.size() > MAX_HOST_LENGTH) {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_HOST, "listener host must be 1-253 characters");
    }

    m_requestedPort = static_cast<uint16_t>(port);
    if (!m_resolver) {
        m_resolver = std::make_shared<SystemHostResolver>();
    }
}

MultiBindingListener::~MultiBindingListener() {
    stop();
}

//=============================================================================
// MultiBindingListener: start()
//=============================================================================

void MultiBindingListener::start() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::Unbound) {
            throw ListenerStateError("start() called on a listener that is already bound");
        }
    }

    log(LogLevel::Info, "Server configured for listening on " + m_host + ":" + std::to_string(m_requestedPort));

    std::vector<NetAddress> addresses;
    for (const auto& address : m_resolver->resolve(m_host)) {
        if (address.isIPv4() || address.isIPv6()) {
            addresses.push_back(address);
        }
    }
    if (addresses.empty()) {
        throw ResolveError(ErrorCodes::NET_NO_USABLE_ADDRESS, m_host, "no IPv4 or IPv6 address");
    }

    // Bind every address on one port. Sockets live in `opened` until all
    // binds succeeded, so unwinding closes them.
    std::vector<std::unique_ptr<AcceptSlot>> opened;
    uint16_t selectedPort = m_requestedPort;

    try {
        for (const auto& address : addresses) {
            auto slot = std::make_unique<AcceptSlot>();
            slot->index = opened.size();
            slot->listenSocket = openListeningSocket(address.withPort(selectedPort), SOMAXCONN_VALUE);
            slot->boundAddress = getLocalAddress(slot->listenSocket.get());

            if (slot->boundAddress.family() == AF_UNSPEC) {
                const int err = errno;
                throw BindFailure(ErrorCodes::NET_BIND_FAILED, address.withPort(selectedPort).toEndpointString(),
                                  err, "getsockname(): " + sysErrorString(err));
            }

            if (selectedPort == 0) {
                selectedPort = slot->boundAddress.port();
            }

            log(LogLevel::Debug, "Started listening on " + slot->boundAddress.toEndpointString());
            opened.push_back(std::move(slot));
        }
    } catch (const BindFailure& e) {
        const size_t rolledBack = opened.size();
        opened.clear();
        log(LogLevel::Error, std::string(e.what()) + " (closed " + std::to_string(rolledBack) +
                             " socket(s) opened by this start)");
        throw;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_slots = std::move(opened);
    m_port = selectedPort;
    m_state = State::Bound;
    m_stopRequested = false;

    log(LogLevel::Info, "Listening on " + std::to_string(m_slots.size()) + " address(es), port " +
                        std::to_string(m_port));
}

//=============================================================================
// MultiBindingListener: beginAccepting()
//=============================================================================

void MultiBindingListener::beginAccepting() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Accepting) {
            return;
        }
        if (m_state != State::Bound) {
            throw ListenerStateError("beginAccepting() called before start()");
        }
        for (auto& slot : m_slots) {
            slot->state = SlotState::Pending;
        }
        m_state = State::Accepting;
    }

    try {
        for (auto& slot : m_slots) {
            slot->acceptor = std::thread(&MultiBindingListener::acceptorThreadFunc, this, slot.get());
        }
    } catch (const std::system_error& e) {
        log(LogLevel::Error, std::string("Failed to start acceptor thread: ") + e.what());
        stopAcceptorsAndClose();
        throw;
    }
}

//=============================================================================
// MultiBindingListener: waitForNextClient()
//=============================================================================

WaitResult MultiBindingListener::waitForNextClient(const CancellationToken& token) {
    // Registered before m_mutex is taken: cancel() holds the token's lock
    // while the callback takes m_mutex.
    CancellationRegistration registration = token.registerCallback([this]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_clientCv.notify_all();
    });

    std::unique_lock<std::mutex> lock(m_mutex);
    WaitResult result;

    if (m_state != State::Accepting) {
        result.status = WaitStatus::Stopped;
        return result;
    }

    const uint64_t generation = m_generation;
    AcceptSlot* ready = nullptr;

    m_clientCv.wait(lock, [&]() {
        if (m_generation != generation || m_state != State::Accepting) {
            return true;
        }
        ready = findCompletedSlotLocked();
        return ready != nullptr || token.isCancellationRequested();
    });

    if (m_generation != generation || m_state != State::Accepting) {
        result.status = WaitStatus::Stopped;
        return result;
    }

    if (!ready) {
        result.status = WaitStatus::Cancelled;
        return result;
    }

    if (ready->state == SlotState::Failed) {
        AcceptFailure failure(ready->index, ready->boundAddress.toEndpointString(),
                              ready->error, sysErrorString(ready->error));
        ready->error = 0;
        ready->state = SlotState::Pending;
        m_slotCv.notify_all();
        lock.unlock();

        log(LogLevel::Error, failure.what());
        throw failure;
    }

    result.status = WaitStatus::Accepted;
    result.client = std::move(ready->result);
    ready->result = ClientConnection();
    ready->state = SlotState::Pending;
    m_slotCv.notify_all();
    return result;
}

//=============================================================================
// MultiBindingListener: stop()
//=============================================================================

void MultiBindingListener::stop() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    stopAcceptorsAndClose();
}

void MultiBindingListener::stopAcceptorsAndClose() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Unbound && m_slots.empty()) {
            m_port = 0;
            return;
        }
        m_state = State::Unbound;
        m_stopRequested = true;
        ++m_generation;
        m_slotCv.notify_all();
        m_clientCv.notify_all();
    }

    // Shutting a listening socket down makes a blocked accept() fail with
    // EINVAL on Linux; the acceptor sees m_stopRequested and exits.
    for (auto& slot : m_slots) {
        if (slot->listenSocket) {
            (void)::shutdown(slot->listenSocket.get(), SHUT_RDWR);
        }
    }

    for (auto& slot : m_slots) {
        if (slot->acceptor.joinable()) {
            slot->acceptor.join();
        }
    }

    std::vector<std::unique_ptr<AcceptSlot>> closing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        closing.swap(m_slots);
        m_port = 0;
        m_stopRequested = false;
    }

    size_t unclaimed = 0;
    for (const auto& slot : closing) {
        if (slot->state == SlotState::Completed) {
            ++unclaimed;
        }
    }
    const size_t count = closing.size();
    closing.clear();

    log(LogLevel::Info, "Stopped listening on " + std::to_string(count) + " address(es)" +
                        (unclaimed ? ", dropped " + std::to_string(unclaimed) + " unclaimed connection(s)" : ""));
}

//=============================================================================
// Queries
//=============================================================================

uint16_t MultiBindingListener::getPort() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_port;
}

std::vector<std::string> MultiBindingListener::getBoundEndpoints() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_slots.size());
    for (const auto& slot : m_slots) {
        out.push_back(slot->boundAddress.toEndpointString());
    }
    return out;
}

std::vector<NetAddress> MultiBindingListener::getBoundAddresses() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<NetAddress> out;
    out.reserve(m_slots.size());
    for (const auto& slot : m_slots) {
        out.push_back(slot->boundAddress);
    }
    return out;
}

size_t MultiBindingListener::getListenerCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

bool MultiBindingListener::isBound() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state != State::Unbound;
}

bool MultiBindingListener::isAccepting() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == State::Accepting;
}

//=============================================================================
// Private
//=============================================================================

void MultiBindingListener::acceptorThreadFunc(AcceptSlot* slot) {
    // The socket stays open until stop() has joined this thread
    const int listenFd = slot->listenSocket.get();

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_slotCv.wait(lock, [&]() {
                return m_stopRequested || slot->state == SlotState::Pending;
            });
            if (m_stopRequested) {
                return;
            }
        }

        sockaddr_storage peer{};
        socklen_t peerLen = sizeof(peer);
        SocketHandle client(::accept4(listenFd, reinterpret_cast<sockaddr*>(&peer), &peerLen, SOCK_CLOEXEC));
        const int err = client ? 0 : errno;

        // Interrupted, or the peer gave up before we got to it: the accept is
        // still outstanding, not failed.
        if (!client && (err == EINTR || err == ECONNABORTED)) {
            continue;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopRequested) {
            return;  // client (if any) is closed by its handle
        }

        if (client) {
            slot->result.peerAddress = NetAddress::fromSockaddr(reinterpret_cast<const sockaddr*>(&peer), peerLen);
            slot->result.localAddress = getLocalAddress(client.get());
            slot->result.listenerIndex = slot->index;
            slot->result.socket = std::move(client);
            slot->state = SlotState::Completed;
        } else {
            slot->error = err;
            slot->state = SlotState::Failed;
        }
        slot->completionSeq = ++m_completionCounter;
        m_clientCv.notify_all();
    }
}

MultiBindingListener::AcceptSlot* MultiBindingListener::findCompletedSlotLocked() const {
    AcceptSlot* earliest = nullptr;
    for (const auto& slot : m_slots) {
        if (slot->state != SlotState::Completed && slot->state != SlotState::Failed) {
            continue;
        }
        if (!earliest || slot->completionSeq < earliest->completionSeq) {
            earliest = slot.get();
        }
    }
    return earliest;
}

void MultiBindingListener::log(LogLevel level, const std::string& message) const {
    if (m_logger) {
        m_logger->write(level, message);
    }
}

}  // namespace FtpCore
