/**
 * @file CancellationToken.h
 * @brief Cooperative cancellation for blocking waits
 *
 * A CancellationSource owns the cancelled flag; CancellationToken is a cheap
 * copyable view handed to blocking operations. Blocking code registers a
 * wake-up callback for the duration of its wait.
 *
 * Usage:
 * @code
 * CancellationSource source;
 * std::thread t([&] { auto r = listener.waitForNextClient(source.token()); });
 * source.cancel();  // wakes the waiter, which returns WaitStatus::Cancelled
 * t.join();
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace FtpCore {

namespace detail {

/**
 * @brief Shared state between a source and its tokens
 */
struct CancellationState {
    std::mutex mutex;
    std::atomic<bool> cancelled{false};
    uint64_t nextId{1};
    std::map<uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

/**
 * @brief RAII handle that keeps a callback registered on a token
 *
 * The destructor unregisters the callback. If cancel() is running the
 * callback at that moment, the destructor waits for it to finish, so objects
 * captured by the callback may be destroyed right after the handle.
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    /// Unregister now (idempotent)
    void reset();

private:
    friend class CancellationToken;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
        : m_state(std::move(state)), m_id(id) {}

    std::weak_ptr<detail::CancellationState> m_state;
    uint64_t m_id{0};
};

/**
 * @brief Read-only view of a cancellation flag
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    /// True once the owning source has been cancelled
    bool isCancellationRequested() const;

    /// False for the default token, which can never be cancelled
    bool canBeCancelled() const { return static_cast<bool>(m_state); }

    /**
     * @brief Register a callback invoked once when cancellation happens
     *
     * If the token is already cancelled the callback runs immediately on the
     * calling thread. The callback must not call cancel() on the same source.
     */
    CancellationRegistration registerCallback(std::function<void()> callback) const;

    /**
     * @brief Sleep for up to timeout, returning early on cancellation
     * @return true if the token is cancelled when the wait ends
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// A token that can never be cancelled
    static CancellationToken none() { return CancellationToken(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> m_state;
};

/**
 * @brief Owner of a cancellation flag
 */
class CancellationSource {
public:
    CancellationSource() : m_state(std::make_shared<detail::CancellationState>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationToken token() const { return CancellationToken(m_state); }

    /**
     * @brief Set the flag and run every registered callback (once)
     *
     * Thread-safe; later calls are no-ops.
     */
    void cancel();

    bool isCancellationRequested() const { return m_state->cancelled.load(); }

private:
    std::shared_ptr<detail::CancellationState> m_state;
};

}  // namespace FtpCore
