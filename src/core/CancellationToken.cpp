/**
 * @file CancellationToken.cpp
 * @brief Cooperative cancellation implementation
 */

#include "ftpcore/CancellationToken.h"

#include <condition_variable>
#include <thread>

namespace FtpCore {

//=============================================================================
// CancellationRegistration
//=============================================================================

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : m_state(std::move(other.m_state))
    , m_id(other.m_id)
{
    other.m_id = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        m_state = std::move(other.m_state);
        m_id = other.m_id;
        other.m_id = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (m_id == 0) {
        return;
    }

    // cancel() runs callbacks while holding the state mutex, so taking it
    // here also waits out a callback that is currently executing.
    if (auto state = m_state.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(m_id);
    }
    m_state.reset();
    m_id = 0;
}

//=============================================================================
// CancellationToken
//=============================================================================

bool CancellationToken::isCancellationRequested() const {
    return m_state && m_state->cancelled.load();
}

CancellationRegistration CancellationToken::registerCallback(std::function<void()> callback) const {
    if (!m_state || !callback) {
        return {};
    }

    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (!m_state->cancelled.load()) {
            const uint64_t id = m_state->nextId++;
            m_state->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(m_state, id);
        }
    }

    // Already cancelled: run inline, nothing to unregister
    callback();
    return {};
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    if (!m_state) {
        std::this_thread::sleep_for(timeout);
        return false;
    }

    std::mutex mutex;
    std::condition_variable cv;
    bool fired = false;

    CancellationRegistration registration = registerCallback([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        fired = true;
        cv.notify_all();
    });

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, timeout, [&]() { return fired; });
    }
    return isCancellationRequested();
}

//=============================================================================
// CancellationSource
//=============================================================================

void CancellationSource::cancel() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->cancelled.exchange(true)) {
        return;
    }

    for (auto& entry : m_state->callbacks) {
        entry.second();
    }
    m_state->callbacks.clear();
}

}  // namespace FtpCore
