/**
 * @file PasvPortPool.cpp
 * @brief Lease/return allocator for passive-mode data ports
 */

#include "ftpcore/PasvPortPool.h"
#include "ftpcore/Debug.h"
#include "ftpcore/NetErrors.h"

#include <algorithm>
#include <array>
#include <functional>
#include <random>

namespace FtpCore {

namespace {

    // Per-thread generator, seeded with a full state's worth of entropy
    std::mt19937& threadRng() {
        thread_local std::mt19937 rng_ = []() {
            std::array<std::mt19937::result_type, std::mt19937::state_size> seedData;
            std::random_device rd;
            std::generate(seedData.begin(), seedData.end(), std::ref(rd));
            std::seed_seq seq(seedData.begin(), seedData.end());
            return std::mt19937(seq);
        }();
        return rng_;
    }

} // anonymous namespace

const char* leaseStatusToString(LeaseStatus status) {
    switch (status) {
        case LeaseStatus::Leased:          return "leased";
        case LeaseStatus::PoolExhausted:   return "pool exhausted";
        case LeaseStatus::PortUnavailable: return "port unavailable";
    }
    return "unknown";
}

//=============================================================================
// PasvPortPool
//=============================================================================

PasvPortPool::PasvPortPool(const PortSet& ports, std::shared_ptr<Logger> logger)
    : m_logger(std::move(logger))
    , m_ports(ports.ports())
{
    if (m_ports.empty()) {
        throw ConfigurationError(ErrorCodes::CONFIG_INVALID_RANGE, "passive port pool needs at least one port");
    }

    m_indexOf.reserve(m_ports.size());
    m_free.reserve(m_ports.size());
    m_freePos.resize(m_ports.size());

    for (size_t i = 0; i < m_ports.size(); ++i) {
        m_indexOf.emplace(m_ports[i], i);
        m_freePos[i] = m_free.size();
        m_free.push_back(i);
    }

    if (m_logger) {
        m_logger->debug("Passive port pool " + ports.toString() + " (" +
                        std::to_string(m_ports.size()) + " ports)");
    }
}

void PasvPortPool::takeFreeSlotLocked(size_t freePos) {
    const size_t index = m_free[freePos];
    const size_t last = m_free.back();

    // Swap-remove: move the last free entry into the hole
    m_free[freePos] = last;
    m_freePos[last] = freePos;
    m_free.pop_back();
    m_freePos[index] = LEASED;
}

PortLease PasvPortPool::leasePort(uint16_t requestedPort) {
    PortLease lease;

    if (requestedPort != 0) {
        auto it = m_indexOf.find(requestedPort);
        if (it == m_indexOf.end()) {
            lease.status = LeaseStatus::PortUnavailable;
            return lease;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        const size_t freePos = m_freePos[it->second];
        if (freePos == LEASED) {
            lease.status = LeaseStatus::PortUnavailable;
            return lease;
        }
        takeFreeSlotLocked(freePos);
        lease.status = LeaseStatus::Leased;
        lease.port = requestedPort;
        return lease;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_free.empty()) {
            std::uniform_int_distribution<size_t> pick(0, m_free.size() - 1);
            const size_t freePos = pick(threadRng());
            lease.port = m_ports[m_free[freePos]];
            takeFreeSlotLocked(freePos);
            lease.status = LeaseStatus::Leased;
            return lease;
        }
    }

    lease.status = LeaseStatus::PoolExhausted;
    if (m_logger) {
        m_logger->debug("Passive port pool exhausted (" + std::to_string(m_ports.size()) + " ports leased)");
    }
    return lease;
}

void PasvPortPool::returnPort(uint16_t port) {
    auto it = m_indexOf.find(port);
    if (it == m_indexOf.end()) {
        PortPoolMisuse misuse(ErrorCodes::POOL_RETURN_UNKNOWN_PORT, port, "returned port is not part of the pool");
        if (m_logger) {
            m_logger->error(misuse.what());
        }
        throw misuse;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const size_t index = it->second;
        if (m_freePos[index] == LEASED) {
            m_freePos[index] = m_free.size();
            m_free.push_back(index);
            return;
        }
    }

    // Already free: double return

    PortPoolMisuse misuse(ErrorCodes::POOL_RETURN_NOT_LEASED, port, "returned port is not leased");
    if (m_logger) {
        m_logger->error(misuse.what());
    }
    throw misuse;
}

size_t PasvPortPool::leasedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ports.size() - m_free.size();
}

size_t PasvPortPool::freeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_free.size();
}

bool PasvPortPool::isLeased(uint16_t port) const {
    auto it = m_indexOf.find(port);
    if (it == m_indexOf.end()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_freePos[it->second] == LEASED;
}

bool PasvPortPool::contains(uint16_t port) const {
    return m_indexOf.find(port) != m_indexOf.end();
}

//=============================================================================
// AnyPortPool
//=============================================================================

PortLease AnyPortPool::leasePort(uint16_t requestedPort) {
    std::lock_guard<std::mutex> lock(m_mutex);
    PortLease lease;

    if (requestedPort == 0) {
        ++m_systemAssignedLeases;
        lease.status = LeaseStatus::Leased;
        lease.port = 0;
        return lease;
    }

    if (!m_specificLeases.insert(requestedPort).second) {
        lease.status = LeaseStatus::PortUnavailable;
        return lease;
    }

    lease.status = LeaseStatus::Leased;
    lease.port = requestedPort;
    return lease;
}

void AnyPortPool::returnPort(uint16_t port) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (port == 0 && m_systemAssignedLeases > 0) {
            --m_systemAssignedLeases;
            return;
        }
        if (port != 0 && m_specificLeases.erase(port) == 1) {
            return;
        }
    }

    PortPoolMisuse misuse(ErrorCodes::POOL_RETURN_NOT_LEASED, port, "returned port is not leased");
    if (m_logger) {
        m_logger->error(misuse.what());
    }
    throw misuse;
}

size_t AnyPortPool::leasedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_systemAssignedLeases + m_specificLeases.size();
}

std::shared_ptr<PortPool> makePortPool(const PortSet& ports, std::shared_ptr<Logger> logger) {
    if (ports.empty()) {
        return std::make_shared<AnyPortPool>(std::move(logger));
    }
    return std::make_shared<PasvPortPool>(ports, std::move(logger));
}

//=============================================================================
// PortLeaseGuard
//=============================================================================

PortLeaseGuard::PortLeaseGuard(PortPool& pool, const PortLease& lease)
    : m_pool(lease.ok() ? &pool : nullptr)
    , m_port(lease.port)
    , m_status(lease.status)
{
}

PortLeaseGuard::~PortLeaseGuard() {
    // Destructors must not throw; a rejected return is a bookkeeping bug
    // that the pool has already logged.
    try {
        release();
    } catch (const PortPoolMisuse& e) {
        LOG_ERROR("[PortLeaseGuard] " << e.what());
    }
}

PortLeaseGuard::PortLeaseGuard(PortLeaseGuard&& other) noexcept
    : m_pool(other.m_pool)
    , m_port(other.m_port)
    , m_status(other.m_status)
{
    other.m_pool = nullptr;
}

PortLeaseGuard& PortLeaseGuard::operator=(PortLeaseGuard&& other) noexcept {
    if (this != &other) {
        try {
            release();
        } catch (const PortPoolMisuse& e) {
            LOG_ERROR("[PortLeaseGuard] " << e.what());
        }
        m_pool = other.m_pool;
        m_port = other.m_port;
        m_status = other.m_status;
        other.m_pool = nullptr;
    }
    return *this;
}

void PortLeaseGuard::release() {
    if (!m_pool) {
        return;
    }
    PortPool* pool = m_pool;
    m_pool = nullptr;
    pool->returnPort(m_port);
}

}  // namespace FtpCore
