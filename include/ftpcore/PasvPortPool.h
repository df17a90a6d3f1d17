/**
 * @file PasvPortPool.h
 * @brief Lease/return allocator for passive-mode data ports
 *
 * Passive ports are visible to anyone watching the control channel, so a
 * predictable allocation order makes it easier to steal data connections.
 * The pool therefore hands out a uniformly random free port.
 *
 * Usage:
 * @code
 * PasvPortPool pool(PortSet::range(50000, 50099), logger);
 *
 * PortLeaseGuard lease(pool, pool.leasePort());
 * if (!lease) {
 *     // transient: tell the client passive mode is unavailable right now
 *     return;
 * }
 * PassiveDataListener data(bindAddress.withPort(lease.port()));
 * // ... transfer ...
 * // lease returns the port when it goes out of scope
 * @endcode
 */

#pragma once

#include "ftpcore/Logger.h"
#include "ftpcore/PortSet.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace FtpCore {

//=============================================================================
// Lease result
//=============================================================================

/**
 * @brief Outcome of a lease request
 *
 * Neither failure is an error: both are expected under load and should be
 * reported to the client as a transient failure of the passive request.
 */
enum class LeaseStatus {
    Leased,           ///< port is now exclusively the caller's
    PoolExhausted,    ///< no port at all was free (request for "any" port)
    PortUnavailable   ///< the specific requested port is leased or not in the pool
};

const char* leaseStatusToString(LeaseStatus status);

struct PortLease {
    LeaseStatus status{LeaseStatus::PoolExhausted};
    uint16_t port{0};

    /// True only for LeaseStatus::Leased
    bool ok() const { return status == LeaseStatus::Leased; }
};

//=============================================================================
// PortPool interface
//=============================================================================

/**
 * @brief Passive port allocator used by data-transfer sessions
 *
 * Implementations are safe to call from any number of threads.
 */
class PortPool {
public:
    virtual ~PortPool() = default;

    /**
     * @brief Lease a port
     * @param requestedPort 0 for any free port, otherwise exactly that port
     */
    virtual PortLease leasePort(uint16_t requestedPort = 0) = 0;

    /**
     * @brief Give a leased port back
     * @throws PortPoolMisuse if the port is not currently leased from this pool
     */
    virtual void returnPort(uint16_t port) = 0;

    /// Number of leases currently outstanding
    virtual size_t leasedCount() const = 0;
};

//=============================================================================
// PasvPortPool Class
//=============================================================================

/**
 * @class PasvPortPool
 * @brief Bounded pool over a fixed PortSet
 *
 * Free ports are kept in a free-list; each candidate remembers its position
 * in that list, so random selection, specific lookup and return are all O(1)
 * under one short critical section.
 *
 * Invariants:
 * - every candidate is either Free (in the free-list) or Leased
 * - the candidate set never changes after construction
 * - a misuse (foreign port, double return) never changes any port's state
 */
class PasvPortPool final : public PortPool {
public:
    /**
     * @brief Construct a pool with every port Free
     * @param ports Candidate ports (must not be empty)
     * @param logger Optional logger (may be null)
     * @throws ConfigurationError if ports is empty
     */
    explicit PasvPortPool(const PortSet& ports, std::shared_ptr<Logger> logger = nullptr);

    PasvPortPool(const PasvPortPool&) = delete;
    PasvPortPool& operator=(const PasvPortPool&) = delete;

    PortLease leasePort(uint16_t requestedPort = 0) override;
    void returnPort(uint16_t port) override;
    size_t leasedCount() const override;

    /// Total number of candidate ports
    size_t capacity() const { return m_ports.size(); }

    size_t freeCount() const;
    bool isLeased(uint16_t port) const;
    bool contains(uint16_t port) const;

    const std::vector<uint16_t>& ports() const { return m_ports; }

private:
    static constexpr size_t LEASED = static_cast<size_t>(-1);

    void takeFreeSlotLocked(size_t freePos);

    std::shared_ptr<Logger> m_logger;
    std::vector<uint16_t> m_ports;                      ///< candidate ports, sorted
    std::unordered_map<uint16_t, size_t> m_indexOf;     ///< port -> index into m_ports

    mutable std::mutex m_mutex;
    std::vector<size_t> m_free;       ///< indices into m_ports that are Free
    std::vector<size_t> m_freePos;    ///< per candidate: position in m_free, or LEASED
};

//=============================================================================
// AnyPortPool Class
//=============================================================================

/**
 * @class AnyPortPool
 * @brief Pool used when no passive range is configured
 *
 * leasePort(0) always succeeds with port 0, meaning "bind to a port the
 * system picks". A specific request is granted unless this pool already
 * leased that port. Returns are still checked against outstanding leases.
 */
class AnyPortPool final : public PortPool {
public:
    explicit AnyPortPool(std::shared_ptr<Logger> logger = nullptr) : m_logger(std::move(logger)) {}

    PortLease leasePort(uint16_t requestedPort = 0) override;
    void returnPort(uint16_t port) override;
    size_t leasedCount() const override;

private:
    std::shared_ptr<Logger> m_logger;

    mutable std::mutex m_mutex;
    size_t m_systemAssignedLeases{0};
    std::unordered_set<uint16_t> m_specificLeases;
};

/**
 * @brief PasvPortPool for a non-empty set, AnyPortPool otherwise
 */
std::shared_ptr<PortPool> makePortPool(const PortSet& ports, std::shared_ptr<Logger> logger = nullptr);

//=============================================================================
// PortLeaseGuard
//=============================================================================

/**
 * @brief Holds a lease and returns the port exactly once
 *
 * A guard built from a failed lease holds nothing and returns nothing.
 */
class PortLeaseGuard {
public:
    PortLeaseGuard() = default;
    PortLeaseGuard(PortPool& pool, const PortLease& lease);
    ~PortLeaseGuard();

    PortLeaseGuard(const PortLeaseGuard&) = delete;
    PortLeaseGuard& operator=(const PortLeaseGuard&) = delete;

    PortLeaseGuard(PortLeaseGuard&& other) noexcept;
    PortLeaseGuard& operator=(PortLeaseGuard&& other) noexcept;

    bool holds() const { return m_pool != nullptr; }
    explicit operator bool() const { return holds(); }

    uint16_t port() const { return m_port; }
    LeaseStatus status() const { return m_status; }

    /**
     * @brief Return the port now (idempotent)
     * @throws PortPoolMisuse if the pool rejects the return
     */
    void release();

private:
    PortPool* m_pool{nullptr};
    uint16_t m_port{0};
    LeaseStatus m_status{LeaseStatus::PoolExhausted};
};

}  // namespace FtpCore
