/**
 * @file multi_binding_listener_test.cpp
 * @brief Tests for MultiBindingListener binding, accepting and shutdown
 *
 * Every test binds loopback addresses (127.0.0.1-3) through a
 * StaticHostResolver, so no DNS is involved.
 */

#include "ftpcore/MultiBindingListener.h"
#include "ftpcore/NetErrors.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace FtpCore;
using FtpCoreTest::CapturingLogger;
using FtpCoreTest::connectTo;
using FtpCoreTest::countOpenFds;

namespace {

/**
 * @brief Fills the descriptor table so the next accept() fails with EMFILE
 *
 * Lowers the soft RLIMIT_NOFILE, then dup()s until the table is full.
 * release() (or the destructor) closes the copies and restores the limit.
 */
class DescriptorExhaustion {
public:
    DescriptorExhaustion() {
        if (::getrlimit(RLIMIT_NOFILE, &m_saved) != 0) {
            return;
        }
        rlimit lowered = m_saved;
        const rlim_t wanted = static_cast<rlim_t>(countOpenFds() + 32);
        if (lowered.rlim_cur == RLIM_INFINITY || lowered.rlim_cur > wanted) {
            lowered.rlim_cur = wanted;
        }
        if (::setrlimit(RLIMIT_NOFILE, &lowered) != 0) {
            return;
        }
        m_limited = true;

        for (int i = 0; i < 4096; ++i) {
            const int fd = ::dup(STDERR_FILENO);
            if (fd < 0) {
                m_full = (errno == EMFILE);
                break;
            }
            m_copies.emplace_back(fd);
        }
    }

    ~DescriptorExhaustion() { release(); }

    DescriptorExhaustion(const DescriptorExhaustion&) = delete;
    DescriptorExhaustion& operator=(const DescriptorExhaustion&) = delete;

    bool full() const { return m_full; }

    void release() {
        m_copies.clear();
        if (m_limited) {
            (void)::setrlimit(RLIMIT_NOFILE, &m_saved);
            m_limited = false;
        }
    }

private:
    rlimit m_saved{};
    bool m_limited{false};
    bool m_full{false};
    std::vector<SocketHandle> m_copies;
};

} // anonymous namespace

//=============================================================================
// Test Fixtures
//=============================================================================

class MultiBindingListenerTest : public ::testing::Test {
protected:
    std::shared_ptr<CapturingLogger> logger = std::make_shared<CapturingLogger>();

    std::shared_ptr<HostResolver> loopback3() {
        return std::make_shared<StaticHostResolver>(
            StaticHostResolver::fromLiterals({"127.0.0.1", "127.0.0.2", "127.0.0.3"}));
    }

    std::unique_ptr<MultiBindingListener> makeListener(int port = 0) {
        return std::make_unique<MultiBindingListener>(logger, "ftp.test", port, loopback3());
    }

    /// Wait with a token that fires after timeoutMs, so a broken listener fails instead of hanging
    WaitResult waitWithTimeout(MultiBindingListener& listener, int timeoutMs = 5000) {
        auto timeout = std::make_shared<CancellationSource>();
        std::thread timer([timeout, timeoutMs]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
            timeout->cancel();
        });
        timer.detach();
        return listener.waitForNextClient(timeout->token());
    }
};

//=============================================================================
// Construction
//=============================================================================

TEST_F(MultiBindingListenerTest, RejectsOutOfRangePort) {
    EXPECT_THROW(MultiBindingListener(logger, "localhost", -1), ConfigurationError);
    EXPECT_THROW(MultiBindingListener(logger, "localhost", 65536), ConfigurationError);
}

TEST_F(MultiBindingListenerTest, RejectsEmptyHost) {
    EXPECT_THROW(MultiBindingListener(logger, "", 21), ConfigurationError);
}

TEST_F(MultiBindingListenerTest, ReturnsZeroPortBeforeStart) {
    auto listener = makeListener();
    EXPECT_EQ(listener->getPort(), 0u);
    EXPECT_FALSE(listener->isBound());
    EXPECT_EQ(listener->getListenerCount(), 0u);
}

//=============================================================================
// start()
//=============================================================================

TEST_F(MultiBindingListenerTest, SystemAssignedPortIsSharedByEveryAddress) {
    auto listener = makeListener(0);
    listener->start();

    const uint16_t port = listener->getPort();
    EXPECT_NE(port, 0u);
    ASSERT_EQ(listener->getListenerCount(), 3u);

    for (const auto& address : listener->getBoundAddresses()) {
        EXPECT_EQ(address.port(), port);
    }

    const auto endpoints = listener->getBoundEndpoints();
    EXPECT_EQ(endpoints[0], "127.0.0.1:" + std::to_string(port));
    EXPECT_EQ(endpoints[1], "127.0.0.2:" + std::to_string(port));
    EXPECT_EQ(endpoints[2], "127.0.0.3:" + std::to_string(port));

    EXPECT_TRUE(logger->contains("Server configured for listening on ftp.test:0"));
    listener->stop();
}

TEST_F(MultiBindingListenerTest, ExplicitPortIsUsedOnEveryAddress) {
    // Borrow a free port number from the kernel
    uint16_t port = 0;
    {
        SocketHandle borrowed = openListeningSocket(*NetAddress::fromLiteral("127.0.0.1"), 1);
        port = getLocalAddress(borrowed.get()).port();
    }

    auto listener = makeListener(port);
    listener->start();
    EXPECT_EQ(listener->getPort(), port);
    for (const auto& address : listener->getBoundAddresses()) {
        EXPECT_EQ(address.port(), port);
    }
    listener->stop();
}

TEST_F(MultiBindingListenerTest, StartTwiceThrows) {
    auto listener = makeListener();
    listener->start();
    EXPECT_THROW(listener->start(), ListenerStateError);
    EXPECT_TRUE(listener->isBound());
    listener->stop();
}

TEST_F(MultiBindingListenerTest, NoUsableAddressThrowsResolveError) {
    MultiBindingListener listener(logger, "nowhere.test", 0,
                                  std::make_shared<StaticHostResolver>(std::vector<NetAddress>{}));
    try {
        listener.start();
        FAIL() << "Expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_STREQ(e.code(), ErrorCodes::NET_NO_USABLE_ADDRESS);
        EXPECT_EQ(e.host(), "nowhere.test");
    }
    EXPECT_FALSE(listener.isBound());
}

TEST_F(MultiBindingListenerTest, FailedBindClosesEverySocketOfThatStart) {
    // Occupy 127.0.0.3 on some port, then ask for that port on .1, .2 and .3
    SocketHandle blocker = openListeningSocket(*NetAddress::fromLiteral("127.0.0.3"), 1);
    const uint16_t port = getLocalAddress(blocker.get()).port();

    const size_t fdsBefore = countOpenFds();
    auto listener = makeListener(port);

    try {
        listener->start();
        FAIL() << "Expected BindFailure";
    } catch (const BindFailure& e) {
        EXPECT_STREQ(e.code(), ErrorCodes::NET_BIND_FAILED);
        EXPECT_EQ(e.endpoint(), "127.0.0.3:" + std::to_string(port));
        EXPECT_EQ(e.sysError(), EADDRINUSE);
    }

    EXPECT_EQ(countOpenFds(), fdsBefore);
    EXPECT_FALSE(listener->isBound());
    EXPECT_EQ(listener->getPort(), 0u);
    EXPECT_EQ(listener->getListenerCount(), 0u);

    // .1 and .2 were released: the same port binds there again
    EXPECT_NO_THROW(openListeningSocket(*NetAddress::fromLiteral("127.0.0.1", port), 1));
    EXPECT_NO_THROW(openListeningSocket(*NetAddress::fromLiteral("127.0.0.2", port), 1));
}

TEST_F(MultiBindingListenerTest, DuplicateAddressFailsAtomically) {
    MultiBindingListener listener(logger, "dup.test", 0,
                                  std::make_shared<StaticHostResolver>(
                                      StaticHostResolver::fromLiterals({"127.0.0.1", "127.0.0.1"})));
    const size_t fdsBefore = countOpenFds();

    EXPECT_THROW(listener.start(), BindFailure);
    EXPECT_EQ(countOpenFds(), fdsBefore);
    EXPECT_FALSE(listener.isBound());
    EXPECT_GE(logger->count(LogLevel::Error), 1u);
}

TEST_F(MultiBindingListenerTest, CanStartAgainAfterFailedStart) {
    SocketHandle blocker = openListeningSocket(*NetAddress::fromLiteral("127.0.0.2"), 1);
    const uint16_t port = getLocalAddress(blocker.get()).port();

    auto listener = makeListener(port);
    EXPECT_THROW(listener->start(), BindFailure);

    blocker.close();
    listener->start();
    EXPECT_EQ(listener->getPort(), port);
    listener->stop();
}

//=============================================================================
// beginAccepting() / waitForNextClient()
//=============================================================================

TEST_F(MultiBindingListenerTest, BeginAcceptingBeforeStartThrows) {
    auto listener = makeListener();
    EXPECT_THROW(listener->beginAccepting(), ListenerStateError);
}

TEST_F(MultiBindingListenerTest, BeginAcceptingTwiceIsNoOp) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();
    EXPECT_NO_THROW(listener->beginAccepting());
    EXPECT_TRUE(listener->isAccepting());
    listener->stop();
}

TEST_F(MultiBindingListenerTest, WaitBeforeBeginAcceptingReturnsStopped) {
    auto listener = makeListener();
    EXPECT_EQ(listener->waitForNextClient().status, WaitStatus::Stopped);
    listener->start();
    EXPECT_EQ(listener->waitForNextClient().status, WaitStatus::Stopped);
    listener->stop();
}

TEST_F(MultiBindingListenerTest, AcceptsOnEveryAddress) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    const auto addresses = listener->getBoundAddresses();
    std::set<size_t> listenerIndexes;

    for (const auto& address : addresses) {
        SocketHandle client = connectTo(address);
        ASSERT_TRUE(client) << "connect to " << address.toEndpointString();

        WaitResult r = waitWithTimeout(*listener);
        ASSERT_EQ(r.status, WaitStatus::Accepted);
        EXPECT_TRUE(r.client.socket.valid());
        EXPECT_EQ(r.client.localAddress, address);
        EXPECT_EQ(r.client.peerAddress, getLocalAddress(client.get()));
        listenerIndexes.insert(r.client.listenerIndex);
    }

    EXPECT_EQ(listenerIndexes, (std::set<size_t>{0, 1, 2}));
    listener->stop();
}

TEST_F(MultiBindingListenerTest, FiveClientsAcrossAddressesThenWaitBlocks) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    const auto addresses = listener->getBoundAddresses();
    std::vector<SocketHandle> clients;
    for (int i = 0; i < 5; ++i) {
        clients.push_back(connectTo(addresses[static_cast<size_t>(i) % addresses.size()]));
        ASSERT_TRUE(clients.back());
    }

    std::vector<ClientConnection> accepted;
    for (int i = 0; i < 5; ++i) {
        WaitResult r = waitWithTimeout(*listener);
        ASSERT_EQ(r.status, WaitStatus::Accepted) << "client " << i;
        accepted.push_back(std::move(r.client));
    }

    // Each accepted connection pairs with a distinct client
    std::set<std::string> pairs;
    for (const auto& conn : accepted) {
        pairs.insert(conn.localAddress.toEndpointString() + " " + conn.peerAddress.toEndpointString());
    }
    EXPECT_EQ(pairs.size(), 5u);

    // The sixth wait has nothing to return
    WaitResult sixth = waitWithTimeout(*listener, 200);
    EXPECT_EQ(sixth.status, WaitStatus::Cancelled);
    EXPECT_FALSE(sixth.client.socket.valid());

    // Every address still has an accept outstanding
    for (const auto& address : addresses) {
        clients.push_back(connectTo(address));
        ASSERT_TRUE(clients.back());
    }

    std::set<size_t> listenerIndexes;
    for (size_t i = 0; i < addresses.size(); ++i) {
        WaitResult r = waitWithTimeout(*listener);
        ASSERT_EQ(r.status, WaitStatus::Accepted) << "late client " << i;
        listenerIndexes.insert(r.client.listenerIndex);
    }
    EXPECT_EQ(listenerIndexes, (std::set<size_t>{0, 1, 2}));

    listener->stop();
}

TEST_F(MultiBindingListenerTest, CancelledWaitLeavesAcceptsOutstanding) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    CancellationSource source;
    source.cancel();
    EXPECT_EQ(listener->waitForNextClient(source.token()).status, WaitStatus::Cancelled);
    EXPECT_TRUE(listener->isAccepting());

    SocketHandle client = connectTo(listener->getBoundAddresses()[1]);
    ASSERT_TRUE(client);

    WaitResult r = waitWithTimeout(*listener);
    ASSERT_EQ(r.status, WaitStatus::Accepted);
    EXPECT_EQ(r.client.listenerIndex, 1u);
    listener->stop();
}

TEST_F(MultiBindingListenerTest, CancelWakesBlockedWaiter) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    CancellationSource source;
    auto waiter = std::async(std::launch::async, [&]() {
        return listener->waitForNextClient(source.token()).status;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    source.cancel();

    ASSERT_EQ(waiter.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(waiter.get(), WaitStatus::Cancelled);
    listener->stop();
}

TEST_F(MultiBindingListenerTest, ReadyClientIsPreferredOverCancellation) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    SocketHandle client = connectTo(listener->getBoundAddresses()[0]);
    ASSERT_TRUE(client);

    CancellationSource source;
    source.cancel();

    // The acceptor thread needs a moment to complete the accept
    WaitResult r;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        r = listener->waitForNextClient(source.token());
        if (r.accepted()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(r.status, WaitStatus::Accepted);
    listener->stop();
}

TEST_F(MultiBindingListenerTest, ConcurrentWaitersEachGetOneConnection) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    auto w1 = std::async(std::launch::async, [&]() { return waitWithTimeout(*listener); });
    auto w2 = std::async(std::launch::async, [&]() { return waitWithTimeout(*listener); });

    SocketHandle c1 = connectTo(listener->getBoundAddresses()[0]);
    SocketHandle c2 = connectTo(listener->getBoundAddresses()[2]);
    ASSERT_TRUE(c1);
    ASSERT_TRUE(c2);

    WaitResult r1 = w1.get();
    WaitResult r2 = w2.get();
    ASSERT_TRUE(r1.accepted());
    ASSERT_TRUE(r2.accepted());
    EXPECT_NE(r1.client.socket.get(), r2.client.socket.get());
    EXPECT_NE(r1.client.listenerIndex, r2.client.listenerIndex);
    listener->stop();
}

TEST_F(MultiBindingListenerTest, AcceptFailureIsReportedAndSlotIsRearmed) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();
    const NetAddress target = listener->getBoundAddresses()[1];

    // Let every acceptor block in accept(); a blocked accept already holds
    // the descriptor it will return
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // Created up front: connect() needs no new descriptor
    SocketHandle first(::socket(target.family(), SOCK_STREAM | SOCK_CLOEXEC, 0));
    ASSERT_TRUE(first);

    DescriptorExhaustion exhaustion;
    ASSERT_TRUE(exhaustion.full()) << "could not fill the descriptor table";
    ASSERT_EQ(::connect(first.get(), target.data(), target.length), 0);

    WaitResult accepted = waitWithTimeout(*listener);
    ASSERT_EQ(accepted.status, WaitStatus::Accepted);
    EXPECT_EQ(accepted.client.listenerIndex, 1u);

    // Claiming re-armed slot 1; with no descriptor left that accept fails
    try {
        (void)waitWithTimeout(*listener);
        FAIL() << "Expected AcceptFailure";
    } catch (const AcceptFailure& e) {
        EXPECT_STREQ(e.code(), ErrorCodes::NET_ACCEPT_FAILED);
        EXPECT_EQ(e.listenerIndex(), 1u);
        EXPECT_EQ(e.sysError(), EMFILE);
        EXPECT_EQ(e.endpoint(), target.toEndpointString());
        EXPECT_EQ(classifyAcceptError(e.sysError()), AcceptErrorAction::BackOff);
    }
    EXPECT_GE(logger->count(LogLevel::Error), 1u);

    // The failure re-armed the slot too, which fails again the same way
    try {
        (void)waitWithTimeout(*listener);
        FAIL() << "Expected a second AcceptFailure";
    } catch (const AcceptFailure& e) {
        EXPECT_EQ(e.listenerIndex(), 1u);
        EXPECT_EQ(e.sysError(), EMFILE);
    }

    exhaustion.release();
    EXPECT_TRUE(listener->isAccepting());

    SocketHandle second = connectTo(target);
    ASSERT_TRUE(second);

    // At most one more failure can have completed before the release
    WaitResult r;
    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            r = waitWithTimeout(*listener);
            break;
        } catch (const AcceptFailure& e) {
            EXPECT_EQ(e.listenerIndex(), 1u);
            EXPECT_EQ(e.sysError(), EMFILE);
        }
    }
    ASSERT_EQ(r.status, WaitStatus::Accepted);
    EXPECT_EQ(r.client.listenerIndex, 1u);
    EXPECT_EQ(r.client.peerAddress, getLocalAddress(second.get()));
    listener->stop();
}

//=============================================================================
// stop()
//=============================================================================

TEST_F(MultiBindingListenerTest, StopWakesBlockedWaiter) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    auto waiter = std::async(std::launch::async, [&]() {
        return listener->waitForNextClient().status;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    listener->stop();

    ASSERT_EQ(waiter.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(waiter.get(), WaitStatus::Stopped);
}

TEST_F(MultiBindingListenerTest, StopResetsStateAndIsIdempotent) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    listener->stop();
    EXPECT_EQ(listener->getPort(), 0u);
    EXPECT_FALSE(listener->isBound());
    EXPECT_FALSE(listener->isAccepting());
    EXPECT_TRUE(listener->getBoundEndpoints().empty());

    EXPECT_NO_THROW(listener->stop());
    EXPECT_EQ(listener->waitForNextClient().status, WaitStatus::Stopped);
}

TEST_F(MultiBindingListenerTest, StopClosesUnclaimedConnections) {
    auto listener = makeListener();
    listener->start();
    listener->beginAccepting();

    SocketHandle client = connectTo(listener->getBoundAddresses()[0]);
    ASSERT_TRUE(client);
    ASSERT_TRUE(setSocketRecvTimeout(client.get(), 5000));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    listener->stop();

    // Closed (EOF) or reset: either way nothing is left serving this client
    char byte = 0;
    EXPECT_LE(::recv(client.get(), &byte, 1, 0), 0);
}

TEST_F(MultiBindingListenerTest, StopAndRestartDoesNotLeakDescriptors) {
    auto listener = makeListener();
    const size_t fdsBefore = countOpenFds();

    for (int round = 0; round < 5; ++round) {
        listener->start();
        listener->beginAccepting();

        SocketHandle client = connectTo(listener->getBoundAddresses()[static_cast<size_t>(round) % 3]);
        ASSERT_TRUE(client);
        WaitResult r = waitWithTimeout(*listener);
        ASSERT_TRUE(r.accepted()) << "round " << round;

        listener->stop();
        EXPECT_EQ(listener->getPort(), 0u);
    }

    EXPECT_EQ(countOpenFds(), fdsBefore);
}

TEST_F(MultiBindingListenerTest, DestructorStopsAcceptingListener) {
    const size_t fdsBefore = countOpenFds();
    {
        auto listener = makeListener();
        listener->start();
        listener->beginAccepting();
        EXPECT_EQ(countOpenFds(), fdsBefore + 3);
    }
    EXPECT_EQ(countOpenFds(), fdsBefore);
}

TEST(WaitStatusTest, ToString) {
    EXPECT_STREQ(waitStatusToString(WaitStatus::Accepted), "accepted");
    EXPECT_STREQ(waitStatusToString(WaitStatus::Cancelled), "cancelled");
    EXPECT_STREQ(waitStatusToString(WaitStatus::Stopped), "stopped");
}

//=============================================================================
// Accept failure handling
//=============================================================================

TEST(AcceptErrorActionTest, ClassifiesErrno) {
    EXPECT_EQ(classifyAcceptError(EBADF), AcceptErrorAction::Fatal);
    EXPECT_EQ(classifyAcceptError(EINVAL), AcceptErrorAction::Fatal);
    EXPECT_EQ(classifyAcceptError(ENOTSOCK), AcceptErrorAction::Fatal);
    EXPECT_EQ(classifyAcceptError(EMFILE), AcceptErrorAction::BackOff);
    EXPECT_EQ(classifyAcceptError(ENFILE), AcceptErrorAction::BackOff);
    EXPECT_EQ(classifyAcceptError(ENOBUFS), AcceptErrorAction::BackOff);
    EXPECT_EQ(classifyAcceptError(ENOMEM), AcceptErrorAction::BackOff);
    EXPECT_EQ(classifyAcceptError(EPROTO), AcceptErrorAction::Retry);
    EXPECT_EQ(classifyAcceptError(EPERM), AcceptErrorAction::Retry);
    EXPECT_STREQ(acceptErrorActionToString(AcceptErrorAction::BackOff), "back off");
}

TEST(AcceptFailureThrottleTest, LogsFirstThenOncePerInterval) {
    AcceptFailureThrottle throttle(std::chrono::milliseconds(1000));
    const auto t0 = std::chrono::steady_clock::now();

    EXPECT_TRUE(throttle.shouldLog(t0));
    EXPECT_EQ(throttle.suppressed(), 0u);

    for (int i = 1; i <= 500; ++i) {
        EXPECT_FALSE(throttle.shouldLog(t0 + std::chrono::milliseconds(i)));
    }

    EXPECT_TRUE(throttle.shouldLog(t0 + std::chrono::milliseconds(1000)));
    EXPECT_EQ(throttle.suppressed(), 500u);

    EXPECT_TRUE(throttle.shouldLog(t0 + std::chrono::milliseconds(2500)));
    EXPECT_EQ(throttle.suppressed(), 0u);
}
