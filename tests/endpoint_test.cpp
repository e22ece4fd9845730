#include <gtest/gtest.h>

#include "solo/endpoint.hpp"
#include "solo/errors.hpp"
#include "test_support.h"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using solo::Endpoint;
using solo::EndpointMutex;

TEST(EndpointMutexTest, SecondAcquireOnSameEndpointFails) {
    EndpointMutex first(Endpoint{"127.0.0.1", 0});
    ASSERT_TRUE(first.tryAcquire());
    const uint16_t port = first.endpoint().port;
    EXPECT_NE(port, 0);

    EndpointMutex second(Endpoint{"127.0.0.1", port});
    EXPECT_FALSE(second.tryAcquire());
    EXPECT_FALSE(second.held());
}

TEST(EndpointMutexTest, ReleasedEndpointCanBeTakenAgain) {
    uint16_t port;
    {
        EndpointMutex mutex(Endpoint{"127.0.0.1", 0});
        ASSERT_TRUE(mutex.tryAcquire());
        port = mutex.endpoint().port;
        EXPECT_FALSE(solo_test::canAcquire(port));
    }
    EXPECT_TRUE(solo_test::canAcquire(port));
}

TEST(EndpointMutexTest, RacingAcquirersProduceExactlyOneHost) {
    const uint16_t port = solo_test::freePort();
    ASSERT_NE(port, 0);

    constexpr int kRacers = 8;
    std::vector<std::unique_ptr<EndpointMutex>> mutexes;
    for (int i = 0; i < kRacers; ++i) {
        mutexes.push_back(std::make_unique<EndpointMutex>(Endpoint{"127.0.0.1", port}));
    }

    std::atomic<bool> go{false};
    std::atomic<int> hosts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kRacers; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            if (mutexes[i]->tryAcquire()) ++hosts;
        });
    }
    go = true;
    for (auto &t : threads) t.join();

    EXPECT_EQ(hosts.load(), 1);
}

TEST(EndpointMutexTest, TakeSocketHandsOverOwnership) {
    EndpointMutex mutex(Endpoint{"127.0.0.1", 0});
    ASSERT_TRUE(mutex.tryAcquire());
    const uint16_t port = mutex.endpoint().port;

    solo::Socket socket = mutex.takeSocket();
    EXPECT_TRUE(socket.valid());
    EXPECT_FALSE(mutex.held());
    EXPECT_EQ(socket.localPort(), port);
    EXPECT_FALSE(solo_test::canAcquire(port));
}

TEST(EndpointMutexTest, UnresolvableAddressIsAConfigurationError) {
    EndpointMutex mutex(Endpoint{"no-such-host.invalid", 0});
    EXPECT_THROW(mutex.tryAcquire(), solo::ConfigError);
}

TEST(EndpointMutexTest, ForeignAddressIsNotMistakenForAlreadyRunning) {
    // TEST-NET-1 is never assigned to a local interface.
    EndpointMutex mutex(Endpoint{"192.0.2.1", 0});
    EXPECT_THROW(mutex.tryAcquire(), std::system_error);
}

TEST(EndpointTest, ConnectAddressMapsWildcardsToLoopback) {
    EXPECT_EQ(solo::connectAddress("0.0.0.0"), "127.0.0.1");
    EXPECT_EQ(solo::connectAddress("::"), "::1");
    EXPECT_EQ(solo::connectAddress("10.1.2.3"), "10.1.2.3");
    EXPECT_EQ((Endpoint{"::1", 80}).toString(), "[::1]:80");
    EXPECT_EQ((Endpoint{"127.0.0.1", 80}).toString(), "127.0.0.1:80");
}
