#include <gtest/gtest.h>

#include "solo/timer.hpp"
#include "test_support.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using solo::CountdownTimer;
using namespace std::chrono_literals;

TEST(CountdownTimerTest, FiresOnceAfterDelay) {
    std::atomic<int> fired{0};
    CountdownTimer timer(50ms, [&] { ++fired; });
    timer.start();

    EXPECT_FALSE(timer.elapsed());
    ASSERT_TRUE(solo_test::waitFor([&] { return timer.elapsed(); }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(fired.load(), 1);
}

TEST(CountdownTimerTest, CancelPreventsCallback) {
    std::atomic<int> fired{0};
    CountdownTimer timer(200ms, [&] { ++fired; });
    timer.start();
    timer.cancel();

    std::this_thread::sleep_for(300ms);
    EXPECT_FALSE(timer.elapsed());
    EXPECT_EQ(fired.load(), 0);
}

TEST(CountdownTimerTest, DestructionDoesNotWaitForDelay) {
    std::atomic<int> fired{0};
    auto started = std::chrono::steady_clock::now();
    {
        CountdownTimer timer(10s, [&] { ++fired; });
        timer.start();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    EXPECT_EQ(fired.load(), 0);
}

TEST(CountdownTimerTest, CallbackMayCancelItself) {
    std::unique_ptr<CountdownTimer> timer;
    std::atomic<bool> done{false};
    timer = std::make_unique<CountdownTimer>(20ms, [&] {
        timer->cancel();
        done = true;
    });
    timer->start();

    ASSERT_TRUE(solo_test::waitFor([&] { return done.load(); }));
    EXPECT_TRUE(timer->elapsed());
}

TEST(CountdownTimerTest, CallbackMayDestroyTheTimer) {
    std::unique_ptr<CountdownTimer> timer;
    std::atomic<bool> done{false};
    timer = std::make_unique<CountdownTimer>(20ms, [&] {
        timer.reset();
        done = true;
    });
    timer->start();

    ASSERT_TRUE(solo_test::waitFor([&] { return done.load(); }));
    EXPECT_EQ(timer, nullptr);
}
