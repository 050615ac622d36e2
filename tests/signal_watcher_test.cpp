#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <thread>
#include <unistd.h>

#include "SignalWatcher.h"

namespace {

bool WaitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

}

TEST(SignalWatcherTest, EverySignalReachesTheHandler) {
    std::atomic<int> delivered{0};
    std::atomic<int> last_count{0};
    SignalWatcher watcher([&](int sig, int count) {
        if (sig > 0) {
            delivered++;
            last_count = count;
        }
    }, std::chrono::milliseconds(20));

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    ASSERT_TRUE(WaitFor([&] { return delivered.load() == 1; }, std::chrono::milliseconds(2000)));

    // A second signal during shutdown is still seen.
    ASSERT_EQ(kill(getpid(), SIGINT), 0);
    ASSERT_TRUE(WaitFor([&] { return delivered.load() == 2; }, std::chrono::milliseconds(2000)));

    watcher.Close();
    EXPECT_EQ(last_count.load(), 2);
    EXPECT_EQ(watcher.Received(), 2);
}

TEST(SignalWatcherTest, HandlerRepeatsOnTicksAfterFirstSignal) {
    std::atomic<int> ticks{0};
    SignalWatcher watcher([&](int sig, int) {
        if (sig == 0) ticks++;
    }, std::chrono::milliseconds(20));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(ticks.load(), 0);

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    EXPECT_TRUE(WaitFor([&] { return ticks.load() >= 3; }, std::chrono::milliseconds(2000)));

    watcher.Close();
    const int after_close = ticks.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(ticks.load(), after_close);
}
