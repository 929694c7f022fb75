#include "../pagesmith_cli/src/utils/interrupt_watcher.hpp"
#include <gtest/gtest.h>
#include <mutex>

TEST(InterruptWatcher, RunsCallbackOffTheSignallingThread) {
    std::atomic<bool> flag{false};
    std::mutex held;
    std::atomic<int> calls{0};
    std::atomic<bool> other_thread{false};
    const auto setter = std::this_thread::get_id();

    {
        InterruptWatcher watcher(flag, [&] {
            // would deadlock if run while the setter still holds the mutex
            std::lock_guard lock(held);
            other_thread = std::this_thread::get_id() != setter;
            ++calls;
        }, std::chrono::milliseconds(1));

        {
            std::lock_guard lock(held);
            flag.store(true);
        }
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (calls.load() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    EXPECT_GE(calls.load(), 1);
    EXPECT_TRUE(other_thread.load());
}

TEST(InterruptWatcher, IdleWithoutInterrupt) {
    std::atomic<bool> flag{false};
    std::atomic<int> calls{0};
    {
        InterruptWatcher watcher(flag, [&] { ++calls; }, std::chrono::milliseconds(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(calls.load(), 0);
}
