#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "vmk/std/spinlock.hpp"

TEST(SpinLockTest, TryLockWhileHeld) {
    stdx::SpinLock lock;
    lock.lock();
    ASSERT_FALSE(lock.try_lock());

    lock.unlock();
    ASSERT_TRUE(lock.try_lock());
    lock.unlock();
}

TEST(SpinLockTest, GuardReleasesAtScopeExit) {
    stdx::SpinLock lock;
    {
        stdx::LockGuard guard(lock);
        ASSERT_FALSE(lock.try_lock());
    }

    ASSERT_TRUE(lock.try_lock());
    lock.unlock();
}

TEST(SpinLockTest, CountsUnderContention) {
    static constexpr size_t kThreads = 4;
    static constexpr size_t kRounds = 10000;

    stdx::SpinLock lock;
    size_t counter = 0;
    size_t lastWriter = kThreads;
    size_t handoffs = 0;

    {
        std::vector<std::jthread> threads;
        for (size_t id = 0; id < kThreads; id++) {
            threads.emplace_back([&, id] {
                for (size_t i = 0; i < kRounds; i++) {
                    stdx::LockGuard guard(lock);
                    if (lastWriter != id) {
                        handoffs += 1;
                        lastWriter = id;
                    }

                    counter += 1;
                }
            });
        }
    }

    ASSERT_EQ(counter, kThreads * kRounds);
    ASSERT_GE(handoffs, kThreads);
}
