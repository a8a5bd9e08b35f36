#pragma once

#include <atomic>

#include "vmk/arch/intrin.hpp"

namespace stdx {
    class SpinLock {
        std::atomic_flag mLock = ATOMIC_FLAG_INIT;

    public:
        void lock() noexcept {
            while (mLock.test_and_set(std::memory_order_acquire)) {
                arch::Intrin::pause();
            }
        }

        void unlock() noexcept {
            mLock.clear(std::memory_order_release);
        }

        [[nodiscard]]
        bool try_lock() noexcept {
            return !mLock.test_and_set(std::memory_order_acquire);
        }
    };

    template<typename T>
    class [[nodiscard]] LockGuard {
        T& mLock;

    public:
        LockGuard(T& lock) noexcept
            : mLock(lock)
        {
            mLock.lock();
        }

        ~LockGuard() noexcept {
            mLock.unlock();
        }
    };
}
