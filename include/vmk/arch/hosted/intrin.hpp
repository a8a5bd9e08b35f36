#pragma once

#include "vmk/arch/generic/intrin.hpp"

#include <thread>

namespace arch {
    /// @brief Replaceable backend for intrinsics when running as a normal process.
    ///
    /// Tests install their own implementation to observe tlb flushes and interrupt state.
    class IHostedIntrin {
    public:
        virtual ~IHostedIntrin() = default;

        virtual void nop() noexcept { }
        virtual void halt() noexcept { }
        virtual void cli() noexcept { }
        virtual void sti() noexcept { }
        virtual bool interruptsEnabled() noexcept { return true; }
        virtual void invlpg(uintptr_t) noexcept { }
        virtual void flushTlb() noexcept { }

        static IHostedIntrin *GetDefault() noexcept {
            static IHostedIntrin sInstance;
            return &sInstance;
        }
    };

    struct HostedIntrin : GenericIntrin {
        static IHostedIntrin *gImpl;

        static void nop() noexcept {
            gImpl->nop();
        }

        static void pause() noexcept {
            std::this_thread::yield();
        }

        static void halt() noexcept {
            gImpl->halt();
        }

        static void cli() noexcept {
            gImpl->cli();
        }

        static void sti() noexcept {
            gImpl->sti();
        }

        static bool interruptsEnabled() noexcept {
            return gImpl->interruptsEnabled();
        }

        static void invlpg(uintptr_t address) noexcept {
            gImpl->invlpg(address);
        }

        static void flushTlb() noexcept {
            gImpl->flushTlb();
        }
    };

    using Intrin = HostedIntrin;
}
