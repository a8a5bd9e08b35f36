#pragma once

#include "vmk/arch/generic/intrin.hpp"

namespace arch {
    struct IntrinAarch64 : GenericIntrin {
        [[gnu::always_inline, gnu::nodebug]]
        static void nop() noexcept {
            asm volatile("nop");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void pause() noexcept {
            asm volatile("yield");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void halt() noexcept {
            asm volatile("wfi");
        }

        /// @note FIQs stay unmasked, they carry the shootdown IPI.
        [[gnu::always_inline, gnu::nodebug]]
        static void cli() noexcept {
            asm volatile("msr daifset, #2" ::: "memory");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void sti() noexcept {
            asm volatile("msr daifclr, #2" ::: "memory");
        }

        [[gnu::always_inline, gnu::nodebug, nodiscard]]
        static bool interruptsEnabled() noexcept {
            uint64_t daif;
            asm volatile("mrs %0, daif" : "=r"(daif));
            return !(daif & (1 << 7));
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void invlpg(uintptr_t address) noexcept {
            asm volatile("dsb ishst; tlbi vaae1, %0; dsb ish; isb" :: "r"(address >> 12) : "memory");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void flushTlb() noexcept {
            asm volatile("dsb ishst; tlbi vmalle1; dsb ish; isb" ::: "memory");
        }
    };

    using Intrin = IntrinAarch64;
}
