#pragma once

#include "vmk/arch/generic/intrin.hpp"

namespace arch {
    struct IntrinX86_64 : GenericIntrin {
        [[gnu::always_inline, gnu::nodebug]]
        static void nop() noexcept {
            asm volatile("nop");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void pause() noexcept {
            asm volatile("pause");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void halt() noexcept {
            asm volatile("hlt");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void cli() noexcept {
            asm volatile("cli" ::: "memory");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void sti() noexcept {
            asm volatile("sti" ::: "memory");
        }

        [[gnu::always_inline, gnu::nodebug, nodiscard]]
        static bool interruptsEnabled() noexcept {
            uint64_t rflags;
            asm volatile("pushfq; popq %0" : "=r"(rflags));
            return rflags & (1 << 9);
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void invlpg(uintptr_t address) noexcept {
            asm volatile("invlpg (%0)" : : "r"(address) : "memory");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void flushTlb() noexcept {
            uint64_t cr3;
            asm volatile("mov %%cr3, %0" : "=r"(cr3));
            asm volatile("mov %0, %%cr3" :: "r"(cr3) : "memory");
        }
    };

    using Intrin = IntrinX86_64;
}
