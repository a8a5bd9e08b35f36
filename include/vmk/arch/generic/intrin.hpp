#pragma once

#include <stdint.h>

namespace arch {
    struct GenericIntrin {
        /// @brief No operation. Does nothing.
        [[gnu::error("nop not implemented by platform")]]
        static void nop() noexcept;

        /// @brief Hint to the cpu that the current thread is spinning.
        [[gnu::error("pause not implemented by platform")]]
        static void pause() noexcept;

        /// @brief Halt the CPU until the next interrupt.
        [[gnu::error("hlt not implemented by platform")]]
        static void halt() noexcept;

        /// @brief Disable interrupts.
        [[gnu::error("cli not implemented by platform")]]
        static void cli() noexcept;

        /// @brief Enable interrupts.
        [[gnu::error("sti not implemented by platform")]]
        static void sti() noexcept;

        /// @brief Are interrupts currently enabled on this core.
        [[gnu::error("interruptsEnabled not implemented by platform"), nodiscard]]
        static bool interruptsEnabled() noexcept;

        /// @brief Invalidate the TLB entry for the given address on this core.
        [[gnu::error("invlpg not implemented by platform")]]
        static void invlpg(uintptr_t address) noexcept;

        /// @brief Invalidate every non-global TLB entry on this core.
        [[gnu::error("flushTlb not implemented by platform")]]
        static void flushTlb() noexcept;
    };
}
