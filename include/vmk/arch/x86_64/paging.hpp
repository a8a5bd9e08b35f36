#pragma once

#include "vmk/memory/pte_flags.hpp"

#include <stdint.h>

namespace x64 {
    namespace paging {
        constexpr uint64_t kPresentBit        = 1ull << 0;
        constexpr uint64_t kWriteableBit      = 1ull << 1;
        constexpr uint64_t kUserBit           = 1ull << 2;
        constexpr uint64_t kWriteThroughBit   = 1ull << 3;
        constexpr uint64_t kCacheDisableBit   = 1ull << 4;
        constexpr uint64_t kAccessedBit       = 1ull << 5;
        constexpr uint64_t kWrittenBit        = 1ull << 6;
        constexpr uint64_t kHugePageBit       = 1ull << 7;
        constexpr uint64_t kGlobalBit         = 1ull << 8;
        constexpr uint64_t kExecuteDisableBit = 1ull << 63;

        constexpr uint64_t kFrameMask = 0x000F'FFFF'FFFF'F000;

        /// @brief Every bit that has a generic equivalent.
        constexpr uint64_t kFlagMask
            = kPresentBit | kWriteableBit | kUserBit
            | kCacheDisableBit | kAccessedBit | kWrittenBit
            | kHugePageBit | kGlobalBit | kExecuteDisableBit;

        static_assert((kFlagMask & kFrameMask) == 0);
    }

    /// @brief The flag bits of a hardware page table entry.
    ///
    /// The generic flags share the x86_64 layout, so conversion is a mask.
    struct PteFlagsX64 {
        uint64_t underlying;

        static constexpr uint64_t kFrameMask = paging::kFrameMask;

        static constexpr PteFlagsX64 fromGeneric(vmk::PteFlags flags) noexcept {
            return PteFlagsX64 { std::to_underlying(flags) & paging::kFlagMask };
        }

        static constexpr PteFlagsX64 fromEntry(uint64_t entry) noexcept {
            return PteFlagsX64 { entry & paging::kFlagMask };
        }

        constexpr vmk::PteFlags toGeneric() const noexcept {
            return vmk::PteFlags(underlying & paging::kFlagMask);
        }

        constexpr bool isValid() const noexcept { return underlying & paging::kPresentBit; }
        constexpr bool isHuge() const noexcept { return underlying & paging::kHugePageBit; }
        constexpr bool isWritable() const noexcept { return underlying & paging::kWriteableBit; }
    };
}
