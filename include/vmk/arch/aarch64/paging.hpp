#pragma once

#include "vmk/memory/pte_flags.hpp"

#include <stdint.h>

namespace arm64 {
    namespace paging {
        constexpr uint64_t kValidBit          = 1ull << 0;

        /// @brief Set for page and table descriptors, clear for block descriptors.
        constexpr uint64_t kPageDescriptorBit = 1ull << 1;

        /// @brief MAIR_EL1 index in bits [2:4].
        constexpr uint64_t kMairMask          = 7ull << 2;
        constexpr uint64_t kMairNormal        = 0ull << 2;
        constexpr uint64_t kMairDevice        = 1ull << 2;

        constexpr uint64_t kUserBit           = 1ull << 6;
        constexpr uint64_t kReadOnlyBit       = 1ull << 7;

        /// @brief Shareability in bits [8:9], 0b01 is reserved.
        constexpr uint64_t kShareMask         = 3ull << 8;
        constexpr uint64_t kOuterShareable    = 2ull << 8;
        constexpr uint64_t kInnerShareable    = 3ull << 8;

        constexpr uint64_t kAccessedBit       = 1ull << 10;
        constexpr uint64_t kNotGlobalBit      = 1ull << 11;
        constexpr uint64_t kDirtyBit          = 1ull << 51;
        constexpr uint64_t kPrivExecNeverBit  = 1ull << 53;
        constexpr uint64_t kUserExecNeverBit  = 1ull << 54;
        constexpr uint64_t kExecNeverMask     = kPrivExecNeverBit | kUserExecNeverBit;

        constexpr uint64_t kFrameMask = 0x0000'FFFF'FFFF'F000;

        constexpr uint64_t kFlagMask
            = kValidBit | kPageDescriptorBit | kMairMask
            | kUserBit | kReadOnlyBit | kShareMask
            | kAccessedBit | kNotGlobalBit | kDirtyBit
            | kExecNeverMask;

        static_assert((kFlagMask & kFrameMask) == 0);
    }

    /// @brief The flag bits of an aarch64 stage 1 descriptor.
    ///
    /// Writable and global are inverted relative to the generic flags.
    /// Memory type is a MAIR index paired with a shareability field, these
    /// two groups are only ever written together.
    struct PteFlagsArm64 {
        uint64_t underlying;

        /// @brief Select device or normal memory.
        ///
        /// MAIR index 0 holds normal write-back memory and index 1 holds
        /// device nGnRE memory. Both are outer shareable.
        constexpr void setDevice(bool device) noexcept {
            underlying &= ~(paging::kMairMask | paging::kShareMask);
            underlying |= paging::kOuterShareable;
            underlying |= device ? paging::kMairDevice : paging::kMairNormal;
        }

        constexpr bool isDevice() const noexcept {
            return (underlying & paging::kMairMask) == paging::kMairDevice;
        }

        constexpr bool isValid() const noexcept { return underlying & paging::kValidBit; }
        constexpr bool isWritable() const noexcept { return !(underlying & paging::kReadOnlyBit); }

        /// @brief A valid block descriptor at P3 or P2.
        constexpr bool isHuge() const noexcept {
            return isValid() && !(underlying & paging::kPageDescriptorBit);
        }

        static constexpr uint64_t kFrameMask = paging::kFrameMask;

        static constexpr PteFlagsArm64 fromGeneric(vmk::PteFlags flags) noexcept {
            using vmk::PteFlags;
            using vmk::HasFlag;

            PteFlagsArm64 result { 0 };
            if (HasFlag(flags, PteFlags::eValid)) result.underlying |= paging::kValidBit;
            if (!HasFlag(flags, PteFlags::eHuge)) result.underlying |= paging::kPageDescriptorBit;
            if (HasFlag(flags, PteFlags::eUser)) result.underlying |= paging::kUserBit;
            if (!HasFlag(flags, PteFlags::eWritable)) result.underlying |= paging::kReadOnlyBit;
            if (HasFlag(flags, PteFlags::eAccessed)) result.underlying |= paging::kAccessedBit;
            if (!HasFlag(flags, PteFlags::eGlobal)) result.underlying |= paging::kNotGlobalBit;
            if (HasFlag(flags, PteFlags::eDirty)) result.underlying |= paging::kDirtyBit;
            if (HasFlag(flags, PteFlags::eNotExecutable)) result.underlying |= paging::kExecNeverMask;

            result.setDevice(HasFlag(flags, PteFlags::eDevice));
            return result;
        }

        static constexpr PteFlagsArm64 fromEntry(uint64_t entry) noexcept {
            return PteFlagsArm64 { entry & paging::kFlagMask };
        }

        constexpr vmk::PteFlags toGeneric() const noexcept {
            using vmk::PteFlags;
            using vmk::SetFlag;

            PteFlags result = PteFlags::eNone;
            result = SetFlag(result, PteFlags::eValid, underlying & paging::kValidBit);
            result = SetFlag(result, PteFlags::eHuge, isHuge());
            result = SetFlag(result, PteFlags::eUser, underlying & paging::kUserBit);
            result = SetFlag(result, PteFlags::eWritable, !(underlying & paging::kReadOnlyBit));
            result = SetFlag(result, PteFlags::eAccessed, underlying & paging::kAccessedBit);
            result = SetFlag(result, PteFlags::eGlobal, !(underlying & paging::kNotGlobalBit));
            result = SetFlag(result, PteFlags::eDirty, underlying & paging::kDirtyBit);
            result = SetFlag(result, PteFlags::eNotExecutable, (underlying & paging::kExecNeverMask) == paging::kExecNeverMask);
            result = SetFlag(result, PteFlags::eDevice, isDevice());
            return result;
        }
    };
}
