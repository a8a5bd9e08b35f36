#pragma once

#include "vmk/memory/mmu.hpp"

namespace vmk {
    /// @brief What an entry owned at the moment it was unmapped.
    struct UnmapResult {
        enum Kind {
            /// @brief The entry owned its frames, the caller now owns them.
            eExclusive,

            /// @brief The frames are owned elsewhere and must not be freed.
            eNonExclusive,
        };

        Kind kind;
        FrameRange frames;

        bool isExclusive() const noexcept { return kind == eExclusive; }
    };

    /// @brief A single 8 byte entry of a page table.
    ///
    /// The entry is addressed virtually, every access goes through the
    /// active translation. Exclusivity is kept in the @a OwnershipTable
    /// next to the hardware word rather than in a software bit.
    class PageTableEntry {
        Mmu *mMmu;
        VirtualAddress mAddress;

    public:
        PageTableEntry(Mmu *mmu [[gnu::nonnull]], VirtualAddress address) noexcept
            : mMmu(mmu)
            , mAddress(address)
        { }

        VirtualAddress address() const noexcept { return mAddress; }

        /// @brief The physical location of this entry.
        PhysicalAddress slot() const noexcept;

        uint64_t value() const noexcept;

        bool isUnused() const noexcept {
            return value() == 0;
        }

        /// @brief The flags of this entry, including @a PteFlags::eExclusive if it owns its frame.
        PteFlags flags() const noexcept;

        /// @brief The frame this entry points to, only if it is valid.
        std::optional<Frame> pointedFrame() const noexcept;

        /// @brief Point this entry at @p frame.
        ///
        /// If @p flags contains @a PteFlags::eExclusive the entry takes ownership of the frame.
        void set(Frame frame, PteFlags flags) noexcept;

        /// @brief Zero this entry, reporting whether it owned its frame.
        [[nodiscard]]
        UnmapResult setUnmapped() noexcept;

        /// @brief Zero this entry without inspecting it.
        void zero() noexcept;
    };
}
