#pragma once

#include "vmk/memory/arena.hpp"
#include "vmk/memory/ownership.hpp"
#include "vmk/memory/pte_flags.hpp"

#include <optional>

namespace vmk {
    struct Translation {
        PhysicalAddress address;

        /// @brief Effective flags of the leaf, writable only if every level is writable.
        PteFlags flags;
    };

    /// @brief A software model of the memory management unit.
    ///
    /// Walks the 4 level table hierarchy rooted at the active root frame the
    /// same way the hardware would, using the native entry encoding. Table
    /// memory and mapped frames must live inside the arena.
    class Mmu {
        PhysicalArena *mArena;
        OwnershipTable mOwnership;
        Frame mActiveRoot;

    public:
        UTIL_NOCOPY(Mmu);
        UTIL_NOMOVE(Mmu);

        Mmu(PhysicalArena *arena [[gnu::nonnull]]) noexcept
            : mArena(arena)
        { }

        PhysicalArena& arena() noexcept { return *mArena; }
        OwnershipTable& ownership() noexcept { return mOwnership; }

        Frame activeRoot() const noexcept { return mActiveRoot; }

        /// @brief Switch to a new root table, flushing all non-global translations.
        void setActiveRoot(Frame root) noexcept;

        /// @brief Translate a virtual address through the active tables.
        std::optional<Translation> walk(VirtualAddress address) const noexcept;

        /// @brief Translate a virtual address, an unmapped address is a fatal page fault.
        PhysicalAddress resolve(VirtualAddress address) const noexcept;

        uint64_t load64(VirtualAddress address) const noexcept;
        void store64(VirtualAddress address, uint64_t value) noexcept;

        void read(VirtualAddress address, std::span<std::byte> dst) const noexcept;
        void write(VirtualAddress address, std::span<const std::byte> src) noexcept;

        /// @brief Zero a frame and forget any ownership recorded inside it.
        void zeroFrame(Frame frame) noexcept;

        void flushPage(Page page) noexcept;
        void flushAll() noexcept;
    };
}
