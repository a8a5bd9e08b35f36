#pragma once

#include "vmk/memory/allocated.hpp"
#include "vmk/memory/pte.hpp"

#include "vmk/panic.hpp"

namespace vmk {
    /// @brief The virtual address of the table below entry @p index of @p table.
    ///
    /// Every walk through the recursive slot strips one level of table
    /// selector from the top of the address, so shifting the current table
    /// address up by one level and inserting the index selects the child.
    constexpr VirtualAddress NextTableAddress(VirtualAddress table, size_t index) noexcept {
        return VirtualAddress::canonical((table.address << kEntryShift) | (index << kPageShift));
    }

    /// @brief Where the active top level table appears through the recursive slot.
    constexpr VirtualAddress kRecursiveP4Address = VirtualAddress::canonical(
        (uintptr_t(kRecursiveIndex) << 39)
        | (uintptr_t(kRecursiveIndex) << 30)
        | (uintptr_t(kRecursiveIndex) << 21)
        | (uintptr_t(kRecursiveIndex) << 12)
    );

#if !defined(__aarch64__)
    static_assert(kRecursiveP4Address.address == 0xFFFF'FF7F'BFDF'E000);
#endif

    /// @brief One level of the page table hierarchy, accessed through its virtual address.
    ///
    /// @tparam Level 4 for the top level table, 1 for the tables that map pages.
    template<unsigned Level>
    class Table {
        static_assert(Level >= 1 && Level <= 4, "Invalid page table level");

        Mmu *mMmu = nullptr;
        VirtualAddress mAddress = nullptr;

    public:
        using Lower = Table<(Level > 1) ? Level - 1 : 1>;

        Table() noexcept = default;

        Table(Mmu *mmu [[gnu::nonnull]], VirtualAddress address) noexcept
            : mMmu(mmu)
            , mAddress(address)
        { }

        VirtualAddress address() const noexcept { return mAddress; }

        PageTableEntry operator[](size_t index) const noexcept {
            VMK_CHECK(index < kEntriesPerTable, "Page table index out of bounds");

            return PageTableEntry { mMmu, mAddress + (index * sizeof(uint64_t)) };
        }

        /// @brief Zero every entry, releasing any recorded ownership.
        ///
        /// Frames owned by the entries are not returned to their allocator.
        void zero() noexcept {
            for (size_t i = 0; i < kEntriesPerTable; i++) {
                (*this)[i].zero();
            }
        }

        /// @brief The address of the table below @p index, if there is one.
        std::optional<VirtualAddress> nextTableAddress(size_t index) const noexcept requires (Level > 1) {
            PteFlags flags = (*this)[index].flags();
            if (!HasFlag(flags, PteFlags::eValid) || HasFlag(flags, PteFlags::eHuge)) {
                return std::nullopt;
            }

            return NextTableAddress(mAddress, index);
        }

        std::optional<Lower> nextTable(size_t index) const noexcept requires (Level > 1) {
            if (std::optional<VirtualAddress> address = nextTableAddress(index)) {
                return Lower { mMmu, *address };
            }

            return std::nullopt;
        }

        /// @brief Get the table below @p index, creating it if the entry is empty.
        ///
        /// A new table frame is zeroed before it is installed, so no stale
        /// contents are ever visible as entries.
        ///
        /// @pre The entry at @p index must not map a huge page.
        ///
        /// @param index The entry to descend through.
        /// @param flags The flags of the mapping being created, adjusted for a higher level entry.
        /// @param allocator Where to take a new table frame from.
        /// @param result The table below @p index.
        ///
        /// @return OsStatusOutOfMemory if a table was needed and @p allocator is exhausted.
        [[nodiscard]]
        OsStatus nextTableCreate(size_t index, PteFlags flags, IFrameAllocator& allocator, Lower *result) noexcept requires (Level > 1) {
            PageTableEntry entry = (*this)[index];
            PteFlags current = entry.flags();
            VMK_CHECK(!HasFlag(current, PteFlags::eHuge), "mapping code does not support huge pages");

            if (!HasFlag(current, PteFlags::eValid)) {
                AllocatedFrames frame;
                if (allocator.allocate(1, &frame) != OsStatusSuccess) {
                    return OsStatusOutOfMemory;
                }

                // Table frames are owned by the hierarchy, not by the entry.
                FrameRange range = frame.consume();
                mMmu->zeroFrame(range.front());
                entry.set(range.front(), AdjustForHigherLevel(flags) | PteFlags::eWritable);
            }

            *result = Lower { mMmu, NextTableAddress(mAddress, index) };
            return OsStatusSuccess;
        }
    };

    using P4Table = Table<4>;
    using P3Table = Table<3>;
    using P2Table = Table<2>;
    using P1Table = Table<1>;
}
