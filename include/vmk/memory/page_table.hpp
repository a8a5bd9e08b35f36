#pragma once

#include "vmk/memory/mapped_pages.hpp"
#include "vmk/memory/temporary_page.hpp"

namespace vmk {
    /// @brief A complete address space, owning its top level table.
    ///
    /// Every page table holds a recursive entry at @a kRecursiveIndex
    /// pointing back at its own root. Intermediate tables created while
    /// mapping are owned by the hierarchy and are not reclaimed.
    class PageTable {
        AllocatedFrames mRoot;
        Mapper mMapper;

        static PteFlags recursiveFlags() noexcept {
            return AdjustForHigherLevel(PteFlags::eWritable);
        }

    public:
        UTIL_NOCOPY(PageTable);
        UTIL_NOMOVE(PageTable);

        PageTable() noexcept = default;
        ~PageTable() noexcept;

        Frame root() const noexcept { return mRoot.front(); }
        Mapper& mapper() noexcept { return mMapper; }
        const Mapper& mapper() const noexcept { return mMapper; }

        bool isActive() const noexcept { return mMapper.isActive(); }

        /// @brief Make this the active page table.
        void activate() noexcept;

        /// @brief Edit @p other through the recursive slot of this table.
        ///
        /// The recursive entry of this table is pointed at @p other for the
        /// duration of @p fn, then restored through a temporary page.
        ///
        /// @pre This page table must be active.
        ///
        /// @param other The page table to edit.
        /// @param fn Called as fn(Mapper&) with the mapper of @p other.
        template<typename F>
        OsStatus with(PageTable& other, F&& fn) noexcept {
            if (!isActive() || other.root() == root()) {
                return OsStatusInvalidInput;
            }

            TemporaryPage page;
            if (OsStatus status = TemporaryPage::create(mMapper, root(), &page)) {
                return status;
            }

            Mmu& mmu = mMapper.mmu();

            mMapper.p4()[kRecursiveIndex].set(other.root(), recursiveFlags());
            mmu.flushAll();

            std::forward<F>(fn)(other.mapper());

            page.withTableAndFrame([](P1Table& table, Frame frame) {
                table[kRecursiveIndex].set(frame, recursiveFlags());
            });
            mmu.flushAll();

            UnmappedParts parts;
            return page.unmapIntoParts(&parts);
        }

        /// @brief Create the first page table and make it active.
        ///
        /// The recursive entry is written physically since nothing is mapped yet.
        [[nodiscard]]
        static OsStatus bootstrap(Mmu& mmu, IFrameAllocator& frames, IPageAllocator& pages, ShootdownCoordinator *shootdown, PageTable *result) noexcept;

        /// @brief Create a new, inactive, page table.
        ///
        /// The new root is zeroed and given its recursive entry through a
        /// temporary page in @p active.
        ///
        /// @pre @p active must be the active page table.
        [[nodiscard]]
        static OsStatus create(PageTable& active, PageTable *result) noexcept;
    };
}
