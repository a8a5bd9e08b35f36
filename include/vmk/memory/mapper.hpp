#pragma once

#include "vmk/memory/shootdown.hpp"
#include "vmk/memory/table.hpp"

#include "vmk/util/absl.hpp"

#include <optional>
#include <span>

namespace vmk {
    class MappedPages;
    class TemporaryPage;

    /// @brief Frames taken back from exclusive entries.
    ///
    /// A mapping does not guarantee its frames are contiguous, so they are
    /// kept as runs of adjacent frames in page order.
    class ReclaimedFrames {
        sm::InlinedVector<AllocatedFrames, 1> mRuns;

    public:
        /// @brief Append @p frames, extending the last run if they are adjacent to it.
        void add(AllocatedFrames&& frames) noexcept;

        bool isEmpty() const noexcept { return mRuns.empty(); }

        /// @brief Total number of frames across every run.
        size_t count() const noexcept;

        bool contains(Frame frame) const noexcept;

        std::span<AllocatedFrames> runs() noexcept { return { mRuns.data(), mRuns.size() }; }
        std::span<const AllocatedFrames> runs() const noexcept { return { mRuns.data(), mRuns.size() }; }

        /// @brief Return every run to its allocator.
        void clear() noexcept { mRuns.clear(); }
    };

    /// @brief What is left over after a mapping is removed.
    struct UnmappedParts {
        /// @brief The virtual pages, now unmapped and owned by the caller.
        AllocatedPages pages;

        /// @brief The frames that were mapped exclusively, empty if there were none.
        ReclaimedFrames frames;
    };

    /// @brief The physical location and effective flags of a virtual address.
    struct PageTranslation {
        PhysicalAddress address;
        PteFlags flags;
    };

    /// @brief Maps and unmaps pages in the page table currently reachable
    ///        through the recursive slot.
    ///
    /// A mapper targets one root table. Its operations are only valid while
    /// that root is reachable, either because it is the active root or
    /// because the active root's recursive slot has been pointed at it.
    ///
    /// Edits to a single page table must be serialized by the caller.
    class Mapper {
        Mmu *mMmu = nullptr;
        Frame mRoot;
        IFrameAllocator *mFrameAllocator = nullptr;
        IPageAllocator *mPageAllocator = nullptr;
        ShootdownCoordinator *mShootdown = nullptr;

        [[nodiscard]]
        OsStatus checkCanMap(PageRange pages) const noexcept;

        [[nodiscard]]
        OsStatus mapFrames(AllocatedPages&& pages, FrameRange frames, PteFlags flags, MappedPages *result) noexcept;

        [[nodiscard]]
        OsStatus unmapPages(PageRange pages, ReclaimedFrames *frames) noexcept;

        /// @brief Undo the leaf entries of a partially applied mapping.
        ///
        /// @param reclaim Return frames of exclusive entries to the frame allocator.
        void rollback(PageRange mapped, bool reclaim) noexcept;

        std::optional<P1Table> findP1(Page page) const noexcept;

        void flush(PageRange pages) noexcept;

    public:
        UTIL_NOCOPY(Mapper);

        Mapper() noexcept = default;

        Mapper(Mmu *mmu [[gnu::nonnull]], Frame root,
               IFrameAllocator *frames [[gnu::nonnull]], IPageAllocator *pages [[gnu::nonnull]],
               ShootdownCoordinator *shootdown = nullptr) noexcept
            : mMmu(mmu)
            , mRoot(root)
            , mFrameAllocator(frames)
            , mPageAllocator(pages)
            , mShootdown(shootdown)
        { }

        Mapper(Mapper&&) noexcept = default;
        Mapper& operator=(Mapper&&) noexcept = default;

        Mmu& mmu() const noexcept { return *mMmu; }
        Frame root() const noexcept { return mRoot; }
        IFrameAllocator& frameAllocator() const noexcept { return *mFrameAllocator; }
        IPageAllocator& pageAllocator() const noexcept { return *mPageAllocator; }

        ShootdownCoordinator *shootdown() const noexcept { return mShootdown; }
        void setShootdown(ShootdownCoordinator *shootdown) noexcept { mShootdown = shootdown; }

        /// @brief The top level table of the reachable hierarchy.
        P4Table p4() const noexcept {
            return P4Table { mMmu, kRecursiveP4Address };
        }

        /// @brief Is this mapper's root the one reached through the recursive slot.
        bool isReachable() const noexcept;

        /// @brief Is this mapper's root the active root of the mmu.
        bool isActive() const noexcept;

        std::optional<Frame> translatePage(Page page) const noexcept;
        std::optional<PageTranslation> translate(VirtualAddress address) const noexcept;

        /// @brief Map @p pages to newly allocated frames.
        ///
        /// Each page gets its own frame, the frames are not contiguous in general.
        ///
        /// @param pages The pages to map, only moved from on success.
        /// @param flags The flags of every page, @a PteFlags::eValid is implied.
        /// @param result The new mapping.
        ///
        /// @return OsStatusNotSupported if @p flags requests a huge page.
        [[nodiscard]]
        OsStatus map(AllocatedPages&& pages, PteFlags flags, MappedPages *result) noexcept;

        /// @brief Map @p pages to @p frames, the mapping takes ownership of the frames.
        ///
        /// @pre @p frames must come from this mapper's frame allocator.
        [[nodiscard]]
        OsStatus mapTo(AllocatedPages&& pages, AllocatedFrames&& frames, PteFlags flags, MappedPages *result) noexcept;

        /// @brief Map @p pages to frames owned elsewhere, such as device memory.
        ///
        /// The frames are never returned to an allocator when the mapping is removed.
        [[nodiscard]]
        OsStatus mapToShared(AllocatedPages&& pages, FrameRange frames, PteFlags flags, MappedPages *result) noexcept;

        /// @brief Remove a mapping and hand back its parts.
        ///
        /// The pages are flushed locally and from every other started core
        /// before this returns.
        [[nodiscard]]
        OsStatus unmap(MappedPages&& mapping, UnmappedParts *result) noexcept;

        /// @brief Remove the front or back of a mapping.
        ///
        /// @return OsStatusInvalidAddress if @p pages is not inside the mapping,
        ///         OsStatusInvalidInput if it would leave a hole.
        [[nodiscard]]
        OsStatus unmapRange(MappedPages& mapping, PageRange pages, UnmappedParts *result) noexcept;

        /// @brief Change the flags of an existing mapping.
        [[nodiscard]]
        OsStatus remap(MappedPages& mapping, PteFlags flags) noexcept;

        /// @brief Map @p frame at a temporary page and run @p fn on it.
        ///
        /// The frame is not owned by the temporary mapping.
        ///
        /// @param fn Called as fn(P1Table&, Frame) while the frame is mapped.
        template<typename F>
        OsStatus withTemporaryMapping(Frame frame, F&& fn) noexcept;

        /// @brief Install a single leaf entry, creating tables from @p tables.
        ///
        /// No ownership handles are involved and nothing is broadcast, this
        /// is the building block for temporary pages.
        [[nodiscard]]
        OsStatus mapPage(Page page, Frame frame, PteFlags flags, IFrameAllocator& tables) noexcept;

        /// @brief Remove a single leaf entry installed by @a mapPage, flushing it locally.
        [[nodiscard]]
        UnmapResult unmapPage(Page page) noexcept;
    };
}

#include "vmk/memory/temporary_page.hpp"
