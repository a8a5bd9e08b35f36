#pragma once

#include "vmk/memory/mapper.hpp"

namespace vmk {
    /// @brief A small reserve of frames used to build the tables a temporary page needs.
    ///
    /// Frames that are used to create tables stay installed in the page table
    /// hierarchy for the life of that hierarchy. Unused frames are returned to
    /// their source allocator when the reserve is destroyed.
    ///
    /// @note Frames handed out must be consumed before the reserve is destroyed.
    class TinyAllocator final : public IFrameAllocator {
        IFrameAllocator *mSource = nullptr;
        AllocatedFrames mReserve[kTemporaryPageReserveFrames];

    protected:
        void deallocate(FrameRange range) noexcept override;

    public:
        UTIL_NOCOPY(TinyAllocator);
        UTIL_NOMOVE(TinyAllocator);

        TinyAllocator() noexcept = default;

        [[nodiscard]]
        OsStatus allocate(size_t count, AllocatedFrames *result) noexcept override;

        [[nodiscard]]
        OsStatus allocateAt(Frame start, size_t count, AllocatedFrames *result) noexcept override;

        /// @brief Frames still held in reserve.
        size_t remaining() const noexcept;

        /// @brief Fill the reserve from @p source.
        [[nodiscard]]
        static OsStatus create(IFrameAllocator& source, TinyAllocator *result) noexcept;
    };

    /// @brief Maps a single frame at a fixed high page so it can be edited as a table.
    ///
    /// This is how tables that are not reachable through the recursive slot,
    /// such as the root of an inactive page table, are modified. The page is
    /// chosen by probing downward from @a kTemporaryPageAddress so it does
    /// not depend on any general purpose allocation policy.
    ///
    /// A temporary page must be torn down with @a unmapIntoParts. Destroying
    /// one that is still mapped is a bug, it is logged and then torn down
    /// through the same path so the frame is released exactly once.
    class TemporaryPage {
        Mapper *mMapper = nullptr;
        TinyAllocator mReserve;
        AllocatedPages mPage;
        Frame mFrame;

        /// @brief Ownership of the mapped frame, if it was handed over exclusively.
        AllocatedFrames mOwnedFrame;

        bool mMapped = false;

        [[nodiscard]]
        static OsStatus map(Mapper& mapper, Frame frame, TemporaryPage *result) noexcept;

    public:
        UTIL_NOCOPY(TemporaryPage);
        UTIL_NOMOVE(TemporaryPage);

        TemporaryPage() noexcept = default;
        ~TemporaryPage() noexcept;

        bool isMapped() const noexcept { return mMapped; }
        Page page() const noexcept { return mPage.front(); }
        Frame frame() const noexcept { return mFrame; }

        /// @brief Run @p fn with the mapped frame viewed as a table.
        ///
        /// @param fn Called as fn(P1Table&, Frame).
        template<typename F>
        void withTableAndFrame(F&& fn) {
            VMK_CHECK(mMapped, "Temporary page is not mapped");

            P1Table table { &mMapper->mmu(), mPage.front().startAddress() };
            std::forward<F>(fn)(table, mFrame);
        }

        /// @brief Unmap the page and hand back the page and, if it was owned, the frame.
        [[nodiscard]]
        OsStatus unmapIntoParts(UnmappedParts *parts) noexcept;

        /// @brief Map a frame that the temporary page takes ownership of.
        ///
        /// @param mapper The mapper of the active page table.
        /// @param frame A single frame.
        /// @param result The temporary page to initialize.
        ///
        /// @return OsStatusNotAvailable if no free page was found near the top of the address space.
        [[nodiscard]]
        static OsStatus create(Mapper& mapper, AllocatedFrames&& frame, TemporaryPage *result) noexcept;

        /// @brief Map a frame that is owned elsewhere.
        [[nodiscard]]
        static OsStatus create(Mapper& mapper, Frame frame, TemporaryPage *result) noexcept;
    };

    template<typename F>
    OsStatus Mapper::withTemporaryMapping(Frame frame, F&& fn) noexcept {
        TemporaryPage page;
        if (OsStatus status = TemporaryPage::create(*this, frame, &page)) {
            return status;
        }

        page.withTableAndFrame(std::forward<F>(fn));

        UnmappedParts parts;
        return page.unmapIntoParts(&parts);
    }
}
