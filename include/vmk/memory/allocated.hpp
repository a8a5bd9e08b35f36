#pragma once

#include "vmk/memory/chunk_range.hpp"

#include "vmk/util/util.hpp"

namespace vmk {
    template<typename AddressSpace>
    class AllocatedChunks;

    /// @brief A source of exclusively owned chunks.
    ///
    /// Implementations must never hand out two live allocations that overlap.
    template<typename AddressSpace>
    class IChunkAllocator {
        friend class AllocatedChunks<AddressSpace>;

    protected:
        /// @brief Return a range to the allocator.
        ///
        /// Only called by @a AllocatedChunks when it is destroyed while still owning memory.
        virtual void deallocate(ChunkRange<AddressSpace> range) noexcept = 0;

    public:
        virtual ~IChunkAllocator() = default;

        /// @brief Allocate @p count contiguous chunks anywhere.
        [[nodiscard]]
        virtual OsStatus allocate(size_t count, AllocatedChunks<AddressSpace> *result) noexcept = 0;

        /// @brief Allocate @p count contiguous chunks starting exactly at @p start.
        [[nodiscard]]
        virtual OsStatus allocateAt(Chunk<AddressSpace> start, size_t count, AllocatedChunks<AddressSpace> *result) noexcept = 0;

        /// @brief Take back ownership of a range that was previously consumed.
        ///
        /// @pre @p range was allocated by this allocator and released with @a AllocatedChunks::consume.
        ///
        /// @warning Adopting a range that is free, or owned elsewhere, breaks exclusivity.
        AllocatedChunks<AddressSpace> adopt(ChunkRange<AddressSpace> range) noexcept;
    };

    /// @brief An exclusively owned range of chunks.
    ///
    /// Destroying a non-empty handle returns its range to the allocator that produced it.
    template<typename AddressSpace>
    class AllocatedChunks {
        friend class IChunkAllocator<AddressSpace>;

        using Chunk = vmk::Chunk<AddressSpace>;
        using Range = ChunkRange<AddressSpace>;

        Range mRange;
        IChunkAllocator<AddressSpace> *mAllocator;

        AllocatedChunks(Range range, IChunkAllocator<AddressSpace> *allocator) noexcept
            : mRange(range)
            , mAllocator(allocator)
        { }

        void release() noexcept {
            if (!mRange.isEmpty() && mAllocator != nullptr) {
                mAllocator->deallocate(mRange);
            }

            mRange = Range::empty();
        }

    public:
        UTIL_NOCOPY(AllocatedChunks);

        constexpr AllocatedChunks() noexcept
            : mRange(Range::empty())
            , mAllocator(nullptr)
        { }

        AllocatedChunks(AllocatedChunks&& other) noexcept
            : mRange(std::exchange(other.mRange, Range::empty()))
            , mAllocator(other.mAllocator)
        { }

        AllocatedChunks& operator=(AllocatedChunks&& other) noexcept {
            if (this != &other) {
                release();
                mRange = std::exchange(other.mRange, Range::empty());
                mAllocator = other.mAllocator;
            }

            return *this;
        }

        ~AllocatedChunks() noexcept {
            release();
        }

        Range range() const noexcept { return mRange; }
        Chunk front() const noexcept { return mRange.front(); }
        Chunk back() const noexcept { return mRange.back(); }
        size_t count() const noexcept { return mRange.count(); }
        bool isEmpty() const noexcept { return mRange.isEmpty(); }
        IChunkAllocator<AddressSpace> *allocator() const noexcept { return mAllocator; }

        /// @brief Give up ownership without returning the range to the allocator.
        ///
        /// Used when the chunks are handed to a structure that tracks them by
        /// other means, such as a page table entry marked exclusive.
        [[nodiscard]]
        Range consume() noexcept {
            return std::exchange(mRange, Range::empty());
        }

        /// @brief Split off the chunks from @p at onwards into @p tail.
        ///
        /// @return OsStatusInvalidInput if @p at is outside [front, back + 1].
        [[nodiscard]]
        OsStatus split(Chunk at, AllocatedChunks *tail) noexcept {
            Range head;
            Range rest;
            if (!mRange.splitAt(at, &head, &rest)) {
                return OsStatusInvalidInput;
            }

            mRange = head;
            *tail = AllocatedChunks { rest, mAllocator };
            return OsStatusSuccess;
        }

        /// @brief Absorb @p other into this range.
        ///
        /// Both ranges must come from the same allocator and be adjacent.
        /// On failure neither handle is modified.
        [[nodiscard]]
        OsStatus merge(AllocatedChunks&& other) noexcept {
            if (other.isEmpty()) {
                return OsStatusSuccess;
            }

            if (isEmpty()) {
                *this = std::move(other);
                return OsStatusSuccess;
            }

            if (mAllocator != other.mAllocator) {
                return OsStatusInvalidInput;
            }

            if (mRange.back().number() + 1 == other.mRange.front().number()) {
                mRange = Range { mRange.front(), other.consume().back() };
            } else if (other.mRange.back().number() + 1 == mRange.front().number()) {
                mRange = Range { other.consume().front(), mRange.back() };
            } else {
                return OsStatusInvalidInput;
            }

            return OsStatusSuccess;
        }
    };

    template<typename AddressSpace>
    AllocatedChunks<AddressSpace> IChunkAllocator<AddressSpace>::adopt(ChunkRange<AddressSpace> range) noexcept {
        return AllocatedChunks<AddressSpace> { range, this };
    }

    using IFrameAllocator = IChunkAllocator<detail::PhysicalAddressSpace>;
    using IPageAllocator = IChunkAllocator<detail::VirtualAddressSpace>;

    using AllocatedFrames = AllocatedChunks<detail::PhysicalAddressSpace>;
    using AllocatedPages = AllocatedChunks<detail::VirtualAddressSpace>;
}
