#pragma once

#include "vmk/memory/allocated.hpp"

#include "vmk/logger/categories.hpp"
#include "vmk/panic.hpp"
#include "vmk/std/spinlock.hpp"
#include "vmk/util/absl.hpp"

namespace vmk {
    /// @brief First fit allocator over a set of free chunk ranges.
    ///
    /// Free ranges are kept coalesced, so two adjacent free ranges never
    /// exist at the same time. Returning a range that is already free is a bug.
    template<typename AddressSpace>
    class ChunkAllocator final : public IChunkAllocator<AddressSpace> {
        using Chunk = vmk::Chunk<AddressSpace>;
        using Range = ChunkRange<AddressSpace>;
        using Allocated = AllocatedChunks<AddressSpace>;

        stdx::SpinLock mLock;

        /// @brief Free ranges, keyed by the first chunk number mapped to the last.
        sm::BTreeMap<uintptr_t, uintptr_t> mFreeRanges;
        size_t mFreeCount = 0;

        bool overlapsFree(uintptr_t front, uintptr_t back) const noexcept {
            auto next = mFreeRanges.lower_bound(front);
            if (next != mFreeRanges.end() && next->first <= back) {
                return true;
            }

            if (next != mFreeRanges.begin() && std::prev(next)->second >= front) {
                return true;
            }

            return false;
        }

        /// @note Erasing from a btree invalidates every iterator into it,
        ///       each neighbour is looked up again after the previous erase.
        void insertFree(uintptr_t front, uintptr_t back) noexcept {
            if (auto next = mFreeRanges.find(back + 1); next != mFreeRanges.end()) {
                back = next->second;
                mFreeRanges.erase(next);
            }

            if (auto next = mFreeRanges.lower_bound(front); next != mFreeRanges.begin()) {
                auto prev = std::prev(next);
                if (prev->second + 1 == front) {
                    front = prev->first;
                    mFreeRanges.erase(prev);
                }
            }

            mFreeRanges.insert({ front, back });
        }

        void takeFrom(uintptr_t freeFront, uintptr_t freeBack, uintptr_t front, uintptr_t back) noexcept {
            mFreeRanges.erase(freeFront);

            if (freeFront < front) {
                mFreeRanges.insert({ freeFront, front - 1 });
            }

            if (back < freeBack) {
                mFreeRanges.insert({ back + 1, freeBack });
            }

            mFreeCount -= (back - front) + 1;
        }

    protected:
        void deallocate(Range range) noexcept override {
            stdx::LockGuard guard(mLock);

            uintptr_t front = range.front().number();
            uintptr_t back = range.back().number();
            if (overlapsFree(front, back)) {
                MemLog.fatalf("Double free of ", range);
                VMK_PANIC("Double free detected by chunk allocator");
            }

            insertFree(front, back);
            mFreeCount += range.count();
        }

    public:
        UTIL_NOCOPY(ChunkAllocator);
        UTIL_NOMOVE(ChunkAllocator);

        ChunkAllocator() = default;

        ChunkAllocator(Range range) noexcept {
            OsStatus status = addRange(range);
            VMK_CHECK(status == OsStatusSuccess, "Invalid initial range for chunk allocator");
        }

        /// @brief Donate a range of free chunks to this allocator.
        [[nodiscard]]
        OsStatus addRange(Range range) noexcept {
            if (range.isEmpty()) {
                return OsStatusInvalidInput;
            }

            stdx::LockGuard guard(mLock);

            uintptr_t front = range.front().number();
            uintptr_t back = range.back().number();
            if (overlapsFree(front, back)) {
                return OsStatusAlreadyExists;
            }

            insertFree(front, back);
            mFreeCount += range.count();
            return OsStatusSuccess;
        }

        [[nodiscard]]
        OsStatus allocate(size_t count, Allocated *result) noexcept override {
            if (count == 0) {
                return OsStatusInvalidInput;
            }

            stdx::LockGuard guard(mLock);

            for (auto [front, back] : mFreeRanges) {
                if ((back - front) + 1 >= count) {
                    uintptr_t last = front + count - 1;
                    takeFrom(front, back, front, last);
                    *result = this->adopt(Range { Chunk { front }, Chunk { last } });
                    return OsStatusSuccess;
                }
            }

            return OsStatusOutOfMemory;
        }

        [[nodiscard]]
        OsStatus allocateAt(Chunk start, size_t count, Allocated *result) noexcept override {
            if (count == 0) {
                return OsStatusInvalidInput;
            }

            uintptr_t front = start.number();
            uintptr_t back = front + count - 1;
            if (back < front || back > kMaxPageNumber) {
                return OsStatusInvalidInput;
            }

            stdx::LockGuard guard(mLock);

            auto it = mFreeRanges.upper_bound(front);
            if (it == mFreeRanges.begin()) {
                return OsStatusNotAvailable;
            }

            --it;
            auto [freeFront, freeBack] = *it;
            if (freeBack < back) {
                return OsStatusNotAvailable;
            }

            takeFrom(freeFront, freeBack, front, back);
            *result = this->adopt(Range { Chunk { front }, Chunk { back } });
            return OsStatusSuccess;
        }

        /// @brief Number of chunks available for allocation.
        size_t freeCount() noexcept {
            stdx::LockGuard guard(mLock);
            return mFreeCount;
        }

        /// @brief Is every chunk of @p range currently free.
        bool isFree(Range range) noexcept {
            if (range.isEmpty()) {
                return false;
            }

            stdx::LockGuard guard(mLock);
            auto it = mFreeRanges.upper_bound(range.front().number());
            if (it == mFreeRanges.begin()) {
                return false;
            }

            --it;
            return it->second >= range.back().number();
        }
    };

    using FrameAllocator = ChunkAllocator<detail::PhysicalAddressSpace>;
    using PageAllocator = ChunkAllocator<detail::VirtualAddressSpace>;
}
