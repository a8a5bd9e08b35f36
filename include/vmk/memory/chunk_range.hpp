#pragma once

#include "vmk/memory/chunk.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

namespace vmk {
    /// @brief An inclusive range of chunks.
    ///
    /// A range whose end is below its start is empty, the canonical empty
    /// range is [1, 0].
    template<typename AddressSpace>
    class ChunkRange {
        using Chunk = vmk::Chunk<AddressSpace>;
        using Address = vmk::Address<AddressSpace>;

        Chunk mStart;
        Chunk mEnd;

    public:
        class Iterator {
            uintptr_t mCurrent;

        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = Chunk;
            using difference_type = ptrdiff_t;
            using pointer = const Chunk*;
            using reference = Chunk;

            constexpr Iterator() noexcept
                : mCurrent(0)
            { }

            constexpr Iterator(uintptr_t current) noexcept
                : mCurrent(current)
            { }

            constexpr Chunk operator*() const noexcept {
                return Chunk { mCurrent };
            }

            constexpr Iterator& operator++() noexcept {
                mCurrent += 1;
                return *this;
            }

            constexpr Iterator operator++(int) noexcept {
                Iterator copy = *this;
                mCurrent += 1;
                return copy;
            }

            constexpr bool operator==(const Iterator&) const noexcept = default;
        };

        constexpr ChunkRange() noexcept
            : mStart(1)
            , mEnd(0)
        { }

        constexpr ChunkRange(Chunk start, Chunk end) noexcept
            : mStart(start)
            , mEnd(end)
        { }

        static constexpr ChunkRange empty() noexcept {
            return ChunkRange { };
        }

        /// @brief A range of @p count chunks beginning at @p start.
        static constexpr ChunkRange of(Chunk start, size_t count) noexcept {
            if (count == 0) {
                return empty();
            }

            return ChunkRange { start, start + (count - 1) };
        }

        /// @brief The smallest range that covers @p size bytes beginning at @p start.
        static constexpr ChunkRange fromAddress(Address start, size_t size) noexcept {
            if (size == 0) {
                return empty();
            }

            return ChunkRange { Chunk::containing(start), Chunk::containing(start + (size - 1)) };
        }

        constexpr Chunk front() const noexcept { return mStart; }
        constexpr Chunk back() const noexcept { return mEnd; }

        constexpr Address startAddress() const noexcept {
            return mStart.startAddress();
        }

        constexpr bool isEmpty() const noexcept {
            return mEnd < mStart;
        }

        constexpr size_t count() const noexcept {
            return isEmpty() ? 0 : (mEnd - mStart) + 1;
        }

        constexpr size_t sizeInBytes() const noexcept {
            return count() * kPageSize;
        }

        constexpr bool contains(Chunk chunk) const noexcept {
            return mStart <= chunk && chunk <= mEnd;
        }

        constexpr bool contains(ChunkRange other) const noexcept {
            return !other.isEmpty() && contains(other.mStart) && contains(other.mEnd);
        }

        constexpr bool containsAddress(Address address) const noexcept {
            return contains(Chunk::containing(address));
        }

        /// @brief The offset of @p address from the start of this range.
        constexpr std::optional<size_t> offsetOfAddress(Address address) const noexcept {
            if (!containsAddress(address)) {
                return std::nullopt;
            }

            return address.address - startAddress().address;
        }

        /// @brief The address @p offset bytes into this range.
        constexpr std::optional<Address> addressAtOffset(size_t offset) const noexcept {
            if (offset >= sizeInBytes()) {
                return std::nullopt;
            }

            return startAddress() + offset;
        }

        constexpr std::optional<ChunkRange> overlap(ChunkRange other) const noexcept {
            ChunkRange result { std::max(mStart, other.mStart), std::min(mEnd, other.mEnd) };
            if (result.isEmpty()) {
                return std::nullopt;
            }

            return result;
        }

        /// @brief Split this range into [front, at) and [at, back].
        ///
        /// @pre @p at must lie within [front, back + 1].
        ///
        /// @return True if the split point was valid.
        constexpr bool splitAt(Chunk at, ChunkRange *head, ChunkRange *tail) const noexcept {
            if (isEmpty() || at < mStart || (at - mEnd) > 1) {
                return false;
            }

            *head = (at == mStart) ? empty() : ChunkRange { mStart, at - 1 };
            *tail = (at > mEnd) ? empty() : ChunkRange { at, mEnd };
            return true;
        }

        constexpr Iterator begin() const noexcept {
            return Iterator { mStart.number() };
        }

        constexpr Iterator end() const noexcept {
            return Iterator { mStart.number() + count() };
        }

        constexpr bool operator==(const ChunkRange& other) const noexcept {
            if (isEmpty() && other.isEmpty()) {
                return true;
            }

            return mStart == other.mStart && mEnd == other.mEnd;
        }
    };

    using FrameRange = ChunkRange<detail::PhysicalAddressSpace>;
    using PageRange = ChunkRange<detail::VirtualAddressSpace>;

    template<typename AddressSpace>
    struct Format<ChunkRange<AddressSpace>> {
        static constexpr size_t kStringSize = (kFormatSize<Chunk<AddressSpace>> * 2) + 8;

        static void format(IOutStream& out, ChunkRange<AddressSpace> value) {
            if (value.isEmpty()) {
                out.write("[empty]");
            } else {
                out.format("[", value.front(), " .. ", value.back(), "]");
            }
        }
    };
}
