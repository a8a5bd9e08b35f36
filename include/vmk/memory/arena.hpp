#pragma once

#include "vmk/memory/chunk_range.hpp"

#include "vmk/util/util.hpp"

#include <memory>
#include <span>

namespace vmk {
    /// @brief Backing storage for a contiguous range of physical memory.
    ///
    /// Page tables and mapped frames live here. All word access is bounds
    /// checked and little endian, matching the layout the hardware expects.
    class PhysicalArena {
        struct FreeStorage {
            void operator()(std::byte *storage) const noexcept;
        };

        std::unique_ptr<std::byte[], FreeStorage> mStorage;
        PhysicalAddress mBase;
        size_t mFrameCount = 0;

        std::byte *locate(PhysicalAddress address, size_t size) const noexcept;

    public:
        UTIL_NOCOPY(PhysicalArena);

        PhysicalArena() = default;
        PhysicalArena(PhysicalArena&&) = default;
        PhysicalArena& operator=(PhysicalArena&&) = default;

        PhysicalAddress base() const noexcept { return mBase; }
        size_t sizeInBytes() const noexcept { return mFrameCount * kPageSize; }

        FrameRange frames() const noexcept {
            return FrameRange::of(Frame::containing(mBase), mFrameCount);
        }

        /// @brief Does the arena hold all of [address, address + size).
        bool contains(PhysicalAddress address, size_t size = 1) const noexcept;

        /// @brief Read an 8 byte little endian word.
        ///
        /// @pre @p address is 8 byte aligned and inside the arena.
        uint64_t load64(PhysicalAddress address) const noexcept;

        /// @brief Write an 8 byte little endian word.
        ///
        /// @pre @p address is 8 byte aligned and inside the arena.
        void store64(PhysicalAddress address, uint64_t value) noexcept;

        void read(PhysicalAddress address, std::span<std::byte> dst) const noexcept;
        void write(PhysicalAddress address, std::span<const std::byte> src) noexcept;

        /// @brief Fill a frame with zeros.
        void zero(Frame frame) noexcept;

        /// @brief Create an arena of @p frames frames starting at @p base.
        ///
        /// @param base The physical address of the first frame, must be page aligned.
        /// @param frames The number of frames to back.
        /// @param arena The arena to initialize.
        ///
        /// @return The status of the operation.
        [[nodiscard]]
        static OsStatus create(PhysicalAddress base, size_t frames, PhysicalArena *arena) noexcept;
    };
}
