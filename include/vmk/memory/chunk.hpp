#pragma once

#include "vmk/memory/address.hpp"

#include <concepts>

namespace vmk {
    /// @brief A single page sized unit of either physical or virtual memory.
    ///
    /// Chunk numbers never exceed @a kMaxPageNumber, arithmetic saturates
    /// at both ends of the range rather than wrapping.
    template<typename AddressSpace>
    class Chunk {
        uintptr_t mNumber;

    public:
        using Address = vmk::Address<AddressSpace>;

        constexpr Chunk() noexcept
            : mNumber(0)
        { }

        constexpr explicit Chunk(uintptr_t number) noexcept
            : mNumber(number > kMaxPageNumber ? kMaxPageNumber : number)
        { }

        /// @brief The chunk that contains @p address.
        static constexpr Chunk containing(Address address) noexcept {
            return Chunk { address.address / kPageSize };
        }

        constexpr uintptr_t number() const noexcept {
            return mNumber;
        }

        constexpr Address startAddress() const noexcept {
            return Address::canonical(mNumber * kPageSize);
        }

        constexpr auto operator<=>(const Chunk&) const noexcept = default;

        constexpr Chunk operator+(uintptr_t count) const noexcept {
            return Chunk { detail::SaturatingAdd(mNumber, count) };
        }

        constexpr Chunk operator-(uintptr_t count) const noexcept {
            return Chunk { detail::SaturatingSub(mNumber, count) };
        }

        constexpr Chunk& operator+=(uintptr_t count) noexcept {
            return *this = *this + count;
        }

        constexpr Chunk& operator-=(uintptr_t count) noexcept {
            return *this = *this - count;
        }

        /// @brief The number of chunks between two chunks, zero if @p other is above this chunk.
        constexpr uintptr_t operator-(Chunk other) const noexcept {
            return detail::SaturatingSub(mNumber, other.mNumber);
        }

        constexpr Chunk& operator++() noexcept {
            return *this += 1;
        }

        constexpr uintptr_t p4Index() const noexcept requires (std::same_as<AddressSpace, detail::VirtualAddressSpace>) {
            return (mNumber >> 27) & 0x1FF;
        }

        constexpr uintptr_t p3Index() const noexcept requires (std::same_as<AddressSpace, detail::VirtualAddressSpace>) {
            return (mNumber >> 18) & 0x1FF;
        }

        constexpr uintptr_t p2Index() const noexcept requires (std::same_as<AddressSpace, detail::VirtualAddressSpace>) {
            return (mNumber >> 9) & 0x1FF;
        }

        constexpr uintptr_t p1Index() const noexcept requires (std::same_as<AddressSpace, detail::VirtualAddressSpace>) {
            return mNumber & 0x1FF;
        }
    };

    using Frame = Chunk<detail::PhysicalAddressSpace>;
    using Page = Chunk<detail::VirtualAddressSpace>;

    template<typename AddressSpace>
    struct Format<Chunk<AddressSpace>> {
        static constexpr size_t kStringSize = kFormatSize<Hex<uintptr_t>> + 8;

        static void format(IOutStream& out, Chunk<AddressSpace> value) {
            if constexpr (std::same_as<AddressSpace, detail::PhysicalAddressSpace>) {
                out.format("Frame(", value.startAddress(), ")");
            } else {
                out.format("Page(", value.startAddress(), ")");
            }
        }
    };
}
