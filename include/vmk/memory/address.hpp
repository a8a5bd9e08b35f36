#pragma once

#include "vmk/memory/layout.hpp"
#include "vmk/util/format.hpp"

#include <compare> // IWYU pragma: keep - std::strong_ordering
#include <memory> // IWYU pragma: keep - std::hash<>

#include <cstddef>
#include <cstdint>

namespace vmk {
    namespace detail {
        struct PhysicalAddressSpace {
            static constexpr bool isCanonical(uintptr_t address) noexcept {
                return (address & ~kPhysicalAddressMask) == 0;
            }

            static constexpr uintptr_t canonicalize(uintptr_t address) noexcept {
                return address & kPhysicalAddressMask;
            }
        };

        struct VirtualAddressSpace {
#if defined(__aarch64__)
            // The top 16 bits select the ASID which is always zero.
            static constexpr bool isCanonical(uintptr_t address) noexcept {
                return (address >> 48) == 0;
            }

            static constexpr uintptr_t canonicalize(uintptr_t address) noexcept {
                return address & 0x0000'FFFF'FFFF'FFFF;
            }
#else
            // Bits 47 through 63 must all match.
            static constexpr bool isCanonical(uintptr_t address) noexcept {
                uintptr_t top = address >> 47;
                return top == 0 || top == 0x1FFFF;
            }

            static constexpr uintptr_t canonicalize(uintptr_t address) noexcept {
                return uintptr_t(intptr_t(address << 16) >> 16);
            }
#endif
        };

        constexpr uintptr_t SaturatingAdd(uintptr_t lhs, uintptr_t rhs) noexcept {
            uintptr_t result;
            if (__builtin_add_overflow(lhs, rhs, &result)) {
                return UINTPTR_MAX;
            }
            return result;
        }

        constexpr uintptr_t SaturatingSub(uintptr_t lhs, uintptr_t rhs) noexcept {
            return lhs > rhs ? lhs - rhs : 0;
        }
    }

    /// @brief An address in either the physical or virtual address space.
    ///
    /// The raw value is stored as given, use @a canonical to construct an address
    /// that the hardware will accept. Arithmetic saturates and canonicalizes.
    template<typename AddressSpace>
    struct Address {
        uintptr_t address;

        constexpr Address() noexcept = default;

        constexpr Address(uintptr_t address) noexcept
            : address(address)
        { }

        constexpr Address(std::nullptr_t) noexcept
            : address(0)
        { }

        static constexpr Address canonical(uintptr_t address) noexcept {
            return Address { AddressSpace::canonicalize(address) };
        }

        constexpr auto operator<=>(const Address& other) const noexcept = default;

        constexpr bool isNull() const noexcept {
            return address == 0;
        }

        constexpr bool isCanonical() const noexcept {
            return AddressSpace::isCanonical(address);
        }

        constexpr bool isAlignedTo(size_t alignment) const noexcept {
            return (address % alignment) == 0;
        }

        constexpr uintptr_t pageOffset() const noexcept {
            return address & (kPageSize - 1);
        }

        constexpr Address operator+(uintptr_t offset) const noexcept {
            return canonical(detail::SaturatingAdd(address, offset));
        }

        constexpr Address operator-(uintptr_t offset) const noexcept {
            return canonical(detail::SaturatingSub(address, offset));
        }

        constexpr Address& operator+=(uintptr_t offset) noexcept {
            return *this = *this + offset;
        }

        constexpr Address& operator-=(uintptr_t offset) noexcept {
            return *this = *this - offset;
        }

        constexpr ptrdiff_t operator-(Address other) const noexcept {
            return address - other.address;
        }
    };

    using PhysicalAddress = Address<detail::PhysicalAddressSpace>;
    using VirtualAddress = Address<detail::VirtualAddressSpace>;

    template<typename AddressSpace>
    struct Format<Address<AddressSpace>> {
        static constexpr size_t kStringSize = kFormatSize<Hex<uintptr_t>>;
        static stdx::StringView toString(char *buffer, Address<AddressSpace> value) {
            return Format<Hex<uintptr_t>>::toString(buffer, Hex(value.address).pad(16));
        }
    };
}

template<typename AddressSpace>
struct std::hash<vmk::Address<AddressSpace>> {
    size_t operator()(const vmk::Address<AddressSpace>& address) const noexcept {
        return std::hash<uintptr_t>()(address.address);
    }
};
