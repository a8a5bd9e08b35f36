#include "vmk/memory/arena.hpp"

#include "vmk/panic.hpp"

#include <bit>
#include <cstring>
#include <new>

using vmk::PhysicalArena;

/// Table words are stored little endian regardless of the host.
static uint64_t ToLittleEndian(uint64_t value) {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

void PhysicalArena::FreeStorage::operator()(std::byte *storage) const noexcept {
    ::operator delete(storage, std::align_val_t(kPageSize));
}

bool PhysicalArena::contains(PhysicalAddress address, size_t size) const noexcept {
    if (address < mBase) {
        return false;
    }

    uintptr_t offset = address.address - mBase.address;
    return offset < sizeInBytes() && size <= sizeInBytes() - offset;
}

std::byte *PhysicalArena::locate(PhysicalAddress address, size_t size) const noexcept {
    VMK_CHECK(contains(address, size), "Physical access outside of arena");

    return mStorage.get() + (address.address - mBase.address);
}

uint64_t PhysicalArena::load64(PhysicalAddress address) const noexcept {
    VMK_CHECK(address.isAlignedTo(sizeof(uint64_t)), "Unaligned physical word read");

    uint64_t value;
    std::memcpy(&value, locate(address, sizeof(uint64_t)), sizeof(uint64_t));
    return ToLittleEndian(value);
}

void PhysicalArena::store64(PhysicalAddress address, uint64_t value) noexcept {
    VMK_CHECK(address.isAlignedTo(sizeof(uint64_t)), "Unaligned physical word write");

    uint64_t stored = ToLittleEndian(value);
    std::memcpy(locate(address, sizeof(uint64_t)), &stored, sizeof(uint64_t));
}

void PhysicalArena::read(PhysicalAddress address, std::span<std::byte> dst) const noexcept {
    if (dst.empty()) return;

    std::memcpy(dst.data(), locate(address, dst.size()), dst.size());
}

void PhysicalArena::write(PhysicalAddress address, std::span<const std::byte> src) noexcept {
    if (src.empty()) return;

    std::memcpy(locate(address, src.size()), src.data(), src.size());
}

void PhysicalArena::zero(Frame frame) noexcept {
    std::memset(locate(frame.startAddress(), kPageSize), 0, kPageSize);
}

OsStatus PhysicalArena::create(PhysicalAddress base, size_t frames, PhysicalArena *arena) noexcept {
    if (frames == 0 || !base.isAlignedTo(kPageSize) || !base.isCanonical()) {
        return OsStatusInvalidInput;
    }

    if (frames > (kMaxPageNumber - Frame::containing(base).number())) {
        return OsStatusInvalidInput;
    }

    size_t size = frames * kPageSize;
    void *storage = ::operator new(size, std::align_val_t(kPageSize), std::nothrow);
    if (storage == nullptr) {
        return OsStatusOutOfMemory;
    }

    std::memset(storage, 0, size);

    arena->mStorage.reset(static_cast<std::byte*>(storage));
    arena->mBase = base;
    arena->mFrameCount = frames;
    return OsStatusSuccess;
}
