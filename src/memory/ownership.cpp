#include "vmk/memory/ownership.hpp"

using vmk::OwnershipTable;

void OwnershipTable::setExclusive(PhysicalAddress slot, Frame frame) noexcept {
    stdx::LockGuard guard(mLock);
    mExclusive.insert_or_assign(slot.address, frame);
}

bool OwnershipTable::release(PhysicalAddress slot) noexcept {
    stdx::LockGuard guard(mLock);
    return mExclusive.erase(slot.address) != 0;
}

bool OwnershipTable::isExclusive(PhysicalAddress slot) noexcept {
    stdx::LockGuard guard(mLock);
    return mExclusive.contains(slot.address);
}

void OwnershipTable::releaseTable(Frame frame) noexcept {
    stdx::LockGuard guard(mLock);
    if (mExclusive.empty()) return;

    uintptr_t base = frame.startAddress().address;
    for (size_t i = 0; i < kEntriesPerTable; i++) {
        mExclusive.erase(base + (i * sizeof(uint64_t)));
    }
}

size_t OwnershipTable::count() noexcept {
    stdx::LockGuard guard(mLock);
    return mExclusive.size();
}
