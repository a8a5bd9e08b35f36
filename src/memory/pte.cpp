#include "vmk/memory/pte.hpp"

#include "vmk/arch/paging.hpp"

using vmk::PageTableEntry;
using vmk::PteFlags;

vmk::PhysicalAddress PageTableEntry::slot() const noexcept {
    return mMmu->resolve(mAddress);
}

uint64_t PageTableEntry::value() const noexcept {
    return mMmu->load64(mAddress);
}

PteFlags PageTableEntry::flags() const noexcept {
    uint64_t entry = value();
    if (entry == 0) {
        return PteFlags::eNone;
    }

    PteFlags result = arch::PteFlagsArch::fromEntry(entry).toGeneric();
    if (mMmu->ownership().isExclusive(slot())) {
        result |= PteFlags::eExclusive;
    }

    return result;
}

std::optional<vmk::Frame> PageTableEntry::pointedFrame() const noexcept {
    uint64_t entry = value();
    if (!arch::PteFlagsArch::fromEntry(entry).isValid()) {
        return std::nullopt;
    }

    return Frame::containing(entry & arch::PteFlagsArch::kFrameMask);
}

void PageTableEntry::set(Frame frame, PteFlags flags) noexcept {
    uint64_t entry = arch::PteFlagsArch::fromGeneric(flags).underlying;
    entry |= frame.startAddress().address & arch::PteFlagsArch::kFrameMask;

    // Resolve first, the entry may be the one that redirects the walk.
    PhysicalAddress where = slot();
    mMmu->store64(mAddress, entry);

    if (HasFlag(flags, PteFlags::eExclusive)) {
        mMmu->ownership().setExclusive(where, frame);
    } else {
        mMmu->ownership().release(where);
    }
}

vmk::UnmapResult PageTableEntry::setUnmapped() noexcept {
    std::optional<Frame> frame = pointedFrame();
    PhysicalAddress where = slot();

    mMmu->store64(mAddress, 0);
    bool exclusive = mMmu->ownership().release(where);

    if (!frame.has_value()) {
        return UnmapResult { UnmapResult::eNonExclusive, FrameRange::empty() };
    }

    FrameRange frames = FrameRange::of(*frame, 1);
    return UnmapResult { exclusive ? UnmapResult::eExclusive : UnmapResult::eNonExclusive, frames };
}

void PageTableEntry::zero() noexcept {
    PhysicalAddress where = slot();
    mMmu->store64(mAddress, 0);
    mMmu->ownership().release(where);
}
