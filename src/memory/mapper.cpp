#include "vmk/memory/mapper.hpp"
#include "vmk/memory/mapped_pages.hpp"

#include "vmk/logger/categories.hpp"

using vmk::Mapper;
using vmk::PteFlags;

/// The huge bit of a leaf entry selects PAT on x86_64 and is a reserved encoding on aarch64.
static bool IsLeafFlags(PteFlags flags) {
    return !vmk::HasFlag(flags, PteFlags::eHuge);
}

static bool IsMappable(vmk::Page page) {
    vmk::VirtualAddress address { page.number() * vmk::kPageSize };
    return address.isCanonical() && page.p4Index() != vmk::kRecursiveIndex;
}

bool Mapper::isReachable() const noexcept {
    std::optional<Translation> translation = mMmu->walk(kRecursiveP4Address);
    return translation.has_value() && Frame::containing(translation->address) == mRoot;
}

bool Mapper::isActive() const noexcept {
    return mMmu->activeRoot() == mRoot;
}

std::optional<vmk::P1Table> Mapper::findP1(Page page) const noexcept {
    std::optional<P3Table> p3 = p4().nextTable(page.p4Index());
    if (!p3.has_value()) return std::nullopt;

    std::optional<P2Table> p2 = p3->nextTable(page.p3Index());
    if (!p2.has_value()) return std::nullopt;

    return p2->nextTable(page.p2Index());
}

std::optional<vmk::PageTranslation> Mapper::translate(VirtualAddress address) const noexcept {
    Page page = Page::containing(address);
    if (!IsMappable(page) || !isReachable()) {
        return std::nullopt;
    }

    P4Table p4 = this->p4();
    if (!HasFlag(p4[page.p4Index()].flags(), PteFlags::eValid)) {
        return std::nullopt;
    }

    P3Table p3 { mMmu, NextTableAddress(p4.address(), page.p4Index()) };
    PageTableEntry e3 = p3[page.p3Index()];
    PteFlags f3 = e3.flags();
    if (!HasFlag(f3, PteFlags::eValid)) {
        return std::nullopt;
    }

    if (HasFlag(f3, PteFlags::eHuge)) {
        uintptr_t offset = address.address & (kHugePageSize - 1);
        return PageTranslation { e3.pointedFrame()->startAddress() + offset, f3 };
    }

    P2Table p2 { mMmu, NextTableAddress(p3.address(), page.p3Index()) };
    PageTableEntry e2 = p2[page.p2Index()];
    PteFlags f2 = e2.flags();
    if (!HasFlag(f2, PteFlags::eValid)) {
        return std::nullopt;
    }

    if (HasFlag(f2, PteFlags::eHuge)) {
        uintptr_t offset = address.address & (kLargePageSize - 1);
        return PageTranslation { e2.pointedFrame()->startAddress() + offset, f2 };
    }

    P1Table p1 { mMmu, NextTableAddress(p2.address(), page.p2Index()) };
    PageTableEntry e1 = p1[page.p1Index()];
    std::optional<Frame> frame = e1.pointedFrame();
    if (!frame.has_value()) {
        return std::nullopt;
    }

    return PageTranslation { frame->startAddress() + address.pageOffset(), e1.flags() };
}

std::optional<vmk::Frame> Mapper::translatePage(Page page) const noexcept {
    if (std::optional<PageTranslation> translation = translate(page.startAddress())) {
        return Frame::containing(translation->address);
    }

    return std::nullopt;
}

OsStatus Mapper::checkCanMap(PageRange pages) const noexcept {
    P4Table p4 = this->p4();

    for (Page page : pages) {
        if (!IsMappable(page)) {
            return OsStatusInvalidAddress;
        }

        PteFlags f4 = p4[page.p4Index()].flags();
        if (!HasFlag(f4, PteFlags::eValid)) continue;

        P3Table p3 { mMmu, NextTableAddress(p4.address(), page.p4Index()) };
        PteFlags f3 = p3[page.p3Index()].flags();
        if (HasFlag(f3, PteFlags::eHuge)) return OsStatusNotSupported;
        if (!HasFlag(f3, PteFlags::eValid)) continue;

        P2Table p2 { mMmu, NextTableAddress(p3.address(), page.p3Index()) };
        PteFlags f2 = p2[page.p2Index()].flags();
        if (HasFlag(f2, PteFlags::eHuge)) return OsStatusNotSupported;
        if (!HasFlag(f2, PteFlags::eValid)) continue;

        P1Table p1 { mMmu, NextTableAddress(p2.address(), page.p2Index()) };
        if (!p1[page.p1Index()].isUnused()) {
            return OsStatusAlreadyExists;
        }
    }

    return OsStatusSuccess;
}

OsStatus Mapper::mapPage(Page page, Frame frame, PteFlags flags, IFrameAllocator& tables) noexcept {
    if (!IsMappable(page)) {
        return OsStatusInvalidAddress;
    }

    P4Table p4 = this->p4();

    P3Table p3;
    if (OsStatus status = p4.nextTableCreate(page.p4Index(), flags, tables, &p3)) {
        return status;
    }

    if (HasFlag(p3[page.p3Index()].flags(), PteFlags::eHuge)) {
        return OsStatusNotSupported;
    }

    P2Table p2;
    if (OsStatus status = p3.nextTableCreate(page.p3Index(), flags, tables, &p2)) {
        return status;
    }

    if (HasFlag(p2[page.p2Index()].flags(), PteFlags::eHuge)) {
        return OsStatusNotSupported;
    }

    P1Table p1;
    if (OsStatus status = p2.nextTableCreate(page.p2Index(), flags, tables, &p1)) {
        return status;
    }

    PageTableEntry entry = p1[page.p1Index()];
    if (!entry.isUnused()) {
        return OsStatusAlreadyExists;
    }

    entry.set(frame, flags | PteFlags::eValid);
    return OsStatusSuccess;
}

vmk::UnmapResult Mapper::unmapPage(Page page) noexcept {
    std::optional<P1Table> p1 = findP1(page);
    if (!p1.has_value()) {
        return UnmapResult { UnmapResult::eNonExclusive, FrameRange::empty() };
    }

    UnmapResult result = (*p1)[page.p1Index()].setUnmapped();
    mMmu->flushPage(page);
    return result;
}

void vmk::ReclaimedFrames::add(AllocatedFrames&& frames) noexcept {
    if (frames.isEmpty()) {
        return;
    }

    if (!mRuns.empty() && mRuns.back().merge(std::move(frames)) == OsStatusSuccess) {
        return;
    }

    mRuns.push_back(std::move(frames));
}

size_t vmk::ReclaimedFrames::count() const noexcept {
    size_t total = 0;
    for (const AllocatedFrames& run : mRuns) {
        total += run.count();
    }

    return total;
}

bool vmk::ReclaimedFrames::contains(Frame frame) const noexcept {
    for (const AllocatedFrames& run : mRuns) {
        if (run.range().contains(frame)) {
            return true;
        }
    }

    return false;
}

void Mapper::rollback(PageRange mapped, bool reclaim) noexcept {
    for (Page page : mapped) {
        UnmapResult undo = unmapPage(page);
        if (reclaim && undo.isExclusive()) {
            [[maybe_unused]] AllocatedFrames freed = mFrameAllocator->adopt(undo.frames);
        }
    }
}

void Mapper::flush(PageRange pages) noexcept {
    for (Page page : pages) {
        mMmu->flushPage(page);
    }

    if (mShootdown != nullptr) {
        mShootdown->shootdown(pages);
    }
}

OsStatus Mapper::mapFrames(AllocatedPages&& pages, FrameRange frames, PteFlags flags, MappedPages *result) noexcept {
    if (pages.count() != frames.count()) {
        return OsStatusInvalidInput;
    }

    if (!IsLeafFlags(flags)) {
        return OsStatusNotSupported;
    }

    if (!isReachable()) {
        return OsStatusInvalidInput;
    }

    if (OsStatus status = checkCanMap(pages.range())) {
        return status;
    }

    flags |= PteFlags::eValid;

    size_t index = 0;
    for (Page page : pages.range()) {
        if (OsStatus status = mapPage(page, frames.front() + index, flags, *mFrameAllocator)) {
            MemLog.warnf("Failed to map ", page, ": ", OsStatusId(status));

            // The caller still owns the frames.
            rollback(PageRange::of(pages.front(), index), false);
            return status;
        }

        index += 1;
    }

    *result = MappedPages { std::move(pages), flags & ~PteFlags::eExclusive, mRoot, this };
    return OsStatusSuccess;
}

OsStatus Mapper::map(AllocatedPages&& pages, PteFlags flags, MappedPages *result) noexcept {
    if (pages.isEmpty()) {
        *result = MappedPages { std::move(pages), flags, mRoot, this };
        return OsStatusSuccess;
    }

    if (!IsLeafFlags(flags)) {
        return OsStatusNotSupported;
    }

    if (!isReachable()) {
        return OsStatusInvalidInput;
    }

    if (OsStatus status = checkCanMap(pages.range())) {
        return status;
    }

    flags = (flags | PteFlags::eValid) & ~PteFlags::eExclusive;

    size_t index = 0;
    for (Page page : pages.range()) {
        AllocatedFrames frame;
        OsStatus status = mFrameAllocator->allocate(1, &frame);
        if (status == OsStatusSuccess) {
            status = mapPage(page, frame.front(), flags | PteFlags::eExclusive, *mFrameAllocator);
        }

        if (status != OsStatusSuccess) {
            MemLog.warnf("Failed to map ", page, ": ", OsStatusId(status));

            rollback(PageRange::of(pages.front(), index), true);
            return status;
        }

        // The entry now owns the frame.
        [[maybe_unused]] FrameRange owned = frame.consume();
        index += 1;
    }

    *result = MappedPages { std::move(pages), flags, mRoot, this };
    return OsStatusSuccess;
}

OsStatus Mapper::mapTo(AllocatedPages&& pages, AllocatedFrames&& frames, PteFlags flags, MappedPages *result) noexcept {
    if (!frames.isEmpty() && frames.allocator() != mFrameAllocator) {
        return OsStatusInvalidInput;
    }

    if (pages.isEmpty() && frames.isEmpty()) {
        *result = MappedPages { std::move(pages), flags, mRoot, this };
        return OsStatusSuccess;
    }

    if (OsStatus status = mapFrames(std::move(pages), frames.range(), flags | PteFlags::eExclusive, result)) {
        return status;
    }

    // The entries now own the frames.
    [[maybe_unused]] FrameRange owned = frames.consume();
    return OsStatusSuccess;
}

OsStatus Mapper::mapToShared(AllocatedPages&& pages, FrameRange frames, PteFlags flags, MappedPages *result) noexcept {
    if (pages.isEmpty() && frames.isEmpty()) {
        *result = MappedPages { std::move(pages), flags, mRoot, this };
        return OsStatusSuccess;
    }

    return mapFrames(std::move(pages), frames, flags & ~PteFlags::eExclusive, result);
}

OsStatus Mapper::unmapPages(PageRange pages, ReclaimedFrames *frames) noexcept {
    ReclaimedFrames owned;

    for (Page page : pages) {
        std::optional<P1Table> p1 = findP1(page);
        if (!p1.has_value()) {
            MemLog.errorf("Unmapping ", page, " which has no page table");
            continue;
        }

        UnmapResult entry = (*p1)[page.p1Index()].setUnmapped();
        if (!entry.isExclusive()) {
            continue;
        }

        owned.add(mFrameAllocator->adopt(entry.frames));
    }

    flush(pages);

    *frames = std::move(owned);
    return OsStatusSuccess;
}

OsStatus Mapper::unmap(MappedPages&& mapping, UnmappedParts *result) noexcept {
    if (mapping.isEmpty()) {
        result->pages = std::move(mapping.mPages);
        result->frames.clear();
        mapping.mMapper = nullptr;
        return OsStatusSuccess;
    }

    if (mapping.mRoot != mRoot || !isReachable()) {
        return OsStatusInvalidInput;
    }

    ReclaimedFrames frames;
    if (OsStatus status = unmapPages(mapping.pages(), &frames)) {
        return status;
    }

    result->pages = std::move(mapping.mPages);
    result->frames = std::move(frames);
    mapping.mMapper = nullptr;
    return OsStatusSuccess;
}

OsStatus Mapper::unmapRange(MappedPages& mapping, PageRange pages, UnmappedParts *result) noexcept {
    if (pages.isEmpty()) {
        result->pages = AllocatedPages();
        result->frames.clear();
        return OsStatusSuccess;
    }

    if (mapping.mRoot != mRoot) {
        return OsStatusInvalidInput;
    }

    PageRange owned = mapping.pages();
    if (!owned.contains(pages)) {
        return OsStatusInvalidAddress;
    }

    if (owned == pages) {
        return unmap(std::move(mapping), result);
    }

    bool prefix = pages.front() == owned.front();
    bool suffix = pages.back() == owned.back();
    if (!prefix && !suffix) {
        return OsStatusInvalidInput;
    }

    if (!isReachable()) {
        return OsStatusInvalidInput;
    }

    ReclaimedFrames frames;
    if (OsStatus status = unmapPages(pages, &frames)) {
        return status;
    }

    AllocatedPages removed;
    if (prefix) {
        AllocatedPages rest;
        OsStatus status = mapping.mPages.split(pages.back() + 1, &rest);
        VMK_CHECK(status == OsStatusSuccess, "Failed to split mapping");

        removed = std::move(mapping.mPages);
        mapping.mPages = std::move(rest);
    } else {
        OsStatus status = mapping.mPages.split(pages.front(), &removed);
        VMK_CHECK(status == OsStatusSuccess, "Failed to split mapping");
    }

    result->pages = std::move(removed);
    result->frames = std::move(frames);
    return OsStatusSuccess;
}

OsStatus Mapper::remap(MappedPages& mapping, PteFlags flags) noexcept {
    if (!IsLeafFlags(flags)) {
        return OsStatusNotSupported;
    }

    flags &= ~PteFlags::eExclusive;

    if (mapping.isEmpty()) {
        mapping.mFlags = flags;
        return OsStatusSuccess;
    }

    if (mapping.mRoot != mRoot || !isReachable()) {
        return OsStatusInvalidInput;
    }

    flags |= PteFlags::eValid;

    for (Page page : mapping.pages()) {
        std::optional<P1Table> p1 = findP1(page);
        if (!p1.has_value()) {
            MemLog.errorf("Remapping ", page, " which has no page table");
            continue;
        }

        PageTableEntry entry = (*p1)[page.p1Index()];
        std::optional<Frame> frame = entry.pointedFrame();
        if (!frame.has_value()) {
            MemLog.errorf("Remapping ", page, " which is not mapped");
            continue;
        }

        PteFlags exclusive = entry.flags() & PteFlags::eExclusive;
        entry.set(*frame, flags | exclusive);
    }

    flush(mapping.pages());

    mapping.mFlags = flags;
    return OsStatusSuccess;
}
