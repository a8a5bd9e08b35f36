#include "vmk/memory/temporary_page.hpp"

#include "vmk/logger/categories.hpp"

using vmk::TinyAllocator;
using vmk::TemporaryPage;

void TinyAllocator::deallocate(FrameRange range) noexcept {
    for (AllocatedFrames& slot : mReserve) {
        if (slot.isEmpty()) {
            slot = mSource->adopt(range);
            return;
        }
    }

    // Only frames that came from the reserve can be returned to it.
    VMK_PANIC("Tiny allocator reserve overflow");
}

OsStatus TinyAllocator::allocate(size_t count, AllocatedFrames *result) noexcept {
    if (count != 1) {
        return OsStatusInvalidInput;
    }

    for (AllocatedFrames& slot : mReserve) {
        if (!slot.isEmpty()) {
            *result = adopt(slot.consume());
            return OsStatusSuccess;
        }
    }

    return OsStatusOutOfMemory;
}

OsStatus TinyAllocator::allocateAt(Frame, size_t, AllocatedFrames *) noexcept {
    return OsStatusNotSupported;
}

size_t TinyAllocator::remaining() const noexcept {
    size_t count = 0;
    for (const AllocatedFrames& slot : mReserve) {
        if (!slot.isEmpty()) {
            count += 1;
        }
    }

    return count;
}

OsStatus TinyAllocator::create(IFrameAllocator& source, TinyAllocator *result) noexcept {
    result->mSource = &source;

    for (AllocatedFrames& slot : result->mReserve) {
        if (OsStatus status = source.allocate(1, &slot)) {
            return status;
        }
    }

    return OsStatusSuccess;
}

OsStatus TemporaryPage::map(Mapper& mapper, Frame frame, TemporaryPage *result) noexcept {
    if (!mapper.isActive() || !mapper.isReachable()) {
        return OsStatusInvalidInput;
    }

    if (OsStatus status = TinyAllocator::create(mapper.frameAllocator(), &result->mReserve)) {
        return status;
    }

    Page top = Page::containing(kTemporaryPageAddress);
    AllocatedPages page;

    for (size_t i = 0; i < kTemporaryPageProbeLimit; i++) {
        Page candidate = top - i;
        if (mapper.translatePage(candidate).has_value()) {
            continue;
        }

        if (mapper.pageAllocator().allocateAt(candidate, 1, &page) == OsStatusSuccess) {
            break;
        }
    }

    if (page.isEmpty()) {
        MemLog.warnf("No temporary page available below ", Page::containing(kTemporaryPageAddress));
        return OsStatusNotAvailable;
    }

    PteFlags flags = kDefaultPteFlags | PteFlags::eValid | PteFlags::eWritable;
    if (OsStatus status = mapper.mapPage(page.front(), frame, flags, result->mReserve)) {
        return status;
    }

    result->mMapper = &mapper;
    result->mPage = std::move(page);
    result->mFrame = frame;
    result->mMapped = true;
    return OsStatusSuccess;
}

OsStatus TemporaryPage::create(Mapper& mapper, AllocatedFrames&& frame, TemporaryPage *result) noexcept {
    if (frame.count() != 1) {
        return OsStatusInvalidInput;
    }

    if (OsStatus status = map(mapper, frame.front(), result)) {
        return status;
    }

    result->mOwnedFrame = std::move(frame);
    return OsStatusSuccess;
}

OsStatus TemporaryPage::create(Mapper& mapper, Frame frame, TemporaryPage *result) noexcept {
    return map(mapper, frame, result);
}

OsStatus TemporaryPage::unmapIntoParts(UnmappedParts *parts) noexcept {
    if (!mMapped) {
        return OsStatusInvalidInput;
    }

    UnmapResult entry = mMapper->unmapPage(mPage.front());
    VMK_CHECK(!entry.isExclusive(), "Temporary page entry must not own its frame");

    mMapped = false;

    parts->pages = std::move(mPage);
    parts->frames.clear();
    parts->frames.add(std::move(mOwnedFrame));

    return OsStatusSuccess;
}

TemporaryPage::~TemporaryPage() noexcept {
    if (!mMapped) {
        return;
    }

    MemLog.errorf("Temporary page ", mPage.range(), " dropped without being unmapped");

    UnmappedParts parts;
    OsStatus status = unmapIntoParts(&parts);
    VMK_CHECK(status == OsStatusSuccess, "Failed to tear down temporary page");
}
