#include "vmk/memory/mapped_pages.hpp"

#include "vmk/logger/categories.hpp"

#include <array>

using vmk::MappedPages;

void MappedPages::release() noexcept {
    if (mMapper == nullptr || mPages.isEmpty()) {
        mMapper = nullptr;
        return;
    }

    UnmappedParts parts;
    if (OsStatus status = mMapper->unmap(std::move(*this), &parts)) {
        // The pages may still be mapped somewhere, they can never be reused.
        PageRange leaked = mPages.consume();
        MemLog.errorf("Failed to unmap ", leaked, " on release: ", OsStatusId(status));
    }

    mMapper = nullptr;
}

MappedPages& MappedPages::operator=(MappedPages&& other) noexcept {
    if (this != &other) {
        release();

        mPages = std::move(other.mPages);
        mFlags = other.mFlags;
        mRoot = other.mRoot;
        mMapper = std::exchange(other.mMapper, nullptr);
    }

    return *this;
}

OsStatus MappedPages::read(size_t offset, std::span<std::byte> dst) const noexcept {
    if (mMapper == nullptr || mMapper->mmu().activeRoot() != mRoot) {
        return OsStatusInvalidInput;
    }

    if (offset > sizeInBytes() || dst.size() > sizeInBytes() - offset) {
        return OsStatusOutOfBounds;
    }

    mMapper->mmu().read(startAddress() + offset, dst);
    return OsStatusSuccess;
}

OsStatus MappedPages::write(size_t offset, std::span<const std::byte> src) noexcept {
    if (mMapper == nullptr || mMapper->mmu().activeRoot() != mRoot) {
        return OsStatusInvalidInput;
    }

    if (!HasFlag(mFlags, PteFlags::eWritable)) {
        return OsStatusAccessDenied;
    }

    if (offset > sizeInBytes() || src.size() > sizeInBytes() - offset) {
        return OsStatusOutOfBounds;
    }

    mMapper->mmu().write(startAddress() + offset, src);
    return OsStatusSuccess;
}

OsStatus MappedPages::merge(std::span<MappedPages> mappings) noexcept {
    if (isEmpty()) {
        return OsStatusInvalidInput;
    }

    uintptr_t next = pages().back().number() + 1;
    for (const MappedPages& mapping : mappings) {
        if (mapping.isEmpty()
            || mapping.mRoot != mRoot
            || mapping.mFlags != mFlags
            || mapping.mPages.allocator() != mPages.allocator()
            || mapping.pages().front().number() != next) {
            return OsStatusInvalidInput;
        }

        next = mapping.pages().back().number() + 1;
    }

    for (MappedPages& mapping : mappings) {
        OsStatus status = mPages.merge(std::move(mapping.mPages));
        VMK_CHECK(status == OsStatusSuccess, "Validated mappings failed to merge");
        mapping.mMapper = nullptr;
    }

    return OsStatusSuccess;
}

OsStatus MappedPages::deepCopy(PteFlags flags, MappedPages *result) const noexcept {
    if (mMapper == nullptr || mMapper->mmu().activeRoot() != mRoot) {
        return OsStatusInvalidInput;
    }

    if (isEmpty()) {
        *result = MappedPages();
        return OsStatusSuccess;
    }

    AllocatedPages pages;
    if (OsStatus status = mMapper->pageAllocator().allocate(count(), &pages)) {
        return status;
    }

    MappedPages copy;
    if (OsStatus status = mMapper->map(std::move(pages), flags | PteFlags::eWritable, &copy)) {
        return status;
    }

    std::array<std::byte, kPageSize> buffer;
    for (size_t offset = 0; offset < sizeInBytes(); offset += kPageSize) {
        if (OsStatus status = read(offset, buffer)) {
            return status;
        }

        if (OsStatus status = copy.write(offset, buffer)) {
            return status;
        }
    }

    if (!HasFlag(flags, PteFlags::eWritable)) {
        if (OsStatus status = mMapper->remap(copy, flags)) {
            return status;
        }
    }

    *result = std::move(copy);
    return OsStatusSuccess;
}
