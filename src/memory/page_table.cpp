#include "vmk/memory/page_table.hpp"

#include "vmk/arch/paging.hpp"
#include "vmk/logger/categories.hpp"

using vmk::PageTable;

PageTable::~PageTable() noexcept {
    if (mRoot.isEmpty()) {
        return;
    }

    if (isActive()) {
        FrameRange leaked = mRoot.consume();
        MemLog.errorf("Active page table ", leaked, " destroyed, its root is leaked");
    }
}

void PageTable::activate() noexcept {
    mMapper.mmu().setActiveRoot(root());
}

OsStatus PageTable::bootstrap(Mmu& mmu, IFrameAllocator& frames, IPageAllocator& pages, ShootdownCoordinator *shootdown, PageTable *result) noexcept {
    AllocatedFrames root;
    if (OsStatus status = frames.allocate(1, &root)) {
        return status;
    }

    if (!mmu.arena().frames().contains(root.range())) {
        return OsStatusInvalidAddress;
    }

    Frame frame = root.front();
    mmu.zeroFrame(frame);

    uint64_t entry = arch::PteFlagsArch::fromGeneric(recursiveFlags()).underlying;
    entry |= frame.startAddress().address & arch::PteFlagsArch::kFrameMask;
    mmu.arena().store64(frame.startAddress() + (kRecursiveIndex * sizeof(uint64_t)), entry);

    result->mRoot = std::move(root);
    result->mMapper = Mapper { &mmu, frame, &frames, &pages, shootdown };
    result->activate();

    InitLog.infof("Bootstrapped page table at ", frame);
    return OsStatusSuccess;
}

OsStatus PageTable::create(PageTable& active, PageTable *result) noexcept {
    Mapper& mapper = active.mapper();
    if (!active.isActive()) {
        return OsStatusInvalidInput;
    }

    AllocatedFrames root;
    if (OsStatus status = mapper.frameAllocator().allocate(1, &root)) {
        return status;
    }

    TemporaryPage page;
    if (OsStatus status = TemporaryPage::create(mapper, std::move(root), &page)) {
        return status;
    }

    page.withTableAndFrame([](P1Table& table, Frame frame) {
        table.zero();
        table[kRecursiveIndex].set(frame, recursiveFlags());
    });

    UnmappedParts parts;
    if (OsStatus status = page.unmapIntoParts(&parts)) {
        return status;
    }

    AllocatedFrames& rootRun = parts.frames.runs().front();
    Frame frame = rootRun.front();
    result->mRoot = std::move(rootRun);
    result->mMapper = Mapper { &mapper.mmu(), frame, &mapper.frameAllocator(), &mapper.pageAllocator(), mapper.shootdown() };
    return OsStatusSuccess;
}
