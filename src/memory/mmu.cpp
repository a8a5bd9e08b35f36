#include "vmk/memory/mmu.hpp"

#include "vmk/arch/intrin.hpp"
#include "vmk/arch/paging.hpp"
#include "vmk/logger/categories.hpp"
#include "vmk/panic.hpp"

using vmk::Mmu;
using vmk::PhysicalAddress;
using vmk::VirtualAddress;

void Mmu::setActiveRoot(Frame root) noexcept {
    mActiveRoot = root;
    arch::Intrin::flushTlb();
}

std::optional<vmk::Translation> Mmu::walk(VirtualAddress address) const noexcept {
    if (!address.isCanonical()) {
        return std::nullopt;
    }

    PhysicalAddress table = mActiveRoot.startAddress();
    bool writable = true;

    for (unsigned level = 4; level > 0; level--) {
        unsigned shift = kPageShift + (kEntryShift * (level - 1));
        uintptr_t index = (address.address >> shift) & (kEntriesPerTable - 1);

        uint64_t entry = mArena->load64(table + (index * sizeof(uint64_t)));
        arch::PteFlagsArch flags = arch::PteFlagsArch::fromEntry(entry);
        if (!flags.isValid()) {
            return std::nullopt;
        }

        writable = writable && flags.isWritable();

        PhysicalAddress next = entry & arch::PteFlagsArch::kFrameMask;
        bool leaf = (level == 1) || (flags.isHuge() && level < 4);
        if (leaf) {
            uintptr_t offset = address.address & ((uintptr_t(1) << shift) - 1);
            PteFlags result = SetFlag(flags.toGeneric(), PteFlags::eWritable, writable);
            return Translation { next + offset, result };
        }

        table = next;
    }

    return std::nullopt;
}

PhysicalAddress Mmu::resolve(VirtualAddress address) const noexcept {
    std::optional<Translation> translation = walk(address);
    if (!translation.has_value()) {
        MemLog.fatalf("Page fault at ", address);
        VMK_PANIC("Page fault");
    }

    return translation->address;
}

uint64_t Mmu::load64(VirtualAddress address) const noexcept {
    return mArena->load64(resolve(address));
}

void Mmu::store64(VirtualAddress address, uint64_t value) noexcept {
    std::optional<Translation> translation = walk(address);
    if (!translation.has_value() || !HasFlag(translation->flags, PteFlags::eWritable)) {
        MemLog.fatalf("Write fault at ", address);
        VMK_PANIC("Write fault");
    }

    mArena->store64(translation->address, value);
}

void Mmu::read(VirtualAddress address, std::span<std::byte> dst) const noexcept {
    while (!dst.empty()) {
        size_t chunk = std::min(dst.size(), kPageSize - address.pageOffset());
        mArena->read(resolve(address), dst.subspan(0, chunk));

        dst = dst.subspan(chunk);
        address += chunk;
    }
}

void Mmu::write(VirtualAddress address, std::span<const std::byte> src) noexcept {
    while (!src.empty()) {
        size_t chunk = std::min(src.size(), kPageSize - address.pageOffset());

        std::optional<Translation> translation = walk(address);
        if (!translation.has_value() || !HasFlag(translation->flags, PteFlags::eWritable)) {
            MemLog.fatalf("Write fault at ", address);
            VMK_PANIC("Write fault");
        }

        mArena->write(translation->address, src.subspan(0, chunk));

        src = src.subspan(chunk);
        address += chunk;
    }
}

void Mmu::zeroFrame(Frame frame) noexcept {
    mArena->zero(frame);
    mOwnership.releaseTable(frame);
}

void Mmu::flushPage(Page page) noexcept {
    arch::Intrin::invlpg(page.startAddress().address);
}

void Mmu::flushAll() noexcept {
    arch::Intrin::flushTlb();
}
