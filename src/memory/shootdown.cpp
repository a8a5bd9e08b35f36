#include "vmk/memory/shootdown.hpp"

#include "vmk/arch/intrin.hpp"
#include "vmk/isr.hpp"
#include "vmk/logger/categories.hpp"

using vmk::ShootdownCoordinator;

void ShootdownCoordinator::shootdown(PageRange pages) noexcept {
    if (pages.isEmpty()) {
        return;
    }

    uint32_t cores = mController->startedCoreCount();
    if (cores <= 1) {
        return;
    }

    IntGuard guard;

    bool expected = false;
    while (!mLock.compare_exchange_weak(expected, true, std::memory_order_acquire, std::memory_order_relaxed)) {
        expected = false;
        arch::Intrin::pause();
    }

    mFront.store(pages.front().number(), std::memory_order_relaxed);
    mBack.store(pages.back().number(), std::memory_order_relaxed);
    mPending.store(cores - 1, std::memory_order_relaxed);
    mPublished.store(true, std::memory_order_release);

    mController->sendToAllOthers(kShootdownIpi);

    while (mPending.load(std::memory_order_acquire) > 0) {
        arch::Intrin::pause();
    }

    mPublished.store(false, std::memory_order_relaxed);
    mLock.store(false, std::memory_order_release);

    TlbLog.dbgf("Shootdown of ", pages, " acknowledged by ", cores - 1, " cores");
}

bool ShootdownCoordinator::handleShootdownIpi() noexcept {
    if (!mPublished.load(std::memory_order_acquire)) {
        return false;
    }

    PageRange pages { Page { mFront.load(std::memory_order_relaxed) }, Page { mBack.load(std::memory_order_relaxed) } };
    for (Page page : pages) {
        arch::Intrin::invlpg(page.startAddress().address);
    }

    mPending.fetch_sub(1, std::memory_order_acq_rel);
    return true;
}
