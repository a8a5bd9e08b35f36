#pragma once

#include "vmk/memory/chunk_range.hpp"

#include "vmk/util/util.hpp"

#include <atomic>

namespace vmk {
    /// @brief The interrupt used to request a tlb shootdown.
    struct ShootdownIpi {
        enum Kind : uint8_t {
            /// @brief Delivered as a non maskable interrupt.
            eNmi,

            /// @brief Delivered as a regular inter-processor interrupt.
            eFast,
        };

        Kind kind;
        uint8_t vector;
    };

#if defined(__aarch64__)
    constexpr ShootdownIpi kShootdownIpi { ShootdownIpi::eFast, 2 };
#else
    constexpr ShootdownIpi kShootdownIpi { ShootdownIpi::eNmi, 2 };
#endif

    /// @brief The interrupt controller as seen by the shootdown protocol.
    class IIpiController {
    public:
        virtual ~IIpiController() = default;

        /// @brief How many cores have been started, including the current one.
        virtual uint32_t startedCoreCount() const noexcept = 0;

        /// @brief Deliver @p ipi to every started core except the current one.
        virtual void sendToAllOthers(ShootdownIpi ipi) noexcept = 0;
    };

    /// @brief Keeps the tlbs of every started core coherent after an unmap or remap.
    ///
    /// Only one shootdown may be in flight at a time. The initiator spins
    /// with interrupts disabled until every other core has flushed the
    /// published range.
    class ShootdownCoordinator {
        IIpiController *mController;

        std::atomic<bool> mLock { false };
        std::atomic<uint32_t> mPending { 0 };
        std::atomic<bool> mPublished { false };

        /// @brief The published range, as inclusive page numbers.
        std::atomic<uintptr_t> mFront { 0 };
        std::atomic<uintptr_t> mBack { 0 };

    public:
        UTIL_NOCOPY(ShootdownCoordinator);
        UTIL_NOMOVE(ShootdownCoordinator);

        ShootdownCoordinator(IIpiController *controller [[gnu::nonnull]]) noexcept
            : mController(controller)
        { }

        /// @brief Flush @p pages from the tlb of every other started core.
        ///
        /// Does nothing when only one core is running. The caller is expected
        /// to have already flushed its own tlb.
        ///
        /// @note Blocks until every other core has acknowledged the flush.
        void shootdown(PageRange pages) noexcept;

        /// @brief Service a shootdown request on the current core.
        ///
        /// @return False if no shootdown is in flight, so the interrupt was not ours.
        bool handleShootdownIpi() noexcept;

        /// @brief Cores that have not yet acknowledged the current shootdown.
        uint32_t pending() const noexcept {
            return mPending.load(std::memory_order_acquire);
        }

        bool inFlight() const noexcept {
            return mLock.load(std::memory_order_acquire);
        }
    };
}
