#pragma once

#include "vmk/memory/chunk.hpp"

#include "vmk/std/spinlock.hpp"
#include "vmk/util/absl.hpp"

namespace vmk {
    /// @brief Records which leaf entries own the frame they map.
    ///
    /// Keyed by the physical address of the entry, so every virtual alias of
    /// a table sees the same ownership. Only exclusive entries are stored.
    class OwnershipTable {
        stdx::SpinLock mLock;
        sm::FlatHashMap<uintptr_t, Frame> mExclusive;

    public:
        /// @brief Record that the entry at @p slot exclusively owns @p frame.
        void setExclusive(PhysicalAddress slot, Frame frame) noexcept;

        /// @brief Forget any ownership recorded for the entry at @p slot.
        ///
        /// @return True if the entry was exclusive.
        bool release(PhysicalAddress slot) noexcept;

        bool isExclusive(PhysicalAddress slot) noexcept;

        /// @brief Forget every entry stored inside @p frame.
        void releaseTable(Frame frame) noexcept;

        size_t count() noexcept;
    };
}
