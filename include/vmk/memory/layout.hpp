#pragma once

#include <stddef.h>
#include <stdint.h>

namespace vmk {
    /// @brief Size of the smallest page, and of every page table.
    constexpr size_t kPageSize = 0x1000;
    constexpr size_t kPageShift = 12;

    /// @brief Number of entries in a table of any level.
    constexpr size_t kEntriesPerTable = 512;
    constexpr size_t kEntryShift = 9;

    constexpr size_t kLargePageSize = kPageSize * kEntriesPerTable;
    constexpr size_t kHugePageSize = kLargePageSize * kEntriesPerTable;

    /// @brief The largest page or frame number, chunk arithmetic saturates here.
    constexpr uintptr_t kMaxPageNumber = UINTPTR_MAX / kPageSize;

    /// @brief The top level slot that points back at its own table.
    ///
    /// No mapping may ever be installed into this slot.
    constexpr size_t kRecursiveIndex = 510;

    /// @brief Where the search for a free temporary page begins, the highest canonical page.
#if defined(__aarch64__)
    constexpr uintptr_t kTemporaryPageAddress = 0x0000'FFFF'FFFF'F000;
#else
    constexpr uintptr_t kTemporaryPageAddress = 0xFFFF'FFFF'FFFF'F000;
#endif

    /// @brief How many pages below @a kTemporaryPageAddress are probed before giving up.
    constexpr size_t kTemporaryPageProbeLimit = 512;

    /// @brief Frames held in reserve to create the tables a temporary page needs.
    constexpr size_t kTemporaryPageReserveFrames = 3;

#if defined(__aarch64__)
    constexpr uintptr_t kPhysicalAddressMask = 0x0000'FFFF'FFFF'FFFF;
#else
    constexpr uintptr_t kPhysicalAddressMask = 0x000F'FFFF'FFFF'FFFF;
#endif
}
