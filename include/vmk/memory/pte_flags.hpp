#pragma once

#include "vmk/util/format.hpp"
#include "vmk/util/util.hpp"

#include <elf.h>

#include <stdint.h>

namespace vmk {
    /// @brief Architecture independent page table entry flags.
    ///
    /// Each architecture translates these into its own hardware encoding,
    /// see @a arch::PteFlagsArch.
    enum class PteFlags : uint64_t {
        eNone = 0,

        /// @brief The entry maps a frame, or points to a lower table.
        eValid = 1ull << 0,

        /// @brief The page may be written to.
        eWritable = 1ull << 1,

        /// @brief The page is accessible from user mode.
        eUser = 1ull << 2,

        /// @brief The page is uncached device memory.
        eDevice = 1ull << 4,

        eAccessed = 1ull << 5,
        eDirty = 1ull << 6,

        /// @brief The entry maps a large or huge page rather than a lower table.
        eHuge = 1ull << 7,

        /// @brief The translation is shared by all address spaces.
        eGlobal = 1ull << 8,

        /// @brief The entry is the only mapping of its frame and owns it.
        ///
        /// This is never written into a hardware entry, it is tracked in
        /// the ownership side table alongside the entry.
        eExclusive = 1ull << 55,

        eNotExecutable = 1ull << 63,
    };

    UTIL_BITFLAGS(PteFlags);

    /// @brief Flags for a page that is readable, not writable, and not executable.
    constexpr PteFlags kDefaultPteFlags = PteFlags::eAccessed | PteFlags::eNotExecutable;

    constexpr bool HasFlag(PteFlags flags, PteFlags bit) noexcept {
        return (flags & bit) == bit;
    }

    constexpr PteFlags SetFlag(PteFlags flags, PteFlags bit, bool state) noexcept {
        return state ? (flags | bit) : (flags & ~bit);
    }

    /// @brief Adjust flags for use in a P4, P3, or P2 entry.
    ///
    /// Higher level entries are always valid and executable, only a P1 entry
    /// may restrict execution or own its frame. Cache attributes and the huge
    /// bit only have meaning on leaf entries.
    constexpr PteFlags AdjustForHigherLevel(PteFlags flags) noexcept {
        flags &= ~(PteFlags::eNotExecutable | PteFlags::eExclusive | PteFlags::eDevice | PteFlags::eHuge);
        return flags | PteFlags::eValid | PteFlags::eAccessed;
    }

    /// @brief Build page flags from the flags of an ELF section header.
    ///
    /// An allocated section is valid, a writable section is writable, and any
    /// section without @c SHF_EXECINSTR is not executable.
    constexpr PteFlags FromElfSectionFlags(uint64_t flags) noexcept {
        PteFlags result = kDefaultPteFlags;
        result = SetFlag(result, PteFlags::eValid, flags & SHF_ALLOC);
        result = SetFlag(result, PteFlags::eWritable, flags & SHF_WRITE);
        result = SetFlag(result, PteFlags::eNotExecutable, !(flags & SHF_EXECINSTR));
        return result;
    }

    /// @brief Build page flags from a section of the multiboot2 ELF symbols tag.
    PteFlags FromMultibootElfSection(const Elf64_Shdr& section) noexcept;

    template<>
    struct Format<PteFlags> {
        static constexpr size_t kStringSize = 96;
        static void format(IOutStream& out, PteFlags value);
    };
}
