#include "vmk/memory/pte_flags.hpp"

using vmk::PteFlags;

PteFlags vmk::FromMultibootElfSection(const Elf64_Shdr& section) noexcept {
    return FromElfSectionFlags(section.sh_flags);
}

void vmk::Format<PteFlags>::format(IOutStream& out, PteFlags value) {
    struct FlagName {
        PteFlags flag;
        stdx::StringView name;
    };

    using namespace stdx::literals;

    static constexpr FlagName kNames[] = {
        { PteFlags::eValid, "Valid"_sv },
        { PteFlags::eWritable, "Writable"_sv },
        { PteFlags::eUser, "User"_sv },
        { PteFlags::eDevice, "Device"_sv },
        { PteFlags::eAccessed, "Accessed"_sv },
        { PteFlags::eDirty, "Dirty"_sv },
        { PteFlags::eHuge, "Huge"_sv },
        { PteFlags::eGlobal, "Global"_sv },
        { PteFlags::eExclusive, "Exclusive"_sv },
        { PteFlags::eNotExecutable, "NX"_sv },
    };

    bool first = true;
    for (const FlagName& entry : kNames) {
        if (!HasFlag(value, entry.flag)) continue;

        if (!first) out.write('|');
        out.write(entry.name);
        first = false;
    }

    if (first) {
        out.write("None");
    }
}
