#pragma once

#include "vmk/arch/x86_64/paging.hpp"
#include "vmk/arch/aarch64/paging.hpp"

namespace arch {
#if defined(__aarch64__)
    using PteFlagsArch = arm64::PteFlagsArm64;
#else
    using PteFlagsArch = x64::PteFlagsX64;
#endif
}
