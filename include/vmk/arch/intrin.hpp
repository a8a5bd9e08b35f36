#pragma once

#include <stdint.h>
#include <stddef.h>

#if __STDC_HOSTED__
#   include "vmk/arch/hosted/intrin.hpp"
#elif defined(__x86_64__)
#   include "vmk/arch/x86_64/intrin.hpp"
#elif defined(__aarch64__)
#   include "vmk/arch/aarch64/intrin.hpp"
#else
#   error "Unsupported architecture"
#endif
