#pragma once

#include "vmk/logger/logger.hpp"

inline vmk::Logger InitLog { "INIT" };
inline vmk::Logger MemLog { "MEM" };
inline vmk::Logger TlbLog { "TLB" };
