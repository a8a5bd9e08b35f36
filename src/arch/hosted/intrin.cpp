#include "vmk/arch/intrin.hpp"

#if __STDC_HOSTED__
arch::IHostedIntrin *arch::HostedIntrin::gImpl = arch::IHostedIntrin::GetDefault();
#endif
