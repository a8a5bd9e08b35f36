#pragma once

#include "vmk/util/util.hpp"

namespace vmk {
    void DisableInterrupts();
    void EnableInterrupts();
    bool InterruptsEnabled();

    /// @brief RAII guard to disable interrupts.
    ///
    /// Interrupts are only re-enabled on exit if they were enabled on entry.
    class IntGuard {
        bool mWasEnabled;

    public:
        UTIL_NOMOVE(IntGuard);
        UTIL_NOCOPY(IntGuard);

        IntGuard()
            : mWasEnabled(InterruptsEnabled())
        {
            DisableInterrupts();
        }

        ~IntGuard() {
            if (mWasEnabled) {
                EnableInterrupts();
            }
        }
    };
}
