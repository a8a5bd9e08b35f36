#include "vmk/isr.hpp"

#include "vmk/arch/intrin.hpp"

void vmk::DisableInterrupts() {
    arch::Intrin::cli();
}

void vmk::EnableInterrupts() {
    arch::Intrin::sti();
}

bool vmk::InterruptsEnabled() {
    return arch::Intrin::interruptsEnabled();
}
