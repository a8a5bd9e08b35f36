#pragma once

#include "vmk/std/string_view.hpp"

#include <source_location>

/// @brief Stop the current core. Supplied by the embedder.
extern "C" [[noreturn]] void VmkHalt(void);

namespace vmk {
    [[noreturn]]
    void BugCheck(stdx::StringView message, std::source_location where = std::source_location::current()) noexcept;
}

#define VMK_PANIC(msg) vmk::BugCheck(msg)
#define VMK_CHECK(expr, msg) do { if (!(expr)) { vmk::BugCheck(msg); } } while (0)
