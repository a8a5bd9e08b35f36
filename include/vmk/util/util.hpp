#pragma once

#include <utility> // IWYU pragma: keep - std::to_underlying

#define UTIL_BITFLAGS(it) \
    inline constexpr it operator|(it lhs, it rhs) { return it(std::to_underlying(lhs) | std::to_underlying(rhs)); } \
    inline constexpr it operator&(it lhs, it rhs) { return it(std::to_underlying(lhs) & std::to_underlying(rhs)); } \
    inline constexpr it operator^(it lhs, it rhs) { return it(std::to_underlying(lhs) ^ std::to_underlying(rhs)); } \
    inline constexpr it operator~(it rhs) { return it(~std::to_underlying(rhs)); } \
    inline constexpr it& operator|=(it& lhs, it rhs) { return lhs = lhs | rhs; } \
    inline constexpr it& operator&=(it& lhs, it rhs) { return lhs = lhs & rhs; } \
    inline constexpr it& operator^=(it& lhs, it rhs) { return lhs = lhs ^ rhs; }

#define UTIL_NOCOPY(it) \
    it(const it&) = delete; \
    it& operator=(const it&) = delete;

#define UTIL_NOMOVE(it) \
    it(it&&) = delete; \
    it& operator=(it&&) = delete;
