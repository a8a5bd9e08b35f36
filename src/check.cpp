#include "vmk/panic.hpp"

#include "vmk/logger/categories.hpp"

void vmk::BugCheck(stdx::StringView message, std::source_location where) noexcept {
    InitLog.fatalf("Assertion failed '", message, "'");
    stdx::StringView fn(where.function_name(), where.function_name() + std::char_traits<char>::length(where.function_name()));
    stdx::StringView file(where.file_name(), where.file_name() + std::char_traits<char>::length(where.file_name()));
    InitLog.fatalf(fn, " (", file, ":", where.line(), ")");
    VmkHalt();
}
