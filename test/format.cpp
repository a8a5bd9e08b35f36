#include <gtest/gtest.h>

#include "vmk/util/format.hpp"

TEST(FormatTest, Integers) {
    EXPECT_EQ(std::string_view(vmk::concat<32>(1234)), "1234");
    EXPECT_EQ(std::string_view(vmk::concat<32>(-42)), "-42");
    EXPECT_EQ(std::string_view(vmk::concat<32>(0)), "0");
}

TEST(FormatTest, Hex) {
    EXPECT_EQ(std::string_view(vmk::concat<32>(vmk::Hex(0x1FFu).pad(8))), "0x000001FF");
    EXPECT_EQ(std::string_view(vmk::concat<32>(vmk::Hex(0xABCu).pad(0, '0', false))), "ABC");
}

TEST(FormatTest, Concat) {
    auto text = vmk::concat<64>("entry ", 5, " of ", 512);
    EXPECT_EQ(std::string_view(text), "entry 5 of 512");
}

TEST(FormatTest, Truncates) {
    auto text = vmk::concat<4>("truncated");
    EXPECT_EQ(std::string_view(text), "trun");
}

TEST(FormatTest, StatusName) {
    auto text = vmk::format(OsStatusId(OsStatusNotAvailable));
    EXPECT_EQ(std::string_view(text), "NotAvailable (0x001E)");
}

TEST(FormatTest, UnknownStatus) {
    auto text = vmk::format(OsStatusId(0x1D));
    EXPECT_EQ(std::string_view(text), "0x001D");
}
