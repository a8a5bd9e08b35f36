#include <gtest/gtest.h>

#include "vmk/memory/chunk.hpp"

using namespace vmk;

TEST(AddressTest, PageOffset) {
    VirtualAddress address { 0x1234'5678 };
    ASSERT_EQ(address.pageOffset(), 0x678);
}

TEST(AddressTest, CanonicalVirtual) {
#if defined(__aarch64__)
    ASSERT_TRUE(VirtualAddress(0x0000'FFFF'FFFF'F000).isCanonical());
    ASSERT_FALSE(VirtualAddress(0xFFFF'0000'0000'0000).isCanonical());
    ASSERT_EQ(VirtualAddress::canonical(0xFFFF'1234'5678'9000).address, 0x0000'1234'5678'9000);
#else
    ASSERT_TRUE(VirtualAddress(0x0000'7FFF'FFFF'F000).isCanonical());
    ASSERT_TRUE(VirtualAddress(0xFFFF'8000'0000'0000).isCanonical());
    ASSERT_FALSE(VirtualAddress(0x0000'8000'0000'0000).isCanonical());
    ASSERT_EQ(VirtualAddress::canonical(0x0000'8000'0000'0000).address, 0xFFFF'8000'0000'0000);
#endif
}

TEST(AddressTest, CanonicalPhysical) {
    ASSERT_TRUE(PhysicalAddress(0x1000).isCanonical());
    ASSERT_FALSE(PhysicalAddress(0xFFF0'0000'0000'0000).isCanonical());
}

TEST(AddressTest, AddSaturates) {
    PhysicalAddress address { kPhysicalAddressMask - 0x10 };
    PhysicalAddress result = address + UINTPTR_MAX;
    ASSERT_TRUE(result.isCanonical());
}

TEST(AddressTest, SubtractSaturates) {
    VirtualAddress address { 0x1000 };
    ASSERT_EQ((address - 0x2000).address, 0);
}

TEST(ChunkTest, ContainingAddressRoundTrip) {
    for (uintptr_t address : { 0x0ul, 0x1000ul, 0x1FFFul, 0x7FFF'FFFF'F000ul, 0x1234'5678ul }) {
        Page page = Page::containing(address);
        ASSERT_EQ(page.startAddress().address, address & ~(kPageSize - 1));
        ASSERT_EQ(Page::containing(page.startAddress()), page);

        Frame frame = Frame::containing(address);
        ASSERT_EQ(frame.startAddress().address, address & ~(kPageSize - 1));
        ASSERT_EQ(Frame::containing(frame.startAddress()), frame);
    }
}

TEST(ChunkTest, HigherHalfRoundTrip) {
    VirtualAddress address { kTemporaryPageAddress };
    Page page = Page::containing(address);
    ASSERT_EQ(page.startAddress(), address);
}

TEST(ChunkTest, ArithmeticSaturates) {
    Frame top { kMaxPageNumber };
    ASSERT_EQ((top + 1).number(), kMaxPageNumber);
    ASSERT_EQ((top + UINTPTR_MAX).number(), kMaxPageNumber);

    Frame bottom { 0 };
    ASSERT_EQ((bottom - 1).number(), 0);
    ASSERT_EQ(bottom - top, 0);
    ASSERT_EQ(top - bottom, kMaxPageNumber);
}

TEST(ChunkTest, NumberIsClamped) {
    Page page { UINTPTR_MAX };
    ASSERT_EQ(page.number(), kMaxPageNumber);
}

TEST(ChunkTest, TableIndices) {
    // 1 << 39 | 2 << 30 | 3 << 21 | 4 << 12
    Page page = Page::containing(VirtualAddress { 0x0000'0080'8060'4000 });
    ASSERT_EQ(page.p4Index(), 1);
    ASSERT_EQ(page.p3Index(), 2);
    ASSERT_EQ(page.p2Index(), 3);
    ASSERT_EQ(page.p1Index(), 4);
}

TEST(ChunkTest, Format) {
    auto text = vmk::concat<64>(Frame { 0x10 });
    ASSERT_EQ(std::string_view(text), "Frame(0x0000000000010000)");
}
