#include <gtest/gtest.h>

#include "vmk/memory/chunk_range.hpp"

using namespace vmk;

TEST(ChunkRangeTest, Empty) {
    PageRange range;
    ASSERT_TRUE(range.isEmpty());
    ASSERT_EQ(range.count(), 0);
    ASSERT_EQ(range.sizeInBytes(), 0);
    ASSERT_EQ(range.begin(), range.end());

    ASSERT_EQ(PageRange::of(Page { 100 }, 0), PageRange::empty());
    ASSERT_EQ(PageRange::fromAddress(0x1000, 0), PageRange::empty());
}

TEST(ChunkRangeTest, Of) {
    PageRange range = PageRange::of(Page { 100 }, 3);
    ASSERT_EQ(range.count(), 3);
    ASSERT_EQ(range.front(), Page { 100 });
    ASSERT_EQ(range.back(), Page { 102 });
    ASSERT_EQ(range.sizeInBytes(), 3 * kPageSize);
    ASSERT_EQ(range.startAddress().address, 100 * kPageSize);
}

TEST(ChunkRangeTest, FromAddressRoundsOut) {
    PageRange range = PageRange::fromAddress(0x1800, 0x1000);
    ASSERT_EQ(range.front(), Page { 1 });
    ASSERT_EQ(range.back(), Page { 2 });
}

TEST(ChunkRangeTest, Iterate) {
    PageRange range = PageRange::of(Page { 10 }, 4);

    uintptr_t expected = 10;
    for (Page page : range) {
        ASSERT_EQ(page.number(), expected);
        expected += 1;
    }

    ASSERT_EQ(expected, 14);
}

TEST(ChunkRangeTest, Contains) {
    FrameRange range = FrameRange::of(Frame { 10 }, 10);
    ASSERT_TRUE(range.contains(Frame { 10 }));
    ASSERT_TRUE(range.contains(Frame { 19 }));
    ASSERT_FALSE(range.contains(Frame { 20 }));
    ASSERT_FALSE(range.contains(Frame { 9 }));

    ASSERT_TRUE(range.contains(FrameRange::of(Frame { 12 }, 3)));
    ASSERT_FALSE(range.contains(FrameRange::of(Frame { 18 }, 3)));

    ASSERT_TRUE(range.containsAddress(0xA123));
    ASSERT_FALSE(range.containsAddress(0x14000));
}

TEST(ChunkRangeTest, Offsets) {
    PageRange range = PageRange::of(Page { 1 }, 2);
    ASSERT_EQ(range.offsetOfAddress(0x1010), 0x10);
    ASSERT_EQ(range.offsetOfAddress(0x3000), std::nullopt);

    ASSERT_EQ(range.addressAtOffset(0x1FFF), VirtualAddress(0x2FFF));
    ASSERT_EQ(range.addressAtOffset(0x2000), std::nullopt);
}

TEST(ChunkRangeTest, Overlap) {
    PageRange lhs = PageRange::of(Page { 0 }, 10);
    PageRange rhs = PageRange::of(Page { 5 }, 10);

    ASSERT_EQ(lhs.overlap(rhs), PageRange::of(Page { 5 }, 5));
    ASSERT_EQ(lhs.overlap(PageRange::of(Page { 20 }, 1)), std::nullopt);
}

TEST(ChunkRangeTest, SplitAt) {
    PageRange range = PageRange::of(Page { 10 }, 10);
    PageRange head;
    PageRange tail;

    ASSERT_TRUE(range.splitAt(Page { 15 }, &head, &tail));
    ASSERT_EQ(head, PageRange::of(Page { 10 }, 5));
    ASSERT_EQ(tail, PageRange::of(Page { 15 }, 5));

    ASSERT_TRUE(range.splitAt(Page { 10 }, &head, &tail));
    ASSERT_TRUE(head.isEmpty());
    ASSERT_EQ(tail, range);

    ASSERT_TRUE(range.splitAt(Page { 20 }, &head, &tail));
    ASSERT_EQ(head, range);
    ASSERT_TRUE(tail.isEmpty());

    ASSERT_FALSE(range.splitAt(Page { 9 }, &head, &tail));
    ASSERT_FALSE(range.splitAt(Page { 21 }, &head, &tail));
}

TEST(ChunkRangeTest, Format) {
    auto text = vmk::concat<128>(FrameRange::of(Frame { 1 }, 2));
    ASSERT_EQ(std::string_view(text), "[Frame(0x0000000000001000) .. Frame(0x0000000000002000)]");

    auto empty = vmk::concat<128>(FrameRange::empty());
    ASSERT_EQ(std::string_view(empty), "[empty]");
}
