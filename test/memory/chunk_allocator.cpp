#include <gtest/gtest.h>

#include "vmk/memory/chunk_allocator.hpp"

using namespace vmk;

class ChunkAllocatorTest : public testing::Test {
public:
    FrameAllocator allocator { FrameRange::of(Frame { 0x100 }, 64) };
};

TEST_F(ChunkAllocatorTest, Allocate) {
    AllocatedFrames frames;
    OsStatus status = allocator.allocate(4, &frames);
    ASSERT_EQ(status, OsStatusSuccess);
    ASSERT_EQ(frames.count(), 4);
    ASSERT_EQ(frames.front(), Frame { 0x100 });
    ASSERT_EQ(frames.allocator(), &allocator);
    ASSERT_EQ(allocator.freeCount(), 60);
}

TEST_F(ChunkAllocatorTest, ReleaseOnDestroy) {
    {
        AllocatedFrames frames;
        ASSERT_EQ(allocator.allocate(8, &frames), OsStatusSuccess);
        ASSERT_EQ(allocator.freeCount(), 56);
    }

    ASSERT_EQ(allocator.freeCount(), 64);
    ASSERT_TRUE(allocator.isFree(FrameRange::of(Frame { 0x100 }, 64)));
}

TEST_F(ChunkAllocatorTest, AllocateZero) {
    AllocatedFrames frames;
    ASSERT_EQ(allocator.allocate(0, &frames), OsStatusInvalidInput);
}

TEST_F(ChunkAllocatorTest, Exhaust) {
    AllocatedFrames all;
    ASSERT_EQ(allocator.allocate(64, &all), OsStatusSuccess);

    AllocatedFrames more;
    ASSERT_EQ(allocator.allocate(1, &more), OsStatusOutOfMemory);
    ASSERT_TRUE(more.isEmpty());
}

TEST_F(ChunkAllocatorTest, AllocateAt) {
    AllocatedFrames frames;
    ASSERT_EQ(allocator.allocateAt(Frame { 0x110 }, 4, &frames), OsStatusSuccess);
    ASSERT_EQ(frames.range(), FrameRange::of(Frame { 0x110 }, 4));

    AllocatedFrames overlapping;
    ASSERT_EQ(allocator.allocateAt(Frame { 0x112 }, 4, &overlapping), OsStatusNotAvailable);
    ASSERT_EQ(allocator.allocateAt(Frame { 0x50 }, 1, &overlapping), OsStatusNotAvailable);
}

TEST_F(ChunkAllocatorTest, FreeRangesCoalesce) {
    AllocatedFrames a, b, c;
    ASSERT_EQ(allocator.allocate(16, &a), OsStatusSuccess);
    ASSERT_EQ(allocator.allocate(16, &b), OsStatusSuccess);
    ASSERT_EQ(allocator.allocate(16, &c), OsStatusSuccess);

    a = AllocatedFrames();
    c = AllocatedFrames();
    b = AllocatedFrames();

    AllocatedFrames all;
    ASSERT_EQ(allocator.allocate(64, &all), OsStatusSuccess);
}

TEST(PageAllocatorTest, FreeBetweenFreeRanges) {
    PageRange whole = PageRange::of(Page { 0x10 }, 0x100);
    PageAllocator allocator { whole };

    {
        AllocatedPages middle;
        ASSERT_EQ(allocator.allocateAt(Page { 0x50 }, 1, &middle), OsStatusSuccess);
        ASSERT_EQ(allocator.freeCount(), 0xFF);
        ASSERT_FALSE(allocator.isFree(whole));
    }

    ASSERT_EQ(allocator.freeCount(), 0x100);
    ASSERT_TRUE(allocator.isFree(whole));

    AllocatedPages across;
    ASSERT_EQ(allocator.allocateAt(Page { 0x50 }, 2, &across), OsStatusSuccess);
    across = AllocatedPages();

    AllocatedPages all;
    ASSERT_EQ(allocator.allocate(0x100, &all), OsStatusSuccess);
    ASSERT_EQ(all.range(), whole);
}

TEST_F(ChunkAllocatorTest, FreeJoinsBothNeighbours) {
    AllocatedFrames a, b, c, d;
    ASSERT_EQ(allocator.allocateAt(Frame { 0x108 }, 8, &a), OsStatusSuccess);
    ASSERT_EQ(allocator.allocateAt(Frame { 0x110 }, 8, &b), OsStatusSuccess);
    ASSERT_EQ(allocator.allocateAt(Frame { 0x118 }, 8, &c), OsStatusSuccess);
    ASSERT_EQ(allocator.allocateAt(Frame { 0x120 }, 8, &d), OsStatusSuccess);

    a = AllocatedFrames();
    c = AllocatedFrames();
    ASSERT_FALSE(allocator.isFree(FrameRange::of(Frame { 0x108 }, 24)));

    b = AllocatedFrames();
    ASSERT_TRUE(allocator.isFree(FrameRange::of(Frame { 0x100 }, 0x20)));

    AllocatedFrames span;
    ASSERT_EQ(allocator.allocateAt(Frame { 0x100 }, 0x20, &span), OsStatusSuccess);
    ASSERT_EQ(allocator.freeCount(), 64 - 0x28);
}

TEST_F(ChunkAllocatorTest, ConsumeAndAdopt) {
    AllocatedFrames frames;
    ASSERT_EQ(allocator.allocate(2, &frames), OsStatusSuccess);

    FrameRange range = frames.consume();
    ASSERT_TRUE(frames.isEmpty());
    ASSERT_EQ(allocator.freeCount(), 62);

    {
        AllocatedFrames adopted = allocator.adopt(range);
        ASSERT_EQ(adopted.range(), range);
    }

    ASSERT_EQ(allocator.freeCount(), 64);
}

TEST_F(ChunkAllocatorTest, SplitAndMerge) {
    AllocatedFrames frames;
    ASSERT_EQ(allocator.allocate(10, &frames), OsStatusSuccess);

    AllocatedFrames tail;
    ASSERT_EQ(frames.split(Frame { 0x104 }, &tail), OsStatusSuccess);
    ASSERT_EQ(frames.count(), 4);
    ASSERT_EQ(tail.count(), 6);
    ASSERT_EQ(tail.front(), Frame { 0x104 });

    ASSERT_EQ(frames.merge(std::move(tail)), OsStatusSuccess);
    ASSERT_EQ(frames.count(), 10);
    ASSERT_TRUE(tail.isEmpty());
}

TEST_F(ChunkAllocatorTest, MergeRejectsGap) {
    AllocatedFrames a, b;
    ASSERT_EQ(allocator.allocateAt(Frame { 0x100 }, 2, &a), OsStatusSuccess);
    ASSERT_EQ(allocator.allocateAt(Frame { 0x110 }, 2, &b), OsStatusSuccess);

    ASSERT_EQ(a.merge(std::move(b)), OsStatusInvalidInput);
    ASSERT_EQ(a.count(), 2);
    ASSERT_EQ(b.count(), 2);
}

TEST_F(ChunkAllocatorTest, MergeRejectsOtherAllocator) {
    FrameAllocator other { FrameRange::of(Frame { 0x102 }, 2) };

    AllocatedFrames a, b;
    ASSERT_EQ(allocator.allocateAt(Frame { 0x100 }, 2, &a), OsStatusSuccess);
    ASSERT_EQ(other.allocate(2, &b), OsStatusSuccess);

    ASSERT_EQ(a.merge(std::move(b)), OsStatusInvalidInput);
}

TEST_F(ChunkAllocatorTest, AddOverlappingRange) {
    ASSERT_EQ(allocator.addRange(FrameRange::of(Frame { 0x120 }, 64)), OsStatusAlreadyExists);
    ASSERT_EQ(allocator.addRange(FrameRange::of(Frame { 0x200 }, 16)), OsStatusSuccess);
    ASSERT_EQ(allocator.freeCount(), 80);
}

TEST_F(ChunkAllocatorTest, DoubleFree) {
    AllocatedFrames frames;
    ASSERT_EQ(allocator.allocate(1, &frames), OsStatusSuccess);
    FrameRange range = frames.consume();

    allocator.adopt(range);
    EXPECT_DEATH({ allocator.adopt(range); }, "");
}
