#include "test_memory.hpp"

using namespace vmk;

class TableTest : public MemoryTest { };

TEST_F(TableTest, RecursiveAddress) {
    P4Table p4 = mapper().p4();
    ASSERT_EQ(p4.address(), kRecursiveP4Address);

    std::optional<Translation> translation = mmu->walk(kRecursiveP4Address);
    ASSERT_TRUE(translation.has_value());
    ASSERT_EQ(Frame::containing(translation->address), table.root());
}

TEST_F(TableTest, NextTableAddress) {
    // Descending from the top level table through index 1 strips one recursive selector.
    VirtualAddress p3 = NextTableAddress(kRecursiveP4Address, 1);
    VirtualAddress expected = VirtualAddress::canonical(
        (uintptr_t(kRecursiveIndex) << 39)
        | (uintptr_t(kRecursiveIndex) << 30)
        | (uintptr_t(kRecursiveIndex) << 21)
        | (uintptr_t(1) << 12)
    );

    ASSERT_EQ(p3, expected);
}

TEST_F(TableTest, MissingTable) {
    P4Table p4 = mapper().p4();
    ASSERT_EQ(p4.nextTable(0), std::nullopt);
    ASSERT_EQ(p4.nextTableAddress(0), std::nullopt);
}

TEST_F(TableTest, NextTableCreateIsIdempotent) {
    P4Table p4 = mapper().p4();
    size_t before = frames->freeCount();

    P3Table first;
    ASSERT_EQ(p4.nextTableCreate(1, kDefaultPteFlags, *frames, &first), OsStatusSuccess);
    ASSERT_EQ(frames->freeCount(), before - 1);

    P3Table second;
    ASSERT_EQ(p4.nextTableCreate(1, kDefaultPteFlags, *frames, &second), OsStatusSuccess);
    ASSERT_EQ(frames->freeCount(), before - 1);

    ASSERT_EQ(first.address(), second.address());
    ASSERT_EQ(p4.nextTable(1)->address(), first.address());
}

TEST_F(TableTest, HigherLevelEntryFlags) {
    P4Table p4 = mapper().p4();

    P3Table p3;
    ASSERT_EQ(p4.nextTableCreate(1, kDefaultPteFlags | PteFlags::eExclusive, *frames, &p3), OsStatusSuccess);

    PteFlags flags = p4[1].flags();
    ASSERT_TRUE(HasFlag(flags, PteFlags::eValid));
    ASSERT_TRUE(HasFlag(flags, PteFlags::eWritable));
    ASSERT_FALSE(HasFlag(flags, PteFlags::eNotExecutable));
    ASSERT_FALSE(HasFlag(flags, PteFlags::eExclusive));
}

TEST_F(TableTest, NewTableIsZeroed) {
    Frame dirty;
    {
        AllocatedFrames frame = allocateFrames(1);
        dirty = frame.front();
        for (size_t i = 0; i < kEntriesPerTable; i++) {
            arena.store64(dirty.startAddress() + (i * sizeof(uint64_t)), UINT64_MAX);
        }
    }

    P3Table p3;
    ASSERT_EQ(mapper().p4().nextTableCreate(2, kDefaultPteFlags, *frames, &p3), OsStatusSuccess);
    ASSERT_EQ(mapper().p4()[2].pointedFrame(), dirty);

    for (size_t i = 0; i < kEntriesPerTable; i++) {
        ASSERT_TRUE(p3[i].isUnused()) << "entry " << i;
    }
}

TEST_F(TableTest, CreateOutOfMemory) {
    FrameAllocator empty;

    P3Table p3;
    ASSERT_EQ(mapper().p4().nextTableCreate(1, kDefaultPteFlags, empty, &p3), OsStatusOutOfMemory);
    ASSERT_TRUE(mapper().p4()[1].isUnused());
}

TEST_F(TableTest, HugePageEntry) {
    P3Table p3;
    ASSERT_EQ(mapper().p4().nextTableCreate(1, kDefaultPteFlags, *frames, &p3), OsStatusSuccess);

    p3[0].set(Frame { 0 }, PteFlags::eValid | PteFlags::eHuge);

    ASSERT_EQ(p3.nextTable(0), std::nullopt);

    P2Table p2;
    EXPECT_DEATH({ (void)p3.nextTableCreate(0, kDefaultPteFlags, *frames, &p2); }, "");
}

TEST_F(TableTest, IndexOutOfBounds) {
    P4Table p4 = mapper().p4();
    EXPECT_DEATH({ (void)p4[kEntriesPerTable]; }, "");
}
