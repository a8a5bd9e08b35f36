#include <gtest/gtest.h>

#include "vmk/arch/paging.hpp"

using namespace vmk;

TEST(PteFlagsTest, AdjustForHigherLevel) {
    PteFlags flags = kDefaultPteFlags | PteFlags::eExclusive | PteFlags::eDevice | PteFlags::eHuge;
    PteFlags adjusted = AdjustForHigherLevel(flags);

    ASSERT_TRUE(HasFlag(adjusted, PteFlags::eValid));
    ASSERT_TRUE(HasFlag(adjusted, PteFlags::eAccessed));
    ASSERT_FALSE(HasFlag(adjusted, PteFlags::eNotExecutable));
    ASSERT_FALSE(HasFlag(adjusted, PteFlags::eExclusive));
    ASSERT_FALSE(HasFlag(adjusted, PteFlags::eDevice));
    ASSERT_FALSE(HasFlag(adjusted, PteFlags::eHuge));
}

TEST(PteFlagsTest, ElfSectionFlags) {
    PteFlags text = FromElfSectionFlags(SHF_ALLOC | SHF_EXECINSTR);
    ASSERT_TRUE(HasFlag(text, PteFlags::eValid));
    ASSERT_FALSE(HasFlag(text, PteFlags::eWritable));
    ASSERT_FALSE(HasFlag(text, PteFlags::eNotExecutable));

    PteFlags data = FromElfSectionFlags(SHF_ALLOC | SHF_WRITE);
    ASSERT_TRUE(HasFlag(data, PteFlags::eValid));
    ASSERT_TRUE(HasFlag(data, PteFlags::eWritable));
    ASSERT_TRUE(HasFlag(data, PteFlags::eNotExecutable));

    PteFlags debug = FromElfSectionFlags(0);
    ASSERT_FALSE(HasFlag(debug, PteFlags::eValid));
}

TEST(PteFlagsTest, MultibootSection) {
    Elf64_Shdr section { };
    section.sh_flags = SHF_ALLOC;

    PteFlags rodata = FromMultibootElfSection(section);
    ASSERT_EQ(rodata, PteFlags::eValid | kDefaultPteFlags);
}

TEST(PteFlagsTest, Format) {
    auto text = vmk::concat<128>(PteFlags::eValid | PteFlags::eWritable);
    ASSERT_EQ(std::string_view(text), "Valid|Writable");

    auto none = vmk::concat<128>(PteFlags::eNone);
    ASSERT_EQ(std::string_view(none), "None");
}

TEST(PteFlagsX64Test, MatchesGenericLayout) {
    PteFlags flags = PteFlags::eValid | PteFlags::eWritable | PteFlags::eNotExecutable;
    x64::PteFlagsX64 hw = x64::PteFlagsX64::fromGeneric(flags);

    ASSERT_EQ(hw.underlying, x64::paging::kPresentBit | x64::paging::kWriteableBit | x64::paging::kExecuteDisableBit);
    ASSERT_TRUE(hw.isValid());
    ASSERT_TRUE(hw.isWritable());
    ASSERT_TRUE(HasFlag(hw.toGeneric(), PteFlags::eNotExecutable));
    ASSERT_EQ(hw.toGeneric(), flags);
}

TEST(PteFlagsX64Test, ExclusiveNeverReachesHardware) {
    x64::PteFlagsX64 hw = x64::PteFlagsX64::fromGeneric(PteFlags::eValid | PteFlags::eExclusive);
    ASSERT_EQ(hw.underlying, x64::paging::kPresentBit);
}

TEST(PteFlagsX64Test, FromEntryDropsFrame) {
    uint64_t entry = 0x1234'5000 | x64::paging::kPresentBit | x64::paging::kHugePageBit;
    x64::PteFlagsX64 hw = x64::PteFlagsX64::fromEntry(entry);

    ASSERT_TRUE(hw.isValid());
    ASSERT_TRUE(hw.isHuge());
    ASSERT_EQ(hw.underlying & x64::PteFlagsX64::kFrameMask, 0);
}

TEST(PteFlagsArm64Test, PageDescriptor) {
    arm64::PteFlagsArm64 hw = arm64::PteFlagsArm64::fromGeneric(PteFlags::eValid | PteFlags::eWritable);

    ASSERT_TRUE(hw.underlying & arm64::paging::kValidBit);
    ASSERT_TRUE(hw.underlying & arm64::paging::kPageDescriptorBit);
    ASSERT_FALSE(hw.underlying & arm64::paging::kReadOnlyBit);
    ASSERT_TRUE(hw.underlying & arm64::paging::kNotGlobalBit);
    ASSERT_TRUE(hw.isWritable());
    ASSERT_FALSE(hw.isHuge());
}

TEST(PteFlagsArm64Test, ReadOnlyAndGlobalAreInverted) {
    arm64::PteFlagsArm64 hw = arm64::PteFlagsArm64::fromGeneric(PteFlags::eValid | PteFlags::eGlobal);

    ASSERT_TRUE(hw.underlying & arm64::paging::kReadOnlyBit);
    ASSERT_FALSE(hw.underlying & arm64::paging::kNotGlobalBit);
    ASSERT_FALSE(hw.isWritable());
}

TEST(PteFlagsArm64Test, BlockDescriptor) {
    arm64::PteFlagsArm64 hw = arm64::PteFlagsArm64::fromGeneric(PteFlags::eValid | PteFlags::eHuge);
    ASSERT_FALSE(hw.underlying & arm64::paging::kPageDescriptorBit);
    ASSERT_TRUE(hw.isHuge());
    ASSERT_TRUE(HasFlag(hw.toGeneric(), PteFlags::eHuge));
}

TEST(PteFlagsArm64Test, ExecuteNeverSetsBothBits) {
    arm64::PteFlagsArm64 hw = arm64::PteFlagsArm64::fromGeneric(PteFlags::eValid | PteFlags::eNotExecutable);
    ASSERT_EQ(hw.underlying & arm64::paging::kExecNeverMask, arm64::paging::kExecNeverMask);
}

TEST(PteFlagsArm64Test, MemoryTypeAndShareabilityChangeTogether) {
    arm64::PteFlagsArm64 hw = arm64::PteFlagsArm64::fromGeneric(PteFlags::eValid);
    ASSERT_EQ(hw.underlying & arm64::paging::kMairMask, arm64::paging::kMairNormal);
    ASSERT_EQ(hw.underlying & arm64::paging::kShareMask, arm64::paging::kOuterShareable);

    // a stale inner shareable field must not survive a memory type change
    hw.underlying |= arm64::paging::kInnerShareable;
    hw.setDevice(true);
    ASSERT_TRUE(hw.isDevice());
    ASSERT_EQ(hw.underlying & arm64::paging::kMairMask, arm64::paging::kMairDevice);
    ASSERT_EQ(hw.underlying & arm64::paging::kShareMask, arm64::paging::kOuterShareable);

    hw.setDevice(false);
    ASSERT_FALSE(hw.isDevice());
    ASSERT_EQ(hw.underlying & arm64::paging::kMairMask, arm64::paging::kMairNormal);
    ASSERT_EQ(hw.underlying & arm64::paging::kShareMask, arm64::paging::kOuterShareable);
}

TEST(PteFlagsArm64Test, GenericRoundTrip) {
    PteFlags flags = PteFlags::eValid | PteFlags::eWritable | PteFlags::eUser
        | PteFlags::eAccessed | PteFlags::eDevice | PteFlags::eNotExecutable;

    arm64::PteFlagsArm64 hw = arm64::PteFlagsArm64::fromGeneric(flags);
    ASSERT_EQ(hw.toGeneric(), flags);
}
