#include <gtest/gtest.h>
#include "common/size_units.hpp"

TEST(SizeUnitsTest, BinaryUnits) {
    EXPECT_EQ(SizeUnits::toBytes("10G").unwrap(), 10ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(SizeUnits::toBytes("1TiB").unwrap(), 1024ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(SizeUnits::toBytes("512m").unwrap(), 512ULL * 1024 * 1024);
    EXPECT_EQ(SizeUnits::toBytes("4kb").unwrap(), 4096ULL);
    EXPECT_EQ(SizeUnits::toBytes("5G").unwrap(), 5368709120ULL);
}

TEST(SizeUnitsTest, BareDigitsAreBytes) {
    EXPECT_EQ(SizeUnits::toBytes("2048").unwrap(), 2048ULL);
    EXPECT_EQ(SizeUnits::toBytes("0").unwrap(), 0ULL);
}

TEST(SizeUnitsTest, SurroundingWhitespaceIsIgnored) {
    EXPECT_EQ(SizeUnits::toBytes("  10G\t").unwrap(), 10ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(SizeUnits::toDeltaBytes(" +5G ").unwrap(), 5368709120ULL);
    EXPECT_TRUE(SizeUnits::toBytes("   ").isErr());
}

TEST(SizeUnitsTest, DecimalMagnitude) {
    EXPECT_EQ(SizeUnits::toBytes("1.5K").unwrap(), 1536ULL);
    EXPECT_EQ(SizeUnits::toBytes("0.5GiB").unwrap(), 512ULL * 1024 * 1024);
}

TEST(SizeUnitsTest, UnknownSuffixIsParseError) {
    auto result = SizeUnits::toBytes("5x");
    ASSERT_TRUE(result.isErr());
    EXPECT_EQ(result.kind(), ErrorKind::ParseError);

    EXPECT_TRUE(SizeUnits::toBytes("G").isErr());
    EXPECT_TRUE(SizeUnits::toBytes("").isErr());
    EXPECT_TRUE(SizeUnits::toBytes("1.2.3G").isErr());
    EXPECT_TRUE(SizeUnits::toBytes("-5G").isErr());
}

TEST(SizeUnitsTest, OverflowIsParseError) {
    EXPECT_TRUE(SizeUnits::toBytes("99999999999999999999").isErr());
    EXPECT_TRUE(SizeUnits::toBytes("99999999T").isErr());
}

TEST(SizeUnitsTest, DeltaAcceptsLeadingPlus) {
    EXPECT_EQ(SizeUnits::toDeltaBytes("+5G").unwrap(), 5368709120ULL);
    EXPECT_EQ(SizeUnits::toDeltaBytes("5G").unwrap(), 5368709120ULL);
    EXPECT_TRUE(SizeUnits::toDeltaBytes("+").isErr());
}

TEST(SizeUnitsTest, HumanReadable) {
    EXPECT_EQ(SizeUnits::toHuman(1024), "1 KiB");
    EXPECT_EQ(SizeUnits::toHuman(1536), "1.500 KiB");
    EXPECT_EQ(SizeUnits::toHuman(512), "512 B");
    EXPECT_EQ(SizeUnits::toHuman(10ULL << 30), "10 GiB");
    EXPECT_EQ(SizeUnits::toHuman(3, 3), "3 GiB");
    EXPECT_EQ(SizeUnits::toHuman(1500, 0, 1000), "1.500 KiB");
}
