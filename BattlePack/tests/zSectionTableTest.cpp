#include "zSectionTable.h"

#include "zCodec.h"

#include <gtest/gtest.h>

using bpk::base::BpErrorCode;
using bpk::base::zBpError;
using bpk::container::zSectionEntry;
using bpk::container::zSectionTable;

namespace {

std::vector<uint8_t> makeHeader(const std::vector<uint32_t>& offsets) {
    std::vector<uint8_t> header;
    bpk::base::codec::appendU32Le(&header, static_cast<uint32_t>(offsets.size()));
    for (uint32_t offset : offsets) {
        bpk::base::codec::appendU32Le(&header, offset);
    }
    return header;
}

}  // namespace

TEST(SectionTableTest, ParsesOffsetsAndDerivesLengths) {
    // header = 4 + 3*4 = 16
    const auto header = makeHeader({16, 26, 26});
    zSectionTable table;
    zBpError error;
    ASSERT_TRUE(table.parse(header, 282, &error)) << error.message;
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table.declaredCount(), 3u);

    zSectionEntry entry;
    ASSERT_TRUE(table.entry(0, &entry));
    EXPECT_EQ(entry.offset, 16u);
    EXPECT_EQ(entry.length, 10u);
    ASSERT_TRUE(table.entry(1, &entry));
    EXPECT_EQ(entry.offset, 26u);
    EXPECT_EQ(entry.length, 0u);
    ASSERT_TRUE(table.entry(2, &entry));
    EXPECT_EQ(entry.offset, 26u);
    EXPECT_EQ(entry.length, 256u);
    EXPECT_FALSE(table.entry(3, &entry));
}

TEST(SectionTableTest, ZeroSections) {
    zSectionTable table;
    zBpError error;
    ASSERT_TRUE(table.parse(makeHeader({}), 4, &error));
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(table.dataEnd(), 4u);
}

TEST(SectionTableTest, RejectsShortCountField) {
    zSectionTable table;
    zBpError error;
    EXPECT_FALSE(table.parse({0x01, 0x00}, 2, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
}

TEST(SectionTableTest, RejectsTableRunningPastEndOfFile) {
    zSectionTable table;
    zBpError error;
    auto header = makeHeader({});
    header[0] = 0xff;
    header[1] = 0xff;
    EXPECT_FALSE(table.parse(header, 64, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
    EXPECT_EQ(table.size(), 0u);
}

TEST(SectionTableTest, RejectsOffsetInsideTable) {
    zSectionTable table;
    zBpError error;
    EXPECT_FALSE(table.parse(makeHeader({8, 12}), 40, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
}

TEST(SectionTableTest, RejectsOffsetPastEndOfFile) {
    zSectionTable table;
    zBpError error;
    EXPECT_FALSE(table.parse(makeHeader({12, 100}), 40, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
}

TEST(SectionTableTest, RejectsDecreasingOffsets) {
    zSectionTable table;
    zBpError error;
    EXPECT_FALSE(table.parse(makeHeader({20, 16, 30}), 40, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
    EXPECT_EQ(table.size(), 0u);
}

TEST(SectionTableTest, AppendUsesRunningOffsets) {
    zSectionTable table;
    table.reset(3);
    zBpError error;
    ASSERT_TRUE(table.append(10, &error));
    ASSERT_TRUE(table.append(0, &error));
    ASSERT_TRUE(table.append(256, &error));
    EXPECT_EQ(table.dataEnd(), 16u + 266u);

    EXPECT_FALSE(table.append(1, &error));
    EXPECT_EQ(error.code, BpErrorCode::kContractViolation);

    std::vector<uint8_t> header;
    table.serializeHeader(&header);
    EXPECT_EQ(header, makeHeader({16, 26, 26}));
}

TEST(SectionTableTest, SerializePadsUnwrittenSlotsWithZero) {
    zSectionTable table;
    table.reset(2);
    zBpError error;
    ASSERT_TRUE(table.append(5, &error));
    std::vector<uint8_t> header;
    table.serializeHeader(&header);
    EXPECT_EQ(header, makeHeader({12, 0}));
}

TEST(SectionTableTest, OffsetBeyondThirtyTwoBitsIsFormatError) {
    zSectionTable table;
    table.reset(3);
    zBpError error;
    // 12 字节表 + 4 GiB 首节：第二节起点已超出 u32。
    ASSERT_TRUE(table.append(0x100000000ULL, &error)) << error.message;
    EXPECT_FALSE(table.append(1, &error));
    EXPECT_EQ(error.code, BpErrorCode::kFormatError);
    EXPECT_EQ(table.size(), 1u);
}

TEST(SectionTableTest, LastOffsetThatFitsIsAccepted) {
    zSectionTable table;
    table.reset(2);
    zBpError error;
    // 第二节恰好从 0xFFFFFFFF 开始。
    ASSERT_TRUE(table.append(0xFFFFFFFFULL - 12, &error)) << error.message;
    ASSERT_TRUE(table.append(0, &error)) << error.message;
    zSectionEntry entry;
    ASSERT_TRUE(table.entry(1, &entry));
    EXPECT_EQ(entry.offset, 0xFFFFFFFFULL);
}
