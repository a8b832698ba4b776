#include <gtest/gtest.h>

#include "util/byte_utils.hpp"

#include <cstdint>

using namespace medslice;

TEST(ByteUtilsTest, ReadU16LittleEndian) {
    EXPECT_EQ(read_u16_le(0x00, 0x00), 0);
    EXPECT_EQ(read_u16_le(0x34, 0x12), 0x1234);
    EXPECT_EQ(read_u16_le(0xFF, 0x0F), 4095);
    EXPECT_EQ(read_u16_le(0xFF, 0xFF), 0xFFFF);

    const uint8_t bytes[] = {0x01, 0x02};
    EXPECT_EQ(read_u16_le(bytes), 0x0201);
}

TEST(ByteUtilsTest, WriteU16LittleEndian) {
    const auto b = write_u16_le(0xABCD);
    EXPECT_EQ(b[0], 0xCD);
    EXPECT_EQ(b[1], 0xAB);
}

TEST(ByteUtilsTest, NormalizeEndpointsAndMidpoint) {
    EXPECT_EQ(normalize(0), 0);
    EXPECT_EQ(normalize(4095), 255);
    EXPECT_EQ(normalize(2048), 128);
    // 2047 * 255 / 4095 = 127.47
    EXPECT_EQ(normalize(2047), 127);
    // 9 * 255 / 4095 = 0.56
    EXPECT_EQ(normalize(9), 1);
    EXPECT_EQ(normalize(8), 0);
}

TEST(ByteUtilsTest, ByteWriterLayout) {
    ByteWriter w;
    w.write_u8(0x42);
    w.write_u16_le(0x0102);
    w.write_u32_le(0x03040506);
    w.write_i32_le(-1);
    w.write_zeros(2);

    const std::vector<uint8_t> expected = {0x42, 0x02, 0x01, 0x06, 0x05, 0x04, 0x03,
                                           0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00};
    EXPECT_EQ(w.bytes(), expected);
    EXPECT_EQ(w.size(), expected.size());

    w.clear();
    EXPECT_EQ(w.size(), 0u);
}
