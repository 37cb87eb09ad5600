#include <gtest/gtest.h>
#include "crypto/byte_order.hpp"

using namespace brightchain::crypto;

TEST(ByteOrderTest, WritesBigEndian) {
    uint8_t buffer[8] = {};
    ByteOrder::write_big_endian<uint32_t>(buffer, 0x12345678);
    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(buffer[1], 0x34);
    EXPECT_EQ(buffer[2], 0x56);
    EXPECT_EQ(buffer[3], 0x78);

    ByteOrder::write_big_endian<uint16_t>(buffer, 0xABCD);
    EXPECT_EQ(buffer[0], 0xAB);
    EXPECT_EQ(buffer[1], 0xCD);
}

TEST(ByteOrderTest, DifferentTypes) {
    uint8_t buffer[8] = {};
    uint16_t u16 = 0x1234;
    uint32_t u32 = 0x12345678;
    uint64_t u64 = 0x1234567890ABCDEF;

    ByteOrder::write_big_endian(buffer, u16);
    EXPECT_EQ(ByteOrder::read_big_endian<uint16_t>(buffer), u16);
    ByteOrder::write_big_endian(buffer, u32);
    EXPECT_EQ(ByteOrder::read_big_endian<uint32_t>(buffer), u32);
    ByteOrder::write_big_endian(buffer, u64);
    EXPECT_EQ(ByteOrder::read_big_endian<uint64_t>(buffer), u64);
    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(buffer[7], 0xEF);
}
