#include <gtest/gtest.h>
#include <stdexcept>
#include "common/bytes.hpp"
#include "common/error.hpp"

using namespace brightchain;

TEST(BytesTest, HexRoundTrip) {
    Bytes data = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(to_hex(data), "000fa5ff");
    EXPECT_EQ(from_hex("000fa5ff"), data);
    EXPECT_EQ(from_hex("000FA5FF"), data);
}

TEST(BytesTest, HexRejectsMalformedInput) {
    EXPECT_THROW(from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(from_hex("zz"), std::invalid_argument);
}

TEST(BytesTest, XorInto) {
    Bytes lhs = {0x01, 0x02, 0x03};
    xor_into(lhs, {0xff, 0x02, 0x00});
    EXPECT_EQ(lhs, (Bytes{0xfe, 0x00, 0x03}));

    Bytes short_operand = {0x01};
    EXPECT_THROW(xor_into(lhs, short_operand), std::invalid_argument);
}

TEST(BytesTest, EqualBytes) {
    Bytes a = {1, 2, 3};
    Bytes b = {1, 2, 3};
    Bytes c = {1, 2, 4};
    EXPECT_TRUE(equal_bytes(a.data(), a.size(), b.data(), b.size()));
    EXPECT_FALSE(equal_bytes(a.data(), a.size(), c.data(), c.size()));
    EXPECT_FALSE(equal_bytes(a.data(), a.size(), c.data(), 2));
}

TEST(BytesTest, ErrorCarriesContext) {
    BrightChainError error("Block error", "DataLengthExceedsCapacity", {{"block_size", "512"}, {"length", "600"}});
    EXPECT_EQ(error.category(), "Block error");
    EXPECT_EQ(error.reason(), "DataLengthExceedsCapacity");
    EXPECT_EQ(error.context().at("length"), "600");
    EXPECT_STREQ(error.what(), "Block error: DataLengthExceedsCapacity [block_size=512, length=600]");
}
