#include <gtest/gtest.h>
#include <sstream>
#include <unordered_set>
#include "crypto/checksum.hpp"
#include "crypto/crypto_error.hpp"
#include "test_utils.hpp"

using namespace brightchain;
using namespace brightchain::crypto;

class ChecksumTest : public ::testing::Test {
protected:
    ChecksumService service;

    void SetUp() override {
        init_logging();
    }
};

TEST_F(ChecksumTest, KnownAnswers) {
    EXPECT_EQ(service.calculate_checksum(Bytes{}).to_hex(),
              "a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
              "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26");
    EXPECT_EQ(service.calculate_checksum(to_bytes("abc")).to_hex(),
              "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
              "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0");
}

TEST_F(ChecksumTest, Deterministic) {
    Bytes data = pattern_bytes(5000);
    Checksum first = service.calculate_checksum(data);
    Checksum second = service.calculate_checksum(data);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 64u);

    Bytes changed = data;
    changed[100] ^= 0x01;
    EXPECT_NE(service.calculate_checksum(changed), first);
}

TEST_F(ChecksumTest, StreamMatchesBuffer) {
    // Larger than one stream buffer so the digest spans several reads
    Bytes data = pattern_bytes(20000);
    std::stringstream stream(std::string(data.begin(), data.end()));
    EXPECT_EQ(service.calculate_checksum(stream), service.calculate_checksum(data));
}

TEST_F(ChecksumTest, AsyncStreamMatchesBuffer) {
    Bytes data = pattern_bytes(12345);
    auto stream = std::make_shared<std::stringstream>(std::string(data.begin(), data.end()));
    std::future<Checksum> pending = service.calculate_checksum_async(stream);
    EXPECT_EQ(pending.get(), service.calculate_checksum(data));
}

TEST_F(ChecksumTest, ValidateChecksum) {
    Bytes data = to_bytes("block content");
    Checksum checksum = service.calculate_checksum(data);
    EXPECT_TRUE(service.validate_checksum(data, checksum));
    EXPECT_TRUE(service.validate_checksum(data, checksum.to_bytes()));
    EXPECT_FALSE(service.validate_checksum(to_bytes("other content"), checksum));
    EXPECT_FALSE(service.validate_checksum(data, Bytes(32, 0)));
}

TEST_F(ChecksumTest, ConversionsAndErrors) {
    Checksum checksum = service.calculate_checksum(to_bytes("abc"));
    EXPECT_EQ(Checksum::from_hex(checksum.to_hex()), checksum);
    EXPECT_EQ(Checksum::from_bytes(checksum.to_bytes()), checksum);

    EXPECT_THROW(Checksum::from_bytes(Bytes(63, 0)), ChecksumError);
    EXPECT_THROW(Checksum::from_hex("abcd"), ChecksumError);
    EXPECT_THROW(Checksum::from_hex(std::string(128, 'x')), ChecksumError);
}

TEST_F(ChecksumTest, UsableAsHashKey) {
    std::unordered_set<Checksum, ChecksumHash> keys;
    keys.insert(service.calculate_checksum(to_bytes("a")));
    keys.insert(service.calculate_checksum(to_bytes("b")));
    keys.insert(service.calculate_checksum(to_bytes("a")));
    EXPECT_EQ(keys.size(), 2u);
}
