#include <gtest/gtest.h>
#include <limits>
#include "blocks/block_error.hpp"
#include "blocks/block_factory.hpp"
#include "blocks/cbl_block.hpp"
#include "blocks/encrypted_block.hpp"
#include "crypto/byte_order.hpp"
#include "crypto/constants.hpp"
#include "crypto/crypto_error.hpp"
#include "test_utils.hpp"

using namespace brightchain;
using namespace brightchain::blocks;

class EncryptedBlockTest : public ::testing::Test {
protected:
    crypto::ChecksumService checksums;
    crypto::EciesService ecies;
    BlockCapacityCalculator calculator;
    BlockFactory factory{checksums, calculator};
    std::shared_ptr<crypto::Member> alice;
    std::shared_ptr<crypto::Member> bob;

    void SetUp() override {
        init_logging();
        register_default_block_types(factory);
        alice = crypto::Member::generate("alice");
        bob = crypto::Member::generate("bob");
    }

    std::shared_ptr<EncryptedBlock> encrypt_for(const crypto::Member& recipient, const Bytes& plaintext,
                                                BlockSize size = BlockSize::Message) {
        Bytes ciphertext = ecies.encrypt_single(recipient, plaintext);
        return EncryptedBlock::from(checksums, calculator, BlockType::EncryptedOwnedDataBlock, size, ciphertext);
    }
};

TEST_F(EncryptedBlockTest, ParsesHeaderAtConstruction) {
    Bytes plaintext = to_bytes("sealed content");
    auto block = encrypt_for(*alice, plaintext);

    EXPECT_EQ(block->full_data().size(), 512u);
    EXPECT_EQ(block->encryption_type(), BlockEncryptionType::SingleRecipient);
    EXPECT_EQ(block->layer_overhead_size(), 89u);
    EXPECT_EQ(block->total_overhead(), 89u);
    EXPECT_EQ(block->recipient_count(), 1u);
    EXPECT_EQ(block->recipient_ids().front(), alice->id_bytes());
    EXPECT_EQ(block->ephemeral_public_key().size(), 33u);
    EXPECT_EQ(block->iv().size(), 12u);
    EXPECT_EQ(block->auth_tag().size(), 16u);
    EXPECT_EQ(block->length_before_encryption(), plaintext.size());
    EXPECT_EQ(block->payload().size(), plaintext.size());
    EXPECT_EQ(block->layer_header_data().size(), 89u);
    EXPECT_EQ(block->available_capacity(), 512u - 89u);
    EXPECT_TRUE(block->can_decrypt());
    EXPECT_NO_THROW(block->validate(checksums));
}

TEST_F(EncryptedBlockTest, DecryptRoundTrip) {
    Bytes plaintext = pattern_bytes(400);
    auto block = encrypt_for(*alice, plaintext);
    EXPECT_NE(block->data(), plaintext);
    EXPECT_GE(block->data().size(), plaintext.size() + 89u);

    auto decrypted = block->decrypt(*alice, ecies, factory);
    EXPECT_EQ(decrypted->block_type(), BlockType::EphemeralOwnedDataBlock);
    EXPECT_EQ(decrypted->data(), plaintext);
    EXPECT_EQ(decrypted->block_size(), BlockSize::Message);

    EXPECT_THROW(block->decrypt(*bob, ecies, factory), crypto::EciesError);
}

TEST_F(EncryptedBlockTest, MultiRecipient) {
    Bytes plaintext = pattern_bytes(200);
    Bytes ciphertext = ecies.encrypt_multiple({alice, bob}, plaintext.data(), plaintext.size());
    auto block = EncryptedBlock::from(checksums, calculator, BlockType::MultiEncryptedBlock, BlockSize::Tiny, ciphertext);

    EXPECT_EQ(block->encryption_type(), BlockEncryptionType::MultiRecipient);
    EXPECT_EQ(block->recipient_count(), 2u);
    EXPECT_EQ(block->layer_overhead_size(), 75u + 2 * 76u);
    EXPECT_EQ(block->recipient_ids()[1], bob->id_bytes());

    EXPECT_EQ(block->decrypt(*alice, ecies, factory)->data(), plaintext);
    EXPECT_EQ(block->decrypt(*bob, ecies, factory)->data(), plaintext);
}

TEST_F(EncryptedBlockTest, RejectsMismatchedInputs) {
    Bytes ciphertext = ecies.encrypt_single(*alice, to_bytes("x"));
    EXPECT_THROW(EncryptedBlock::from(checksums, calculator, BlockType::EphemeralOwnedDataBlock,
                                      BlockSize::Message, ciphertext),
                 BlockError);
    EXPECT_THROW(EncryptedBlock::from(checksums, calculator, BlockType::MultiEncryptedBlock,
                                      BlockSize::Message, ciphertext),
                 std::exception);

    Bytes oversized = ecies.encrypt_single(*alice, pattern_bytes(500));
    try {
        EncryptedBlock::from(checksums, calculator, BlockType::EncryptedOwnedDataBlock, BlockSize::Message, oversized);
        FAIL() << "Expected BlockError";
    } catch (const BlockError& e) {
        EXPECT_EQ(e.type(), BlockErrorType::DataLengthExceedsCapacity);
    }
}

TEST_F(EncryptedBlockTest, CorruptHeaderRejected) {
    Bytes ciphertext = ecies.encrypt_single(*alice, to_bytes("content"));
    ciphertext[0] = 7;
    EXPECT_THROW(EncryptedBlock::from(checksums, calculator, BlockType::EncryptedOwnedDataBlock,
                                      BlockSize::Message, ciphertext),
                 crypto::EciesError);
}

TEST_F(EncryptedBlockTest, PlaintextLengthBeyondCapacityRejected) {
    auto block = encrypt_for(*alice, to_bytes("content"));
    const std::size_t length_offset = crypto::constants::SINGLE_RECIPIENT_OVERHEAD - sizeof(uint64_t);

    for (uint64_t claimed : {uint64_t{512 - 89 + 1}, uint64_t{1000}, std::numeric_limits<uint64_t>::max()}) {
        Bytes patched = block->full_data();
        crypto::ByteOrder::write_big_endian<uint64_t>(patched.data() + length_offset, claimed);
        try {
            EncryptedBlock::from(checksums, calculator, BlockType::EncryptedOwnedDataBlock, BlockSize::Message,
                                 patched);
            FAIL() << "Accepted plaintext length " << claimed;
        } catch (const crypto::EciesError& e) {
            EXPECT_EQ(e.type(), crypto::EciesErrorType::InvalidDataLength);
        }
    }
}

TEST_F(EncryptedBlockTest, RecipientCountBeyondBufferRejected) {
    Bytes plaintext = pattern_bytes(200);
    Bytes ciphertext = ecies.encrypt_multiple({alice, bob}, plaintext.data(), plaintext.size());
    auto block = EncryptedBlock::from(checksums, calculator, BlockType::MultiEncryptedBlock, BlockSize::Tiny, ciphertext);
    const std::size_t count_offset = crypto::constants::MULTI_RECIPIENT_FIXED_OVERHEAD - sizeof(uint16_t);

    // 13 entries of 76 bytes overrun a 1024-byte block
    for (uint16_t claimed : {uint16_t{13}, uint16_t{0xFFFF}}) {
        Bytes patched = block->full_data();
        crypto::ByteOrder::write_big_endian<uint16_t>(patched.data() + count_offset, claimed);
        try {
            EncryptedBlock::from(checksums, calculator, BlockType::MultiEncryptedBlock, BlockSize::Tiny, patched);
            FAIL() << "Accepted recipient count " << claimed;
        } catch (const crypto::EciesError& e) {
            EXPECT_EQ(e.type(), crypto::EciesErrorType::InvalidEncryptionHeaderLength);
        }
    }
}

TEST_F(EncryptedBlockTest, SuppliedChecksumCoversCiphertext) {
    Bytes ciphertext = ecies.encrypt_single(*alice, to_bytes("content"));
    crypto::Checksum expected = checksums.calculate_checksum(ciphertext);
    EXPECT_NO_THROW(EncryptedBlock::from(checksums, calculator, BlockType::EncryptedOwnedDataBlock,
                                         BlockSize::Message, ciphertext, expected));
    ciphertext.back() ^= 0x01;
    EXPECT_THROW(EncryptedBlock::from(checksums, calculator, BlockType::EncryptedOwnedDataBlock,
                                      BlockSize::Message, ciphertext, expected),
                 ChecksumMismatchError);
}

TEST_F(EncryptedBlockTest, FactoryRejectsUnregisteredTypes) {
    BlockFactory empty{checksums, calculator};
    BlockCreationParams params;
    params.block_type = BlockType::EphemeralOwnedDataBlock;
    params.block_size = BlockSize::Message;
    params.data = to_bytes("x");
    EXPECT_FALSE(empty.is_registered(BlockType::EphemeralOwnedDataBlock));
    EXPECT_THROW(empty.create(params), BlockError);
    EXPECT_TRUE(factory.is_registered(BlockType::EphemeralOwnedDataBlock));
    EXPECT_EQ(factory.create(params)->data(), to_bytes("x"));
}
