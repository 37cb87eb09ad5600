#include <gtest/gtest.h>
#include <functional>
#include "blocks/block_error.hpp"
#include "service/block_service.hpp"
#include "test_utils.hpp"

using namespace brightchain;
using namespace brightchain::blocks;
using namespace brightchain::service;

class BlockServiceTest : public ::testing::Test {
protected:
    crypto::ChecksumService checksums;
    crypto::EciesService ecies;
    BlockCapacityCalculator calculator;
    BlockFactory factory{checksums, calculator};
    CblService cbl_service{checksums, ecies};
    BlockService block_service{checksums, ecies, factory, cbl_service};
    store::MemoryBlockStore store;
    std::shared_ptr<crypto::Member> alice;
    std::shared_ptr<crypto::Member> bob;

    void SetUp() override {
        init_logging();
        register_default_block_types(factory);
        alice = crypto::Member::generate("alice");
        bob = crypto::Member::generate("bob");
    }

    std::shared_ptr<EphemeralBlock> owned(const Bytes& data, BlockSize size = BlockSize::Message) {
        BlockMetadata metadata;
        metadata.creator = alice;
        return EphemeralBlock::from(checksums, BlockType::EphemeralOwnedDataBlock,
                                    BlockDataType::EphemeralStructuredData, size, data, std::nullopt, metadata);
    }

    static BlockServiceErrorType error_type(const std::function<void()>& action) {
        try {
            action();
        } catch (const BlockServiceError& e) {
            return e.type();
        }
        ADD_FAILURE() << "Expected BlockServiceError";
        return BlockServiceErrorType::InvalidBlockSize;
    }
};

TEST_F(BlockServiceTest, BlockSizeForData) {
    EXPECT_EQ(BlockService::get_block_size_for_data(0), BlockSize::Message);
    EXPECT_EQ(BlockService::get_block_size_for_data(400), BlockSize::Message);
    EXPECT_EQ(BlockService::get_block_size_for_data(423), BlockSize::Message);
    EXPECT_EQ(BlockService::get_block_size_for_data(424), BlockSize::Tiny);
    EXPECT_EQ(BlockService::get_block_size_for_data(900), BlockSize::Tiny);
    EXPECT_EQ(BlockService::get_block_size_for_data(3900), BlockSize::Small);
    EXPECT_EQ(BlockService::get_block_size_for_data(1000000), BlockSize::Medium);
    EXPECT_EQ(BlockService::get_block_size_for_data(268435500), BlockSize::Unknown);
    EXPECT_EQ(BlockService::get_block_size_for_data(-50), BlockSize::Unknown);
}

TEST_F(BlockServiceTest, BreakFileIntoBlocks) {
    Bytes data = pattern_bytes(1200);
    auto chunks = BlockService::break_file_into_blocks(data, BlockSize::Message);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size(), 512u);
    EXPECT_EQ(chunks[1].size(), 512u);
    EXPECT_EQ(chunks[2].size(), 176u);
    EXPECT_EQ(chunks[2].back(), data.back());

    EXPECT_TRUE(BlockService::break_file_into_blocks({}, BlockSize::Message).empty());
    EXPECT_EQ(error_type([&] { BlockService::break_file_into_blocks(data, BlockSize::Unknown); }),
              BlockServiceErrorType::InvalidBlockSize);
}

TEST_F(BlockServiceTest, RoundRobinWhitening) {
    std::vector<Bytes> blocks{{1, 1}, {2, 2}, {3, 3}};
    std::vector<Bytes> whiteners{{10, 10}, {20, 20}};
    auto result = BlockService::xor_blocks_with_whiteners_round_robin(blocks, whiteners);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], (Bytes{11, 11}));
    EXPECT_EQ(result[1], (Bytes{22, 22}));
    EXPECT_EQ(result[2], (Bytes{9, 9}));

    EXPECT_EQ(error_type([&] { BlockService::xor_blocks_with_whiteners_round_robin(blocks, {}); }),
              BlockServiceErrorType::NoWhitenersProvided);
    EXPECT_EQ(error_type([&] { BlockService::xor_block_with_whiteners({1, 2}, {}); }),
              BlockServiceErrorType::NoWhitenersProvided);
    EXPECT_EQ(error_type([&] { BlockService::xor_block_with_whiteners({1, 2}, {{1, 2, 3}}); }),
              BlockServiceErrorType::BlockSizeMismatch);
}

TEST_F(BlockServiceTest, WhitenersUndoThemselves) {
    Bytes block = pattern_bytes(512);
    auto whiteners = block_service.generate_whiteners(BlockSize::Message, 2);
    ASSERT_EQ(whiteners.size(), 2u);
    std::vector<Bytes> pads{whiteners[0]->full_data(), whiteners[1]->full_data()};

    Bytes whitened = BlockService::xor_block_with_whiteners(block, pads);
    EXPECT_NE(whitened, block);
    EXPECT_EQ(BlockService::xor_block_with_whiteners(whitened, pads), block);
}

TEST_F(BlockServiceTest, EncryptDecryptRoundTrip) {
    Bytes plaintext = pattern_bytes(400);
    auto block = owned(plaintext);

    auto encrypted = block_service.encrypt(BlockType::EncryptedOwnedDataBlock, *block, *bob);
    EXPECT_EQ(encrypted->block_type(), BlockType::EncryptedOwnedDataBlock);
    EXPECT_EQ(encrypted->block_size(), BlockSize::Message);
    EXPECT_TRUE(BlockService::is_single_recipient_encrypted(encrypted->full_data()));
    EXPECT_FALSE(BlockService::is_multi_recipient_encrypted(encrypted->full_data()));

    auto decrypted = block_service.decrypt(*bob, *encrypted);
    EXPECT_EQ(decrypted->data(), plaintext);
    EXPECT_EQ(decrypted->block_type(), BlockType::EphemeralOwnedDataBlock);

    EXPECT_EQ(error_type([&] { block_service.decrypt_multiple(*bob, *encrypted); }),
              BlockServiceErrorType::CannotDecryptBlock);
}

TEST_F(BlockServiceTest, EncryptRejectsUnsuitableInput) {
    auto block = owned(pattern_bytes(400));
    EXPECT_EQ(error_type([&] { block_service.encrypt(BlockType::RawData, *block, *bob); }),
              BlockServiceErrorType::InvalidEncryptedBlockType);
    EXPECT_EQ(error_type([&] { block_service.encrypt(BlockType::MultiEncryptedBlock, *block, *bob); }),
              BlockServiceErrorType::InvalidEncryptedBlockType);

    // 500 bytes leave no room for the 89 byte header in a message block
    auto full = owned(pattern_bytes(500));
    EXPECT_EQ(error_type([&] { block_service.encrypt(BlockType::EncryptedOwnedDataBlock, *full, *bob); }),
              BlockServiceErrorType::CannotEncryptBlock);
}

TEST_F(BlockServiceTest, MultiRecipientRoundTrip) {
    Bytes plaintext = pattern_bytes(200);
    auto block = owned(plaintext);
    std::vector<std::shared_ptr<const crypto::Member>> recipients{alice, bob};

    auto encrypted = block_service.encrypt_multiple(BlockType::MultiEncryptedBlock, *block, recipients);
    EXPECT_EQ(encrypted->recipient_count(), 2u);
    EXPECT_EQ(BlockService::determine_block_encryption_type(encrypted->full_data()),
              BlockEncryptionType::MultiRecipient);
    EXPECT_EQ(block_service.decrypt_multiple(*alice, *encrypted)->data(), plaintext);
    EXPECT_EQ(block_service.decrypt_multiple(*bob, *encrypted)->data(), plaintext);

    EXPECT_EQ(error_type([&] { block_service.decrypt(*bob, *encrypted); }),
              BlockServiceErrorType::CannotDecryptBlock);
    EXPECT_EQ(error_type([&] { block_service.encrypt_multiple(BlockType::MultiEncryptedBlock, *block, {bob}); }),
              BlockServiceErrorType::InvalidRecipientCount);
    EXPECT_EQ(error_type([&] {
                  block_service.encrypt_multiple(BlockType::EncryptedOwnedDataBlock, *block, recipients);
              }),
              BlockServiceErrorType::InvalidEncryptedBlockType);
}

TEST_F(BlockServiceTest, EncryptBlocksOnWorkerPool) {
    std::vector<std::shared_ptr<const EphemeralBlock>> blocks;
    for (uint8_t seed = 0; seed < 4; ++seed) {
        blocks.push_back(owned(pattern_bytes(100, seed)));
    }
    auto futures = block_service.encrypt_blocks(blocks, bob);
    ASSERT_EQ(futures.size(), 4u);
    for (std::size_t i = 0; i < futures.size(); ++i) {
        auto encrypted = futures[i].get();
        EXPECT_EQ(block_service.decrypt(*bob, *encrypted)->data(), blocks[i]->data());
    }

    std::vector<std::shared_ptr<const EphemeralBlock>> too_large{owned(pattern_bytes(500))};
    auto failing = block_service.encrypt_blocks(too_large, bob);
    EXPECT_THROW(failing.front().get(), BlockServiceError);
}

TEST_F(BlockServiceTest, CreateAndStoreCbl) {
    Bytes data = pattern_bytes(1500);
    std::vector<std::shared_ptr<const BaseBlock>> blocks;
    Bytes padded = data;
    padded.resize(3 * 512, 0);
    for (const auto& chunk : BlockService::break_file_into_blocks(padded, BlockSize::Message)) {
        auto block = RawDataBlock::from(checksums, BlockSize::Message, chunk);
        store.store(block->id_checksum(), block->full_data(), "files");
        blocks.push_back(block);
    }

    auto cbl = block_service.create_and_store_cbl(blocks, alice, data.size(), store, "files");
    EXPECT_TRUE(store.has(cbl->id_checksum(), "files"));
    EXPECT_EQ(cbl->cbl_address_count(), 3u);
    EXPECT_EQ(cbl->original_data_length(), 1500u);
    EXPECT_EQ(cbl->original_data_checksum(), checksums.calculate_checksum(data));
    EXPECT_TRUE(cbl->validate_signature(ecies, checksums));
    EXPECT_EQ(cbl->addresses()[2], blocks[2]->id_checksum());
    // 1500 bytes need a larger CBL than the blocks it lists
    EXPECT_EQ(cbl->block_size(), BlockSize::Tiny);
    EXPECT_EQ(cbl->data_block_size(), BlockSize::Message);

    auto tuples = cbl->get_handle_tuples(store, std::string("files"));
    ASSERT_EQ(tuples.size(), 1u);
    for (const auto& handle : tuples[0].handles()) {
        EXPECT_EQ(handle.block_size(), BlockSize::Message);
    }
    Bytes combined = tuples[0].xor_data(checksums);
    Bytes manual(512, 0);
    for (const auto& block : blocks) {
        xor_into(manual, block->full_data());
    }
    EXPECT_EQ(combined, manual);
}

TEST_F(BlockServiceTest, CreateAndStoreCblErrors) {
    EXPECT_EQ(error_type([&] { block_service.create_and_store_cbl({}, alice, 0, store); }),
              BlockServiceErrorType::EmptyBlocksArray);

    std::vector<std::shared_ptr<const BaseBlock>> mixed{
        RawDataBlock::from(checksums, BlockSize::Message, pattern_bytes(512)),
        RawDataBlock::from(checksums, BlockSize::Tiny, pattern_bytes(1024)),
        RawDataBlock::from(checksums, BlockSize::Message, pattern_bytes(512, 3))};
    EXPECT_EQ(error_type([&] { block_service.create_and_store_cbl(mixed, alice, 100, store); }),
              BlockServiceErrorType::BlockSizeMismatch);

    std::vector<std::shared_ptr<const BaseBlock>> two{
        RawDataBlock::from(checksums, BlockSize::Message, pattern_bytes(512)),
        RawDataBlock::from(checksums, BlockSize::Message, pattern_bytes(512, 3))};
    try {
        block_service.create_and_store_cbl(two, alice, 1024, store);
        FAIL() << "Expected CblError";
    } catch (const CblError& e) {
        EXPECT_EQ(e.type(), CblErrorType::InvalidCBLAddressCount);
    }
    EXPECT_EQ(store.size(store::DEFAULT_POOL), 0u);
}

TEST_F(BlockServiceTest, EncryptionTypeSniffing) {
    EXPECT_EQ(BlockService::determine_block_encryption_type({}), BlockEncryptionType::None);
    EXPECT_EQ(BlockService::determine_block_encryption_type({0x01, 0x00}), BlockEncryptionType::SingleRecipient);
    EXPECT_EQ(BlockService::determine_block_encryption_type({0x02}), BlockEncryptionType::MultiRecipient);
    EXPECT_EQ(BlockService::determine_block_encryption_type({0x07}), BlockEncryptionType::None);
    EXPECT_FALSE(BlockService::is_single_recipient_encrypted({0x00}));
}

TEST_F(BlockServiceTest, EncryptedCblRoundTrip) {
    std::vector<crypto::Checksum> addresses;
    for (int i = 0; i < 3; ++i) {
        addresses.push_back(checksums.calculate_checksum(to_bytes("member " + std::to_string(i))));
    }
    auto cbl = cbl_service.make_cbl(alice, BlockSize::Tiny, addresses, 1000,
                                    checksums.calculate_checksum(to_bytes("file")));

    auto encrypted = block_service.encrypt(BlockType::EncryptedConstituentBlockListBlock, *cbl, *bob);
    EXPECT_EQ(encrypted->block_type(), BlockType::EncryptedConstituentBlockListBlock);
    EXPECT_EQ(encrypted->length_before_encryption(), cbl->data().size());

    auto decrypted = std::dynamic_pointer_cast<ConstituentBlockListBlock>(block_service.decrypt(*bob, *encrypted));
    ASSERT_NE(decrypted, nullptr);
    EXPECT_EQ(decrypted->block_type(), BlockType::ConstituentBlockList);
    EXPECT_EQ(decrypted->addresses(), addresses);
    EXPECT_TRUE(decrypted->validate_signature(ecies, checksums));
}
