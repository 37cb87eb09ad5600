#include <gtest/gtest.h>
#include "blocks/block_capacity.hpp"
#include "blocks/block_error.hpp"

using namespace brightchain::blocks;

TEST(BlockCapacityTest, PlainBlocks) {
    BlockCapacityCalculator calculator;
    CapacityResult result = calculator.calculate_capacity(
        {BlockSize::Message, BlockType::EphemeralOwnedDataBlock, BlockEncryptionType::None});
    EXPECT_EQ(result.total_capacity, 512u);
    EXPECT_EQ(result.available_capacity, 512u);
}

TEST(BlockCapacityTest, EncryptedBlocks) {
    BlockCapacityCalculator calculator;
    CapacityResult single = calculator.calculate_capacity(
        {BlockSize::Message, BlockType::EncryptedOwnedDataBlock, BlockEncryptionType::SingleRecipient});
    EXPECT_EQ(single.details.encryption_overhead, 89u);
    EXPECT_EQ(single.available_capacity, 512u - 89u);

    CapacityResult multi = calculator.calculate_capacity(
        {BlockSize::Tiny, BlockType::MultiEncryptedBlock, BlockEncryptionType::MultiRecipient, 3});
    EXPECT_EQ(multi.details.encryption_overhead, 75u + 3 * 76u);
    EXPECT_EQ(multi.available_capacity, 1024u - 75u - 3 * 76u);
}

TEST(BlockCapacityTest, CblBlocks) {
    BlockCapacityCalculator calculator;
    CapacityResult plain = calculator.calculate_capacity(
        {BlockSize::Message, BlockType::ConstituentBlockList, BlockEncryptionType::None});
    EXPECT_EQ(plain.details.type_specific_overhead, 171u);
    EXPECT_EQ(plain.available_capacity, 512u - 171u);

    CapacityParams extended{BlockSize::Message, BlockType::ExtendedConstituentBlockListBlock,
                            BlockEncryptionType::None, 1, ExtendedCblDetails{"notes.txt", "text/plain"}};
    CapacityResult result = calculator.calculate_capacity(extended);
    EXPECT_EQ(result.details.variable_overhead, 2u + 9u + 1u + 10u);

    CapacityResult encrypted = calculator.calculate_capacity(
        {BlockSize::Message, BlockType::EncryptedConstituentBlockListBlock, BlockEncryptionType::SingleRecipient});
    EXPECT_EQ(encrypted.available_capacity, 512u - 171u - 89u);
}

TEST(BlockCapacityTest, OverheadClampsToZero) {
    BlockCapacityCalculator calculator;
    CapacityResult result = calculator.calculate_capacity(
        {BlockSize::Message, BlockType::MultiEncryptedBlock, BlockEncryptionType::MultiRecipient, 10});
    EXPECT_EQ(result.available_capacity, 0u);
}

TEST(BlockCapacityTest, RejectsInvalidParameters) {
    BlockCapacityCalculator calculator;
    EXPECT_THROW(calculator.calculate_capacity(
                     {BlockSize::Unknown, BlockType::RawData, BlockEncryptionType::None}),
                 BlockError);
    EXPECT_THROW(calculator.calculate_capacity(
                     {BlockSize::Message, BlockType::RawData, BlockEncryptionType::SingleRecipient}),
                 BlockError);
    EXPECT_THROW(calculator.calculate_capacity(
                     {BlockSize::Message, BlockType::EncryptedOwnedDataBlock, BlockEncryptionType::None}),
                 BlockError);
    EXPECT_THROW(calculator.calculate_capacity(
                     {BlockSize::Message, BlockType::MultiEncryptedBlock, BlockEncryptionType::SingleRecipient}),
                 BlockError);
    EXPECT_THROW(calculator.calculate_capacity(
                     {BlockSize::Message, BlockType::MultiEncryptedBlock, BlockEncryptionType::MultiRecipient, 0}),
                 BlockError);
}
