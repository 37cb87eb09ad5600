#include <gtest/gtest.h>
#include "blocks/block_error.hpp"
#include "blocks/raw_data_block.hpp"
#include "service/service_provider.hpp"
#include "service/tuple_service.hpp"
#include "test_utils.hpp"

using namespace brightchain;
using namespace brightchain::blocks;
using namespace brightchain::service;

class TupleServiceTest : public ::testing::Test {
protected:
    crypto::ChecksumService checksums;
    crypto::EciesService ecies;
    CblService cbl_service{checksums, ecies, 3};
    TupleService tuple_service{checksums, cbl_service};
    store::MemoryBlockStore store;
    std::shared_ptr<crypto::Member> creator;

    void SetUp() override {
        init_logging();
        creator = crypto::Member::generate("creator");
    }

    std::shared_ptr<const BaseBlock> random_block(BlockSize size = BlockSize::Message) {
        return RandomBlock::generate(checksums, size);
    }
};

TEST_F(TupleServiceTest, PrimeWhitenedBlockReversesToSource) {
    auto source = RawDataBlock::from(checksums, BlockSize::Message, pattern_bytes(512));
    std::vector<std::shared_ptr<const BaseBlock>> whiteners{random_block()};
    std::vector<std::shared_ptr<const BaseBlock>> randoms{random_block()};

    auto tuple = tuple_service.make_tuple_from_source_xor(*source, whiteners, randoms);
    ASSERT_EQ(tuple.blocks().size(), 3u);
    EXPECT_EQ(tuple.blocks()[0]->block_type(), BlockType::OwnerFreeWhitenedBlock);
    EXPECT_NE(tuple.blocks()[0]->full_data(), source->full_data());
    EXPECT_EQ(tuple.blocks()[1]->id_checksum(), whiteners[0]->id_checksum());
    EXPECT_EQ(tuple.blocks()[2]->id_checksum(), randoms[0]->id_checksum());
    EXPECT_EQ(tuple.xor_data(), source->full_data());
}

TEST_F(TupleServiceTest, MemberCountMustMatchTupleSize) {
    auto source = RawDataBlock::from(checksums, BlockSize::Message, pattern_bytes(512));
    try {
        tuple_service.xor_source_to_prime_whitened(*source, {random_block()}, {});
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::InvalidBlockCount);
    }

    try {
        tuple_service.xor_source_to_prime_whitened(*source, {random_block()}, {random_block(BlockSize::Tiny)});
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::BlockSizeMismatch);
    }
}

TEST_F(TupleServiceTest, IngestAndReconstruct) {
    Bytes data = pattern_bytes(2000, 11);
    TupleIngestResult result = tuple_service.data_to_tuples_and_cbl(data, creator, store, "files");

    ASSERT_NE(result.cbl, nullptr);
    EXPECT_EQ(result.cbl->block_size(), BlockSize::Tiny);
    EXPECT_EQ(result.data_tuple_count, 2u);
    EXPECT_EQ(result.cbl->cbl_address_count(), 6u);
    EXPECT_EQ(result.cbl->original_data_length(), 2000u);
    EXPECT_EQ(result.cbl_tuple_ids.size(), 3u);
    EXPECT_TRUE(result.cbl->validate_signature(ecies, checksums));

    // Two data tuples share one random block, plus the three CBL tuple members
    EXPECT_EQ(store.size("files"), 8u);
    EXPECT_FALSE(store.has(result.cbl->id_checksum(), "files"));
    for (const auto& address : result.cbl->addresses()) {
        EXPECT_TRUE(store.has(address, "files"));
    }

    EXPECT_EQ(tuple_service.reconstruct_data(*result.cbl, store, std::string("files")), data);
}

TEST_F(TupleServiceTest, RetrieveCblFromItsTuple) {
    Bytes data = to_bytes("a short document that fits in a single block");
    TupleIngestResult result = tuple_service.data_to_tuples_and_cbl(data, creator, store);
    EXPECT_EQ(result.cbl->block_size(), BlockSize::Message);

    auto retrieved = tuple_service.retrieve_cbl(result.cbl_tuple_ids, result.cbl->block_size(), store, creator);
    EXPECT_EQ(retrieved->addresses(), result.cbl->addresses());
    EXPECT_EQ(retrieved->creator_signature(), result.cbl->creator_signature());
    EXPECT_TRUE(retrieved->validate_signature(ecies, checksums));
    EXPECT_EQ(tuple_service.reconstruct_data(*retrieved, store), data);
}

TEST_F(TupleServiceTest, ExtendedIngest) {
    ExtendedCblDetails details{"notes.txt", "text/plain"};
    Bytes data = pattern_bytes(300);
    TupleIngestResult result = tuple_service.data_to_tuples_and_cbl(data, creator, store, store::DEFAULT_POOL,
                                                                    std::nullopt, details);
    EXPECT_TRUE(result.cbl->is_extended());
    EXPECT_EQ(result.cbl->file_name(), "notes.txt");
    EXPECT_EQ(tuple_service.reconstruct_data(*result.cbl, store), data);
}

TEST_F(TupleServiceTest, RejectsEmptyInput) {
    try {
        tuple_service.data_to_tuples_and_cbl({}, creator, store);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::InvalidSourceLength);
    }
    EXPECT_EQ(store.size(store::DEFAULT_POOL), 0u);
}

TEST_F(TupleServiceTest, RejectsFileTooLargeForBlockSize) {
    // A message block CBL indexes a single tuple of 512 bytes
    try {
        tuple_service.data_to_tuples_and_cbl(pattern_bytes(1500), creator, store, store::DEFAULT_POOL,
                                             BlockSize::Message);
        FAIL() << "Expected CblError";
    } catch (const CblError& e) {
        EXPECT_EQ(e.type(), CblErrorType::AddressCountExceedsCapacity);
    }
    EXPECT_EQ(store.size(store::DEFAULT_POOL), 0u);
}

TEST_F(TupleServiceTest, ReconstructVerifiesPoolAndChecksum) {
    Bytes data = pattern_bytes(700);
    TupleIngestResult result = tuple_service.data_to_tuples_and_cbl(data, creator, store, "files");

    EXPECT_THROW(tuple_service.reconstruct_data(*result.cbl, store, std::string("elsewhere")),
                 store::PoolIntegrityError);

    crypto::Checksum wrong = checksums.calculate_checksum(to_bytes("something else"));
    auto forged = cbl_service.make_cbl(creator, result.cbl->block_size(), result.cbl->addresses(),
                                       data.size(), wrong);
    try {
        tuple_service.reconstruct_data(*forged, store, std::string("files"));
        FAIL() << "Expected CblError";
    } catch (const CblError& e) {
        EXPECT_EQ(e.type(), CblErrorType::OriginalDataChecksumMismatch);
    }

    store.remove(result.cbl->addresses().front(), "files");
    EXPECT_THROW(tuple_service.reconstruct_data(*result.cbl, store, std::string("files")),
                 store::PoolIntegrityError);
}

TEST(ServiceProviderTest, WiresServicesFromConfig) {
    init_logging();
    config::Config config;
    config.tuple_size = 4;
    ServiceProvider services(config);
    EXPECT_EQ(services.cbl_service().tuple_size(), 4u);
    EXPECT_EQ(services.tuple_service().tuple_size(), 4u);
    EXPECT_TRUE(services.factory().is_registered(BlockType::EncryptedOwnedDataBlock));

    store::MemoryBlockStore store;
    auto creator = crypto::Member::generate("creator");
    Bytes data = to_bytes("wired through the provider");
    auto result = services.tuple_service().data_to_tuples_and_cbl(data, creator, store);
    EXPECT_EQ(result.cbl->tuple_size(), 4u);
    EXPECT_EQ(result.cbl_tuple_ids.size(), 4u);
    EXPECT_EQ(services.tuple_service().reconstruct_data(*result.cbl, store), data);
}
