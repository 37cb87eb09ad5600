#include <gtest/gtest.h>
#include <map>
#include "blocks/block_error.hpp"
#include "blocks/block_tuple.hpp"
#include "blocks/raw_data_block.hpp"
#include "test_utils.hpp"

using namespace brightchain;
using namespace brightchain::blocks;

class BlockTupleTest : public ::testing::Test {
protected:
    crypto::ChecksumService checksums;
    store::MemoryBlockStore store;

    void SetUp() override {
        init_logging();
    }

    std::shared_ptr<RawDataBlock> raw(uint8_t seed) {
        return RawDataBlock::from(checksums, BlockSize::Message, pattern_bytes(512, seed));
    }

    static Bytes expected_xor(const std::vector<std::shared_ptr<RawDataBlock>>& blocks) {
        Bytes result = blocks.front()->full_data();
        for (std::size_t i = 1; i < blocks.size(); ++i) {
            xor_into(result, blocks[i]->full_data());
        }
        return result;
    }
};

TEST_F(BlockTupleTest, InMemoryXor) {
    std::vector<std::shared_ptr<RawDataBlock>> blocks{raw(1), raw(2), raw(3)};
    InMemoryBlockTuple tuple({blocks[0], blocks[1], blocks[2]}, 3);

    EXPECT_EQ(tuple.block_size(), BlockSize::Message);
    EXPECT_EQ(tuple.xor_data(), expected_xor(blocks));
    EXPECT_EQ(tuple.xor_blocks(checksums)->full_data(), expected_xor(blocks));
    ASSERT_EQ(tuple.block_ids().size(), 3u);
    EXPECT_EQ(tuple.block_ids()[1], blocks[1]->id_checksum());
}

TEST_F(BlockTupleTest, RejectsWrongMemberCount) {
    try {
        InMemoryBlockTuple tuple({raw(1), raw(2)}, 3);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::InvalidBlockCount);
    }

    try {
        InMemoryBlockTuple tuple({raw(1)}, 1);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::InvalidTupleSize);
    }
}

TEST_F(BlockTupleTest, RejectsMixedSizes) {
    auto tiny = RawDataBlock::from(checksums, BlockSize::Tiny, pattern_bytes(1024));
    try {
        InMemoryBlockTuple tuple({raw(1), raw(2), tiny}, 3);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::BlockSizeMismatch);
    }
}

TEST_F(BlockTupleTest, FromIdsResolvesEveryMember) {
    std::map<std::string, std::shared_ptr<const BaseBlock>> blocks;
    std::vector<crypto::Checksum> ids;
    for (uint8_t seed = 1; seed <= 3; ++seed) {
        auto block = raw(seed);
        blocks[block->id_checksum().to_hex()] = block;
        ids.push_back(block->id_checksum());
    }
    auto fetch = [&](const crypto::Checksum& id) -> std::shared_ptr<const BaseBlock> {
        auto it = blocks.find(id.to_hex());
        return it == blocks.end() ? nullptr : it->second;
    };

    auto tuple = InMemoryBlockTuple::from_ids(ids, fetch, 3);
    EXPECT_EQ(tuple.block_ids(), ids);

    try {
        InMemoryBlockTuple::from_ids({ids[0], ids[1]}, fetch, 3);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::InvalidBlockCount);
    }

    std::vector<crypto::Checksum> with_unknown{ids[0], ids[1], checksums.calculate_checksum(to_bytes("nope"))};
    try {
        InMemoryBlockTuple::from_ids(with_unknown, fetch, 3);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::FetchFailed);
    }

    auto throwing = [](const crypto::Checksum&) -> std::shared_ptr<const BaseBlock> {
        throw std::runtime_error("backend offline");
    };
    try {
        InMemoryBlockTuple::from_ids(ids, throwing, 3);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::FetchFailed);
    }
}

TEST_F(BlockTupleTest, FromIdsDetectsSubstitutedBlock) {
    auto a = raw(1);
    auto b = raw(2);
    auto c = raw(3);
    auto fetch = [&](const crypto::Checksum& id) -> std::shared_ptr<const BaseBlock> {
        // Hands back the wrong block for c
        if (id == c->id_checksum()) {
            return a;
        }
        return id == a->id_checksum() ? a : b;
    };
    EXPECT_THROW(InMemoryBlockTuple::from_ids({a->id_checksum(), b->id_checksum(), c->id_checksum()}, fetch, 3),
                 ChecksumMismatchError);
}

TEST_F(BlockTupleTest, HandleTupleReadsFromStore) {
    std::vector<std::shared_ptr<RawDataBlock>> blocks{raw(4), raw(5), raw(6)};
    std::vector<BlockHandle> handles;
    for (const auto& block : blocks) {
        store.store(block->id_checksum(), block->full_data(), "tuples");
        handles.emplace_back(block->id_checksum(), BlockSize::Message, store, "tuples");
    }
    EXPECT_TRUE(handles[0].exists());

    BlockHandleTuple tuple(handles, 3);
    EXPECT_EQ(tuple.xor_data(checksums), expected_xor(blocks));
    EXPECT_EQ(tuple.xor_blocks(checksums)->block_size(), BlockSize::Message);
}

TEST_F(BlockTupleTest, HandleTupleFailsWhenAnyMemberIsMissing) {
    std::vector<std::shared_ptr<RawDataBlock>> blocks{raw(4), raw(5), raw(6)};
    std::vector<BlockHandle> handles;
    for (const auto& block : blocks) {
        handles.emplace_back(block->id_checksum(), BlockSize::Message, store);
    }
    store.store(blocks[0]->id_checksum(), blocks[0]->full_data(), store::DEFAULT_POOL);
    store.store(blocks[1]->id_checksum(), blocks[1]->full_data(), store::DEFAULT_POOL);

    BlockHandleTuple tuple(handles, 3);
    try {
        tuple.xor_data(checksums);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::FetchFailed);
    }
}

TEST_F(BlockTupleTest, HandleFetchVerifiesContent) {
    auto block = raw(9);
    auto other = raw(10);
    // Stored under the wrong key
    store.store(block->id_checksum(), other->full_data(), store::DEFAULT_POOL);
    BlockHandle handle(block->id_checksum(), BlockSize::Message, store);
    EXPECT_THROW(handle.fetch(checksums), ChecksumMismatchError);

    BlockHandle wrong_size(block->id_checksum(), BlockSize::Tiny, store);
    try {
        wrong_size.fetch(checksums);
        FAIL() << "Expected TupleError";
    } catch (const TupleError& e) {
        EXPECT_EQ(e.type(), TupleErrorType::BlockSizeMismatch);
    }
}
