#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "store/block_store.hpp"
#include "test_utils.hpp"

using namespace brightchain;
using namespace brightchain::store;

class MemoryBlockStoreTest : public ::testing::Test {
protected:
    crypto::ChecksumService checksums;
    MemoryBlockStore store;

    void SetUp() override {
        init_logging();
    }

    crypto::Checksum key_for(const Bytes& data) {
        return checksums.calculate_checksum(data);
    }
};

TEST_F(MemoryBlockStoreTest, BasicOperations) {
    Bytes data = to_bytes("Hello, Store!");
    crypto::Checksum key = key_for(data);

    EXPECT_FALSE(store.has(key, DEFAULT_POOL));
    ASSERT_NO_THROW(store.store(key, data, DEFAULT_POOL));
    EXPECT_TRUE(store.has(key, DEFAULT_POOL));
    EXPECT_EQ(store.get(key, DEFAULT_POOL), data);
    EXPECT_EQ(store.size(DEFAULT_POOL), 1u);

    ASSERT_NO_THROW(store.remove(key, DEFAULT_POOL));
    EXPECT_FALSE(store.has(key, DEFAULT_POOL));
    EXPECT_THROW(store.remove(key, DEFAULT_POOL), StoreError);
}

TEST_F(MemoryBlockStoreTest, DuplicateStores) {
    Bytes data = to_bytes("same content");
    crypto::Checksum key = key_for(data);
    store.store(key, data, DEFAULT_POOL);
    EXPECT_NO_THROW(store.store(key, data, DEFAULT_POOL));
    EXPECT_EQ(store.size(DEFAULT_POOL), 1u);

    EXPECT_THROW(store.store(key, to_bytes("different content"), DEFAULT_POOL), StoreError);
    EXPECT_EQ(store.get(key, DEFAULT_POOL), data);
}

TEST_F(MemoryBlockStoreTest, MissingKey) {
    EXPECT_THROW(store.get(key_for(to_bytes("absent")), DEFAULT_POOL), StoreError);
    EXPECT_EQ(store.size("never-used"), 0u);
}

TEST_F(MemoryBlockStoreTest, PoolsAreIsolated) {
    Bytes data = to_bytes("pooled");
    crypto::Checksum key = key_for(data);
    store.store(key, data, "alpha");

    EXPECT_TRUE(store.has(key, "alpha"));
    EXPECT_FALSE(store.has(key, "beta"));
    EXPECT_THROW(store.get(key, "beta"), StoreError);

    store.store(key, data, "beta");
    store.remove(key, "alpha");
    EXPECT_TRUE(store.has(key, "beta"));
    EXPECT_EQ(store.size("alpha"), 0u);
}

TEST_F(MemoryBlockStoreTest, ClearEmptiesEveryPool) {
    Bytes a = to_bytes("a");
    Bytes b = to_bytes("b");
    store.store(key_for(a), a, "alpha");
    store.store(key_for(b), b, DEFAULT_POOL);

    store.clear();
    EXPECT_EQ(store.size("alpha"), 0u);
    EXPECT_EQ(store.size(DEFAULT_POOL), 0u);
    EXPECT_FALSE(store.has(key_for(a), "alpha"));
}

TEST_F(MemoryBlockStoreTest, ConcurrentAccess) {
    const std::size_t num_threads = 5;
    const std::size_t ops_per_thread = 50;
    std::atomic<std::size_t> successful_ops{0};
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
            for (std::size_t j = 0; j < ops_per_thread; ++j) {
                try {
                    Bytes data = to_bytes("Data " + std::to_string(i) + "_" + std::to_string(j));
                    crypto::Checksum key = key_for(data);
                    store.store(key, data, DEFAULT_POOL);
                    if (store.get(key, DEFAULT_POOL) == data) {
                        successful_ops++;
                    }
                } catch (const std::exception& e) {
                    ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
    EXPECT_EQ(store.size(DEFAULT_POOL), num_threads * ops_per_thread);
}
