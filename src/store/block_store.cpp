#include "store/block_store.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

MemoryBlockStore::MemoryBlockStore() {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing in-memory block store";
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void MemoryBlockStore::store(const crypto::Checksum& key, const Bytes& data, const std::string& pool) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entries = pools_[pool];
  auto it = entries.find(key);
  if (it != entries.end()) {
    if (it->second != data) {
      BOOST_LOG_TRIVIAL(error) << "Store: Conflicting content for key " << key << " in pool " << pool;
      throw StoreError("Conflicting content for existing key", {{"key", key.to_hex()}, {"pool", pool}});
    }
    BOOST_LOG_TRIVIAL(debug) << "Store: Key " << key << " already present in pool " << pool;
    return;
  }
  entries.emplace(key, data);
  BOOST_LOG_TRIVIAL(debug) << "Store: Stored " << data.size() << " bytes with key " << key << " in pool " << pool;
}

Bytes MemoryBlockStore::get(const crypto::Checksum& key, const std::string& pool) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto pool_it = pools_.find(pool);
  if (pool_it != pools_.end()) {
    auto it = pool_it->second.find(key);
    if (it != pool_it->second.end()) {
      return it->second;
    }
  }
  BOOST_LOG_TRIVIAL(error) << "Store: Key " << key << " not found in pool " << pool;
  throw StoreError("Key not found", {{"key", key.to_hex()}, {"pool", pool}});
}

void MemoryBlockStore::remove(const crypto::Checksum& key, const std::string& pool) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto pool_it = pools_.find(pool);
  if (pool_it == pools_.end() || pool_it->second.erase(key) == 0) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove key " << key << " from pool " << pool;
    throw StoreError("Failed to remove key", {{"key", key.to_hex()}, {"pool", pool}});
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Removed key " << key << " from pool " << pool;
}

void MemoryBlockStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  pools_.clear();
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool MemoryBlockStore::has(const crypto::Checksum& key, const std::string& pool) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto pool_it = pools_.find(pool);
  return pool_it != pools_.end() && pool_it->second.count(key) > 0;
}

std::size_t MemoryBlockStore::size(const std::string& pool) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto pool_it = pools_.find(pool);
  return pool_it == pools_.end() ? 0 : pool_it->second.size();
}

} // namespace store
} // namespace brightchain
