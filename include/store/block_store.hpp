#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/bytes.hpp"
#include "common/error.hpp"
#include "crypto/checksum.hpp"

namespace brightchain {
namespace store {

inline const std::string DEFAULT_POOL = "default";

// Checksum-addressed block storage, optionally partitioned into named pools
class BlockStore {
public:
  virtual ~BlockStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Stores data under key; storing identical content twice is a no-op
  virtual void store(const crypto::Checksum& key, const Bytes& data, const std::string& pool) = 0;
  // Throws StoreError if key is absent from pool
  virtual Bytes get(const crypto::Checksum& key, const std::string& pool) const = 0;
  virtual void remove(const crypto::Checksum& key, const std::string& pool) = 0;
  virtual void clear() = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool has(const crypto::Checksum& key, const std::string& pool) const = 0;
  virtual std::size_t size(const std::string& pool) const = 0;
};

class MemoryBlockStore : public BlockStore {
public:
  MemoryBlockStore();

  void store(const crypto::Checksum& key, const Bytes& data, const std::string& pool) override;
  Bytes get(const crypto::Checksum& key, const std::string& pool) const override;
  void remove(const crypto::Checksum& key, const std::string& pool) override;
  void clear() override;

  bool has(const crypto::Checksum& key, const std::string& pool) const override;
  std::size_t size(const std::string& pool) const override;

private:
  using Pool = std::unordered_map<crypto::Checksum, Bytes, crypto::ChecksumHash>;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Pool> pools_;
};

class StoreError : public BrightChainError {
public:
  explicit StoreError(const std::string& message, Context context = {})
    : BrightChainError("Store error", message, std::move(context)) {}
};

// Raised when addresses a CBL references are missing from the pool it claims
class PoolIntegrityError : public BrightChainError {
public:
  PoolIntegrityError(const std::string& pool, std::vector<crypto::Checksum> missing)
    : BrightChainError("Pool integrity error", "Blocks missing from pool",
                       {{"pool", pool}, {"missing", std::to_string(missing.size())},
                        {"first_missing", missing.empty() ? "" : missing.front().to_hex()}})
    , pool_(pool)
    , missing_(std::move(missing)) {}

  const std::string& pool() const { return pool_; }
  const std::vector<crypto::Checksum>& missing() const { return missing_; }

private:
  std::string pool_;
  std::vector<crypto::Checksum> missing_;
};

} // namespace store
} // namespace brightchain
