#include "blocks/block_tuple.hpp"
#include "blocks/block_error.hpp"
#include "blocks/cbl_block.hpp"
#include "blocks/encrypted_block.hpp"
#include "blocks/raw_data_block.hpp"
#include "crypto/constants.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

namespace {

void check_tuple_size(std::size_t tuple_size) {
  if (tuple_size < crypto::constants::MIN_TUPLE_SIZE || tuple_size > crypto::constants::MAX_TUPLE_SIZE) {
    throw TupleError(TupleErrorType::InvalidTupleSize, {{"tuple_size", std::to_string(tuple_size)}});
  }
}

void check_member_count(std::size_t count, std::size_t tuple_size) {
  if (count != tuple_size) {
    throw TupleError(TupleErrorType::InvalidBlockCount,
                     {{"count", std::to_string(count)}, {"tuple_size", std::to_string(tuple_size)}});
  }
}

// Combines equal-length buffers position-wise
Bytes xor_all(const std::vector<Bytes>& buffers) {
  Bytes result = buffers.front();
  for (std::size_t i = 1; i < buffers.size(); ++i) {
    if (buffers[i].size() != result.size()) {
      throw TupleError(TupleErrorType::XorLengthMismatch,
                       {{"expected", std::to_string(result.size())},
                        {"actual", std::to_string(buffers[i].size())},
                        {"member", std::to_string(i)}});
    }
    xor_into(result, buffers[i]);
  }
  return result;
}

} // namespace

//==============================================
// BLOCK HANDLE
//==============================================

BlockHandle::BlockHandle(const crypto::Checksum& checksum, BlockSize block_size,
                         const store::BlockStore& store, std::string pool)
  : checksum_(checksum)
  , block_size_(block_size)
  , store_(&store)
  , pool_(std::move(pool)) {}

bool BlockHandle::exists() const {
  return store_->has(checksum_, pool_);
}

Bytes BlockHandle::fetch(const crypto::ChecksumService& checksums) const {
  Bytes data = store_->get(checksum_, pool_);
  if (data.size() != to_length(block_size_)) {
    throw TupleError(TupleErrorType::BlockSizeMismatch,
                     {{"key", checksum_.to_hex()},
                      {"length", std::to_string(data.size())},
                      {"block_size", std::to_string(to_length(block_size_))}});
  }
  crypto::Checksum computed = checksums.calculate_checksum(data);
  if (computed != checksum_) {
    throw ChecksumMismatchError(checksum_, computed, {{"pool", pool_}});
  }
  return data;
}

//==============================================
// BLOCK HANDLE TUPLE
//==============================================

BlockHandleTuple::BlockHandleTuple(std::vector<BlockHandle> handles, std::size_t tuple_size)
  : handles_(std::move(handles)) {
  check_tuple_size(tuple_size);
  check_member_count(handles_.size(), tuple_size);
  for (const auto& handle : handles_) {
    if (handle.block_size() != handles_.front().block_size()) {
      throw TupleError(TupleErrorType::BlockSizeMismatch,
                       {{"expected", std::to_string(to_length(handles_.front().block_size()))},
                        {"actual", std::to_string(to_length(handle.block_size()))}});
    }
  }
}

std::vector<crypto::Checksum> BlockHandleTuple::block_ids() const {
  std::vector<crypto::Checksum> ids;
  for (const auto& handle : handles_) {
    ids.push_back(handle.id_checksum());
  }
  return ids;
}

Bytes BlockHandleTuple::xor_data(const crypto::ChecksumService& checksums) const {
  std::vector<Bytes> buffers;
  buffers.reserve(handles_.size());
  for (const auto& handle : handles_) {
    try {
      buffers.push_back(handle.fetch(checksums));
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Block tuple: Failed to fetch " << handle.id_checksum() << ": " << e.what();
      throw TupleError(TupleErrorType::FetchFailed,
                       {{"key", handle.id_checksum().to_hex()}, {"pool", handle.pool()}, {"reason", e.what()}});
    }
  }
  return xor_all(buffers);
}

std::shared_ptr<RawDataBlock> BlockHandleTuple::xor_blocks(const crypto::ChecksumService& checksums) const {
  return RawDataBlock::from(checksums, block_size(), xor_data(checksums));
}

std::shared_ptr<ConstituentBlockListBlock> BlockHandleTuple::xor_to_cbl(
    const crypto::ChecksumService& checksums, std::shared_ptr<const crypto::Member> creator) const {
  return ConstituentBlockListBlock::from_bytes(checksums, xor_data(checksums), std::move(creator), block_size());
}

std::shared_ptr<EncryptedBlock> BlockHandleTuple::xor_to_encrypted_cbl(
    const crypto::ChecksumService& checksums, const BlockCapacityCalculator& calculator,
    std::shared_ptr<const crypto::Member> creator, BlockType block_type) const {
  BlockMetadata metadata;
  metadata.creator = std::move(creator);
  return EncryptedBlock::from(checksums, calculator, block_type, block_size(), xor_data(checksums),
                              std::nullopt, metadata);
}

//==============================================
// IN MEMORY BLOCK TUPLE
//==============================================

InMemoryBlockTuple::InMemoryBlockTuple(std::vector<std::shared_ptr<const BaseBlock>> blocks,
                                       std::size_t tuple_size)
  : blocks_(std::move(blocks)) {
  check_tuple_size(tuple_size);
  check_member_count(blocks_.size(), tuple_size);
  for (const auto& block : blocks_) {
    if (!block) {
      throw TupleError(TupleErrorType::MissingParameters, {{"reason", "null block"}});
    }
    if (block->block_size() != blocks_.front()->block_size()) {
      throw TupleError(TupleErrorType::BlockSizeMismatch,
                       {{"expected", std::to_string(to_length(blocks_.front()->block_size()))},
                        {"actual", std::to_string(to_length(block->block_size()))}});
    }
  }
}

InMemoryBlockTuple InMemoryBlockTuple::from_ids(const std::vector<crypto::Checksum>& ids,
                                                const FetchBlock& fetch, std::size_t tuple_size) {
  check_tuple_size(tuple_size);
  check_member_count(ids.size(), tuple_size);
  if (!fetch) {
    throw TupleError(TupleErrorType::MissingParameters, {{"reason", "no fetch callback"}});
  }

  std::vector<std::shared_ptr<const BaseBlock>> blocks;
  blocks.reserve(ids.size());
  for (const auto& id : ids) {
    std::shared_ptr<const BaseBlock> block;
    try {
      block = fetch(id);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Block tuple: Fetch of " << id << " failed: " << e.what();
      throw TupleError(TupleErrorType::FetchFailed, {{"key", id.to_hex()}, {"reason", e.what()}});
    }
    if (!block) {
      throw TupleError(TupleErrorType::FetchFailed, {{"key", id.to_hex()}, {"reason", "block not found"}});
    }
    if (block->id_checksum() != id) {
      throw ChecksumMismatchError(id, block->id_checksum());
    }
    blocks.push_back(std::move(block));
  }
  return InMemoryBlockTuple(std::move(blocks), tuple_size);
}

std::vector<crypto::Checksum> InMemoryBlockTuple::block_ids() const {
  std::vector<crypto::Checksum> ids;
  for (const auto& block : blocks_) {
    ids.push_back(block->id_checksum());
  }
  return ids;
}

Bytes InMemoryBlockTuple::xor_data() const {
  std::vector<Bytes> buffers;
  buffers.reserve(blocks_.size());
  for (const auto& block : blocks_) {
    buffers.push_back(block->full_data());
  }
  return xor_all(buffers);
}

std::shared_ptr<RawDataBlock> InMemoryBlockTuple::xor_blocks(const crypto::ChecksumService& checksums) const {
  return RawDataBlock::from(checksums, block_size(), xor_data());
}

std::shared_ptr<ConstituentBlockListBlock> InMemoryBlockTuple::xor_to_cbl(
    const crypto::ChecksumService& checksums, std::shared_ptr<const crypto::Member> creator) const {
  return ConstituentBlockListBlock::from_bytes(checksums, xor_data(), std::move(creator), block_size());
}

std::shared_ptr<EncryptedBlock> InMemoryBlockTuple::xor_to_encrypted_cbl(
    const crypto::ChecksumService& checksums, const BlockCapacityCalculator& calculator,
    std::shared_ptr<const crypto::Member> creator, BlockType block_type) const {
  BlockMetadata metadata;
  metadata.creator = std::move(creator);
  return EncryptedBlock::from(checksums, calculator, block_type, block_size(), xor_data(),
                              std::nullopt, metadata);
}

} // namespace brightchain::blocks
