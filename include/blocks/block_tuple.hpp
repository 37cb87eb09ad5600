#ifndef BRIGHTCHAIN_BLOCK_TUPLE_HPP
#define BRIGHTCHAIN_BLOCK_TUPLE_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "blocks/base_block.hpp"
#include "blocks/block_capacity.hpp"
#include "store/block_store.hpp"

namespace brightchain::blocks {

class RawDataBlock;
class ConstituentBlockListBlock;
class EncryptedBlock;

// Reference to a stored block, resolved on demand
class BlockHandle {
public:
  BlockHandle(const crypto::Checksum& checksum, BlockSize block_size,
              const store::BlockStore& store, std::string pool = store::DEFAULT_POOL);

  const crypto::Checksum& id_checksum() const { return checksum_; }
  BlockSize block_size() const { return block_size_; }
  const std::string& pool() const { return pool_; }

  bool exists() const;
  // Reads the block and verifies its length and checksum
  Bytes fetch(const crypto::ChecksumService& checksums) const;

private:
  crypto::Checksum checksum_;
  BlockSize block_size_;
  const store::BlockStore* store_;
  std::string pool_;
};

// Fixed-size group of stored blocks combined by XOR. Every member is fetched
// before anything is combined; one failed fetch fails the whole tuple.
class BlockHandleTuple {
public:
  BlockHandleTuple(std::vector<BlockHandle> handles, std::size_t tuple_size);

  const std::vector<BlockHandle>& handles() const { return handles_; }
  std::vector<crypto::Checksum> block_ids() const;
  BlockSize block_size() const { return handles_.front().block_size(); }

  // ---- XOR RECONSTRUCTION ----
  Bytes xor_data(const crypto::ChecksumService& checksums) const;
  std::shared_ptr<RawDataBlock> xor_blocks(const crypto::ChecksumService& checksums) const;
  std::shared_ptr<ConstituentBlockListBlock> xor_to_cbl(const crypto::ChecksumService& checksums,
                                                        std::shared_ptr<const crypto::Member> creator) const;
  std::shared_ptr<EncryptedBlock> xor_to_encrypted_cbl(
    const crypto::ChecksumService& checksums, const BlockCapacityCalculator& calculator,
    std::shared_ptr<const crypto::Member> creator,
    BlockType block_type = BlockType::EncryptedConstituentBlockListBlock) const;

private:
  std::vector<BlockHandle> handles_;
};

// Tuple over blocks already held in memory
class InMemoryBlockTuple {
public:
  using FetchBlock = std::function<std::shared_ptr<const BaseBlock>(const crypto::Checksum&)>;

  InMemoryBlockTuple(std::vector<std::shared_ptr<const BaseBlock>> blocks, std::size_t tuple_size);

  // Resolves exactly tuple_size ids through fetch before building the tuple
  static InMemoryBlockTuple from_ids(const std::vector<crypto::Checksum>& ids, const FetchBlock& fetch,
                                     std::size_t tuple_size);

  const std::vector<std::shared_ptr<const BaseBlock>>& blocks() const { return blocks_; }
  std::vector<crypto::Checksum> block_ids() const;
  BlockSize block_size() const { return blocks_.front()->block_size(); }

  // ---- XOR RECONSTRUCTION ----
  Bytes xor_data() const;
  std::shared_ptr<RawDataBlock> xor_blocks(const crypto::ChecksumService& checksums) const;
  std::shared_ptr<ConstituentBlockListBlock> xor_to_cbl(const crypto::ChecksumService& checksums,
                                                        std::shared_ptr<const crypto::Member> creator) const;
  std::shared_ptr<EncryptedBlock> xor_to_encrypted_cbl(
    const crypto::ChecksumService& checksums, const BlockCapacityCalculator& calculator,
    std::shared_ptr<const crypto::Member> creator,
    BlockType block_type = BlockType::EncryptedConstituentBlockListBlock) const;

private:
  std::vector<std::shared_ptr<const BaseBlock>> blocks_;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_BLOCK_TUPLE_HPP
