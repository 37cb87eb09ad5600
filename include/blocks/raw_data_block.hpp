#ifndef BRIGHTCHAIN_RAW_DATA_BLOCK_HPP
#define BRIGHTCHAIN_RAW_DATA_BLOCK_HPP

#include "blocks/base_block.hpp"

namespace brightchain::blocks {

// Persisted form of a block: exactly block_size bytes with no header
class RawDataBlock : public BaseBlock {
public:
  // data must be exactly block_size bytes long
  static std::shared_ptr<RawDataBlock> from(const crypto::ChecksumService& checksums,
                                            BlockSize block_size, const Bytes& data,
                                            const std::optional<crypto::Checksum>& checksum = std::nullopt,
                                            const BlockMetadata& metadata = {});

protected:
  using BaseBlock::BaseBlock;
};

// Cryptographically random block, used as a whitener
class RandomBlock : public BaseBlock {
public:
  static std::shared_ptr<RandomBlock> generate(const crypto::ChecksumService& checksums, BlockSize block_size);
  // Reloads a stored random block
  static std::shared_ptr<RandomBlock> from(const crypto::ChecksumService& checksums, BlockSize block_size,
                                           const Bytes& data,
                                           const std::optional<crypto::Checksum>& checksum = std::nullopt);

protected:
  using BaseBlock::BaseBlock;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_RAW_DATA_BLOCK_HPP
