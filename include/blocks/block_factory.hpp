#ifndef BRIGHTCHAIN_BLOCK_FACTORY_HPP
#define BRIGHTCHAIN_BLOCK_FACTORY_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include "blocks/block_capacity.hpp"
#include "blocks/ephemeral_block.hpp"

namespace brightchain::blocks {

struct BlockCreationParams {
  BlockType block_type = BlockType::Unknown;
  BlockDataType block_data_type = BlockDataType::RawData;
  BlockSize block_size = BlockSize::Unknown;
  Bytes data;
  std::optional<crypto::Checksum> checksum;
  BlockMetadata metadata;
};

// Typed registry from block type to constructor, filled at startup
class BlockFactory {
public:
  using Creator = std::function<std::shared_ptr<EphemeralBlock>(const BlockCreationParams&)>;

  BlockFactory(const crypto::ChecksumService& checksums, const BlockCapacityCalculator& calculator);

  void register_block_type(BlockType block_type, Creator creator);
  bool is_registered(BlockType block_type) const;
  // Throws BlockError(InvalidBlockType) for unregistered types
  std::shared_ptr<EphemeralBlock> create(const BlockCreationParams& params) const;

  const crypto::ChecksumService& checksums() const { return checksums_; }
  const BlockCapacityCalculator& calculator() const { return calculator_; }

private:
  const crypto::ChecksumService& checksums_;
  const BlockCapacityCalculator& calculator_;
  std::map<BlockType, Creator> creators_;
};

// Registers owned data, CBL and every encrypted block type
void register_default_block_types(BlockFactory& factory);

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_BLOCK_FACTORY_HPP
