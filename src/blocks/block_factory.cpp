#include "blocks/block_factory.hpp"
#include "blocks/block_error.hpp"
#include "blocks/cbl_block.hpp"
#include "blocks/encrypted_block.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

BlockFactory::BlockFactory(const crypto::ChecksumService& checksums, const BlockCapacityCalculator& calculator)
  : checksums_(checksums)
  , calculator_(calculator) {}

void BlockFactory::register_block_type(BlockType block_type, Creator creator) {
  BOOST_LOG_TRIVIAL(debug) << "Block factory: Registered " << block_type;
  creators_[block_type] = std::move(creator);
}

bool BlockFactory::is_registered(BlockType block_type) const {
  return creators_.count(block_type) > 0;
}

std::shared_ptr<EphemeralBlock> BlockFactory::create(const BlockCreationParams& params) const {
  auto it = creators_.find(params.block_type);
  if (it == creators_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Block factory: No creator registered for " << params.block_type;
    throw BlockError(BlockErrorType::InvalidBlockType, {{"block_type", to_string(params.block_type)}});
  }
  return it->second(params);
}

void register_default_block_types(BlockFactory& factory) {
  const crypto::ChecksumService& checksums = factory.checksums();
  const BlockCapacityCalculator& calculator = factory.calculator();

  auto owned = [&checksums](const BlockCreationParams& p) -> std::shared_ptr<EphemeralBlock> {
    return EphemeralBlock::from(checksums, p.block_type, p.block_data_type, p.block_size, p.data,
                                p.checksum, p.metadata);
  };
  factory.register_block_type(BlockType::EphemeralOwnedDataBlock, owned);
  factory.register_block_type(BlockType::OwnedDataBlock, owned);

  auto cbl = [&checksums](const BlockCreationParams& p) -> std::shared_ptr<EphemeralBlock> {
    return ConstituentBlockListBlock::from_bytes(checksums, p.data, p.metadata.creator, p.block_size,
                                                 p.checksum, p.metadata.can_read, p.metadata.can_persist);
  };
  factory.register_block_type(BlockType::ConstituentBlockList, cbl);
  factory.register_block_type(BlockType::ExtendedConstituentBlockListBlock, cbl);

  auto encrypted = [&checksums, &calculator](const BlockCreationParams& p) -> std::shared_ptr<EphemeralBlock> {
    return EncryptedBlock::from(checksums, calculator, p.block_type, p.block_size, p.data,
                                p.checksum, p.metadata);
  };
  factory.register_block_type(BlockType::EncryptedOwnedDataBlock, encrypted);
  factory.register_block_type(BlockType::MultiEncryptedBlock, encrypted);
  factory.register_block_type(BlockType::EncryptedConstituentBlockListBlock, encrypted);
  factory.register_block_type(BlockType::EncryptedExtendedConstituentBlockListBlock, encrypted);
}

} // namespace brightchain::blocks
