#include "blocks/whitened_block.hpp"
#include "blocks/block_error.hpp"
#include "crypto/openssl_util.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

std::shared_ptr<WhitenedBlock> WhitenedBlock::from_data(const crypto::ChecksumService& checksums,
                                                        BlockSize block_size, const Bytes& data,
                                                        const Bytes& random_data,
                                                        const BlockMetadata& metadata) {
  if (data.size() != random_data.size()) {
    BOOST_LOG_TRIVIAL(error) << "Whitened block: Data length " << data.size()
                             << " differs from random length " << random_data.size();
    throw WhitenedError(WhitenedErrorType::DataLengthMismatch,
                        {{"data_length", std::to_string(data.size())},
                         {"random_length", std::to_string(random_data.size())}});
  }
  if (data.size() > to_length(block_size)) {
    throw WhitenedError(WhitenedErrorType::BlockSizeMismatch,
                        {{"data_length", std::to_string(data.size())},
                         {"block_size", std::to_string(to_length(block_size))}});
  }
  check_block_inputs(BlockType::OwnerFreeWhitenedBlock, block_size, data.size(), false, metadata.date_created);

  Bytes whitened = data;
  xor_into(whitened, random_data);
  if (whitened.size() < to_length(block_size)) {
    Bytes padding = crypto::random_bytes(to_length(block_size) - whitened.size());
    whitened.insert(whitened.end(), padding.begin(), padding.end());
  }

  crypto::Checksum computed = checksums.calculate_checksum(whitened);
  return std::shared_ptr<WhitenedBlock>(
    new WhitenedBlock(BlockType::OwnerFreeWhitenedBlock, BlockDataType::RawData, block_size,
                      std::move(whitened), computed, metadata));
}

std::shared_ptr<WhitenedBlock> WhitenedBlock::from(const crypto::ChecksumService& checksums,
                                                   BlockSize block_size, const Bytes& data,
                                                   const std::optional<crypto::Checksum>& checksum,
                                                   const BlockMetadata& metadata) {
  check_block_inputs(BlockType::OwnerFreeWhitenedBlock, block_size, data.size(), false, metadata.date_created);
  if (data.size() != to_length(block_size)) {
    throw WhitenedError(WhitenedErrorType::BlockSizeMismatch,
                        {{"data_length", std::to_string(data.size())},
                         {"block_size", std::to_string(to_length(block_size))}});
  }

  crypto::Checksum computed = checksums.calculate_checksum(data);
  check_supplied_checksum(checksum, computed, BlockType::OwnerFreeWhitenedBlock);
  return std::shared_ptr<WhitenedBlock>(
    new WhitenedBlock(BlockType::OwnerFreeWhitenedBlock, BlockDataType::RawData, block_size,
                      data, computed, metadata));
}

std::shared_ptr<BaseBlock> WhitenedBlock::xor_with(const BaseBlock& other,
                                                   const crypto::ChecksumService& checksums) const {
  if (other.block_size() != block_size()) {
    BOOST_LOG_TRIVIAL(error) << "Whitened block: Cannot XOR " << block_size() << " with " << other.block_size();
    throw WhitenedError(WhitenedErrorType::BlockSizeMismatch,
                        {{"left", std::to_string(to_length(block_size()))},
                         {"right", std::to_string(to_length(other.block_size()))}});
  }
  Bytes result = xor_buffers(*this, other);
  return from(checksums, block_size(), result, std::nullopt, BlockMetadata{creator()});
}

} // namespace brightchain::blocks
