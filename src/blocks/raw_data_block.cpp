#include "blocks/raw_data_block.hpp"
#include "blocks/block_error.hpp"
#include "crypto/openssl_util.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

namespace {

void require_exact_length(BlockType block_type, BlockSize block_size, std::size_t length) {
  if (length < to_length(block_size)) {
    BOOST_LOG_TRIVIAL(error) << "Block: " << block_type << " buffer truncated to " << length << " bytes";
    throw BlockError(BlockErrorType::DataBufferIsTruncated,
                     {{"block_type", to_string(block_type)},
                      {"length", std::to_string(length)},
                      {"block_size", std::to_string(to_length(block_size))}});
  }
}

} // namespace

//==============================================
// RAW DATA BLOCK
//==============================================

std::shared_ptr<RawDataBlock> RawDataBlock::from(const crypto::ChecksumService& checksums,
                                                 BlockSize block_size, const Bytes& data,
                                                 const std::optional<crypto::Checksum>& checksum,
                                                 const BlockMetadata& metadata) {
  check_block_inputs(BlockType::RawData, block_size, data.size(), false, metadata.date_created);
  require_exact_length(BlockType::RawData, block_size, data.size());

  crypto::Checksum computed = checksums.calculate_checksum(data);
  check_supplied_checksum(checksum, computed, BlockType::RawData);

  return std::shared_ptr<RawDataBlock>(
    new RawDataBlock(BlockType::RawData, BlockDataType::RawData, block_size, data, computed, metadata));
}

//==============================================
// RANDOM BLOCK
//==============================================

std::shared_ptr<RandomBlock> RandomBlock::generate(const crypto::ChecksumService& checksums, BlockSize block_size) {
  check_block_inputs(BlockType::Random, block_size, 0, true, std::nullopt);
  Bytes data = crypto::random_bytes(to_length(block_size));
  crypto::Checksum computed = checksums.calculate_checksum(data);
  return std::shared_ptr<RandomBlock>(
    new RandomBlock(BlockType::Random, BlockDataType::RawData, block_size, std::move(data), computed, {}));
}

std::shared_ptr<RandomBlock> RandomBlock::from(const crypto::ChecksumService& checksums, BlockSize block_size,
                                               const Bytes& data,
                                               const std::optional<crypto::Checksum>& checksum) {
  check_block_inputs(BlockType::Random, block_size, data.size(), false, std::nullopt);
  require_exact_length(BlockType::Random, block_size, data.size());

  crypto::Checksum computed = checksums.calculate_checksum(data);
  check_supplied_checksum(checksum, computed, BlockType::Random);
  return std::shared_ptr<RandomBlock>(
    new RandomBlock(BlockType::Random, BlockDataType::RawData, block_size, data, computed, {}));
}

} // namespace brightchain::blocks
