#include "blocks/ephemeral_block.hpp"
#include "blocks/block_error.hpp"
#include "crypto/ecies.hpp"
#include "crypto/openssl_util.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

EphemeralBlock::EphemeralBlock(BlockType block_type, BlockDataType block_data_type, BlockSize block_size,
                               Bytes data, const crypto::Checksum& checksum, const BlockMetadata& metadata,
                               std::size_t length_before_encryption, bool encrypted)
  : BaseBlock(block_type, block_data_type, block_size, std::move(data), checksum, metadata)
  , length_before_encryption_(length_before_encryption)
  , encrypted_(encrypted) {}

Bytes EphemeralBlock::pad_to_block_size(const Bytes& data, BlockSize block_size) {
  Bytes padded = data;
  if (padded.size() < to_length(block_size)) {
    Bytes padding = crypto::random_bytes(to_length(block_size) - padded.size());
    padded.insert(padded.end(), padding.begin(), padding.end());
  }
  return padded;
}

std::shared_ptr<EphemeralBlock> EphemeralBlock::from(const crypto::ChecksumService& checksums,
                                                     BlockType block_type, BlockDataType block_data_type,
                                                     BlockSize block_size, const Bytes& data,
                                                     const std::optional<crypto::Checksum>& checksum,
                                                     const BlockMetadata& metadata) {
  check_block_inputs(block_type, block_size, data.size(), false, metadata.date_created);
  if (is_encrypted_block_type(block_type) || block_data_type == BlockDataType::EncryptedData) {
    throw BlockError(BlockErrorType::UnexpectedEncryptedBlockType, {{"block_type", to_string(block_type)}});
  }

  std::size_t length = metadata.length_before_encryption.value_or(data.size());
  if (length > data.size()) {
    throw BlockError(BlockErrorType::DataLengthTooShort,
                     {{"length_before_encryption", std::to_string(length)},
                      {"data_length", std::to_string(data.size())}});
  }
  check_supplied_checksum(checksum, checksums.calculate_checksum(data), block_type);

  Bytes padded = pad_to_block_size(data, block_size);
  crypto::Checksum computed = checksums.calculate_checksum(padded);
  BOOST_LOG_TRIVIAL(trace) << "Ephemeral block: Created " << block_type << " with " << length
                           << " of " << to_length(block_size) << " bytes";
  return std::shared_ptr<EphemeralBlock>(
    new EphemeralBlock(block_type, block_data_type, block_size, std::move(padded), computed,
                       metadata, length, false));
}

Bytes EphemeralBlock::data() const {
  if (encrypted_) {
    return full_data();
  }
  const Bytes& full = full_data();
  return Bytes(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(length_before_encryption_));
}

bool EphemeralBlock::can_encrypt() const {
  return !encrypted_
      && length_before_encryption_ + crypto::EciesService::single_overhead() <= to_length(block_size());
}

bool EphemeralBlock::can_multi_encrypt(std::size_t recipient_count) const {
  return !encrypted_ && recipient_count >= 2
      && length_before_encryption_ + crypto::EciesService::multi_overhead(recipient_count)
           <= to_length(block_size());
}

void EphemeralBlock::validate_layers() const {
  if (length_before_encryption_ > to_length(block_size())) {
    throw BlockError(BlockErrorType::DataLengthExceedsCapacity,
                     {{"length_before_encryption", std::to_string(length_before_encryption_)},
                      {"block_size", std::to_string(to_length(block_size()))}});
  }
}

} // namespace brightchain::blocks
