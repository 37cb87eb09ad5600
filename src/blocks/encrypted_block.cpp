#include "blocks/encrypted_block.hpp"
#include "blocks/block_error.hpp"
#include "blocks/block_factory.hpp"
#include "crypto/constants.hpp"
#include "crypto/crypto_error.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

using namespace crypto::constants;

//==============================================
// CONSTRUCTION
//==============================================

EncryptedBlock::EncryptedBlock(BlockType block_type, BlockSize block_size, Bytes data,
                               const crypto::Checksum& checksum, const BlockMetadata& metadata,
                               BlockEncryptionType encryption_type,
                               std::optional<crypto::SingleHeader> single_header,
                               std::optional<crypto::MultiHeader> multi_header,
                               std::size_t available_capacity)
  : EphemeralBlock(block_type, BlockDataType::EncryptedData, block_size, std::move(data), checksum, metadata,
                   static_cast<std::size_t>(single_header ? single_header->data_length : multi_header->data_length),
                   true)
  , encryption_type_(encryption_type)
  , single_header_(std::move(single_header))
  , multi_header_(std::move(multi_header))
  , available_capacity_(available_capacity) {}

std::shared_ptr<EncryptedBlock> EncryptedBlock::from(const crypto::ChecksumService& checksums,
                                                     const BlockCapacityCalculator& calculator,
                                                     BlockType block_type, BlockSize block_size,
                                                     const Bytes& data,
                                                     const std::optional<crypto::Checksum>& checksum,
                                                     const BlockMetadata& metadata) {
  check_block_inputs(block_type, block_size, data.size(), false, metadata.date_created);
  if (!is_encrypted_block_type(block_type)) {
    throw BlockError(BlockErrorType::UnexpectedEncryptedBlockType, {{"block_type", to_string(block_type)}});
  }
  check_supplied_checksum(checksum, checksums.calculate_checksum(data), block_type);

  BlockEncryptionType encryption_type = crypto::read_encryption_type(data.data(), data.size());
  Bytes padded = pad_to_block_size(data, block_size);

  std::optional<crypto::SingleHeader> single_header;
  std::optional<crypto::MultiHeader> multi_header;
  std::size_t recipient_count = 1;
  if (encryption_type == BlockEncryptionType::SingleRecipient) {
    single_header = crypto::parse_single_header(padded.data(), padded.size());
  } else {
    multi_header = crypto::parse_multi_header(padded.data(), padded.size());
    recipient_count = multi_header->recipient_count;
  }

  CapacityResult capacity = calculator.calculate_capacity(
    CapacityParams{block_size, block_type, encryption_type, recipient_count, std::nullopt});
  // Plaintext of an encrypted CBL includes its own header
  std::size_t available = capacity.available_capacity + capacity.details.type_specific_overhead
                        + capacity.details.variable_overhead;

  crypto::Checksum computed = checksums.calculate_checksum(padded);
  std::shared_ptr<EncryptedBlock> block(
    new EncryptedBlock(block_type, block_size, std::move(padded), computed, metadata, encryption_type,
                       std::move(single_header), std::move(multi_header), available));
  block->validate_layers();

  BOOST_LOG_TRIVIAL(debug) << "Encrypted block: Loaded " << block_type << " with "
                           << block->recipient_count() << " recipient(s)";
  return block;
}

//==============================================
// HEADER
//==============================================

std::size_t EncryptedBlock::layer_overhead_size() const {
  if (encryption_type_ == BlockEncryptionType::SingleRecipient) {
    return crypto::EciesService::single_overhead();
  }
  return crypto::EciesService::multi_overhead(multi_header_->recipient_count);
}

std::vector<Bytes> EncryptedBlock::recipient_ids() const {
  if (single_header_) {
    return {single_header_->recipient_id};
  }
  return multi_header_->recipient_ids;
}

std::size_t EncryptedBlock::recipient_count() const {
  return single_header_ ? 1 : multi_header_->recipient_count;
}

const Bytes& EncryptedBlock::ephemeral_public_key() const {
  return single_header_ ? single_header_->ephemeral_public_key : multi_header_->ephemeral_public_key;
}

const Bytes& EncryptedBlock::iv() const {
  return single_header_ ? single_header_->iv : multi_header_->iv;
}

const Bytes& EncryptedBlock::auth_tag() const {
  return single_header_ ? single_header_->auth_tag : multi_header_->auth_tag;
}

//==============================================
// LAYER VIEW
//==============================================

Bytes EncryptedBlock::layer_header_data() const {
  const Bytes& full = full_data();
  return Bytes(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(layer_overhead_size()));
}

Bytes EncryptedBlock::payload() const {
  const Bytes& full = full_data();
  auto begin = full.begin() + static_cast<std::ptrdiff_t>(layer_overhead_size());
  return Bytes(begin, begin + static_cast<std::ptrdiff_t>(length_before_encryption()));
}

std::size_t EncryptedBlock::payload_length() const {
  return length_before_encryption();
}

std::size_t EncryptedBlock::total_overhead() const {
  return layer_overhead_size();
}

//==============================================
// VALIDATION
//==============================================

void EncryptedBlock::validate_layers() const {
  const Bytes& full = full_data();
  if (full.size() != to_length(block_size())) {
    throw BlockError(BlockErrorType::DataBufferIsTruncated,
                     {{"length", std::to_string(full.size())},
                      {"block_size", std::to_string(to_length(block_size()))}});
  }
  if (crypto::read_encryption_type(full.data(), full.size()) != encryption_type_) {
    throw crypto::EciesError(crypto::EciesErrorType::InvalidEncryptionType,
                             {{"expected", crypto::to_string(encryption_type_)}});
  }

  if (ephemeral_public_key().size() != PUBLIC_KEY_LENGTH) {
    throw crypto::EciesError(crypto::EciesErrorType::InvalidEphemeralPublicKeyLength,
                             {{"length", std::to_string(ephemeral_public_key().size())}});
  }
  if (iv().size() != IV_SIZE) {
    throw crypto::EciesError(crypto::EciesErrorType::InvalidIVLength, {{"length", std::to_string(iv().size())}});
  }
  if (auth_tag().size() != AUTH_TAG_SIZE) {
    throw crypto::EciesError(crypto::EciesErrorType::InvalidAuthTagLength,
                             {{"length", std::to_string(auth_tag().size())}});
  }
  if (multi_header_) {
    crypto::validate_multi_header(*multi_header_);
  }

  std::size_t header_size = single_header_ ? single_header_->header_size : multi_header_->header_size;
  if (header_size != layer_overhead_size()) {
    throw crypto::EciesError(crypto::EciesErrorType::InvalidEncryptionHeaderLength,
                             {{"parsed", std::to_string(header_size)},
                              {"expected", std::to_string(layer_overhead_size())}});
  }
  if (length_before_encryption() > available_capacity_) {
    BOOST_LOG_TRIVIAL(error) << "Encrypted block: Claimed length " << length_before_encryption()
                             << " exceeds capacity " << available_capacity_;
    throw BlockError(BlockErrorType::DataLengthExceedsCapacity,
                     {{"length_before_encryption", std::to_string(length_before_encryption())},
                      {"available_capacity", std::to_string(available_capacity_)},
                      {"block_type", to_string(block_type())}});
  }
}

//==============================================
// DECRYPTION
//==============================================

std::shared_ptr<EphemeralBlock> EncryptedBlock::decrypt(const crypto::Member& identity,
                                                        const crypto::EciesService& ecies,
                                                        const BlockFactory& factory,
                                                        std::optional<BlockType> new_type) const {
  BlockType target = new_type.value_or(decrypted_block_type(block_type()));
  if (target == BlockType::Unknown || is_encrypted_block_type(target)) {
    throw BlockError(BlockErrorType::InvalidBlockType, {{"block_type", to_string(target)}});
  }

  const Bytes& full = full_data();
  Bytes plaintext = encryption_type_ == BlockEncryptionType::SingleRecipient
    ? ecies.decrypt_single(identity, full.data(), full.size())
    : ecies.decrypt_multiple(identity, full.data(), full.size());

  BlockMetadata metadata;
  metadata.creator = creator();
  metadata.date_created = date_created();
  metadata.length_before_encryption = plaintext.size();
  metadata.can_read = can_read();
  metadata.can_persist = can_persist();

  BlockCreationParams params;
  params.block_type = target;
  params.block_data_type = is_cbl_block_type(target) ? BlockDataType::EphemeralStructuredData
                                                     : BlockDataType::RawData;
  params.block_size = block_size();
  params.data = std::move(plaintext);
  params.metadata = metadata;

  BOOST_LOG_TRIVIAL(debug) << "Encrypted block: Decrypted " << block_type() << " into " << target;
  return factory.create(params);
}

} // namespace brightchain::blocks
