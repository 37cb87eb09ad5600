#include "blocks/block_capacity.hpp"
#include "blocks/block_error.hpp"
#include "crypto/ecies.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

CapacityResult BlockCapacityCalculator::calculate_capacity(const CapacityParams& params) const {
  if (!validate_block_size(to_length(params.block_size))) {
    throw BlockError(BlockErrorType::InvalidBlockSize,
                     {{"block_size", std::to_string(to_length(params.block_size))}});
  }

  bool encrypted_type = is_encrypted_block_type(params.block_type);
  bool encrypted = params.encryption_type != BlockEncryptionType::None;
  bool multi_type = params.block_type == BlockType::MultiEncryptedBlock;
  if (encrypted_type != encrypted
      || (multi_type && params.encryption_type != BlockEncryptionType::MultiRecipient)) {
    BOOST_LOG_TRIVIAL(error) << "Capacity: " << params.block_type << " does not match encryption "
                             << crypto::to_string(params.encryption_type);
    throw BlockError(BlockErrorType::UnexpectedEncryptedBlockType,
                     {{"block_type", to_string(params.block_type)},
                      {"encryption_type", crypto::to_string(params.encryption_type)}});
  }
  if (params.encryption_type == BlockEncryptionType::MultiRecipient && params.recipient_count < 1) {
    throw BlockError(BlockErrorType::InvalidRecipientCount,
                     {{"recipient_count", std::to_string(params.recipient_count)}});
  }

  CapacityResult result;
  result.total_capacity = to_length(params.block_size);

  switch (params.encryption_type) {
    case BlockEncryptionType::SingleRecipient:
      result.details.encryption_overhead = crypto::EciesService::single_overhead();
      break;
    case BlockEncryptionType::MultiRecipient:
      result.details.encryption_overhead = crypto::EciesService::multi_overhead(params.recipient_count);
      break;
    default:
      break;
  }

  bool cbl = is_cbl_block_type(params.block_type)
          || params.block_type == BlockType::EncryptedConstituentBlockListBlock
          || params.block_type == BlockType::EncryptedExtendedConstituentBlockListBlock;
  if (cbl) {
    result.details.type_specific_overhead = cbl_layout::BASE_HEADER_SIZE;
    if (is_extended_cbl_block_type(params.block_type) && params.extended) {
      validate_file_name_format(params.extended->file_name);
      validate_mime_type_format(params.extended->mime_type);
      result.details.variable_overhead = cbl_header_size(params.extended) - cbl_layout::BASE_HEADER_SIZE;
    }
  }

  std::size_t overhead = result.details.base_header + result.details.type_specific_overhead
                       + result.details.encryption_overhead + result.details.variable_overhead;
  result.available_capacity = overhead >= result.total_capacity ? 0 : result.total_capacity - overhead;
  return result;
}

} // namespace brightchain::blocks
