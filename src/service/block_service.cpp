#include "service/block_service.hpp"
#include "blocks/block_error.hpp"
#include "crypto/constants.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace brightchain::service {

using namespace blocks;

const char* to_string(BlockServiceErrorType type) {
  switch (type) {
    case BlockServiceErrorType::NoWhitenersProvided:       return "NoWhitenersProvided";
    case BlockServiceErrorType::EmptyBlocksArray:          return "EmptyBlocksArray";
    case BlockServiceErrorType::BlockSizeMismatch:         return "BlockSizeMismatch";
    case BlockServiceErrorType::InvalidBlockSize:          return "InvalidBlockSize";
    case BlockServiceErrorType::CannotEncryptBlock:        return "CannotEncryptBlock";
    case BlockServiceErrorType::CannotDecryptBlock:        return "CannotDecryptBlock";
    case BlockServiceErrorType::InvalidEncryptedBlockType: return "InvalidEncryptedBlockType";
    case BlockServiceErrorType::InvalidRecipientCount:     return "InvalidRecipientCount";
    default:                                               return "Unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlockService::BlockService(const crypto::ChecksumService& checksums, const crypto::EciesService& ecies,
                           const BlockFactory& factory, const CblService& cbl_service,
                           std::size_t worker_threads)
  : checksums_(checksums)
  , ecies_(ecies)
  , factory_(factory)
  , cbl_service_(cbl_service)
  , pool_(worker_threads) {}

BlockService::~BlockService() {
  pool_.join();
}

//==============================================
// SIZING
//==============================================

BlockSize BlockService::get_block_size_for_data(int64_t length) {
  if (length < 0) {
    return BlockSize::Unknown;
  }
  for (BlockSize size : valid_block_sizes()) {
    std::size_t capacity = to_length(size) - crypto::constants::SINGLE_RECIPIENT_OVERHEAD;
    if (static_cast<uint64_t>(length) <= capacity) {
      return size;
    }
  }
  return BlockSize::Unknown;
}

std::vector<Bytes> BlockService::break_file_into_blocks(const Bytes& data, BlockSize block_size) {
  if (block_size == BlockSize::Unknown) {
    throw BlockServiceError(BlockServiceErrorType::InvalidBlockSize);
  }
  std::size_t chunk = to_length(block_size);
  std::vector<Bytes> chunks;
  chunks.reserve((data.size() + chunk - 1) / chunk);
  for (std::size_t offset = 0; offset < data.size(); offset += chunk) {
    std::size_t end = std::min(offset + chunk, data.size());
    chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                        data.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return chunks;
}

//==============================================
// WHITENING
//==============================================

Bytes BlockService::xor_block_with_whiteners(const Bytes& block, const std::vector<Bytes>& whiteners) {
  if (whiteners.empty()) {
    throw BlockServiceError(BlockServiceErrorType::NoWhitenersProvided);
  }
  Bytes result = block;
  for (const auto& whitener : whiteners) {
    if (whitener.size() != result.size()) {
      throw BlockServiceError(BlockServiceErrorType::BlockSizeMismatch,
                              {{"block_length", std::to_string(result.size())},
                               {"whitener_length", std::to_string(whitener.size())}});
    }
    xor_into(result, whitener);
  }
  return result;
}

std::vector<Bytes> BlockService::xor_blocks_with_whiteners_round_robin(const std::vector<Bytes>& blocks,
                                                                      const std::vector<Bytes>& whiteners) {
  if (whiteners.empty()) {
    throw BlockServiceError(BlockServiceErrorType::NoWhitenersProvided);
  }
  std::vector<Bytes> result;
  result.reserve(blocks.size());
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    result.push_back(xor_block_with_whiteners(blocks[i], {whiteners[i % whiteners.size()]}));
  }
  return result;
}

std::vector<std::shared_ptr<RandomBlock>> BlockService::generate_whiteners(BlockSize block_size,
                                                                           std::size_t count) const {
  std::vector<std::shared_ptr<RandomBlock>> whiteners;
  whiteners.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    whiteners.push_back(RandomBlock::generate(checksums_, block_size));
  }
  return whiteners;
}

//==============================================
// ENCRYPTION
//==============================================

BlockCreationParams BlockService::encrypted_params(BlockType new_block_type, const EphemeralBlock& block,
                                                   Bytes ciphertext) const {
  BlockCreationParams params;
  params.block_type = new_block_type;
  params.block_data_type = BlockDataType::EncryptedData;
  params.block_size = block.block_size();
  params.data = std::move(ciphertext);
  params.metadata.creator = block.creator();
  params.metadata.date_created = block.date_created();
  params.metadata.can_read = block.can_read();
  params.metadata.can_persist = block.can_persist();
  return params;
}

std::shared_ptr<EncryptedBlock> BlockService::encrypt(BlockType new_block_type, const EphemeralBlock& block,
                                                      const crypto::Member& recipient) const {
  if (new_block_type == BlockType::MultiEncryptedBlock || !is_encrypted_block_type(new_block_type)) {
    throw BlockServiceError(BlockServiceErrorType::InvalidEncryptedBlockType,
                            {{"block_type", to_string(new_block_type)}});
  }
  if (!block.can_encrypt()) {
    throw BlockServiceError(BlockServiceErrorType::CannotEncryptBlock,
                            {{"block_type", to_string(block.block_type())},
                             {"length", std::to_string(block.length_before_encryption())},
                             {"block_size", std::to_string(to_length(block.block_size()))}});
  }

  Bytes ciphertext = ecies_.encrypt_single(recipient, block.data());
  auto encrypted = std::dynamic_pointer_cast<EncryptedBlock>(
    factory_.create(encrypted_params(new_block_type, block, std::move(ciphertext))));
  if (!encrypted) {
    throw BlockServiceError(BlockServiceErrorType::InvalidEncryptedBlockType,
                            {{"block_type", to_string(new_block_type)}});
  }
  BOOST_LOG_TRIVIAL(debug) << "Block service: Encrypted " << block.id_checksum() << " for "
                           << recipient.id_string();
  return encrypted;
}

std::shared_ptr<EphemeralBlock> BlockService::decrypt(const crypto::Member& identity, const EncryptedBlock& block,
                                                      std::optional<BlockType> new_block_type) const {
  if (!block.can_decrypt() || block.encryption_type() != BlockEncryptionType::SingleRecipient) {
    throw BlockServiceError(BlockServiceErrorType::CannotDecryptBlock,
                            {{"block_type", to_string(block.block_type())},
                             {"encryption_type", crypto::to_string(block.encryption_type())}});
  }
  return block.decrypt(identity, ecies_, factory_, new_block_type);
}

std::shared_ptr<EncryptedBlock> BlockService::encrypt_multiple(
    BlockType new_block_type, const EphemeralBlock& block,
    const std::vector<std::shared_ptr<const crypto::Member>>& recipients) const {
  if (new_block_type != BlockType::MultiEncryptedBlock) {
    throw BlockServiceError(BlockServiceErrorType::InvalidEncryptedBlockType,
                            {{"block_type", to_string(new_block_type)}});
  }
  if (recipients.size() < 2 || recipients.size() > crypto::constants::MAX_RECIPIENTS) {
    throw BlockServiceError(BlockServiceErrorType::InvalidRecipientCount,
                            {{"recipient_count", std::to_string(recipients.size())}});
  }
  if (!block.can_multi_encrypt(recipients.size())) {
    throw BlockServiceError(BlockServiceErrorType::CannotEncryptBlock,
                            {{"block_type", to_string(block.block_type())},
                             {"recipient_count", std::to_string(recipients.size())},
                             {"length", std::to_string(block.length_before_encryption())}});
  }

  Bytes plaintext = block.data();
  Bytes ciphertext = ecies_.encrypt_multiple(recipients, plaintext.data(), plaintext.size());
  auto encrypted = std::dynamic_pointer_cast<EncryptedBlock>(
    factory_.create(encrypted_params(new_block_type, block, std::move(ciphertext))));
  if (!encrypted) {
    throw BlockServiceError(BlockServiceErrorType::InvalidEncryptedBlockType,
                            {{"block_type", to_string(new_block_type)}});
  }
  BOOST_LOG_TRIVIAL(debug) << "Block service: Encrypted " << block.id_checksum() << " for "
                           << recipients.size() << " recipients";
  return encrypted;
}

std::shared_ptr<EphemeralBlock> BlockService::decrypt_multiple(const crypto::Member& identity,
                                                               const EncryptedBlock& block) const {
  if (!block.can_decrypt() || block.encryption_type() != BlockEncryptionType::MultiRecipient) {
    throw BlockServiceError(BlockServiceErrorType::CannotDecryptBlock,
                            {{"block_type", to_string(block.block_type())},
                             {"encryption_type", crypto::to_string(block.encryption_type())}});
  }
  return block.decrypt(identity, ecies_, factory_);
}

std::vector<std::future<std::shared_ptr<EncryptedBlock>>> BlockService::encrypt_blocks(
    const std::vector<std::shared_ptr<const EphemeralBlock>>& blocks,
    std::shared_ptr<const crypto::Member> recipient, BlockType new_block_type) const {
  std::vector<std::future<std::shared_ptr<EncryptedBlock>>> results;
  results.reserve(blocks.size());
  for (const auto& block : blocks) {
    auto task = std::make_shared<std::packaged_task<std::shared_ptr<EncryptedBlock>()>>(
      [this, block, recipient, new_block_type]() { return encrypt(new_block_type, *block, *recipient); });
    results.push_back(task->get_future());
    boost::asio::post(pool_, [task]() { (*task)(); });
  }
  return results;
}

//==============================================
// CBL
//==============================================

std::shared_ptr<ConstituentBlockListBlock> BlockService::create_and_store_cbl(
    const std::vector<std::shared_ptr<const BaseBlock>>& blocks, std::shared_ptr<const crypto::Member> creator,
    uint64_t total_length, store::BlockStore& store, const std::string& pool,
    const std::optional<crypto::Checksum>& original_checksum) const {
  if (blocks.empty()) {
    throw BlockServiceError(BlockServiceErrorType::EmptyBlocksArray);
  }
  BlockSize data_size = blocks.front()->block_size();
  std::vector<crypto::Checksum> addresses;
  addresses.reserve(blocks.size());
  for (const auto& block : blocks) {
    if (block->block_size() != data_size) {
      throw BlockServiceError(BlockServiceErrorType::BlockSizeMismatch,
                              {{"expected", to_string(data_size)}, {"actual", to_string(block->block_size())}});
    }
    addresses.push_back(block->id_checksum());
  }

  crypto::Checksum checksum;
  if (original_checksum) {
    checksum = *original_checksum;
  } else {
    Bytes joined;
    for (const auto& block : blocks) {
      Bytes data = block->data();
      joined.insert(joined.end(), data.begin(), data.end());
    }
    joined.resize(std::min<uint64_t>(joined.size(), total_length));
    checksum = checksums_.calculate_checksum(joined);
  }

  BlockSize cbl_size = cbl_service_.file_size_to_cbl_block_size(total_length);
  // The address list may still outgrow the size picked from the file length
  while (cbl_size != BlockSize::Unknown && cbl_service_.calculate_cbl_address_capacity(cbl_size) < addresses.size()) {
    cbl_size = next_largest_block_size(to_length(cbl_size) + 1);
  }
  if (cbl_size == BlockSize::Unknown) {
    throw CblError(CblErrorType::AddressCountExceedsCapacity,
                   {{"address_count", std::to_string(addresses.size())},
                    {"total_length", std::to_string(total_length)}});
  }

  auto cbl = cbl_service_.make_cbl(std::move(creator), cbl_size, addresses, total_length, checksum,
                                   std::nullopt, std::nullopt, data_size);
  store.store(cbl->id_checksum(), cbl->full_data(), pool);
  BOOST_LOG_TRIVIAL(info) << "Block service: Stored CBL " << cbl->id_checksum() << " for "
                          << addresses.size() << " blocks in pool " << pool;
  return cbl;
}

//==============================================
// ENCRYPTION TYPE SNIFFING
//==============================================

BlockEncryptionType BlockService::determine_block_encryption_type(const Bytes& data) {
  if (data.empty()) {
    return BlockEncryptionType::None;
  }
  switch (static_cast<BlockEncryptionType>(data.front())) {
    case BlockEncryptionType::SingleRecipient: return BlockEncryptionType::SingleRecipient;
    case BlockEncryptionType::MultiRecipient:  return BlockEncryptionType::MultiRecipient;
    default:                                   return BlockEncryptionType::None;
  }
}

bool BlockService::is_single_recipient_encrypted(const Bytes& data) {
  return determine_block_encryption_type(data) == BlockEncryptionType::SingleRecipient;
}

bool BlockService::is_multi_recipient_encrypted(const Bytes& data) {
  return determine_block_encryption_type(data) == BlockEncryptionType::MultiRecipient;
}

} // namespace brightchain::service
