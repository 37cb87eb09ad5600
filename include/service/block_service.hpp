#ifndef BRIGHTCHAIN_BLOCK_SERVICE_HPP
#define BRIGHTCHAIN_BLOCK_SERVICE_HPP

#include <future>
#include <memory>
#include <optional>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "blocks/block_factory.hpp"
#include "blocks/encrypted_block.hpp"
#include "blocks/raw_data_block.hpp"
#include "service/cbl_service.hpp"
#include "store/block_store.hpp"

namespace brightchain::service {

enum class BlockServiceErrorType {
  NoWhitenersProvided,
  EmptyBlocksArray,
  BlockSizeMismatch,
  InvalidBlockSize,
  CannotEncryptBlock,
  CannotDecryptBlock,
  InvalidEncryptedBlockType,
  InvalidRecipientCount
};

const char* to_string(BlockServiceErrorType type);

class BlockServiceError : public BrightChainError {
public:
  explicit BlockServiceError(BlockServiceErrorType type, Context context = {})
    : BrightChainError("Block service error", to_string(type), std::move(context)), type_(type) {}

  BlockServiceErrorType type() const { return type_; }

private:
  BlockServiceErrorType type_;
};

// Orchestrates sizing, whitening, encryption and CBL creation over blocks
class BlockService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BlockService(const crypto::ChecksumService& checksums, const crypto::EciesService& ecies,
               const blocks::BlockFactory& factory, const CblService& cbl_service,
               std::size_t worker_threads = 2);
  ~BlockService();

  BlockService(const BlockService&) = delete;
  BlockService& operator=(const BlockService&) = delete;


  // ---- SIZING ----
  // Smallest size whose single recipient encrypted capacity holds length
  static blocks::BlockSize get_block_size_for_data(int64_t length);
  // Unpadded chunks of block_size bytes, the last one holding the remainder
  static std::vector<Bytes> break_file_into_blocks(const Bytes& data, blocks::BlockSize block_size);


  // ---- WHITENING ----
  static Bytes xor_block_with_whiteners(const Bytes& block, const std::vector<Bytes>& whiteners);
  // Block i is combined with whiteners[i % whiteners.size()]
  static std::vector<Bytes> xor_blocks_with_whiteners_round_robin(const std::vector<Bytes>& blocks,
                                                                  const std::vector<Bytes>& whiteners);
  std::vector<std::shared_ptr<blocks::RandomBlock>> generate_whiteners(blocks::BlockSize block_size,
                                                                       std::size_t count) const;


  // ---- ENCRYPTION ----
  std::shared_ptr<blocks::EncryptedBlock> encrypt(blocks::BlockType new_block_type,
                                                  const blocks::EphemeralBlock& block,
                                                  const crypto::Member& recipient) const;
  std::shared_ptr<blocks::EphemeralBlock> decrypt(const crypto::Member& identity,
                                                  const blocks::EncryptedBlock& block,
                                                  std::optional<blocks::BlockType> new_block_type = std::nullopt) const;
  std::shared_ptr<blocks::EncryptedBlock> encrypt_multiple(
    blocks::BlockType new_block_type, const blocks::EphemeralBlock& block,
    const std::vector<std::shared_ptr<const crypto::Member>>& recipients) const;
  std::shared_ptr<blocks::EphemeralBlock> decrypt_multiple(const crypto::Member& identity,
                                                           const blocks::EncryptedBlock& block) const;
  // One future per block, encrypted on the worker pool
  std::vector<std::future<std::shared_ptr<blocks::EncryptedBlock>>> encrypt_blocks(
    const std::vector<std::shared_ptr<const blocks::EphemeralBlock>>& blocks,
    std::shared_ptr<const crypto::Member> recipient,
    blocks::BlockType new_block_type = blocks::BlockType::EncryptedOwnedDataBlock) const;


  // ---- CBL ----
  // Signs a CBL over the block ids, in order, and stores it in pool. Without
  // original_checksum the checksum of the joined block data is used.
  std::shared_ptr<blocks::ConstituentBlockListBlock> create_and_store_cbl(
    const std::vector<std::shared_ptr<const blocks::BaseBlock>>& blocks,
    std::shared_ptr<const crypto::Member> creator, uint64_t total_length, store::BlockStore& store,
    const std::string& pool = store::DEFAULT_POOL,
    const std::optional<crypto::Checksum>& original_checksum = std::nullopt) const;


  // ---- ENCRYPTION TYPE SNIFFING ----
  // Reads the leading encryption type byte of an encrypted block buffer
  static blocks::BlockEncryptionType determine_block_encryption_type(const Bytes& data);
  static bool is_single_recipient_encrypted(const Bytes& data);
  static bool is_multi_recipient_encrypted(const Bytes& data);

private:
  blocks::BlockCreationParams encrypted_params(blocks::BlockType new_block_type,
                                               const blocks::EphemeralBlock& block, Bytes ciphertext) const;

  const crypto::ChecksumService& checksums_;
  const crypto::EciesService& ecies_;
  const blocks::BlockFactory& factory_;
  const CblService& cbl_service_;
  mutable boost::asio::thread_pool pool_;
};

} // namespace brightchain::service

#endif // BRIGHTCHAIN_BLOCK_SERVICE_HPP
