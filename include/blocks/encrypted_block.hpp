#ifndef BRIGHTCHAIN_ENCRYPTED_BLOCK_HPP
#define BRIGHTCHAIN_ENCRYPTED_BLOCK_HPP

#include <optional>
#include <vector>
#include "blocks/block_capacity.hpp"
#include "blocks/ephemeral_block.hpp"
#include "crypto/ecies.hpp"
#include "crypto/encryption_header.hpp"

namespace brightchain::blocks {

class BlockFactory;

// Block whose buffer is an ECIES header, ciphertext and random padding.
// The header is parsed once at construction and never changes afterwards.
class EncryptedBlock : public EphemeralBlock {
public:
  // data is the ECIES output, padded here if shorter than the block size.
  // checksum, when given, must match data as supplied.
  static std::shared_ptr<EncryptedBlock> from(const crypto::ChecksumService& checksums,
                                              const BlockCapacityCalculator& calculator,
                                              BlockType block_type, BlockSize block_size,
                                              const Bytes& data,
                                              const std::optional<crypto::Checksum>& checksum = std::nullopt,
                                              const BlockMetadata& metadata = {});

  // ---- HEADER ----
  BlockEncryptionType encryption_type() const { return encryption_type_; }
  // Header length derived from the encryption type and recipient count
  std::size_t layer_overhead_size() const;
  std::vector<Bytes> recipient_ids() const;
  std::size_t recipient_count() const;
  const Bytes& ephemeral_public_key() const;
  const Bytes& iv() const;
  const Bytes& auth_tag() const;
  std::size_t available_capacity() const { return available_capacity_; }


  // ---- LAYER VIEW ----
  Bytes layer_header_data() const override;
  // Ciphertext only
  Bytes payload() const override;
  std::size_t payload_length() const override;
  std::size_t total_overhead() const override;


  // ---- DECRYPTION ----
  // Decrypts with identity's private key and builds a new_type block through
  // the factory. new_type defaults to the plain counterpart of this type.
  std::shared_ptr<EphemeralBlock> decrypt(const crypto::Member& identity,
                                          const crypto::EciesService& ecies,
                                          const BlockFactory& factory,
                                          std::optional<BlockType> new_type = std::nullopt) const;

protected:
  EncryptedBlock(BlockType block_type, BlockSize block_size, Bytes data, const crypto::Checksum& checksum,
                 const BlockMetadata& metadata, BlockEncryptionType encryption_type,
                 std::optional<crypto::SingleHeader> single_header,
                 std::optional<crypto::MultiHeader> multi_header, std::size_t available_capacity);

  void validate_layers() const override;

private:
  BlockEncryptionType encryption_type_;
  std::optional<crypto::SingleHeader> single_header_;
  std::optional<crypto::MultiHeader> multi_header_;
  std::size_t available_capacity_;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_ENCRYPTED_BLOCK_HPP
