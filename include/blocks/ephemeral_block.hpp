#ifndef BRIGHTCHAIN_EPHEMERAL_BLOCK_HPP
#define BRIGHTCHAIN_EPHEMERAL_BLOCK_HPP

#include "blocks/base_block.hpp"

namespace brightchain::blocks {

// In-memory block carrying a logical payload shorter than the block size.
// The remainder is random padding; the checksum covers the padded buffer.
class EphemeralBlock : public BaseBlock {
public:
  // checksum, when given, must match the data as supplied (before padding)
  static std::shared_ptr<EphemeralBlock> from(const crypto::ChecksumService& checksums,
                                              BlockType block_type, BlockDataType block_data_type,
                                              BlockSize block_size, const Bytes& data,
                                              const std::optional<crypto::Checksum>& checksum = std::nullopt,
                                              const BlockMetadata& metadata = {});

  // ---- LAYER VIEW ----
  // Logical prefix for plain blocks, the whole buffer once encrypted
  Bytes data() const override;
  std::size_t length_before_encryption() const { return length_before_encryption_; }
  bool encrypted() const { return encrypted_; }


  // ---- CAPABILITIES ----
  bool can_encrypt() const;
  bool can_multi_encrypt(std::size_t recipient_count) const;
  bool can_decrypt() const { return encrypted_; }

protected:
  EphemeralBlock(BlockType block_type, BlockDataType block_data_type, BlockSize block_size,
                 Bytes data, const crypto::Checksum& checksum, const BlockMetadata& metadata,
                 std::size_t length_before_encryption, bool encrypted);

  void validate_layers() const override;

  // Pads data with random bytes up to the block size
  static Bytes pad_to_block_size(const Bytes& data, BlockSize block_size);

private:
  std::size_t length_before_encryption_;
  bool encrypted_;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_EPHEMERAL_BLOCK_HPP
