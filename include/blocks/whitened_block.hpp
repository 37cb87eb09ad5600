#ifndef BRIGHTCHAIN_WHITENED_BLOCK_HPP
#define BRIGHTCHAIN_WHITENED_BLOCK_HPP

#include "blocks/base_block.hpp"

namespace brightchain::blocks {

// Owner-free whitened block: source bytes XORed with random bytes, so neither
// the stored block nor its whitener alone reveals the content.
class WhitenedBlock : public BaseBlock {
public:
  // data and random_data must have equal length, at most block_size.
  // A short result is padded with random bytes.
  static std::shared_ptr<WhitenedBlock> from_data(const crypto::ChecksumService& checksums,
                                                  BlockSize block_size, const Bytes& data,
                                                  const Bytes& random_data,
                                                  const BlockMetadata& metadata = {});
  // Reloads a stored whitened block of exactly block_size bytes
  static std::shared_ptr<WhitenedBlock> from(const crypto::ChecksumService& checksums,
                                             BlockSize block_size, const Bytes& data,
                                             const std::optional<crypto::Checksum>& checksum = std::nullopt,
                                             const BlockMetadata& metadata = {});

  std::shared_ptr<BaseBlock> xor_with(const BaseBlock& other,
                                      const crypto::ChecksumService& checksums) const override;

  // Whitened blocks are stored in the clear by construction
  bool can_encrypt() const { return false; }

protected:
  using BaseBlock::BaseBlock;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_WHITENED_BLOCK_HPP
