#ifndef BRIGHTCHAIN_CBL_BLOCK_HPP
#define BRIGHTCHAIN_CBL_BLOCK_HPP

#include <optional>
#include <vector>
#include "blocks/block_tuple.hpp"
#include "blocks/cbl_header.hpp"
#include "blocks/ephemeral_block.hpp"
#include "crypto/ecies.hpp"
#include "store/block_store.hpp"

namespace brightchain::blocks {

// Signed list of the block addresses that make up a file, grouped in tuples
class ConstituentBlockListBlock : public EphemeralBlock {
public:
  // data is either the logical CBL (header and addresses) or the full padded
  // block. Without block_size the size is taken from the data length.
  static std::shared_ptr<ConstituentBlockListBlock> from_bytes(
    const crypto::ChecksumService& checksums, const Bytes& data,
    std::shared_ptr<const crypto::Member> creator,
    std::optional<BlockSize> block_size = std::nullopt,
    const std::optional<crypto::Checksum>& checksum = std::nullopt,
    bool can_read = true, bool can_persist = true);

  // ---- HEADER ----
  const CblHeader& header() const { return header_; }
  const Bytes& creator_id() const { return header_.creator_id; }
  const Bytes& creator_signature() const { return header_.signature; }
  uint32_t cbl_address_count() const { return header_.address_count; }
  std::size_t tuple_size() const { return header_.tuple_size; }
  uint64_t original_data_length() const { return header_.original_data_length; }
  const crypto::Checksum& original_data_checksum() const { return header_.original_data_checksum; }
  BlockSize data_block_size() const { return header_.data_block_size; }
  bool is_extended() const { return header_.extended.has_value(); }
  // Throw CblError(NotExtendedCbl) on a plain CBL
  const std::string& file_name() const;
  const std::string& mime_type() const;


  // ---- ADDRESSES ----
  // Decoded from the block buffer on every call
  std::vector<crypto::Checksum> addresses() const;
  Bytes address_data() const;


  // ---- LAYER VIEW ----
  Bytes layer_header_data() const override;
  Bytes payload() const override;
  std::size_t payload_length() const override;
  std::size_t total_overhead() const override;


  // ---- AUTHENTICITY ----
  // False when the signer id differs from the header or the signature does
  // not cover the current header and address list
  bool validate_signature(const crypto::EciesService& ecies, const crypto::ChecksumService& checksums,
                          const crypto::Member& signer) const;
  // Uses the block creator; throws CblError(CreatorRequired) without one
  bool validate_signature(const crypto::EciesService& ecies, const crypto::ChecksumService& checksums) const;


  // ---- RECONSTRUCTION ----
  // Groups the addresses into tuples of data_block_size handles. With a
  // pool, every address must be present in it or PoolIntegrityError is thrown.
  std::vector<BlockHandleTuple> get_handle_tuples(const store::BlockStore& store,
                                                  const std::optional<std::string>& pool = std::nullopt) const;

protected:
  ConstituentBlockListBlock(BlockType block_type, BlockSize block_size, Bytes data,
                            const crypto::Checksum& checksum, const BlockMetadata& metadata,
                            std::size_t logical_length, CblHeader header);

  void validate_layers() const override;

private:
  CblHeader header_;
};

// Checksum signed by a CBL creator: SHA3-512(header without signature || addresses)
crypto::Checksum cbl_signature_checksum(const crypto::ChecksumService& checksums,
                                        const Bytes& header_data, const Bytes& address_list);

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_CBL_BLOCK_HPP
