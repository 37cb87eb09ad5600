#ifndef BRIGHTCHAIN_CBL_SERVICE_HPP
#define BRIGHTCHAIN_CBL_SERVICE_HPP

#include <memory>
#include <optional>
#include <vector>
#include "blocks/cbl_block.hpp"
#include "crypto/constants.hpp"

namespace brightchain::service {

// Header bytes produced by make_cbl_header and the signature written into them
struct SignedCblHeader {
  Bytes header_data;
  Bytes signature;
};

// Builds, signs and sizes constituent block lists for a fixed tuple size
class CblService {
public:
  CblService(const crypto::ChecksumService& checksums, const crypto::EciesService& ecies,
             std::size_t tuple_size = crypto::constants::TUPLE_SIZE);

  std::size_t tuple_size() const { return tuple_size_; }


  // ---- HEADER ----
  // Signs with the creator's private key unless a signature is supplied.
  // address_list must hold exactly address_count checksums. The listed
  // blocks are data_block_size, block_size when unset.
  SignedCblHeader make_cbl_header(const crypto::Member& creator, blocks::Clock::time_point date_created,
                                  uint32_t address_count, uint64_t original_data_length,
                                  const crypto::Checksum& original_data_checksum, const Bytes& address_list,
                                  blocks::BlockSize block_size,
                                  const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt,
                                  const std::optional<Bytes>& signature = std::nullopt,
                                  std::optional<blocks::BlockSize> data_block_size = std::nullopt) const;
  blocks::CblHeader read_cbl_header(const Bytes& data) const;
  // False if creator is not the header creator or the signature does not verify
  bool validate_signature(const Bytes& data, const crypto::Member& creator) const;


  // ---- BLOCKS ----
  std::shared_ptr<blocks::ConstituentBlockListBlock> make_cbl(
    std::shared_ptr<const crypto::Member> creator, blocks::BlockSize block_size,
    const std::vector<crypto::Checksum>& addresses, uint64_t original_data_length,
    const crypto::Checksum& original_data_checksum,
    const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt,
    std::optional<blocks::Clock::time_point> date_created = std::nullopt,
    std::optional<blocks::BlockSize> data_block_size = std::nullopt) const;


  // ---- CAPACITY ----
  // Largest multiple of the tuple size that fits, zero if not even one tuple fits
  std::size_t calculate_cbl_address_capacity(
    blocks::BlockSize block_size, const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt) const;
  std::size_t max_id_count(blocks::BlockSize block_size,
                           const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt) const;
  std::size_t max_tuple_count(blocks::BlockSize block_size,
                              const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt) const;
  uint64_t max_file_size(blocks::BlockSize block_size,
                         const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt) const;
  // Smallest size whose single CBL can index file_size bytes, Unknown if none
  blocks::BlockSize file_size_to_cbl_block_size(
    uint64_t file_size, const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt) const;


  // ---- EXTENDED FIELDS ----
  void validate_file_name(const std::string& file_name) const { blocks::validate_file_name_format(file_name); }
  void validate_mime_type(const std::string& mime_type) const { blocks::validate_mime_type_format(mime_type); }

private:
  const crypto::ChecksumService& checksums_;
  const crypto::EciesService& ecies_;
  std::size_t tuple_size_;
};

} // namespace brightchain::service

#endif // BRIGHTCHAIN_CBL_SERVICE_HPP
