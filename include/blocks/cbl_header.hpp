#ifndef BRIGHTCHAIN_CBL_HEADER_HPP
#define BRIGHTCHAIN_CBL_HEADER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "blocks/block_size.hpp"
#include "common/bytes.hpp"
#include "crypto/checksum.hpp"

namespace brightchain::blocks {

// File name and MIME type carried by extended CBLs
struct ExtendedCblDetails {
  std::string file_name;
  std::string mime_type;
};

// Decoded CBL v1 header
struct CblHeader {
  uint8_t version = 0;
  Bytes creator_id;
  Bytes signature;
  uint64_t date_created_ms = 0;
  uint32_t address_count = 0;
  uint8_t tuple_size = 0;
  uint64_t original_data_length = 0;
  crypto::Checksum original_data_checksum;
  // Size of the listed blocks, which may be smaller than the CBL's own size
  BlockSize data_block_size = BlockSize::Unknown;
  std::optional<ExtendedCblDetails> extended;
  // Base header plus extended fields, where the address list begins
  std::size_t header_size = 0;
};

namespace cbl_layout {
// Version | CreatorID | Signature | Date | Count | TupleSize | Length | Checksum | DataBlockSize | IsExtended
inline constexpr std::size_t VERSION_OFFSET = 0;
inline constexpr std::size_t CREATOR_ID_OFFSET = 1;
inline constexpr std::size_t SIGNATURE_OFFSET = 17;
inline constexpr std::size_t DATE_CREATED_OFFSET = 81;
inline constexpr std::size_t ADDRESS_COUNT_OFFSET = 89;
inline constexpr std::size_t TUPLE_SIZE_OFFSET = 93;
inline constexpr std::size_t ORIGINAL_LENGTH_OFFSET = 94;
inline constexpr std::size_t ORIGINAL_CHECKSUM_OFFSET = 102;
inline constexpr std::size_t DATA_BLOCK_SIZE_OFFSET = 166;
inline constexpr std::size_t IS_EXTENDED_OFFSET = 170;
inline constexpr std::size_t BASE_HEADER_SIZE = 171;
}

// Header size including the extended fields when present
std::size_t cbl_header_size(const std::optional<ExtendedCblDetails>& extended);

// Encodes every field including the signature
Bytes encode_cbl_header(const CblHeader& header);

// Strict decode of a CBL buffer (header, addresses and optional padding).
// Throws CblError or ExtendedCblError, never truncates.
CblHeader read_cbl_header(const uint8_t* data, std::size_t length);

// Addresses following the header, re-read from the buffer on every call
std::vector<crypto::Checksum> read_cbl_addresses(const uint8_t* data, std::size_t length,
                                                 const CblHeader& header);

// Header with the signature field removed, the signed portion of the header
Bytes header_without_signature(const Bytes& header_data);

// ---- EXTENDED FIELD VALIDATION ----
// At most 255 bytes, no surrounding whitespace, no control characters,
// no path separators or traversal
void validate_file_name_format(const std::string& file_name);
// At most 127 bytes, lowercase type/subtype
void validate_mime_type_format(const std::string& mime_type);

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_CBL_HEADER_HPP
