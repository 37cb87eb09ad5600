#ifndef BRIGHTCHAIN_ENCRYPTION_HEADER_HPP
#define BRIGHTCHAIN_ENCRYPTION_HEADER_HPP

#include <cstdint>
#include <vector>
#include "common/bytes.hpp"

namespace brightchain::crypto {

// Leading byte of every encrypted payload
enum class EncryptionType : uint8_t {
  None = 0,
  SingleRecipient = 1,
  MultiRecipient = 2
};

const char* to_string(EncryptionType type);

// ---- SINGLE RECIPIENT ----
// EncType | RecipientID | Version | CipherSuite | FormatTag | EphPub | IV | Tag | Length
struct SingleHeader {
  Bytes recipient_id;
  uint8_t version = 0;
  uint8_t cipher_suite = 0;
  uint8_t format_tag = 0;
  Bytes ephemeral_public_key;
  Bytes iv;
  Bytes auth_tag;
  uint64_t data_length = 0;
  std::size_t header_size = 0;
};

// ---- MULTI RECIPIENT ----
// EncType | Version | CipherSuite | FormatTag | EphPub | IV | Tag | Length | Count | Entries
struct MultiHeader {
  uint8_t version = 0;
  uint8_t cipher_suite = 0;
  uint8_t format_tag = 0;
  Bytes ephemeral_public_key;
  Bytes iv;
  Bytes auth_tag;
  uint64_t data_length = 0;
  uint16_t recipient_count = 0;
  std::vector<Bytes> recipient_ids;
  // KeyIV | KeyAuthTag | WrappedKey per recipient
  std::vector<Bytes> recipient_keys;
  std::size_t header_size = 0;
};

// Byte offsets shared by the encoder and the parsers
namespace layout {
std::size_t single_tag_offset();
std::size_t multi_tag_offset();
}

// Strict fixed-offset decode, throws EciesError for any structural fault.
// data starts at the encryption type byte.
SingleHeader parse_single_header(const uint8_t* data, std::size_t length);
MultiHeader parse_multi_header(const uint8_t* data, std::size_t length);

// Checks count >= 2, table sizes, entry lengths and unique ids
void validate_multi_header(const MultiHeader& header);

// Reads byte 0; throws EciesError(InvalidEncryptionType) for unknown or None values
EncryptionType read_encryption_type(const uint8_t* data, std::size_t length);

// Header bytes with the auth tag field removed, bound as GCM additional data
Bytes additional_data(const uint8_t* header, std::size_t header_size, std::size_t tag_offset);

} // namespace brightchain::crypto

#endif // BRIGHTCHAIN_ENCRYPTION_HEADER_HPP
