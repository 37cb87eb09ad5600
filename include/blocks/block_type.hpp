#ifndef BRIGHTCHAIN_BLOCK_TYPE_HPP
#define BRIGHTCHAIN_BLOCK_TYPE_HPP

#include <cstdint>
#include <ostream>
#include "crypto/encryption_header.hpp"

namespace brightchain::blocks {

enum class BlockType {
  Unknown,
  RawData,
  Random,
  OwnerFreeWhitenedBlock,
  EphemeralOwnedDataBlock,
  OwnedDataBlock,
  EncryptedOwnedDataBlock,
  MultiEncryptedBlock,
  ConstituentBlockList,
  ExtendedConstituentBlockListBlock,
  EncryptedConstituentBlockListBlock,
  EncryptedExtendedConstituentBlockListBlock,
  Handle,
  Input
};

enum class BlockDataType {
  RawData,
  EncryptedData,
  EphemeralStructuredData
};

// Same values as the leading byte of an encrypted payload
using BlockEncryptionType = crypto::EncryptionType;

const char* to_string(BlockType type);
const char* to_string(BlockDataType type);
std::ostream& operator<<(std::ostream& os, BlockType type);

bool is_encrypted_block_type(BlockType type);
bool is_cbl_block_type(BlockType type);
bool is_extended_cbl_block_type(BlockType type);
// Plain type recovered by decrypting a block of the given encrypted type,
// Unknown for types that are not encrypted
BlockType decrypted_block_type(BlockType type);

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_BLOCK_TYPE_HPP
