#include "blocks/block_type.hpp"

namespace brightchain::blocks {

const char* to_string(BlockType type) {
  switch (type) {
    case BlockType::Unknown:                                    return "Unknown";
    case BlockType::RawData:                                    return "RawData";
    case BlockType::Random:                                     return "Random";
    case BlockType::OwnerFreeWhitenedBlock:                     return "OwnerFreeWhitenedBlock";
    case BlockType::EphemeralOwnedDataBlock:                    return "EphemeralOwnedDataBlock";
    case BlockType::OwnedDataBlock:                             return "OwnedDataBlock";
    case BlockType::EncryptedOwnedDataBlock:                    return "EncryptedOwnedDataBlock";
    case BlockType::MultiEncryptedBlock:                        return "MultiEncryptedBlock";
    case BlockType::ConstituentBlockList:                       return "ConstituentBlockList";
    case BlockType::ExtendedConstituentBlockListBlock:          return "ExtendedConstituentBlockListBlock";
    case BlockType::EncryptedConstituentBlockListBlock:         return "EncryptedConstituentBlockListBlock";
    case BlockType::EncryptedExtendedConstituentBlockListBlock: return "EncryptedExtendedConstituentBlockListBlock";
    case BlockType::Handle:                                     return "Handle";
    case BlockType::Input:                                      return "Input";
    default:                                                    return "Invalid";
  }
}

const char* to_string(BlockDataType type) {
  switch (type) {
    case BlockDataType::RawData:                 return "RawData";
    case BlockDataType::EncryptedData:           return "EncryptedData";
    case BlockDataType::EphemeralStructuredData: return "EphemeralStructuredData";
    default:                                     return "Invalid";
  }
}

std::ostream& operator<<(std::ostream& os, BlockType type) {
  return os << to_string(type);
}

bool is_encrypted_block_type(BlockType type) {
  return type == BlockType::EncryptedOwnedDataBlock
      || type == BlockType::MultiEncryptedBlock
      || type == BlockType::EncryptedConstituentBlockListBlock
      || type == BlockType::EncryptedExtendedConstituentBlockListBlock;
}

bool is_cbl_block_type(BlockType type) {
  return type == BlockType::ConstituentBlockList
      || type == BlockType::ExtendedConstituentBlockListBlock;
}

bool is_extended_cbl_block_type(BlockType type) {
  return type == BlockType::ExtendedConstituentBlockListBlock
      || type == BlockType::EncryptedExtendedConstituentBlockListBlock;
}

BlockType decrypted_block_type(BlockType type) {
  switch (type) {
    case BlockType::EncryptedOwnedDataBlock:
    case BlockType::MultiEncryptedBlock:
      return BlockType::EphemeralOwnedDataBlock;
    case BlockType::EncryptedConstituentBlockListBlock:
      return BlockType::ConstituentBlockList;
    case BlockType::EncryptedExtendedConstituentBlockListBlock:
      return BlockType::ExtendedConstituentBlockListBlock;
    default:
      return BlockType::Unknown;
  }
}

} // namespace brightchain::blocks
