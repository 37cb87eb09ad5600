#include "blocks/block_error.hpp"

namespace brightchain::blocks {

const char* to_string(BlockErrorType type) {
  switch (type) {
    case BlockErrorType::DataLengthExceedsCapacity:    return "DataLengthExceedsCapacity";
    case BlockErrorType::DataLengthTooShort:           return "DataLengthTooShort";
    case BlockErrorType::DataBufferIsTruncated:        return "DataBufferIsTruncated";
    case BlockErrorType::DataCannotBeEmpty:            return "DataCannotBeEmpty";
    case BlockErrorType::InvalidBlockType:             return "InvalidBlockType";
    case BlockErrorType::InvalidBlockSize:             return "InvalidBlockSize";
    case BlockErrorType::InvalidRecipientCount:        return "InvalidRecipientCount";
    case BlockErrorType::FutureCreationDate:           return "FutureCreationDate";
    case BlockErrorType::InvalidDateCreated:           return "InvalidDateCreated";
    case BlockErrorType::BlockSizesDoNotMatch:         return "BlockSizesDoNotMatch";
    case BlockErrorType::CreatorRequired:              return "CreatorRequired";
    case BlockErrorType::CreatorPrivateKeyRequired:    return "CreatorPrivateKeyRequired";
    case BlockErrorType::UnexpectedEncryptedBlockType: return "UnexpectedEncryptedBlockType";
    case BlockErrorType::CannotEncrypt:                return "CannotEncrypt";
    case BlockErrorType::CannotDecrypt:                return "CannotDecrypt";
    case BlockErrorType::BlockIsNotReadable:           return "BlockIsNotReadable";
    default:                                           return "Unknown";
  }
}

const char* to_string(BlockSizeErrorType type) {
  switch (type) {
    case BlockSizeErrorType::InvalidBlockSizeLength: return "InvalidBlockSizeLength";
    default:                                         return "Unknown";
  }
}

const char* to_string(WhitenedErrorType type) {
  switch (type) {
    case WhitenedErrorType::BlockSizeMismatch:  return "BlockSizeMismatch";
    case WhitenedErrorType::DataLengthMismatch: return "DataLengthMismatch";
    default:                                    return "Unknown";
  }
}

const char* to_string(CblErrorType type) {
  switch (type) {
    case CblErrorType::InvalidCBLAddressCount:       return "InvalidCBLAddressCount";
    case CblErrorType::AddressCountExceedsCapacity:  return "AddressCountExceedsCapacity";
    case CblErrorType::InvalidTupleSize:             return "InvalidTupleSize";
    case CblErrorType::InvalidStructure:             return "InvalidStructure";
    case CblErrorType::InvalidHeaderLength:          return "InvalidHeaderLength";
    case CblErrorType::UnsupportedCblVersion:        return "UnsupportedCblVersion";
    case CblErrorType::CreatorIdMismatch:            return "CreatorIdMismatch";
    case CblErrorType::CreatorRequired:              return "CreatorRequired";
    case CblErrorType::CreatorPrivateKeyRequired:    return "CreatorPrivateKeyRequired";
    case CblErrorType::InvalidSignature:             return "InvalidSignature";
    case CblErrorType::NotExtendedCbl:               return "NotExtendedCbl";
    case CblErrorType::OriginalDataChecksumMismatch: return "OriginalDataChecksumMismatch";
    case CblErrorType::FileSizeTooLarge:             return "FileSizeTooLarge";
    default:                                         return "Unknown";
  }
}

const char* to_string(ExtendedCblErrorType type) {
  switch (type) {
    case ExtendedCblErrorType::FileNameRequired:         return "FileNameRequired";
    case ExtendedCblErrorType::FileNameTooLong:          return "FileNameTooLong";
    case ExtendedCblErrorType::FileNameWhitespace:       return "FileNameWhitespace";
    case ExtendedCblErrorType::FileNameInvalidCharacter: return "FileNameInvalidCharacter";
    case ExtendedCblErrorType::FileNamePathTraversal:    return "FileNamePathTraversal";
    case ExtendedCblErrorType::MimeTypeRequired:         return "MimeTypeRequired";
    case ExtendedCblErrorType::MimeTypeTooLong:          return "MimeTypeTooLong";
    case ExtendedCblErrorType::MimeTypeWhitespace:       return "MimeTypeWhitespace";
    case ExtendedCblErrorType::MimeTypeLowercase:        return "MimeTypeLowercase";
    case ExtendedCblErrorType::MimeTypeInvalidFormat:    return "MimeTypeInvalidFormat";
    default:                                             return "Unknown";
  }
}

const char* to_string(TupleErrorType type) {
  switch (type) {
    case TupleErrorType::InvalidTupleSize:    return "InvalidTupleSize";
    case TupleErrorType::InvalidBlockCount:   return "InvalidBlockCount";
    case TupleErrorType::BlockSizeMismatch:   return "BlockSizeMismatch";
    case TupleErrorType::MissingParameters:   return "MissingParameters";
    case TupleErrorType::FetchFailed:         return "FetchFailed";
    case TupleErrorType::XorLengthMismatch:   return "XorLengthMismatch";
    case TupleErrorType::InvalidBlockType:    return "InvalidBlockType";
    case TupleErrorType::InvalidSourceLength: return "InvalidSourceLength";
    default:                                  return "Unknown";
  }
}

} // namespace brightchain::blocks
