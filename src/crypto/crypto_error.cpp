#include "crypto/crypto_error.hpp"

namespace brightchain::crypto {

const char* to_string(ChecksumErrorType type) {
  switch (type) {
    case ChecksumErrorType::InvalidChecksumLength: return "InvalidChecksumLength";
    case ChecksumErrorType::InvalidChecksumHex:    return "InvalidChecksumHex";
    case ChecksumErrorType::DigestFailed:          return "DigestFailed";
    default:                                       return "Unknown";
  }
}

const char* to_string(EciesErrorType type) {
  switch (type) {
    case EciesErrorType::InvalidEncryptionType:                   return "InvalidEncryptionType";
    case EciesErrorType::InvalidEphemeralPublicKeyLength:         return "InvalidEphemeralPublicKeyLength";
    case EciesErrorType::InvalidIVLength:                         return "InvalidIVLength";
    case EciesErrorType::InvalidAuthTagLength:                    return "InvalidAuthTagLength";
    case EciesErrorType::InvalidEncryptionHeaderLength:           return "InvalidEncryptionHeaderLength";
    case EciesErrorType::InvalidRecipientCount:                   return "InvalidRecipientCount";
    case EciesErrorType::InvalidRecipientIds:                     return "InvalidRecipientIds";
    case EciesErrorType::InvalidRecipientKeys:                    return "InvalidRecipientKeys";
    case EciesErrorType::InvalidVersion:                          return "InvalidVersion";
    case EciesErrorType::InvalidCipherSuite:                      return "InvalidCipherSuite";
    case EciesErrorType::InvalidFormatTag:                        return "InvalidFormatTag";
    case EciesErrorType::InvalidDataLength:                       return "InvalidDataLength";
    case EciesErrorType::InvalidPublicKey:                        return "InvalidPublicKey";
    case EciesErrorType::InvalidSignatureLength:                  return "InvalidSignatureLength";
    case EciesErrorType::EncryptionRecipientHasNoPrivateKey:      return "EncryptionRecipientHasNoPrivateKey";
    case EciesErrorType::EncryptionRecipientNotFoundInRecipients: return "EncryptionRecipientNotFoundInRecipients";
    case EciesErrorType::EncryptionFailed:                        return "EncryptionFailed";
    case EciesErrorType::DecryptionFailed:                        return "DecryptionFailed";
    case EciesErrorType::KeyOperationFailed:                      return "KeyOperationFailed";
    case EciesErrorType::SignatureFailed:                         return "SignatureFailed";
    default:                                                      return "Unknown";
  }
}

} // namespace brightchain::crypto
