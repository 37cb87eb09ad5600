#ifndef BRIGHTCHAIN_CRYPTO_ERROR_HPP
#define BRIGHTCHAIN_CRYPTO_ERROR_HPP

#include <string>
#include "common/error.hpp"

namespace brightchain::crypto {

// Raised by key handling and low level OpenSSL calls
class CryptoError : public BrightChainError {
public:
  explicit CryptoError(const std::string& message, Context context = {})
    : BrightChainError("Crypto error", message, std::move(context)) {}
};

enum class ChecksumErrorType {
  InvalidChecksumLength,
  InvalidChecksumHex,
  DigestFailed
};

const char* to_string(ChecksumErrorType type);

class ChecksumError : public BrightChainError {
public:
  explicit ChecksumError(ChecksumErrorType type, Context context = {})
    : BrightChainError("Checksum error", to_string(type), std::move(context)), type_(type) {}

  ChecksumErrorType type() const { return type_; }

private:
  ChecksumErrorType type_;
};

enum class EciesErrorType {
  InvalidEncryptionType,
  InvalidEphemeralPublicKeyLength,
  InvalidIVLength,
  InvalidAuthTagLength,
  InvalidEncryptionHeaderLength,
  InvalidRecipientCount,
  InvalidRecipientIds,
  InvalidRecipientKeys,
  InvalidVersion,
  InvalidCipherSuite,
  InvalidFormatTag,
  InvalidDataLength,
  InvalidPublicKey,
  InvalidSignatureLength,
  EncryptionRecipientHasNoPrivateKey,
  EncryptionRecipientNotFoundInRecipients,
  EncryptionFailed,
  DecryptionFailed,
  KeyOperationFailed,
  SignatureFailed
};

const char* to_string(EciesErrorType type);

// Cryptographic header and authorization failures of the ECIES layer
class EciesError : public BrightChainError {
public:
  explicit EciesError(EciesErrorType type, Context context = {})
    : BrightChainError("ECIES error", to_string(type), std::move(context)), type_(type) {}

  EciesErrorType type() const { return type_; }

private:
  EciesErrorType type_;
};

} // namespace brightchain::crypto

#endif // BRIGHTCHAIN_CRYPTO_ERROR_HPP
