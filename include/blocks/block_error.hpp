#ifndef BRIGHTCHAIN_BLOCK_ERROR_HPP
#define BRIGHTCHAIN_BLOCK_ERROR_HPP

#include <string>
#include "common/error.hpp"
#include "crypto/checksum.hpp"

namespace brightchain::blocks {

// ---- BLOCK ----
enum class BlockErrorType {
  DataLengthExceedsCapacity,
  DataLengthTooShort,
  DataBufferIsTruncated,
  DataCannotBeEmpty,
  InvalidBlockType,
  InvalidBlockSize,
  InvalidRecipientCount,
  FutureCreationDate,
  InvalidDateCreated,
  BlockSizesDoNotMatch,
  CreatorRequired,
  CreatorPrivateKeyRequired,
  UnexpectedEncryptedBlockType,
  CannotEncrypt,
  CannotDecrypt,
  BlockIsNotReadable
};

const char* to_string(BlockErrorType type);

class BlockError : public BrightChainError {
public:
  explicit BlockError(BlockErrorType type, Context context = {})
    : BrightChainError("Block error", to_string(type), std::move(context)), type_(type) {}

  BlockErrorType type() const { return type_; }

private:
  BlockErrorType type_;
};

// ---- INTEGRITY ----
class ChecksumMismatchError : public BrightChainError {
public:
  ChecksumMismatchError(const crypto::Checksum& expected, const crypto::Checksum& computed, Context context = {})
    : BrightChainError("Checksum mismatch", "ChecksumMismatch",
                       with_checksums(std::move(context), expected, computed))
    , expected_(expected)
    , computed_(computed) {}

  const crypto::Checksum& expected() const { return expected_; }
  const crypto::Checksum& computed() const { return computed_; }

private:
  crypto::Checksum expected_;
  crypto::Checksum computed_;

  static Context with_checksums(Context context, const crypto::Checksum& expected,
                                const crypto::Checksum& computed) {
    context["expected"] = expected.to_hex();
    context["computed"] = computed.to_hex();
    return context;
  }
};

// ---- BLOCK SIZE ----
enum class BlockSizeErrorType {
  InvalidBlockSizeLength
};

const char* to_string(BlockSizeErrorType type);

class BlockSizeError : public BrightChainError {
public:
  explicit BlockSizeError(BlockSizeErrorType type, Context context = {})
    : BrightChainError("Block size error", to_string(type), std::move(context)), type_(type) {}

  BlockSizeErrorType type() const { return type_; }

private:
  BlockSizeErrorType type_;
};

// ---- WHITENING ----
enum class WhitenedErrorType {
  BlockSizeMismatch,
  DataLengthMismatch
};

const char* to_string(WhitenedErrorType type);

class WhitenedError : public BrightChainError {
public:
  explicit WhitenedError(WhitenedErrorType type, Context context = {})
    : BrightChainError("Whitened block error", to_string(type), std::move(context)), type_(type) {}

  WhitenedErrorType type() const { return type_; }

private:
  WhitenedErrorType type_;
};

// ---- CONSTITUENT BLOCK LIST ----
enum class CblErrorType {
  InvalidCBLAddressCount,
  AddressCountExceedsCapacity,
  InvalidTupleSize,
  InvalidStructure,
  InvalidHeaderLength,
  UnsupportedCblVersion,
  CreatorIdMismatch,
  CreatorRequired,
  CreatorPrivateKeyRequired,
  InvalidSignature,
  NotExtendedCbl,
  OriginalDataChecksumMismatch,
  FileSizeTooLarge
};

const char* to_string(CblErrorType type);

class CblError : public BrightChainError {
public:
  explicit CblError(CblErrorType type, Context context = {})
    : BrightChainError("CBL error", to_string(type), std::move(context)), type_(type) {}

  CblErrorType type() const { return type_; }

private:
  CblErrorType type_;
};

enum class ExtendedCblErrorType {
  FileNameRequired,
  FileNameTooLong,
  FileNameWhitespace,
  FileNameInvalidCharacter,
  FileNamePathTraversal,
  MimeTypeRequired,
  MimeTypeTooLong,
  MimeTypeWhitespace,
  MimeTypeLowercase,
  MimeTypeInvalidFormat
};

const char* to_string(ExtendedCblErrorType type);

class ExtendedCblError : public BrightChainError {
public:
  explicit ExtendedCblError(ExtendedCblErrorType type, Context context = {})
    : BrightChainError("Extended CBL error", to_string(type), std::move(context)), type_(type) {}

  ExtendedCblErrorType type() const { return type_; }

private:
  ExtendedCblErrorType type_;
};

// ---- TUPLES ----
enum class TupleErrorType {
  InvalidTupleSize,
  InvalidBlockCount,
  BlockSizeMismatch,
  MissingParameters,
  FetchFailed,
  XorLengthMismatch,
  InvalidBlockType,
  InvalidSourceLength
};

const char* to_string(TupleErrorType type);

class TupleError : public BrightChainError {
public:
  explicit TupleError(TupleErrorType type, Context context = {})
    : BrightChainError("Tuple error", to_string(type), std::move(context)), type_(type) {}

  TupleErrorType type() const { return type_; }

private:
  TupleErrorType type_;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_BLOCK_ERROR_HPP
