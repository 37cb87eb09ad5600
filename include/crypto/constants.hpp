#ifndef BRIGHTCHAIN_CRYPTO_CONSTANTS_HPP
#define BRIGHTCHAIN_CRYPTO_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace brightchain::crypto::constants {

// ---- CHECKSUM ----
inline constexpr std::size_t CHECKSUM_LENGTH = 64;   // SHA3-512

// ---- IDENTITY ----
inline constexpr std::size_t ID_SIZE = 16;           // UUID bytes
inline constexpr std::size_t PUBLIC_KEY_LENGTH = 33; // compressed secp256k1 point
inline constexpr std::size_t SIGNATURE_LENGTH = 64;  // compact r || s
inline constexpr const char* CURVE_NAME = "secp256k1";

// ---- SYMMETRIC ----
inline constexpr std::size_t SYMMETRIC_KEY_SIZE = 32; // AES-256
inline constexpr std::size_t IV_SIZE = 12;            // GCM nonce
inline constexpr std::size_t AUTH_TAG_SIZE = 16;      // GCM tag
inline constexpr std::size_t DATA_LENGTH_SIZE = 8;

// ---- ENCRYPTION HEADER ----
inline constexpr std::size_t ENCRYPTION_TYPE_SIZE = 1;
inline constexpr std::size_t RECIPIENT_COUNT_SIZE = 2;
inline constexpr uint8_t ENCRYPTION_VERSION = 1;
inline constexpr uint8_t CIPHER_SUITE = 1;             // secp256k1 ECDH, HKDF-SHA256, AES-256-GCM
inline constexpr uint8_t FORMAT_TAG_WITH_LENGTH = 1;

// Version, suite, format tag, ephemeral key, IV, tag, plaintext length
inline constexpr std::size_t ECIES_FIXED_OVERHEAD =
    3 + PUBLIC_KEY_LENGTH + IV_SIZE + AUTH_TAG_SIZE + DATA_LENGTH_SIZE;
static_assert(ECIES_FIXED_OVERHEAD == 72, "ECIES fixed overhead layout changed");

// EncType + RecipientID + fixed overhead
inline constexpr std::size_t SINGLE_RECIPIENT_OVERHEAD =
    ENCRYPTION_TYPE_SIZE + ID_SIZE + ECIES_FIXED_OVERHEAD;

// EncType + fixed overhead + RecipientCount. The fixed overhead includes the
// FormatTag byte after CipherSuite, so the multi-recipient header is 75 bytes
// before its recipient table rather than the 74 a bare field list adds up to.
inline constexpr std::size_t MULTI_RECIPIENT_FIXED_OVERHEAD =
    ENCRYPTION_TYPE_SIZE + ECIES_FIXED_OVERHEAD + RECIPIENT_COUNT_SIZE;
static_assert(MULTI_RECIPIENT_FIXED_OVERHEAD == 75, "Multi-recipient header layout changed");

inline constexpr std::size_t WRAPPED_KEY_SIZE = SYMMETRIC_KEY_SIZE;
// KeyIV + KeyAuthTag + WrappedKey
inline constexpr std::size_t RECIPIENT_ENTRY_KEY_SIZE = IV_SIZE + AUTH_TAG_SIZE + WRAPPED_KEY_SIZE;
inline constexpr std::size_t RECIPIENT_ENTRY_SIZE = ID_SIZE + RECIPIENT_ENTRY_KEY_SIZE;
inline constexpr std::size_t MAX_RECIPIENTS = 65535;

// ---- TUPLES ----
inline constexpr std::size_t TUPLE_SIZE = 3;
inline constexpr std::size_t MIN_TUPLE_SIZE = 2;
inline constexpr std::size_t MAX_TUPLE_SIZE = 15;

// ---- CBL ----
inline constexpr uint8_t CBL_FORMAT_VERSION = 1;
inline constexpr std::size_t CBL_MAX_FILE_NAME_LENGTH = 255;
inline constexpr std::size_t CBL_MAX_MIME_TYPE_LENGTH = 127;
inline constexpr uint64_t CBL_MAX_INPUT_FILE_SIZE = 9007199254740991ULL; // 2^53 - 1

// ---- STREAMING ----
inline constexpr std::size_t STREAM_BUFFER_SIZE = 8192;

} // namespace brightchain::crypto::constants

#endif // BRIGHTCHAIN_CRYPTO_CONSTANTS_HPP
