#ifndef BRIGHTCHAIN_OPENSSL_UTIL_HPP
#define BRIGHTCHAIN_OPENSSL_UTIL_HPP

#include <memory>
#include <string>
#include <openssl/evp.h>
#include "common/bytes.hpp"

namespace brightchain::crypto {

// ---- RAII OWNERSHIP OF OPENSSL HANDLES ----
struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Cipher context owned for the duration of one GCM operation
struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext();
  ~CipherContext();
  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

// ---- HELPERS ----
// Drains the OpenSSL error queue into a readable string
std::string openssl_error_string();

// Cryptographically secure random bytes; throws CryptoError if the RNG fails
Bytes random_bytes(std::size_t length);
void fill_random(uint8_t* out, std::size_t length);

} // namespace brightchain::crypto

#endif // BRIGHTCHAIN_OPENSSL_UTIL_HPP
