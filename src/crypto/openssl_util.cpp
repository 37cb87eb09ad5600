#include "crypto/openssl_util.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <climits>
#include <boost/log/trivial.hpp>

namespace brightchain::crypto {

//==============================================
// CIPHER CONTEXT
//==============================================

CipherContext::CipherContext() {
  ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    throw CryptoError("Failed to create cipher context");
  }
}

CipherContext::~CipherContext() {
  if (ctx) {
    EVP_CIPHER_CTX_free(ctx);
  }
}

//==============================================
// HELPERS
//==============================================

std::string openssl_error_string() {
  std::string result;
  unsigned long code = 0;
  char buffer[256];
  while ((code = ERR_get_error()) != 0) {
    ERR_error_string_n(code, buffer, sizeof(buffer));
    if (!result.empty()) {
      result += "; ";
    }
    result += buffer;
  }
  return result.empty() ? "no OpenSSL error queued" : result;
}

void fill_random(uint8_t* out, std::size_t length) {
  // RAND_bytes takes an int length
  while (length > 0) {
    int chunk = length > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(length);
    if (RAND_bytes(out, chunk) != 1) {
      BOOST_LOG_TRIVIAL(error) << "Crypto: RAND_bytes failed for " << chunk << " bytes";
      throw CryptoError("Random generation failed", {{"openssl", openssl_error_string()}});
    }
    out += chunk;
    length -= static_cast<std::size_t>(chunk);
  }
}

Bytes random_bytes(std::size_t length) {
  Bytes result(length);
  if (length > 0) {
    fill_random(result.data(), length);
  }
  return result;
}

} // namespace brightchain::crypto
