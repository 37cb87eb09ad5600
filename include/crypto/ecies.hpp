#ifndef BRIGHTCHAIN_ECIES_HPP
#define BRIGHTCHAIN_ECIES_HPP

#include <memory>
#include <vector>
#include "common/bytes.hpp"
#include "crypto/encryption_header.hpp"
#include "crypto/member.hpp"

namespace brightchain::crypto {

// secp256k1 ECDH + HKDF-SHA256 + AES-256-GCM, single and multi recipient,
// plus compact ECDSA signatures for CBL authentication.
class EciesService {
public:
  EciesService();

  // ---- OVERHEAD ----
  static std::size_t single_overhead();
  static std::size_t multi_overhead(std::size_t recipient_count);


  // ---- SINGLE RECIPIENT ----
  // Output is the complete header followed by the ciphertext
  Bytes encrypt_single(const Member& recipient, const uint8_t* plaintext, std::size_t length) const;
  Bytes encrypt_single(const Member& recipient, const Bytes& plaintext) const;
  // data may carry trailing padding after the ciphertext
  Bytes decrypt_single(const Member& recipient, const uint8_t* data, std::size_t length) const;


  // ---- MULTI RECIPIENT ----
  Bytes encrypt_multiple(const std::vector<std::shared_ptr<const Member>>& recipients,
                         const uint8_t* plaintext, std::size_t length) const;
  Bytes decrypt_multiple(const Member& recipient, const uint8_t* data, std::size_t length) const;


  // ---- SIGNATURES ----
  // Compact 64-byte r || s over SHA-256(message)
  Bytes sign_message(const Member& signer, const Bytes& message) const;
  // False for a bad signature; throws only for malformed keys
  bool verify_message(const Member& signer, const Bytes& message, const Bytes& signature) const;
};

} // namespace brightchain::crypto

#endif // BRIGHTCHAIN_ECIES_HPP
