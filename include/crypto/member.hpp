#ifndef BRIGHTCHAIN_MEMBER_HPP
#define BRIGHTCHAIN_MEMBER_HPP

#include <memory>
#include <string>
#include <boost/uuid/uuid.hpp>
#include "common/bytes.hpp"
#include "crypto/openssl_util.hpp"

namespace brightchain::crypto {

// Identity of a block creator or recipient: a UUID plus a secp256k1 key pair.
// Members created from a public key alone can verify and be encrypted to but
// cannot sign or decrypt.
class Member {
public:
  // ---- FACTORIES ----
  static std::shared_ptr<Member> generate(const std::string& name);
  // Throws EciesError(InvalidPublicKey) for anything but a compressed secp256k1 point
  static std::shared_ptr<Member> from_public_key(const boost::uuids::uuid& id,
                                                 const std::string& name,
                                                 const Bytes& public_key);
  // Throws CryptoError if bytes is not ID_SIZE long
  static boost::uuids::uuid id_from_bytes(const uint8_t* bytes, std::size_t length);

  Member(const Member&) = delete;
  Member& operator=(const Member&) = delete;


  // ---- ACCESSORS ----
  const boost::uuids::uuid& id() const { return id_; }
  Bytes id_bytes() const;
  std::string id_string() const;
  const std::string& name() const { return name_; }
  bool has_private_key() const { return has_private_key_; }
  // 33-byte compressed point
  const Bytes& public_key() const { return public_key_; }
  EVP_PKEY* key() const { return key_.get(); }

  // Copy of this identity without private key material
  std::shared_ptr<Member> public_only() const;

private:
  Member(const boost::uuids::uuid& id, std::string name, PkeyPtr key, Bytes public_key,
         bool has_private_key);

  boost::uuids::uuid id_;
  std::string name_;
  PkeyPtr key_;
  Bytes public_key_;
  bool has_private_key_;
};

// ---- KEY HELPERS SHARED WITH ECIES ----
// Fresh secp256k1 key pair with compressed point encoding
PkeyPtr generate_ec_key();
// Compressed encoding of the public point of key
Bytes compressed_public_key(EVP_PKEY* key);
// Imports a compressed public point as a public-only key
PkeyPtr import_public_key(const uint8_t* data, std::size_t length);

} // namespace brightchain::crypto

#endif // BRIGHTCHAIN_MEMBER_HPP
