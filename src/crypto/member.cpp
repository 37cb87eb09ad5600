#include "crypto/member.hpp"
#include "crypto/constants.hpp"
#include "crypto/crypto_error.hpp"
#include <cstring>
#include <boost/log/trivial.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <openssl/core_names.h>
#include <openssl/param_build.h>

namespace brightchain::crypto {

namespace {

struct ParamBldDeleter {
  void operator()(OSSL_PARAM_BLD* bld) const { OSSL_PARAM_BLD_free(bld); }
};
struct ParamDeleter {
  void operator()(OSSL_PARAM* params) const { OSSL_PARAM_free(params); }
};

[[noreturn]] void throw_key_error(const std::string& operation) {
  BOOST_LOG_TRIVIAL(error) << "Member: Key operation failed: " << operation;
  throw EciesError(EciesErrorType::KeyOperationFailed,
                   {{"operation", operation}, {"openssl", openssl_error_string()}});
}

char COMPRESSED_FORMAT[] = "compressed";
char CURVE[] = "secp256k1";

} // namespace

//==============================================
// KEY HELPERS
//==============================================

PkeyPtr generate_ec_key() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
    throw_key_error("keygen_init");
  }

  OSSL_PARAM params[] = {
    OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, CURVE, 0),
    OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT, COMPRESSED_FORMAT, 0),
    OSSL_PARAM_construct_end()
  };
  if (EVP_PKEY_CTX_set_params(ctx.get(), params) <= 0) {
    throw_key_error("keygen_set_params");
  }

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_generate(ctx.get(), &raw) <= 0) {
    throw_key_error("generate");
  }
  return PkeyPtr(raw);
}

Bytes compressed_public_key(EVP_PKEY* key) {
  // Room for an uncompressed point in case the key ignores the conversion format
  Bytes encoded(1 + 2 * 32);
  std::size_t length = 0;
  if (EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_PUB_KEY, encoded.data(),
                                      encoded.size(), &length) != 1) {
    throw_key_error("get_public_key");
  }

  if (length == encoded.size() && encoded[0] == 0x04) {
    Bytes compressed(constants::PUBLIC_KEY_LENGTH);
    compressed[0] = (encoded[64] & 1) ? 0x03 : 0x02;
    std::memcpy(compressed.data() + 1, encoded.data() + 1, 32);
    return compressed;
  }
  if (length != constants::PUBLIC_KEY_LENGTH) {
    throw EciesError(EciesErrorType::InvalidPublicKey,
                     {{"expected", std::to_string(constants::PUBLIC_KEY_LENGTH)},
                      {"actual", std::to_string(length)}});
  }
  encoded.resize(length);
  return encoded;
}

PkeyPtr import_public_key(const uint8_t* data, std::size_t length) {
  // Only compressed points are accepted: 0x02 or 0x03 prefix
  if (length != constants::PUBLIC_KEY_LENGTH || (data[0] != 0x02 && data[0] != 0x03)) {
    throw EciesError(EciesErrorType::InvalidPublicKey, {{"length", std::to_string(length)}});
  }

  std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter> bld(OSSL_PARAM_BLD_new());
  if (!bld
      || OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, CURVE, 0) != 1
      || OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
                                         COMPRESSED_FORMAT, 0) != 1
      || OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, data, length) != 1) {
    throw_key_error("param_build");
  }
  std::unique_ptr<OSSL_PARAM, ParamDeleter> params(OSSL_PARAM_BLD_to_param(bld.get()));
  if (!params) {
    throw_key_error("param_build");
  }

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
    throw_key_error("fromdata_init");
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.get()) <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Member: Rejected public key point";
    throw EciesError(EciesErrorType::InvalidPublicKey, {{"openssl", openssl_error_string()}});
  }
  return PkeyPtr(raw);
}

//==============================================
// MEMBER
//==============================================

Member::Member(const boost::uuids::uuid& id, std::string name, PkeyPtr key, Bytes public_key,
               bool has_private_key)
  : id_(id)
  , name_(std::move(name))
  , key_(std::move(key))
  , public_key_(std::move(public_key))
  , has_private_key_(has_private_key) {}

std::shared_ptr<Member> Member::generate(const std::string& name) {
  boost::uuids::random_generator uuid_generator;
  boost::uuids::uuid id = uuid_generator();
  PkeyPtr key = generate_ec_key();
  Bytes public_key = compressed_public_key(key.get());
  BOOST_LOG_TRIVIAL(debug) << "Member: Generated identity " << id << " for " << name;
  return std::shared_ptr<Member>(new Member(id, name, std::move(key), std::move(public_key), true));
}

std::shared_ptr<Member> Member::from_public_key(const boost::uuids::uuid& id,
                                                const std::string& name,
                                                const Bytes& public_key) {
  PkeyPtr key = import_public_key(public_key.data(), public_key.size());
  return std::shared_ptr<Member>(new Member(id, name, std::move(key), public_key, false));
}

boost::uuids::uuid Member::id_from_bytes(const uint8_t* bytes, std::size_t length) {
  if (length != constants::ID_SIZE) {
    throw CryptoError("Invalid member id length", {{"expected", std::to_string(constants::ID_SIZE)},
                                                  {"actual", std::to_string(length)}});
  }
  boost::uuids::uuid id;
  std::memcpy(id.data, bytes, constants::ID_SIZE);
  return id;
}

Bytes Member::id_bytes() const {
  return Bytes(id_.begin(), id_.end());
}

std::string Member::id_string() const {
  return boost::uuids::to_string(id_);
}

std::shared_ptr<Member> Member::public_only() const {
  return from_public_key(id_, name_, public_key_);
}

} // namespace brightchain::crypto
