#include "crypto/ecies.hpp"
#include "crypto/byte_order.hpp"
#include "crypto/constants.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/openssl_util.hpp"
#include <array>
#include <cstring>
#include <set>
#include <boost/log/trivial.hpp>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/kdf.h>

namespace brightchain::crypto {

using namespace constants;

namespace {

const char ECIES_INFO[] = "brightchain-ecies-v1";
const char KEY_WRAP_INFO[] = "brightchain-ecies-key-wrap-v1";

using SymmetricKey = std::array<uint8_t, SYMMETRIC_KEY_SIZE>;

//==============================================
// KEY AGREEMENT
//==============================================

Bytes ecdh(EVP_PKEY* private_key, EVP_PKEY* peer_key) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(private_key, nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0
      || EVP_PKEY_derive_set_peer(ctx.get(), peer_key) <= 0) {
    throw EciesError(EciesErrorType::KeyOperationFailed,
                     {{"operation", "ecdh_init"}, {"openssl", openssl_error_string()}});
  }

  std::size_t length = 0;
  if (EVP_PKEY_derive(ctx.get(), nullptr, &length) <= 0) {
    throw EciesError(EciesErrorType::KeyOperationFailed,
                     {{"operation", "ecdh_length"}, {"openssl", openssl_error_string()}});
  }
  Bytes secret(length);
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &length) <= 0) {
    throw EciesError(EciesErrorType::KeyOperationFailed,
                     {{"operation", "ecdh_derive"}, {"openssl", openssl_error_string()}});
  }
  secret.resize(length);
  return secret;
}

// HKDF-Extract(salt, secret) then Expand with info
SymmetricKey hkdf_sha256(const Bytes& secret, const Bytes& salt, const char* info) {
  SymmetricKey key{};
  PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  std::size_t outlen = key.size();

  if (!pctx
      || EVP_PKEY_derive_init(pctx.get()) <= 0
      || EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0
      || EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0
      || EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), secret.data(), static_cast<int>(secret.size())) <= 0
      || EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), reinterpret_cast<const unsigned char*>(info),
                                     static_cast<int>(std::strlen(info))) <= 0
      || EVP_PKEY_derive(pctx.get(), key.data(), &outlen) <= 0
      || outlen != key.size()) {
    throw EciesError(EciesErrorType::KeyOperationFailed,
                     {{"operation", "hkdf"}, {"openssl", openssl_error_string()}});
  }
  return key;
}

//==============================================
// AES-256-GCM
//==============================================

void gcm_encrypt(const SymmetricKey& key, const uint8_t* iv, const Bytes& aad,
                 const uint8_t* plaintext, std::size_t length, uint8_t* ciphertext, uint8_t* tag) {
  CipherContext context;
  int outl = 0;
  int tmplen = 0;
  bool ok = EVP_EncryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
         && EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, IV_SIZE, nullptr) == 1
         && EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.data(), iv) == 1;
  if (ok && !aad.empty()) {
    ok = EVP_EncryptUpdate(context.get(), nullptr, &tmplen, aad.data(), static_cast<int>(aad.size())) == 1;
  }
  if (ok && length > 0) {
    ok = EVP_EncryptUpdate(context.get(), ciphertext, &outl, plaintext, static_cast<int>(length)) == 1;
  }
  ok = ok && EVP_EncryptFinal_ex(context.get(), ciphertext + outl, &tmplen) == 1
          && EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, AUTH_TAG_SIZE, tag) == 1;
  if (!ok) {
    BOOST_LOG_TRIVIAL(error) << "ECIES: AES-GCM encryption failed";
    throw EciesError(EciesErrorType::EncryptionFailed, {{"openssl", openssl_error_string()}});
  }
}

bool gcm_decrypt(const SymmetricKey& key, const uint8_t* iv, const Bytes& aad,
                 const uint8_t* ciphertext, std::size_t length, const uint8_t* tag, uint8_t* plaintext) {
  CipherContext context;
  int outl = 0;
  int tmplen = 0;
  bool ok = EVP_DecryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
         && EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, IV_SIZE, nullptr) == 1
         && EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), iv) == 1;
  if (ok && !aad.empty()) {
    ok = EVP_DecryptUpdate(context.get(), nullptr, &tmplen, aad.data(), static_cast<int>(aad.size())) == 1;
  }
  if (ok && length > 0) {
    ok = EVP_DecryptUpdate(context.get(), plaintext, &outl, ciphertext, static_cast<int>(length)) == 1;
  }
  ok = ok && EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, AUTH_TAG_SIZE,
                                 const_cast<uint8_t*>(tag)) == 1
          && EVP_DecryptFinal_ex(context.get(), plaintext + outl, &tmplen) == 1;
  if (!ok) {
    ERR_clear_error();
  }
  return ok;
}

std::size_t write_preamble(uint8_t* out, const Bytes& ephemeral_public_key, const Bytes& iv) {
  std::size_t offset = 0;
  out[offset++] = ENCRYPTION_VERSION;
  out[offset++] = CIPHER_SUITE;
  out[offset++] = FORMAT_TAG_WITH_LENGTH;
  std::memcpy(out + offset, ephemeral_public_key.data(), PUBLIC_KEY_LENGTH);
  offset += PUBLIC_KEY_LENGTH;
  std::memcpy(out + offset, iv.data(), IV_SIZE);
  offset += IV_SIZE;
  // Tag is filled in after encryption
  offset += AUTH_TAG_SIZE;
  return offset;
}

void require_private_key(const Member& recipient) {
  if (!recipient.has_private_key()) {
    BOOST_LOG_TRIVIAL(error) << "ECIES: Recipient " << recipient.id_string() << " has no private key";
    throw EciesError(EciesErrorType::EncryptionRecipientHasNoPrivateKey,
                     {{"recipient", recipient.id_string()}});
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND OVERHEAD
//==============================================

EciesService::EciesService() {
  BOOST_LOG_TRIVIAL(debug) << "ECIES: Service ready, single recipient overhead " << single_overhead();
}

std::size_t EciesService::single_overhead() {
  return SINGLE_RECIPIENT_OVERHEAD;
}

std::size_t EciesService::multi_overhead(std::size_t recipient_count) {
  return MULTI_RECIPIENT_FIXED_OVERHEAD + recipient_count * RECIPIENT_ENTRY_SIZE;
}

//==============================================
// SINGLE RECIPIENT
//==============================================

Bytes EciesService::encrypt_single(const Member& recipient, const uint8_t* plaintext,
                                   std::size_t length) const {
  BOOST_LOG_TRIVIAL(debug) << "ECIES: Encrypting " << length << " bytes for " << recipient.id_string();

  PkeyPtr ephemeral = generate_ec_key();
  Bytes ephemeral_public = compressed_public_key(ephemeral.get());
  SymmetricKey key = hkdf_sha256(ecdh(ephemeral.get(), recipient.key()), ephemeral_public, ECIES_INFO);
  Bytes iv = random_bytes(IV_SIZE);

  Bytes out(SINGLE_RECIPIENT_OVERHEAD + length);
  std::size_t offset = 0;
  out[offset++] = static_cast<uint8_t>(EncryptionType::SingleRecipient);
  Bytes id = recipient.id_bytes();
  std::memcpy(out.data() + offset, id.data(), ID_SIZE);
  offset += ID_SIZE;
  offset += write_preamble(out.data() + offset, ephemeral_public, iv);
  ByteOrder::write_big_endian<uint64_t>(out.data() + offset, static_cast<uint64_t>(length));
  offset += DATA_LENGTH_SIZE;

  std::size_t tag_offset = layout::single_tag_offset();
  Bytes aad = additional_data(out.data(), offset, tag_offset);
  gcm_encrypt(key, iv.data(), aad, plaintext, length, out.data() + offset, out.data() + tag_offset);
  return out;
}

Bytes EciesService::encrypt_single(const Member& recipient, const Bytes& plaintext) const {
  return encrypt_single(recipient, plaintext.data(), plaintext.size());
}

Bytes EciesService::decrypt_single(const Member& recipient, const uint8_t* data, std::size_t length) const {
  require_private_key(recipient);
  SingleHeader header = parse_single_header(data, length);

  if (header.recipient_id != recipient.id_bytes()) {
    BOOST_LOG_TRIVIAL(error) << "ECIES: Block is not addressed to " << recipient.id_string();
    throw EciesError(EciesErrorType::EncryptionRecipientNotFoundInRecipients,
                     {{"recipient", recipient.id_string()}, {"header_recipient", to_hex(header.recipient_id)}});
  }

  PkeyPtr ephemeral = import_public_key(header.ephemeral_public_key.data(), header.ephemeral_public_key.size());
  SymmetricKey key = hkdf_sha256(ecdh(recipient.key(), ephemeral.get()), header.ephemeral_public_key, ECIES_INFO);
  Bytes aad = additional_data(data, header.header_size, layout::single_tag_offset());

  Bytes plaintext(header.data_length);
  if (!gcm_decrypt(key, header.iv.data(), aad, data + header.header_size,
                   static_cast<std::size_t>(header.data_length), header.auth_tag.data(), plaintext.data())) {
    BOOST_LOG_TRIVIAL(error) << "ECIES: Authentication failed for single recipient payload";
    throw EciesError(EciesErrorType::DecryptionFailed, {{"recipient", recipient.id_string()}});
  }
  BOOST_LOG_TRIVIAL(debug) << "ECIES: Decrypted " << plaintext.size() << " bytes";
  return plaintext;
}

//==============================================
// MULTI RECIPIENT
//==============================================

Bytes EciesService::encrypt_multiple(const std::vector<std::shared_ptr<const Member>>& recipients,
                                     const uint8_t* plaintext, std::size_t length) const {
  if (recipients.size() < 2 || recipients.size() > MAX_RECIPIENTS) {
    throw EciesError(EciesErrorType::InvalidRecipientCount,
                     {{"recipient_count", std::to_string(recipients.size())}});
  }
  std::set<Bytes> seen;
  for (const auto& recipient : recipients) {
    if (!recipient || !seen.insert(recipient->id_bytes()).second) {
      throw EciesError(EciesErrorType::InvalidRecipientIds,
                       {{"recipient", recipient ? recipient->id_string() : "null"}});
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "ECIES: Encrypting " << length << " bytes for "
                           << recipients.size() << " recipients";

  PkeyPtr ephemeral = generate_ec_key();
  Bytes ephemeral_public = compressed_public_key(ephemeral.get());
  SymmetricKey content_key;
  fill_random(content_key.data(), content_key.size());
  Bytes iv = random_bytes(IV_SIZE);

  std::size_t header_size = multi_overhead(recipients.size());
  Bytes out(header_size + length);
  std::size_t offset = 0;
  out[offset++] = static_cast<uint8_t>(EncryptionType::MultiRecipient);
  offset += write_preamble(out.data() + offset, ephemeral_public, iv);
  ByteOrder::write_big_endian<uint64_t>(out.data() + offset, static_cast<uint64_t>(length));
  offset += DATA_LENGTH_SIZE;
  ByteOrder::write_big_endian<uint16_t>(out.data() + offset, static_cast<uint16_t>(recipients.size()));
  offset += RECIPIENT_COUNT_SIZE;

  for (const auto& recipient : recipients) {
    Bytes id = recipient->id_bytes();
    Bytes salt = ephemeral_public;
    salt.insert(salt.end(), id.begin(), id.end());
    SymmetricKey wrap_key = hkdf_sha256(ecdh(ephemeral.get(), recipient->key()), salt, KEY_WRAP_INFO);

    uint8_t* entry = out.data() + offset;
    std::memcpy(entry, id.data(), ID_SIZE);
    uint8_t* key_iv = entry + ID_SIZE;
    uint8_t* key_tag = key_iv + IV_SIZE;
    uint8_t* wrapped = key_tag + AUTH_TAG_SIZE;
    fill_random(key_iv, IV_SIZE);
    gcm_encrypt(wrap_key, key_iv, id, content_key.data(), content_key.size(), wrapped, key_tag);
    offset += RECIPIENT_ENTRY_SIZE;
  }

  std::size_t tag_offset = layout::multi_tag_offset();
  Bytes aad = additional_data(out.data(), header_size, tag_offset);
  gcm_encrypt(content_key, iv.data(), aad, plaintext, length, out.data() + header_size,
              out.data() + tag_offset);
  OPENSSL_cleanse(content_key.data(), content_key.size());
  return out;
}

Bytes EciesService::decrypt_multiple(const Member& recipient, const uint8_t* data, std::size_t length) const {
  require_private_key(recipient);
  MultiHeader header = parse_multi_header(data, length);

  Bytes id = recipient.id_bytes();
  std::size_t index = header.recipient_ids.size();
  for (std::size_t i = 0; i < header.recipient_ids.size(); ++i) {
    if (header.recipient_ids[i] == id) {
      index = i;
      break;
    }
  }
  if (index == header.recipient_ids.size()) {
    BOOST_LOG_TRIVIAL(error) << "ECIES: " << recipient.id_string() << " is not among "
                             << header.recipient_count << " recipients";
    throw EciesError(EciesErrorType::EncryptionRecipientNotFoundInRecipients,
                     {{"recipient", recipient.id_string()},
                      {"recipient_count", std::to_string(header.recipient_count)}});
  }

  PkeyPtr ephemeral = import_public_key(header.ephemeral_public_key.data(), header.ephemeral_public_key.size());
  Bytes salt = header.ephemeral_public_key;
  salt.insert(salt.end(), id.begin(), id.end());
  SymmetricKey wrap_key = hkdf_sha256(ecdh(recipient.key(), ephemeral.get()), salt, KEY_WRAP_INFO);

  const Bytes& entry = header.recipient_keys[index];
  const uint8_t* key_iv = entry.data();
  const uint8_t* key_tag = key_iv + IV_SIZE;
  const uint8_t* wrapped = key_tag + AUTH_TAG_SIZE;
  SymmetricKey content_key;
  if (!gcm_decrypt(wrap_key, key_iv, id, wrapped, WRAPPED_KEY_SIZE, key_tag, content_key.data())) {
    BOOST_LOG_TRIVIAL(error) << "ECIES: Failed to unwrap content key for " << recipient.id_string();
    throw EciesError(EciesErrorType::DecryptionFailed, {{"recipient", recipient.id_string()},
                                                        {"stage", "key_unwrap"}});
  }

  Bytes aad = additional_data(data, header.header_size, layout::multi_tag_offset());
  Bytes plaintext(header.data_length);
  bool ok = gcm_decrypt(content_key, header.iv.data(), aad, data + header.header_size,
                        static_cast<std::size_t>(header.data_length), header.auth_tag.data(), plaintext.data());
  OPENSSL_cleanse(content_key.data(), content_key.size());
  if (!ok) {
    BOOST_LOG_TRIVIAL(error) << "ECIES: Authentication failed for multi recipient payload";
    throw EciesError(EciesErrorType::DecryptionFailed, {{"recipient", recipient.id_string()},
                                                        {"stage", "content"}});
  }
  return plaintext;
}

//==============================================
// SIGNATURES
//==============================================

Bytes EciesService::sign_message(const Member& signer, const Bytes& message) const {
  if (!signer.has_private_key()) {
    throw EciesError(EciesErrorType::SignatureFailed, {{"signer", signer.id_string()},
                                                       {"reason", "no private key"}});
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  std::size_t der_length = 0;
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, signer.key()) != 1
      || EVP_DigestSign(ctx.get(), nullptr, &der_length, message.data(), message.size()) != 1) {
    throw EciesError(EciesErrorType::SignatureFailed, {{"openssl", openssl_error_string()}});
  }
  Bytes der(der_length);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_length, message.data(), message.size()) != 1) {
    throw EciesError(EciesErrorType::SignatureFailed, {{"openssl", openssl_error_string()}});
  }

  // DER to compact r || s
  const unsigned char* cursor = der.data();
  ECDSA_SIG* sig = d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_length));
  if (!sig) {
    throw EciesError(EciesErrorType::SignatureFailed, {{"openssl", openssl_error_string()}});
  }
  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig, &r, &s);
  Bytes compact(SIGNATURE_LENGTH);
  bool ok = BN_bn2binpad(r, compact.data(), 32) == 32
         && BN_bn2binpad(s, compact.data() + 32, 32) == 32;
  ECDSA_SIG_free(sig);
  if (!ok) {
    throw EciesError(EciesErrorType::SignatureFailed, {{"reason", "signature component too large"}});
  }
  return compact;
}

bool EciesService::verify_message(const Member& signer, const Bytes& message, const Bytes& signature) const {
  if (signature.size() != SIGNATURE_LENGTH) {
    BOOST_LOG_TRIVIAL(debug) << "ECIES: Signature has length " << signature.size();
    return false;
  }

  ECDSA_SIG* sig = ECDSA_SIG_new();
  BIGNUM* r = BN_bin2bn(signature.data(), 32, nullptr);
  BIGNUM* s = BN_bin2bn(signature.data() + 32, 32, nullptr);
  if (!sig || !r || !s || ECDSA_SIG_set0(sig, r, s) != 1) {
    BN_free(r);
    BN_free(s);
    ECDSA_SIG_free(sig);
    throw EciesError(EciesErrorType::SignatureFailed, {{"openssl", openssl_error_string()}});
  }

  unsigned char* der = nullptr;
  int der_length = i2d_ECDSA_SIG(sig, &der);
  ECDSA_SIG_free(sig);
  if (der_length <= 0) {
    throw EciesError(EciesErrorType::SignatureFailed, {{"openssl", openssl_error_string()}});
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  bool verified = ctx
    && EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, signer.key()) == 1
    && EVP_DigestVerify(ctx.get(), der, static_cast<std::size_t>(der_length),
                        message.data(), message.size()) == 1;
  OPENSSL_free(der);
  if (!verified) {
    ERR_clear_error();
  }
  return verified;
}

} // namespace brightchain::crypto
