#include "crypto/encryption_header.hpp"
#include "crypto/byte_order.hpp"
#include "crypto/constants.hpp"
#include "crypto/crypto_error.hpp"
#include <set>
#include <boost/log/trivial.hpp>

namespace brightchain::crypto {

using namespace constants;

const char* to_string(EncryptionType type) {
  switch (type) {
    case EncryptionType::None:            return "None";
    case EncryptionType::SingleRecipient: return "SingleRecipient";
    case EncryptionType::MultiRecipient:  return "MultiRecipient";
    default:                              return "Unknown";
  }
}

namespace layout {

std::size_t single_tag_offset() {
  return ENCRYPTION_TYPE_SIZE + ID_SIZE + 3 + PUBLIC_KEY_LENGTH + IV_SIZE;
}

std::size_t multi_tag_offset() {
  return ENCRYPTION_TYPE_SIZE + 3 + PUBLIC_KEY_LENGTH + IV_SIZE;
}

} // namespace layout

namespace {

// Sequential reader over a header; every read is bounds checked
class HeaderReader {
public:
  HeaderReader(const uint8_t* data, std::size_t length) : data_(data), length_(length) {}

  void require(std::size_t count, EciesErrorType error) const {
    if (offset_ + count > length_) {
      BOOST_LOG_TRIVIAL(error) << "Encryption header: Truncated at offset " << offset_
                               << " needing " << count << " of " << length_ << " bytes";
      throw EciesError(error, {{"offset", std::to_string(offset_)},
                               {"needed", std::to_string(count)},
                               {"available", std::to_string(length_)}});
    }
  }

  uint8_t byte() {
    require(1, EciesErrorType::InvalidEncryptionHeaderLength);
    return data_[offset_++];
  }

  Bytes bytes(std::size_t count, EciesErrorType error) {
    require(count, error);
    Bytes result(data_ + offset_, data_ + offset_ + count);
    offset_ += count;
    return result;
  }

  template<typename T>
  T integer() {
    require(sizeof(T), EciesErrorType::InvalidEncryptionHeaderLength);
    T value = ByteOrder::read_big_endian<T>(data_ + offset_);
    offset_ += sizeof(T);
    return value;
  }

  std::size_t offset() const { return offset_; }

private:
  const uint8_t* data_;
  std::size_t length_;
  std::size_t offset_ = 0;
};

void check_preamble(uint8_t version, uint8_t cipher_suite, uint8_t format_tag) {
  if (version != ENCRYPTION_VERSION) {
    throw EciesError(EciesErrorType::InvalidVersion, {{"version", std::to_string(version)}});
  }
  if (cipher_suite != CIPHER_SUITE) {
    throw EciesError(EciesErrorType::InvalidCipherSuite, {{"cipher_suite", std::to_string(cipher_suite)}});
  }
  if (format_tag != FORMAT_TAG_WITH_LENGTH) {
    throw EciesError(EciesErrorType::InvalidFormatTag, {{"format_tag", std::to_string(format_tag)}});
  }
}

} // namespace

EncryptionType read_encryption_type(const uint8_t* data, std::size_t length) {
  if (length < ENCRYPTION_TYPE_SIZE) {
    throw EciesError(EciesErrorType::InvalidEncryptionHeaderLength, {{"length", std::to_string(length)}});
  }
  uint8_t value = data[0];
  if (value != static_cast<uint8_t>(EncryptionType::SingleRecipient)
      && value != static_cast<uint8_t>(EncryptionType::MultiRecipient)) {
    throw EciesError(EciesErrorType::InvalidEncryptionType, {{"value", std::to_string(value)}});
  }
  return static_cast<EncryptionType>(value);
}

//==============================================
// SINGLE RECIPIENT
//==============================================

SingleHeader parse_single_header(const uint8_t* data, std::size_t length) {
  if (read_encryption_type(data, length) != EncryptionType::SingleRecipient) {
    throw EciesError(EciesErrorType::InvalidEncryptionType, {{"expected", "SingleRecipient"}});
  }
  if (length < SINGLE_RECIPIENT_OVERHEAD) {
    throw EciesError(EciesErrorType::InvalidEncryptionHeaderLength,
                     {{"expected", std::to_string(SINGLE_RECIPIENT_OVERHEAD)},
                      {"actual", std::to_string(length)}});
  }

  HeaderReader reader(data, length);
  reader.byte();

  SingleHeader header;
  header.recipient_id = reader.bytes(ID_SIZE, EciesErrorType::InvalidRecipientIds);
  header.version = reader.byte();
  header.cipher_suite = reader.byte();
  header.format_tag = reader.byte();
  check_preamble(header.version, header.cipher_suite, header.format_tag);
  header.ephemeral_public_key = reader.bytes(PUBLIC_KEY_LENGTH, EciesErrorType::InvalidEphemeralPublicKeyLength);
  header.iv = reader.bytes(IV_SIZE, EciesErrorType::InvalidIVLength);
  header.auth_tag = reader.bytes(AUTH_TAG_SIZE, EciesErrorType::InvalidAuthTagLength);
  header.data_length = reader.integer<uint64_t>();
  header.header_size = reader.offset();

  if (header.data_length > length - header.header_size) {
    throw EciesError(EciesErrorType::InvalidDataLength,
                     {{"data_length", std::to_string(header.data_length)},
                      {"available", std::to_string(length - header.header_size)}});
  }
  return header;
}

//==============================================
// MULTI RECIPIENT
//==============================================

MultiHeader parse_multi_header(const uint8_t* data, std::size_t length) {
  if (read_encryption_type(data, length) != EncryptionType::MultiRecipient) {
    throw EciesError(EciesErrorType::InvalidEncryptionType, {{"expected", "MultiRecipient"}});
  }
  if (length < MULTI_RECIPIENT_FIXED_OVERHEAD) {
    throw EciesError(EciesErrorType::InvalidEncryptionHeaderLength,
                     {{"expected", std::to_string(MULTI_RECIPIENT_FIXED_OVERHEAD)},
                      {"actual", std::to_string(length)}});
  }

  HeaderReader reader(data, length);
  reader.byte();

  MultiHeader header;
  header.version = reader.byte();
  header.cipher_suite = reader.byte();
  // Same FormatTag byte as the single-recipient header
  header.format_tag = reader.byte();
  check_preamble(header.version, header.cipher_suite, header.format_tag);
  header.ephemeral_public_key = reader.bytes(PUBLIC_KEY_LENGTH, EciesErrorType::InvalidEphemeralPublicKeyLength);
  header.iv = reader.bytes(IV_SIZE, EciesErrorType::InvalidIVLength);
  header.auth_tag = reader.bytes(AUTH_TAG_SIZE, EciesErrorType::InvalidAuthTagLength);
  header.data_length = reader.integer<uint64_t>();
  header.recipient_count = reader.integer<uint16_t>();

  if (header.recipient_count < 2) {
    throw EciesError(EciesErrorType::InvalidRecipientCount,
                     {{"recipient_count", std::to_string(header.recipient_count)}});
  }
  reader.require(static_cast<std::size_t>(header.recipient_count) * RECIPIENT_ENTRY_SIZE,
                 EciesErrorType::InvalidEncryptionHeaderLength);

  for (uint16_t i = 0; i < header.recipient_count; ++i) {
    header.recipient_ids.push_back(reader.bytes(ID_SIZE, EciesErrorType::InvalidRecipientIds));
    header.recipient_keys.push_back(reader.bytes(RECIPIENT_ENTRY_KEY_SIZE, EciesErrorType::InvalidRecipientKeys));
  }
  header.header_size = reader.offset();

  if (header.data_length > length - header.header_size) {
    throw EciesError(EciesErrorType::InvalidDataLength,
                     {{"data_length", std::to_string(header.data_length)},
                      {"available", std::to_string(length - header.header_size)}});
  }

  validate_multi_header(header);
  return header;
}

void validate_multi_header(const MultiHeader& header) {
  if (header.recipient_count < 2) {
    throw EciesError(EciesErrorType::InvalidRecipientCount,
                     {{"recipient_count", std::to_string(header.recipient_count)}});
  }
  if (header.ephemeral_public_key.size() != PUBLIC_KEY_LENGTH) {
    throw EciesError(EciesErrorType::InvalidEphemeralPublicKeyLength,
                     {{"length", std::to_string(header.ephemeral_public_key.size())}});
  }
  if (header.iv.size() != IV_SIZE) {
    throw EciesError(EciesErrorType::InvalidIVLength, {{"length", std::to_string(header.iv.size())}});
  }
  if (header.auth_tag.size() != AUTH_TAG_SIZE) {
    throw EciesError(EciesErrorType::InvalidAuthTagLength, {{"length", std::to_string(header.auth_tag.size())}});
  }
  if (header.recipient_ids.size() != header.recipient_count) {
    throw EciesError(EciesErrorType::InvalidRecipientIds,
                     {{"ids", std::to_string(header.recipient_ids.size())},
                      {"recipient_count", std::to_string(header.recipient_count)}});
  }
  if (header.recipient_keys.size() != header.recipient_count) {
    throw EciesError(EciesErrorType::InvalidRecipientKeys,
                     {{"keys", std::to_string(header.recipient_keys.size())},
                      {"recipient_count", std::to_string(header.recipient_count)}});
  }

  std::set<Bytes> seen;
  for (const auto& id : header.recipient_ids) {
    if (id.size() != ID_SIZE || !seen.insert(id).second) {
      throw EciesError(EciesErrorType::InvalidRecipientIds, {{"id", to_hex(id)}});
    }
  }
  for (const auto& key : header.recipient_keys) {
    if (key.size() != RECIPIENT_ENTRY_KEY_SIZE) {
      throw EciesError(EciesErrorType::InvalidRecipientKeys, {{"length", std::to_string(key.size())}});
    }
  }
}

Bytes additional_data(const uint8_t* header, std::size_t header_size, std::size_t tag_offset) {
  Bytes aad;
  aad.reserve(header_size - AUTH_TAG_SIZE);
  aad.insert(aad.end(), header, header + tag_offset);
  aad.insert(aad.end(), header + tag_offset + AUTH_TAG_SIZE, header + header_size);
  return aad;
}

} // namespace brightchain::crypto
