#include "blocks/cbl_header.hpp"
#include "blocks/block_error.hpp"
#include "crypto/byte_order.hpp"
#include "crypto/constants.hpp"
#include <chrono>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

using crypto::ByteOrder;
using namespace crypto::constants;

std::size_t cbl_header_size(const std::optional<ExtendedCblDetails>& extended) {
  std::size_t size = cbl_layout::BASE_HEADER_SIZE;
  if (extended) {
    size += sizeof(uint16_t) + extended->file_name.size() + sizeof(uint8_t) + extended->mime_type.size();
  }
  return size;
}

//==============================================
// ENCODING
//==============================================

Bytes encode_cbl_header(const CblHeader& header) {
  if (header.creator_id.size() != ID_SIZE) {
    throw CblError(CblErrorType::InvalidStructure, {{"creator_id_length", std::to_string(header.creator_id.size())}});
  }
  if (header.signature.size() != SIGNATURE_LENGTH) {
    throw CblError(CblErrorType::InvalidSignature, {{"signature_length", std::to_string(header.signature.size())}});
  }
  if (header.data_block_size == BlockSize::Unknown) {
    throw CblError(CblErrorType::InvalidStructure, {{"data_block_size", to_string(header.data_block_size)}});
  }
  if (header.extended) {
    validate_file_name_format(header.extended->file_name);
    validate_mime_type_format(header.extended->mime_type);
  }

  Bytes out(cbl_header_size(header.extended));
  uint8_t* p = out.data();
  p[cbl_layout::VERSION_OFFSET] = CBL_FORMAT_VERSION;
  std::memcpy(p + cbl_layout::CREATOR_ID_OFFSET, header.creator_id.data(), ID_SIZE);
  std::memcpy(p + cbl_layout::SIGNATURE_OFFSET, header.signature.data(), SIGNATURE_LENGTH);
  ByteOrder::write_big_endian<uint64_t>(p + cbl_layout::DATE_CREATED_OFFSET, header.date_created_ms);
  ByteOrder::write_big_endian<uint32_t>(p + cbl_layout::ADDRESS_COUNT_OFFSET, header.address_count);
  p[cbl_layout::TUPLE_SIZE_OFFSET] = header.tuple_size;
  ByteOrder::write_big_endian<uint64_t>(p + cbl_layout::ORIGINAL_LENGTH_OFFSET, header.original_data_length);
  std::memcpy(p + cbl_layout::ORIGINAL_CHECKSUM_OFFSET, header.original_data_checksum.data(), CHECKSUM_LENGTH);
  ByteOrder::write_big_endian<uint32_t>(p + cbl_layout::DATA_BLOCK_SIZE_OFFSET,
                                        static_cast<uint32_t>(to_length(header.data_block_size)));
  p[cbl_layout::IS_EXTENDED_OFFSET] = header.extended ? 1 : 0;

  if (header.extended) {
    std::size_t offset = cbl_layout::BASE_HEADER_SIZE;
    const std::string& name = header.extended->file_name;
    const std::string& mime = header.extended->mime_type;
    ByteOrder::write_big_endian<uint16_t>(p + offset, static_cast<uint16_t>(name.size()));
    offset += sizeof(uint16_t);
    std::memcpy(p + offset, name.data(), name.size());
    offset += name.size();
    p[offset++] = static_cast<uint8_t>(mime.size());
    std::memcpy(p + offset, mime.data(), mime.size());
  }
  return out;
}

Bytes header_without_signature(const Bytes& header_data) {
  if (header_data.size() < cbl_layout::BASE_HEADER_SIZE) {
    throw CblError(CblErrorType::InvalidHeaderLength, {{"length", std::to_string(header_data.size())}});
  }
  Bytes result(header_data.begin(), header_data.begin() + cbl_layout::SIGNATURE_OFFSET);
  result.insert(result.end(), header_data.begin() + cbl_layout::SIGNATURE_OFFSET + SIGNATURE_LENGTH,
                header_data.end());
  return result;
}

//==============================================
// DECODING
//==============================================

CblHeader read_cbl_header(const uint8_t* data, std::size_t length) {
  if (length < 1) {
    throw CblError(CblErrorType::InvalidHeaderLength, {{"length", "0"}});
  }
  if (data[cbl_layout::VERSION_OFFSET] != CBL_FORMAT_VERSION) {
    BOOST_LOG_TRIVIAL(error) << "CBL header: Unsupported version " << static_cast<int>(data[0]);
    throw CblError(CblErrorType::UnsupportedCblVersion, {{"version", std::to_string(data[0])}});
  }
  if (length < cbl_layout::BASE_HEADER_SIZE) {
    throw CblError(CblErrorType::InvalidHeaderLength,
                   {{"length", std::to_string(length)},
                    {"required", std::to_string(cbl_layout::BASE_HEADER_SIZE)}});
  }

  CblHeader header;
  header.version = data[cbl_layout::VERSION_OFFSET];
  header.creator_id.assign(data + cbl_layout::CREATOR_ID_OFFSET, data + cbl_layout::CREATOR_ID_OFFSET + ID_SIZE);
  header.signature.assign(data + cbl_layout::SIGNATURE_OFFSET,
                          data + cbl_layout::SIGNATURE_OFFSET + SIGNATURE_LENGTH);
  header.date_created_ms = ByteOrder::read_big_endian<uint64_t>(data + cbl_layout::DATE_CREATED_OFFSET);
  // Dates past the clock's range would wrap when converted to a time point
  const auto max_date_ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::duration::max()).count();
  if (header.date_created_ms > static_cast<uint64_t>(max_date_ms)) {
    BOOST_LOG_TRIVIAL(error) << "CBL header: Creation date " << header.date_created_ms << " ms is out of range";
    throw BlockError(BlockErrorType::FutureCreationDate,
                     {{"date_created_ms", std::to_string(header.date_created_ms)}});
  }
  header.address_count = ByteOrder::read_big_endian<uint32_t>(data + cbl_layout::ADDRESS_COUNT_OFFSET);
  header.tuple_size = data[cbl_layout::TUPLE_SIZE_OFFSET];
  header.original_data_length = ByteOrder::read_big_endian<uint64_t>(data + cbl_layout::ORIGINAL_LENGTH_OFFSET);
  header.original_data_checksum = crypto::Checksum::from_bytes(data + cbl_layout::ORIGINAL_CHECKSUM_OFFSET,
                                                               CHECKSUM_LENGTH);

  if (header.tuple_size < MIN_TUPLE_SIZE || header.tuple_size > MAX_TUPLE_SIZE) {
    throw CblError(CblErrorType::InvalidTupleSize, {{"tuple_size", std::to_string(header.tuple_size)}});
  }
  if (header.address_count % header.tuple_size != 0) {
    throw CblError(CblErrorType::InvalidCBLAddressCount,
                   {{"address_count", std::to_string(header.address_count)},
                    {"tuple_size", std::to_string(header.tuple_size)}});
  }
  if (header.original_data_length > CBL_MAX_INPUT_FILE_SIZE) {
    throw CblError(CblErrorType::FileSizeTooLarge,
                   {{"original_data_length", std::to_string(header.original_data_length)}});
  }
  uint32_t data_block_length = ByteOrder::read_big_endian<uint32_t>(data + cbl_layout::DATA_BLOCK_SIZE_OFFSET);
  header.data_block_size = length_to_block_size(data_block_length);
  if (header.data_block_size == BlockSize::Unknown) {
    throw CblError(CblErrorType::InvalidStructure, {{"data_block_size", std::to_string(data_block_length)}});
  }

  uint8_t is_extended = data[cbl_layout::IS_EXTENDED_OFFSET];
  std::size_t offset = cbl_layout::BASE_HEADER_SIZE;
  if (is_extended == 1) {
    if (offset + sizeof(uint16_t) > length) {
      throw CblError(CblErrorType::InvalidHeaderLength, {{"field", "file_name_length"}});
    }
    uint16_t name_length = ByteOrder::read_big_endian<uint16_t>(data + offset);
    offset += sizeof(uint16_t);
    if (offset + name_length + sizeof(uint8_t) > length) {
      throw CblError(CblErrorType::InvalidHeaderLength, {{"field", "file_name"}});
    }
    ExtendedCblDetails details;
    details.file_name.assign(reinterpret_cast<const char*>(data + offset), name_length);
    offset += name_length;
    uint8_t mime_length = data[offset++];
    if (offset + mime_length > length) {
      throw CblError(CblErrorType::InvalidHeaderLength, {{"field", "mime_type"}});
    }
    details.mime_type.assign(reinterpret_cast<const char*>(data + offset), mime_length);
    offset += mime_length;

    validate_file_name_format(details.file_name);
    validate_mime_type_format(details.mime_type);
    header.extended = std::move(details);
  } else if (is_extended != 0) {
    throw CblError(CblErrorType::InvalidStructure, {{"is_extended", std::to_string(is_extended)}});
  }
  header.header_size = offset;

  // Address list must fit in what follows the header
  uint64_t address_bytes = static_cast<uint64_t>(header.address_count) * CHECKSUM_LENGTH;
  if (address_bytes > length - header.header_size) {
    BOOST_LOG_TRIVIAL(error) << "CBL header: " << header.address_count << " addresses do not fit in "
                             << length - header.header_size << " bytes";
    throw CblError(CblErrorType::InvalidStructure,
                   {{"address_count", std::to_string(header.address_count)},
                    {"available", std::to_string(length - header.header_size)}});
  }
  return header;
}

std::vector<crypto::Checksum> read_cbl_addresses(const uint8_t* data, std::size_t length,
                                                 const CblHeader& header) {
  std::size_t end = header.header_size + static_cast<std::size_t>(header.address_count) * CHECKSUM_LENGTH;
  if (end > length) {
    throw CblError(CblErrorType::InvalidStructure,
                   {{"required", std::to_string(end)}, {"length", std::to_string(length)}});
  }
  std::vector<crypto::Checksum> addresses;
  addresses.reserve(header.address_count);
  for (std::size_t offset = header.header_size; offset < end; offset += CHECKSUM_LENGTH) {
    addresses.push_back(crypto::Checksum::from_bytes(data + offset, CHECKSUM_LENGTH));
  }
  return addresses;
}

//==============================================
// EXTENDED FIELD VALIDATION
//==============================================

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_trimmed(const std::string& value) {
  return !value.empty() && !is_space(value.front()) && !is_space(value.back());
}

} // namespace

void validate_file_name_format(const std::string& file_name) {
  if (file_name.empty()) {
    throw ExtendedCblError(ExtendedCblErrorType::FileNameRequired);
  }
  if (!is_trimmed(file_name)) {
    throw ExtendedCblError(ExtendedCblErrorType::FileNameWhitespace, {{"file_name", file_name}});
  }
  if (file_name.size() > CBL_MAX_FILE_NAME_LENGTH) {
    throw ExtendedCblError(ExtendedCblErrorType::FileNameTooLong,
                           {{"length", std::to_string(file_name.size())}});
  }
  for (char c : file_name) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7f || std::strchr("<>:\"/\\|?*", c) != nullptr) {
      throw ExtendedCblError(ExtendedCblErrorType::FileNameInvalidCharacter,
                             {{"character", std::to_string(static_cast<int>(u))}});
    }
  }
  // Separators are already rejected, so traversal can only be the bare name
  if (file_name == "..") {
    throw ExtendedCblError(ExtendedCblErrorType::FileNamePathTraversal, {{"file_name", file_name}});
  }
}

void validate_mime_type_format(const std::string& mime_type) {
  if (mime_type.empty()) {
    throw ExtendedCblError(ExtendedCblErrorType::MimeTypeRequired);
  }
  if (!is_trimmed(mime_type)) {
    throw ExtendedCblError(ExtendedCblErrorType::MimeTypeWhitespace, {{"mime_type", mime_type}});
  }
  for (char c : mime_type) {
    if (c >= 'A' && c <= 'Z') {
      throw ExtendedCblError(ExtendedCblErrorType::MimeTypeLowercase, {{"mime_type", mime_type}});
    }
  }
  if (mime_type.size() > CBL_MAX_MIME_TYPE_LENGTH) {
    throw ExtendedCblError(ExtendedCblErrorType::MimeTypeTooLong,
                           {{"length", std::to_string(mime_type.size())}});
  }

  // type/subtype from [a-z0-9-]
  std::size_t slash = mime_type.find('/');
  bool valid = slash != std::string::npos && slash > 0 && slash + 1 < mime_type.size();
  for (std::size_t i = 0; valid && i < mime_type.size(); ++i) {
    char c = mime_type[i];
    if (i == slash) {
      continue;
    }
    valid = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
  }
  if (!valid) {
    throw ExtendedCblError(ExtendedCblErrorType::MimeTypeInvalidFormat, {{"mime_type", mime_type}});
  }
}

} // namespace brightchain::blocks
