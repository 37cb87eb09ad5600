#include "service/cbl_service.hpp"
#include "blocks/block_error.hpp"
#include <cstring>
#include <boost/log/trivial.hpp>

namespace brightchain::service {

using namespace blocks;
using crypto::constants::CHECKSUM_LENGTH;

CblService::CblService(const crypto::ChecksumService& checksums, const crypto::EciesService& ecies,
                       std::size_t tuple_size)
  : checksums_(checksums)
  , ecies_(ecies)
  , tuple_size_(tuple_size) {
  if (tuple_size < crypto::constants::MIN_TUPLE_SIZE || tuple_size > crypto::constants::MAX_TUPLE_SIZE) {
    throw CblError(CblErrorType::InvalidTupleSize, {{"tuple_size", std::to_string(tuple_size)}});
  }
}

//==============================================
// HEADER
//==============================================

SignedCblHeader CblService::make_cbl_header(const crypto::Member& creator, Clock::time_point date_created,
                                            uint32_t address_count, uint64_t original_data_length,
                                            const crypto::Checksum& original_data_checksum,
                                            const Bytes& address_list, BlockSize block_size,
                                            const std::optional<ExtendedCblDetails>& extended,
                                            const std::optional<Bytes>& signature,
                                            std::optional<BlockSize> data_block_size) const {
  if (original_data_length > crypto::constants::CBL_MAX_INPUT_FILE_SIZE) {
    throw CblError(CblErrorType::FileSizeTooLarge, {{"original_data_length", std::to_string(original_data_length)}});
  }
  if (extended) {
    validate_file_name_format(extended->file_name);
    validate_mime_type_format(extended->mime_type);
  }
  if (address_count % tuple_size_ != 0) {
    throw CblError(CblErrorType::InvalidCBLAddressCount,
                   {{"address_count", std::to_string(address_count)}, {"tuple_size", std::to_string(tuple_size_)}});
  }
  std::size_t capacity = calculate_cbl_address_capacity(block_size, extended);
  if (address_count > capacity) {
    throw CblError(CblErrorType::AddressCountExceedsCapacity,
                   {{"address_count", std::to_string(address_count)},
                    {"capacity", std::to_string(capacity)},
                    {"block_size", to_string(block_size)}});
  }
  if (address_list.size() != static_cast<std::size_t>(address_count) * CHECKSUM_LENGTH) {
    throw CblError(CblErrorType::InvalidStructure,
                   {{"address_list_length", std::to_string(address_list.size())},
                    {"address_count", std::to_string(address_count)}});
  }
  BlockSize member_size = data_block_size.value_or(block_size);
  if (member_size == BlockSize::Unknown) {
    throw CblError(CblErrorType::InvalidStructure, {{"data_block_size", to_string(member_size)}});
  }
  if (!signature && !creator.has_private_key()) {
    throw CblError(CblErrorType::CreatorPrivateKeyRequired, {{"creator", creator.id_string()}});
  }

  CblHeader header;
  header.version = crypto::constants::CBL_FORMAT_VERSION;
  header.creator_id = creator.id_bytes();
  header.signature = signature.value_or(Bytes(crypto::constants::SIGNATURE_LENGTH, 0));
  header.date_created_ms = static_cast<uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(date_created.time_since_epoch()).count());
  header.address_count = address_count;
  header.tuple_size = static_cast<uint8_t>(tuple_size_);
  header.original_data_length = original_data_length;
  header.original_data_checksum = original_data_checksum;
  header.data_block_size = member_size;
  header.extended = extended;

  Bytes header_data = encode_cbl_header(header);
  if (!signature) {
    crypto::Checksum message = cbl_signature_checksum(checksums_, header_data, address_list);
    header.signature = ecies_.sign_message(creator, message.to_bytes());
    std::memcpy(header_data.data() + cbl_layout::SIGNATURE_OFFSET, header.signature.data(),
                header.signature.size());
  }
  BOOST_LOG_TRIVIAL(debug) << "CBL service: Built header for " << address_count << " addresses, "
                           << original_data_length << " bytes";
  return SignedCblHeader{std::move(header_data), std::move(header.signature)};
}

CblHeader CblService::read_cbl_header(const Bytes& data) const {
  return blocks::read_cbl_header(data.data(), data.size());
}

bool CblService::validate_signature(const Bytes& data, const crypto::Member& creator) const {
  CblHeader header = read_cbl_header(data);
  if (creator.id_bytes() != header.creator_id) {
    return false;
  }
  Bytes header_data(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(header.header_size));
  auto address_begin = data.begin() + static_cast<std::ptrdiff_t>(header.header_size);
  Bytes address_list(address_begin,
                     address_begin + static_cast<std::ptrdiff_t>(header.address_count) * CHECKSUM_LENGTH);
  crypto::Checksum message = cbl_signature_checksum(checksums_, header_data, address_list);
  return ecies_.verify_message(creator, message.to_bytes(), header.signature);
}

//==============================================
// BLOCKS
//==============================================

std::shared_ptr<ConstituentBlockListBlock> CblService::make_cbl(
    std::shared_ptr<const crypto::Member> creator, BlockSize block_size,
    const std::vector<crypto::Checksum>& addresses, uint64_t original_data_length,
    const crypto::Checksum& original_data_checksum, const std::optional<ExtendedCblDetails>& extended,
    std::optional<Clock::time_point> date_created, std::optional<BlockSize> data_block_size) const {
  if (!creator) {
    throw CblError(CblErrorType::CreatorRequired);
  }
  Bytes address_list;
  address_list.reserve(addresses.size() * CHECKSUM_LENGTH);
  for (const auto& address : addresses) {
    address_list.insert(address_list.end(), address.data(), address.data() + CHECKSUM_LENGTH);
  }

  SignedCblHeader header = make_cbl_header(*creator, date_created.value_or(Clock::now()),
                                           static_cast<uint32_t>(addresses.size()), original_data_length,
                                           original_data_checksum, address_list, block_size, extended,
                                           std::nullopt, data_block_size);
  Bytes data = std::move(header.header_data);
  data.insert(data.end(), address_list.begin(), address_list.end());
  return ConstituentBlockListBlock::from_bytes(checksums_, data, std::move(creator), block_size);
}

//==============================================
// CAPACITY
//==============================================

std::size_t CblService::max_id_count(BlockSize block_size,
                                     const std::optional<ExtendedCblDetails>& extended) const {
  std::size_t header_size = cbl_header_size(extended);
  std::size_t length = to_length(block_size);
  if (length <= header_size) {
    return 0;
  }
  return (length - header_size) / CHECKSUM_LENGTH;
}

std::size_t CblService::max_tuple_count(BlockSize block_size,
                                        const std::optional<ExtendedCblDetails>& extended) const {
  return max_id_count(block_size, extended) / tuple_size_;
}

std::size_t CblService::calculate_cbl_address_capacity(BlockSize block_size,
                                                       const std::optional<ExtendedCblDetails>& extended) const {
  return max_tuple_count(block_size, extended) * tuple_size_;
}

uint64_t CblService::max_file_size(BlockSize block_size, const std::optional<ExtendedCblDetails>& extended) const {
  return static_cast<uint64_t>(to_length(block_size)) * max_tuple_count(block_size, extended);
}

BlockSize CblService::file_size_to_cbl_block_size(uint64_t file_size,
                                                  const std::optional<ExtendedCblDetails>& extended) const {
  for (BlockSize size : valid_block_sizes()) {
    if (max_file_size(size, extended) >= file_size) {
      return size;
    }
  }
  BOOST_LOG_TRIVIAL(warning) << "CBL service: No block size can index " << file_size << " bytes";
  return BlockSize::Unknown;
}

} // namespace brightchain::service
