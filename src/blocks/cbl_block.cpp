#include "blocks/cbl_block.hpp"
#include "blocks/block_error.hpp"
#include "crypto/constants.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

using crypto::constants::CHECKSUM_LENGTH;

crypto::Checksum cbl_signature_checksum(const crypto::ChecksumService& checksums,
                                        const Bytes& header_data, const Bytes& address_list) {
  Bytes message = header_without_signature(header_data);
  message.insert(message.end(), address_list.begin(), address_list.end());
  return checksums.calculate_checksum(message);
}

//==============================================
// CONSTRUCTION
//==============================================

ConstituentBlockListBlock::ConstituentBlockListBlock(BlockType block_type, BlockSize block_size, Bytes data,
                                                     const crypto::Checksum& checksum,
                                                     const BlockMetadata& metadata,
                                                     std::size_t logical_length, CblHeader header)
  : EphemeralBlock(block_type, BlockDataType::EphemeralStructuredData, block_size, std::move(data), checksum,
                   metadata, logical_length, false)
  , header_(std::move(header)) {}

std::shared_ptr<ConstituentBlockListBlock> ConstituentBlockListBlock::from_bytes(
    const crypto::ChecksumService& checksums, const Bytes& data,
    std::shared_ptr<const crypto::Member> creator, std::optional<BlockSize> block_size,
    const std::optional<crypto::Checksum>& checksum, bool can_read, bool can_persist) {
  CblHeader header = read_cbl_header(data.data(), data.size());
  std::size_t logical_length = header.header_size
                             + static_cast<std::size_t>(header.address_count) * CHECKSUM_LENGTH;

  BlockSize size = block_size.value_or(validate_block_size(data.size()) ? length_to_block_size(data.size())
                                                                        : next_largest_block_size(data.size()));
  if (size == BlockSize::Unknown) {
    throw BlockError(BlockErrorType::DataLengthExceedsCapacity, {{"length", std::to_string(data.size())}});
  }

  if (creator && creator->id_bytes() != header.creator_id) {
    BOOST_LOG_TRIVIAL(error) << "CBL: Creator " << creator->id_string() << " does not match header";
    throw CblError(CblErrorType::CreatorIdMismatch,
                   {{"creator", creator->id_string()}, {"header_creator", to_hex(header.creator_id)}});
  }

  BlockType block_type = header.extended ? BlockType::ExtendedConstituentBlockListBlock
                                         : BlockType::ConstituentBlockList;
  BlockMetadata metadata;
  metadata.creator = std::move(creator);
  metadata.date_created = Clock::time_point(std::chrono::milliseconds(header.date_created_ms));
  metadata.length_before_encryption = logical_length;
  metadata.can_read = can_read;
  metadata.can_persist = can_persist;

  check_block_inputs(block_type, size, data.size(), false, metadata.date_created);
  check_supplied_checksum(checksum, checksums.calculate_checksum(data), block_type);

  Bytes padded = pad_to_block_size(data, size);
  crypto::Checksum computed = checksums.calculate_checksum(padded);
  std::shared_ptr<ConstituentBlockListBlock> block(
    new ConstituentBlockListBlock(block_type, size, std::move(padded), computed, metadata,
                                  logical_length, std::move(header)));
  block->validate_layers();

  BOOST_LOG_TRIVIAL(debug) << "CBL: Loaded " << block->cbl_address_count() << " addresses in "
                           << block->block_size();
  return block;
}

//==============================================
// HEADER AND ADDRESSES
//==============================================

const std::string& ConstituentBlockListBlock::file_name() const {
  if (!header_.extended) {
    throw CblError(CblErrorType::NotExtendedCbl);
  }
  return header_.extended->file_name;
}

const std::string& ConstituentBlockListBlock::mime_type() const {
  if (!header_.extended) {
    throw CblError(CblErrorType::NotExtendedCbl);
  }
  return header_.extended->mime_type;
}

std::vector<crypto::Checksum> ConstituentBlockListBlock::addresses() const {
  const Bytes& full = full_data();
  CblHeader header = read_cbl_header(full.data(), full.size());
  return read_cbl_addresses(full.data(), full.size(), header);
}

Bytes ConstituentBlockListBlock::address_data() const {
  const Bytes& full = full_data();
  auto begin = full.begin() + static_cast<std::ptrdiff_t>(header_.header_size);
  return Bytes(begin, begin + static_cast<std::ptrdiff_t>(header_.address_count) * CHECKSUM_LENGTH);
}

Bytes ConstituentBlockListBlock::layer_header_data() const {
  const Bytes& full = full_data();
  return Bytes(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(header_.header_size));
}

Bytes ConstituentBlockListBlock::payload() const {
  return address_data();
}

std::size_t ConstituentBlockListBlock::payload_length() const {
  return static_cast<std::size_t>(header_.address_count) * CHECKSUM_LENGTH;
}

std::size_t ConstituentBlockListBlock::total_overhead() const {
  return header_.header_size;
}

//==============================================
// VALIDATION
//==============================================

void ConstituentBlockListBlock::validate_layers() const {
  const Bytes& full = full_data();
  CblHeader reparsed = read_cbl_header(full.data(), full.size());
  if (reparsed.address_count != header_.address_count || reparsed.header_size != header_.header_size) {
    throw CblError(CblErrorType::InvalidStructure, {{"reason", "header changed after parsing"}});
  }
  if (header_.address_count % header_.tuple_size != 0) {
    throw CblError(CblErrorType::InvalidCBLAddressCount,
                   {{"address_count", std::to_string(header_.address_count)},
                    {"tuple_size", std::to_string(header_.tuple_size)}});
  }
  std::size_t logical = header_.header_size + static_cast<std::size_t>(header_.address_count) * CHECKSUM_LENGTH;
  if (logical != length_before_encryption() || logical > to_length(block_size())) {
    throw CblError(CblErrorType::AddressCountExceedsCapacity,
                   {{"address_count", std::to_string(header_.address_count)},
                    {"block_size", std::to_string(to_length(block_size()))}});
  }
}

bool ConstituentBlockListBlock::validate_signature(const crypto::EciesService& ecies,
                                                   const crypto::ChecksumService& checksums,
                                                   const crypto::Member& signer) const {
  if (signer.id_bytes() != header_.creator_id) {
    BOOST_LOG_TRIVIAL(warning) << "CBL: Signer " << signer.id_string() << " is not the header creator";
    return false;
  }
  // Re-read so a mutated buffer is what gets verified
  const Bytes& full = full_data();
  CblHeader current = read_cbl_header(full.data(), full.size());
  Bytes header_data(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(current.header_size));
  auto address_begin = full.begin() + static_cast<std::ptrdiff_t>(current.header_size);
  Bytes address_list(address_begin,
                     address_begin + static_cast<std::ptrdiff_t>(current.address_count) * CHECKSUM_LENGTH);

  crypto::Checksum message = cbl_signature_checksum(checksums, header_data, address_list);
  return ecies.verify_message(signer, message.to_bytes(), current.signature);
}

bool ConstituentBlockListBlock::validate_signature(const crypto::EciesService& ecies,
                                                   const crypto::ChecksumService& checksums) const {
  if (!creator()) {
    throw CblError(CblErrorType::CreatorRequired);
  }
  return validate_signature(ecies, checksums, *creator());
}

//==============================================
// RECONSTRUCTION
//==============================================

std::vector<BlockHandleTuple> ConstituentBlockListBlock::get_handle_tuples(
    const store::BlockStore& store, const std::optional<std::string>& pool) const {
  std::vector<crypto::Checksum> ids = addresses();
  std::string pool_name = pool.value_or(store::DEFAULT_POOL);

  if (pool) {
    std::vector<crypto::Checksum> missing;
    for (const auto& id : ids) {
      if (!store.has(id, *pool)) {
        missing.push_back(id);
      }
    }
    if (!missing.empty()) {
      BOOST_LOG_TRIVIAL(error) << "CBL: " << missing.size() << " of " << ids.size()
                               << " addresses missing from pool " << *pool;
      throw store::PoolIntegrityError(*pool, std::move(missing));
    }
  }

  std::vector<BlockHandleTuple> tuples;
  for (std::size_t i = 0; i < ids.size(); i += header_.tuple_size) {
    std::vector<BlockHandle> handles;
    for (std::size_t j = 0; j < header_.tuple_size; ++j) {
      handles.emplace_back(ids[i + j], header_.data_block_size, store, pool_name);
    }
    tuples.emplace_back(std::move(handles), header_.tuple_size);
  }
  return tuples;
}

} // namespace brightchain::blocks
