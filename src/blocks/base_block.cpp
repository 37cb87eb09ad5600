#include "blocks/base_block.hpp"
#include "blocks/block_error.hpp"
#include "blocks/raw_data_block.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

//==============================================
// CONSTRUCTOR
//==============================================

BaseBlock::BaseBlock(BlockType block_type, BlockDataType block_data_type, BlockSize block_size,
                     Bytes data, const crypto::Checksum& checksum, const BlockMetadata& metadata)
  : block_type_(block_type)
  , block_data_type_(block_data_type)
  , block_size_(block_size)
  , data_(std::move(data))
  , checksum_(checksum)
  , date_created_(metadata.date_created.value_or(Clock::now()))
  , creator_(metadata.creator)
  , can_read_(metadata.can_read)
  , can_persist_(metadata.can_persist) {
  if (data_.size() != to_length(block_size_)) {
    // Factories pad before constructing; reaching this is a factory bug
    throw BlockError(data_.size() > to_length(block_size_) ? BlockErrorType::DataLengthExceedsCapacity
                                                           : BlockErrorType::DataBufferIsTruncated,
                     {{"block_type", to_string(block_type_)},
                      {"length", std::to_string(data_.size())},
                      {"block_size", std::to_string(to_length(block_size_))}});
  }
}

//==============================================
// FACTORY PRECONDITIONS
//==============================================

void BaseBlock::check_block_inputs(BlockType block_type, BlockSize block_size, std::size_t data_length,
                                   bool allow_empty, const std::optional<Clock::time_point>& date_created) {
  if (!validate_block_size(to_length(block_size))) {
    throw BlockError(BlockErrorType::InvalidBlockSize,
                     {{"block_type", to_string(block_type)}, {"block_size", std::to_string(to_length(block_size))}});
  }
  if (data_length > to_length(block_size)) {
    BOOST_LOG_TRIVIAL(error) << "Block: " << data_length << " bytes exceed block size "
                             << to_length(block_size) << " for " << block_type;
    throw BlockError(BlockErrorType::DataLengthExceedsCapacity,
                     {{"block_type", to_string(block_type)},
                      {"length", std::to_string(data_length)},
                      {"block_size", std::to_string(to_length(block_size))}});
  }
  if (data_length == 0 && !allow_empty) {
    throw BlockError(BlockErrorType::DataCannotBeEmpty, {{"block_type", to_string(block_type)}});
  }
  if (date_created) {
    if (date_created->time_since_epoch().count() < 0) {
      throw BlockError(BlockErrorType::InvalidDateCreated, {{"block_type", to_string(block_type)}});
    }
    if (*date_created > Clock::now()) {
      BOOST_LOG_TRIVIAL(error) << "Block: Creation date in the future for " << block_type;
      throw BlockError(BlockErrorType::FutureCreationDate, {{"block_type", to_string(block_type)}});
    }
  }
}

void BaseBlock::check_supplied_checksum(const std::optional<crypto::Checksum>& expected,
                                        const crypto::Checksum& computed, BlockType block_type) {
  if (expected && *expected != computed) {
    BOOST_LOG_TRIVIAL(error) << "Block: Checksum mismatch for " << block_type;
    throw ChecksumMismatchError(*expected, computed, {{"block_type", to_string(block_type)}});
  }
}

//==============================================
// LAYER VIEW
//==============================================

Bytes BaseBlock::data() const {
  return data_;
}

Bytes BaseBlock::layer_header_data() const {
  return Bytes();
}

Bytes BaseBlock::payload() const {
  std::size_t overhead = total_overhead();
  return Bytes(data_.begin() + static_cast<std::ptrdiff_t>(overhead), data_.end());
}

std::size_t BaseBlock::payload_length() const {
  return data_.size() - total_overhead();
}

std::size_t BaseBlock::total_overhead() const {
  return 0;
}

std::size_t BaseBlock::capacity() const {
  return to_length(block_size_) - total_overhead();
}

//==============================================
// VALIDATION
//==============================================

void BaseBlock::check_computed_checksum(const crypto::Checksum& computed) const {
  if (computed != checksum_) {
    BOOST_LOG_TRIVIAL(error) << "Block: Validation failed for " << block_type_ << " " << checksum_;
    throw ChecksumMismatchError(checksum_, computed, {{"block_type", to_string(block_type_)}});
  }
}

void BaseBlock::validate(const crypto::ChecksumService& checksums) const {
  check_computed_checksum(checksums.calculate_checksum(data_));
  validate_layers();
}

std::future<void> BaseBlock::validate_async(const crypto::ChecksumService& checksums) const {
  auto stream = std::make_shared<std::istringstream>(
    std::string(reinterpret_cast<const char*>(data_.data()), data_.size()));
  std::future<crypto::Checksum> digest = checksums.calculate_checksum_async(stream);
  std::shared_ptr<const BaseBlock> self = shared_from_this();

  return std::async(std::launch::deferred, [self, digest = std::move(digest)]() mutable {
    self->check_computed_checksum(digest.get());
    self->validate_layers();
  });
}

//==============================================
// XOR
//==============================================

Bytes BaseBlock::xor_buffers(const BaseBlock& lhs, const BaseBlock& rhs) {
  if (lhs.block_size_ != rhs.block_size_ || lhs.data_.size() != rhs.data_.size()) {
    throw BlockError(BlockErrorType::BlockSizesDoNotMatch,
                     {{"left", std::to_string(to_length(lhs.block_size_))},
                      {"right", std::to_string(to_length(rhs.block_size_))}});
  }
  Bytes result = lhs.data_;
  xor_into(result, rhs.data_);
  return result;
}

std::shared_ptr<BaseBlock> BaseBlock::xor_with(const BaseBlock& other,
                                               const crypto::ChecksumService& checksums) const {
  Bytes result = xor_buffers(*this, other);
  return RawDataBlock::from(checksums, block_size_, result, std::nullopt, BlockMetadata{creator_});
}

} // namespace brightchain::blocks
