#ifndef BRIGHTCHAIN_BASE_BLOCK_HPP
#define BRIGHTCHAIN_BASE_BLOCK_HPP

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include "blocks/block_size.hpp"
#include "blocks/block_type.hpp"
#include "common/bytes.hpp"
#include "crypto/checksum.hpp"
#include "crypto/member.hpp"

namespace brightchain::blocks {

using Clock = std::chrono::system_clock;

// Optional construction inputs shared by the block factories
struct BlockMetadata {
  std::shared_ptr<const crypto::Member> creator;
  std::optional<Clock::time_point> date_created;
  std::optional<std::size_t> length_before_encryption;
  bool can_read = true;
  bool can_persist = true;
};

// Immutable fixed-size block. The buffer is always exactly block_size bytes
// and the checksum always covers the whole buffer.
class BaseBlock : public std::enable_shared_from_this<BaseBlock> {
public:
  virtual ~BaseBlock() = default;

  BaseBlock(const BaseBlock&) = delete;
  BaseBlock& operator=(const BaseBlock&) = delete;


  // ---- IDENTITY ----
  BlockType block_type() const { return block_type_; }
  BlockDataType block_data_type() const { return block_data_type_; }
  BlockSize block_size() const { return block_size_; }
  const crypto::Checksum& id_checksum() const { return checksum_; }
  Clock::time_point date_created() const { return date_created_; }
  const std::shared_ptr<const crypto::Member>& creator() const { return creator_; }
  bool can_read() const { return can_read_; }
  bool can_persist() const { return can_persist_; }


  // ---- LAYER VIEW ----
  // Full padded buffer as stored
  const Bytes& full_data() const { return data_; }
  // Caller-facing data; the base layer exposes the whole buffer
  virtual Bytes data() const;
  virtual Bytes layer_header_data() const;
  virtual Bytes payload() const;
  virtual std::size_t payload_length() const;
  virtual std::size_t total_overhead() const;
  virtual std::size_t capacity() const;


  // ---- VALIDATION ----
  // Recomputes the checksum then runs the layer checks; throws on failure
  void validate(const crypto::ChecksumService& checksums) const;
  // Same checks with the digest computed on the checksum service workers
  std::future<void> validate_async(const crypto::ChecksumService& checksums) const;


  // ---- XOR ----
  // Position-wise XOR of both full buffers into a new raw data block
  virtual std::shared_ptr<BaseBlock> xor_with(const BaseBlock& other,
                                              const crypto::ChecksumService& checksums) const;

protected:
  BaseBlock(BlockType block_type, BlockDataType block_data_type, BlockSize block_size,
            Bytes data, const crypto::Checksum& checksum, const BlockMetadata& metadata);

  // Layer specific structure checks, run after the checksum check
  virtual void validate_layers() const {}

  // Shared factory preconditions in the order every factory applies them:
  // size, emptiness, creation date
  static void check_block_inputs(BlockType block_type, BlockSize block_size, std::size_t data_length,
                                 bool allow_empty, const std::optional<Clock::time_point>& date_created);
  // Throws ChecksumMismatchError when expected is set and differs from computed
  static void check_supplied_checksum(const std::optional<crypto::Checksum>& expected,
                                      const crypto::Checksum& computed, BlockType block_type);
  // Full XOR buffer of two blocks, throws BlockSizesDoNotMatch for unequal sizes
  static Bytes xor_buffers(const BaseBlock& lhs, const BaseBlock& rhs);

private:
  void check_computed_checksum(const crypto::Checksum& computed) const;

  BlockType block_type_;
  BlockDataType block_data_type_;
  BlockSize block_size_;
  Bytes data_;
  crypto::Checksum checksum_;
  Clock::time_point date_created_;
  std::shared_ptr<const crypto::Member> creator_;
  bool can_read_;
  bool can_persist_;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_BASE_BLOCK_HPP
