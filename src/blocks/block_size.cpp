#include "blocks/block_size.hpp"
#include "blocks/block_error.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::blocks {

const char* to_string(BlockSize size) {
  switch (size) {
    case BlockSize::Unknown: return "Unknown";
    case BlockSize::Message: return "Message";
    case BlockSize::Tiny:    return "Tiny";
    case BlockSize::Small:   return "Small";
    case BlockSize::Medium:  return "Medium";
    case BlockSize::Large:   return "Large";
    case BlockSize::Huge:    return "Huge";
    default:                 return "Invalid";
  }
}

std::ostream& operator<<(std::ostream& os, BlockSize size) {
  return os << to_string(size) << "(" << to_length(size) << ")";
}

const std::vector<BlockSize>& valid_block_sizes() {
  static const std::vector<BlockSize> sizes = {
    BlockSize::Message, BlockSize::Tiny, BlockSize::Small,
    BlockSize::Medium, BlockSize::Large, BlockSize::Huge
  };
  return sizes;
}

BlockSize length_to_block_size(std::size_t length) {
  for (BlockSize size : valid_block_sizes()) {
    if (to_length(size) == length) {
      return size;
    }
  }
  return BlockSize::Unknown;
}

BlockSize length_to_block_size_or_throw(std::size_t length) {
  BlockSize size = length_to_block_size(length);
  if (size == BlockSize::Unknown) {
    BOOST_LOG_TRIVIAL(error) << "Block size: No block size has length " << length;
    throw BlockSizeError(BlockSizeErrorType::InvalidBlockSizeLength, {{"length", std::to_string(length)}});
  }
  return size;
}

bool validate_block_size(std::size_t length) {
  return length_to_block_size(length) != BlockSize::Unknown;
}

BlockSize next_largest_block_size(std::size_t length) {
  for (BlockSize size : valid_block_sizes()) {
    if (to_length(size) >= length) {
      return size;
    }
  }
  return BlockSize::Unknown;
}

} // namespace brightchain::blocks
