#ifndef BRIGHTCHAIN_BLOCK_SIZE_HPP
#define BRIGHTCHAIN_BLOCK_SIZE_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

namespace brightchain::blocks {

// Every stored block is exactly one of these lengths. Unknown is an error
// sentinel, never a storage size.
enum class BlockSize : uint32_t {
  Unknown = 0,
  Message = 512,
  Tiny = 1024,
  Small = 4096,
  Medium = 1048576,
  Large = 67108864,
  Huge = 268435456
};

inline std::size_t to_length(BlockSize size) {
  return static_cast<std::size_t>(size);
}

const char* to_string(BlockSize size);
std::ostream& operator<<(std::ostream& os, BlockSize size);

// Ascending, Unknown excluded
const std::vector<BlockSize>& valid_block_sizes();

// Exact match or Unknown
BlockSize length_to_block_size(std::size_t length);
// Exact match or BlockSizeError(InvalidBlockSizeLength)
BlockSize length_to_block_size_or_throw(std::size_t length);
bool validate_block_size(std::size_t length);
// Smallest size >= length, Unknown if none
BlockSize next_largest_block_size(std::size_t length);

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_BLOCK_SIZE_HPP
