#ifndef BRIGHTCHAIN_BLOCK_CAPACITY_HPP
#define BRIGHTCHAIN_BLOCK_CAPACITY_HPP

#include <optional>
#include "blocks/block_size.hpp"
#include "blocks/block_type.hpp"
#include "blocks/cbl_header.hpp"

namespace brightchain::blocks {

struct CapacityParams {
  BlockSize block_size = BlockSize::Unknown;
  BlockType block_type = BlockType::Unknown;
  BlockEncryptionType encryption_type = BlockEncryptionType::None;
  std::size_t recipient_count = 1;
  std::optional<ExtendedCblDetails> extended;
};

struct CapacityDetails {
  std::size_t base_header = 0;
  std::size_t type_specific_overhead = 0;
  std::size_t encryption_overhead = 0;
  std::size_t variable_overhead = 0;
};

struct CapacityResult {
  std::size_t total_capacity = 0;
  // Clamped to zero when the overhead exceeds the block
  std::size_t available_capacity = 0;
  CapacityDetails details;
};

// Maps a block configuration to its usable payload space
class BlockCapacityCalculator {
public:
  // Throws BlockError for an invalid size, a multi recipient count below 1,
  // or a block type that does not match the encryption type
  CapacityResult calculate_capacity(const CapacityParams& params) const;
};

} // namespace brightchain::blocks

#endif // BRIGHTCHAIN_BLOCK_CAPACITY_HPP
