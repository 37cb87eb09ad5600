#ifndef BRIGHTCHAIN_COMMON_BYTES_HPP
#define BRIGHTCHAIN_COMMON_BYTES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace brightchain {

using Bytes = std::vector<uint8_t>;

// Lowercase hex encoding, two characters per byte
std::string to_hex(const uint8_t* data, std::size_t length);
std::string to_hex(const Bytes& data);
// Throws std::invalid_argument on odd length or non-hex characters
Bytes from_hex(const std::string& hex);

// Position-wise XOR of rhs into lhs; both buffers must have the same length
void xor_into(Bytes& lhs, const Bytes& rhs);

// Constant-time comparison for secrets and digests
bool equal_bytes(const uint8_t* lhs, std::size_t lhs_length,
                 const uint8_t* rhs, std::size_t rhs_length);

} // namespace brightchain

#endif // BRIGHTCHAIN_COMMON_BYTES_HPP
