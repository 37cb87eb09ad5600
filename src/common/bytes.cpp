#include "common/bytes.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace brightchain {

std::string to_hex(const uint8_t* data, std::size_t length) {
  std::stringstream ss;
  for (std::size_t i = 0; i < length; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const Bytes& data) {
  return to_hex(data.data(), data.size());
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Bytes from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Hex string has odd length: " + std::to_string(hex.size()));
  }

  Bytes result(hex.size() / 2);
  for (std::size_t i = 0; i < result.size(); ++i) {
    int high = hex_value(hex[2 * i]);
    int low = hex_value(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Invalid hex character at offset " + std::to_string(2 * i));
    }
    result[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return result;
}

void xor_into(Bytes& lhs, const Bytes& rhs) {
  if (lhs.size() != rhs.size()) {
    throw std::invalid_argument("XOR operands differ in length: " + std::to_string(lhs.size())
                                + " vs " + std::to_string(rhs.size()));
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    lhs[i] ^= rhs[i];
  }
}

bool equal_bytes(const uint8_t* lhs, std::size_t lhs_length,
                 const uint8_t* rhs, std::size_t rhs_length) {
  if (lhs_length != rhs_length) {
    return false;
  }
  uint8_t diff = 0;
  for (std::size_t i = 0; i < lhs_length; ++i) {
    diff |= static_cast<uint8_t>(lhs[i] ^ rhs[i]);
  }
  return diff == 0;
}

} // namespace brightchain
