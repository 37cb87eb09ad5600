#ifndef BRIGHTCHAIN_BYTE_ORDER_HPP
#define BRIGHTCHAIN_BYTE_ORDER_HPP

#include <cstdint>
#include <cstring>
#include <type_traits>
#include <boost/endian/conversion.hpp>

namespace brightchain::crypto {

// Big-endian field access for the block headers. Every multi-byte integer on
// the wire is big-endian.
class ByteOrder {
public:
  // Writes value at out in big-endian order
  template<typename T>
  static void write_big_endian(uint8_t* out, T value) {
    static_assert(std::is_unsigned<T>::value, "ByteOrder: unsigned integers only");
    T network_value = boost::endian::native_to_big(value);
    std::memcpy(out, &network_value, sizeof(T));
  }

  // Reads a big-endian value starting at in
  template<typename T>
  static T read_big_endian(const uint8_t* in) {
    static_assert(std::is_unsigned<T>::value, "ByteOrder: unsigned integers only");
    T network_value;
    std::memcpy(&network_value, in, sizeof(T));
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace brightchain::crypto

#endif // BRIGHTCHAIN_BYTE_ORDER_HPP
