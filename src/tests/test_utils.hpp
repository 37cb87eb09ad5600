#ifndef BRIGHTCHAIN_TEST_UTILS_HPP
#define BRIGHTCHAIN_TEST_UTILS_HPP

#include <string>
#include "common/bytes.hpp"
#include "logger/logger.hpp"

// Console logging for test binaries; warnings and above keep the output readable
inline void init_logging() {
    brightchain::logging::init_console_logging(boost::log::trivial::warning);
}

inline brightchain::Bytes to_bytes(const std::string& text) {
    return brightchain::Bytes(text.begin(), text.end());
}

// Deterministic filler so failures are reproducible
inline brightchain::Bytes pattern_bytes(std::size_t length, uint8_t seed = 7) {
    brightchain::Bytes data(length);
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return data;
}

#endif // BRIGHTCHAIN_TEST_UTILS_HPP
