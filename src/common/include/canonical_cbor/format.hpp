#pragma once

#include <canonical_cbor/types.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <iterator>
#include <string>

namespace ccb {

// Lowercase hex, no separators
inline std::string to_hex(const uint8_t* buffer, size_t length) {
    std::string result;
    result.reserve(length * 2);

    for (size_t i = 0; i < length; i++) {
        fmt::format_to(std::back_inserter(result), "{:02x}", buffer[i]);
    }

    return result;
}

inline std::string to_hex(const byte_vector& buffer) {
    return to_hex(buffer.data(), buffer.size());
}

inline std::string to_hex(byte_string_view buffer) {
    return to_hex(buffer.data(), buffer.size());
}

}  // namespace ccb
