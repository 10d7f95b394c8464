#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ccb {

using byte_vector = std::vector<uint8_t>;
using byte_string = std::basic_string<uint8_t>;
using byte_string_view = std::basic_string_view<uint8_t>;

namespace literals {

inline byte_string operator "" _bytes(const char* chars, size_t size) {
    return byte_string{reinterpret_cast<const uint8_t*>(chars), size};
}

}  // namespace literals

}  // namespace ccb
