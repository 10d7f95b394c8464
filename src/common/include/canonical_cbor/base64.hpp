#pragma once

#include <canonical_cbor/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace ccb {

std::string base64_encode(const uint8_t* buffer, size_t length);
byte_vector base64_decode(std::string_view str);

}  // namespace ccb
