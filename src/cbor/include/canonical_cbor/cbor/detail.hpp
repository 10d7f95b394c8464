#pragma once

#include <cstdint>

namespace ccb {

constexpr const uint8_t CBOR_NON_NEGATIVE_INTEGER = 0;
constexpr const uint8_t CBOR_NEGATIVE_INTEGER = 1;
constexpr const uint8_t CBOR_BYTE_STRING = 2;
constexpr const uint8_t CBOR_TEXT_STRING = 3;
constexpr const uint8_t CBOR_ARRAY = 4;
constexpr const uint8_t CBOR_MAP = 5;
constexpr const uint8_t CBOR_TAG = 6;
constexpr const uint8_t CBOR_EVERYTHING_ELSE = 7;

constexpr const uint8_t CBOR_MAJOR_TYPE_BIT_SHIFT = 5;

constexpr const uint8_t CBOR_ADDITIONAL_INFORMATION_MAX_INLINE = 23;
constexpr const uint8_t CBOR_ADDITIONAL_INFORMATION_1_BYTE = 24;
constexpr const uint8_t CBOR_ADDITIONAL_INFORMATION_2_BYTES = 25;
constexpr const uint8_t CBOR_ADDITIONAL_INFORMATION_4_BYTES = 26;
constexpr const uint8_t CBOR_ADDITIONAL_INFORMATION_8_BYTES = 27;

constexpr const uint8_t CBOR_VALUE_FALSE = 20;
constexpr const uint8_t CBOR_VALUE_TRUE = 21;
constexpr const uint8_t CBOR_VALUE_NULL = 22;
constexpr const uint8_t CBOR_VALUE_UNDEFINED = 23;

// Simple values 24-31 are ill-formed
constexpr const uint8_t CBOR_SIMPLE_RESERVED_FIRST = 24;
constexpr const uint8_t CBOR_SIMPLE_RESERVED_LAST = 31;

class binary_writer;

// Appends the shortest header for raw_value under the given major type: the
// value inline when below 24, otherwise a 1, 2, 4 or 8 byte big-endian
// argument. Throws std::out_of_range for a major type above 7.
void write_initial_byte_into(binary_writer& writer, uint8_t major_type, uint64_t raw_value);

}  // namespace ccb
