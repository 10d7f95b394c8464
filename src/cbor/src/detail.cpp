#include "canonical_cbor/cbor/detail.hpp"

#include <canonical_cbor/binary_io.hpp>

#include <fmt/format.h>

#include <limits>
#include <stdexcept>

namespace ccb {

void write_initial_byte_into(binary_writer& writer, uint8_t major_type, uint64_t raw_value) {
    if (major_type > CBOR_EVERYTHING_ELSE) {
        throw std::out_of_range(fmt::format("Invalid major type value {}", major_type));
    }

    uint8_t major_type_shifted = (major_type << CBOR_MAJOR_TYPE_BIT_SHIFT) & 0b111'00000;

    if (raw_value <= CBOR_ADDITIONAL_INFORMATION_MAX_INLINE) {
        writer.write_uint8_t(major_type_shifted | static_cast<uint8_t>(raw_value));
    } else if (raw_value <= std::numeric_limits<uint8_t>::max()) {
        writer.write_uint8_t(major_type_shifted | CBOR_ADDITIONAL_INFORMATION_1_BYTE);
        writer.write_uint8_t(static_cast<uint8_t>(raw_value));
    } else if (raw_value <= std::numeric_limits<uint16_t>::max()) {
        writer.write_uint8_t(major_type_shifted | CBOR_ADDITIONAL_INFORMATION_2_BYTES);
        writer.write_be_uint16_t(static_cast<uint16_t>(raw_value));
    } else if (raw_value <= std::numeric_limits<uint32_t>::max()) {
        writer.write_uint8_t(major_type_shifted | CBOR_ADDITIONAL_INFORMATION_4_BYTES);
        writer.write_be_uint32_t(static_cast<uint32_t>(raw_value));
    } else {
        writer.write_uint8_t(major_type_shifted | CBOR_ADDITIONAL_INFORMATION_8_BYTES);
        writer.write_be_uint64_t(raw_value);
    }
}

}  // namespace ccb
