#include <canonical_cbor/binary_io.hpp>
#include <canonical_cbor/cbor.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

ccb::byte_vector header_bytes(uint8_t major_type, uint64_t raw_value) {
    ccb::byte_vector output;
    ccb::binary_writer writer{output};
    ccb::write_initial_byte_into(writer, major_type, raw_value);
    return output;
}

}  // namespace

TEST(CBOR, HeaderInlineValues) {
    for (uint8_t major_type = 0; major_type < 8; major_type++) {
        for (uint64_t raw_value = 0; raw_value < 24; raw_value++) {
            ccb::byte_vector expected{static_cast<uint8_t>((major_type << 5) | raw_value)};
            ASSERT_EQ(header_bytes(major_type, raw_value), expected);
        }
    }
}

TEST(CBOR, HeaderSizeClassBoundaries) {
    struct test_case {
        uint64_t raw_value;
        ccb::byte_vector expected;
    };

    std::vector<test_case> cases = {
        {23, {0b100'10111}},
        {24, {0b100'11000, 0x18}},
        {255, {0b100'11000, 0xff}},
        {256, {0b100'11001, 0x01, 0x00}},
        {65535, {0b100'11001, 0xff, 0xff}},
        {65536, {0b100'11010, 0x00, 0x01, 0x00, 0x00}},
        {4294967295, {0b100'11010, 0xff, 0xff, 0xff, 0xff}},
        {4294967296, {0b100'11011, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00}},
        {
            std::numeric_limits<uint64_t>::max(),
            {0b100'11011, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff},
        },
    };

    for (const auto& [raw_value, expected] : cases) {
        ASSERT_EQ(header_bytes(ccb::CBOR_ARRAY, raw_value), expected) << "raw value " << raw_value;
    }
}

TEST(CBOR, HeaderAppendsToExistingOutput) {
    ccb::byte_vector output{0xaa, 0xbb};
    ccb::binary_writer writer{output};
    ccb::write_initial_byte_into(writer, ccb::CBOR_TAG, 1000);

    ccb::byte_vector expected{0xaa, 0xbb, 0xd9, 0x03, 0xe8};
    ASSERT_EQ(output, expected);
    ASSERT_EQ(writer.bytes_written(), 5u);
}

TEST(CBOR, HeaderRejectsInvalidMajorType) {
    EXPECT_THROW(header_bytes(8, 0), std::out_of_range);
    EXPECT_THROW(header_bytes(0xff, 1000), std::out_of_range);
}
